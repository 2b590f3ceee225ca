// ==============================================================================
// wsformat/discovery.hpp - Поиск файлов для форматирования
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий
// - Политика символических ссылок (--follow-symlinks)
// - Исключение файлов по регулярному выражению (--exclude)
// - Детерминированный порядок результатов (сортировка, без дубликатов)
//
// ==============================================================================

#ifndef WSFORMAT_DISCOVERY_HPP
#define WSFORMAT_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace wsformat::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// false: символические ссылки пропускаются (и входные пути, и найденные)
    bool follow_symlinks = false;

    /// Регулярное выражение ECMAScript; файл исключается, если выражение
    /// находится где-либо в его пути (UTF-8). nullopt - ничего не исключать
    std::optional<std::string> exclude;
};

/// Скомпилировать --exclude.
/// @throws wsformat::Error (InvalidExcludePattern)
std::regex compile_exclude_pattern(const std::string& pattern);

// ----------------------------------------------------------------------------
// discover_files - основная функция поиска
// ----------------------------------------------------------------------------

/// Найти файлы по путям
///
/// @param inputs Пути к файлам или директориям
/// @param opt Параметры поиска
/// @return Отсортированный список файлов без дубликатов
///
/// Поведение:
/// - Файл добавляется как есть, директория обходится рекурсивно
/// - Прочие объекты (сокеты, устройства) пропускаются
/// - Циклы ссылок на директории обходятся один раз
/// - Пустой результат - не ошибка
///
/// @throws wsformat::Error (FileNotFound, DirectoryUnreadable,
///         DirectoryEntryUnreadable, InvalidExcludePattern)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

}  // namespace wsformat::io

#endif  // WSFORMAT_DISCOVERY_HPP
