// ==============================================================================
// wsformat/formatter.hpp - Однопроходный форматтер содержимого файла
// ==============================================================================
//
// Назначение:
// - Побайтовый проход по содержимому файла с применением правил FormatOptions
// - Упорядоченный журнал изменений (номера строк по выходному потоку)
// - Идемпотентность: format(format(x)) == format(x), второй проход без изменений
//
// Выход пишется в Sink; откаты делаются только к ранее запомненным позициям
// (конец последней строки, последний непробельный байт, конец последней
// непустой строки), поэтому проход остаётся линейным.
//
// ==============================================================================

#ifndef WSFORMAT_FORMATTER_HPP
#define WSFORMAT_FORMATTER_HPP

#include "wsformat/change.hpp"
#include "wsformat/options.hpp"
#include "wsformat/sink.hpp"

#include <string_view>
#include <vector>

namespace wsformat {

/// Содержит ли вход только CR, LF, пробелы, табы, VT и FF.
/// Для пустого входа возвращает true.
bool is_whitespace_only(std::string_view input);

/// Отформатировать содержимое файла.
///
/// @param input Исходные байты файла
/// @param options Проверенные параметры (см. validate())
/// @param sink Выход; должен быть пустым
/// @return Изменения в порядке их возникновения
///
/// Порядок работы:
/// 1. Пустой файл и файл только из пробельных символов обрабатываются
///    целиком по normalize_empty_files / normalize_whitespace_only_files
/// 2. Остальные файлы - побайтовый проход
/// 3. После прохода по порядку: хвостовые пробелы последней строки,
///    пустые строки в конце, добавление и удаление маркера в конце файла
std::vector<Change> format_content(std::string_view input, const FormatOptions& options,
                                   Sink& sink);

}  // namespace wsformat

#endif  // WSFORMAT_FORMATTER_HPP
