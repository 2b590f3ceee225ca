// ==============================================================================
// wsformat/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для stdout/stderr (цветной вывод в режиме auto)
// - Имя ОС для --version/отладки
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef WSFORMAT_PLATFORM_HPP
#define WSFORMAT_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace wsformat::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (argv, YAML)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать path в UTF-8 строку (для вывода и regex-фильтра)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows", "macOS", "Linux" или "Unknown"
std::string os_name();

}  // namespace wsformat::platform

#endif  // WSFORMAT_PLATFORM_HPP
