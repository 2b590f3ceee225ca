// ==============================================================================
// wsformat/line_ending.hpp - Модель маркеров конца строки
// ==============================================================================
//
// Назначение:
// - Три распознаваемых маркера конца строки и их байтовые последовательности
// - Человекочитаемое представление маркеров ("\n", "\r", "\r\n")
// - Режим выбора выходного маркера (auto/linux/mac-os/windows)
// - Автоопределение самого частого маркера во входных данных
//
// ==============================================================================

#ifndef WSFORMAT_LINE_ENDING_HPP
#define WSFORMAT_LINE_ENDING_HPP

#include <string_view>

namespace wsformat {

// ----------------------------------------------------------------------------
// Коды ASCII, с которыми работает форматтер
// ----------------------------------------------------------------------------
//
// Форматтер работает с байтами, а не с символами Unicode.
//

constexpr char CARRIAGE_RETURN = '\r';
constexpr char LINE_FEED = '\n';
constexpr char SPACE = ' ';
constexpr char TAB = '\t';
constexpr char VERTICAL_TAB = '\x0B';  // '\v'
constexpr char FORM_FEED = '\x0C';     // '\f'

/// Пробельный байт: CR, LF, пробел, таб, VT, FF
bool is_whitespace_byte(char byte);

/// Escape-представление байта для отчётов: "\v", "\f", "\t", "\n", "\r", " "
/// Для прочих байтов возвращает "?"
std::string_view byte_to_escape(char byte);

// ----------------------------------------------------------------------------
// LineEnding - маркер конца строки
// ----------------------------------------------------------------------------

enum class LineEnding {
    Linux,   // "\n"
    MacOs,   // "\r"
    Windows  // "\r\n"
};

/// Байтовая последовательность маркера
std::string_view line_ending_bytes(LineEnding ending);

/// Видимое представление маркера: "\\n", "\\r", "\\r\\n"
std::string_view line_ending_to_escape(LineEnding ending);

// ----------------------------------------------------------------------------
// LineEndingMode - маркер, который следует использовать в выходных файлах
// ----------------------------------------------------------------------------

enum class LineEndingMode {
    Auto,  // самый частый маркер в каждом файле; при отсутствии маркеров - Linux
    Linux,
    MacOs,
    Windows
};

/// Самый частый маркер во входных данных.
///
/// CR, за которым сразу следует LF, считается одним маркером Windows.
/// Побеждает строго наибольший счётчик; ничьи разрешаются в порядке
/// Linux > Windows > MacOs. Вход без маркеров даёт Linux.
LineEnding find_most_common_line_ending(std::string_view input);

/// Выбрать конкретный маркер для вывода по режиму
LineEnding resolve_line_ending(LineEndingMode mode, std::string_view input);

}  // namespace wsformat

#endif  // WSFORMAT_LINE_ENDING_HPP
