// ==============================================================================
// wsformat/options.hpp - Параметры форматирования одного файла
// ==============================================================================
//
// Назначение:
// - FormatOptions: готовый, уже проверенный набор правил нормализации
// - Режимы для тривиальных файлов, табов и нестандартных пробелов
// - Текстовые имена режимов (значения опций CLI и ключей YAML)
// - Проверка взаимоисключающих комбинаций
//
// Форматтер считает FormatOptions корректными и не проверяет их повторно.
//
// ==============================================================================

#ifndef WSFORMAT_OPTIONS_HPP
#define WSFORMAT_OPTIONS_HPP

#include "wsformat/line_ending.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace wsformat {

// ----------------------------------------------------------------------------
// Режимы
// ----------------------------------------------------------------------------

/// Что делать с пустыми файлами и файлами только из пробельных символов
enum class TrivialFileMode {
    Ignore,  // оставить как есть
    Empty,   // заменить пустым файлом
    OneLine  // заменить одним маркером конца строки
};

/// Что делать с '\v' и '\f'
enum class NonStandardWhitespaceMode {
    Ignore,
    ReplaceWithSpace,
    Remove
};

// ----------------------------------------------------------------------------
// FormatOptions
// ----------------------------------------------------------------------------

struct FormatOptions {
    bool add_new_line_marker_at_end_of_file = false;
    bool remove_new_line_marker_from_end_of_file = false;  // убирает и пустые строки в конце
    bool normalize_new_line_markers = false;
    bool remove_trailing_whitespace = false;
    bool remove_leading_empty_lines = false;
    bool remove_trailing_empty_lines = false;
    LineEndingMode new_line_marker = LineEndingMode::Auto;
    TrivialFileMode normalize_empty_files = TrivialFileMode::Ignore;
    TrivialFileMode normalize_whitespace_only_files = TrivialFileMode::Ignore;

    /// < 0: табы не трогаем, 0: удаляем, N > 0: заменяем на N пробелов
    int replace_tabs_with_spaces = -1;

    NonStandardWhitespaceMode normalize_non_standard_whitespace = NonStandardWhitespaceMode::Ignore;
};

/// Включить опции, которые следуют из других:
/// remove_new_line_marker_from_end_of_file => remove_trailing_empty_lines
void apply_implied_options(FormatOptions& options);

/// Проверить взаимоисключающие опции.
/// @return nullopt если комбинация допустима, иначе текст ошибки в стиле clap
std::optional<std::string> validate(const FormatOptions& options);

// ----------------------------------------------------------------------------
// Текстовые имена режимов
// ----------------------------------------------------------------------------

std::optional<LineEndingMode> parse_line_ending_mode(std::string_view text);
std::optional<TrivialFileMode> parse_trivial_file_mode(std::string_view text);
std::optional<NonStandardWhitespaceMode> parse_non_standard_whitespace_mode(std::string_view text);

const char* to_string(LineEndingMode mode);
const char* to_string(TrivialFileMode mode);
const char* to_string(NonStandardWhitespaceMode mode);

/// Списки допустимых значений для сообщений об ошибках ("auto, linux, ...")
const char* line_ending_mode_values();
const char* trivial_file_mode_values();
const char* non_standard_whitespace_mode_values();

}  // namespace wsformat

#endif  // WSFORMAT_OPTIONS_HPP
