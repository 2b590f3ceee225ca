// ==============================================================================
// line_ending.cpp - Модель маркеров конца строки
// ==============================================================================

#include "wsformat/line_ending.hpp"

#include <cstddef>

namespace wsformat {

bool is_whitespace_byte(char byte) {
    switch (byte) {
    case CARRIAGE_RETURN:
    case LINE_FEED:
    case SPACE:
    case TAB:
    case VERTICAL_TAB:
    case FORM_FEED:
        return true;
    default:
        return false;
    }
}

std::string_view byte_to_escape(char byte) {
    switch (byte) {
    case CARRIAGE_RETURN:
        return "\\r";
    case LINE_FEED:
        return "\\n";
    case SPACE:
        return " ";
    case TAB:
        return "\\t";
    case VERTICAL_TAB:
        return "\\v";
    case FORM_FEED:
        return "\\f";
    default:
        return "?";
    }
}

// ----------------------------------------------------------------------------
// LineEnding
// ----------------------------------------------------------------------------

std::string_view line_ending_bytes(LineEnding ending) {
    switch (ending) {
    case LineEnding::Linux:
        return "\n";
    case LineEnding::MacOs:
        return "\r";
    case LineEnding::Windows:
        return "\r\n";
    }
    return "\n";
}

std::string_view line_ending_to_escape(LineEnding ending) {
    switch (ending) {
    case LineEnding::Linux:
        return "\\n";
    case LineEnding::MacOs:
        return "\\r";
    case LineEnding::Windows:
        return "\\r\\n";
    }
    return "\\n";
}

// ----------------------------------------------------------------------------
// Автоопределение
// ----------------------------------------------------------------------------

LineEnding find_most_common_line_ending(std::string_view input) {
    std::size_t linux_count = 0;
    std::size_t macos_count = 0;
    std::size_t windows_count = 0;

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == CARRIAGE_RETURN) {
            if (i + 1 < input.size() && input[i + 1] == LINE_FEED) {
                ++windows_count;
                ++i;  // LF уже учтён как часть CRLF
            } else {
                ++macos_count;
            }
        } else if (input[i] == LINE_FEED) {
            ++linux_count;
        }
    }

    // Ничьи: Linux > Windows > MacOs
    if (macos_count > windows_count && macos_count > linux_count) {
        return LineEnding::MacOs;
    }
    if (windows_count > linux_count) {
        return LineEnding::Windows;
    }
    return LineEnding::Linux;
}

LineEnding resolve_line_ending(LineEndingMode mode, std::string_view input) {
    switch (mode) {
    case LineEndingMode::Auto:
        return find_most_common_line_ending(input);
    case LineEndingMode::Linux:
        return LineEnding::Linux;
    case LineEndingMode::MacOs:
        return LineEnding::MacOs;
    case LineEndingMode::Windows:
        return LineEnding::Windows;
    }
    return LineEnding::Linux;
}

}  // namespace wsformat
