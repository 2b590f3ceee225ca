// ==============================================================================
// options.cpp - Параметры форматирования одного файла
// ==============================================================================

#include "wsformat/options.hpp"

namespace wsformat {

// ----------------------------------------------------------------------------
// Проверка комбинаций
// ----------------------------------------------------------------------------

void apply_implied_options(FormatOptions& options) {
    if (options.remove_new_line_marker_from_end_of_file) {
        options.remove_trailing_empty_lines = true;
    }
}

std::optional<std::string> validate(const FormatOptions& options) {
    if (options.add_new_line_marker_at_end_of_file &&
        options.remove_new_line_marker_from_end_of_file) {
        return std::string(
            "the argument '--add-new-line-marker-at-end-of-file' cannot be used with "
            "'--remove-new-line-marker-from-end-of-file'");
    }

    // Пара не идемпотентна: пустой файл -> одна строка -> пустой файл
    if (options.normalize_empty_files == TrivialFileMode::OneLine &&
        options.normalize_whitespace_only_files == TrivialFileMode::Empty) {
        return std::string(
            "the argument '--normalize-whitespace-only-files=empty' cannot be used with "
            "'--normalize-empty-files=one-line'");
    }

    return std::nullopt;
}

// ----------------------------------------------------------------------------
// LineEndingMode
// ----------------------------------------------------------------------------

std::optional<LineEndingMode> parse_line_ending_mode(std::string_view text) {
    if (text == "auto") {
        return LineEndingMode::Auto;
    }
    if (text == "linux") {
        return LineEndingMode::Linux;
    }
    if (text == "mac-os") {
        return LineEndingMode::MacOs;
    }
    if (text == "windows") {
        return LineEndingMode::Windows;
    }
    return std::nullopt;
}

const char* to_string(LineEndingMode mode) {
    switch (mode) {
    case LineEndingMode::Auto:
        return "auto";
    case LineEndingMode::Linux:
        return "linux";
    case LineEndingMode::MacOs:
        return "mac-os";
    case LineEndingMode::Windows:
        return "windows";
    }
    return "auto";
}

const char* line_ending_mode_values() {
    return "auto, linux, mac-os, windows";
}

// ----------------------------------------------------------------------------
// TrivialFileMode
// ----------------------------------------------------------------------------

std::optional<TrivialFileMode> parse_trivial_file_mode(std::string_view text) {
    if (text == "ignore") {
        return TrivialFileMode::Ignore;
    }
    if (text == "empty") {
        return TrivialFileMode::Empty;
    }
    if (text == "one-line") {
        return TrivialFileMode::OneLine;
    }
    return std::nullopt;
}

const char* to_string(TrivialFileMode mode) {
    switch (mode) {
    case TrivialFileMode::Ignore:
        return "ignore";
    case TrivialFileMode::Empty:
        return "empty";
    case TrivialFileMode::OneLine:
        return "one-line";
    }
    return "ignore";
}

const char* trivial_file_mode_values() {
    return "ignore, empty, one-line";
}

// ----------------------------------------------------------------------------
// NonStandardWhitespaceMode
// ----------------------------------------------------------------------------

std::optional<NonStandardWhitespaceMode> parse_non_standard_whitespace_mode(std::string_view text) {
    if (text == "ignore") {
        return NonStandardWhitespaceMode::Ignore;
    }
    if (text == "replace-with-space") {
        return NonStandardWhitespaceMode::ReplaceWithSpace;
    }
    if (text == "remove") {
        return NonStandardWhitespaceMode::Remove;
    }
    return std::nullopt;
}

const char* to_string(NonStandardWhitespaceMode mode) {
    switch (mode) {
    case NonStandardWhitespaceMode::Ignore:
        return "ignore";
    case NonStandardWhitespaceMode::ReplaceWithSpace:
        return "replace-with-space";
    case NonStandardWhitespaceMode::Remove:
        return "remove";
    }
    return "ignore";
}

const char* non_standard_whitespace_mode_values() {
    return "ignore, replace-with-space, remove";
}

}  // namespace wsformat
