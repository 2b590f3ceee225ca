// ==============================================================================
// formatter.cpp - Однопроходный форматтер содержимого файла
// ==============================================================================
//
// Все позиции ниже - позиции в ВЫХОДНОМ буфере (Sink), а не во входе.
//
// ==============================================================================

#include "wsformat/formatter.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace wsformat {

namespace {

// ----------------------------------------------------------------------------
// Состояние прохода
// ----------------------------------------------------------------------------

struct ScanState {
    /// Номер текущей строки; увеличивается после каждого записанного маркера
    std::size_t line_number = 1;

    /// Позиция сразу после последнего записанного маркера конца строки
    std::size_t end_of_line = 0;

    /// Позиция сразу после последнего непробельного байта
    std::size_t last_non_whitespace = 0;

    /// Конец последней непустой строки без маркера и с маркером
    std::size_t end_of_non_empty_line_excluding_marker = 0;
    std::size_t end_of_non_empty_line_including_marker = 0;

    /// Номер последней непустой строки (0 - таких строк ещё не было)
    std::size_t last_non_empty_line_number = 0;

    /// Запись LeadingBlankLinesRemoved уже добавлена
    bool leading_lines_reported = false;
};

class ContentFormatter {
public:
    ContentFormatter(std::string_view input, const FormatOptions& options, Sink& sink)
        : input_(input),
          options_(options),
          sink_(sink),
          output_marker_(resolve_line_ending(options.new_line_marker, input)) {}

    std::vector<Change> run();

private:
    std::vector<Change> format_empty_file();
    std::vector<Change> format_whitespace_only_file();

    void scan();
    void end_line(LineEnding marker);
    void write_tab();
    void write_non_standard_whitespace(char byte);
    void finish();

    void record(std::size_t line_number, ChangeKind kind) {
        changes_.emplace_back(line_number, std::move(kind));
    }

    std::string_view input_;
    const FormatOptions& options_;
    Sink& sink_;
    const LineEnding output_marker_;

    ScanState state_;
    std::vector<Change> changes_;
};

std::vector<Change> ContentFormatter::run() {
    if (input_.empty()) {
        return format_empty_file();
    }
    if (is_whitespace_only(input_)) {
        return format_whitespace_only_file();
    }

    scan();
    finish();
    return std::move(changes_);
}

// ----------------------------------------------------------------------------
// Тривиальные файлы
// ----------------------------------------------------------------------------

std::vector<Change> ContentFormatter::format_empty_file() {
    switch (options_.normalize_empty_files) {
    case TrivialFileMode::Ignore:
    case TrivialFileMode::Empty:
        break;
    case TrivialFileMode::OneLine:
        sink_.write(line_ending_bytes(output_marker_));
        record(1, change::EmptyFileReplacedWithOneLine{});
        break;
    }
    return std::move(changes_);
}

std::vector<Change> ContentFormatter::format_whitespace_only_file() {
    switch (options_.normalize_whitespace_only_files) {
    case TrivialFileMode::Ignore:
        sink_.write(input_);
        break;
    case TrivialFileMode::Empty:
        record(1, change::WhitespaceOnlyFileReplacedWithEmpty{});
        break;
    case TrivialFileMode::OneLine: {
        const std::string_view marker = line_ending_bytes(output_marker_);
        sink_.write(marker);
        // Файл, уже состоящий ровно из одного маркера, не меняется
        if (input_ != marker) {
            record(1, change::WhitespaceOnlyFileReplacedWithOneLine{});
        }
        break;
    }
    }
    return std::move(changes_);
}

// ----------------------------------------------------------------------------
// Побайтовый проход
// ----------------------------------------------------------------------------

void ContentFormatter::scan() {
    for (std::size_t i = 0; i < input_.size(); ++i) {
        const char byte = input_[i];

        if (byte == CARRIAGE_RETURN || byte == LINE_FEED) {
            LineEnding marker = LineEnding::Linux;
            if (byte == CARRIAGE_RETURN) {
                if (i + 1 < input_.size() && input_[i + 1] == LINE_FEED) {
                    marker = LineEnding::Windows;
                    ++i;  // второй байт CRLF
                } else {
                    marker = LineEnding::MacOs;
                }
            }
            end_line(marker);
        } else if (byte == SPACE) {
            sink_.write(byte);
        } else if (byte == TAB) {
            write_tab();
        } else if (byte == VERTICAL_TAB || byte == FORM_FEED) {
            write_non_standard_whitespace(byte);
        } else {
            sink_.write(byte);
            state_.last_non_whitespace = sink_.position();
        }
    }
}

void ContentFormatter::end_line(LineEnding marker) {
    // Хвостовые пробелы: всё, что записано после последнего непробельного
    // байта и после последнего маркера
    if (options_.remove_trailing_whitespace) {
        const std::size_t keep = std::max(state_.last_non_whitespace, state_.end_of_line);
        if (keep < sink_.position()) {
            record(state_.line_number, change::TrailingWhitespaceRemoved{});
            sink_.rewind(keep);
        }
    }

    const bool is_empty_line = state_.end_of_line == sink_.position();

    // Пустые строки в начале файла: маркер не пишется, номер строки не растёт
    if (options_.remove_leading_empty_lines && is_empty_line && state_.line_number == 1) {
        if (!state_.leading_lines_reported) {
            record(1, change::LeadingBlankLinesRemoved{});
            state_.leading_lines_reported = true;
        }
        return;
    }

    const std::size_t end_of_line_excluding_marker = sink_.position();

    if (options_.normalize_new_line_markers && marker != output_marker_) {
        record(state_.line_number, change::LineEndingReplaced{marker, output_marker_});
        sink_.write(line_ending_bytes(output_marker_));
    } else {
        sink_.write(line_ending_bytes(marker));
    }
    state_.end_of_line = sink_.position();

    if (!is_empty_line) {
        state_.end_of_non_empty_line_excluding_marker = end_of_line_excluding_marker;
        state_.end_of_non_empty_line_including_marker = state_.end_of_line;
        state_.last_non_empty_line_number = state_.line_number;
    }
    ++state_.line_number;
}

void ContentFormatter::write_tab() {
    const int spaces = options_.replace_tabs_with_spaces;
    if (spaces < 0) {
        sink_.write(TAB);
    } else if (spaces > 0) {
        record(state_.line_number,
               change::TabReplacedWithSpaces{static_cast<std::size_t>(spaces)});
        for (int i = 0; i < spaces; ++i) {
            sink_.write(SPACE);
        }
    } else {
        record(state_.line_number, change::TabRemoved{});
    }
}

void ContentFormatter::write_non_standard_whitespace(char byte) {
    switch (options_.normalize_non_standard_whitespace) {
    case NonStandardWhitespaceMode::Ignore:
        sink_.write(byte);
        break;
    case NonStandardWhitespaceMode::ReplaceWithSpace:
        sink_.write(SPACE);
        record(state_.line_number, change::NonStandardWhitespaceReplacedWithSpace{byte});
        break;
    case NonStandardWhitespaceMode::Remove:
        record(state_.line_number, change::NonStandardWhitespaceRemoved{byte});
        break;
    }
}

// ----------------------------------------------------------------------------
// Конец файла
// ----------------------------------------------------------------------------

void ContentFormatter::finish() {
    // 1. Хвостовые пробелы последней (незавершённой) строки.
    // Откат не дальше последнего маркера: иначе удалился бы сам маркер.
    if (options_.remove_trailing_whitespace) {
        const std::size_t keep = std::max(state_.last_non_whitespace, state_.end_of_line);
        if (keep < sink_.position()) {
            record(state_.line_number, change::TrailingWhitespaceRemoved{});
            sink_.rewind(keep);
        }
    }

    // 2. Пустые строки в конце файла; все подряд идущие дают одну запись
    if (options_.remove_trailing_empty_lines && state_.end_of_line == sink_.position() &&
        state_.end_of_non_empty_line_including_marker < sink_.position()) {
        state_.line_number = state_.last_non_empty_line_number + 1;
        state_.end_of_line = state_.end_of_non_empty_line_including_marker;
        record(state_.line_number, change::TrailingBlankLinesRemoved{});
        sink_.rewind(state_.end_of_non_empty_line_including_marker);
    }

    // 3. Маркер в конце файла, если последняя строка не завершена
    if (options_.add_new_line_marker_at_end_of_file && state_.end_of_line < sink_.position()) {
        record(state_.line_number, change::EofMarkerAdded{});
        sink_.write(line_ending_bytes(output_marker_));
        state_.end_of_line = sink_.position();
        ++state_.line_number;
    }

    // 4. Удаление маркера в конце файла. Откат к концу последней непустой
    // строки убирает и пустые строки после неё; запись при этом одна.
    if (options_.remove_new_line_marker_from_end_of_file &&
        state_.end_of_line == sink_.position() && state_.line_number >= 2) {
        state_.line_number = state_.last_non_empty_line_number;
        record(state_.line_number, change::EofMarkerRemoved{});
        sink_.rewind(state_.end_of_non_empty_line_excluding_marker);
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

bool is_whitespace_only(std::string_view input) {
    return std::all_of(input.begin(), input.end(), is_whitespace_byte);
}

std::vector<Change> format_content(std::string_view input, const FormatOptions& options,
                                   Sink& sink) {
    ContentFormatter formatter(input, options, sink);
    return formatter.run();
}

}  // namespace wsformat
