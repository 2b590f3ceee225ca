// ==============================================================================
// wsformat/change.hpp - Журнал изменений
// ==============================================================================
//
// Назначение:
// - ChangeKind: тип изменения с типизированными данными (std::variant)
// - Change: (номер строки, тип изменения)
// - Рендеринг в строку "line <n>: <описание>" в двух формулировках:
//   прошедшее время (файл изменён) и "would be" (режим --check-only)
// - Стабильные машинные имена для JSON-отчёта
//
// Номер строки считается по ВЫХОДНОМУ потоку, начиная с 1.
//
// ==============================================================================

#ifndef WSFORMAT_CHANGE_HPP
#define WSFORMAT_CHANGE_HPP

#include "wsformat/line_ending.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace wsformat {

// ----------------------------------------------------------------------------
// Типы изменений
// ----------------------------------------------------------------------------

namespace change {

struct EofMarkerAdded {};
struct EofMarkerRemoved {};

struct LineEndingReplaced {
    LineEnding from = LineEnding::Linux;
    LineEnding to = LineEnding::Linux;
};

struct TrailingWhitespaceRemoved {};
struct LeadingBlankLinesRemoved {};
struct TrailingBlankLinesRemoved {};
struct EmptyFileReplacedWithOneLine {};
struct WhitespaceOnlyFileReplacedWithEmpty {};
struct WhitespaceOnlyFileReplacedWithOneLine {};

struct TabReplacedWithSpaces {
    std::size_t count = 0;
};

struct TabRemoved {};

/// byte - VERTICAL_TAB или FORM_FEED
struct NonStandardWhitespaceReplacedWithSpace {
    char byte = VERTICAL_TAB;
};

struct NonStandardWhitespaceRemoved {
    char byte = VERTICAL_TAB;
};

bool operator==(const LineEndingReplaced& a, const LineEndingReplaced& b);
bool operator==(const TabReplacedWithSpaces& a, const TabReplacedWithSpaces& b);
bool operator==(const NonStandardWhitespaceReplacedWithSpace& a,
                const NonStandardWhitespaceReplacedWithSpace& b);
bool operator==(const NonStandardWhitespaceRemoved& a, const NonStandardWhitespaceRemoved& b);

// Типы без данных равны всегда
inline bool operator==(const EofMarkerAdded&, const EofMarkerAdded&) {
    return true;
}
inline bool operator==(const EofMarkerRemoved&, const EofMarkerRemoved&) {
    return true;
}
inline bool operator==(const TrailingWhitespaceRemoved&, const TrailingWhitespaceRemoved&) {
    return true;
}
inline bool operator==(const LeadingBlankLinesRemoved&, const LeadingBlankLinesRemoved&) {
    return true;
}
inline bool operator==(const TrailingBlankLinesRemoved&, const TrailingBlankLinesRemoved&) {
    return true;
}
inline bool operator==(const EmptyFileReplacedWithOneLine&, const EmptyFileReplacedWithOneLine&) {
    return true;
}
inline bool operator==(const WhitespaceOnlyFileReplacedWithEmpty&,
                       const WhitespaceOnlyFileReplacedWithEmpty&) {
    return true;
}
inline bool operator==(const WhitespaceOnlyFileReplacedWithOneLine&,
                       const WhitespaceOnlyFileReplacedWithOneLine&) {
    return true;
}
inline bool operator==(const TabRemoved&, const TabRemoved&) {
    return true;
}

}  // namespace change

/// Порядок альтернатив определяет индекс в таблице описаний (change.cpp)
using ChangeKind =
    std::variant<change::EofMarkerAdded, change::EofMarkerRemoved, change::LineEndingReplaced,
                 change::TrailingWhitespaceRemoved, change::LeadingBlankLinesRemoved,
                 change::TrailingBlankLinesRemoved, change::EmptyFileReplacedWithOneLine,
                 change::WhitespaceOnlyFileReplacedWithEmpty,
                 change::WhitespaceOnlyFileReplacedWithOneLine, change::TabReplacedWithSpaces,
                 change::TabRemoved, change::NonStandardWhitespaceReplacedWithSpace,
                 change::NonStandardWhitespaceRemoved>;

// ----------------------------------------------------------------------------
// Change - одна запись журнала
// ----------------------------------------------------------------------------

struct Change {
    std::size_t line_number = 1;
    ChangeKind kind;

    Change() = default;
    Change(std::size_t line, ChangeKind k) : line_number(line), kind(std::move(k)) {}

    /// "line <n>: <описание>"
    std::string to_string(bool check_only) const;
};

bool operator==(const Change& a, const Change& b);
bool operator!=(const Change& a, const Change& b);

/// Описание изменения без номера строки
std::string describe(const ChangeKind& kind, bool check_only);

/// Машинное имя типа изменения ("trailing-whitespace-removed", ...)
std::string_view change_kind_name(const ChangeKind& kind);

}  // namespace wsformat

#endif  // WSFORMAT_CHANGE_HPP
