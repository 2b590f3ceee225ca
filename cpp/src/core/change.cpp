// ==============================================================================
// change.cpp - Журнал изменений
// ==============================================================================
//
// Описания изменений задаются таблицей: одна пара шаблонов (изменено /
// было бы изменено) на каждую альтернативу ChangeKind. Параметры шаблона
// {0}, {1} подставляются из данных изменения.
//
// ==============================================================================

#include "wsformat/change.hpp"

#include <array>
#include <type_traits>
#include <vector>

namespace wsformat {

namespace change {

bool operator==(const LineEndingReplaced& a, const LineEndingReplaced& b) {
    return a.from == b.from && a.to == b.to;
}

bool operator==(const TabReplacedWithSpaces& a, const TabReplacedWithSpaces& b) {
    return a.count == b.count;
}

bool operator==(const NonStandardWhitespaceReplacedWithSpace& a,
                const NonStandardWhitespaceReplacedWithSpace& b) {
    return a.byte == b.byte;
}

bool operator==(const NonStandardWhitespaceRemoved& a, const NonStandardWhitespaceRemoved& b) {
    return a.byte == b.byte;
}

}  // namespace change

namespace {

// ----------------------------------------------------------------------------
// Таблица формулировок
// ----------------------------------------------------------------------------

struct Phrasing {
    std::string_view name;     // машинное имя (JSON)
    std::string_view applied;  // файл изменён
    std::string_view checked;  // --check-only
};

// Порядок строк совпадает с порядком альтернатив ChangeKind
constexpr std::array<Phrasing, 13> PHRASINGS = {{
    {"eof-marker-added", "New line marker was added to the end of the file.",
     "New line marker would be added to the end of the file."},
    {"eof-marker-removed", "New line marker was removed from the end of the file.",
     "New line marker would be removed from the end of the file."},
    {"line-ending-replaced", "New line marker '{0}' was replaced by '{1}'.",
     "New line marker '{0}' would be replaced by '{1}'."},
    {"trailing-whitespace-removed", "Trailing whitespace was removed.",
     "Trailing whitespace would be removed."},
    {"leading-blank-lines-removed", "Empty line(s) at the beginning of the file were removed.",
     "Empty line(s) at the beginning of the file would be removed."},
    {"trailing-blank-lines-removed", "Empty line(s) at the end of the file were removed.",
     "Empty line(s) at the end of the file would be removed."},
    {"empty-file-replaced-with-one-line", "Empty file was replaced with a single empty line.",
     "Empty file would be replaced with a single empty line."},
    {"whitespace-only-file-replaced-with-empty", "File was replaced with an empty file.",
     "File would be replaced with an empty file."},
    {"whitespace-only-file-replaced-with-one-line", "File was replaced with a single empty line.",
     "File would be replaced with a single empty line."},
    {"tab-replaced-with-spaces", "Tab was replaced with {0}.", "Tab would be replaced with {0}."},
    {"tab-removed", "Tab was removed.", "Tab would be removed."},
    {"nonstandard-whitespace-replaced-with-space",
     "Non-standard whitespace character '{0}' was replaced by a space.",
     "Non-standard whitespace character '{0}' would be replaced by a space."},
    {"nonstandard-whitespace-removed", "Non-standard whitespace character '{0}' was removed.",
     "Non-standard whitespace character '{0}' would be removed."},
}};

static_assert(PHRASINGS.size() == std::variant_size_v<ChangeKind>,
              "every ChangeKind alternative needs a phrasing");

/// Параметры шаблона для конкретного изменения
std::vector<std::string> template_arguments(const ChangeKind& kind) {
    return std::visit(
        [](auto&& c) -> std::vector<std::string> {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, change::LineEndingReplaced>) {
                return {std::string(line_ending_to_escape(c.from)),
                        std::string(line_ending_to_escape(c.to))};
            } else if constexpr (std::is_same_v<T, change::TabReplacedWithSpaces>) {
                return {std::to_string(c.count) + (c.count == 1 ? " space" : " spaces")};
            } else if constexpr (
                std::is_same_v<T, change::NonStandardWhitespaceReplacedWithSpace> ||
                std::is_same_v<T, change::NonStandardWhitespaceRemoved>) {
                return {std::string(byte_to_escape(c.byte))};
            } else {
                return {};
            }
        },
        kind);
}

/// Подставить {0}, {1}, ... в шаблон
std::string substitute(std::string_view pattern, const std::vector<std::string>& args) {
    std::string result;
    result.reserve(pattern.size() + 16);

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '{' && i + 2 < pattern.size() && pattern[i + 2] == '}' &&
            pattern[i + 1] >= '0' && pattern[i + 1] <= '9') {
            auto index = static_cast<std::size_t>(pattern[i + 1] - '0');
            if (index < args.size()) {
                result += args[index];
            }
            i += 2;
            continue;
        }
        result += pattern[i];
    }
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::string describe(const ChangeKind& kind, bool check_only) {
    const Phrasing& phrasing = PHRASINGS[kind.index()];
    return substitute(check_only ? phrasing.checked : phrasing.applied, template_arguments(kind));
}

std::string_view change_kind_name(const ChangeKind& kind) {
    return PHRASINGS[kind.index()].name;
}

std::string Change::to_string(bool check_only) const {
    return "line " + std::to_string(line_number) + ": " + describe(kind, check_only);
}

bool operator==(const Change& a, const Change& b) {
    return a.line_number == b.line_number && a.kind == b.kind;
}

bool operator!=(const Change& a, const Change& b) {
    return !(a == b);
}

}  // namespace wsformat
