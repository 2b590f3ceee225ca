// ==============================================================================
// config.cpp - Настройки запуска и файл конфигурации (YAML)
// ==============================================================================

#include "wsformat/config.hpp"

#include "wsformat/platform.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace wsformat::config {

namespace {

// ----------------------------------------------------------------------------
// Разбор значений
// ----------------------------------------------------------------------------

std::optional<bool> parse_flag(std::string_view value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return std::nullopt;
}

std::optional<int> parse_int(std::string_view value) {
    int result = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc() || ptr != last || value.empty()) {
        return std::nullopt;
    }
    return result;
}

/// Сеттер флага, записывающий значение в поле FormatOptions
template <bool FormatOptions::*Field>
bool set_format_flag(Settings& settings, std::string_view value) {
    auto flag = parse_flag(value);
    if (!flag) {
        return false;
    }
    settings.format.*Field = *flag;
    return true;
}

template <TrivialFileMode FormatOptions::*Field>
bool set_trivial_file_mode(Settings& settings, std::string_view value) {
    auto mode = parse_trivial_file_mode(value);
    if (!mode) {
        return false;
    }
    settings.format.*Field = *mode;
    return true;
}

// ----------------------------------------------------------------------------
// Таблица параметров
// ----------------------------------------------------------------------------

std::vector<SettingSpec> make_setting_specs() {
    return {
        {"check-only", "", "",
         "Do not format files. Only report which files would be formatted.",
         [](Settings& s, std::string_view v) {
             auto flag = parse_flag(v);
             if (flag) {
                 s.check_only = *flag;
             }
             return flag.has_value();
         }},
        {"follow-symlinks", "", "", "Follow symbolic links when searching for files.",
         [](Settings& s, std::string_view v) {
             auto flag = parse_flag(v);
             if (flag) {
                 s.follow_symlinks = *flag;
             }
             return flag.has_value();
         }},
        {"exclude", "EXCLUDE", "",
         "Regular expression that specifies which files to exclude.",
         [](Settings& s, std::string_view v) {
             s.exclude = std::string(v);
             return true;
         }},
        {"color", "COLOR", output::color_mode_values(),
         "Enables or disables colored output.",
         [](Settings& s, std::string_view v) {
             auto mode = output::parse_color_mode(v);
             if (mode) {
                 s.color = *mode;
             }
             return mode.has_value();
         }},
        {"new-line-marker", "NEW_LINE_MARKER", line_ending_mode_values(),
         "New line marker to use.",
         [](Settings& s, std::string_view v) {
             auto mode = parse_line_ending_mode(v);
             if (mode) {
                 s.format.new_line_marker = *mode;
             }
             return mode.has_value();
         }},
        {"add-new-line-marker-at-end-of-file", "", "",
         "Add a new line marker at the end of the file if it is missing.",
         &set_format_flag<&FormatOptions::add_new_line_marker_at_end_of_file>},
        {"remove-new-line-marker-from-end-of-file", "", "",
         "Remove all new line marker(s) from the end of each file.",
         &set_format_flag<&FormatOptions::remove_new_line_marker_from_end_of_file>},
        {"normalize-new-line-markers", "", "",
         "Make new line markers the same within each file.",
         &set_format_flag<&FormatOptions::normalize_new_line_markers>},
        {"remove-trailing-whitespace", "", "", "Remove whitespace at the end of each line.",
         &set_format_flag<&FormatOptions::remove_trailing_whitespace>},
        {"remove-leading-empty-lines", "", "", "Remove empty lines at the beginning of each file.",
         &set_format_flag<&FormatOptions::remove_leading_empty_lines>},
        {"remove-trailing-empty-lines", "", "", "Remove empty lines at the end of each file.",
         &set_format_flag<&FormatOptions::remove_trailing_empty_lines>},
        {"normalize-empty-files", "MODE", trivial_file_mode_values(),
         "Replace files of zero length.",
         &set_trivial_file_mode<&FormatOptions::normalize_empty_files>},
        {"normalize-whitespace-only-files", "MODE", trivial_file_mode_values(),
         "Replace files consisting of whitespace only.",
         &set_trivial_file_mode<&FormatOptions::normalize_whitespace_only_files>},
        {"normalize-non-standard-whitespace", "MODE", non_standard_whitespace_mode_values(),
         "Replace or remove non-standard whitespace characters '\\v' and '\\f'.",
         [](Settings& s, std::string_view v) {
             auto mode = parse_non_standard_whitespace_mode(v);
             if (mode) {
                 s.format.normalize_non_standard_whitespace = *mode;
             }
             return mode.has_value();
         }},
        {"replace-tabs-with-spaces", "N", "",
         "Replace tabs with N spaces. Zero removes tabs, a negative value keeps them.",
         [](Settings& s, std::string_view v) {
             auto count = parse_int(v);
             if (count) {
                 s.format.replace_tabs_with_spaces = *count;
             }
             return count.has_value();
         }},
    };
}

// ----------------------------------------------------------------------------
// YAML
// ----------------------------------------------------------------------------

/// Применить один ключ YAML; пустая строка означает успех
std::string apply_yaml_entry(Settings& settings, const std::string& key, const YAML::Node& node) {
    const SettingSpec* spec = find_setting(key);
    if (spec == nullptr) {
        return "unknown key '" + key + "'";
    }
    if (!node.IsScalar()) {
        return "expected a scalar value for key '" + key + "'";
    }

    if (spec->is_flag()) {
        bool flag = false;
        if (!YAML::convert<bool>::decode(node, flag) ||
            !spec->apply(settings, flag ? "true" : "false")) {
            return "expected a boolean for key '" + key + "'";
        }
        return {};
    }

    const std::string& value = node.Scalar();
    if (!spec->apply(settings, value)) {
        std::string message = "invalid value '" + value + "' for key '" + key + "'";
        if (!spec->possible_values.empty()) {
            message += " (possible values: " + std::string(spec->possible_values) + ")";
        }
        return message;
    }
    return {};
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

const std::vector<SettingSpec>& setting_specs() {
    static const std::vector<SettingSpec> specs = make_setting_specs();
    return specs;
}

const SettingSpec* find_setting(std::string_view name) {
    for (const auto& spec : setting_specs()) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

ConfigResult parse_config(std::string_view yaml_text, const Settings& base) {
    ConfigResult result;
    result.ok = false;
    result.settings = base;

    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));

        // Пустой файл - допустимая конфигурация без параметров
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = "expected a mapping of option names to values";
            return result;
        }

        for (const auto& entry : root) {
            if (!entry.first.IsScalar()) {
                result.error = "option names must be strings";
                return result;
            }
            std::string error =
                apply_yaml_entry(result.settings, entry.first.Scalar(), entry.second);
            if (!error.empty()) {
                result.error = std::move(error);
                return result;
            }
        }

        apply_implied_options(result.settings.format);
        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

ConfigResult load_config(const std::filesystem::path& path, const Settings& base) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ConfigResult result;
        result.settings = base;
        result.error = "cannot open configuration file: " + platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), base);
}

}  // namespace wsformat::config
