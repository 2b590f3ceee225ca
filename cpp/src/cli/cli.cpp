// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Сообщения об ошибках повторяют формат clap v4:
//   error: <описание>
//
//   Usage: whitespace-format [OPTIONS] <PATHS>...
//
//   For more information, try '--help'.
//
// ==============================================================================

#include "wsformat/cli.hpp"

#include "wsformat/error.hpp"
#include "wsformat/output.hpp"
#include "wsformat/platform.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>
#include <utility>

namespace wsformat::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: whitespace-format [OPTIONS] <PATHS>...";
constexpr const char* MORE_INFO = "For more information, try '--help'.\n";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// "-v", "-vv", "-vvv"...
bool is_verbose_cluster(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (const char* p = arg + 2; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
    }
    return true;
}

/// Ошибка с блоком Usage
std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg + "\n\n" + USAGE + "\n\n" + MORE_INFO;
}

/// Ошибка без блока Usage (некорректное значение опции)
std::string render_value_error(const std::string& error_msg) {
    return "error: " + error_msg + "\n\n" + MORE_INFO;
}

/// "--name <VALUE_NAME>" или "--name" для флагов
std::string option_display(const config::SettingSpec& spec) {
    std::string text = "--" + std::string(spec.name);
    if (!spec.is_flag()) {
        text += " <" + std::string(spec.value_name) + ">";
    }
    return text;
}

ParseResult usage_failure(ParseResult result, const std::string& error_msg) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg);
    return result;
}

ParseResult value_failure(ParseResult result, const std::string& error_msg) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_value_error(error_msg);
    return result;
}

/// Сообщение о недопустимом значении опции
std::string invalid_value_message(const config::SettingSpec& spec, std::string_view value) {
    std::string message =
        "invalid value '" + std::string(value) + "' for '" + option_display(spec) + "'";
    if (!spec.possible_values.empty()) {
        message += "\n  [possible values: " + std::string(spec.possible_values) + "]";
    } else {
        message += ": invalid digit found in string";
    }
    return message;
}

/// Разделить "--name=value" на имя и значение
std::pair<std::string_view, std::optional<std::string_view>> split_long_option(const char* arg) {
    std::string_view body(arg + 2);
    auto eq = body.find('=');
    if (eq == std::string_view::npos) {
        return {body, std::nullopt};
    }
    return {body.substr(0, eq), body.substr(eq + 1)};
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help() {
    std::vector<std::pair<std::string, std::string>> rows;

    for (const auto& spec : config::setting_specs()) {
        std::string help(spec.help);
        if (!spec.possible_values.empty()) {
            help += " [possible values: " + std::string(spec.possible_values) + "]";
        }
        rows.emplace_back("      " + option_display(spec), std::move(help));
    }
    rows.emplace_back("      --config <FILE>", "Read options from a YAML configuration file");
    rows.emplace_back("      --json", "Print the report as a JSON document");
    rows.emplace_back("      --jsonl", "Print the report as JSON lines, one object per file");
    rows.emplace_back("  -q", "Suppress informational output");
    rows.emplace_back("  -v...", "Print verbose output");
    rows.emplace_back("  -h, --help", "Print help");
    rows.emplace_back("  -V, --version", "Print version");

    std::size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.first.size());
    }

    std::string text;
    text += ABOUT;
    text += "\n\n";
    text += USAGE;
    text += "\n\n"
            "Arguments:\n"
            "  <PATHS>...  List of files and/or directories to process\n"
            "\n"
            "Options:\n";
    for (const auto& row : rows) {
        text += row.first;
        text.append(width - row.first.size() + 2, ' ');
        text += row.second;
        text += "\n";
    }
    return text;
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    // Фаза 1: --help / --version и путь к файлу конфигурации
    std::optional<std::filesystem::path> config_path;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--")) {
            break;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "--config")) {
            if (i + 1 >= argc) {
                return value_failure(
                    std::move(result),
                    "a value is required for '--config <FILE>' but none was supplied");
            }
            ++i;
            config_path = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--config=")) {
            config_path = platform::path_from_utf8(arg + std::strlen("--config="));
        }
    }

    FormatCommand format_cmd;
    format_cmd.config_path = config_path;

    if (config_path.has_value()) {
        config::ConfigResult loaded = config::load_config(*config_path);
        if (!loaded) {
            result.diagnostic.exit_code = 1;
            result.diagnostic.stderr_message = output::format_error(
                format_error_message(ErrorKind::InvalidConfiguration,
                                     platform::path_to_utf8(*config_path), loaded.error));
            return result;
        }
        format_cmd.settings = std::move(loaded.settings);
    }

    // Фаза 2: опции командной строки поверх файла конфигурации
    bool only_positional = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (only_positional || arg[0] != '-' || str_eq(arg, "-")) {
            format_cmd.paths.push_back(platform::path_from_utf8(arg));
        } else if (str_eq(arg, "--")) {
            only_positional = true;
        } else if (is_verbose_cluster(arg)) {
            result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--json")) {
            format_cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            format_cmd.jsonl = true;
        } else if (str_eq(arg, "--config")) {
            ++i;  // уже загружен в фазе 1
        } else if (starts_with(arg, "--config=")) {
            continue;
        } else if (starts_with(arg, "--")) {
            auto [name, inline_value] = split_long_option(arg);
            const config::SettingSpec* spec = config::find_setting(name);
            if (spec == nullptr) {
                return usage_failure(std::move(result), std::string("unexpected argument '") +
                                                            arg + "' found");
            }

            if (spec->is_flag()) {
                if (inline_value.has_value()) {
                    return value_failure(std::move(result),
                                         "unexpected value '" + std::string(*inline_value) +
                                             "' for '" + option_display(*spec) +
                                             "' found; no more were expected");
                }
                if (!spec->apply(format_cmd.settings, "true")) {
                    return value_failure(std::move(result), invalid_value_message(*spec, "true"));
                }
                continue;
            }

            std::string_view value;
            if (inline_value.has_value()) {
                value = *inline_value;
            } else if (i + 1 < argc) {
                ++i;
                value = argv[i];
            } else {
                return value_failure(std::move(result), "a value is required for '" +
                                                            option_display(*spec) +
                                                            "' but none was supplied");
            }

            if (!spec->apply(format_cmd.settings, value)) {
                return value_failure(std::move(result), invalid_value_message(*spec, value));
            }
        } else {
            return usage_failure(std::move(result),
                                 std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (format_cmd.paths.empty()) {
        return usage_failure(std::move(result),
                             "the following required arguments were not provided:\n"
                             "  <PATHS>...");
    }

    if (format_cmd.json && format_cmd.jsonl) {
        return usage_failure(std::move(result),
                             "the argument '--json' cannot be used with '--jsonl'");
    }

    apply_implied_options(format_cmd.settings.format);
    if (auto conflict = validate(format_cmd.settings.format)) {
        return usage_failure(std::move(result), *conflict);
    }

    result.ok = true;
    result.command = std::move(format_cmd);
    return result;
}

}  // namespace wsformat::cli
