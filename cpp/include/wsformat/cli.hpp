// ==============================================================================
// wsformat/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv (формы "--opt value" и "--opt=value")
// - Наложение опций командной строки на файл --config
// - Генерация --help / --version
// - Диагностика ошибок CLI в стиле clap (exit code 2)
//
// ==============================================================================

#ifndef WSFORMAT_CLI_HPP
#define WSFORMAT_CLI_HPP

#include "wsformat/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wsformat::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Форматирование (или проверка) файлов
struct FormatCommand {
    std::vector<std::filesystem::path> paths;
    config::Settings settings;
    std::optional<std::filesystem::path> config_path;  // --config
    bool json = false;                                 // --json
    bool jsonl = false;                                // --jsonl
};

/// -h, --help
struct HelpCommand {};

/// -V, --version
struct VersionCommand {};

using Command = std::variant<FormatCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки.
///
/// Порядок: -h/-V имеют приоритет; затем загружается --config (если задан);
/// затем опции командной строки перекрывают значения из файла; в конце
/// проверяются взаимоисключающие комбинации.
///
/// Ошибки использования дают exit_code 2. Некорректный файл конфигурации
/// даёт exit_code 1 и сообщение "[x] Invalid configuration file ...".
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "whitespace-format";

constexpr const char* VERSION = "0.1.7";

constexpr const char* ABOUT =
    "Whitespace formatter and linter for text files and source code files.";

}  // namespace wsformat::cli

#endif  // WSFORMAT_CLI_HPP
