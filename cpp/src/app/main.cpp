// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Поиск файлов (discovery)
// 4. Обработка каждого файла (processor) и отчёт (report)
// 5. Возврат exit code
//
// Исключения перехватываются на границе приложения: "[x] <err>", exit code 1.
//
// ==============================================================================

#include "wsformat/cli.hpp"
#include "wsformat/discovery.hpp"
#include "wsformat/error.hpp"
#include "wsformat/output.hpp"
#include "wsformat/platform.hpp"
#include "wsformat/processor.hpp"
#include "wsformat/report.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace {

int run_format(const wsformat::cli::FormatCommand& cmd, wsformat::output::Writer& writer) {
    using namespace wsformat;

    const config::Settings& settings = cmd.settings;
    writer.trace("Platform: " + platform::os_name());

    if (cmd.config_path.has_value()) {
        writer.debug("Loaded configuration from " + platform::path_to_utf8(*cmd.config_path));
    }

    io::DiscoveryOptions disc_opt;
    disc_opt.follow_symlinks = settings.follow_symlinks;
    disc_opt.exclude = settings.exclude;

    auto files = io::discover_files(cmd.paths, disc_opt);

    report::Reporter reporter(writer, settings.check_only);
    reporter.begin(files.size());
    for (const auto& file : files) {
        writer.trace("Processing " + platform::path_to_utf8(file));
        ProcessResult result = process_file(file, settings.format, settings.check_only);
        reporter.add(report::FileReport{file, std::move(result.changes)});
    }
    reporter.finish();

    return report::exit_code(reporter.summary(), settings.check_only);
}

int run(int argc, char** argv) {
    using namespace wsformat;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    if (const auto* cmd = std::get_if<cli::FormatCommand>(&parse_result.command)) {
        out_cfg.color = cmd->settings.color;
        if (cmd->json) {
            out_cfg.format = output::Format::Json;
        } else if (cmd->jsonl) {
            out_cfg.format = output::Format::Jsonl;
        }
    }
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                try {
                    return run_format(cmd, writer);
                } catch (const Error& e) {
                    writer.error(e.what());
                    return 1;
                }
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Writer мог не создаться: пишем напрямую
        std::fputs(wsformat::output::format_error(e.what()).c_str(), stderr);
        return 1;
    }
}
