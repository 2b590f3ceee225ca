// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется.
//
// ==============================================================================

#include "wsformat/output.hpp"

#include "wsformat/platform.hpp"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace wsformat::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

}  // namespace

// ----------------------------------------------------------------------------
// ColorMode
// ----------------------------------------------------------------------------

std::optional<ColorMode> parse_color_mode(std::string_view text) {
    if (text == "auto") {
        return ColorMode::Auto;
    }
    if (text == "on") {
        return ColorMode::On;
    }
    if (text == "off") {
        return ColorMode::Off;
    }
    return std::nullopt;
}

const char* to_string(ColorMode mode) {
    switch (mode) {
    case ColorMode::Auto:
        return "auto";
    case ColorMode::On:
        return "on";
    case ColorMode::Off:
        return "off";
    }
    return "auto";
}

const char* color_mode_values() {
    return "auto, off, on";
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg)
    : config_(cfg),
      out_(stdout),
      err_(stderr),
      tty_out_(supports_color(Stream::Stdout)),
      tty_err_(supports_color(Stream::Stderr)) {}

Writer::Writer(const OutputConfig& cfg, FILE* out, FILE* err)
    : config_(cfg), out_(out), err_(err), tty_out_(false), tty_err_(false) {}

Writer::~Writer() {
    flush();
}

bool Writer::use_color(Stream s) const {
    switch (config_.color) {
    case ColorMode::On:
        return true;
    case ColorMode::Off:
        return false;
    case ColorMode::Auto:
        break;
    }
    return s == Stream::Stdout ? tty_out_ : tty_err_;
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? out_ : err_;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (use_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::colored_line(std::string_view message, Color color) {
    if (use_color(Stream::Stdout) && color != Color::Default) {
        write(Stream::Stdout, ansi_color_code(color));
        write(Stream::Stdout, message);
        write(Stream::Stdout, ANSI_RESET);
    } else {
        write(Stream::Stdout, message);
    }
    write(Stream::Stdout, "\n");
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    if (out_ != nullptr) {
        std::fflush(out_);
    }
    if (err_ != nullptr) {
        std::fflush(err_);
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_error(std::string_view message) {
    return "[x] " + std::string(message) + "\n";
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        break;
    }
    return "";
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace wsformat::output
