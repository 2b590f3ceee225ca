// ==============================================================================
// wsformat/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами и уровнями ([+] [!] [x] [*] [~])
// - Цветной вывод (ANSI escape codes), режим --color auto/on/off
// - JSON / JSON Lines через RapidJSON
//
// ==============================================================================

#ifndef WSFORMAT_OUTPUT_HPP
#define WSFORMAT_OUTPUT_HPP

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace wsformat::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат отчёта
// ----------------------------------------------------------------------------

enum class Format {
    Std,   // текст для человека
    Json,  // один JSON-документ
    Jsonl  // JSON Lines (один объект на файл)
};

// ----------------------------------------------------------------------------
// Цвета
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // успех, информация
    Yellow,  // предупреждения, изменённые файлы
    Red,     // ошибки
    Cyan,    // отладка
    Magenta  // трассировка
};

/// --color
enum class ColorMode {
    Auto,  // цвет только для TTY
    On,
    Off
};

std::optional<ColorMode> parse_color_mode(std::string_view text);
const char* to_string(ColorMode mode);
const char* color_mode_values();

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;                 // -q: подавить informational stderr
    int verbose = 0;                    // -v: уровень подробности (0..2+)
    ColorMode color = ColorMode::Auto;  // --color
    Format format = Format::Std;        // --json / --jsonl
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    /// Вывод в stdout/stderr процесса
    explicit Writer(const OutputConfig& cfg);

    /// Вывод в заданные потоки (тесты). В режиме auto цвета для них отключены.
    Writer(const OutputConfig& cfg, FILE* out, FILE* err);

    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод в stdout
    // -------------------------------------------------------------------------

    void colored_line(std::string_view message, Color color);

    // JSON вывод в stdout
    // -------------------------------------------------------------------------

    /// Компактный JSON без перевода строки
    void write_json(const rapidjson::Value& value);

    /// JSON + newline (JSONL формат)
    void write_json_line(const rapidjson::Value& value);

    /// JSON с отступами + newline
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Будут ли в поток s выводиться ANSI-коды
    bool use_color(Stream s) const;

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* out_;
    FILE* err_;
    bool tty_out_;
    bool tty_err_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[x] <message>\n" - для ошибок вне Writer (граница main)
std::string format_error(std::string_view message);

/// ANSI escape code для цвета (пустая строка для Default)
std::string ansi_color_code(Color color);

/// Поддерживает ли стандартный поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace wsformat::output

#endif  // WSFORMAT_OUTPUT_HPP
