// ==============================================================================
// wsformat/config.hpp - Настройки запуска и файл конфигурации (YAML)
// ==============================================================================
//
// Назначение:
// - Settings: всё, что задаётся опциями CLI кроме путей и формата отчёта
// - Таблица параметров (имя длинной опции без "--", тип значения, сеттер);
//   её используют и парсер argv, и загрузчик YAML
// - Загрузка YAML-файла --config через yaml-cpp
//
// Формат файла:
//
//   remove-trailing-whitespace: true
//   new-line-marker: windows
//   replace-tabs-with-spaces: 4
//   exclude: "\\.git/"
//
// ==============================================================================

#ifndef WSFORMAT_CONFIG_HPP
#define WSFORMAT_CONFIG_HPP

#include "wsformat/options.hpp"
#include "wsformat/output.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsformat::config {

// ----------------------------------------------------------------------------
// Settings
// ----------------------------------------------------------------------------

struct Settings {
    FormatOptions format;
    bool check_only = false;                            // --check-only
    bool follow_symlinks = false;                       // --follow-symlinks
    std::optional<std::string> exclude;                 // --exclude
    output::ColorMode color = output::ColorMode::Auto;  // --color
};

// ----------------------------------------------------------------------------
// Таблица параметров
// ----------------------------------------------------------------------------

struct SettingSpec {
    /// Имя длинной опции без "--"; оно же ключ YAML
    std::string_view name;

    /// Имя значения для сообщений ("NEW_LINE_MARKER"); пусто для флагов
    std::string_view value_name;

    /// Допустимые значения через запятую; пусто, если значение произвольное
    std::string_view possible_values;

    /// Краткое описание для --help
    std::string_view help;

    /// Применить значение. Флаги получают "true" или "false".
    /// @return false, если значение недопустимо
    bool (*apply)(Settings& settings, std::string_view value);

    bool is_flag() const { return value_name.empty(); }
};

/// Все параметры в порядке вывода в --help
const std::vector<SettingSpec>& setting_specs();

/// Найти параметр по имени; nullptr если такого нет
const SettingSpec* find_setting(std::string_view name);

// ----------------------------------------------------------------------------
// Файл конфигурации
// ----------------------------------------------------------------------------

struct ConfigResult {
    bool ok = false;
    Settings settings;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML-текст поверх base (значения из файла заменяют base)
ConfigResult parse_config(std::string_view yaml_text, const Settings& base = {});

/// Прочитать и разобрать файл конфигурации
ConfigResult load_config(const std::filesystem::path& path, const Settings& base = {});

}  // namespace wsformat::config

#endif  // WSFORMAT_CONFIG_HPP
