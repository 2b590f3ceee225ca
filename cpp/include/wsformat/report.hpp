// ==============================================================================
// wsformat/report.hpp - Отчёт об изменениях
// ==============================================================================
//
// Назначение:
// - Вывод результатов по каждому файлу (текст, JSON, JSON Lines)
// - Итоговая сводка и код завершения
//
// Текстовый режим:
//
//   Reformatted src/a.txt
//       line 3: Trailing whitespace was removed.
//   1 file(s) reformatted, 4 file(s) left unchanged.
//
// JSON Lines печатаются сразу по мере обработки; JSON-документ - в finish().
//
// ==============================================================================

#ifndef WSFORMAT_REPORT_HPP
#define WSFORMAT_REPORT_HPP

#include "wsformat/change.hpp"
#include "wsformat/output.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace wsformat::report {

// ----------------------------------------------------------------------------
// Данные отчёта
// ----------------------------------------------------------------------------

struct FileReport {
    std::filesystem::path path;
    std::vector<Change> changes;

    bool changed() const { return !changes.empty(); }
};

struct Summary {
    std::size_t changed = 0;
    std::size_t unchanged = 0;

    std::size_t total() const { return changed + unchanged; }
};

/// Текст сводки, например "2 file(s) would be reformatted, 1 file(s) already formatted."
std::string render_summary(const Summary& summary, bool check_only);

/// Код завершения: 1 если в режиме --check-only найден файл с изменениями
int exit_code(const Summary& summary, bool check_only);

// ----------------------------------------------------------------------------
// Reporter
// ----------------------------------------------------------------------------

class Reporter {
public:
    Reporter(output::Writer& writer, bool check_only);
    ~Reporter();

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    /// Сообщить число найденных файлов (stderr, подавляется -q)
    void begin(std::size_t file_count);

    /// Добавить результат по одному файлу
    void add(FileReport file);

    /// Вывести сводку (или JSON-документ целиком)
    void finish();

    const Summary& summary() const { return summary_; }

private:
    void write_text(const FileReport& file);

    struct JsonState;

    output::Writer& writer_;
    bool check_only_;
    Summary summary_;
    std::unique_ptr<JsonState> json_;
};

}  // namespace wsformat::report

#endif  // WSFORMAT_REPORT_HPP
