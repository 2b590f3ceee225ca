// ==============================================================================
// wsformat/processor.hpp - Обработка одного файла
// ==============================================================================
//
// Назначение:
// - Двухпроходная схема: сначала CountingSink (только журнал изменений и
//   максимальный размер выхода), затем BufferSink - только если файл
//   действительно нужно переписать
// - Чтение и запись файла целиком в двоичном режиме
//
// ==============================================================================

#ifndef WSFORMAT_PROCESSOR_HPP
#define WSFORMAT_PROCESSOR_HPP

#include "wsformat/change.hpp"
#include "wsformat/options.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wsformat {

// ----------------------------------------------------------------------------
// ProcessResult
// ----------------------------------------------------------------------------

struct ProcessResult {
    std::vector<Change> changes;

    /// Новое содержимое; nullopt при --check-only или если изменений нет
    std::optional<std::string> output;

    bool changed() const { return !changes.empty(); }
};

/// Обработать содержимое в памяти (без файловых операций)
ProcessResult process_content(std::string_view input, const FormatOptions& options,
                              bool check_only);

/// Прочитать файл, обработать и, если нужно, перезаписать его.
/// @throws wsformat::Error (FileUnreadable, FileUnwritable)
ProcessResult process_file(const std::filesystem::path& path, const FormatOptions& options,
                           bool check_only);

}  // namespace wsformat

#endif  // WSFORMAT_PROCESSOR_HPP
