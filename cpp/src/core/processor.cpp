// ==============================================================================
// processor.cpp - Обработка одного файла
// ==============================================================================

#include "wsformat/processor.hpp"

#include "wsformat/error.hpp"
#include "wsformat/formatter.hpp"
#include "wsformat/platform.hpp"
#include "wsformat/sink.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace wsformat {

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw Error(ErrorKind::FileUnreadable, platform::path_to_utf8(path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw Error(ErrorKind::FileUnreadable, platform::path_to_utf8(path));
    }
    return buffer.str();
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw Error(ErrorKind::FileUnwritable, platform::path_to_utf8(path));
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        throw Error(ErrorKind::FileUnwritable, platform::path_to_utf8(path));
    }
}

}  // namespace

ProcessResult process_content(std::string_view input, const FormatOptions& options,
                              bool check_only) {
    ProcessResult result;

    CountingSink counter;
    result.changes = format_content(input, options, counter);

    if (check_only || result.changes.empty()) {
        return result;
    }

    // Второй проход даёт тот же журнал; сохраняем только байты
    BufferSink buffer(counter.maximum_position());
    format_content(input, options, buffer);
    result.output = buffer.release();
    return result;
}

ProcessResult process_file(const std::filesystem::path& path, const FormatOptions& options,
                           bool check_only) {
    const std::string input = read_file(path);
    ProcessResult result = process_content(input, options, check_only);

    if (result.output) {
        write_file(path, *result.output);
    }
    return result;
}

}  // namespace wsformat
