// ==============================================================================
// report.cpp - Отчёт об изменениях
// ==============================================================================

#include "wsformat/report.hpp"

#include "wsformat/platform.hpp"

#include <cstdint>
#include <rapidjson/document.h>
#include <utility>

namespace wsformat::report {

namespace {

constexpr const char* CHANGE_INDENT = "    ";

rapidjson::Value make_string(const std::string& text,
                             rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value value;
    value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator);
    return value;
}

rapidjson::Value file_to_json(const FileReport& file, bool check_only,
                              rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value changes(rapidjson::kArrayType);
    for (const auto& change : file.changes) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("line", static_cast<std::uint64_t>(change.line_number), allocator);
        item.AddMember("kind", make_string(std::string(change_kind_name(change.kind)), allocator),
                       allocator);
        item.AddMember("description",
                       make_string(describe(change.kind, check_only), allocator), allocator);
        changes.PushBack(item, allocator);
    }

    rapidjson::Value object(rapidjson::kObjectType);
    object.AddMember("path", make_string(platform::path_to_utf8(file.path), allocator),
                     allocator);
    object.AddMember("changed", file.changed(), allocator);
    object.AddMember("changes", changes, allocator);
    return object;
}

}  // namespace

// ----------------------------------------------------------------------------
// Сводка
// ----------------------------------------------------------------------------

std::string render_summary(const Summary& summary, bool check_only) {
    if (check_only) {
        return std::to_string(summary.changed) + " file(s) would be reformatted, " +
               std::to_string(summary.unchanged) + " file(s) already formatted.";
    }
    return std::to_string(summary.changed) + " file(s) reformatted, " +
           std::to_string(summary.unchanged) + " file(s) left unchanged.";
}

int exit_code(const Summary& summary, bool check_only) {
    return (check_only && summary.changed > 0) ? 1 : 0;
}

// ----------------------------------------------------------------------------
// Reporter
// ----------------------------------------------------------------------------

/// Накопленный JSON-документ (только для Format::Json)
struct Reporter::JsonState {
    rapidjson::Document document;
    rapidjson::Value files{rapidjson::kArrayType};
};

Reporter::Reporter(output::Writer& writer, bool check_only)
    : writer_(writer), check_only_(check_only) {
    if (writer_.config().format == output::Format::Json) {
        json_ = std::make_unique<JsonState>();
        json_->document.SetObject();
    }
}

Reporter::~Reporter() = default;

void Reporter::begin(std::size_t file_count) {
    if (file_count == 0) {
        writer_.warn("No files were found in the provided paths");
        return;
    }
    writer_.info("Found " + std::to_string(file_count) + " file(s) to process");
}

void Reporter::add(FileReport file) {
    if (file.changed()) {
        ++summary_.changed;
    } else {
        ++summary_.unchanged;
    }

    switch (writer_.config().format) {
    case output::Format::Std:
        write_text(file);
        break;
    case output::Format::Jsonl: {
        rapidjson::Document document;
        rapidjson::Value object = file_to_json(file, check_only_, document.GetAllocator());
        writer_.write_json_line(object);
        break;
    }
    case output::Format::Json:
        json_->files.PushBack(file_to_json(file, check_only_, json_->document.GetAllocator()),
                              json_->document.GetAllocator());
        break;
    }
}

void Reporter::write_text(const FileReport& file) {
    const std::string path = platform::path_to_utf8(file.path);

    if (!file.changed()) {
        writer_.debug(path + " is already formatted");
        return;
    }

    if (check_only_) {
        writer_.colored_line("Would reformat " + path, output::Color::Red);
    } else {
        writer_.colored_line("Reformatted " + path, output::Color::Yellow);
    }
    for (const auto& change : file.changes) {
        writer_.write_line(output::Stream::Stdout, CHANGE_INDENT + change.to_string(check_only_));
    }
}

void Reporter::finish() {
    switch (writer_.config().format) {
    case output::Format::Std:
        if (!writer_.config().quiet) {
            writer_.colored_line(render_summary(summary_, check_only_),
                                 summary_.changed == 0 ? output::Color::Green
                                                       : output::Color::Yellow);
        }
        break;
    case output::Format::Jsonl:
        break;
    case output::Format::Json: {
        auto& allocator = json_->document.GetAllocator();

        rapidjson::Value summary(rapidjson::kObjectType);
        summary.AddMember("total", static_cast<std::uint64_t>(summary_.total()), allocator);
        summary.AddMember("changed", static_cast<std::uint64_t>(summary_.changed), allocator);
        summary.AddMember("unchanged", static_cast<std::uint64_t>(summary_.unchanged), allocator);

        json_->document.AddMember("check_only", check_only_, allocator);
        json_->document.AddMember("files", json_->files, allocator);
        json_->document.AddMember("summary", summary, allocator);
        writer_.write_json_pretty(json_->document);
        break;
    }
    }
    writer_.flush();
}

}  // namespace wsformat::report
