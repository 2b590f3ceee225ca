// ==============================================================================
// test_report_gtest.cpp - Тесты отчёта об обработанных файлах (GoogleTest)
// ==============================================================================

#include "wsformat/report.hpp"

#include <cstdio>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <vector>

namespace wsformat::report::test {

namespace {

std::string read_all(FILE* file) {
    std::fflush(file);
    std::rewind(file);
    std::string text;
    char buffer[256];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        text.append(buffer, n);
    }
    return text;
}

// Прогоняет Reporter по набору файлов и возвращает stdout/stderr
struct Run {
    std::string out;
    std::string err;
    Summary summary;
};

Run run_reporter(const output::OutputConfig& config, bool check_only,
                 const std::vector<FileReport>& files) {
    FILE* out = std::tmpfile();
    FILE* err = std::tmpfile();
    Run run;
    {
        output::Writer writer(config, out, err);
        Reporter reporter(writer, check_only);
        for (const auto& file : files) {
            reporter.add(file);
        }
        reporter.finish();
        run.summary = reporter.summary();
    }
    run.out = read_all(out);
    run.err = read_all(err);
    std::fclose(out);
    std::fclose(err);
    return run;
}

std::vector<FileReport> sample_files() {
    return {
        FileReport{"clean.txt", {}},
        FileReport{"dirty.txt",
                   {Change(1, change::TrailingWhitespaceRemoved{}),
                    Change(3, change::EofMarkerAdded{})}},
    };
}

std::string begin_stderr(const output::OutputConfig& config, std::size_t file_count) {
    FILE* out = std::tmpfile();
    FILE* err = std::tmpfile();
    std::string text;
    {
        output::Writer writer(config, out, err);
        Reporter reporter(writer, false);
        reporter.begin(file_count);
    }
    EXPECT_EQ(read_all(out), "");
    text = read_all(err);
    std::fclose(out);
    std::fclose(err);
    return text;
}

output::OutputConfig text_config() {
    output::OutputConfig config;
    config.color = output::ColorMode::Off;
    return config;
}

}  // namespace

// ==============================================================================
// Итоги и exit code
// ==============================================================================

TEST(ReportTest, RenderSummary) {
    Summary summary;
    summary.changed = 2;
    summary.unchanged = 5;

    EXPECT_EQ(render_summary(summary, true),
              "2 file(s) would be reformatted, 5 file(s) already formatted.");
    EXPECT_EQ(render_summary(summary, false),
              "2 file(s) reformatted, 5 file(s) left unchanged.");
    EXPECT_EQ(summary.total(), 7u);
}

TEST(ReportTest, ExitCode) {
    Summary clean;
    clean.unchanged = 3;
    Summary dirty;
    dirty.changed = 1;

    EXPECT_EQ(exit_code(clean, true), 0);
    EXPECT_EQ(exit_code(dirty, true), 1);
    EXPECT_EQ(exit_code(dirty, false), 0);
}

// ==============================================================================
// Текстовый отчёт
// ==============================================================================

TEST(ReportTest, Text_CheckOnly) {
    Run run = run_reporter(text_config(), true, sample_files());

    EXPECT_EQ(run.out,
              "Would reformat dirty.txt\n"
              "    line 1: Trailing whitespace would be removed.\n"
              "    line 3: New line marker would be added to the end of the file.\n"
              "1 file(s) would be reformatted, 1 file(s) already formatted.\n");
    EXPECT_EQ(run.err, "");
    EXPECT_EQ(run.summary.changed, 1u);
    EXPECT_EQ(run.summary.unchanged, 1u);
}

TEST(ReportTest, Text_Applied) {
    Run run = run_reporter(text_config(), false, sample_files());

    EXPECT_EQ(run.out,
              "Reformatted dirty.txt\n"
              "    line 1: Trailing whitespace was removed.\n"
              "    line 3: New line marker was added to the end of the file.\n"
              "1 file(s) reformatted, 1 file(s) left unchanged.\n");
}

TEST(ReportTest, Text_VerboseListsUnchangedFiles) {
    output::OutputConfig config = text_config();
    config.verbose = 1;

    Run run = run_reporter(config, false, sample_files());

    EXPECT_EQ(run.err, "[*] clean.txt is already formatted\n");
}

TEST(ReportTest, Text_QuietOmitsSummary) {
    output::OutputConfig config = text_config();
    config.quiet = true;

    Run run = run_reporter(config, true, sample_files());

    EXPECT_EQ(run.out.find("file(s)"), std::string::npos);
    EXPECT_NE(run.out.find("Would reformat dirty.txt"), std::string::npos);
}

// ==============================================================================
// JSON / JSONL
// ==============================================================================

TEST(ReportTest, Jsonl_OneObjectPerFile) {
    output::OutputConfig config = text_config();
    config.format = output::Format::Jsonl;

    Run run = run_reporter(config, true, sample_files());

    std::istringstream lines(run.out);
    std::string line;
    std::vector<std::string> objects;
    while (std::getline(lines, line)) {
        objects.push_back(line);
    }
    ASSERT_EQ(objects.size(), 2u);

    rapidjson::Document first;
    first.Parse(objects[0].c_str());
    ASSERT_FALSE(first.HasParseError());
    EXPECT_STREQ(first["path"].GetString(), "clean.txt");
    EXPECT_FALSE(first["changed"].GetBool());
    EXPECT_EQ(first["changes"].Size(), 0u);

    rapidjson::Document second;
    second.Parse(objects[1].c_str());
    ASSERT_FALSE(second.HasParseError());
    EXPECT_TRUE(second["changed"].GetBool());
    ASSERT_EQ(second["changes"].Size(), 2u);
    EXPECT_EQ(second["changes"][0]["line"].GetUint64(), 1u);
    EXPECT_STREQ(second["changes"][0]["kind"].GetString(), "trailing-whitespace-removed");
    EXPECT_STREQ(second["changes"][1]["description"].GetString(),
                 "New line marker would be added to the end of the file.");
}

TEST(ReportTest, Json_SingleDocumentWithSummary) {
    output::OutputConfig config = text_config();
    config.format = output::Format::Json;

    Run run = run_reporter(config, false, sample_files());

    rapidjson::Document doc;
    doc.Parse(run.out.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_FALSE(doc["check_only"].GetBool());
    ASSERT_EQ(doc["files"].Size(), 2u);
    EXPECT_STREQ(doc["files"][1]["path"].GetString(), "dirty.txt");
    EXPECT_STREQ(doc["files"][1]["changes"][0]["description"].GetString(),
                 "Trailing whitespace was removed.");
    EXPECT_EQ(doc["summary"]["total"].GetUint64(), 2u);
    EXPECT_EQ(doc["summary"]["changed"].GetUint64(), 1u);
    EXPECT_EQ(doc["summary"]["unchanged"].GetUint64(), 1u);
}

TEST(ReportTest, Json_EmptyRun) {
    output::OutputConfig config = text_config();
    config.format = output::Format::Json;

    Run run = run_reporter(config, true, {});

    rapidjson::Document doc;
    doc.Parse(run.out.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_TRUE(doc["check_only"].GetBool());
    EXPECT_EQ(doc["files"].Size(), 0u);
    EXPECT_EQ(doc["summary"]["total"].GetUint64(), 0u);
}

// ==============================================================================
// Начало обработки
// ==============================================================================

TEST(ReportTest, Begin_AnnouncesFileCount) {
    EXPECT_EQ(begin_stderr(text_config(), 3), "[+] Found 3 file(s) to process\n");
}

TEST(ReportTest, Begin_WarnsWhenNothingFound) {
    EXPECT_EQ(begin_stderr(text_config(), 0), "[!] No files were found in the provided paths\n");
}

TEST(ReportTest, Begin_QuietSuppressesAnnouncement) {
    output::OutputConfig config = text_config();
    config.quiet = true;

    EXPECT_EQ(begin_stderr(config, 3), "");
    EXPECT_EQ(begin_stderr(config, 0), "");
}

}  // namespace wsformat::report::test
