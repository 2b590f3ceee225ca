// ==============================================================================
// discovery.cpp - Поиск файлов для форматирования
// ==============================================================================

#include "wsformat/discovery.hpp"

#include "wsformat/error.hpp"
#include "wsformat/platform.hpp"

#include <algorithm>
#include <set>
#include <system_error>

namespace wsformat::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

struct Walker {
    const DiscoveryOptions& options;
    std::vector<std::filesystem::path>& result;

    /// Канонические пути уже пройденных директорий (защита от циклов ссылок)
    std::set<std::filesystem::path> visited;

    void collect(const std::filesystem::path& path);
    void collect_directory(const std::filesystem::path& path);
};

void Walker::collect(const std::filesystem::path& path) {
    std::error_code ec;
    const std::filesystem::file_status link_status = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(link_status)) {
        throw Error(ErrorKind::FileNotFound, platform::path_to_utf8(path));
    }

    if (std::filesystem::is_symlink(link_status) && !options.follow_symlinks) {
        return;
    }

    // Висячая ссылка при --follow-symlinks
    const std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw Error(ErrorKind::FileNotFound, platform::path_to_utf8(path));
    }

    if (std::filesystem::is_directory(status)) {
        collect_directory(path);
    } else if (std::filesystem::is_regular_file(status)) {
        result.push_back(path);
    }
    // Сокеты, FIFO и устройства игнорируются
}

void Walker::collect_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        throw Error(ErrorKind::DirectoryUnreadable, platform::path_to_utf8(path), ec.message());
    }
    if (!visited.insert(canonical).second) {
        return;
    }

    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        throw Error(ErrorKind::DirectoryUnreadable, platform::path_to_utf8(path), ec.message());
    }

    // Сначала собираем записи, затем спускаемся: итератор не держится открытым
    // во время рекурсии
    std::vector<std::filesystem::path> entries;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        throw Error(ErrorKind::DirectoryEntryUnreadable, platform::path_to_utf8(path),
                    ec.message());
    }

    for (const auto& entry : entries) {
        collect(entry);
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::regex compile_exclude_pattern(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw Error(ErrorKind::InvalidExcludePattern, pattern, e.what());
    }
}

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    // Regex проверяется до обхода: ошибка в шаблоне не зависит от файлов
    std::optional<std::regex> exclude;
    if (opt.exclude) {
        exclude = compile_exclude_pattern(*opt.exclude);
    }

    std::vector<std::filesystem::path> result;
    Walker walker{opt, result, {}};
    for (const auto& input : inputs) {
        walker.collect(input);
    }

    if (exclude) {
        result.erase(std::remove_if(result.begin(), result.end(),
                                    [&](const std::filesystem::path& p) {
                                        return std::regex_search(platform::path_to_utf8(p),
                                                                 *exclude);
                                    }),
                     result.end());
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

}  // namespace wsformat::io
