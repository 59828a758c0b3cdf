/**
 * @file file_find.cpp
 * @brief file_find tool
 */

#include "toolrpc/tools/search_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/utils/fs.h"
#include "toolrpc/utils/utf8.h"
#include "toolrpc/logger.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace toolrpc {

namespace {

bool matches(const FileFindParams& params, const fs::directory_entry& entry, bool is_dir) {
    if ((params.file_type == FileType::FILE && is_dir) ||
        (params.file_type == FileType::DIRECTORY && !is_dir)) {
        return false;
    }

    std::string path = entry.path().string();
    for (const auto& ignore : params.ignore) {
        if (glob_match(ignore, path)) {
            return false;
        }
    }

    switch (params.mode) {
        case FindMode::NAME: {
            std::string name = entry.path().filename().string();
            return name == params.pattern ||
                   (params.pattern.find('*') != std::string::npos && glob_match(params.pattern, name));
        }
        case FindMode::PATTERN:
            return glob_match(params.pattern, path);
        case FindMode::PATH:
            return path.find(params.pattern) != std::string::npos;
    }
    return false;
}

} // namespace

const char* to_string(FindMode mode) {
    switch (mode) {
        case FindMode::NAME: return "name";
        case FindMode::PATTERN: return "pattern";
        case FindMode::PATH: return "path";
        default: return "unknown";
    }
}

const char* to_string(FileType type) {
    switch (type) {
        case FileType::ALL: return "all";
        case FileType::FILE: return "file";
        case FileType::DIRECTORY: return "directory";
        default: return "unknown";
    }
}

FindMode find_mode_from_string(const std::string& s) {
    if (s == "name") return FindMode::NAME;
    if (s == "pattern") return FindMode::PATTERN;
    if (s == "path") return FindMode::PATH;
    throw InvalidParams("unknown mode `" + s + "`, expected one of `name`, `pattern`, `path`");
}

FileType file_type_from_string(const std::string& s) {
    if (s == "all") return FileType::ALL;
    if (s == "file") return FileType::FILE;
    if (s == "directory") return FileType::DIRECTORY;
    throw InvalidParams("unknown file_type `" + s + "`, expected one of `all`, `file`, `directory`");
}

void from_json(const json& j, FileFindParams& p) {
    require_object(j);
    p.directory = required_field<std::string>(j, "directory");
    p.pattern = required_field<std::string>(j, "pattern");
    if (auto mode = optional_field<std::string>(j, "mode")) {
        p.mode = find_mode_from_string(*mode);
    }
    if (auto type = optional_field<std::string>(j, "file_type")) {
        p.file_type = file_type_from_string(*type);
    }
    p.recursive = field_or(j, "recursive", true);
    p.max_depth = count_field(j, "max_depth");
    p.limit = count_field(j, "limit");
    p.follow_links = field_or(j, "follow_links", false);
    p.ignore = field_or(j, "ignore", std::vector<std::string>{});
}

void to_json(json& j, const FoundEntry& e) {
    j = json{{"path", e.path}, {"name", e.name}, {"is_dir", e.is_dir}};
    if (e.size) {
        j["size"] = *e.size;
    }
    if (e.modified) {
        j["modified"] = *e.modified;
    }
}

void to_json(json& j, const FileFindOutput& o) {
    j = json{
        {"directory", o.directory},
        {"pattern", o.pattern},
        {"entries", o.entries},
        {"total", o.total},
        {"limited", o.limited}
    };
}

FileFindOutput FileFindTool::run(const FileFindParams& params) const {
    fs::path root = prepare_directory(params.directory);
    size_t max_depth = params.recursive ? params.max_depth : 1;

    FileFindOutput output;
    output.directory = root.string();
    output.pattern = params.pattern;

    walk_tree(root, max_depth, params.follow_links, [&](const fs::directory_entry& entry) {
        std::error_code ec;
        bool is_dir = entry.is_directory(ec);
        if (!matches(params, entry, is_dir)) {
            return true;
        }

        ++output.total;
        if (params.limit > 0 && output.entries.size() >= params.limit) {
            output.limited = true;
            return true;
        }

        FoundEntry found;
        found.path = to_valid_utf8(entry.path().string());
        found.name = to_valid_utf8(entry.path().filename().string());
        found.is_dir = is_dir;
        if (!is_dir) {
            uintmax_t size = entry.file_size(ec);
            if (!ec) {
                found.size = static_cast<uint64_t>(size);
            }
        }
        if (auto mtime = modified_time(entry.path())) {
            found.modified = static_cast<int64_t>(*mtime);
        }
        output.entries.push_back(std::move(found));
        return true;
    });

    std::sort(output.entries.begin(), output.entries.end(),
              [](const FoundEntry& a, const FoundEntry& b) { return a.path < b.path; });

    LOG_DEBUG("file_find", "Found " + std::to_string(output.total) + " entries under " + output.directory);
    return output;
}

} // namespace toolrpc
