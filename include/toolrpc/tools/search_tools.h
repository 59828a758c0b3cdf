/**
 * @file search_tools.h
 * @brief Tree search tools: file_find and file_grep
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/tools/blocking_tool.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolrpc {

// ============================================================================
// file_find
// ============================================================================

/**
 * @brief How file_find interprets its pattern
 */
enum class FindMode {
    NAME,     // exact file name, or a glob if the pattern contains '*'
    PATTERN,  // glob over the full path
    PATH      // substring of the full path
};

enum class FileType {
    ALL,
    FILE,
    DIRECTORY
};

const char* to_string(FindMode mode);
const char* to_string(FileType type);
FindMode find_mode_from_string(const std::string& s);
FileType file_type_from_string(const std::string& s);

struct FileFindParams {
    std::string directory;
    std::string pattern;
    FindMode mode = FindMode::NAME;
    FileType file_type = FileType::ALL;
    bool recursive = true;
    size_t max_depth = 0;  // 0 = unlimited
    size_t limit = 0;      // 0 = unlimited
    bool follow_links = false;
    std::vector<std::string> ignore;  // globs over the full path
};

struct FoundEntry {
    std::string path;
    std::string name;
    bool is_dir = false;
    std::optional<uint64_t> size;     // files only
    std::optional<int64_t> modified;  // Unix timestamp
};

struct FileFindOutput {
    std::string directory;  // canonicalized
    std::string pattern;
    std::vector<FoundEntry> entries;
    size_t total = 0;       // all matches, including those past the limit
    bool limited = false;
};

void from_json(const json& j, FileFindParams& p);
void to_json(json& j, const FoundEntry& e);
void to_json(json& j, const FileFindOutput& o);

class FileFindTool : public BlockingTool<FileFindParams, FileFindOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "file_find"; }
    FileFindOutput run(const FileFindParams& params) const override;
};

// ============================================================================
// file_grep
// ============================================================================

struct FileGrepParams {
    std::string directory;
    std::string pattern;
    bool regex = false;
    bool case_insensitive = false;
    bool recursive = true;
    size_t max_depth = 0;
    size_t limit = 0;  // maximum number of matching files
    bool follow_links = false;
    std::optional<std::string> include;
    std::vector<std::string> exclude;
    size_t before_context = 0;
    size_t after_context = 0;
    bool file_names_only = false;
};

struct GrepMatch {
    size_t line_number = 0;  // 1-based
    std::string line;
    std::vector<std::string> before_context;  // "<n>:<text>"
    std::vector<std::string> after_context;
};

struct GrepFile {
    std::string path;
    uint64_t size = 0;
    std::vector<GrepMatch> matches;  // empty when only file names were requested
};

struct FileGrepOutput {
    std::string directory;
    std::string pattern;
    std::vector<GrepFile> files;
    size_t files_searched = 0;
    size_t files_matched = 0;
    size_t total_matches = 0;
    bool limited = false;
};

void from_json(const json& j, FileGrepParams& p);
void to_json(json& j, const GrepMatch& m);
void to_json(json& j, const GrepFile& f);
void to_json(json& j, const FileGrepOutput& o);

class FileGrepTool : public BlockingTool<FileGrepParams, FileGrepOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "file_grep"; }
    FileGrepOutput run(const FileGrepParams& params) const override;
};

} // namespace toolrpc
