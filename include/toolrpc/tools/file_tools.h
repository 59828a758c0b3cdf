/**
 * @file file_tools.h
 * @brief Directory and single-file tools
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
// directory_list
// ============================================================================

struct DirectoryListParams {
    std::string path;
    std::optional<std::string> pattern;  // glob over the entry name
    bool include_hidden = false;
    bool directories_only = false;
    bool files_only = false;
};

struct DirectoryEntry {
    std::string name;
    std::string path;
    bool is_directory = false;
    uint64_t size = 0;  // 0 for directories
    std::optional<std::string> modified;  // ISO 8601 UTC
};

struct DirectoryListOutput {
    std::vector<DirectoryEntry> entries;
    size_t count = 0;
};

void from_json(const json& j, DirectoryListParams& p);
void to_json(json& j, const DirectoryEntry& e);
void to_json(json& j, const DirectoryListOutput& o);

class DirectoryListTool : public BlockingTool<DirectoryListParams, DirectoryListOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "directory_list"; }
    DirectoryListOutput run(const DirectoryListParams& params) const override;
};

// ============================================================================
// directory_make
// ============================================================================

struct DirectoryMakeParams {
    std::string path;
    bool parents = false;
    bool exist_ok = false;
};

struct DirectoryMakeOutput {
    std::string path;
    bool created = false;
};

void from_json(const json& j, DirectoryMakeParams& p);
void to_json(json& j, const DirectoryMakeOutput& o);

class DirectoryMakeTool : public BlockingTool<DirectoryMakeParams, DirectoryMakeOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "directory_make"; }
    DirectoryMakeOutput run(const DirectoryMakeParams& params) const override;
};

// ============================================================================
// file_read
// ============================================================================

enum class ContentType {
    TEXT,
    BINARY,
    AUTO
};

const char* to_string(ContentType type);

/**
 * @throws InvalidParams for anything but "text", "binary", "auto"
 */
ContentType content_type_from_string(const std::string& s);

/**
 * @brief MIME type guessed from the file extension
 */
std::string guess_mime_type(const std::string& path);
bool is_text_mime_type(const std::string& mime_type);

struct FileReadParams {
    std::string path;
    ContentType content_type = ContentType::AUTO;
    std::optional<size_t> offset;  // first line, 0-based (text only)
    std::optional<size_t> limit;   // number of lines (text only)
    bool line_numbers = false;
};

struct FileReadOutput {
    std::string content;  // text, or base64 for binary
    uint64_t size = 0;
    std::string mime_type;
    ContentType content_type = ContentType::TEXT;
    std::optional<size_t> line_count;  // only when line numbers were requested
};

void from_json(const json& j, FileReadParams& p);
void to_json(json& j, const FileReadOutput& o);

class FileReadTool : public BlockingTool<FileReadParams, FileReadOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "file_read"; }
    FileReadOutput run(const FileReadParams& params) const override;
};

// ============================================================================
// file_write
// ============================================================================

struct FileWriteParams {
    std::string path;
    std::string content;
    ContentType content_type = ContentType::TEXT;  // TEXT or BINARY
    bool create_dirs = false;
};

struct FileWriteOutput {
    std::string path;
    uint64_t size = 0;
    ContentType content_type = ContentType::TEXT;
    bool created = false;
};

void from_json(const json& j, FileWriteParams& p);
void to_json(json& j, const FileWriteOutput& o);

class FileWriteTool : public BlockingTool<FileWriteParams, FileWriteOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "file_write"; }
    FileWriteOutput run(const FileWriteParams& params) const override;
};

// ============================================================================
// file_move
// ============================================================================

struct FileMoveParams {
    std::string source;
    std::string destination;
    bool overwrite = false;
    bool create_dirs = false;
};

struct FileMoveOutput {
    std::string source;
    std::string destination;
    bool overwritten = false;
};

void from_json(const json& j, FileMoveParams& p);
void to_json(json& j, const FileMoveOutput& o);

class FileMoveTool : public BlockingTool<FileMoveParams, FileMoveOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "file_move"; }
    FileMoveOutput run(const FileMoveParams& params) const override;
};

} // namespace toolrpc
