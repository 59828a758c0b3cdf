/**
 * @file fs.h
 * @brief Filesystem helpers shared by the tools
 *
 * Failures are raised as toolrpc errors: missing or wrong-kind paths as
 * InvalidParams, EACCES/EPERM as PermissionDenied, anything else as IoError.
 */

#pragma once

#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolrpc {

/**
 * @brief Shell-style glob (fnmatch); '*' also matches '/'
 */
bool glob_match(const std::string& pattern, const std::string& text);

/**
 * @brief Last modification time (stat), nullopt if unavailable
 */
std::optional<std::time_t> modified_time(const std::filesystem::path& path);

/**
 * @brief Check that dir exists and is a directory, return it canonicalized
 */
std::filesystem::path prepare_directory(const std::string& dir);

/**
 * @brief Throw PermissionDenied or IoError for an errno value
 */
[[noreturn]] void throw_errno(const std::string& context, int err);

std::string read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::string& bytes);

/**
 * @brief Split on '\n', dropping a trailing '\r' per line and the empty
 * remainder after a final newline
 */
std::vector<std::string> split_lines(const std::string& content);

/**
 * @brief Depth-limited walk below root (root itself is not visited)
 *
 * Children of root have depth 1; max_depth 0 means unlimited. Unreadable
 * directories are skipped. visit returns false to stop the walk.
 */
void walk_tree(const std::filesystem::path& root, size_t max_depth, bool follow_links,
               const std::function<bool(const std::filesystem::directory_entry&)>& visit);

} // namespace toolrpc
