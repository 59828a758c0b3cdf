/**
 * @file fs.cpp
 * @brief Filesystem helpers
 */

#include "toolrpc/utils/fs.h"
#include "toolrpc/logger.h"
#include "toolrpc/rpc/error.h"
#include <cerrno>
#include <cstring>
#include <fnmatch.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace toolrpc {

bool glob_match(const std::string& pattern, const std::string& text) {
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

std::optional<std::time_t> modified_time(const fs::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return st.st_mtime;
}

fs::path prepare_directory(const std::string& dir) {
    std::error_code ec;
    fs::path path(dir);

    if (!fs::exists(path, ec)) {
        throw InvalidParams("Directory not found: " + dir);
    }
    if (!fs::is_directory(path, ec)) {
        throw InvalidParams("Path is not a directory: " + dir);
    }

    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        throw from_system_error(fs::filesystem_error("canonicalize", path, ec));
    }
    return canonical;
}

void throw_errno(const std::string& context, int err) {
    std::string message = context + ": " + std::strerror(err);
    if (err == EACCES || err == EPERM) {
        throw PermissionDenied(message);
    }
    throw IoError(message);
}

std::string read_file(const fs::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw_errno("Failed to open " + path.string(), errno ? errno : EIO);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw_errno("Failed to read " + path.string(), errno ? errno : EIO);
    }
    return content;
}

void write_file(const fs::path& path, const std::string& bytes) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw_errno("Failed to open " + path.string() + " for writing", errno ? errno : EIO);
    }

    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
        throw_errno("Failed to write " + path.string(), errno ? errno : EIO);
    }
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }

        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }

    return lines;
}

void walk_tree(const fs::path& root, size_t max_depth, bool follow_links,
               const std::function<bool(const fs::directory_entry&)>& visit) {
    auto options = fs::directory_options::skip_permission_denied;
    if (follow_links) {
        options |= fs::directory_options::follow_directory_symlink;
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root, options, ec);
    if (ec) {
        throw from_system_error(fs::filesystem_error("walk", root, ec));
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARN("Walk", "Stopping walk of " + root.string() + ": " + ec.message());
            break;
        }

        size_t depth = static_cast<size_t>(it.depth()) + 1;
        if (max_depth > 0 && depth >= max_depth) {
            it.disable_recursion_pending();
        }

        if (!visit(*it)) {
            break;
        }
    }
}

} // namespace toolrpc
