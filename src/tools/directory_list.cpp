/**
 * @file directory_list.cpp
 * @brief directory_list tool
 */

#include "toolrpc/tools/file_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/utils/fs.h"
#include "toolrpc/utils/utf8.h"
#include "toolrpc/logger.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace toolrpc {

void from_json(const json& j, DirectoryListParams& p) {
    require_object(j);
    p.path = required_field<std::string>(j, "path");
    p.pattern = optional_field<std::string>(j, "pattern");
    p.include_hidden = field_or(j, "include_hidden", false);
    p.directories_only = field_or(j, "directories_only", false);
    p.files_only = field_or(j, "files_only", false);
}

void to_json(json& j, const DirectoryEntry& e) {
    j = json{
        {"name", e.name},
        {"path", e.path},
        {"is_directory", e.is_directory},
        {"size", e.size}
    };
    if (e.modified) {
        j["modified"] = *e.modified;
    }
}

void to_json(json& j, const DirectoryListOutput& o) {
    j = json{{"entries", o.entries}, {"count", o.count}};
}

DirectoryListOutput DirectoryListTool::run(const DirectoryListParams& params) const {
    fs::path dir(params.path);
    std::error_code ec;

    fs::file_status status = fs::status(dir, ec);
    if (ec) {
        throw from_system_error(fs::filesystem_error("stat", dir, ec));
    }
    if (!fs::is_directory(status)) {
        throw InvalidParams("Path '" + params.path + "' is not a directory");
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw from_system_error(fs::filesystem_error("list", dir, ec));
    }

    DirectoryListOutput output;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw from_system_error(fs::filesystem_error("list", dir, ec));
        }

        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();

        if (!params.include_hidden && !name.empty() && name[0] == '.') {
            continue;
        }

        std::error_code entry_ec;
        bool is_directory = entry.is_directory(entry_ec);
        if (entry_ec) {
            // Dangling symlink or entry removed mid-listing
            LOG_DEBUG("directory_list", "Skipping " + entry.path().string() + ": " + entry_ec.message());
            continue;
        }

        if ((params.directories_only && !is_directory) || (params.files_only && is_directory)) {
            continue;
        }
        if (params.pattern && !glob_match(*params.pattern, name)) {
            continue;
        }

        DirectoryEntry out;
        out.name = to_valid_utf8(name);
        out.path = to_valid_utf8(entry.path().string());
        out.is_directory = is_directory;
        if (!is_directory) {
            uintmax_t size = entry.file_size(entry_ec);
            out.size = entry_ec ? 0 : static_cast<uint64_t>(size);
        }
        if (auto mtime = modified_time(entry.path())) {
            out.modified = format_iso(*mtime);
        }
        output.entries.push_back(std::move(out));
    }

    std::sort(output.entries.begin(), output.entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    output.count = output.entries.size();
    return output;
}

} // namespace toolrpc
