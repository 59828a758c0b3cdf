/**
 * @file directory_make.cpp
 * @brief directory_make tool
 */

#include "toolrpc/tools/file_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace toolrpc {

void from_json(const json& j, DirectoryMakeParams& p) {
    require_object(j);
    p.path = required_field<std::string>(j, "path");
    p.parents = field_or(j, "parents", false);
    p.exist_ok = field_or(j, "exist_ok", false);
}

void to_json(json& j, const DirectoryMakeOutput& o) {
    j = json{{"path", o.path}, {"created", o.created}};
}

DirectoryMakeOutput DirectoryMakeTool::run(const DirectoryMakeParams& params) const {
    fs::path path(params.path);
    std::error_code ec;

    if (fs::exists(path, ec)) {
        if (!fs::is_directory(path, ec)) {
            throw InvalidParams("Path exists but is not a directory: " + params.path);
        }
        if (!params.exist_ok) {
            throw InvalidParams("Directory already exists: " + params.path);
        }
        return DirectoryMakeOutput{params.path, false};
    }

    if (params.parents) {
        fs::create_directories(path, ec);
    } else {
        fs::path parent = path.parent_path();
        if (!parent.empty() && !fs::exists(parent, ec)) {
            throw InvalidParams("Parent directory does not exist: " + parent.string());
        }
        fs::create_directory(path, ec);
    }

    if (ec) {
        throw from_system_error(fs::filesystem_error("create directory", path, ec));
    }

    LOG_DEBUG("directory_make", "Created " + params.path);
    return DirectoryMakeOutput{params.path, true};
}

} // namespace toolrpc
