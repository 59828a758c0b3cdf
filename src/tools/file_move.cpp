/**
 * @file file_move.cpp
 * @brief file_move tool
 */

#include "toolrpc/tools/file_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace toolrpc {

void from_json(const json& j, FileMoveParams& p) {
    require_object(j);
    p.source = required_field<std::string>(j, "source");
    p.destination = required_field<std::string>(j, "destination");
    p.overwrite = field_or(j, "overwrite", false);
    p.create_dirs = field_or(j, "create_dirs", false);
}

void to_json(json& j, const FileMoveOutput& o) {
    j = json{
        {"source", o.source},
        {"destination", o.destination},
        {"overwritten", o.overwritten}
    };
}

FileMoveOutput FileMoveTool::run(const FileMoveParams& params) const {
    fs::path source(params.source);
    fs::path destination(params.destination);
    std::error_code ec;

    if (!fs::exists(fs::symlink_status(source, ec))) {
        throw InvalidParams("Source not found: " + params.source);
    }

    fs::path parent = destination.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        if (!params.create_dirs) {
            throw InvalidParams("Destination parent directory does not exist: " + parent.string());
        }
        fs::create_directories(parent, ec);
        if (ec) {
            throw from_system_error(fs::filesystem_error("create directory", parent, ec));
        }
    }

    bool destination_exists = fs::exists(fs::symlink_status(destination, ec));
    if (destination_exists && !params.overwrite) {
        throw InvalidParams("Destination already exists: " + params.destination);
    }

    // rename(2) replaces an existing file atomically
    fs::rename(source, destination, ec);
    if (ec) {
        throw from_system_error(fs::filesystem_error("rename", source, destination, ec));
    }

    LOG_DEBUG("file_move", "Moved " + params.source + " -> " + params.destination);
    return FileMoveOutput{params.source, params.destination, destination_exists};
}

} // namespace toolrpc
