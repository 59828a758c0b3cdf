/**
 * @file file_write.cpp
 * @brief file_write tool
 */

#include "toolrpc/tools/file_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/utils/base64.h"
#include "toolrpc/utils/fs.h"
#include "toolrpc/logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace toolrpc {

void from_json(const json& j, FileWriteParams& p) {
    require_object(j);
    p.path = required_field<std::string>(j, "path");
    p.content = required_field<std::string>(j, "content");
    if (auto type = optional_field<std::string>(j, "content_type")) {
        p.content_type = content_type_from_string(*type);
        if (p.content_type == ContentType::AUTO) {
            throw InvalidParams("content_type `auto` is only valid for reading");
        }
    }
    p.create_dirs = field_or(j, "create_dirs", false);
}

void to_json(json& j, const FileWriteOutput& o) {
    j = json{
        {"path", o.path},
        {"size", o.size},
        {"content_type", to_string(o.content_type)},
        {"created", o.created}
    };
}

FileWriteOutput FileWriteTool::run(const FileWriteParams& params) const {
    fs::path path(params.path);
    std::error_code ec;

    fs::path parent = path.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        if (!params.create_dirs) {
            throw InvalidParams("Parent directory does not exist: " + parent.string());
        }
        fs::create_directories(parent, ec);
        if (ec) {
            throw from_system_error(fs::filesystem_error("create directory", parent, ec));
        }
    }

    std::string bytes;
    if (params.content_type == ContentType::BINARY) {
        auto decoded = base64_decode(params.content);
        if (!decoded) {
            throw InvalidParams("Invalid base64 content");
        }
        bytes = std::move(*decoded);
    } else {
        bytes = params.content;
    }

    bool created = !fs::exists(path, ec);
    write_file(path, bytes);
    LOG_DEBUG("file_write", "Wrote " + std::to_string(bytes.size()) + " bytes to " + params.path);

    FileWriteOutput output;
    output.path = params.path;
    output.size = bytes.size();
    output.content_type = params.content_type;
    output.created = created;
    return output;
}

} // namespace toolrpc
