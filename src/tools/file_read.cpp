/**
 * @file file_read.cpp
 * @brief file_read tool, plus the content type and MIME helpers it shares
 * with file_write
 */

#include "toolrpc/tools/file_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/utils/base64.h"
#include "toolrpc/utils/fs.h"
#include "toolrpc/utils/utf8.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

namespace toolrpc {

namespace {

const std::unordered_map<std::string, std::string>& mime_types() {
    static const std::unordered_map<std::string, std::string> types = {
        // Text formats
        {"txt", "text/plain"}, {"md", "text/plain"}, {"rs", "text/plain"},
        {"js", "text/plain"}, {"ts", "text/plain"}, {"json", "text/plain"},
        {"yml", "text/plain"}, {"yaml", "text/plain"}, {"toml", "text/plain"},
        {"html", "text/plain"}, {"css", "text/plain"}, {"c", "text/plain"},
        {"cc", "text/plain"}, {"cpp", "text/plain"}, {"h", "text/plain"},
        {"hpp", "text/plain"},
        // Images
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"gif", "image/gif"}, {"svg", "image/svg+xml"}, {"webp", "image/webp"},
        // Archives and executables
        {"pdf", "application/pdf"}, {"zip", "application/zip"},
        {"gz", "application/gzip"}, {"tar", "application/x-tar"},
        {"exe", "application/octet-stream"}, {"dll", "application/octet-stream"},
    };
    return types;
}

std::string numbered(const std::vector<std::string>& lines, size_t begin, size_t end) {
    std::ostringstream out;
    for (size_t i = begin; i < end; ++i) {
        if (i != begin) out << '\n';
        out << std::setw(6) << (i + 1) << "  " << lines[i];
    }
    return out.str();
}

std::string joined(const std::vector<std::string>& lines, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (i != begin) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace

const char* to_string(ContentType type) {
    switch (type) {
        case ContentType::TEXT: return "text";
        case ContentType::BINARY: return "binary";
        case ContentType::AUTO: return "auto";
        default: return "unknown";
    }
}

ContentType content_type_from_string(const std::string& s) {
    if (s == "text") return ContentType::TEXT;
    if (s == "binary") return ContentType::BINARY;
    if (s == "auto") return ContentType::AUTO;
    throw InvalidParams("unknown content_type `" + s + "`, expected one of `text`, `binary`, `auto`");
}

std::string guess_mime_type(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types().find(ext);
    return it != mime_types().end() ? it->second : "application/octet-stream";
}

bool is_text_mime_type(const std::string& mime_type) {
    return mime_type.rfind("text/", 0) == 0 ||
           mime_type == "application/json" ||
           mime_type == "application/xml" ||
           mime_type == "application/javascript";
}

void from_json(const json& j, FileReadParams& p) {
    require_object(j);
    p.path = required_field<std::string>(j, "path");
    if (auto type = optional_field<std::string>(j, "content_type")) {
        p.content_type = content_type_from_string(*type);
    }
    if (j.contains("offset") && !j["offset"].is_null()) {
        p.offset = count_field(j, "offset");
    }
    if (j.contains("limit") && !j["limit"].is_null()) {
        p.limit = count_field(j, "limit");
    }
    p.line_numbers = field_or(j, "line_numbers", false);
}

void to_json(json& j, const FileReadOutput& o) {
    j = json{
        {"content", o.content},
        {"size", o.size},
        {"mime_type", o.mime_type},
        {"content_type", to_string(o.content_type)}
    };
    if (o.line_count) {
        j["line_count"] = *o.line_count;
    }
}

FileReadOutput FileReadTool::run(const FileReadParams& params) const {
    fs::path path(params.path);
    std::error_code ec;

    if (!fs::exists(path, ec)) {
        throw InvalidParams("File not found: " + params.path);
    }
    if (!fs::is_regular_file(path, ec)) {
        throw InvalidParams("Path is not a file: " + params.path);
    }

    FileReadOutput output;
    output.mime_type = guess_mime_type(params.path);
    output.content_type = params.content_type;
    if (output.content_type == ContentType::AUTO) {
        output.content_type = is_text_mime_type(output.mime_type) ? ContentType::TEXT : ContentType::BINARY;
    }

    std::string content = read_file(path);
    output.size = content.size();

    if (output.content_type == ContentType::BINARY) {
        output.content = base64_encode(content);
        return output;
    }
    if (!is_valid_utf8(content)) {
        throw IoError(params.path + " is not valid UTF-8, read it as binary");
    }

    if (!params.offset && !params.limit && !params.line_numbers) {
        output.content = std::move(content);
        return output;
    }

    std::vector<std::string> lines = split_lines(content);
    if (params.line_numbers) {
        output.line_count = lines.size();
    }

    size_t begin = params.offset.value_or(0);
    if (begin >= lines.size()) {
        output.content.clear();
        return output;
    }
    size_t end = lines.size();
    if (params.limit && *params.limit < end - begin) {
        end = begin + *params.limit;
    }

    output.content = params.line_numbers ? numbered(lines, begin, end) : joined(lines, begin, end);
    return output;
}

} // namespace toolrpc
