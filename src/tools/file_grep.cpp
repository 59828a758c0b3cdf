/**
 * @file file_grep.cpp
 * @brief file_grep tool
 */

#include "toolrpc/tools/search_tools.h"
#include "toolrpc/tools/params.h"
#include "toolrpc/utils/fs.h"
#include "toolrpc/utils/utf8.h"
#include "toolrpc/logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace toolrpc {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Line matcher: a compiled regex, or a plain (optionally folded) substring
 */
class Matcher {
public:
    explicit Matcher(const FileGrepParams& params)
        : case_insensitive_(params.case_insensitive),
          needle_(params.case_insensitive ? lowercase(params.pattern) : params.pattern) {
        if (params.regex) {
            auto flags = std::regex::ECMAScript;
            if (params.case_insensitive) {
                flags |= std::regex::icase;
            }
            try {
                regex_.emplace(params.pattern, flags);
            } catch (const std::regex_error& e) {
                throw InvalidParams("invalid regular expression `" + params.pattern + "`: " + e.what());
            }
        }
    }

    bool operator()(const std::string& text) const {
        if (regex_) {
            return std::regex_search(text, *regex_);
        }
        if (case_insensitive_) {
            return lowercase(text).find(needle_) != std::string::npos;
        }
        return text.find(needle_) != std::string::npos;
    }

private:
    bool case_insensitive_;
    std::string needle_;
    std::optional<std::regex> regex_;
};

bool is_candidate(const FileGrepParams& params, const std::string& path) {
    for (const auto& exclude : params.exclude) {
        if (glob_match(exclude, path)) {
            return false;
        }
    }
    return !params.include || glob_match(*params.include, path);
}

std::string context_line(size_t index, const std::string& text) {
    return std::to_string(index + 1) + ":" + text;
}

std::optional<GrepFile> search_file(const fs::path& path, const Matcher& matcher,
                                    const FileGrepParams& params) {
    std::string content = read_file(path);
    if (!is_valid_utf8(content)) {
        throw IoError(path.string() + " is not valid UTF-8");
    }

    GrepFile file;
    file.path = to_valid_utf8(path.string());
    file.size = content.size();

    if (params.file_names_only) {
        if (!matcher(content)) {
            return std::nullopt;
        }
        return file;
    }

    std::vector<std::string> lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!matcher(lines[i])) {
            continue;
        }

        GrepMatch match;
        match.line_number = i + 1;
        match.line = lines[i];

        size_t first = i > params.before_context ? i - params.before_context : 0;
        for (size_t k = first; k < i; ++k) {
            match.before_context.push_back(context_line(k, lines[k]));
        }
        size_t last = std::min(lines.size(), i + 1 + params.after_context);
        for (size_t k = i + 1; k < last; ++k) {
            match.after_context.push_back(context_line(k, lines[k]));
        }

        file.matches.push_back(std::move(match));
    }

    if (file.matches.empty()) {
        return std::nullopt;
    }
    return file;
}

} // namespace

void from_json(const json& j, FileGrepParams& p) {
    require_object(j);
    p.directory = required_field<std::string>(j, "directory");
    p.pattern = required_field<std::string>(j, "pattern");
    p.regex = field_or(j, "regex", false);
    p.case_insensitive = field_or(j, "case_insensitive", false);
    p.recursive = field_or(j, "recursive", true);
    p.max_depth = count_field(j, "max_depth");
    p.limit = count_field(j, "limit");
    p.follow_links = field_or(j, "follow_links", false);
    p.include = optional_field<std::string>(j, "include");
    p.exclude = field_or(j, "exclude", std::vector<std::string>{});
    p.before_context = count_field(j, "before_context");
    p.after_context = count_field(j, "after_context");
    p.file_names_only = field_or(j, "file_names_only", false);
}

void to_json(json& j, const GrepMatch& m) {
    j = json{{"line_number", m.line_number}, {"line", m.line}};
    if (!m.before_context.empty()) {
        j["before_context"] = m.before_context;
    }
    if (!m.after_context.empty()) {
        j["after_context"] = m.after_context;
    }
}

void to_json(json& j, const GrepFile& f) {
    j = json{{"path", f.path}, {"size", f.size}};
    if (!f.matches.empty()) {
        j["matches"] = f.matches;
    }
}

void to_json(json& j, const FileGrepOutput& o) {
    j = json{
        {"directory", o.directory},
        {"pattern", o.pattern},
        {"files", o.files},
        {"files_searched", o.files_searched},
        {"files_matched", o.files_matched},
        {"total_matches", o.total_matches},
        {"limited", o.limited}
    };
}

FileGrepOutput FileGrepTool::run(const FileGrepParams& params) const {
    fs::path root = prepare_directory(params.directory);
    Matcher matcher(params);
    size_t max_depth = params.recursive ? params.max_depth : 1;

    std::vector<fs::path> candidates;
    walk_tree(root, max_depth, params.follow_links, [&](const fs::directory_entry& entry) {
        std::error_code ec;
        if (entry.is_regular_file(ec) && is_candidate(params, entry.path().string())) {
            candidates.push_back(entry.path());
        }
        return true;
    });
    std::sort(candidates.begin(), candidates.end());

    FileGrepOutput output;
    output.directory = root.string();
    output.pattern = params.pattern;
    output.files_searched = candidates.size();

    for (const auto& path : candidates) {
        if (params.limit > 0 && output.files.size() >= params.limit) {
            output.limited = true;
            break;
        }

        std::optional<GrepFile> found;
        try {
            found = search_file(path, matcher, params);
        } catch (const Error& e) {
            LOG_DEBUG("file_grep", "Skipping unreadable file: " + std::string(e.what()));
            continue;
        }

        if (found) {
            ++output.files_matched;
            output.total_matches += found->matches.size();
            output.files.push_back(std::move(*found));
        }
    }

    return output;
}

} // namespace toolrpc
