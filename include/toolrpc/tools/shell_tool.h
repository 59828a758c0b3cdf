/**
 * @file shell_tool.h
 * @brief shell tool: run one program directly, without a shell
 */

#pragma once

#include "toolrpc/common.h"
#include "toolrpc/tools/blocking_tool.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolrpc {

// Largest accepted timeout_ms (one day)
constexpr uint64_t MAX_SHELL_TIMEOUT_MS = 24ULL * 60 * 60 * 1000;

struct ShellParams {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // added to the daemon's environment
    std::optional<std::string> cwd;
    bool capture_stderr = false;
    uint64_t timeout_ms = 0;  // 0 = wait forever
};

struct ShellOutput {
    std::string command;
    std::vector<std::string> args;
    int status = -1;  // exit code; -1 if killed by a signal or timed out
    bool success = false;
    std::string stdout_text;
    std::optional<std::string> stderr_text;
    bool timed_out = false;
};

void from_json(const json& j, ShellParams& p);
void to_json(json& j, const ShellOutput& o);

/**
 * @brief Reject commands with whitespace or shell metacharacters
 * @throws InvalidParams
 */
void validate_command(const std::string& command);

class ShellTool : public BlockingTool<ShellParams, ShellOutput> {
public:
    using BlockingTool::BlockingTool;
    const char* name() const override { return "shell"; }
    ShellOutput run(const ShellParams& params) const override;
};

} // namespace toolrpc
