/**
 * @file default_tools.cpp
 * @brief Built-in tool registration
 */

#include "toolrpc/tools/default_tools.h"
#include "toolrpc/tools/file_tools.h"
#include "toolrpc/tools/search_tools.h"
#include "toolrpc/tools/shell_tool.h"
#include "toolrpc/logger.h"
#include <stdexcept>

namespace toolrpc {

void register_default_tools(MethodRegistry& registry, std::shared_ptr<WorkerPool> pool) {
    if (!pool) {
        throw std::invalid_argument("register_default_tools requires a worker pool");
    }

    registry.register_tool(Methods::DIRECTORY_LIST, std::make_shared<DirectoryListTool>(pool));
    registry.register_tool(Methods::DIRECTORY_MAKE, std::make_shared<DirectoryMakeTool>(pool));
    registry.register_tool(Methods::FILE_READ, std::make_shared<FileReadTool>(pool));
    registry.register_tool(Methods::FILE_WRITE, std::make_shared<FileWriteTool>(pool));
    registry.register_tool(Methods::FILE_MOVE, std::make_shared<FileMoveTool>(pool));
    registry.register_tool(Methods::FILE_FIND, std::make_shared<FileFindTool>(pool));
    registry.register_tool(Methods::FILE_GREP, std::make_shared<FileGrepTool>(pool));
    registry.register_tool(Methods::SHELL, std::make_shared<ShellTool>(pool));

    LOG_DEBUG("Tools", "Registered " + std::to_string(registry.size()) + " methods");
}

std::unique_ptr<Dispatcher> make_dispatcher(FormatConfig formats, std::shared_ptr<WorkerPool> pool) {
    auto registry = std::make_shared<MethodRegistry>(FormatTransformer(formats));
    register_default_tools(*registry, std::move(pool));

    LOG_INFO("Tools", std::string("Dispatcher ready (input: ") + to_string(formats.decode) +
             ", output: " + to_string(formats.encode) + ")");
    return std::make_unique<Dispatcher>(std::move(registry));
}

} // namespace toolrpc
