/**
 * @file test_registry.cpp
 * @brief Unit tests for MethodRegistry
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "fake_tools.h"
#include "toolrpc/rpc/registry.h"
#include "toolrpc/logger.h"

using json = toolrpc::json;

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        toolrpc::Logger::init(toolrpc::LogLevel::ERROR, false);
    }

    void TearDown() override {
        toolrpc::Logger::shutdown();
    }

    static json invoke(const toolrpc::MethodRegistry& registry, const std::string& method, const json& params) {
        const auto* handler = registry.find(method);
        EXPECT_NE(handler, nullptr) << method;
        return (*handler)(params).get();
    }
};

TEST_F(RegistryTest, StartsEmpty) {
    toolrpc::MethodRegistry registry;

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.find("echo"), nullptr);
    EXPECT_FALSE(registry.contains("echo"));
}

TEST_F(RegistryTest, RegistersUnderToolName) {
    toolrpc::MethodRegistry registry;
    registry.register_tool(std::make_shared<fake::EchoTool>());
    registry.register_tool(std::make_shared<fake::AddTool>());

    EXPECT_TRUE(registry.contains("echo"));
    EXPECT_TRUE(registry.contains("add"));
    EXPECT_EQ(registry.methods(), (std::vector<std::string>{"add", "echo"}));
}

TEST_F(RegistryTest, RegistersUnderExplicitName) {
    toolrpc::MethodRegistry registry;
    registry.register_tool("math.add", std::make_shared<fake::AddTool>());

    EXPECT_TRUE(registry.contains("math.add"));
    EXPECT_FALSE(registry.contains("add"));
    EXPECT_EQ(invoke(registry, "math.add", {{"a", 2}, {"b", 3}}), 5);
}

TEST_F(RegistryTest, LookupIsExactMatch) {
    toolrpc::MethodRegistry registry;
    registry.register_tool(std::make_shared<fake::EchoTool>());

    EXPECT_EQ(registry.find("Echo"), nullptr);
    EXPECT_EQ(registry.find("echo "), nullptr);
    EXPECT_EQ(registry.find(""), nullptr);
}

TEST_F(RegistryTest, ReRegistrationReplaces) {
    toolrpc::MethodRegistry registry;
    registry.register_tool("value", std::make_shared<fake::ConstantTool>("first"));
    registry.register_tool("value", std::make_shared<fake::ConstantTool>("second"));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(invoke(registry, "value", nullptr), "second");
}

TEST_F(RegistryTest, RejectsEmptyNamesAndNullTools) {
    toolrpc::MethodRegistry registry;

    EXPECT_THROW(registry.register_tool("", std::make_shared<fake::EchoTool>()), std::invalid_argument);
    EXPECT_THROW(registry.register_tool(std::shared_ptr<fake::EchoTool>()), std::invalid_argument);
    EXPECT_THROW(registry.register_handler("raw", toolrpc::MethodRegistry::Handler()), std::invalid_argument);
}

TEST_F(RegistryTest, DecodeFailureIsInvalidParamsBeforeExecution) {
    toolrpc::MethodRegistry registry;
    registry.register_tool(std::make_shared<fake::AddTool>());
    const auto* handler = registry.find("add");
    ASSERT_NE(handler, nullptr);

    EXPECT_THROW((*handler)(json{{"a", 1}}), toolrpc::InvalidParams);
    EXPECT_THROW((*handler)(json{{"a", "one"}, {"b", 2}}), toolrpc::InvalidParams);
    EXPECT_THROW((*handler)(json::array()), toolrpc::InvalidParams);
}

TEST_F(RegistryTest, ClosureAppliesRegistryFormats) {
    toolrpc::MethodRegistry registry(toolrpc::FormatTransformer(toolrpc::FormatConfig::wrapped()));
    registry.register_tool(std::make_shared<fake::AddTool>());

    json params = {
        {"a", {{"type", "text"}, {"text", 20}}},
        {"b", {{"type", "text"}, {"text", 22}}}
    };

    EXPECT_EQ(invoke(registry, "add", params), (json{{"type", "text"}, {"text", 42}}));
}

TEST_F(RegistryTest, RawHandlersSkipTransformation) {
    toolrpc::MethodRegistry registry(toolrpc::FormatTransformer(toolrpc::FormatConfig::wrapped()));
    registry.register_handler("raw", [](const json& params) {
        return toolrpc::make_ready_future(params);
    });

    EXPECT_EQ(invoke(registry, "raw", json{{"x", 1}}), (json{{"x", 1}}));
}

TEST_F(RegistryTest, ToolStartsBeforeResultIsAwaited) {
    toolrpc::MethodRegistry registry;
    auto echo = std::make_shared<fake::EchoTool>();
    registry.register_tool(echo);

    auto pending = (*registry.find("echo"))(json{{"k", "v"}});
    EXPECT_EQ(echo->calls.load(), 1);

    EXPECT_EQ(pending.get(), (json{{"k", "v"}}));
    EXPECT_EQ(echo->calls.load(), 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
