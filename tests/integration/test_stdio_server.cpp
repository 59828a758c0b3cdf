/**
 * @file test_stdio_server.cpp
 * @brief Integration tests for the line-delimited stdio transport
 */

#include <gtest/gtest.h>
#include <functional>
#include <sstream>
#include <string>
#include <vector>
#include "toolrpc/server/stdio_server.h"
#include "toolrpc/tools/default_tools.h"
#include "toolrpc/logger.h"

using json = toolrpc::json;

class StdioServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        toolrpc::Logger::init(toolrpc::LogLevel::ERROR, false);
        pool_ = std::make_shared<toolrpc::WorkerPool>(2);
        dispatcher_ = toolrpc::make_plain_dispatcher(pool_);
    }

    void TearDown() override {
        pool_->stop();
        toolrpc::Logger::shutdown();
    }

    // Feed the input through a fresh server and return one parsed envelope per output line
    std::vector<json> serve(const std::string& input, size_t max_message_bytes = toolrpc::MAX_MESSAGE_SIZE) {
        toolrpc::StdioServer server(dispatcher_, max_message_bytes);
        std::istringstream in(input);
        std::ostringstream out;

        answered_ = server.serve(in, out);
        EXPECT_FALSE(server.is_running());

        std::vector<json> responses;
        std::istringstream lines(out.str());
        std::string line;
        while (std::getline(lines, line)) {
            responses.push_back(json::parse(line));
        }
        return responses;
    }

    static std::string request(const std::string& method, const json& params, int id) {
        return json{{"protocol_version", "2.0"}, {"method", method}, {"params", params}, {"id", id}}.dump();
    }

    std::shared_ptr<toolrpc::WorkerPool> pool_;
    std::shared_ptr<toolrpc::Dispatcher> dispatcher_;
    size_t answered_ = 0;
};

TEST_F(StdioServerTest, RejectsNullDispatcher) {
    EXPECT_THROW(toolrpc::StdioServer(nullptr), std::invalid_argument);
}

TEST_F(StdioServerTest, AnswersEachLineInOrder) {
    std::string input =
        request("shell", {{"command", "echo"}, {"args", {"one"}}}, 1) + "\n" +
        request("shell", {{"command", "echo"}, {"args", {"two"}}}, 2) + "\n";

    auto responses = serve(input);

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(answered_, 2u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["result"]["stdout"], "one\n");
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["result"]["stdout"], "two\n");
}

TEST_F(StdioServerTest, SkipsBlankLinesAndHandlesCrlf) {
    std::string input = "\n   \n" + request("missing", json::object(), 7) + "\r\n\t\n";

    auto responses = serve(input);

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["error"]["code"], -32601);
    EXPECT_EQ(responses[0]["id"], 7);
}

TEST_F(StdioServerTest, LastLineWithoutNewlineIsServed) {
    auto responses = serve(request("missing", nullptr, 3));

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["id"], 3);
}

TEST_F(StdioServerTest, ParseErrorDoesNotStopTheStream) {
    std::string input = "{this is not json\n" + request("missing", nullptr, 2) + "\n";

    auto responses = serve(input);

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["error"]["code"], -32700);
    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[1]["error"]["code"], -32601);
}

TEST_F(StdioServerTest, NonObjectLineIsParseError) {
    auto responses = serve("[1,2,3]\n42\n");

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["error"]["code"], -32700);
    EXPECT_EQ(responses[1]["error"]["code"], -32700);
}

TEST_F(StdioServerTest, DeeplyNestedLineIsParseError) {
    std::string deep = R"({"protocol_version":"2.0","method":"missing","id":)" +
                       std::string(300000, '[') + std::string(300000, ']') + "}";

    auto responses = serve(deep + "\n" + request("missing", nullptr, 4) + "\n");

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["error"]["code"], -32700);
    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[1]["id"], 4);
}

TEST_F(StdioServerTest, OversizeLineIsInvalidRequest) {
    std::string big = request("shell", {{"command", std::string(2048, 'x')}}, 9);

    auto responses = serve(big + "\n" + request("missing", nullptr, 10) + "\n", 1024);

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["error"]["code"], -32600);
    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[1]["id"], 10);
}

// Input that runs a hook the first time the reader blocks for data
class HookedInput : public std::streambuf {
public:
    HookedInput(std::string data, std::function<void()> hook)
        : data_(std::move(data)), hook_(std::move(hook)) {
    }

protected:
    int_type underflow() override {
        if (hook_) {
            hook_();
            hook_ = nullptr;
            setg(&data_[0], &data_[0], &data_[0] + data_.size());
            return traits_type::to_int_type(data_[0]);
        }
        return traits_type::eof();
    }

private:
    std::string data_;
    std::function<void()> hook_;
};

TEST_F(StdioServerTest, LineArrivingAfterStopIsNotDispatched) {
    toolrpc::StdioServer server(dispatcher_);
    HookedInput input(request("shell", {{"command", "echo"}, {"args", {"late"}}}, 1) + "\n",
                      [&server] { server.stop(); });
    std::istream in(&input);
    std::ostringstream out;

    EXPECT_EQ(server.serve(in, out), 0u);
    EXPECT_TRUE(out.str().empty());
    EXPECT_FALSE(server.is_running());
}

TEST_F(StdioServerTest, EmptyInputAnswersNothing) {
    auto responses = serve("");

    EXPECT_TRUE(responses.empty());
    EXPECT_EQ(answered_, 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
