/**
 * @file test_file_tools.cpp
 * @brief Unit tests for the directory and single-file tools
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "toolrpc/tools/file_tools.h"
#include "toolrpc/rpc/error.h"
#include "toolrpc/utils/base64.h"
#include "toolrpc/utils/fs.h"
#include "toolrpc/logger.h"

namespace fs = std::filesystem;
using json = toolrpc::json;

class FileToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        toolrpc::Logger::init(toolrpc::LogLevel::ERROR, false);
        pool_ = std::make_shared<toolrpc::WorkerPool>(2);
        root_ = fs::temp_directory_path() /
                ("toolrpc_file_tools_" + std::to_string(getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        pool_->stop();
        fs::remove_all(root_);
        toolrpc::Logger::shutdown();
    }

    void write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::string slurp(const fs::path& path) {
        return toolrpc::read_file(path);
    }

    template <typename P>
    static P decode(const json& j) {
        return j.get<P>();
    }

    std::shared_ptr<toolrpc::WorkerPool> pool_;
    fs::path root_;
};

// ============================================================================
// directory_list
// ============================================================================

TEST_F(FileToolsTest, ListSortsByNameAndHidesDotfiles) {
    write(root_ / "b.txt", "bb");
    write(root_ / "a.md", "a");
    write(root_ / ".hidden", "h");
    fs::create_directories(root_ / "sub");
    auto tool = std::make_shared<toolrpc::DirectoryListTool>(pool_);

    auto out = tool->run(decode<toolrpc::DirectoryListParams>({{"path", root_.string()}}));

    ASSERT_EQ(out.count, 3u);
    ASSERT_EQ(out.entries.size(), 3u);
    EXPECT_EQ(out.entries[0].name, "a.md");
    EXPECT_EQ(out.entries[1].name, "b.txt");
    EXPECT_EQ(out.entries[1].size, 2u);
    EXPECT_FALSE(out.entries[1].is_directory);
    EXPECT_EQ(out.entries[2].name, "sub");
    EXPECT_TRUE(out.entries[2].is_directory);
    EXPECT_EQ(out.entries[2].size, 0u);
    EXPECT_EQ(out.entries[0].path, (root_ / "a.md").string());
    EXPECT_TRUE(out.entries[0].modified.has_value());
}

TEST_F(FileToolsTest, ListFiltersAndPattern) {
    write(root_ / "a.txt", "");
    write(root_ / "b.log", "");
    write(root_ / ".c.txt", "");
    fs::create_directories(root_ / "d.txt");
    auto tool = std::make_shared<toolrpc::DirectoryListTool>(pool_);

    auto files = tool->run(decode<toolrpc::DirectoryListParams>(
        {{"path", root_.string()}, {"pattern", "*.txt"}, {"files_only", true}, {"include_hidden", true}}));
    auto dirs = tool->run(decode<toolrpc::DirectoryListParams>(
        {{"path", root_.string()}, {"directories_only", true}}));

    ASSERT_EQ(files.count, 2u);
    EXPECT_EQ(files.entries[0].name, ".c.txt");
    EXPECT_EQ(files.entries[1].name, "a.txt");
    ASSERT_EQ(dirs.count, 1u);
    EXPECT_EQ(dirs.entries[0].name, "d.txt");
}

TEST_F(FileToolsTest, ListRejectsFilesAndMissingPaths) {
    write(root_ / "plain.txt", "x");
    auto tool = std::make_shared<toolrpc::DirectoryListTool>(pool_);

    EXPECT_THROW(tool->run(decode<toolrpc::DirectoryListParams>({{"path", (root_ / "plain.txt").string()}})),
                 toolrpc::InvalidParams);
    EXPECT_THROW(tool->run(decode<toolrpc::DirectoryListParams>({{"path", (root_ / "missing").string()}})),
                 toolrpc::IoError);
    EXPECT_THROW(decode<toolrpc::DirectoryListParams>(json::object()), toolrpc::InvalidParams);
}

TEST_F(FileToolsTest, ListSerializesEntries) {
    write(root_ / "one", "1");
    auto tool = std::make_shared<toolrpc::DirectoryListTool>(pool_);

    json j = tool->execute(decode<toolrpc::DirectoryListParams>({{"path", root_.string()}})).get();

    EXPECT_EQ(j["count"], 1);
    EXPECT_EQ(j["entries"][0]["name"], "one");
    EXPECT_EQ(j["entries"][0]["is_directory"], false);
    EXPECT_EQ(j["entries"][0]["size"], 1);
    EXPECT_TRUE(j["entries"][0]["modified"].is_string());
}

TEST_F(FileToolsTest, ListReplacesInvalidBytesInNames) {
    write(root_ / "r\xe9sum\xe9.txt", "x");
    auto tool = std::make_shared<toolrpc::DirectoryListTool>(pool_);

    auto out = tool->run(decode<toolrpc::DirectoryListParams>({{"path", root_.string()}}));

    ASSERT_EQ(out.count, 1u);
    EXPECT_EQ(out.entries[0].name, "r\xEF\xBF\xBDsum\xEF\xBF\xBD.txt");
    EXPECT_NO_THROW(json(out).dump());
}

// ============================================================================
// directory_make
// ============================================================================

TEST_F(FileToolsTest, MakeCreatesSingleDirectory) {
    auto tool = std::make_shared<toolrpc::DirectoryMakeTool>(pool_);
    fs::path target = root_ / "new";

    auto out = tool->run(decode<toolrpc::DirectoryMakeParams>({{"path", target.string()}}));

    EXPECT_TRUE(out.created);
    EXPECT_EQ(out.path, target.string());
    EXPECT_TRUE(fs::is_directory(target));
}

TEST_F(FileToolsTest, MakeNeedsParentsForNestedPaths) {
    auto tool = std::make_shared<toolrpc::DirectoryMakeTool>(pool_);
    fs::path target = root_ / "x" / "y" / "z";

    EXPECT_THROW(tool->run(decode<toolrpc::DirectoryMakeParams>({{"path", target.string()}})),
                 toolrpc::InvalidParams);
    EXPECT_FALSE(fs::exists(root_ / "x"));

    auto out = tool->run(decode<toolrpc::DirectoryMakeParams>({{"path", target.string()}, {"parents", true}}));
    EXPECT_TRUE(out.created);
    EXPECT_TRUE(fs::is_directory(target));
}

TEST_F(FileToolsTest, MakeExistingDirectory) {
    auto tool = std::make_shared<toolrpc::DirectoryMakeTool>(pool_);

    EXPECT_THROW(tool->run(decode<toolrpc::DirectoryMakeParams>({{"path", root_.string()}})),
                 toolrpc::InvalidParams);

    auto out = tool->run(decode<toolrpc::DirectoryMakeParams>({{"path", root_.string()}, {"exist_ok", true}}));
    EXPECT_FALSE(out.created);
}

TEST_F(FileToolsTest, MakeOverFileFailsEvenWithExistOk) {
    write(root_ / "file", "x");
    auto tool = std::make_shared<toolrpc::DirectoryMakeTool>(pool_);

    EXPECT_THROW(tool->run(decode<toolrpc::DirectoryMakeParams>(
                     {{"path", (root_ / "file").string()}, {"exist_ok", true}})),
                 toolrpc::InvalidParams);
}

// ============================================================================
// file_read
// ============================================================================

TEST_F(FileToolsTest, MimeTypes) {
    EXPECT_EQ(toolrpc::guess_mime_type("a/b/notes.txt"), "text/plain");
    EXPECT_EQ(toolrpc::guess_mime_type("main.CPP"), "text/plain");
    EXPECT_EQ(toolrpc::guess_mime_type("logo.png"), "image/png");
    EXPECT_EQ(toolrpc::guess_mime_type("doc.pdf"), "application/pdf");
    EXPECT_EQ(toolrpc::guess_mime_type("Makefile"), "application/octet-stream");
    EXPECT_TRUE(toolrpc::is_text_mime_type("text/plain"));
    EXPECT_FALSE(toolrpc::is_text_mime_type("image/png"));
}

TEST_F(FileToolsTest, ContentTypeNames) {
    EXPECT_EQ(toolrpc::content_type_from_string("text"), toolrpc::ContentType::TEXT);
    EXPECT_EQ(toolrpc::content_type_from_string("binary"), toolrpc::ContentType::BINARY);
    EXPECT_EQ(toolrpc::content_type_from_string("auto"), toolrpc::ContentType::AUTO);
    EXPECT_THROW(toolrpc::content_type_from_string("Text"), toolrpc::InvalidParams);
    EXPECT_STREQ(toolrpc::to_string(toolrpc::ContentType::BINARY), "binary");
}

TEST_F(FileToolsTest, ReadWholeTextFile) {
    write(root_ / "notes.txt", "alpha\nbeta\n");
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);

    auto out = tool->run(decode<toolrpc::FileReadParams>({{"path", (root_ / "notes.txt").string()}}));

    EXPECT_EQ(out.content, "alpha\nbeta\n");
    EXPECT_EQ(out.size, 11u);
    EXPECT_EQ(out.mime_type, "text/plain");
    EXPECT_EQ(out.content_type, toolrpc::ContentType::TEXT);
    EXPECT_FALSE(out.line_count.has_value());
}

TEST_F(FileToolsTest, ReadBinaryAsBase64) {
    std::string bytes("\x00\x01\xff\x10", 4);
    write(root_ / "blob.bin", bytes);
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);

    auto out = tool->run(decode<toolrpc::FileReadParams>({{"path", (root_ / "blob.bin").string()}}));

    EXPECT_EQ(out.content_type, toolrpc::ContentType::BINARY);
    EXPECT_EQ(out.mime_type, "application/octet-stream");
    EXPECT_EQ(out.size, 4u);
    EXPECT_EQ(out.content, toolrpc::base64_encode(bytes));
}

TEST_F(FileToolsTest, ReadExplicitTextOverridesGuess) {
    write(root_ / "Makefile", "all:\n");
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);

    auto out = tool->run(decode<toolrpc::FileReadParams>(
        {{"path", (root_ / "Makefile").string()}, {"content_type", "text"}}));

    EXPECT_EQ(out.content_type, toolrpc::ContentType::TEXT);
    EXPECT_EQ(out.content, "all:\n");
}

TEST_F(FileToolsTest, ReadTextThatIsNotUtf8IsIoError) {
    write(root_ / "latin1.txt", "caf\xe9\n");
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);
    std::string path = (root_ / "latin1.txt").string();

    EXPECT_THROW(tool->run(decode<toolrpc::FileReadParams>({{"path", path}})), toolrpc::IoError);

    auto binary = tool->run(decode<toolrpc::FileReadParams>({{"path", path}, {"content_type", "binary"}}));
    EXPECT_EQ(binary.content, toolrpc::base64_encode("caf\xe9\n"));
}

TEST_F(FileToolsTest, ReadLineWindow) {
    write(root_ / "lines.txt", "l1\nl2\nl3\nl4\nl5\n");
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);
    std::string path = (root_ / "lines.txt").string();

    auto window = tool->run(decode<toolrpc::FileReadParams>({{"path", path}, {"offset", 1}, {"limit", 2}}));
    auto tail = tool->run(decode<toolrpc::FileReadParams>({{"path", path}, {"offset", 3}}));
    auto past = tool->run(decode<toolrpc::FileReadParams>({{"path", path}, {"offset", 10}}));

    EXPECT_EQ(window.content, "l2\nl3");
    EXPECT_EQ(tail.content, "l4\nl5");
    EXPECT_EQ(past.content, "");
    EXPECT_EQ(window.size, 15u);
}

TEST_F(FileToolsTest, ReadWithLineNumbers) {
    write(root_ / "lines.txt", "first\r\nsecond\nthird");
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);

    auto out = tool->run(decode<toolrpc::FileReadParams>(
        {{"path", (root_ / "lines.txt").string()}, {"line_numbers", true}, {"offset", 1}}));

    EXPECT_EQ(out.content, "     2  second\n     3  third");
    ASSERT_TRUE(out.line_count.has_value());
    EXPECT_EQ(*out.line_count, 3u);

    json j = out;
    EXPECT_EQ(j["line_count"], 3);
}

TEST_F(FileToolsTest, ReadRejectsBadTargetsAndParams) {
    auto tool = std::make_shared<toolrpc::FileReadTool>(pool_);

    EXPECT_THROW(tool->run(decode<toolrpc::FileReadParams>({{"path", (root_ / "nope").string()}})),
                 toolrpc::InvalidParams);
    EXPECT_THROW(tool->run(decode<toolrpc::FileReadParams>({{"path", root_.string()}})),
                 toolrpc::InvalidParams);
    EXPECT_THROW(decode<toolrpc::FileReadParams>({{"path", "x"}, {"offset", -1}}), toolrpc::InvalidParams);
    EXPECT_THROW(decode<toolrpc::FileReadParams>({{"path", "x"}, {"content_type", "utf8"}}),
                 toolrpc::InvalidParams);
}

// ============================================================================
// file_write
// ============================================================================

TEST_F(FileToolsTest, WriteCreatesThenOverwrites) {
    auto tool = std::make_shared<toolrpc::FileWriteTool>(pool_);
    std::string path = (root_ / "out.txt").string();

    auto first = tool->run(decode<toolrpc::FileWriteParams>({{"path", path}, {"content", "hello"}}));
    auto second = tool->run(decode<toolrpc::FileWriteParams>({{"path", path}, {"content", "bye"}}));

    EXPECT_TRUE(first.created);
    EXPECT_EQ(first.size, 5u);
    EXPECT_FALSE(second.created);
    EXPECT_EQ(slurp(path), "bye");
}

TEST_F(FileToolsTest, WriteBinaryDecodesBase64) {
    auto tool = std::make_shared<toolrpc::FileWriteTool>(pool_);
    std::string path = (root_ / "blob.bin").string();

    auto out = tool->run(decode<toolrpc::FileWriteParams>(
        {{"path", path}, {"content", "AAH/EA=="}, {"content_type", "binary"}}));

    EXPECT_EQ(out.size, 4u);
    EXPECT_EQ(out.content_type, toolrpc::ContentType::BINARY);
    EXPECT_EQ(slurp(path), std::string("\x00\x01\xff\x10", 4));
}

TEST_F(FileToolsTest, WriteRejectsInvalidBase64WithoutTouchingDisk) {
    auto tool = std::make_shared<toolrpc::FileWriteTool>(pool_);
    std::string path = (root_ / "blob.bin").string();

    EXPECT_THROW(tool->run(decode<toolrpc::FileWriteParams>(
                     {{"path", path}, {"content", "not base64!"}, {"content_type", "binary"}})),
                 toolrpc::InvalidParams);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(FileToolsTest, WriteParentHandling) {
    auto tool = std::make_shared<toolrpc::FileWriteTool>(pool_);
    std::string path = (root_ / "deep" / "er" / "f.txt").string();

    EXPECT_THROW(tool->run(decode<toolrpc::FileWriteParams>({{"path", path}, {"content", "x"}})),
                 toolrpc::InvalidParams);

    auto out = tool->run(decode<toolrpc::FileWriteParams>(
        {{"path", path}, {"content", "x"}, {"create_dirs", true}}));
    EXPECT_TRUE(out.created);
    EXPECT_EQ(slurp(path), "x");
}

TEST_F(FileToolsTest, WriteRejectsAutoContentType) {
    EXPECT_THROW(decode<toolrpc::FileWriteParams>({{"path", "x"}, {"content", ""}, {"content_type", "auto"}}),
                 toolrpc::InvalidParams);
    EXPECT_THROW(decode<toolrpc::FileWriteParams>({{"path", "x"}}), toolrpc::InvalidParams);
}

// ============================================================================
// file_move
// ============================================================================

TEST_F(FileToolsTest, MoveRenamesFile) {
    write(root_ / "src.txt", "payload");
    auto tool = std::make_shared<toolrpc::FileMoveTool>(pool_);

    auto out = tool->run(decode<toolrpc::FileMoveParams>(
        {{"source", (root_ / "src.txt").string()}, {"destination", (root_ / "dst.txt").string()}}));

    EXPECT_FALSE(out.overwritten);
    EXPECT_FALSE(fs::exists(root_ / "src.txt"));
    EXPECT_EQ(slurp(root_ / "dst.txt"), "payload");
}

TEST_F(FileToolsTest, MoveRefusesToClobberWithoutOverwrite) {
    write(root_ / "src.txt", "new");
    write(root_ / "dst.txt", "old");
    auto tool = std::make_shared<toolrpc::FileMoveTool>(pool_);
    json params = {{"source", (root_ / "src.txt").string()}, {"destination", (root_ / "dst.txt").string()}};

    EXPECT_THROW(tool->run(decode<toolrpc::FileMoveParams>(params)), toolrpc::InvalidParams);
    EXPECT_EQ(slurp(root_ / "dst.txt"), "old");

    params["overwrite"] = true;
    auto out = tool->run(decode<toolrpc::FileMoveParams>(params));
    EXPECT_TRUE(out.overwritten);
    EXPECT_EQ(slurp(root_ / "dst.txt"), "new");
}

TEST_F(FileToolsTest, MoveDirectoryWithCreateDirs) {
    write(root_ / "tree" / "leaf.txt", "x");
    auto tool = std::make_shared<toolrpc::FileMoveTool>(pool_);
    json params = {{"source", (root_ / "tree").string()},
                   {"destination", (root_ / "a" / "b" / "tree").string()}};

    EXPECT_THROW(tool->run(decode<toolrpc::FileMoveParams>(params)), toolrpc::InvalidParams);

    params["create_dirs"] = true;
    tool->run(decode<toolrpc::FileMoveParams>(params));
    EXPECT_TRUE(fs::exists(root_ / "a" / "b" / "tree" / "leaf.txt"));
}

TEST_F(FileToolsTest, MoveMissingSource) {
    auto tool = std::make_shared<toolrpc::FileMoveTool>(pool_);

    EXPECT_THROW(tool->run(decode<toolrpc::FileMoveParams>(
                     {{"source", (root_ / "ghost").string()}, {"destination", (root_ / "d").string()}})),
                 toolrpc::InvalidParams);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
