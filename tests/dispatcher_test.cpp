#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "dispatcher/request_dispatcher.hpp"
#include "nlohmann/json.hpp"
#include "stub_interpreter.hpp"

namespace {

using pysandbox::config::ExecutorConfig;
using pysandbox::dispatcher::LoopExit;
using pysandbox::dispatcher::RequestDispatcher;
using pysandbox::executor::Executor;
using pysandbox::filesystem::VirtualFilesystem;
using pysandbox::protocol::ResponseEmitter;
using pysandbox::runtime::RuntimeInitError;
using pysandbox::runtime::RuntimeManager;
using pysandbox::testing::StubInterpreter;

std::vector<nlohmann::json> ParseLines(const std::string& text) {
    std::vector<nlohmann::json> lines;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stub = std::make_unique<StubInterpreter>();
        stub_ = stub.get();
        runtime_ = std::make_unique<RuntimeManager>(std::move(stub));
        root_ = std::filesystem::temp_directory_path() /
                (std::string("pysandbox_dispatcher_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root_);
        filesystem_ = std::make_unique<VirtualFilesystem>(root_);
        executor_ = std::make_unique<Executor>(*runtime_, *filesystem_, ExecutorConfig{});
        emitter_ = std::make_unique<ResponseEmitter>(out_);
        dispatcher_ = std::make_unique<RequestDispatcher>(*executor_, *filesystem_, *emitter_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    StubInterpreter* stub_ = nullptr;
    std::unique_ptr<RuntimeManager> runtime_;
    std::filesystem::path root_;
    std::unique_ptr<VirtualFilesystem> filesystem_;
    std::unique_ptr<Executor> executor_;
    std::ostringstream out_;
    std::unique_ptr<ResponseEmitter> emitter_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
};

TEST_F(DispatcherTest, MalformedLineDoesNotStopTheLoop) {
    std::istringstream input("{not json\n{\"code\":\"print(1+1)\"}\n");
    EXPECT_EQ(dispatcher_->Run(input), LoopExit::kEndOfInput);

    const auto lines = ParseLines(out_.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_FALSE(lines[0]["success"].get<bool>());
    EXPECT_EQ(lines[0]["error"].get<std::string>().rfind("Failed to process request: ", 0), 0u);
    EXPECT_TRUE(lines[1]["success"].get<bool>());
    EXPECT_EQ(lines[1]["output"], "print(1+1)\n");
    EXPECT_TRUE(lines[1]["error"].is_null());
    EXPECT_EQ(dispatcher_->Stats().handled, 2u);
    EXPECT_EQ(dispatcher_->Stats().failed, 1u);
}

TEST_F(DispatcherTest, BlankLinesAreSkipped) {
    std::istringstream input("\n   \r\n{\"code\":\"a\"}\r\n\n");
    EXPECT_EQ(dispatcher_->Run(input), LoopExit::kEndOfInput);
    EXPECT_EQ(ParseLines(out_.str()).size(), 1u);
    EXPECT_EQ(stub_->last_code, "a");
}

TEST_F(DispatcherTest, EmptyCodeIsRejectedWithoutRunning) {
    const auto result = dispatcher_->HandleLine(R"({"type":"execute","code":""})");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(*result.error, "No code provided for execution");
    EXPECT_EQ(stub_->run_calls.load(), 0);
    EXPECT_EQ(stub_->initialize_calls.load(), 0);
}

TEST_F(DispatcherTest, WriteFileThenReadItBack) {
    const auto path = (root_ / "a.txt").string();
    nlohmann::json write = {{"type", "writeFile"}, {"path", path}, {"content", "hi"}};
    const auto written = dispatcher_->HandleLine(write.dump());
    EXPECT_TRUE(written.success);
    EXPECT_EQ(written.output, "File written to " + path);
    EXPECT_FALSE(written.error.has_value());

    nlohmann::json read = {{"type", "readFile"}, {"path", path}};
    const auto content = dispatcher_->HandleLine(read.dump());
    EXPECT_TRUE(content.success);
    EXPECT_EQ(content.output, "hi");
    EXPECT_EQ(stub_->run_calls.load(), 0);
}

TEST_F(DispatcherTest, FileFailuresAreWrapped) {
    const auto read = dispatcher_->HandleLine(R"({"type":"readFile","path":"missing.txt"})");
    EXPECT_FALSE(read.success);
    EXPECT_EQ(*read.error, "Failed to read file: Failed to read file missing.txt: no such file or directory");

    std::filesystem::create_directories(root_ / "dir");
    const auto written = dispatcher_->HandleLine(R"({"type":"writeFile","path":"dir","content":"x"})");
    EXPECT_FALSE(written.success);
    EXPECT_EQ(*written.error, "Failed to write file: Failed to write file dir: is a directory");
}

TEST_F(DispatcherTest, RuntimeInitFailureEscapes) {
    stub_->fail_initialize = true;
    EXPECT_THROW(dispatcher_->HandleLine(R"({"code":"x"})"), RuntimeInitError);
}

TEST_F(DispatcherTest, DeadControlChannelEndsTheLoop) {
    out_.setstate(std::ios::badbit);
    std::istringstream input("{\"code\":\"a\"}\n{\"code\":\"b\"}\n");
    EXPECT_EQ(dispatcher_->Run(input), LoopExit::kTransportFailure);
    EXPECT_EQ(dispatcher_->Stats().handled, 1u);
}

TEST(LoopExitTest, HasReadableNames) {
    EXPECT_STREQ(pysandbox::dispatcher::ToString(LoopExit::kEndOfInput), "end_of_input");
    EXPECT_STREQ(pysandbox::dispatcher::ToString(LoopExit::kTransportFailure), "transport_failure");
}

}  // namespace
