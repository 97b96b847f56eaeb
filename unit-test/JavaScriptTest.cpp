#include "common/utils.hpp"
#include "engine/javascript.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;

class JavaScriptTest : public ::testing::Test {
protected:
    javascript_options options;

    void SetUp() override {
        options.timeout = 1;
        options.memory_limit = 64 << 20;
        options.stream_size = 65536;
    }
};

TEST_F(JavaScriptTest, HelloWorld) {
    auto result = run_javascript("console.log(\"Hello, World!\");", options);
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data, "Hello, World!\n");
    EXPECT_EQ(result.stderr_data, "");
}

TEST_F(JavaScriptTest, ConsoleStreamsAndFormatting) {
    auto result = run_javascript(R"(
console.log("a", 1, true, null, undefined);
console.info({x: 1, y: [1, 2]});
console.debug([1, "two"]);
console.warn("careful");
console.error("broken");
)",
                                 options);
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "a 1 true null undefined\n{\"x\":1,\"y\":[1,2]}\n[1,\"two\"]\n");
    EXPECT_EQ(result.stderr_data, "careful\nbroken\n");
}

TEST_F(JavaScriptTest, UncaughtException) {
    auto result = run_javascript("console.log('before');\nthrow new TypeError('bad value');", options);
    EXPECT_EQ(result.status, status::EXECUTION_FAILED);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitcode, 1);
    EXPECT_EQ(result.stdout_data, "before\n");
    EXPECT_NE(result.stderr_data.find("Uncaught TypeError: bad value"), string::npos);
}

TEST_F(JavaScriptTest, SyntaxError) {
    auto result = run_javascript("let = ;", options);
    EXPECT_EQ(result.status, status::EXECUTION_FAILED);
    EXPECT_NE(result.stderr_data.find("SyntaxError"), string::npos);
}

TEST_F(JavaScriptTest, InfiniteLoopTimesOut) {
    elapsed_time timer;
    auto result = run_javascript("console.log('start'); while (true) {}", options);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 3000);
    EXPECT_EQ(result.status, status::EXECUTION_TIMEOUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exitcode);
    EXPECT_EQ(result.stdout_data, "start\n");
}

TEST_F(JavaScriptTest, MemoryLimit) {
    options.memory_limit = 8 << 20;
    auto result = run_javascript("let a = []; while (true) a.push('x'.repeat(1024));", options);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, status::EXECUTION_FAILED);
}

TEST_F(JavaScriptTest, PromiseJobsAreDrained) {
    auto result = run_javascript(R"(
Promise.resolve(1).then(v => console.log("then", v));
console.log("sync");
)",
                                 options);
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "sync\nthen 1\n");
}

TEST_F(JavaScriptTest, NoHostCapabilities) {
    auto result = run_javascript(R"(
console.log(typeof require, typeof process, typeof std, typeof os, typeof print, typeof scriptArgs);
)",
                                 options);
    EXPECT_EQ(result.stdout_data, "undefined undefined undefined undefined undefined undefined\n");
}

TEST_F(JavaScriptTest, FreshContextPerRun) {
    run_javascript("var leaked = 42;", options);
    auto result = run_javascript("console.log(typeof leaked);", options);
    EXPECT_EQ(result.stdout_data, "undefined\n");
}

TEST_F(JavaScriptTest, OutputTruncation) {
    options.stream_size = 12;
    auto result = run_javascript("for (let i = 0; i < 100; i++) console.log('line');", options);
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "line\nline\nli");
    EXPECT_TRUE(result.stdout_truncated);
}
