#include <csignal>
#include "engine/result.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace runner;
using nlohmann::json;

static execution_result finished(status stat, const string &out, const string &err, optional<int> exitcode) {
    execution_result result;
    result.status = stat;
    result.success = stat == status::SUCCESS;
    result.stdout_data = out;
    result.stderr_data = err;
    result.exitcode = exitcode;
    return result;
}

TEST(ResultTest, SuccessWithoutStderr) {
    json j = to_response(finished(status::SUCCESS, "Hello, World!\n", "", 0));
    EXPECT_JSON_EQ(j, json::parse(R"({
        "output": "Hello, World!\n",
        "error": null,
        "success": true,
        "status": "success",
        "timed_out": false,
        "truncated": false
    })"));
}

TEST(ResultTest, SuccessWithStderr) {
    auto response = to_response(finished(status::SUCCESS, "out", "warning", 0));
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.error, "warning");
}

TEST(ResultTest, ExecutionFailed) {
    auto response = to_response(finished(status::EXECUTION_FAILED, "partial", "Traceback", 1));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.output, "partial");
    EXPECT_EQ(response.error, "Traceback");

    response = to_response(finished(status::EXECUTION_FAILED, "", "", 3));
    EXPECT_EQ(response.error, "Process exited with code 3");

    auto killed = finished(status::EXECUTION_FAILED, "", "", 128 + SIGSEGV);
    killed.signal = SIGSEGV;
    EXPECT_EQ(to_response(killed).error, "Process terminated by signal " + to_string(SIGSEGV));
}

TEST(ResultTest, Timeout) {
    auto result = finished(status::EXECUTION_TIMEOUT, "so far", "", nullopt);
    result.timed_out = true;
    json j = to_response(result);
    EXPECT_EQ(j["output"], "so far");
    EXPECT_EQ(j["error"], "Execution timed out");
    EXPECT_EQ(j["timed_out"], true);
    EXPECT_EQ(j["status"], "execution_timeout");
}

TEST(ResultTest, CompileFailed) {
    auto result = make_result(status::COMPILE_FAILED, "Compilation failed");
    result.stdout_data = "main.c:1:1: error: expected ';'";
    auto response = to_response(result);
    EXPECT_EQ(response.output, "main.c:1:1: error: expected ';'");
    EXPECT_EQ(response.error, "Compilation failed");
    EXPECT_FALSE(response.success);
}

TEST(ResultTest, RejectionsCarryReason) {
    auto response = to_response(make_result(status::RATE_LIMITED, "Rate limit exceeded. Please try again later."));
    EXPECT_EQ(response.error, "Rate limit exceeded. Please try again later.");
    EXPECT_EQ(response.output, "");

    response = to_response(make_result(status::VALIDATION_REJECTED, "Potentially dangerous code detected: process spawning"));
    EXPECT_EQ(response.status, status::VALIDATION_REJECTED);
    EXPECT_EQ(response.error, "Potentially dangerous code detected: process spawning");
}

TEST(ResultTest, InternalErrorHidesDetails) {
    auto result = make_result(status::INTERNAL_ERROR, "Unable to create workspace in /tmp/code-runner: No space left on device");
    json j = to_response(result);
    EXPECT_EQ(j["error"], "Internal server error");
    EXPECT_EQ(j["output"], "");
    EXPECT_EQ(j.dump().find("/tmp"), string::npos);
}

TEST(ResultTest, ResponseJsonRoundTrip) {
    auto result = finished(status::EXECUTION_FAILED, "x", "", 2);
    result.stdout_truncated = true;
    json j = to_response(result);
    auto response = j.get<execution_response>();
    EXPECT_EQ(response.status, status::EXECUTION_FAILED);
    EXPECT_EQ(response.error, "Process exited with code 2");
    EXPECT_TRUE(response.truncated);

    j["status"] = "exploded";
    EXPECT_THROW(j.get<execution_response>(), invalid_argument);
}

TEST(ResultTest, ParseRequest) {
    auto request = json::parse(R"json({"code": "print(1)", "language": "python"})json").get<execution_request>();
    EXPECT_EQ(request.code, "print(1)");
    EXPECT_EQ(request.language, "python");
    EXPECT_EQ(request.client_id, "anonymous");

    EXPECT_THROW(json::parse(R"({"language": "python"})").get<execution_request>(), json::exception);
    EXPECT_THROW(json::parse(R"({"code": 1, "language": "python"})").get<execution_request>(), json::exception);
}

TEST(StatusTest, Names) {
    for (int i = 0; i <= static_cast<int>(status::INTERNAL_ERROR); ++i) {
        auto stat = static_cast<status>(i);
        EXPECT_EQ(parse_status(get_status_name(stat)), stat);
        EXPECT_NE(string(get_display_message(stat)), "");
    }
    EXPECT_EQ(parse_status("unknown"), nullopt);
}
