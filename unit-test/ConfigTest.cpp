#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "engine/config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;
using nlohmann::json;

TEST(ConfigTest, Defaults) {
    engine_config config;
    EXPECT_EQ(config.max_code_length, 50000u);
    EXPECT_EQ(config.execution_timeout, 10);
    EXPECT_EQ(config.compile_timeout, 10);
    EXPECT_GE(config.max_concurrent_executions, 1u);
    EXPECT_TRUE(config.rate_limit.enabled);
    EXPECT_EQ(config.rate_limit.requests, 50u);
    EXPECT_EQ(config.rate_limit.window, 3600);
    EXPECT_EQ(config.max_output_size, 65536);
    EXPECT_EQ(config.memory_limit, 262144);
    EXPECT_EQ(config.python, "python3");
    EXPECT_EQ(config.c_compiler, "gcc");
    EXPECT_EQ(config.run_dir.filename().string(), "code-runner");
    EXPECT_TRUE(config.denylist.empty());
}

TEST(ConfigTest, Profiles) {
    EXPECT_EQ(profile_config("development").rate_limit.requests, 50u);
    EXPECT_EQ(profile_config("testing").rate_limit.requests, 1000u);
    EXPECT_EQ(profile_config("production").min_log_level, google::WARNING);
    EXPECT_EQ(profile_config("development").min_log_level, google::INFO);
    EXPECT_THROW(profile_config("staging"), invalid_argument);
}

TEST(ConfigTest, FromJsonOverridesGivenKeys) {
    engine_config config = profile_config("testing");
    json j = json::parse(R"({
        "max_code_length": 100,
        "execution_timeout": 2.5,
        "rate_limit": {"window": 60},
        "denylist": {"python": ["secret"], "c": []},
        "run_dir": "/tmp/elsewhere"
    })");
    from_json(j, config);
    EXPECT_EQ(config.max_code_length, 100u);
    EXPECT_EQ(config.execution_timeout, 2.5);
    EXPECT_EQ(config.rate_limit.window, 60);
    EXPECT_EQ(config.rate_limit.requests, 1000u);
    EXPECT_EQ(config.compile_timeout, 10);
    EXPECT_EQ(config.denylist[language::python], vector<string>{"secret"});
    EXPECT_TRUE(config.denylist[language::c].empty());
    EXPECT_EQ(config.run_dir.string(), "/tmp/elsewhere");
}

TEST(ConfigTest, FromJsonRejectsInvalidValues) {
    engine_config config;
    EXPECT_THROW(from_json(json::parse(R"({"max_code_length": "long"})"), config), invalid_argument);
    EXPECT_THROW(from_json(json::parse(R"({"execution_timeout": 0})"), config), invalid_argument);
    EXPECT_THROW(from_json(json::parse(R"({"denylist": {"ruby": ["x"]}})"), config), invalid_argument);
    EXPECT_THROW(from_json(json::parse(R"([1, 2])"), config), invalid_argument);
}

TEST(ConfigTest, LoadConfigFile) {
    filesystem::path file = RUN_DIR / "config.json";
    write_file_content(file, R"({"max_output_size": 1024, "rate_limit": {"enabled": false}})");
    engine_config config = load_config(file, "production");
    EXPECT_EQ(config.max_output_size, 1024);
    EXPECT_FALSE(config.rate_limit.enabled);
    EXPECT_EQ(config.min_log_level, google::WARNING);

    write_file_content(file, "{ not json");
    EXPECT_THROW(load_config(file, "development"), invalid_argument);
    filesystem::remove(file);

    EXPECT_THROW(load_config(RUN_DIR / "missing.json", "development"), invalid_argument);
    EXPECT_EQ(load_config("", "testing").rate_limit.requests, 1000u);
}
