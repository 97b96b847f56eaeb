#include "test/environment.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

static filesystem::path test_root() {
    return filesystem::temp_directory_path() / "runner-test";
}

void setup_test_environment() {
    if (getenv("DEBUG")) runner::DEBUG = true;

    runner::RUN_DIR = test_root() / "run";
    filesystem::create_directories(runner::RUN_DIR);
    CHECK(filesystem::is_directory(runner::RUN_DIR))
        << "Run directory " << runner::RUN_DIR << " does not exist";
}

void teardown_test_environment() {
    error_code ec;
    filesystem::remove_all(test_root(), ec);
}

engine_config test_config() {
    engine_config config = profile_config("testing");
    config.run_dir = runner::RUN_DIR;
    config.execution_timeout = 2;
    config.compile_timeout = 30;
    config.max_concurrent_executions = 4;
    return config;
}

bool has_executable(const string &name) {
    return find_executable(name, test_config().search_path).has_value();
}

size_t count_workspaces(const filesystem::path &run_dir) {
    size_t count = 0;
    if (!filesystem::is_directory(run_dir)) return count;
    for (auto &entry : filesystem::directory_iterator(run_dir))
        if (entry.path().filename().string().rfind("run-", 0) == 0) ++count;
    return count;
}

}  // namespace runner
