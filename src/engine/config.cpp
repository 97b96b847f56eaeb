#include "engine/config.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

engine_config::engine_config()
    : max_concurrent_executions(max(1u, thread::hardware_concurrency())),
      run_dir(filesystem::temp_directory_path() / "code-runner") {}

engine_config profile_config(const string &profile) {
    engine_config config;
    if (profile == "development" || profile == "default") {
    } else if (profile == "production") {
        config.min_log_level = google::WARNING;
    } else if (profile == "testing") {
        config.rate_limit.requests = 1000;
    } else {
        throw invalid_argument("Unrecognized profile " + profile);
    }
    return config;
}

void from_json(const json &j, engine_config &config) {
    if (!j.is_object())
        throw invalid_argument("Configuration must be a JSON object");

    assign_optional(j, config.max_code_length, "max_code_length");
    assign_optional(j, config.execution_timeout, "execution_timeout");
    assign_optional(j, config.compile_timeout, "compile_timeout");
    assign_optional(j, config.max_concurrent_executions, "max_concurrent_executions");
    assign_optional(j, config.rate_limit.enabled, "rate_limit", "enabled");
    assign_optional(j, config.rate_limit.requests, "rate_limit", "requests");
    assign_optional(j, config.rate_limit.window, "rate_limit", "window");
    assign_optional(j, config.max_output_size, "max_output_size");
    assign_optional(j, config.memory_limit, "memory_limit");
    assign_optional(j, config.file_limit, "file_limit");
    assign_optional(j, config.process_limit, "process_limit");
    assign_optional(j, config.python, "python");
    assign_optional(j, config.c_compiler, "c_compiler");
    assign_optional(j, config.search_path, "search_path");

    if (exists(j, "run_dir"))
        config.run_dir = get_value_def<string>(j, "", "run_dir");

    if (exists(j, "denylist")) {
        const json &denylist = j.at("denylist");
        if (!denylist.is_object())
            throw invalid_argument("denylist must be an object keyed by language");
        for (auto &[id, patterns] : denylist.items()) {
            auto lang = parse_language(id);
            if (!lang) throw invalid_argument("Unsupported language in denylist: " + id);
            config.denylist[*lang] = get_value_def<vector<string>>(denylist, {}, id);
        }
    }

    if (config.max_code_length == 0)
        throw invalid_argument("max_code_length must be positive");
    if (config.execution_timeout <= 0 || config.compile_timeout <= 0)
        throw invalid_argument("timeouts must be positive");
    if (config.max_concurrent_executions == 0)
        throw invalid_argument("max_concurrent_executions must be positive");
    if (config.rate_limit.requests == 0 || config.rate_limit.window <= 0)
        throw invalid_argument("rate_limit requests and window must be positive");
    if (config.max_output_size <= 0)
        throw invalid_argument("max_output_size must be positive");
}

engine_config load_config(const filesystem::path &file, const string &profile) {
    engine_config config = profile_config(profile);
    if (!file.empty()) {
        if (!filesystem::is_regular_file(file))
            throw invalid_argument("Configuration file " + file.string() + " does not exist");
        json j;
        try {
            j = json::parse(read_file_content(file));
        } catch (json::parse_error &e) {
            throw invalid_argument("Configuration file " + file.string() + " is malformed: " + e.what());
        }
        from_json(j, config);
        LOG(INFO) << "Loaded configuration " << file << " with profile " << profile;
    }
    return config;
}

}  // namespace runner
