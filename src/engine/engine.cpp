#include "engine/engine.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "engine/strategy.hpp"

namespace runner {
using namespace std;

static const char *RATE_LIMITED_MESSAGE = "Rate limit exceeded. Please try again later.";

unique_ptr<rate_limiter> make_rate_limiter(const rate_limit_config &config) {
    if (!config.enabled) return make_unique<unlimited_rate_limiter>();
    auto window = chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(config.window));
    return make_unique<sliding_window_rate_limiter>(config.requests, window);
}

engine::engine(const engine_config &config)
    : engine(config, make_rate_limiter(config.rate_limit)) {}

engine::engine(const engine_config &config, unique_ptr<rate_limiter> limiter)
    : cfg(config),
      limiter(move(limiter)),
      checker(config),
      manager(config.run_dir),
      slots(config.max_concurrent_executions) {}

execution_result engine::execute(const execution_request &request) {
    return execute(request.code, request.language, request.client_id);
}

execution_result engine::execute(const string &code, const string &language_id, const string &client_id) {
    elapsed_time timer;

    if (!limiter->allow(client_id))
        return make_result(status::RATE_LIMITED, RATE_LIMITED_MESSAGE);

    validation_result validation = checker.validate(code, language_id);
    if (!validation.allowed) {
        LOG(WARNING) << "Rejected " << language_id << " code from " << client_id << ": " << *validation.reason;
        return make_result(validation.status, *validation.reason);
    }

    try {
        language lang = parse_language(language_id).value();

        execution_result result;
        {
            semaphore_guard slot(slots);
            auto ws = manager.acquire(lang, code);
            result = runner::execute(make_strategy(lang), *ws, code, cfg);
        }

        if (result.status == status::INTERNAL_ERROR)
            LOG(ERROR) << "Internal error executing " << language_id << " code from " << client_id << ": " << result.internal_message;
        else
            LOG(INFO) << fmt::format("Executed {} code from {}: {} in {:.3f}s", language_id, client_id,
                                     get_status_name(result.status),
                                     timer.duration<chrono::duration<double>>().count());
        return result;
    } catch (runner_exception &ex) {
        LOG(ERROR) << "Internal error executing " << language_id << " code from " << client_id << ": " << ex;
        return make_result(status::INTERNAL_ERROR, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Internal error executing " << language_id << " code from " << client_id << ": "
                   << boost::diagnostic_information(ex);
        return make_result(status::INTERNAL_ERROR, ex.what());
    }
}

const engine_config &engine::config() const {
    return cfg;
}

const workspace_manager &engine::workspaces() const {
    return manager;
}

}  // namespace runner
