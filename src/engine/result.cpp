#include "engine/result.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace runner {
using namespace std;
using namespace nlohmann;

static const char *INTERNAL_ERROR_MESSAGE = "Internal server error";
static const char *TIMEOUT_MESSAGE = "Execution timed out";

execution_response to_response(const execution_result &result) {
    execution_response response;
    response.status = result.status;
    response.success = result.success;
    response.timed_out = result.timed_out;
    response.truncated = result.stdout_truncated || result.stderr_truncated;

    switch (result.status) {
        case status::SUCCESS:
            response.output = result.stdout_data;
            if (!result.stderr_data.empty()) response.error = result.stderr_data;
            break;
        case status::EXECUTION_FAILED:
            response.output = result.stdout_data;
            if (!result.stderr_data.empty())
                response.error = result.stderr_data;
            else if (result.signal)
                response.error = fmt::format("Process terminated by signal {}", *result.signal);
            else
                response.error = fmt::format("Process exited with code {}", result.exitcode.value_or(-1));
            break;
        case status::EXECUTION_TIMEOUT:
            response.output = result.stdout_data;
            response.error = TIMEOUT_MESSAGE;
            break;
        case status::COMPILE_FAILED:
            response.output = result.stdout_data;
            response.error = result.stderr_data;
            break;
        case status::RATE_LIMITED:
        case status::INVALID_INPUT:
        case status::VALIDATION_REJECTED:
            response.error = result.stderr_data;
            break;
        case status::INTERNAL_ERROR:
            response.error = INTERNAL_ERROR_MESSAGE;
            response.truncated = false;
            break;
    }
    return response;
}

void to_json(json &j, const execution_response &response) {
    j = json{{"output", response.output},
             {"error", response.error ? json(*response.error) : json()},
             {"success", response.success},
             {"status", get_status_name(response.status)},
             {"timed_out", response.timed_out},
             {"truncated", response.truncated}};
}

void from_json(const json &j, execution_response &response) {
    response.output = j.value("output", "");
    if (j.count("error") && !j.at("error").is_null())
        response.error = j.at("error").get<string>();
    else
        response.error.reset();
    response.success = j.value("success", false);
    string name = j.at("status").get<string>();
    auto stat = parse_status(name);
    if (!stat) throw invalid_argument("Unrecognized status " + name);
    response.status = *stat;
    response.timed_out = j.value("timed_out", false);
    response.truncated = j.value("truncated", false);
}

void to_json(json &j, const execution_request &request) {
    j = json{{"code", request.code},
             {"language", request.language},
             {"client_id", request.client_id}};
}

void from_json(const json &j, execution_request &request) {
    j.at("code").get_to(request.code);
    j.at("language").get_to(request.language);
    request.client_id = j.value("client_id", "anonymous");
}

}  // namespace runner
