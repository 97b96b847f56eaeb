#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::RATE_LIMITED, "Rate Limited")
    (status::INVALID_INPUT, "Invalid Input")
    (status::VALIDATION_REJECTED, "Validation Rejected")
    (status::COMPILE_FAILED, "Compile Failed")
    (status::EXECUTION_TIMEOUT, "Execution Timeout")
    (status::EXECUTION_FAILED, "Execution Failed")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::RATE_LIMITED, "rate_limited")
    (status::INVALID_INPUT, "invalid_input")
    (status::VALIDATION_REJECTED, "validation_rejected")
    (status::COMPILE_FAILED, "compile_failed")
    (status::EXECUTION_TIMEOUT, "execution_timeout")
    (status::EXECUTION_FAILED, "execution_failed")
    (status::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

optional<status> parse_status(const string &name) {
    for (auto &[stat, str] : status_name)
        if (name == str) return stat;
    return nullopt;
}

}  // namespace runner
