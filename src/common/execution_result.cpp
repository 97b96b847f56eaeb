#include "common/execution_result.hpp"

namespace runner {

execution_result make_result(status stat, const std::string &message) {
    execution_result result;
    result.status = stat;
    result.success = stat == status::SUCCESS;
    if (stat == status::INTERNAL_ERROR)
        result.internal_message = message;
    else
        result.stderr_data = message;
    return result;
}

}  // namespace runner
