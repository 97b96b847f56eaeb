#pragma once

#include <nlohmann/json.hpp>
#include "engine/result.hpp"

namespace runner::message {

/**
 * @brief 批量模式下由主线程发送给 worker 的执行任务
 */
struct execution_task {
    /**
     * @brief 调用方给出的任务 id，可以是字符串或者数字，原样写回响应中，用于匹配请求和响应
     */
    nlohmann::json id;

    execution_request request;
};

}  // namespace runner::message
