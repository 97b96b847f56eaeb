#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/execution_result.hpp"

namespace runner {

/**
 * @brief 执行请求
 * 请求本身不做检查，代码长度和语言由校验器检查
 */
struct execution_request {
    std::string code;

    /**
     * @brief 语言的稳定名称，比如 "python"
     */
    std::string language;

    /**
     * @brief 调用方的标识，用于速率限制
     */
    std::string client_id;
};

/**
 * @brief 返回给调用方的响应
 * 不包含工作目录路径、内部错误信息等主机细节
 */
struct execution_response {
    std::string output;
    std::optional<std::string> error;
    bool success = false;
    runner::status status = runner::status::INTERNAL_ERROR;
    bool timed_out = false;

    /**
     * @brief 输出是否因为超出 max_output_size 而被截断
     */
    bool truncated = false;
};

/**
 * @brief 将执行结果转换为响应
 * 内部错误只返回 "Internal server error"，详细信息只出现在服务端日志中。
 */
execution_response to_response(const execution_result &result);

void to_json(nlohmann::json &j, const execution_response &response);

/**
 * @throw std::invalid_argument 若状态名称未知
 */
void from_json(const nlohmann::json &j, execution_response &response);

void to_json(nlohmann::json &j, const execution_request &request);

/**
 * @brief 解析请求，code 和 language 必须给出，client_id 默认为 "anonymous"
 * @throw nlohmann::json::exception 若缺少必要字段或者类型不正确
 */
void from_json(const nlohmann::json &j, execution_request &request);

}  // namespace runner
