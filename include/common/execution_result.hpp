#pragma once

#include <optional>
#include <string>
#include "common/status.hpp"

namespace runner {

/**
 * @brief 一次执行的结果
 * 由 runguard 或者语言策略构造，构造完成后不再修改，直接返回给调用方。
 */
struct execution_result {
    /**
     * @brief 程序的标准输出，超过 max_output_size 的部分被丢弃
     * 对于 C 语言编译失败，保存编译器的诊断信息
     */
    std::string stdout_data;

    /**
     * @brief 程序的标准错误输出，超过 max_output_size 的部分被丢弃
     */
    std::string stderr_data;

    /**
     * @brief 程序的返回值
     * 若程序因为信号终止，则为 128 + 信号值；若程序因为超时被终止或者根本没有运行，则为空
     */
    std::optional<int> exitcode;

    /**
     * @brief 终止程序的信号
     */
    std::optional<int> signal;

    bool timed_out = false;

    bool success = false;

    runner::status status = runner::status::INTERNAL_ERROR;

    bool stdout_truncated = false;

    bool stderr_truncated = false;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 内部错误的详细信息，只用于服务端日志
     * 不会出现在返回给调用方的响应中
     */
    std::string internal_message;
};

/**
 * @brief 构造一个不需要运行程序就能确定的结果
 * @param stat 结果类型
 * @param message 对于 INTERNAL_ERROR，为只写入日志的内部信息；
 * 其他情况下为返回给调用方的原因，保存在 stderr_data 中
 */
execution_result make_result(status stat, const std::string &message = "");

}  // namespace runner
