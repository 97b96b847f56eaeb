#pragma once

#include <optional>
#include <string>

namespace runner {

/**
 * @brief 表示一次执行请求的最终结果类型
 * 除了 INTERNAL_ERROR 以外，其余都是运行任意代码时的正常结果，
 * 以数据的形式返回给调用方，而不是以异常的形式抛出。
 */
enum class status {
    /**
     * @brief 程序正常结束且返回值为 0
     * 对于 html，表示原样返回了页面代码
     */
    SUCCESS = 0,

    /**
     * @brief 调用方在时间窗口内的请求数超出限制
     * 请求不会进入校验阶段，调用方需要等待后重试
     */
    RATE_LIMITED = 1,

    /**
     * @brief 请求本身不合法
     * 代码为空、代码过长、不是合法的 UTF-8 或者语言不受支持
     */
    INVALID_INPUT = 2,

    /**
     * @brief 代码命中了黑名单中的危险模式
     * 在创建任何进程之前被拒绝
     */
    VALIDATION_REJECTED = 3,

    /**
     * @brief 编译失败，仅对 C 语言有效
     * 编译器的诊断信息作为输出返回
     */
    COMPILE_FAILED = 4,

    /**
     * @brief 程序运行时间超出限制
     * 整个进程组已被强制终止，输出截止到终止时刻
     */
    EXECUTION_TIMEOUT = 5,

    /**
     * @brief 程序以非零返回值结束或者被信号终止
     */
    EXECUTION_FAILED = 6,

    /**
     * @brief 执行引擎内部错误
     * 比如无法创建工作目录、无法创建子进程。
     */
    INTERNAL_ERROR = 7
};

/**
 * @brief 状态的可读描述，用于日志和界面展示
 */
const char *get_display_message(status);

/**
 * @brief 状态的稳定名称（snake_case），用于 JSON 序列化
 */
const char *get_status_name(status);

/**
 * @brief 从稳定名称解析状态
 * @return 若名称未知，返回 std::nullopt
 */
std::optional<status> parse_status(const std::string &name);

}  // namespace runner
