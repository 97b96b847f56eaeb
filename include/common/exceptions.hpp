#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace runner {

/**
 * @brief 执行引擎内部异常的基类
 * 携带构造时的调用栈，便于在日志中定位故障点。
 * @note 运行用户代码产生的结果（编译错误、超时、非零返回值等）不是异常，
 * 它们保存在 execution_result 中。只有基础设施故障才会抛出该类异常。
 */
struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 这类错误会被记录到服务端日志，返回给调用方时只给出通用的错误信息，
 * 不会泄露工作目录路径或主机信息。
 */
struct internal_error : public runner_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示创建或写入工作目录失败，通常是磁盘已满或没有权限
 */
struct workspace_error : public internal_error {
    workspace_error();
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 表示无法创建子进程，包括 pipe、fork、execve 失败
 */
struct spawn_error : public internal_error {
    spawn_error();
    explicit spawn_error(const std::string &message);
};

}  // namespace runner
