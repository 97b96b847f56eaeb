#pragma once

#include <cstdint>
#include <string>
#include "common/execution_result.hpp"

namespace runner {

struct javascript_options {
    /**
     * @brief 墙上时间限制，单位为秒
     */
    double timeout = 10;

    /**
     * @brief JavaScript 运行时的内存上限，单位为字节，-1 表示不限制
     */
    int64_t memory_limit = -1;

    /**
     * @brief 每个输出流保留的最大字节数，-1 表示不限制
     */
    int64_t stream_size = -1;
};

/**
 * @brief 在嵌入的 QuickJS 运行时中执行 JavaScript 代码
 *
 * 每次调用都会创建全新的运行时和上下文，执行结束后全部释放，不同请求之间不共享任何状态。
 * 上下文只包含 ECMAScript 的内置对象，不加载 std/os 模块，因此代码无法访问文件系统、
 * 创建进程或者进行网络通信。唯一的宿主对象是 console：
 * console.log/info/debug 写入标准输出，console.warn/error 写入标准错误输出。
 *
 * 超时通过运行时的中断回调实现，内存上限通过 JS_SetMemoryLimit 实现。
 * 脚本执行完成后会继续执行排队的 Promise 任务，直到队列为空或者超时。
 *
 * @return 执行结果，未捕获的异常视为 EXECUTION_FAILED，返回值为 1
 * @throw internal_error 若无法创建运行时
 */
execution_result run_javascript(const std::string &code, const javascript_options &options);

}  // namespace runner
