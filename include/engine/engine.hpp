#pragma once

#include <memory>
#include <string>
#include "common/execution_result.hpp"
#include "common/semaphore.hpp"
#include "engine/config.hpp"
#include "engine/rate_limiter.hpp"
#include "engine/result.hpp"
#include "engine/validator.hpp"
#include "engine/workspace.hpp"

/**
 * 执行引擎
 *
 * 一次请求依次经过：
 * 1. 速率限制：每个请求（包括之后校验失败的请求）都计入调用方的请求数；
 * 2. 代码校验：在创建任何进程之前拒绝不合法或者命中黑名单的代码；
 * 3. 获取执行名额：同时执行的用户程序数量不超过 max_concurrent_executions；
 * 4. 创建工作目录并写入代码；
 * 5. 根据语言选择执行策略，通过 runguard 或者 QuickJS 执行代码；
 * 6. 离开作用域时删除工作目录、归还执行名额。
 *
 * 引擎可以被多个线程同时调用，请求之间只共享速率限制器的状态。
 */
namespace runner {

/**
 * @brief 根据配置构造速率限制器
 * 速率限制关闭时返回 unlimited_rate_limiter
 */
std::unique_ptr<rate_limiter> make_rate_limiter(const rate_limit_config &config);

class engine {
public:
    explicit engine(const engine_config &config);
    engine(const engine_config &config, std::unique_ptr<rate_limiter> limiter);

    /**
     * @brief 执行一次请求
     * 运行用户代码的所有结果都以 status 表示，这个函数不会抛出异常。
     */
    execution_result execute(const execution_request &request);

    execution_result execute(const std::string &code, const std::string &language, const std::string &client_id);

    const engine_config &config() const;

    const workspace_manager &workspaces() const;

private:
    engine_config cfg;
    std::unique_ptr<rate_limiter> limiter;
    validator checker;
    workspace_manager manager;
    counting_semaphore slots;
};

}  // namespace runner
