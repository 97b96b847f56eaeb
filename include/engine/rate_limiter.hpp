#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace runner {

/**
 * @brief 请求速率限制器
 * 执行引擎在校验代码之前先调用 allow，被拒绝的请求不会进入后续流程。
 * 实现必须可以被多个线程同时调用。
 */
class rate_limiter {
public:
    virtual ~rate_limiter();

    /**
     * @brief 记录客户端的一次请求，并判断是否允许
     * @return 若客户端在当前窗口内的请求数未超出限制，返回 true 并计入这次请求
     */
    virtual bool allow(const std::string &client_id) = 0;
};

/**
 * @brief 不做限制，用于关闭速率限制的配置
 */
class unlimited_rate_limiter : public rate_limiter {
public:
    bool allow(const std::string &client_id) override;
};

/**
 * @brief 滑动窗口速率限制器
 * 为每个客户端记录窗口内的请求时刻，所有操作都在同一个互斥锁下完成，
 * 因此同一客户端的并发请求不会因为竞争而超出限制。
 */
class sliding_window_rate_limiter : public rate_limiter {
public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;

    /**
     * @param requests 每个窗口内允许的请求数
     * @param window 窗口长度
     * @param clock 获取当前时刻的函数，测试时可以替换
     */
    sliding_window_rate_limiter(std::size_t requests, clock_type::duration window,
                                std::function<time_point()> clock = clock_type::now);

    bool allow(const std::string &client_id) override;

    /**
     * @brief 当前记录的客户端数量
     */
    std::size_t client_count();

private:
    std::size_t requests;
    clock_type::duration window;
    std::function<time_point()> clock;

    std::mutex mut;
    std::unordered_map<std::string, std::deque<time_point>> history;
    time_point last_sweep;

    void prune(std::deque<time_point> &timestamps, time_point now) const;
    void sweep(time_point now);
};

}  // namespace runner
