#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = runner::scoped_guard() + [&]

namespace runner {

/**
 * @brief 作用域退出时执行清理函数
 * 无论是正常返回还是异常退出，析构时都会调用 f。
 * 清理函数抛出的异常会被记录到日志中，不会从析构函数传播出去。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理，析构时不再调用 f
     */
    void dismiss();
};

}  // namespace runner
