#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace runner {

/**
 * @brief 计数信号量，限制同时执行的用户程序数量
 * 避免大量并发请求同时编译、运行导致主机进程表或内存耗尽
 */
struct counting_semaphore {
    explicit counting_semaphore(std::size_t count) : available(count) {}

    counting_semaphore(const counting_semaphore &) = delete;
    counting_semaphore &operator=(const counting_semaphore &) = delete;

    /**
     * @brief 获取一个名额，没有剩余名额时阻塞等待
     */
    void acquire() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return available > 0; });
        --available;
    }

    /**
     * @brief 归还一个名额
     */
    void release() {
        std::unique_lock<std::mutex> mlock(mut);
        ++available;
        mlock.unlock();
        cond.notify_one();
    }

    std::size_t available_count() {
        std::unique_lock<std::mutex> mlock(mut);
        return available;
    }

private:
    std::size_t available;
    std::mutex mut;
    std::condition_variable cond;
};

/**
 * @brief 作用域内持有信号量的一个名额
 */
struct semaphore_guard {
    explicit semaphore_guard(counting_semaphore &sem) : sem(sem) { sem.acquire(); }
    ~semaphore_guard() { sem.release(); }

    semaphore_guard(const semaphore_guard &) = delete;
    semaphore_guard &operator=(const semaphore_guard &) = delete;

private:
    counting_semaphore &sem;
};

}  // namespace runner
