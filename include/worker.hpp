#pragma once

#include <functional>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "engine/engine.hpp"

/**
 * 批量执行相关函数
 * 主线程逐行读取请求，解析后放入 task_queue，每个 worker 从队列中取出任务并执行，
 * 执行结果通过 output 回调写回。不同 worker 的响应按完成顺序输出，通过 id 匹配请求。
 */
namespace runner {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，worker 不再从队列中获取新任务，正在执行的任务会正常完成。
 */
void stop_workers();

/**
 * @brief worker 是否已经被要求停止
 */
bool workers_stopped();

/**
 * @brief 重置停止标记，以便再次启动 worker
 */
void reset_workers();

/**
 * @brief 启动执行 worker 线程
 * worker 在队列关闭且为空时，或者 stop_workers 被调用后退出。
 * @param worker_id worker 的编号，用于日志
 * @param task_queue 主线程发送执行任务的队列
 * @param exec 执行引擎，worker 之间共享
 * @param output 输出一行响应，可能被多个 worker 同时调用，调用方需要保证线程安全
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<message::execution_task> &task_queue,
                         engine &exec, std::function<void(const std::string &)> output);

/**
 * @brief 执行一个任务并构造一行 JSON 响应
 */
std::string process_task(engine &exec, const message::execution_task &task);

}  // namespace runner
