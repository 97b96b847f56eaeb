#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

namespace runner {
using namespace std;
using namespace nlohmann;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

void reset_workers() {
    stop = false;
}

string process_task(engine &exec, const message::execution_task &task) {
    execution_result result = exec.execute(task.request);
    json j = to_response(result);
    j["id"] = task.id;
    // 程序的输出不一定是合法的 UTF-8
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

/**
 * @brief worker 主循环
 * 从队列中读取任务，执行后通过 output 输出响应。
 * 队列为空时最多等待 100ms，以便及时响应 stop_workers。
 */
static void worker_loop(size_t worker_id, concurrent_queue<message::execution_task> &task_queue,
                        engine &exec, const function<void(const string &)> &output) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (!stop) {
        message::execution_task task;
        if (!task_queue.pop_for(task, chrono::milliseconds(100))) {
            // 主线程关闭队列后，队列中不会再有新任务，worker 自然退出
            if (task_queue.drained()) break;
            continue;
        }

        string line;
        try {
            line = process_task(exec, task);
        } catch (std::exception &ex) {
            // engine::execute 不抛出异常，这里只会是序列化失败
            LOG(ERROR) << "Worker " << worker_id << " failed to process task " << task.id.dump() << endl
                       << boost::diagnostic_information(ex);
            json j = to_response(make_result(status::INTERNAL_ERROR, ex.what()));
            j["id"] = task.id;
            line = j.dump();
        }
        output(line);
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<message::execution_task> &task_queue,
                    engine &exec, function<void(const string &)> output) {
    return thread([worker_id, &task_queue, &exec, output = move(output)] {
        worker_loop(worker_id, task_queue, exec, output);
    });
}

}  // namespace runner
