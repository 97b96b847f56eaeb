#include "engine/rate_limiter.hpp"
#include <glog/logging.h>

namespace runner {
using namespace std;

rate_limiter::~rate_limiter() = default;

bool unlimited_rate_limiter::allow(const string &) {
    return true;
}

sliding_window_rate_limiter::sliding_window_rate_limiter(size_t requests, clock_type::duration window, function<time_point()> clock)
    : requests(requests), window(window), clock(move(clock)) {
    last_sweep = this->clock();
}

void sliding_window_rate_limiter::prune(deque<time_point> &timestamps, time_point now) const {
    // 时刻按照插入顺序递增，只需要从队首删除
    while (!timestamps.empty() && now - timestamps.front() >= window)
        timestamps.pop_front();
}

void sliding_window_rate_limiter::sweep(time_point now) {
    for (auto it = history.begin(); it != history.end();) {
        prune(it->second, now);
        if (it->second.empty())
            it = history.erase(it);
        else
            ++it;
    }
    last_sweep = now;
}

bool sliding_window_rate_limiter::allow(const string &client_id) {
    scoped_lock guard(mut);
    time_point now = clock();

    if (now - last_sweep >= window) sweep(now);

    auto &timestamps = history[client_id];
    prune(timestamps, now);
    if (timestamps.size() < requests) {
        timestamps.push_back(now);
        return true;
    }

    LOG(WARNING) << "Client " << client_id << " exceeded " << requests << " requests per window";
    return false;
}

size_t sliding_window_rate_limiter::client_count() {
    scoped_lock guard(mut);
    return history.size();
}

}  // namespace runner
