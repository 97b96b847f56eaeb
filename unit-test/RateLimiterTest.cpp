#include <atomic>
#include <thread>
#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "engine/rate_limiter.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace std::chrono;
using namespace runner;

class RateLimiterTest : public ::testing::Test {
protected:
    sliding_window_rate_limiter::time_point now = sliding_window_rate_limiter::time_point{} + hours(1);

    unique_ptr<sliding_window_rate_limiter> make(size_t requests, seconds window) {
        return make_unique<sliding_window_rate_limiter>(requests, window, [this] { return now; });
    }
};

TEST_F(RateLimiterTest, AllowsUpToLimit) {
    auto limiter = make(3, seconds(60));
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_FALSE(limiter->allow("a"));
    EXPECT_FALSE(limiter->allow("a"));
}

TEST_F(RateLimiterTest, ClientsAreIndependent) {
    auto limiter = make(1, seconds(60));
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_FALSE(limiter->allow("a"));
    EXPECT_TRUE(limiter->allow("b"));
    EXPECT_FALSE(limiter->allow("b"));
}

TEST_F(RateLimiterTest, WindowSlides) {
    auto limiter = make(2, seconds(60));
    EXPECT_TRUE(limiter->allow("a"));
    now += seconds(30);
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_FALSE(limiter->allow("a"));

    // 第一次请求移出窗口
    now += seconds(30);
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_FALSE(limiter->allow("a"));

    now += seconds(60);
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_TRUE(limiter->allow("a"));
}

TEST_F(RateLimiterTest, DeniedRequestsAreNotRecorded) {
    auto limiter = make(1, seconds(60));
    EXPECT_TRUE(limiter->allow("a"));
    now += seconds(59);
    EXPECT_FALSE(limiter->allow("a"));
    now += seconds(1);
    EXPECT_TRUE(limiter->allow("a"));
}

TEST_F(RateLimiterTest, IdleClientsAreSwept) {
    auto limiter = make(5, seconds(60));
    for (int i = 0; i < 100; ++i)
        EXPECT_TRUE(limiter->allow("client-" + to_string(i)));
    EXPECT_EQ(limiter->client_count(), 100u);

    now += seconds(61);
    EXPECT_TRUE(limiter->allow("other"));
    EXPECT_EQ(limiter->client_count(), 1u);
}

TEST_F(RateLimiterTest, ConcurrentRequestsObserveConsistentCount) {
    auto limiter = make(50, seconds(60));
    atomic<int> allowed{0};
    vector<thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&] {
            for (int i = 0; i < 100; ++i)
                if (limiter->allow("shared")) ++allowed;
        });
    for (auto &th : threads) th.join();
    EXPECT_EQ(allowed.load(), 50);
}

TEST(UnlimitedRateLimiterTest, AlwaysAllows) {
    unlimited_rate_limiter limiter;
    for (int i = 0; i < 10000; ++i)
        ASSERT_TRUE(limiter.allow("a"));
}

TEST(MakeRateLimiterTest, DisabledMeansUnlimited) {
    rate_limit_config config;
    config.enabled = false;
    config.requests = 1;
    auto limiter = make_rate_limiter(config);
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_TRUE(limiter->allow("a"));

    config.enabled = true;
    limiter = make_rate_limiter(config);
    EXPECT_TRUE(limiter->allow("a"));
    EXPECT_FALSE(limiter->allow("a"));
}
