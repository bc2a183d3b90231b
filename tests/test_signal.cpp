#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "util/signal.hpp"

using namespace std::chrono_literals;

TEST(Signal, ListenReplaysCurrentValue)
{
    gattlink::Signal<int> s(7);
    std::vector<int>      seen;
    auto                  l = s.listen([&](const int &v) { seen.push_back(v); });
    s.set(8);
    s.update([](const int &v) { return v + 1; });

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], 7);
    EXPECT_EQ(seen[1], 8);
    EXPECT_EQ(seen[2], 9);
    EXPECT_EQ(s.value(), 9);
}

TEST(Signal, ResetStopsDelivery)
{
    gattlink::Signal<int> s(0);
    int                   calls = 0;
    auto                  l     = s.listen([&](const int &) { ++calls; });
    l.reset();
    s.set(1);
    EXPECT_EQ(calls, 1);  // only the replay
}

TEST(Signal, WaitUntilSeesLaterValue)
{
    gattlink::Signal<bool> ready(false);
    std::thread            th([&] {
        std::this_thread::sleep_for(20ms);
        ready.set(true);
    });
    bool out = false;
    EXPECT_TRUE(ready.wait_until([](bool v) { return v; }, gattlink::CancelToken{}, &out));
    EXPECT_TRUE(out);
    th.join();
}

TEST(Signal, WaitUntilCancelled)
{
    gattlink::Signal<bool>   ready(false);
    gattlink::CancelSource   src;
    std::atomic<bool>        returned{false};
    bool                     ok = true;
    std::thread              th([&] {
        ok = ready.wait_until([](bool v) { return v; }, src.token());
        returned.store(true);
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(returned.load());
    src.cancel();
    th.join();
    EXPECT_FALSE(ok);
}

TEST(Signal, WaitForIsBounded)
{
    gattlink::Signal<bool> up(true);
    EXPECT_FALSE(up.wait_for([](bool v) { return !v; }, 20ms));

    std::thread th([&] {
        std::this_thread::sleep_for(10ms);
        up.set(false);
    });
    EXPECT_TRUE(up.wait_for([](bool v) { return !v; }, 2s));
    th.join();
}
