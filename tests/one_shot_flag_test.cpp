#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "test_util.h"
#include "one_shot_flag.h"

namespace tunnel
{

TEST(one_shot_flag_test, StartsOpen)
{
    one_shot_flag flag;
    EXPECT_FALSE(flag.is_closed());
    EXPECT_FALSE(flag.wait_for(std::chrono::milliseconds(1)));
}

TEST(one_shot_flag_test, CloseIsIdempotent)
{
    one_shot_flag flag;
    EXPECT_TRUE(flag.close());
    EXPECT_TRUE(flag.is_closed());
    EXPECT_FALSE(flag.close());
    EXPECT_FALSE(flag.close());
    EXPECT_TRUE(flag.is_closed());
}

TEST(one_shot_flag_test, WaitReturnsImmediatelyOnceClosed)
{
    one_shot_flag flag;
    flag.close();
    flag.wait();
    EXPECT_TRUE(flag.wait_for(std::chrono::milliseconds(0)));
}

TEST(one_shot_flag_test, WaitBlocksUntilAnotherThreadCloses)
{
    one_shot_flag flag;
    std::atomic<bool> woke{false};
    std::thread waiter(
        [&]
        {
            flag.wait();
            woke = true;
        });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(woke.load());
    flag.close();
    waiter.join();
    EXPECT_TRUE(woke.load());
}

TEST(one_shot_flag_test, WaitForTimesOutWhileOpen)
{
    one_shot_flag flag;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(flag.wait_for(std::chrono::milliseconds(30)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(one_shot_flag_test, ConcurrentClosesTransitionExactlyOnce)
{
    one_shot_flag flag;
    std::atomic<int> transitions{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back(
            [&]
            {
                while (!go.load())
                {
                    std::this_thread::yield();
                }
                if (flag.close())
                {
                    transitions++;
                }
            });
    }
    go = true;
    for (auto& t : threads)
    {
        t.join();
    }
    EXPECT_EQ(transitions.load(), 1);
}

TEST(one_shot_flag_test, CloseWakesEveryWaiter)
{
    one_shot_flag flag;
    std::atomic<int> woke{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i)
    {
        waiters.emplace_back(
            [&]
            {
                flag.wait();
                woke++;
            });
    }
    flag.close();
    for (auto& t : waiters)
    {
        t.join();
    }
    EXPECT_EQ(woke.load(), 4);
}

TEST(one_shot_flag_test, WritesBeforeCloseAreVisibleAfterWait)
{
    one_shot_flag flag;
    int payload = 0;
    std::thread writer(
        [&]
        {
            payload = 42;
            flag.close();
        });
    flag.wait();
    EXPECT_EQ(payload, 42);
    writer.join();
}

}    // namespace tunnel
