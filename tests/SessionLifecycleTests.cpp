#include "session/SessionLifecycle.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using wsgate::session::SessionLifecycle;
using wsgate::test::LogCapture;

TEST(SessionLifecycle, UnlimitedModeAdmitsEveryone)
{
    LogCapture logs;
    SessionLifecycle lc(false, logs.Make());

    int exits = 0;
    lc.SetExitCallback([&exits] { exits++; });

    EXPECT_FALSE(lc.RunOnce());
    EXPECT_TRUE(lc.TryAdmit());
    EXPECT_TRUE(lc.TryAdmit());
    EXPECT_FALSE(lc.IsShuttingDown());
    EXPECT_EQ(lc.ActiveSessions(), 2u);

    lc.OnSessionClosed();
    lc.OnSessionClosed();

    EXPECT_EQ(lc.ActiveSessions(), 0u);
    EXPECT_EQ(lc.AdmittedSessions(), 2u);
    EXPECT_EQ(exits, 0);
}

TEST(SessionLifecycle, RunOnceAdmitsOneAndExitsAfterClose)
{
    LogCapture logs;
    SessionLifecycle lc(true, logs.Make());

    int exits = 0;
    lc.SetExitCallback([&exits] { exits++; });

    EXPECT_TRUE(lc.RunOnce());
    EXPECT_FALSE(lc.IsShuttingDown());
    EXPECT_TRUE(lc.TryAdmit());
    EXPECT_TRUE(lc.IsShuttingDown());
    EXPECT_FALSE(lc.TryAdmit());
    EXPECT_EQ(exits, 0);

    lc.OnSessionClosed();
    EXPECT_EQ(exits, 1);
    EXPECT_TRUE(logs.Contains("run once, exiting"));
}

TEST(SessionLifecycle, ExitCallbackFiresOnce)
{
    LogCapture logs;
    SessionLifecycle lc(true, logs.Make());

    int exits = 0;
    lc.SetExitCallback([&exits] { exits++; });

    ASSERT_TRUE(lc.TryAdmit());
    lc.OnSessionClosed();
    lc.OnSessionClosed();

    EXPECT_EQ(exits, 1);
}

TEST(SessionLifecycle, ConcurrentAdmissionAdmitsAtMostOne)
{
    LogCapture logs;
    SessionLifecycle lc(true, logs.Make(wsgate::bridge::LogMask::Error));

    std::atomic<int> admitted{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < 16; i++)
    {
        threads.emplace_back([&]
        {
            while (!go.load())
                std::this_thread::yield();
            if (lc.TryAdmit())
                admitted++;
        });
    }

    go.store(true);
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(admitted.load(), 1);
    EXPECT_EQ(lc.AdmittedSessions(), 1u);
}
