#include "gnss_rtk_bridge/cancellation.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <gtest/gtest.h>

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace gnss_rtk_bridge;
using namespace std::chrono_literals;

TEST(CancellationToken, SleepRunsToItsDeadline) {
    CancellationToken token;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(sleepFor(Seconds(0.02), token));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(CancellationToken, CancelledTokenThrowsUntilReset) {
    CancellationToken token;
    token.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_THROW(sleepFor(Seconds(0.0), token), OperationCancelled);

    token.reset();
    EXPECT_FALSE(token.cancelled());
    EXPECT_NO_THROW(sleepFor(Seconds(0.0), token));
}

TEST(CancellationToken, VeryLongSleepIsCancellable) {
    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(sleepFor(Seconds(1e7), token), OperationCancelled);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(WaitForEvent, VeryLongTimeoutSeesReadableDescriptor) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const char byte = 'x';
    ASSERT_EQ(::write(fds[1], &byte, 1), 1);

    CancellationToken token;
    EXPECT_EQ(waitForEvent(fds[0], POLLIN, Seconds(1e7), token), WaitResult::Ready);
    EXPECT_EQ(waitForEvent(-1, 0, Seconds(0.01), token), WaitResult::Timeout);

    ::close(fds[0]);
    ::close(fds[1]);
}
