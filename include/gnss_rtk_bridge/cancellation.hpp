#pragma once

#include <atomic>
#include <chrono>

namespace gnss_rtk_bridge {

using Seconds = std::chrono::duration<double>;

/// Cancellation signal backed by an eventfd, so it can be polled together
/// with a socket. cancel() may be called from any thread.
class CancellationToken {
public:
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Re-arms the token for another run.
    void reset();

    int fd() const { return fd_; }

private:
    int fd_ = -1;
    std::atomic<bool> cancelled_{false};
};

enum class WaitResult {
    Ready,
    Timeout
};

/// Waits until `fd` reports one of `events` (POLLIN, POLLOUT) or `timeout`
/// elapses. A negative fd only waits for the timeout. Throws
/// OperationCancelled as soon as the token fires, and ConnectionError when
/// poll itself fails.
WaitResult waitForEvent(int fd, short events, Seconds timeout, const CancellationToken &token);

/// Cancellable sleep.
void sleepFor(Seconds duration, const CancellationToken &token);

} // namespace gnss_rtk_bridge
