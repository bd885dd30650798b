#include "gnss_rtk_bridge/cancellation.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <system_error>

namespace gnss_rtk_bridge {

//------------------------- Token -------------------------
CancellationToken::CancellationToken()
{
    fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

CancellationToken::~CancellationToken() {
    if (fd_ >= 0) ::close(fd_);
}

void CancellationToken::cancel() {
    cancelled_.store(true);
    const uint64_t one = 1;
    // EAGAIN: counter saturated, already signalled
    if (::write(fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        throw std::system_error(errno, std::generic_category(), "eventfd write");
    }
}

void CancellationToken::reset() {
    uint64_t value = 0;
    while (::read(fd_, &value, sizeof(value)) > 0) {
    }
    cancelled_.store(false);
}

//------------------------- Wait -------------------------
WaitResult waitForEvent(int fd, short events, Seconds timeout, const CancellationToken &token) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout);

    while (true) {
        if (token.cancelled()) throw OperationCancelled();

        const Seconds left = deadline - Clock::now();
        // poll() takes int milliseconds; longer waits loop
        const double left_ms = std::ceil(left.count() * 1000.0);
        int timeout_ms = 0;
        if (left_ms >= static_cast<double>(std::numeric_limits<int>::max())) {
            timeout_ms = std::numeric_limits<int>::max();
        } else if (left_ms > 0.0) {
            timeout_ms = static_cast<int>(left_ms);
        }

        pollfd fds[2]{};
        fds[0].fd = token.fd();
        fds[0].events = POLLIN;
        fds[1].fd = fd;  // poll ignores negative descriptors
        fds[1].events = events;

        const int rc = ::poll(fds, 2, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw ConnectionError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (fds[0].revents & POLLIN) throw OperationCancelled();
        if (fd >= 0 && fds[1].revents != 0) return WaitResult::Ready;
        if (rc == 0 && Clock::now() >= deadline) return WaitResult::Timeout;
    }
}

void sleepFor(Seconds duration, const CancellationToken &token) {
    waitForEvent(-1, 0, duration, token);
}

} // namespace gnss_rtk_bridge
