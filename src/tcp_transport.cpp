#include "gnss_rtk_bridge/tcp_transport.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>

#include <rclcpp/rclcpp.hpp>

#include <cerrno>
#include <cstring>
#include <memory>

namespace gnss_rtk_bridge {

namespace {

rclcpp::Logger logger() { return rclcpp::get_logger("gnss_rtk_bridge.ntrip"); }

std::string errnoText(const char *what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// Closes a socket unless ownership was released.
struct SocketGuard {
    int fd;
    ~SocketGuard() { if (fd >= 0) ::close(fd); }
    int release() { const int out = fd; fd = -1; return out; }
};

} // namespace

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::close() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

//------------------------- Connect -------------------------
void TcpTransport::connect(const std::string &host, uint16_t port, Seconds timeout,
                           const CancellationToken &token) {
    close();

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    const std::string port_str = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        throw ConnectionError("getaddrinfo failed for " + host + ":" + port_str + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(res, &freeaddrinfo);

    std::string last_error = "no usable address";
    bool timed_out = false;
    for (auto p = res; p != nullptr; p = p->ai_next) {
        SocketGuard sock{::socket(p->ai_family, p->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, p->ai_protocol)};
        if (sock.fd == -1) {
            last_error = errnoText("socket");
            continue;
        }

        if (::connect(sock.fd, p->ai_addr, p->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last_error = errnoText("connect");
                continue;
            }
            if (waitForEvent(sock.fd, POLLOUT, timeout, token) == WaitResult::Timeout) {
                last_error = "connect timed out";
                timed_out = true;
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
                last_error = errnoText("getsockopt");
                continue;
            }
            if (so_error != 0) {
                last_error = std::string("connect: ") + std::strerror(so_error);
                continue;
            }
        }

        fd_ = sock.release();
        peer_ = host + ":" + port_str;
        RCLCPP_INFO(logger(), "Connected to %s", peer_.c_str());
        return;
    }

    if (timed_out) throw TimeoutError("connecting to " + host + ":" + port_str + ": " + last_error);
    throw ConnectionError("connecting to " + host + ":" + port_str + ": " + last_error);
}

//------------------------- I/O -------------------------
void TcpTransport::writeAll(const std::string &data, Seconds timeout, const CancellationToken &token) {
    if (fd_ < 0) throw ConnectionError("write on closed transport");

    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (waitForEvent(fd_, POLLOUT, timeout, token) == WaitResult::Timeout) {
                throw TimeoutError("write to " + peer_ + " timed out");
            }
            continue;
        }
        throw ConnectionError(errnoText("send"));
    }
}

bool TcpTransport::waitReadable(Seconds timeout, const CancellationToken &token) {
    if (fd_ < 0) throw ConnectionError("wait on closed transport");
    return waitForEvent(fd_, POLLIN, timeout, token) == WaitResult::Ready;
}

std::size_t TcpTransport::read(uint8_t *buffer, std::size_t capacity, Seconds timeout,
                               const CancellationToken &token) {
    if (fd_ < 0) throw ConnectionError("read on closed transport");

    while (true) {
        const ssize_t n = ::recv(fd_, buffer, capacity, 0);
        if (n >= 0) return static_cast<std::size_t>(n);
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw ConnectionError(errnoText("recv"));
        }
        if (waitForEvent(fd_, POLLIN, timeout, token) == WaitResult::Timeout) {
            throw TimeoutError("no data from " + peer_ + " within " + std::to_string(timeout.count()) + " s");
        }
    }
}

} // namespace gnss_rtk_bridge
