#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace gnss_rtk_bridge {
namespace test {

/// One accepted client connection, handed to the caster script.
class CasterConnection {
public:
    CasterConnection(int fd, std::string request, const std::atomic<bool> &stopping)
    : fd_(fd), request_(std::move(request)), stopping_(stopping)
    {
    }

    const std::string &request() const { return request_; }

    void send(const std::string &data) {
        std::size_t sent = 0;
        while (sent < data.size()) {
            const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<std::size_t>(n);
        }
    }
    void send(const std::vector<uint8_t> &data) { send(std::string(data.begin(), data.end())); }

    // Reads until `marker` shows up, the peer closes, the caster stops or
    // `timeout` runs out. Returns everything read.
    std::string readUntil(const std::string &marker, std::chrono::milliseconds timeout) {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (out.find(marker) == std::string::npos && !stopping_.load() &&
               std::chrono::steady_clock::now() < deadline) {
            if (!readSome(out)) break;
        }
        return out;
    }

    // Keeps the connection open without sending until the peer closes it or
    // the caster stops.
    void holdOpen() {
        std::string ignored;
        while (!stopping_.load()) {
            if (!readSome(ignored)) return;
            ignored.clear();
        }
    }

private:
    // False once the peer closed the connection.
    bool readSome(std::string &out) {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 20) <= 0) return true;
        char buf[1024];
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        out.append(buf, static_cast<std::size_t>(n));
        return true;
    }

    int fd_;
    std::string request_;
    const std::atomic<bool> &stopping_;
};

/// Loopback TCP server standing in for an NTRIP caster. Each accepted
/// connection reads the request head and then runs `script` on it; the
/// connection is closed when the script returns.
class FakeCaster {
public:
    using Script = std::function<void(CasterConnection &connection, int index)>;

    explicit FakeCaster(Script script) : script_(std::move(script)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");
        const int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~FakeCaster() {
        stopping_.store(true);
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    FakeCaster(const FakeCaster &) = delete;
    FakeCaster &operator=(const FakeCaster &) = delete;

    uint16_t port() const { return port_; }
    int connections() const { return connections_.load(); }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (!stopping_.load()) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0) continue;
            const int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;

            const int index = connections_.fetch_add(1);
            CasterConnection head_reader(fd, {}, stopping_);
            std::string head = head_reader.readUntil("\r\n\r\n", std::chrono::milliseconds(2000));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(head);
            }
            CasterConnection connection(fd, head, stopping_);
            script_(connection, index);
            ::shutdown(fd, SHUT_RDWR);
            ::close(fd);
        }
    }

    Script script_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<int> connections_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

} // namespace test
} // namespace gnss_rtk_bridge
