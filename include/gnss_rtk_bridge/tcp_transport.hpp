#pragma once

#include "gnss_rtk_bridge/cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace gnss_rtk_bridge {

/// Blocking-style TCP stream on top of a non-blocking socket. Every wait goes
/// through waitForEvent(), so each call observes the cancellation token.
class TcpTransport {
public:
    TcpTransport() = default;
    ~TcpTransport();

    TcpTransport(const TcpTransport &) = delete;
    TcpTransport &operator=(const TcpTransport &) = delete;

    // Tries every resolved address in turn. Throws ConnectionError,
    // TimeoutError or OperationCancelled.
    void connect(const std::string &host, uint16_t port, Seconds timeout, const CancellationToken &token);

    void writeAll(const std::string &data, Seconds timeout, const CancellationToken &token);

    // Returns 0 on an orderly shutdown by the peer. Throws TimeoutError when
    // nothing arrives within `timeout`.
    std::size_t read(uint8_t *buffer, std::size_t capacity, Seconds timeout, const CancellationToken &token);

    // True once a read would not block (data, EOF or error).
    bool waitReadable(Seconds timeout, const CancellationToken &token);

    void close();
    bool isOpen() const { return fd_ >= 0; }

    const std::string &peer() const { return peer_; }

private:
    int fd_ = -1;
    std::string peer_;
};

} // namespace gnss_rtk_bridge
