#pragma once

#include "gnss_rtk_bridge/cancellation.hpp"
#include "gnss_rtk_bridge/http_dechunker.hpp"
#include "gnss_rtk_bridge/ntrip_config.hpp"
#include "gnss_rtk_bridge/tcp_transport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gnss_rtk_bridge {

enum class NtripState {
    Disconnected,
    Connecting,
    AwaitingResponse,
    Streaming,
    Reconnecting
};

const char *toString(NtripState state);

/// One connection attempt to a caster. The client replaces the session on
/// every reconnect; a session never goes back to an earlier state.
class NtripSession {
public:
    using Clock = std::chrono::steady_clock;

    NtripSession(const NtripConfig &config, int attempt);

    NtripSession(const NtripSession &) = delete;
    NtripSession &operator=(const NtripSession &) = delete;

    // Connecting: TCP connect and handshake request.
    void connect(const CancellationToken &token);

    // AwaitingResponse -> Streaming. Returns the body bytes that arrived
    // together with the response head. Throws AuthenticationError or
    // NotFoundError for a rejection, ConnectionError or TimeoutError
    // otherwise.
    std::vector<uint8_t> awaitResponse(const CancellationToken &token);

    // Waits at most `max_wait` for body bytes; an empty result means the wait
    // ran out while the idle window is still open. Throws TimeoutError once
    // nothing arrived for the whole idle window and ConnectionError on EOF.
    std::vector<uint8_t> readBody(Seconds max_wait, const CancellationToken &token);

    void send(const std::string &data, const CancellationToken &token);

    void close();

    const NtripConfig &config() const { return config_; }
    int attempt() const { return attempt_; }
    NtripState state() const { return state_; }
    Clock::time_point lastByteTime() const { return last_byte_; }
    bool chunked() const { return dechunker_.has_value(); }

private:
    std::vector<uint8_t> acceptBody(const std::string &bytes);
    std::vector<uint8_t> acceptBody(const uint8_t *data, std::size_t size);

    NtripConfig config_;
    int attempt_;
    NtripState state_ = NtripState::Disconnected;
    TcpTransport transport_;
    std::optional<ChunkedDecoder> dechunker_;
    Clock::time_point last_byte_;
};

} // namespace gnss_rtk_bridge
