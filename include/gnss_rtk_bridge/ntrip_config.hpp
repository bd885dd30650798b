#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gnss_rtk_bridge {

enum class NtripProtocol {
    Legacy,  // NTRIP 1 style "SOURCE" handshake
    Http     // NTRIP 2 over HTTP/1.1
};

const char *toString(NtripProtocol protocol);
// "legacy" / "http"; throws std::invalid_argument otherwise.
NtripProtocol protocolFromString(const std::string &name);

struct NtripConfig {
    std::string host;
    uint16_t port = 2101;
    std::string mountpoint;
    std::string username;
    std::string password;
    NtripProtocol protocol = NtripProtocol::Http;
    std::string user_agent = "gnss_rtk_bridge/1.0";

    double connect_timeout_seconds = 10.0;
    double idle_timeout_seconds = 30.0;
    double backoff_base_seconds = 1.0;
    double backoff_cap_seconds = 60.0;
    int max_reconnect_attempts = 0;  // 0 = retry forever
    double gga_interval_seconds = 60.0;  // 0 = never upload GGA
    std::size_t max_rtcm_payload_length = 1023;

    /// ntrip://[user[:pass]@]host[:port]/mountpoint, or ntrip1:// for the
    /// legacy handshake. Throws std::invalid_argument.
    static NtripConfig fromUri(const std::string &uri);

    /// Throws std::invalid_argument naming the first inconsistent value.
    void validate() const;

    /// min(base * 2^(attempt-1), cap) for attempt >= 1.
    double backoffDelay(int attempt) const;

    std::string request() const;
};

std::string base64Encode(const std::string &in);

} // namespace gnss_rtk_bridge
