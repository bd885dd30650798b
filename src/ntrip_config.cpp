#include "gnss_rtk_bridge/ntrip_config.hpp"
#include "gnss_rtk_bridge/rtcm_framing.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace gnss_rtk_bridge {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hexDigit(in[i + 1]);
            const int lo = hexDigit(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

uint16_t parsePort(const std::string &text, const std::string &uri) {
    if (text.empty()) return 2101;
    char *end = nullptr;
    const long port = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size() || port <= 0 || port > 65535) {
        throw std::invalid_argument("invalid port in caster URI: " + uri);
    }
    return static_cast<uint16_t>(port);
}

} // namespace

const char *toString(NtripProtocol protocol) {
    switch (protocol) {
        case NtripProtocol::Legacy: return "legacy";
        case NtripProtocol::Http: return "http";
    }
    return "unknown";
}

NtripProtocol protocolFromString(const std::string &name) {
    if (name == "legacy") return NtripProtocol::Legacy;
    if (name == "http") return NtripProtocol::Http;
    throw std::invalid_argument("unknown NTRIP protocol version '" + name + "' (expected http or legacy)");
}

//------------------------- URI -------------------------
NtripConfig NtripConfig::fromUri(const std::string &uri) {
    NtripConfig config;
    std::string rest;
    if (uri.rfind("ntrip1://", 0) == 0) {
        config.protocol = NtripProtocol::Legacy;
        rest = uri.substr(9);
    } else if (uri.rfind("ntrip://", 0) == 0) {
        config.protocol = NtripProtocol::Http;
        rest = uri.substr(8);
    } else {
        throw std::invalid_argument("caster URI must start with ntrip:// or ntrip1://: " + uri);
    }

    std::string authority = rest;
    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        config.mountpoint = percentDecode(rest.substr(slash + 1));
    }

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        const std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        const auto colon = userinfo.find(':');
        config.username = percentDecode(userinfo.substr(0, colon));
        if (colon != std::string::npos) config.password = percentDecode(userinfo.substr(colon + 1));
    }

    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) throw std::invalid_argument("unterminated IPv6 address in " + uri);
        config.host = authority.substr(1, close - 1);
        const std::string after = authority.substr(close + 1);
        if (!after.empty() && after[0] != ':') throw std::invalid_argument("invalid caster URI: " + uri);
        config.port = parsePort(after.empty() ? std::string() : after.substr(1), uri);
    } else {
        const auto colon = authority.find(':');
        config.host = authority.substr(0, colon);
        config.port = parsePort(colon == std::string::npos ? std::string() : authority.substr(colon + 1), uri);
    }

    if (config.host.empty()) throw std::invalid_argument("caster URI has no host: " + uri);
    return config;
}

//------------------------- Validation -------------------------
void NtripConfig::validate() const {
    if (host.empty()) throw std::invalid_argument("host must not be empty");
    if (port == 0) throw std::invalid_argument("port must not be 0");
    if (mountpoint.empty()) throw std::invalid_argument("mountpoint must not be empty");
    for (char c : mountpoint) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("mountpoint must not contain whitespace");
        }
    }
    if (protocol == NtripProtocol::Legacy && password.empty()) {
        throw std::invalid_argument("legacy protocol needs a password");
    }
    if (!(connect_timeout_seconds > 0.0)) throw std::invalid_argument("connect_timeout_seconds must be > 0");
    if (!(idle_timeout_seconds > 0.0)) throw std::invalid_argument("idle_timeout_seconds must be > 0");
    if (!(backoff_base_seconds >= 0.0)) throw std::invalid_argument("backoff_base_seconds must be >= 0");
    if (!(backoff_cap_seconds >= backoff_base_seconds)) {
        throw std::invalid_argument("backoff_cap_seconds must be >= backoff_base_seconds");
    }
    if (max_reconnect_attempts < 0) throw std::invalid_argument("max_reconnect_attempts must be >= 0");
    if (!(gga_interval_seconds >= 0.0)) throw std::invalid_argument("gga_interval_seconds must be >= 0");
    if (max_rtcm_payload_length == 0 || max_rtcm_payload_length > kRtcm3MaxPayloadLength) {
        throw std::invalid_argument("max_rtcm_payload_length must be within 1..1023");
    }
}

double NtripConfig::backoffDelay(int attempt) const {
    if (attempt < 1) return 0.0;
    const int exponent = attempt - 1 > 62 ? 62 : attempt - 1;
    return std::min(backoff_base_seconds * std::ldexp(1.0, exponent), backoff_cap_seconds);
}

//------------------------- Handshake -------------------------
std::string NtripConfig::request() const {
    std::ostringstream req;
    if (protocol == NtripProtocol::Legacy) {
        req << "SOURCE " << password << " /" << mountpoint << "\r\n";
        req << "Source-Agent: NTRIP " << user_agent << "\r\n";
        req << "\r\n";
        return req.str();
    }

    req << "GET /" << mountpoint << " HTTP/1.1\r\n";
    req << "Host: " << host << "\r\n";
    req << "Ntrip-Version: Ntrip/2.0\r\n";
    req << "User-Agent: NTRIP " << user_agent << "\r\n";
    req << "Accept: */*\r\n";
    if (!username.empty()) {
        req << "Authorization: Basic " << base64Encode(username + ":" + password) << "\r\n";
    }
    req << "Connection: close\r\n\r\n";
    return req.str();
}

std::string base64Encode(const std::string &in) {
    static const char *b64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    uint32_t val = 0;
    int valb = -6;
    for (unsigned char c : in) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            out.push_back(b64[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) out.push_back(b64[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

} // namespace gnss_rtk_bridge
