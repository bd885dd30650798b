#include "gnss_rtk_bridge/ntrip_session.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace gnss_rtk_bridge {

namespace {

constexpr std::size_t kMaxResponseHead = 8192;
constexpr std::size_t kReadBufferSize = 4096;

rclcpp::Logger logger() { return rclcpp::get_logger("gnss_rtk_bridge.ntrip"); }

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool startsWith(const std::string &s, const char *prefix) {
    return s.rfind(prefix, 0) == 0;
}

// Value of header `name` (lower case) in an HTTP head, empty if absent.
std::string headerValue(const std::string &head, const std::string &name) {
    std::size_t pos = head.find('\n');
    while (pos != std::string::npos && pos + 1 < head.size()) {
        const std::size_t end = head.find('\n', pos + 1);
        const std::string line = head.substr(pos + 1, end == std::string::npos ? std::string::npos : end - pos - 1);
        const auto colon = line.find(':');
        if (colon != std::string::npos && lower(trim(line.substr(0, colon))) == name) {
            return trim(line.substr(colon + 1));
        }
        pos = end;
    }
    return {};
}

// Throws for every HTTP status other than 200.
void checkHttpStatus(const std::string &status) {
    const auto space = status.find(' ');
    const int code = space == std::string::npos ? 0 : std::atoi(status.c_str() + space + 1);
    if (code == 401 || code == 403) throw AuthenticationError("caster rejected credentials: " + status);
    if (code == 404) throw NotFoundError("mountpoint not found: " + status);
    if (code != 200) throw ConnectionError("unexpected caster response: " + status);
}

} // namespace

const char *toString(NtripState state) {
    switch (state) {
        case NtripState::Disconnected: return "disconnected";
        case NtripState::Connecting: return "connecting";
        case NtripState::AwaitingResponse: return "awaiting-response";
        case NtripState::Streaming: return "streaming";
        case NtripState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

NtripSession::NtripSession(const NtripConfig &config, int attempt)
: config_(config), attempt_(attempt), last_byte_(Clock::now())
{
}

void NtripSession::close() {
    transport_.close();
    dechunker_.reset();
    state_ = NtripState::Disconnected;
}

//------------------------- Connect -------------------------
void NtripSession::connect(const CancellationToken &token) {
    state_ = NtripState::Connecting;
    const Seconds timeout(config_.connect_timeout_seconds);
    transport_.connect(config_.host, config_.port, timeout, token);
    transport_.writeAll(config_.request(), timeout, token);
    last_byte_ = Clock::now();
    state_ = NtripState::AwaitingResponse;
    RCLCPP_DEBUG(logger(), "Sent %s request for /%s (attempt %d)", toString(config_.protocol),
                 config_.mountpoint.c_str(), attempt_);
}

//------------------------- Response -------------------------
std::vector<uint8_t> NtripSession::awaitResponse(const CancellationToken &token) {
    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                             Seconds(config_.idle_timeout_seconds));
    std::string head;
    uint8_t buf[kReadBufferSize];

    while (true) {
        const auto eol = head.find('\n');
        if (eol != std::string::npos) {
            const std::string status = trim(head.substr(0, eol));
            std::string rest = head.substr(eol + 1);

            if (startsWith(status, "HTTP/")) {
                auto end = head.find("\r\n\r\n");
                std::size_t sep = 4;
                if (end == std::string::npos) {
                    end = head.find("\n\n");
                    sep = 2;
                }
                if (end != std::string::npos) {
                    checkHttpStatus(status);
                    const std::string block = head.substr(0, end);

                    const std::string content_type = lower(headerValue(block, "content-type"));
                    if (content_type.find("gnss/sourcetable") != std::string::npos) {
                        throw NotFoundError("caster answered with its source table for /" + config_.mountpoint);
                    }
                    if (lower(headerValue(block, "transfer-encoding")).find("chunked") != std::string::npos) {
                        dechunker_.emplace();
                    }
                    state_ = NtripState::Streaming;
                    RCLCPP_INFO(logger(), "Streaming /%s from %s (%s%s)", config_.mountpoint.c_str(),
                                transport_.peer().c_str(), status.c_str(), dechunker_ ? ", chunked" : "");
                    return acceptBody(head.substr(end + sep));
                }
            } else if (startsWith(status, "ICY 200") || status == "OK" || startsWith(status, "OK ")) {
                // ICY casters may close the status line with an empty line
                if (startsWith(rest, "\r\n")) rest.erase(0, 2);
                state_ = NtripState::Streaming;
                RCLCPP_INFO(logger(), "Streaming /%s from %s (%s)", config_.mountpoint.c_str(),
                            transport_.peer().c_str(), status.c_str());
                return acceptBody(rest);
            } else if (startsWith(status, "SOURCETABLE")) {
                throw NotFoundError("caster answered with its source table for /" + config_.mountpoint);
            } else if (startsWith(status, "ERROR")) {
                const std::string text = lower(status);
                if (text.find("mount") != std::string::npos) throw NotFoundError("caster: " + status);
                throw AuthenticationError("caster: " + status);
            } else {
                throw ConnectionError("unexpected caster response: " + status);
            }
        }

        if (head.size() > kMaxResponseHead) throw ConnectionError("caster response head too long");
        const Seconds left = deadline - Clock::now();
        if (left.count() <= 0) throw TimeoutError("no response from caster within the idle window");
        const std::size_t n = transport_.read(buf, sizeof(buf), left, token);
        if (n == 0) {
            // A rejection may be closed before its head is complete
            const auto eol_at_eof = head.find('\n');
            if (eol_at_eof != std::string::npos && startsWith(head, "HTTP/")) {
                checkHttpStatus(trim(head.substr(0, eol_at_eof)));
            }
            throw ConnectionError("caster closed the connection before responding");
        }
        last_byte_ = Clock::now();
        head.append(buf, buf + n);
    }
}

//------------------------- Body -------------------------
std::vector<uint8_t> NtripSession::readBody(Seconds max_wait, const CancellationToken &token) {
    const Seconds idle(config_.idle_timeout_seconds);
    const Seconds idle_left = idle - (Clock::now() - last_byte_);
    if (idle_left.count() <= 0) {
        throw TimeoutError("no data from caster for " + std::to_string(idle.count()) + " s");
    }

    if (!transport_.waitReadable(std::min(max_wait, idle_left), token)) {
        if (Clock::now() - last_byte_ >= idle) {
            throw TimeoutError("no data from caster for " + std::to_string(idle.count()) + " s");
        }
        return {};
    }

    uint8_t buf[kReadBufferSize];
    const std::size_t n = transport_.read(buf, sizeof(buf), idle, token);
    if (n == 0) throw ConnectionError("caster closed the stream");
    last_byte_ = Clock::now();
    return acceptBody(buf, n);
}

std::vector<uint8_t> NtripSession::acceptBody(const std::string &bytes) {
    const std::vector<uint8_t> data(bytes.begin(), bytes.end());
    return acceptBody(data.data(), data.size());
}

std::vector<uint8_t> NtripSession::acceptBody(const uint8_t *data, std::size_t size) {
    if (!dechunker_) return std::vector<uint8_t>(data, data + size);

    std::vector<uint8_t> out;
    dechunker_->feed(data, size, out);
    if (dechunker_->finished() && out.empty()) {
        throw ConnectionError("caster ended the chunked stream");
    }
    return out;
}

void NtripSession::send(const std::string &data, const CancellationToken &token) {
    transport_.writeAll(data, Seconds(config_.idle_timeout_seconds), token);
}

} // namespace gnss_rtk_bridge
