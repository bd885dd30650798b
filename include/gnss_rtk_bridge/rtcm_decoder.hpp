#pragma once

#include "gnss_rtk_bridge/rtcm_framing.hpp"
#include "gnss_rtk_bridge/rtcm_messages.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace gnss_rtk_bridge {

enum class RtcmFrameError {
    Crc,
    Field
};

const char *toString(RtcmFrameError error);

/// Incremental RTCM3 frame decoder. Bytes may arrive in arbitrary chunks;
/// complete frames are handed out in stream order. A frame failing its CRC
/// costs exactly one byte of the stream, after which the decoder rescans.
class Rtcm3Decoder {
public:
    struct Stats {
        std::size_t frames = 0;
        std::size_t crc_errors = 0;
        std::size_t field_errors = 0;
        std::size_t skipped_bytes = 0;
    };

    using MessageHandler = std::function<void(RtcmMessage)>;
    using ErrorHandler = std::function<void(RtcmFrameError, const std::string &)>;

    explicit Rtcm3Decoder(std::size_t max_payload_length = kRtcm3MaxPayloadLength);

    void feed(const uint8_t *data, std::size_t size, const MessageHandler &handler);
    void feed(const std::vector<uint8_t> &data, const MessageHandler &handler) {
        feed(data.data(), data.size(), handler);
    }

    void setErrorHandler(ErrorHandler handler) { error_handler_ = std::move(handler); }

    // Drops buffered bytes; stats are kept.
    void reset();

    const Stats &stats() const { return stats_; }
    std::size_t buffered() const { return buffer_.size() - offset_; }

private:
    void reportError(RtcmFrameError error, const std::string &message);

    std::size_t max_payload_length_;
    std::vector<uint8_t> buffer_;
    std::size_t offset_ = 0;
    Stats stats_;
    ErrorHandler error_handler_;
};

} // namespace gnss_rtk_bridge
