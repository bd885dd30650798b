#include "gnss_rtk_bridge/rtcm_decoder.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gnss_rtk_bridge {

namespace {

rclcpp::Logger logger() { return rclcpp::get_logger("gnss_rtk_bridge.rtcm"); }

} // namespace

const char *toString(RtcmFrameError error) {
    switch (error) {
        case RtcmFrameError::Crc: return "crc";
        case RtcmFrameError::Field: return "field";
    }
    return "unknown";
}

Rtcm3Decoder::Rtcm3Decoder(std::size_t max_payload_length)
: max_payload_length_(max_payload_length)
{
    if (max_payload_length_ > kRtcm3MaxPayloadLength) {
        throw std::invalid_argument("max payload length above 1023 bytes");
    }
}

void Rtcm3Decoder::reset() {
    buffer_.clear();
    offset_ = 0;
}

void Rtcm3Decoder::reportError(RtcmFrameError error, const std::string &message) {
    RCLCPP_DEBUG(logger(), "dropped RTCM3 frame (%s): %s", toString(error), message.c_str());
    if (error_handler_) error_handler_(error, message);
}

//------------------------- Feed -------------------------
void Rtcm3Decoder::feed(const uint8_t *data, std::size_t size, const MessageHandler &handler) {
    // Compact before growing
    if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
        offset_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + size);

    while (offset_ < buffer_.size()) {
        const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_);
        const auto preamble = std::find(begin, buffer_.end(), kRtcm3Preamble);
        const auto skipped = static_cast<std::size_t>(preamble - begin);
        stats_.skipped_bytes += skipped;
        offset_ += skipped;
        if (preamble == buffer_.end()) break;

        if (buffer_.size() - offset_ < kRtcm3HeaderLength) break;
        const uint8_t *frame = buffer_.data() + offset_;
        const std::size_t length = (static_cast<std::size_t>(frame[1] & 0x03) << 8) | frame[2];
        if ((frame[1] & 0xFC) != 0 || length > max_payload_length_) {
            // False preamble
            ++stats_.skipped_bytes;
            ++offset_;
            continue;
        }

        const std::size_t total = kRtcm3HeaderLength + length + kRtcm3CrcLength;
        if (buffer_.size() - offset_ < total) break;

        try {
            checkRtcm3Crc(frame, length);
        } catch (const CrcError &ex) {
            ++stats_.crc_errors;
            ++offset_;
            reportError(RtcmFrameError::Crc, ex.what());
            continue;
        }

        RtcmMessage message;
        message.frame.assign(frame, frame + total);
        message.bit_length = length * 8;
        offset_ += total;
        try {
            if (length < 2) throw FieldBoundsError("payload too short for a message number");
            const uint8_t *payload = message.frame.data() + kRtcm3HeaderLength;
            message.type = static_cast<uint16_t>((payload[0] << 4) | (payload[1] >> 4));
            message.body = decodeRtcm3Payload(message.type, payload, length);
        } catch (const ParseError &ex) {
            ++stats_.field_errors;
            reportError(RtcmFrameError::Field, "type " + std::to_string(message.type) + ": " + ex.what());
            continue;
        }

        ++stats_.frames;
        handler(std::move(message));
    }

    if (offset_ == buffer_.size()) reset();
}

} // namespace gnss_rtk_bridge
