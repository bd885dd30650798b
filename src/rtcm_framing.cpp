#include "gnss_rtk_bridge/rtcm_framing.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <cstdio>

#include <stdexcept>
#include <string>

namespace gnss_rtk_bridge {

namespace {

constexpr uint32_t kCrc24qPoly = 0x1864CFB;

uint32_t crc24qByte(uint32_t crc, uint8_t byte) {
    crc ^= static_cast<uint32_t>(byte) << 16;
    for (int i = 0; i < 8; i++) {
        crc = (crc & 0x800000) ? (crc << 1) ^ kCrc24qPoly : (crc << 1);
    }
    return crc & 0xFFFFFF;
}

} // namespace

uint32_t crc24q(const uint8_t *data, std::size_t size, uint32_t crc) {
    for (std::size_t i = 0; i < size; ++i) crc = crc24qByte(crc, data[i]);
    return crc;
}

void checkRtcm3Crc(const uint8_t *frame, std::size_t length) {
    const uint32_t expected = crc24q(frame, kRtcm3HeaderLength + length);
    const uint8_t *tail = frame + kRtcm3HeaderLength + length;
    const uint32_t received = (static_cast<uint32_t>(tail[0]) << 16) |
                              (static_cast<uint32_t>(tail[1]) << 8) | tail[2];
    if (expected != received) {
        char text[96];
        std::snprintf(text, sizeof(text), "CRC mismatch on frame of %zu bytes (computed %06X, received %06X)",
                      length, static_cast<unsigned>(expected), static_cast<unsigned>(received));
        throw CrcError(text);
    }
}

std::vector<uint8_t> encodeRtcm3Frame(const std::vector<uint8_t> &payload) {
    if (payload.size() > kRtcm3MaxPayloadLength) {
        throw std::invalid_argument("RTCM3 payload too long: " + std::to_string(payload.size()) + " bytes");
    }
    std::vector<uint8_t> frame;
    frame.reserve(kRtcm3HeaderLength + payload.size() + kRtcm3CrcLength);
    frame.push_back(kRtcm3Preamble);
    frame.push_back(static_cast<uint8_t>((payload.size() >> 8) & 0x03));
    frame.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
    frame.insert(frame.end(), payload.begin(), payload.end());

    const uint32_t crc = crc24q(frame.data(), frame.size());
    frame.push_back(static_cast<uint8_t>(crc >> 16));
    frame.push_back(static_cast<uint8_t>(crc >> 8));
    frame.push_back(static_cast<uint8_t>(crc));
    return frame;
}

} // namespace gnss_rtk_bridge
