#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gnss_rtk_bridge {

constexpr uint8_t kRtcm3Preamble = 0xD3;
constexpr std::size_t kRtcm3HeaderLength = 3;
constexpr std::size_t kRtcm3CrcLength = 3;
constexpr std::size_t kRtcm3MaxPayloadLength = 1023;

/// CRC-24Q (poly 0x1864CFB, no reflection), continued from `crc`.
uint32_t crc24q(const uint8_t *data, std::size_t size, uint32_t crc = 0);

// Throws CrcError unless the CRC trailing the `length`-byte payload of
// `frame` matches. `frame` points at the preamble.
void checkRtcm3Crc(const uint8_t *frame, std::size_t length);

/// Preamble, 10-bit length, payload, CRC. Throws std::invalid_argument for
/// payloads above kRtcm3MaxPayloadLength.
std::vector<uint8_t> encodeRtcm3Frame(const std::vector<uint8_t> &payload);

} // namespace gnss_rtk_bridge
