#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gnss_rtk_bridge {

/// Reads big-endian bit fields from a byte buffer, most significant bit first.
/// The buffer must outlive the cursor. Reads past the end throw
/// FieldBoundsError and leave the position unchanged.
class BitCursor {
public:
    BitCursor(const uint8_t *data, std::size_t size_bytes);

    uint64_t readUnsigned(unsigned bits);
    int64_t readSigned(unsigned bits);        // two's complement
    int64_t readSignMagnitude(unsigned bits); // leading sign bit
    bool readBool() { return readUnsigned(1) != 0; }

    double readScaled(unsigned bits, double scale) { return static_cast<double>(readSigned(bits)) * scale; }
    double readScaledUnsigned(unsigned bits, double scale) {
        return static_cast<double>(readUnsigned(bits)) * scale;
    }

    /// 8-bit length followed by that many 8-bit characters.
    std::string readString();

    void skip(std::size_t bits);

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return size_bits_ - pos_; }

private:
    void require(std::size_t bits) const;

    const uint8_t *data_;
    std::size_t size_bits_;
    std::size_t pos_ = 0;
};

} // namespace gnss_rtk_bridge
