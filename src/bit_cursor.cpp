#include "gnss_rtk_bridge/bit_cursor.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <stdexcept>

namespace gnss_rtk_bridge {

BitCursor::BitCursor(const uint8_t *data, std::size_t size_bytes)
: data_(data), size_bits_(size_bytes * 8)
{
}

void BitCursor::require(std::size_t bits) const {
    if (bits > remaining()) {
        throw FieldBoundsError("bit field of " + std::to_string(bits) + " bits at offset " +
                               std::to_string(pos_) + " exceeds payload of " +
                               std::to_string(size_bits_) + " bits");
    }
}

uint64_t BitCursor::readUnsigned(unsigned bits) {
    if (bits > 64) throw std::invalid_argument("bit field wider than 64 bits");
    require(bits);
    uint64_t value = 0;
    for (unsigned i = 0; i < bits; ++i, ++pos_) {
        const uint8_t byte = data_[pos_ >> 3];
        value = (value << 1) | ((byte >> (7 - (pos_ & 7))) & 1u);
    }
    return value;
}

int64_t BitCursor::readSigned(unsigned bits) {
    if (bits == 0) return 0;
    const uint64_t raw = readUnsigned(bits);
    if (bits == 64) return static_cast<int64_t>(raw);
    const uint64_t sign = uint64_t{1} << (bits - 1);
    // Sign extend
    return static_cast<int64_t>((raw ^ sign) - sign);
}

int64_t BitCursor::readSignMagnitude(unsigned bits) {
    if (bits < 2) throw std::invalid_argument("sign-magnitude field needs at least 2 bits");
    require(bits);
    const bool negative = readBool();
    const int64_t magnitude = static_cast<int64_t>(readUnsigned(bits - 1));
    return negative ? -magnitude : magnitude;
}

std::string BitCursor::readString() {
    const std::size_t start = pos_;
    const std::size_t length = readUnsigned(8);
    if (length * 8 > remaining()) {
        pos_ = start;
        require(8 + length * 8);
    }
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(static_cast<char>(readUnsigned(8)));
    }
    return out;
}

void BitCursor::skip(std::size_t bits) {
    require(bits);
    pos_ += bits;
}

} // namespace gnss_rtk_bridge
