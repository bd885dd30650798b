#include "gnss_rtk_bridge/http_dechunker.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace gnss_rtk_bridge {

namespace {

constexpr std::size_t kMaxChunkSize = std::size_t{1} << 28;

int hexValue(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[noreturn]] void violation(const char *expected, uint8_t got) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "chunked encoding violation: expected %s, got 0x%02X", expected, got);
    throw ConnectionError(buf);
}

} // namespace

void ChunkedDecoder::reset() {
    state_ = State::Size;
    chunk_remaining_ = 0;
    have_digits_ = false;
    trailer_line_empty_ = true;
}

void ChunkedDecoder::feed(const uint8_t *data, std::size_t size, std::vector<uint8_t> &out) {
    std::size_t i = 0;
    while (i < size) {
        const uint8_t c = data[i];
        switch (state_) {
            case State::Size: {
                const int digit = hexValue(c);
                if (digit >= 0) {
                    chunk_remaining_ = (chunk_remaining_ << 4) | static_cast<std::size_t>(digit);
                    if (chunk_remaining_ > kMaxChunkSize) violation("a sane chunk size", c);
                    have_digits_ = true;
                } else if (!have_digits_) {
                    violation("hex digit", c);
                } else if (c == ';' || c == ' ' || c == '\t') {
                    state_ = State::Extension;
                } else if (c == '\r') {
                    state_ = State::SizeLineFeed;
                } else {
                    violation("hex digit or CR", c);
                }
                ++i;
                break;
            }
            case State::Extension:
                if (c == '\r') state_ = State::SizeLineFeed;
                ++i;
                break;
            case State::SizeLineFeed:
                if (c != '\n') violation("LF after chunk size", c);
                have_digits_ = false;
                if (chunk_remaining_ == 0) {
                    state_ = State::Trailer;
                    trailer_line_empty_ = true;
                } else {
                    state_ = State::Data;
                }
                ++i;
                break;
            case State::Data: {
                const std::size_t n = std::min(chunk_remaining_, size - i);
                out.insert(out.end(), data + i, data + i + n);
                chunk_remaining_ -= n;
                i += n;
                if (chunk_remaining_ == 0) state_ = State::DataCr;
                break;
            }
            case State::DataCr:
                if (c != '\r') violation("CR after chunk data", c);
                state_ = State::DataLf;
                ++i;
                break;
            case State::DataLf:
                if (c != '\n') violation("LF after chunk data", c);
                state_ = State::Size;
                ++i;
                break;
            case State::Trailer:
                if (c == '\r') {
                    state_ = State::TrailerLineFeed;
                } else {
                    trailer_line_empty_ = false;
                }
                ++i;
                break;
            case State::TrailerLineFeed:
                if (c != '\n') violation("LF in trailer", c);
                state_ = trailer_line_empty_ ? State::Done : State::Trailer;
                trailer_line_empty_ = true;
                ++i;
                break;
            case State::Done:
                // Anything after the last chunk is ignored
                return;
        }
    }
}

} // namespace gnss_rtk_bridge
