#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gnss_rtk_bridge {

/// Turns an HTTP/1.1 chunked body back into a plain byte stream. Chunk
/// boundaries may fall anywhere between feed() calls. Protocol violations
/// throw ConnectionError: the rest of the stream cannot be trusted.
class ChunkedDecoder {
public:
    // Appends the body bytes contained in `data` to `out`.
    void feed(const uint8_t *data, std::size_t size, std::vector<uint8_t> &out);

    // True once the terminating zero-length chunk has been seen.
    bool finished() const { return state_ == State::Done; }

    void reset();

private:
    enum class State {
        Size,
        Extension,
        SizeLineFeed,
        Data,
        DataCr,
        DataLf,
        Trailer,
        TrailerLineFeed,
        Done
    };

    State state_ = State::Size;
    std::size_t chunk_remaining_ = 0;
    bool have_digits_ = false;
    bool trailer_line_empty_ = true;
};

} // namespace gnss_rtk_bridge
