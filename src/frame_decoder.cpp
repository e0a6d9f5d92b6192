#include "frame_decoder.hpp"
#include "errors.hpp"

#include <zlib.h>

#include <array>
#include <cstdint>
#include <limits>

namespace {

constexpr size_t CHUNK_SIZE = 16 * 1024;

// Owns an initialised z_stream for the duration of one decode.
class InflateStream {
public:
    InflateStream() {
        stream_.zalloc = Z_NULL;
        stream_.zfree = Z_NULL;
        stream_.opaque = Z_NULL;
        stream_.avail_in = 0;
        stream_.next_in = Z_NULL;
        int rc = inflateInit(&stream_);
        if (rc != Z_OK) {
            throw DecodeError("inflateInit failed with code " + std::to_string(rc));
        }
    }

    ~InflateStream() {
        inflateEnd(&stream_);
    }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &stream_; }

private:
    z_stream stream_{};
};

}  // namespace

std::string decode_frame(const RawFrame& frame) {
    if (frame.empty()) {
        throw DecodeError("empty frame");
    }
    if (frame.size() > std::numeric_limits<uInt>::max()) {
        throw DecodeError("frame too large");
    }

    InflateStream inflater;
    z_stream* zs = inflater.get();
    zs->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(frame.data()));
    zs->avail_in = static_cast<uInt>(frame.size());

    std::string payload;
    std::array<char, CHUNK_SIZE> chunk;
    int rc = Z_OK;

    do {
        zs->next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs->avail_out = static_cast<uInt>(chunk.size());

        rc = inflate(zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            throw DecodeError(zs->msg ? std::string(zs->msg) : "inflate failed with code " + std::to_string(rc));
        }

        payload.append(chunk.data(), chunk.size() - zs->avail_out);

        // No progress possible and no end marker: the stream was cut short.
        if (rc == Z_BUF_ERROR || (rc == Z_OK && zs->avail_in == 0 && zs->avail_out != 0)) {
            throw DecodeError("truncated stream");
        }
    } while (rc != Z_STREAM_END);

    if (!is_valid_utf8(payload)) {
        throw DecodeError("payload is not valid UTF-8");
    }
    return payload;
}

bool is_valid_utf8(std::string_view text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();

    while (p < end) {
        const unsigned char c = *p;
        if (c < 0x80) {
            ++p;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (static_cast<size_t>(end - p) < len) {
            return false;
        }
        for (size_t i = 1; i < len; ++i) {
            if ((p[i] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (p[i] & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false; // overlong
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        p += len;
    }
    return true;
}
