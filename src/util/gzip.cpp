/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Gzip Implementation
 */

#include "util/gzip.hpp"

#include <zlib.h>

#include <array>
#include <memory>

namespace httpstash::util {

namespace {

// windowBits = 15 + 16 selects the gzip wrapper
constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kChunkSize = 16 * 1024;

} // namespace

std::optional<std::string> gzip_encode(std::string_view input, int level) {
    std::unique_ptr<z_stream, void (*)(z_stream*)> stream(new z_stream{}, [](z_stream* z) {
        deflateEnd(z);
        delete z;
    });

    if (deflateInit2(stream.get(), level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    stream->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream->avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.reserve(deflateBound(stream.get(), static_cast<uLong>(input.size())));

    std::array<Bytef, kChunkSize> chunk;
    int result = Z_OK;
    do {
        stream->next_out = chunk.data();
        stream->avail_out = static_cast<uInt>(chunk.size());
        result = deflate(stream.get(), Z_FINISH);
        if (result == Z_STREAM_ERROR) {
            return std::nullopt;
        }
        output.append(reinterpret_cast<const char*>(chunk.data()), chunk.size() - stream->avail_out);
    } while (result != Z_STREAM_END);

    return output;
}

std::optional<std::string> gzip_decode(std::string_view input) {
    std::unique_ptr<z_stream, void (*)(z_stream*)> stream(new z_stream{}, [](z_stream* z) {
        inflateEnd(z);
        delete z;
    });

    if (inflateInit2(stream.get(), kGzipWindowBits) != Z_OK) {
        return std::nullopt;
    }

    stream->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream->avail_in = static_cast<uInt>(input.size());

    std::string output;
    std::array<Bytef, kChunkSize> chunk;
    int result = Z_OK;
    while (result != Z_STREAM_END) {
        stream->next_out = chunk.data();
        stream->avail_out = static_cast<uInt>(chunk.size());
        result = inflate(stream.get(), Z_NO_FLUSH);
        if (result != Z_OK && result != Z_STREAM_END) {
            return std::nullopt;
        }
        output.append(reinterpret_cast<const char*>(chunk.data()), chunk.size() - stream->avail_out);
        // No progress and no more input: the stream is truncated
        if (result == Z_OK && stream->avail_in == 0 && stream->avail_out != 0) {
            return std::nullopt;
        }
    }

    return output;
}

} // namespace httpstash::util
