#include "gzip_compressor.h"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <zlib.h>
#include <chrono>
#include <limits>

namespace schemadex::compression {

namespace {
constexpr uint8_t DEFAULT_COMPRESSION_LEVEL = 6;
// 15 bits of window plus 16 selects the gzip wrapper
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int MEM_LEVEL = 8;
constexpr size_t CHUNK_SIZE = 64 * 1024;

[[nodiscard]] Error makeZlibError(const char* operation, int code, const z_stream& stream) {
    return Error{ErrorCode::CompressionError,
                 fmt::format("{} failed: {} ({})", operation, stream.msg ? stream.msg : "no message",
                             code)};
}

// Releases the zlib stream on every exit path
struct DeflateGuard {
    z_stream* stream;
    ~DeflateGuard() { deflateEnd(stream); }
};

struct InflateGuard {
    z_stream* stream;
    ~InflateGuard() { inflateEnd(stream); }
};
} // namespace

Result<CompressionResult> GzipCompressor::compress(std::span<const std::byte> data, uint8_t level) {
    if (level == 0)
        level = DEFAULT_COMPRESSION_LEVEL;
    if (level < 1 || level > 9) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Invalid compression level: {}", level)};
    }
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return Error{ErrorCode::InvalidArgument, "Input too large for a single gzip member"};
    }

    auto start = std::chrono::steady_clock::now();

    z_stream stream{};
    if (int rc = deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, MEM_LEVEL,
                              Z_DEFAULT_STRATEGY);
        rc != Z_OK) {
        return makeZlibError("deflateInit2", rc, stream);
    }
    DeflateGuard guard{&stream};

    std::vector<std::byte> compressed(deflateBound(&stream, static_cast<uLong>(data.size())));

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(compressed.data());
    stream.avail_out = static_cast<uInt>(compressed.size());

    int rc = deflate(&stream, Z_FINISH);
    if (rc != Z_STREAM_END) {
        return makeZlibError("deflate", rc, stream);
    }
    compressed.resize(stream.total_out);

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    CompressionResult result;
    result.data = std::move(compressed);
    result.algorithm = CompressionAlgorithm::Gzip;
    result.level = level;
    result.originalSize = data.size();
    result.compressedSize = result.data.size();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(duration);

    spdlog::debug("[Gzip] compressed {} bytes to {} bytes (ratio: {:.2f}x) in {}us", data.size(),
                  result.compressedSize, result.ratio(), duration.count());
    return result;
}

Result<std::vector<std::byte>> GzipCompressor::decompress(std::span<const std::byte> data,
                                                          size_t expectedSize) {
    if (data.empty()) {
        return Error{ErrorCode::InvalidData, "Empty gzip input"};
    }
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return Error{ErrorCode::InvalidArgument, "Input too large for a single gzip member"};
    }

    z_stream stream{};
    if (int rc = inflateInit2(&stream, GZIP_WINDOW_BITS); rc != Z_OK) {
        return makeZlibError("inflateInit2", rc, stream);
    }
    InflateGuard guard{&stream};

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<std::byte> out;
    out.reserve(expectedSize > 0 ? expectedSize : data.size() * 4);

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        const size_t offset = out.size();
        out.resize(offset + CHUNK_SIZE);
        stream.next_out = reinterpret_cast<Bytef*>(out.data() + offset);
        stream.avail_out = static_cast<uInt>(CHUNK_SIZE);

        rc = inflate(&stream, Z_NO_FLUSH);
        out.resize(offset + (CHUNK_SIZE - stream.avail_out));

        if (rc == Z_STREAM_END)
            break;
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR) {
            return Error{ErrorCode::CorruptedData,
                         fmt::format("inflate failed: {}", stream.msg ? stream.msg : "bad data")};
        }
        if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
            return Error{ErrorCode::CorruptedData, "Truncated gzip stream"};
        }
    }

    spdlog::debug("[Gzip] decompressed {} bytes to {} bytes", data.size(), out.size());
    return out;
}

} // namespace schemadex::compression
