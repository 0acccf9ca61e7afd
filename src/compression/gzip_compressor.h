#pragma once

#include <schemadex/compression/compressor_interface.h>

namespace schemadex::compression {

/**
 * @brief gzip (RFC 1952) compressor backed by zlib
 *
 * Output is a standard gzip member, readable by gzip(1) and zcat. Stateless,
 * so a single instance may be used from several threads.
 */
class GzipCompressor final : public ICompressor {
public:
    [[nodiscard]] Result<CompressionResult> compress(std::span<const std::byte> data,
                                                     uint8_t level = 0) override;

    [[nodiscard]] Result<std::vector<std::byte>> decompress(std::span<const std::byte> data,
                                                            size_t expectedSize = 0) override;

    [[nodiscard]] CompressionAlgorithm algorithm() const override {
        return CompressionAlgorithm::Gzip;
    }

    [[nodiscard]] std::pair<uint8_t, uint8_t> supportedLevels() const override { return {1, 9}; }
};

} // namespace schemadex::compression
