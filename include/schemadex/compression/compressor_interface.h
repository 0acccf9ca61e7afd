#pragma once

#include <schemadex/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace schemadex::compression {

/**
 * @brief Supported compression algorithms
 */
enum class CompressionAlgorithm : uint8_t {
    None = 0, ///< Passthrough
    Gzip = 1, ///< zlib deflate in a gzip container
};

/**
 * @brief Result of a compression operation
 */
struct CompressionResult {
    std::vector<std::byte> data;
    size_t originalSize = 0;
    size_t compressedSize = 0;
    CompressionAlgorithm algorithm = CompressionAlgorithm::None;
    uint8_t level = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] double ratio() const noexcept {
        return compressedSize > 0 ? static_cast<double>(originalSize) / compressedSize : 0.0;
    }
};

/**
 * @brief Abstract interface for compression algorithms
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /**
     * @brief Compress data
     * @param data Input data to compress
     * @param level Compression level (0 = default for algorithm)
     */
    [[nodiscard]] virtual Result<CompressionResult> compress(std::span<const std::byte> data,
                                                             uint8_t level = 0) = 0;

    /**
     * @brief Decompress data
     * @param data Compressed data
     * @param expectedSize Uncompressed size hint (0 = unknown)
     */
    [[nodiscard]] virtual Result<std::vector<std::byte>>
    decompress(std::span<const std::byte> data, size_t expectedSize = 0) = 0;

    [[nodiscard]] virtual CompressionAlgorithm algorithm() const = 0;

    /// Pair of (min_level, max_level)
    [[nodiscard]] virtual std::pair<uint8_t, uint8_t> supportedLevels() const = 0;
};

using CompressorFactory = std::function<std::unique_ptr<ICompressor>()>;

/**
 * @brief Registry for compression algorithms
 */
class CompressionRegistry {
public:
    static CompressionRegistry& instance();

    void registerCompressor(CompressionAlgorithm algorithm, CompressorFactory factory);

    /// Compressor instance or nullptr if not registered
    [[nodiscard]] std::unique_ptr<ICompressor> createCompressor(CompressionAlgorithm algorithm) const;

    [[nodiscard]] bool isAvailable(CompressionAlgorithm algorithm) const;

private:
    CompressionRegistry();
    std::unordered_map<CompressionAlgorithm, CompressorFactory> factories_;
    mutable std::mutex mutex_;
};

} // namespace schemadex::compression
