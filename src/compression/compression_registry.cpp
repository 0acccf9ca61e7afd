#include "gzip_compressor.h"

#include <schemadex/compression/compressor_interface.h>

#include <spdlog/spdlog.h>

namespace schemadex::compression {

namespace {
class PassthroughCompressor final : public ICompressor {
public:
    Result<CompressionResult> compress(std::span<const std::byte> data, uint8_t) override {
        CompressionResult result;
        result.data.assign(data.begin(), data.end());
        result.algorithm = CompressionAlgorithm::None;
        result.originalSize = data.size();
        result.compressedSize = data.size();
        return result;
    }

    Result<std::vector<std::byte>> decompress(std::span<const std::byte> data, size_t) override {
        return std::vector<std::byte>(data.begin(), data.end());
    }

    CompressionAlgorithm algorithm() const override { return CompressionAlgorithm::None; }

    std::pair<uint8_t, uint8_t> supportedLevels() const override { return {0, 0}; }
};
} // namespace

CompressionRegistry::CompressionRegistry() {
    factories_[CompressionAlgorithm::None] = [] {
        return std::make_unique<PassthroughCompressor>();
    };
    factories_[CompressionAlgorithm::Gzip] = [] { return std::make_unique<GzipCompressor>(); };
}

CompressionRegistry& CompressionRegistry::instance() {
    static CompressionRegistry registry;
    return registry;
}

void CompressionRegistry::registerCompressor(CompressionAlgorithm algorithm,
                                             CompressorFactory factory) {
    std::lock_guard lock(mutex_);

    if (factories_.count(algorithm) > 0) {
        spdlog::warn("[Compression] overwriting compressor for algorithm {}",
                     static_cast<int>(algorithm));
    }
    factories_[algorithm] = std::move(factory);
}

std::unique_ptr<ICompressor>
CompressionRegistry::createCompressor(CompressionAlgorithm algorithm) const {
    std::lock_guard lock(mutex_);

    auto it = factories_.find(algorithm);
    if (it == factories_.end()) {
        spdlog::error("[Compression] no compressor for algorithm {}", static_cast<int>(algorithm));
        return nullptr;
    }

    try {
        auto compressor = it->second();
        if (!compressor) {
            spdlog::error("[Compression] factory returned null compressor");
        }
        return compressor;
    } catch (const std::exception& e) {
        spdlog::error("[Compression] failed to create compressor: {}", e.what());
        return nullptr;
    }
}

bool CompressionRegistry::isAvailable(CompressionAlgorithm algorithm) const {
    std::lock_guard lock(mutex_);
    return factories_.count(algorithm) > 0;
}

} // namespace schemadex::compression
