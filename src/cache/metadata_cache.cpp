#include <schemadex/cache/cache_key.h>
#include <schemadex/cache/metadata_cache.h>
#include <schemadex/compression/compressor_interface.h>
#include <schemadex/config/config_helpers.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace schemadex::cache {

namespace {

double toEpochSeconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

// Rejects values the clock's integer duration cannot hold
std::optional<TimePoint> fromEpochSeconds(double seconds) {
    const double limit = std::chrono::duration<double>(TimePoint::duration::max()).count();
    if (!std::isfinite(seconds) || std::abs(seconds) >= limit) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::duration<double>(seconds)));
}

std::unique_ptr<compression::ICompressor> gzip() {
    return compression::CompressionRegistry::instance().createCompressor(
        compression::CompressionAlgorithm::Gzip);
}

} // namespace

MetadataCache::MetadataCache(MetadataCacheConfig config)
    : path_(std::move(config.path)), ttl_(config.ttl), clock_(std::move(config.clock)) {
    if (path_.empty()) {
        path_ = config::get_cache_dir() / kDefaultFileName;
    }
}

TimePoint MetadataCache::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::optional<nlohmann::json> MetadataCache::readFile() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
        spdlog::debug("[MetadataCache] cannot open {}", path_.string());
        return std::nullopt;
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto compressor = gzip();
    if (!compressor) {
        return std::nullopt;
    }

    auto inflated = compressor->decompress(std::as_bytes(std::span(raw)));
    if (!inflated) {
        spdlog::debug("[MetadataCache] ignoring unreadable cache file {}: {}", path_.string(),
                      inflated.error().message);
        return std::nullopt;
    }

    const auto& bytes = inflated.value();
    auto doc = nlohmann::json::parse(reinterpret_cast<const char*>(bytes.data()),
                                     reinterpret_cast<const char*>(bytes.data()) + bytes.size(),
                                     nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("entries") ||
        !doc["entries"].is_object()) {
        spdlog::debug("[MetadataCache] ignoring malformed cache file {}", path_.string());
        return std::nullopt;
    }
    return doc;
}

Result<void> MetadataCache::writeFile(const nlohmann::json& doc) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         fmt::format("cannot create {}: {}", path_.parent_path().string(),
                                     ec.message())};
        }
    }

    auto compressor = gzip();
    if (!compressor) {
        return Error{ErrorCode::NotSupported, "gzip compressor not registered"};
    }

    // Catalog text is not guaranteed to be UTF-8; invalid bytes become U+FFFD
    const std::string text = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto deflated = compressor->compress(std::as_bytes(std::span(text)));
    if (!deflated) {
        return deflated.error();
    }

    auto tempPath = path_;
    tempPath += fmt::format(".{}.tmp", ::getpid());

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return Error{ErrorCode::WriteError, fmt::format("cannot open {}", tempPath.string())};
        }
        const auto& data = deflated.value().data;
        ofs.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, fmt::format("short write to {}", tempPath.string())};
        }
    }

    std::filesystem::rename(tempPath, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return Error{ErrorCode::WriteError,
                     fmt::format("cannot rename into {}: {}", path_.string(), ec.message())};
    }
    return {};
}

void MetadataCache::save(const std::optional<std::string>& schemaFilter,
                         const std::vector<catalog::TableDescriptor>& tables,
                         const std::vector<catalog::ColumnDescriptor>& columns,
                         std::optional<int64_t> limit, std::optional<int64_t> offset) const {
    const auto key = cacheKey(schemaFilter, limit, offset);

    auto doc = readFile().value_or(nlohmann::json::object());
    doc["version"] = kFormatVersion;
    if (!doc.contains("entries") || !doc["entries"].is_object()) {
        doc["entries"] = nlohmann::json::object();
    }
    doc["entries"][key] = nlohmann::json{
        {"created_at", toEpochSeconds(now())}, {"tables", tables}, {"columns", columns}};

    if (auto written = writeFile(doc); !written) {
        spdlog::debug("[MetadataCache] save of '{}' skipped: {}", key, written.error().message);
        return;
    }
    spdlog::debug("[MetadataCache] saved '{}' ({} tables, {} columns)", key, tables.size(),
                  columns.size());
}

std::optional<CacheEntry> MetadataCache::load(const std::optional<std::string>& schemaFilter,
                                              std::optional<int64_t> limit,
                                              std::optional<int64_t> offset) const {
    const auto key = cacheKey(schemaFilter, limit, offset);

    auto doc = readFile();
    if (!doc) {
        return std::nullopt;
    }

    const auto& entries = (*doc)["entries"];
    auto it = entries.find(key);
    if (it == entries.end()) {
        spdlog::debug("[MetadataCache] miss for '{}'", key);
        return std::nullopt;
    }

    try {
        const double createdSeconds = it->at("created_at").get<double>();
        auto createdAt = fromEpochSeconds(createdSeconds);
        if (!createdAt) {
            spdlog::debug("[MetadataCache] corrupt entry '{}': created_at out of range", key);
            return std::nullopt;
        }

        CacheEntry entry;
        entry.createdAt = *createdAt;
        // Age in double seconds; a far-past timestamp must not overflow the subtraction
        if (toEpochSeconds(now()) - createdSeconds > static_cast<double>(ttl_.count())) {
            spdlog::debug("[MetadataCache] entry '{}' expired", key);
            return std::nullopt;
        }
        entry.tables = it->at("tables").get<std::vector<catalog::TableDescriptor>>();
        entry.columns = it->at("columns").get<std::vector<catalog::ColumnDescriptor>>();
        spdlog::debug("[MetadataCache] hit for '{}'", key);
        return entry;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("[MetadataCache] corrupt entry '{}': {}", key, e.what());
        return std::nullopt;
    }
}

void MetadataCache::clear() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::debug("[MetadataCache] cannot remove {}: {}", path_.string(), ec.message());
    }
}

} // namespace schemadex::cache
