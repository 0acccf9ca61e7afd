#pragma once

#include <schemadex/catalog/descriptors.h>
#include <schemadex/core/types.h>

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace schemadex::cache {

struct CacheEntry {
    std::vector<catalog::TableDescriptor> tables;
    std::vector<catalog::ColumnDescriptor> columns;
    TimePoint createdAt;
};

struct MetadataCacheConfig {
    std::filesystem::path path;                  ///< empty = <cache dir>/schema_cache.json.gz
    std::chrono::seconds ttl{3600};
    std::function<TimePoint()> clock;            ///< empty = system_clock::now
};

/**
 * @brief Persistent catalog cache in a single gzip-compressed JSON file
 *
 * The file holds every entry keyed by cacheKey(). Reads treat any problem
 * with the file as a miss; writes rewrite the whole map through a temporary
 * file and rename. Neither direction throws or reports errors. Several
 * processes may share the file; the last writer wins.
 */
class MetadataCache {
public:
    static constexpr int kFormatVersion = 1;
    static constexpr const char* kDefaultFileName = "schema_cache.json.gz";

    explicit MetadataCache(MetadataCacheConfig config = {});

    void save(const std::optional<std::string>& schemaFilter,
              const std::vector<catalog::TableDescriptor>& tables,
              const std::vector<catalog::ColumnDescriptor>& columns,
              std::optional<int64_t> limit = std::nullopt,
              std::optional<int64_t> offset = std::nullopt) const;

    std::optional<CacheEntry> load(const std::optional<std::string>& schemaFilter,
                                   std::optional<int64_t> limit = std::nullopt,
                                   std::optional<int64_t> offset = std::nullopt) const;

    /// Remove the cache file; missing file is fine
    void clear() const;

    const std::filesystem::path& path() const { return path_; }
    std::chrono::seconds ttl() const { return ttl_; }

private:
    TimePoint now() const;
    std::optional<nlohmann::json> readFile() const;
    Result<void> writeFile(const nlohmann::json& doc) const;

    std::filesystem::path path_;
    std::chrono::seconds ttl_;
    std::function<TimePoint()> clock_;
};

} // namespace schemadex::cache
