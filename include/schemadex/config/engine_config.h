#pragma once

#include <schemadex/core/types.h>
#include <schemadex/search/search_engine_registry.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace schemadex::config {

/**
 * @brief Settings read from config.toml
 *
 * @code
 * [cache]
 * enabled = true
 * ttl_seconds = 3600
 * directory = "~/.cache/schemadex"
 *
 * [search]
 * acceleration = "auto"   # auto | on | off
 *
 * [loader]
 * default_limit = 500
 * query_runner = "query_runner"
 * database_type = "db2"
 * @endcode
 *
 * SCHEMADEX_CACHE_DIR replaces cache.directory and a truthy
 * SCHEMADEX_DISABLE_ACCELERATION forces acceleration off.
 */
struct EngineConfig {
    struct Cache {
        bool enabled = true;
        std::chrono::seconds ttl{3600};
        std::filesystem::path directory; ///< empty = get_cache_dir()
    };

    struct Search {
        search::AccelerationPreference acceleration = search::AccelerationPreference::Auto;
    };

    struct Loader {
        std::optional<int64_t> defaultLimit;
        std::string queryRunner = "query_runner";
        std::string databaseType = "db2";
    };

    Cache cache;
    Search search;
    Loader loader;

    /// Missing file yields defaults; malformed values are an InvalidArgument error
    static Result<EngineConfig> load(const std::filesystem::path& path);

    /// Defaults plus environment overrides
    static EngineConfig defaults();

    std::filesystem::path cacheFilePath() const;
};

} // namespace schemadex::config
