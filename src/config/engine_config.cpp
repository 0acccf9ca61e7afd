#include <schemadex/cache/metadata_cache.h>
#include <schemadex/common/string_utils.h>
#include <schemadex/config/config_helpers.h>
#include <schemadex/config/engine_config.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <charconv>

namespace schemadex::config {

namespace {

std::optional<int64_t> parseInt(const std::string& value) {
    int64_t out = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, out);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return out;
}

std::optional<bool> parseBool(const std::string& value) {
    const auto v = common::toLower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

Error invalidValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument, fmt::format("invalid value for {}: '{}'", key, value)};
}

void applyEnvironment(EngineConfig& cfg) {
    if (auto dir = env_value("SCHEMADEX_CACHE_DIR")) {
        cfg.cache.directory = expand_tilde(*dir);
    }
    if (auto disable = env_value("SCHEMADEX_DISABLE_ACCELERATION")) {
        if (parseBool(*disable).value_or(true)) {
            cfg.search.acceleration = search::AccelerationPreference::Off;
        }
    }
}

} // namespace

EngineConfig EngineConfig::defaults() {
    EngineConfig cfg;
    applyEnvironment(cfg);
    return cfg;
}

Result<EngineConfig> EngineConfig::load(const std::filesystem::path& path) {
    EngineConfig cfg;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] reading {}", path.string());

        if (auto v = parse_config_value(path, "cache", "enabled"); !v.empty()) {
            auto b = parseBool(v);
            if (!b)
                return invalidValue("cache.enabled", v);
            cfg.cache.enabled = *b;
        }
        if (auto v = parse_config_value(path, "cache", "ttl_seconds"); !v.empty()) {
            auto n = parseInt(v);
            if (!n || *n < 0)
                return invalidValue("cache.ttl_seconds", v);
            cfg.cache.ttl = std::chrono::seconds(*n);
        }
        if (auto v = parse_config_value(path, "cache", "directory"); !v.empty()) {
            cfg.cache.directory = expand_tilde(v);
        }

        if (auto v = parse_config_value(path, "search", "acceleration"); !v.empty()) {
            auto pref = search::parseAccelerationPreference(v);
            if (!pref)
                return invalidValue("search.acceleration", v);
            cfg.search.acceleration = *pref;
        }

        if (auto v = parse_config_value(path, "loader", "default_limit"); !v.empty()) {
            auto n = parseInt(v);
            if (!n || *n <= 0)
                return invalidValue("loader.default_limit", v);
            cfg.loader.defaultLimit = *n;
        }
        if (auto v = parse_config_value(path, "loader", "query_runner"); !v.empty()) {
            cfg.loader.queryRunner = v;
        }
        if (auto v = parse_config_value(path, "loader", "database_type"); !v.empty()) {
            cfg.loader.databaseType = v;
        }
    } else {
        spdlog::debug("[Config] no config file at {}, using defaults", path.string());
    }

    applyEnvironment(cfg);
    return cfg;
}

std::filesystem::path EngineConfig::cacheFilePath() const {
    const auto dir = cache.directory.empty() ? get_cache_dir() : cache.directory;
    return dir / cache::MetadataCache::kDefaultFileName;
}

} // namespace schemadex::config
