// Catch2 tests for config.toml parsing, XDG directories and environment overrides

#include <catch2/catch_test_macros.hpp>

#include <schemadex/config/config_helpers.h>
#include <schemadex/config/engine_config.h>

#include "../../common/test_helpers_catch2.h"

#include <chrono>
#include <filesystem>

using namespace schemadex;
using namespace schemadex::config;
using namespace std::chrono_literals;

namespace {
// Keeps the developer's environment out of the results
struct CleanEnvironment {
    test::ScopedEnvVar cacheDir{"SCHEMADEX_CACHE_DIR", std::nullopt};
    test::ScopedEnvVar disable{"SCHEMADEX_DISABLE_ACCELERATION", std::nullopt};
    test::ScopedEnvVar config{"SCHEMADEX_CONFIG", std::nullopt};
    test::TempDir dir;
};
} // namespace

TEST_CASE("Config string helpers", "[config][catch2]") {
    std::string s = "  value \t";
    trim(s);
    CHECK(s == "value");

    CHECK(unquote("\"quoted\"") == "quoted");
    CHECK(unquote("'single'") == "single");
    CHECK(unquote("  bare  ") == "bare");
    CHECK(unquote("\"") == "\"");

    test::ScopedEnvVar home("HOME", "/home/tester");
    CHECK(expand_tilde("~") == std::filesystem::path("/home/tester"));
    CHECK(expand_tilde("~/cache") == std::filesystem::path("/home/tester/cache"));
    CHECK(expand_tilde("/abs/~x") == std::filesystem::path("/abs/~x"));
}

TEST_CASE_METHOD(CleanEnvironment, "parse_config_value", "[config][catch2]") {
    const auto path = test::write_file(dir.path() / "config.toml", R"(# top comment
root_key = "top"

[cache]
enabled = false
ttl_seconds = 120   # two minutes
directory = "/tmp/has#hash"

[search]
acceleration = 'off'

[loader]
loader.query_runner = ignored
query_runner = "/opt/runner --verbose"
)");

    CHECK(parse_config_value(path, "", "root_key") == "top");
    CHECK(parse_config_value(path, "cache", "enabled") == "false");
    CHECK(parse_config_value(path, "cache", "ttl_seconds") == "120");
    CHECK(parse_config_value(path, "cache", "directory") == "/tmp/has#hash");
    CHECK(parse_config_value(path, "search", "acceleration") == "off");
    CHECK(parse_config_value(path, "search", "missing").empty());
    CHECK(parse_config_value(path, "nosuch", "enabled").empty());
    CHECK(parse_config_value(dir.path() / "absent.toml", "cache", "enabled").empty());

    // The dotted form is accepted in any section; first match wins
    CHECK(parse_config_value(path, "loader", "query_runner") == "ignored");
}

TEST_CASE_METHOD(CleanEnvironment, "EngineConfig loading", "[config][catch2]") {
    SECTION("Missing file yields defaults") {
        auto cfg = EngineConfig::load(dir.path() / "none.toml");
        REQUIRE(cfg.has_value());
        const auto& c = cfg.value();
        CHECK(c.cache.enabled);
        CHECK(c.cache.ttl == 3600s);
        CHECK(c.cache.directory.empty());
        CHECK(c.search.acceleration == search::AccelerationPreference::Auto);
        CHECK_FALSE(c.loader.defaultLimit.has_value());
        CHECK(c.loader.queryRunner == "query_runner");
        CHECK(c.loader.databaseType == "db2");
    }

    SECTION("All keys") {
        const auto path = test::write_file(dir.path() / "config.toml", R"(
[cache]
enabled = no
ttl_seconds = 60
directory = "/var/cache/sdx"

[search]
acceleration = "on"

[loader]
default_limit = 500
query_runner = "/usr/local/bin/query_runner"
database_type = "db2i"
)");
        auto cfg = EngineConfig::load(path);
        REQUIRE(cfg.has_value());
        const auto& c = cfg.value();
        CHECK_FALSE(c.cache.enabled);
        CHECK(c.cache.ttl == 60s);
        CHECK(c.cache.directory == std::filesystem::path("/var/cache/sdx"));
        CHECK(c.search.acceleration == search::AccelerationPreference::On);
        CHECK(c.loader.defaultLimit == 500);
        CHECK(c.loader.queryRunner == "/usr/local/bin/query_runner");
        CHECK(c.loader.databaseType == "db2i");
        CHECK(c.cacheFilePath() == std::filesystem::path("/var/cache/sdx/schema_cache.json.gz"));
    }

    SECTION("Invalid values are rejected") {
        const std::vector<std::string> bad = {
            "[cache]\nttl_seconds = soon\n",     "[cache]\nttl_seconds = -5\n",
            "[cache]\nenabled = maybe\n",        "[search]\nacceleration = turbo\n",
            "[loader]\ndefault_limit = 0\n",     "[loader]\ndefault_limit = 10rows\n",
        };
        for (const auto& text : bad) {
            CAPTURE(text);
            const auto path = test::write_file(dir.path() / "bad.toml", text);
            auto cfg = EngineConfig::load(path);
            REQUIRE_FALSE(cfg.has_value());
            CHECK(cfg.error().code == ErrorCode::InvalidArgument);
        }
    }
}

TEST_CASE_METHOD(CleanEnvironment, "EngineConfig environment overrides", "[config][env][catch2]") {
    const auto path = test::write_file(dir.path() / "config.toml", R"(
[cache]
directory = "/from/file"

[search]
acceleration = "on"
)");

    SECTION("Cache directory") {
        test::ScopedEnvVar env("SCHEMADEX_CACHE_DIR", "/from/env");
        auto cfg = EngineConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().cache.directory == std::filesystem::path("/from/env"));
        CHECK(get_cache_dir() == std::filesystem::path("/from/env"));
    }

    SECTION("Disable acceleration") {
        test::ScopedEnvVar env("SCHEMADEX_DISABLE_ACCELERATION", "1");
        auto cfg = EngineConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().search.acceleration == search::AccelerationPreference::Off);
        CHECK(EngineConfig::defaults().search.acceleration == search::AccelerationPreference::Off);
    }

    SECTION("Falsy disable flag is ignored") {
        test::ScopedEnvVar env("SCHEMADEX_DISABLE_ACCELERATION", "false");
        auto cfg = EngineConfig::load(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg.value().search.acceleration == search::AccelerationPreference::On);
    }

    SECTION("Config path") {
        CHECK(get_config_path("/explicit.toml") == std::filesystem::path("/explicit.toml"));
        test::ScopedEnvVar env("SCHEMADEX_CONFIG", path.string());
        CHECK(get_config_path() == path);
    }
}

TEST_CASE_METHOD(CleanEnvironment, "XDG directories", "[config][env][catch2]") {
    SECTION("XDG variables win") {
        test::ScopedEnvVar cfg("XDG_CONFIG_HOME", "/xdg/config");
        test::ScopedEnvVar cache("XDG_CACHE_HOME", "/xdg/cache");
        CHECK(get_config_dir() == std::filesystem::path("/xdg/config/schemadex"));
        CHECK(get_cache_dir() == std::filesystem::path("/xdg/cache/schemadex"));
        CHECK(get_config_path() == std::filesystem::path("/xdg/config/schemadex/config.toml"));
    }

    SECTION("HOME fallback") {
        test::ScopedEnvVar cfg("XDG_CONFIG_HOME", std::nullopt);
        test::ScopedEnvVar cache("XDG_CACHE_HOME", std::nullopt);
        test::ScopedEnvVar home("HOME", "/home/tester");
        CHECK(get_config_dir() == std::filesystem::path("/home/tester/.config/schemadex"));
        CHECK(get_cache_dir() == std::filesystem::path("/home/tester/.cache/schemadex"));
    }
}
