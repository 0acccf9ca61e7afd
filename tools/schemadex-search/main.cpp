#include <schemadex/cache/metadata_cache.h>
#include <schemadex/catalog/process_row_fetcher.h>
#include <schemadex/config/config_helpers.h>
#include <schemadex/config/engine_config.h>
#include <schemadex/loader/metadata_loader.h>
#include <schemadex/search/search_engine_registry.h>
#include <schemadex/search/string_interner.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace schemadex::tools {

namespace {
// Remarks come from the catalog as raw bytes; invalid UTF-8 becomes U+FFFD
void printJson(const nlohmann::json& out) {
    std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}
} // namespace

struct SearchOptions {
    std::string query;
    std::string schema;
    std::string mode = "tables";
    std::string format = "table";
    std::string configPath;
    size_t limit = 50;
    bool mock = false;
    bool heavyMock = false;
    bool noCache = false;
    bool clearCache = false;
    bool listSchemas = false;
    bool groupByTable = false;
    bool verbose = false;
};

class SearchTool {
public:
    SearchTool() : app_("schemadex-search", "Search database schema metadata") { setupApp(); }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        setupLogging();

        try {
            return execute();
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

private:
    void setupApp() {
        app_.add_option("query", opts_.query, "Text to search for (empty lists everything)");
        app_.add_option("-s,--schema", opts_.schema, "Restrict to one schema");
        app_.add_option("-m,--mode", opts_.mode, "Search mode: [tables|columns] (default: tables)")
            ->check(CLI::IsMember({"tables", "columns"}));
        app_.add_option("-n,--limit", opts_.limit, "Maximum results to print (default: 50)")
            ->check(CLI::PositiveNumber);
        app_.add_option("-f,--format", opts_.format, "Output format: [table|json] (default: table)")
            ->check(CLI::IsMember({"table", "json"}));
        app_.add_option("-c,--config", opts_.configPath, "Path to config.toml");
        app_.add_flag("--mock", opts_.mock, "Use built-in mock catalog");
        app_.add_flag("--heavy-mock", opts_.heavyMock,
                      "Use the large generated mock catalog (5 schemas x 50 tables x 20 columns)");
        app_.add_flag("--no-cache", opts_.noCache, "Bypass the metadata cache");
        app_.add_flag("--clear-cache", opts_.clearCache, "Delete the metadata cache file first");
        app_.add_flag("--list-schemas", opts_.listSchemas, "List schemas with table counts");
        app_.add_flag("--group-by-table", opts_.groupByTable,
                      "In columns mode, report tables that own matching columns");
        app_.add_flag("-v,--verbose", opts_.verbose, "Enable debug logging");
    }

    void setupLogging() {
        auto logger = spdlog::stderr_color_mt("schemadex");
        spdlog::set_default_logger(logger);
        spdlog::set_level(opts_.verbose ? spdlog::level::debug : spdlog::level::warn);
    }

    int execute() {
        auto cfgPath = config::get_config_path(opts_.configPath);
        auto cfg = config::EngineConfig::load(cfgPath);
        if (!cfg) {
            std::cerr << "Error: " << cfg.error().message << std::endl;
            return 2;
        }
        const auto& settings = cfg.value();

        const bool useMock = opts_.mock || opts_.heavyMock;
        const bool useCache = settings.cache.enabled && !opts_.noCache && !useMock;

        loader::MetadataLoaderConfig loaderConfig;
        if (!useMock) {
            loaderConfig.fetcher = std::make_shared<catalog::ProcessRowFetcher>(
                catalog::ProcessRowFetcherConfig{settings.loader.queryRunner,
                                                 settings.loader.databaseType});
        }
        if (settings.cache.enabled) {
            loaderConfig.cache = std::make_shared<cache::MetadataCache>(
                cache::MetadataCacheConfig{settings.cacheFilePath(), settings.cache.ttl, {}});
            if (opts_.clearCache) {
                loaderConfig.cache->clear();
            }
        }
        loaderConfig.mockDataSet = opts_.heavyMock ? catalog::MockCatalogGenerator::DataSet::Heavy
                                                   : catalog::MockCatalogGenerator::DataSet::Standard;

        loader::MetadataLoader loader(std::move(loaderConfig));

        if (opts_.listSchemas) {
            return listSchemas(loader, useMock);
        }

        std::optional<std::string> schemaFilter;
        if (!opts_.schema.empty())
            schemaFilter = opts_.schema;

        auto snapshot = loader.getAllTablesAndColumns(schemaFilter, useMock, useCache,
                                                      settings.loader.defaultLimit, std::nullopt);
        if (!snapshot) {
            std::cerr << "Error: " << snapshot.error().message << std::endl;
            return 1;
        }

        auto registry = search::SearchEngineRegistry::withBuiltins();
        auto interner = std::make_shared<search::StringInterner>();
        auto selection =
            search::selectSearchEngine(registry, settings.search.acceleration, interner);
        selection.engine->buildIndex(snapshot.value().tables, snapshot.value().columns);

        search::SearchEngineHandle handle;
        handle.publish(std::shared_ptr<const search::ISearchEngine>(std::move(selection.engine)));
        auto engine = handle.snapshot();

        const auto stats = engine->stats();
        spdlog::debug("[schemadex-search] {} tables, {} columns indexed by '{}' ({} entries)",
                      stats.tableCount, stats.columnCount, engine->name(), stats.indexNodes);

        if (opts_.mode == "columns") {
            if (opts_.groupByTable)
                return printTableGroups(engine->tablesWithMatchingColumns(opts_.query));
            return printColumns(engine->searchColumnsScored(opts_.query));
        }
        return printTables(engine->searchTablesScored(opts_.query));
    }

    int listSchemas(loader::MetadataLoader& loader, bool useMock) {
        auto schemas = loader.getAvailableSchemas(useMock);
        if (!schemas) {
            std::cerr << "Error: " << schemas.error().message << std::endl;
            return 1;
        }

        if (opts_.format == "json") {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& s : schemas.value())
                out.push_back({{"schema", s.name}, {"table_count", s.tableCount}});
            printJson(out);
            return 0;
        }

        for (const auto& s : schemas.value())
            std::cout << fmt::format("{:<20} {:>6}", s.name, s.tableCount) << '\n';
        return 0;
    }

    int printTables(const std::vector<search::TableHit>& hits) {
        const size_t n = std::min(hits.size(), opts_.limit);

        if (opts_.format == "json") {
            nlohmann::json out = nlohmann::json::array();
            for (size_t i = 0; i < n; ++i) {
                nlohmann::json item = hits[i].item;
                item["score"] = hits[i].score;
                out.push_back(std::move(item));
            }
            printJson(out);
            return 0;
        }

        std::cout << fmt::format("{:<30} {:>5}  {}", "TABLE", "SCORE", "REMARKS") << '\n';
        for (size_t i = 0; i < n; ++i) {
            const auto& hit = hits[i];
            std::cout << fmt::format("{:<30} {:>5.1f}  {}", hit.item.qualifiedName(), hit.score,
                                     hit.item.remarks)
                      << '\n';
        }
        printTruncation(hits.size(), n);
        return 0;
    }

    int printColumns(const std::vector<search::ColumnHit>& hits) {
        const size_t n = std::min(hits.size(), opts_.limit);

        if (opts_.format == "json") {
            nlohmann::json out = nlohmann::json::array();
            for (size_t i = 0; i < n; ++i) {
                nlohmann::json item = hits[i].item;
                item["score"] = hits[i].score;
                out.push_back(std::move(item));
            }
            printJson(out);
            return 0;
        }

        std::cout << fmt::format("{:<40} {:<12} {:>5}  {}", "COLUMN", "TYPE", "SCORE", "REMARKS")
                  << '\n';
        for (size_t i = 0; i < n; ++i) {
            const auto& c = hits[i].item;
            std::string type = c.typeName;
            if (c.length) {
                type += c.scale && *c.scale > 0 ? fmt::format("({},{})", *c.length, *c.scale)
                                                 : fmt::format("({})", *c.length);
            }
            std::cout << fmt::format("{:<40} {:<12} {:>5.1f}  {}", c.qualifiedName(), type,
                                     hits[i].score, c.remarks)
                      << '\n';
        }
        printTruncation(hits.size(), n);
        return 0;
    }

    int printTableGroups(const std::vector<search::TableColumnMatch>& groups) {
        const size_t n = std::min(groups.size(), opts_.limit);

        if (opts_.format == "json") {
            nlohmann::json out = nlohmann::json::array();
            for (size_t i = 0; i < n; ++i) {
                out.push_back({{"schema", groups[i].schema},
                               {"table", groups[i].table},
                               {"match_count", groups[i].matchCount},
                               {"best_score", groups[i].bestScore}});
            }
            printJson(out);
            return 0;
        }

        std::cout << fmt::format("{:<30} {:>7} {:>5}", "TABLE", "COLUMNS", "SCORE") << '\n';
        for (size_t i = 0; i < n; ++i) {
            const auto& g = groups[i];
            std::cout << fmt::format("{:<30} {:>7} {:>5.1f}", g.schema + "." + g.table,
                                     g.matchCount, g.bestScore)
                      << '\n';
        }
        printTruncation(groups.size(), n);
        return 0;
    }

    void printTruncation(size_t total, size_t shown) const {
        if (total > shown)
            std::cout << fmt::format("... {} more (use --limit)", total - shown) << '\n';
    }

    CLI::App app_;
    SearchOptions opts_;
};

} // namespace schemadex::tools

int main(int argc, char** argv) {
    schemadex::tools::SearchTool tool;
    return tool.run(argc, argv);
}
