#pragma once

#include <schemadex/cache/metadata_cache.h>
#include <schemadex/catalog/descriptors.h>
#include <schemadex/catalog/mock_catalog.h>
#include <schemadex/catalog/row_fetcher.h>
#include <schemadex/core/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace schemadex::loader {

struct MetadataLoaderConfig {
    std::shared_ptr<catalog::IRowFetcher> fetcher; ///< null: every fetch fails
    std::shared_ptr<cache::MetadataCache> cache;   ///< null: caching disabled
    catalog::MockCatalogGenerator::DataSet mockDataSet =
        catalog::MockCatalogGenerator::DataSet::Standard;
};

struct TableContentsRequest {
    std::string schema;
    std::string table;
    int64_t limit = 25;
    int64_t offset = 0;
    bool useMock = false;
    /// Column metadata for the table; used for WHERE quoting and mock rows
    std::vector<catalog::ColumnDescriptor> columns;
    std::optional<std::string> whereColumn;
    std::optional<std::string> whereValue;
};

struct TableContents {
    std::vector<std::string> columnNames;
    catalog::RowSet rows;
};

/**
 * @brief Loads catalog metadata through cache, row fetcher and mock fallback
 *
 * Lookup order for getAllTablesAndColumns():
 *  1. the cache, when useCache is set and a fresh entry exists
 *  2. the row fetcher (tables query, then columns query); a successful,
 *     non-empty result is written back to the cache when useCache is set
 *  3. on fetch failure, the mock catalog when useMock is set, otherwise
 *     the fetcher's error unchanged
 *
 * The async variants behave identically. Only the row fetch leaves the
 * caller's executor; it runs on the blocking executor, which defaults to a
 * single-thread pool owned by the loader.
 */
class MetadataLoader {
public:
    explicit MetadataLoader(MetadataLoaderConfig config);
    MetadataLoader(MetadataLoaderConfig config, boost::asio::any_io_executor blockingExecutor);
    ~MetadataLoader();

    MetadataLoader(const MetadataLoader&) = delete;
    MetadataLoader& operator=(const MetadataLoader&) = delete;

    Result<catalog::CatalogSnapshot>
    getAllTablesAndColumns(const std::optional<std::string>& schemaFilter, bool useMock,
                           bool useCache = true, std::optional<int64_t> limit = std::nullopt,
                           std::optional<int64_t> offset = std::nullopt);

    boost::asio::awaitable<Result<catalog::CatalogSnapshot>>
    getAllTablesAndColumnsAsync(std::optional<std::string> schemaFilter, bool useMock,
                                bool useCache = true, std::optional<int64_t> limit = std::nullopt,
                                std::optional<int64_t> offset = std::nullopt);

    Result<std::vector<catalog::SchemaInfo>> getAvailableSchemas(bool useMock);

    /// Any fetch failure reads as "does not exist"
    bool schemaExists(const std::string& schema, bool useMock);

    Result<TableContents> fetchTableContents(const TableContentsRequest& request);

    boost::asio::awaitable<Result<TableContents>>
    fetchTableContentsAsync(TableContentsRequest request);

    const catalog::MockCatalogGenerator& mockCatalog() const { return mock_; }

private:
    using ResultPtr = std::shared_ptr<Result<catalog::RowSet>>;

    Result<catalog::RowSet> fetch(const std::string& sql) const;
    boost::asio::awaitable<Result<catalog::RowSet>> fetchAsync(std::string sql) const;

    std::optional<catalog::CatalogSnapshot>
    cached(const std::optional<std::string>& schemaFilter, bool useCache,
           std::optional<int64_t> limit, std::optional<int64_t> offset) const;

    catalog::CatalogSnapshot assemble(const catalog::RowSet& tableRows,
                                      const catalog::RowSet& columnRows,
                                      std::optional<int64_t> limit) const;

    void store(const std::optional<std::string>& schemaFilter, bool useCache,
               const catalog::CatalogSnapshot& snapshot, std::optional<int64_t> limit,
               std::optional<int64_t> offset) const;

    Result<catalog::CatalogSnapshot> fallback(const Error& error,
                                              const std::optional<std::string>& schemaFilter,
                                              bool useMock, std::optional<int64_t> limit,
                                              std::optional<int64_t> offset) const;

    Result<std::string> contentsQuery(const TableContentsRequest& request) const;
    Result<TableContents> contentsFromRows(Result<catalog::RowSet> rows,
                                           const TableContentsRequest& request) const;

    MetadataLoaderConfig config_;
    catalog::MockCatalogGenerator mock_;
    std::unique_ptr<boost::asio::thread_pool> ownedPool_;
    boost::asio::any_io_executor blockingExecutor_;
};

/// Parse QSYS2.SYSTABLES rows; rows without TABLE_NAME are skipped
std::vector<catalog::TableDescriptor> parseTableRows(const catalog::RowSet& rows);

/// Parse QSYS2.SYSCOLUMNS rows; non-numeric LENGTH/NUMERIC_SCALE become absent
std::vector<catalog::ColumnDescriptor> parseColumnRows(const catalog::RowSet& rows);

} // namespace schemadex::loader
