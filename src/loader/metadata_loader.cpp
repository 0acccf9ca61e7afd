#include <schemadex/catalog/catalog_queries.h>
#include <schemadex/common/string_utils.h>
#include <schemadex/loader/metadata_loader.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <set>

namespace schemadex::loader {

namespace {

std::string stringField(const catalog::Row& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end() || it->is_null())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

std::optional<int64_t> integerField(const catalog::Row& row, const char* key) {
    auto it = row.find(key);
    if (it == row.end())
        return std::nullopt;
    if (it->is_number_integer())
        return it->get<int64_t>();
    if (it->is_number_float()) {
        // 2^63 is exact in a double; anything at or past it does not fit
        const double d = it->get<double>();
        if (!std::isfinite(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0)
            return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty() || !std::ranges::all_of(s, [](unsigned char c) { return c >= '0' && c <= '9'; }))
            return std::nullopt;
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{})
            return std::nullopt;
        return value;
    }
    return std::nullopt;
}

// Letters, digits, '_', '$', '#', '@' and UTF-8 continuation bytes
bool isPlainIdentifier(std::string_view name) {
    if (name.empty())
        return false;
    return std::ranges::all_of(name, [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '$' || c == '#' || c == '@' || c >= 0x80;
    });
}

} // namespace

std::vector<catalog::TableDescriptor> parseTableRows(const catalog::RowSet& rows) {
    std::vector<catalog::TableDescriptor> tables;
    tables.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_object())
            continue;
        auto name = stringField(row, "TABLE_NAME");
        if (name.empty())
            continue;
        tables.push_back(catalog::TableDescriptor{stringField(row, "TABLE_SCHEMA"), std::move(name),
                                                  stringField(row, "TABLE_TEXT")});
    }
    return tables;
}

std::vector<catalog::ColumnDescriptor> parseColumnRows(const catalog::RowSet& rows) {
    std::vector<catalog::ColumnDescriptor> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_object())
            continue;
        catalog::ColumnDescriptor c;
        c.table = stringField(row, "TABLE_NAME");
        c.name = stringField(row, "COLUMN_NAME");
        if (c.table.empty() || c.name.empty())
            continue;
        c.schema = stringField(row, "TABLE_SCHEMA");
        c.typeName = stringField(row, "DATA_TYPE");
        c.length = integerField(row, "LENGTH");
        c.scale = integerField(row, "NUMERIC_SCALE");
        const auto nullable = common::toUpper(stringField(row, "IS_NULLABLE"));
        c.nullable = (nullable == "Y" || nullable == "YES") ? catalog::Nullable::Yes
                                                            : catalog::Nullable::No;
        c.remarks = stringField(row, "COLUMN_TEXT");
        columns.push_back(std::move(c));
    }
    return columns;
}

MetadataLoader::MetadataLoader(MetadataLoaderConfig config)
    : config_(std::move(config)), mock_(config_.mockDataSet),
      ownedPool_(std::make_unique<boost::asio::thread_pool>(1)),
      blockingExecutor_(ownedPool_->get_executor()) {}

MetadataLoader::MetadataLoader(MetadataLoaderConfig config,
                               boost::asio::any_io_executor blockingExecutor)
    : config_(std::move(config)), mock_(config_.mockDataSet),
      blockingExecutor_(std::move(blockingExecutor)) {}

MetadataLoader::~MetadataLoader() {
    if (ownedPool_) {
        ownedPool_->join();
    }
}

Result<catalog::RowSet> MetadataLoader::fetch(const std::string& sql) const {
    if (!config_.fetcher) {
        return Error{ErrorCode::NotSupported, "no row fetcher configured"};
    }
    return config_.fetcher->fetch(sql);
}

boost::asio::awaitable<Result<catalog::RowSet>> MetadataLoader::fetchAsync(std::string sql) const {
    auto fetcher = config_.fetcher;
    auto result = co_await boost::asio::co_spawn(
        blockingExecutor_,
        [fetcher, sql = std::move(sql)]() -> boost::asio::awaitable<ResultPtr> {
            if (!fetcher) {
                co_return std::make_shared<Result<catalog::RowSet>>(
                    Error{ErrorCode::NotSupported, "no row fetcher configured"});
            }
            co_return std::make_shared<Result<catalog::RowSet>>(fetcher->fetch(sql));
        },
        boost::asio::use_awaitable);
    co_return std::move(*result);
}

std::optional<catalog::CatalogSnapshot>
MetadataLoader::cached(const std::optional<std::string>& schemaFilter, bool useCache,
                       std::optional<int64_t> limit, std::optional<int64_t> offset) const {
    if (!useCache || !config_.cache)
        return std::nullopt;
    auto entry = config_.cache->load(schemaFilter, limit, offset);
    if (!entry)
        return std::nullopt;
    spdlog::debug("[MetadataLoader] serving {} tables from cache", entry->tables.size());
    return catalog::CatalogSnapshot{std::move(entry->tables), std::move(entry->columns)};
}

catalog::CatalogSnapshot MetadataLoader::assemble(const catalog::RowSet& tableRows,
                                                  const catalog::RowSet& columnRows,
                                                  std::optional<int64_t> limit) const {
    catalog::CatalogSnapshot snapshot;
    snapshot.tables = parseTableRows(tableRows);
    snapshot.columns = parseColumnRows(columnRows);

    // A paged table list keeps only the columns of its own tables
    if (limit) {
        std::set<std::pair<std::string, std::string>> page;
        for (const auto& t : snapshot.tables)
            page.emplace(t.schema, t.name);
        std::erase_if(snapshot.columns, [&](const catalog::ColumnDescriptor& c) {
            return !page.contains({c.schema, c.table});
        });
    }
    return snapshot;
}

void MetadataLoader::store(const std::optional<std::string>& schemaFilter, bool useCache,
                           const catalog::CatalogSnapshot& snapshot, std::optional<int64_t> limit,
                           std::optional<int64_t> offset) const {
    if (!useCache || !config_.cache)
        return;
    if (snapshot.tables.empty() && snapshot.columns.empty())
        return;
    config_.cache->save(schemaFilter, snapshot.tables, snapshot.columns, limit, offset);
}

Result<catalog::CatalogSnapshot>
MetadataLoader::fallback(const Error& error, const std::optional<std::string>& schemaFilter,
                         bool useMock, std::optional<int64_t> limit,
                         std::optional<int64_t> offset) const {
    if (!useMock) {
        return error;
    }
    if (error.code == ErrorCode::NotSupported) {
        spdlog::debug("[MetadataLoader] {}, using mock data", error.message);
    } else {
        spdlog::warn("[MetadataLoader] catalog fetch failed ({}), using mock data", error.message);
    }
    return mock_.catalog(schemaFilter, limit, offset);
}

Result<catalog::CatalogSnapshot>
MetadataLoader::getAllTablesAndColumns(const std::optional<std::string>& schemaFilter,
                                       bool useMock, bool useCache, std::optional<int64_t> limit,
                                       std::optional<int64_t> offset) {
    if (auto hit = cached(schemaFilter, useCache, limit, offset))
        return std::move(*hit);

    auto tableRows = fetch(catalog::queries::tables(schemaFilter, limit, offset));
    if (!tableRows)
        return fallback(tableRows.error(), schemaFilter, useMock, limit, offset);

    auto columnRows = fetch(catalog::queries::columns(schemaFilter));
    if (!columnRows)
        return fallback(columnRows.error(), schemaFilter, useMock, limit, offset);

    auto snapshot = assemble(tableRows.value(), columnRows.value(), limit);
    store(schemaFilter, useCache, snapshot, limit, offset);
    spdlog::debug("[MetadataLoader] loaded {} tables, {} columns", snapshot.tables.size(),
                  snapshot.columns.size());
    return snapshot;
}

boost::asio::awaitable<Result<catalog::CatalogSnapshot>>
MetadataLoader::getAllTablesAndColumnsAsync(std::optional<std::string> schemaFilter, bool useMock,
                                            bool useCache, std::optional<int64_t> limit,
                                            std::optional<int64_t> offset) {
    using SnapshotResult = Result<catalog::CatalogSnapshot>;

    if (auto hit = cached(schemaFilter, useCache, limit, offset))
        co_return SnapshotResult(std::move(*hit));

    auto tableRows = co_await fetchAsync(catalog::queries::tables(schemaFilter, limit, offset));
    if (!tableRows)
        co_return fallback(tableRows.error(), schemaFilter, useMock, limit, offset);

    auto columnRows = co_await fetchAsync(catalog::queries::columns(schemaFilter));
    if (!columnRows)
        co_return fallback(columnRows.error(), schemaFilter, useMock, limit, offset);

    auto snapshot = assemble(tableRows.value(), columnRows.value(), limit);
    store(schemaFilter, useCache, snapshot, limit, offset);
    co_return SnapshotResult(std::move(snapshot));
}

Result<std::vector<catalog::SchemaInfo>> MetadataLoader::getAvailableSchemas(bool useMock) {
    if (useMock) {
        return mock_.schemas();
    }

    auto rows = fetch(catalog::queries::schemas());
    if (!rows) {
        return rows.error();
    }

    std::vector<catalog::SchemaInfo> schemas;
    for (const auto& row : rows.value()) {
        if (!row.is_object())
            continue;
        auto name = stringField(row, "TABLE_SCHEMA");
        if (name.empty())
            continue;
        schemas.push_back(
            catalog::SchemaInfo{std::move(name), integerField(row, "TABLE_COUNT").value_or(0)});
    }
    return schemas;
}

bool MetadataLoader::schemaExists(const std::string& schema, bool useMock) {
    if (useMock) {
        return mock_.schemaExists(schema);
    }

    auto rows = fetch(catalog::queries::schemaProbe(schema));
    if (!rows) {
        spdlog::debug("[MetadataLoader] schema probe for {} failed: {}", schema,
                      rows.error().message);
        return false;
    }
    return !rows.value().empty();
}

Result<std::string> MetadataLoader::contentsQuery(const TableContentsRequest& request) const {
    if (!isPlainIdentifier(request.schema) || !isPlainIdentifier(request.table)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("invalid table name '{}.{}'", request.schema, request.table)};
    }
    if (request.limit < 0 || request.offset < 0) {
        return Error{ErrorCode::InvalidArgument, "limit and offset must not be negative"};
    }

    std::string where;
    if (request.whereColumn && request.whereValue) {
        if (!isPlainIdentifier(*request.whereColumn)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("invalid column name '{}'", *request.whereColumn)};
        }
        // Unknown columns compare as strings
        bool quote = true;
        const auto wanted = common::toUpper(*request.whereColumn);
        for (const auto& c : request.columns) {
            if (common::toUpper(c.name) == wanted) {
                quote = catalog::isStringType(c.typeName);
                break;
            }
        }
        where = catalog::queries::whereEquals(*request.whereColumn, *request.whereValue, quote);
    }

    return catalog::queries::tableContents(request.schema, request.table, request.limit,
                                           request.offset, where);
}

Result<TableContents> MetadataLoader::contentsFromRows(Result<catalog::RowSet> rows,
                                                       const TableContentsRequest& request) const {
    TableContents contents;

    if (rows) {
        contents.rows = std::move(rows).value();
        if (!contents.rows.empty() && contents.rows.front().is_object()) {
            for (const auto& item : contents.rows.front().items())
                contents.columnNames.push_back(item.key());
        } else {
            for (const auto& c : request.columns)
                contents.columnNames.push_back(c.name);
        }
        return contents;
    }

    auto columns = request.columns;
    if (columns.empty())
        columns = mock_.columnsOf(request.schema, request.table);

    if (!request.useMock || columns.empty()) {
        return rows.error();
    }

    spdlog::warn("[MetadataLoader] contents fetch for {}.{} failed ({}), using mock rows",
                 request.schema, request.table, rows.error().message);
    for (const auto& c : columns)
        contents.columnNames.push_back(c.name);
    contents.rows =
        catalog::MockCatalogGenerator::tableRows(request.table, columns, request.limit,
                                                 request.offset);
    return contents;
}

Result<TableContents> MetadataLoader::fetchTableContents(const TableContentsRequest& request) {
    auto sql = contentsQuery(request);
    if (!sql)
        return sql.error();
    return contentsFromRows(fetch(sql.value()), request);
}

boost::asio::awaitable<Result<TableContents>>
MetadataLoader::fetchTableContentsAsync(TableContentsRequest request) {
    auto sql = contentsQuery(request);
    if (!sql)
        co_return Result<TableContents>(sql.error());
    auto rows = co_await fetchAsync(sql.value());
    co_return contentsFromRows(std::move(rows), request);
}

} // namespace schemadex::loader
