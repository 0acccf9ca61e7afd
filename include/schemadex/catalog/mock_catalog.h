#pragma once

#include <schemadex/catalog/descriptors.h>
#include <schemadex/catalog/row_fetcher.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemadex::catalog {

/**
 * @brief Deterministic stand-in catalog for offline use and tests
 *
 * Standard: six tables in TEST and DACDATA with hand-written columns.
 * Heavy: 5 schemas x 50 tables x 20 columns of generated names for load
 * testing.
 */
class MockCatalogGenerator {
public:
    enum class DataSet { Standard, Heavy };

    static constexpr int kHeavySchemas = 5;
    static constexpr int kHeavyTablesPerSchema = 50;
    static constexpr int kHeavyColumnsPerTable = 20;

    explicit MockCatalogGenerator(DataSet dataSet = DataSet::Standard);

    DataSet dataSet() const { return dataSet_; }

    const CatalogSnapshot& all() const { return data_; }

    /**
     * Tables of the (case-insensitive) schema filter, skipped by offset and
     * capped by limit; columns are those of the returned tables.
     */
    CatalogSnapshot catalog(const std::optional<std::string>& schemaFilter,
                            std::optional<int64_t> limit = std::nullopt,
                            std::optional<int64_t> offset = std::nullopt) const;

    std::vector<SchemaInfo> schemas() const;

    bool schemaExists(std::string_view schema) const;

    /// Columns of schema.table in ordinal order (case-insensitive lookup)
    std::vector<ColumnDescriptor> columnsOf(std::string_view schema, std::string_view table) const;

    /**
     * @brief Synthesized rows row_id in [offset, offset + limit)
     *
     * Value of column i: integer types row_id*100+i, decimal and float types
     * row_id*10.5+i, dates 2024-MM-DD cycling through 28 days and 12 months,
     * anything else "{table}.{column}.row{row_id}".
     */
    static RowSet tableRows(std::string_view table, const std::vector<ColumnDescriptor>& columns,
                            int64_t limit, int64_t offset);

private:
    void buildStandard();
    void buildHeavy();

    DataSet dataSet_;
    CatalogSnapshot data_;
};

} // namespace schemadex::catalog
