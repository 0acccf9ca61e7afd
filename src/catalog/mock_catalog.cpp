#include <schemadex/catalog/mock_catalog.h>
#include <schemadex/common/string_utils.h>

#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <set>

namespace schemadex::catalog {

namespace {

ColumnDescriptor column(std::string schema, std::string table, std::string name,
                        std::string typeName, int64_t length, int64_t scale, Nullable nullable,
                        std::string remarks) {
    return ColumnDescriptor{std::move(schema), std::move(table),   std::move(name),
                            std::move(typeName), length,           scale,
                            nullable,            std::move(remarks)};
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() && common::toUpper(a) == common::toUpper(b);
}

} // namespace

MockCatalogGenerator::MockCatalogGenerator(DataSet dataSet) : dataSet_(dataSet) {
    if (dataSet_ == DataSet::Heavy)
        buildHeavy();
    else
        buildStandard();
}

void MockCatalogGenerator::buildStandard() {
    using N = Nullable;
    data_.tables = {
        {"TEST", "USERS", "User information table"},
        {"TEST", "ORDERS", "Order records table"},
        {"TEST", "PRODUCTS", "Product catalog table"},
        {"DACDATA", "CUSTOMERS", "Customer data"},
        {"DACDATA", "INVOICES", "Invoice records"},
        {"DACDATA", "OHHST", "OH HST master history table"},
    };

    data_.columns = {
        column("TEST", "USERS", "ID", "INTEGER", 10, 0, N::No, "User identifier"),
        column("TEST", "USERS", "NAME", "VARCHAR", 100, 0, N::No, "User name"),
        column("TEST", "USERS", "EMAIL", "VARCHAR", 255, 0, N::Yes, "User email address"),
        column("TEST", "ORDERS", "ID", "INTEGER", 10, 0, N::No, "Order identifier"),
        column("TEST", "ORDERS", "USER_ID", "INTEGER", 10, 0, N::No, "Foreign key to USERS"),
        column("TEST", "ORDERS", "PRODUCT_ID", "INTEGER", 10, 0, N::No, "Foreign key to PRODUCTS"),
        column("TEST", "ORDERS", "ORDER_DATE", "DATE", 10, 0, N::No, "Date of order"),
        column("TEST", "PRODUCTS", "ID", "INTEGER", 10, 0, N::No, "Product identifier"),
        column("TEST", "PRODUCTS", "NAME", "VARCHAR", 200, 0, N::No, "Product name"),
        column("TEST", "PRODUCTS", "PRICE", "DECIMAL", 10, 2, N::No, "Product price"),
        column("DACDATA", "CUSTOMERS", "CUST_ID", "INTEGER", 10, 0, N::No, "Customer identifier"),
        column("DACDATA", "CUSTOMERS", "CUST_NAME", "VARCHAR", 150, 0, N::No, "Customer name"),
        column("DACDATA", "INVOICES", "INV_ID", "INTEGER", 10, 0, N::No, "Invoice identifier"),
        column("DACDATA", "INVOICES", "CUST_ID", "INTEGER", 10, 0, N::No,
               "Foreign key to CUSTOMERS"),
        column("DACDATA", "INVOICES", "INV_DATE", "DATE", 10, 0, N::No, "Invoice date"),
    };
}

void MockCatalogGenerator::buildHeavy() {
    static constexpr std::array<std::string_view, kHeavySchemas> kSchemas = {
        "SALES", "FINANCE", "INVENTORY", "HR", "LOGISTICS"};
    static constexpr std::array<std::string_view, 10> kTableWords = {
        "CUSTOMER", "ORDER",   "INVOICE", "PRODUCT",  "ACCOUNT",
        "PAYMENT",  "SUPPLIER", "EMPLOYEE", "SHIPMENT", "LEDGER"};
    struct ColumnShape {
        std::string_view word;
        std::string_view type;
        int64_t length;
        int64_t scale;
    };
    static constexpr std::array<ColumnShape, 5> kShapes = {{
        {"ID", "INTEGER", 10, 0},
        {"NAME", "VARCHAR", 100, 0},
        {"AMOUNT", "DECIMAL", 12, 2},
        {"CREATED", "DATE", 10, 0},
        {"CODE", "CHAR", 8, 0},
    }};

    data_.tables.reserve(kHeavySchemas * kHeavyTablesPerSchema);
    data_.columns.reserve(kHeavySchemas * kHeavyTablesPerSchema * kHeavyColumnsPerTable);

    for (auto schemaName : kSchemas) {
        const std::string schema(schemaName);
        for (int t = 0; t < kHeavyTablesPerSchema; ++t) {
            const auto word = kTableWords[static_cast<size_t>(t) % kTableWords.size()];
            std::string table = fmt::format("{}_{:02}", word, t);
            data_.tables.push_back(TableDescriptor{
                schema, table, fmt::format("{} table {} in {}", common::toLower(word), t, schema)});

            for (int c = 0; c < kHeavyColumnsPerTable; ++c) {
                const auto& shape = kShapes[static_cast<size_t>(c) % kShapes.size()];
                data_.columns.push_back(
                    column(schema, table, fmt::format("{}_{:02}", shape.word, c),
                           std::string(shape.type), shape.length, shape.scale,
                           c % 3 == 2 ? Nullable::Yes : Nullable::No,
                           fmt::format("Column {} of {}", c, table)));
            }
        }
    }
}

CatalogSnapshot MockCatalogGenerator::catalog(const std::optional<std::string>& schemaFilter,
                                              std::optional<int64_t> limit,
                                              std::optional<int64_t> offset) const {
    std::vector<TableDescriptor> matching;
    for (const auto& t : data_.tables) {
        if (!schemaFilter || schemaFilter->empty() || equalsIgnoreCase(t.schema, *schemaFilter))
            matching.push_back(t);
    }

    const auto begin = static_cast<size_t>(std::max<int64_t>(0, offset.value_or(0)));
    const size_t first = std::min(begin, matching.size());
    size_t last = matching.size();
    if (limit)
        last = std::min(last, first + static_cast<size_t>(std::max<int64_t>(0, *limit)));

    CatalogSnapshot out;
    out.tables.assign(matching.begin() + static_cast<std::ptrdiff_t>(first),
                      matching.begin() + static_cast<std::ptrdiff_t>(last));

    std::set<std::pair<std::string, std::string>> keep;
    for (const auto& t : out.tables)
        keep.emplace(t.schema, t.name);
    for (const auto& c : data_.columns) {
        if (keep.contains({c.schema, c.table}))
            out.columns.push_back(c);
    }
    return out;
}

std::vector<SchemaInfo> MockCatalogGenerator::schemas() const {
    if (dataSet_ == DataSet::Heavy) {
        std::vector<SchemaInfo> out;
        for (const auto& t : data_.tables) {
            if (out.empty() || out.back().name != t.schema)
                out.push_back(SchemaInfo{t.schema, 0});
            ++out.back().tableCount;
        }
        return out;
    }
    return {
        {"DACDATA", 15},
        {"TEST", 8},
        {"QGPL", 23},
        {"PRODUCTION", 42},
    };
}

bool MockCatalogGenerator::schemaExists(std::string_view schema) const {
    if (dataSet_ == DataSet::Heavy) {
        return std::ranges::any_of(data_.tables, [&](const TableDescriptor& t) {
            return equalsIgnoreCase(t.schema, schema);
        });
    }
    return equalsIgnoreCase(schema, "DACDATA");
}

std::vector<ColumnDescriptor> MockCatalogGenerator::columnsOf(std::string_view schema,
                                                              std::string_view table) const {
    std::vector<ColumnDescriptor> out;
    for (const auto& c : data_.columns) {
        if (equalsIgnoreCase(c.schema, schema) && equalsIgnoreCase(c.table, table))
            out.push_back(c);
    }
    return out;
}

RowSet MockCatalogGenerator::tableRows(std::string_view table,
                                       const std::vector<ColumnDescriptor>& columns, int64_t limit,
                                       int64_t offset) {
    RowSet rows;
    if (limit <= 0)
        return rows;
    rows.reserve(static_cast<size_t>(limit));

    for (int64_t rowId = offset; rowId < offset + limit; ++rowId) {
        Row row = Row::object();
        for (size_t i = 0; i < columns.size(); ++i) {
            const auto& col = columns[i];
            const auto type = common::toUpper(col.typeName);
            const auto ordinal = static_cast<int64_t>(i);

            if (type.find("INT") != std::string::npos) {
                row[col.name] = rowId * 100 + ordinal;
            } else if (type.find("DECIMAL") != std::string::npos ||
                       type.find("FLOAT") != std::string::npos) {
                row[col.name] = static_cast<double>(rowId) * 10.5 + static_cast<double>(ordinal);
            } else if (type.find("DATE") != std::string::npos) {
                const int64_t day = (rowId % 28) + 1;
                const int64_t month = ((rowId / 28) % 12) + 1;
                row[col.name] = fmt::format("2024-{:02}-{:02}", month, day);
            } else {
                row[col.name] = fmt::format("{}.{}.row{}", table, col.name, rowId);
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace schemadex::catalog
