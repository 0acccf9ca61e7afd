#include <schemadex/catalog/catalog_queries.h>
#include <schemadex/common/string_utils.h>

#include <fmt/format.h>
#include <array>

namespace schemadex::catalog {

namespace queries {

namespace {
constexpr const char* kUserTablePredicate = "TABLE_TYPE IN ('T', 'P') AND SYSTEM_TABLE = 'N'";

std::string schemaClause(const std::optional<std::string>& schemaFilter) {
    if (!schemaFilter || schemaFilter->empty())
        return {};
    return fmt::format(" AND TABLE_SCHEMA = {}", quoteLiteral(common::toUpper(*schemaFilter)));
}

std::string pageClause(std::optional<int64_t> limit, std::optional<int64_t> offset) {
    if (!limit)
        return {};
    const int64_t off = offset.value_or(0);
    if (off > 0)
        return fmt::format(" OFFSET {} ROWS FETCH FIRST {} ROWS ONLY", off, *limit);
    return fmt::format(" FETCH FIRST {} ROWS ONLY", *limit);
}
} // namespace

std::string tables(const std::optional<std::string>& schemaFilter, std::optional<int64_t> limit,
                   std::optional<int64_t> offset) {
    return fmt::format("SELECT TABLE_SCHEMA, TABLE_NAME, TABLE_TEXT FROM QSYS2.SYSTABLES "
                       "WHERE {}{} ORDER BY TABLE_SCHEMA, TABLE_NAME{}",
                       kUserTablePredicate, schemaClause(schemaFilter), pageClause(limit, offset));
}

std::string columns(const std::optional<std::string>& schemaFilter) {
    return fmt::format(
        "SELECT TABLE_SCHEMA, TABLE_NAME, COLUMN_NAME, DATA_TYPE, LENGTH, NUMERIC_SCALE, "
        "IS_NULLABLE, COLUMN_TEXT FROM QSYS2.SYSCOLUMNS WHERE TABLE_SCHEMA IN ("
        "SELECT TABLE_SCHEMA FROM QSYS2.SYSTABLES WHERE {}{}) "
        "ORDER BY TABLE_SCHEMA, TABLE_NAME, ORDINAL_POSITION",
        kUserTablePredicate, schemaClause(schemaFilter));
}

std::string schemas() {
    return fmt::format("SELECT TABLE_SCHEMA, COUNT(*) AS TABLE_COUNT FROM QSYS2.SYSTABLES "
                       "WHERE {} GROUP BY TABLE_SCHEMA ORDER BY TABLE_COUNT DESC, TABLE_SCHEMA",
                       kUserTablePredicate);
}

std::string schemaProbe(std::string_view schema) {
    return fmt::format("SELECT 1 FROM QSYS2.SYSTABLES WHERE TABLE_SCHEMA = {} AND {} "
                       "FETCH FIRST 1 ROWS ONLY",
                       quoteLiteral(common::toUpper(schema)), kUserTablePredicate);
}

std::string tableContents(std::string_view schema, std::string_view table, int64_t limit,
                          int64_t offset, const std::string& whereClause) {
    return fmt::format("SELECT * FROM {}.{}{} ORDER BY 1{}", schema, table, whereClause,
                       pageClause(limit, offset));
}

std::string whereEquals(std::string_view column, std::string_view value, bool quoteValue) {
    return fmt::format(" WHERE {} = {}", column,
                       quoteValue ? quoteLiteral(value) : std::string(value));
}

std::string quoteLiteral(std::string_view value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'')
            out += "''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace queries

bool isStringType(std::string_view typeName) {
    if (typeName.empty())
        return true;
    static constexpr std::array<std::string_view, 7> kTextual = {
        "CHAR", "VARCHAR", "CLOB", "TEXT", "DATE", "TIMESTAMP", "TIME"};
    const auto upper = common::toUpper(typeName);
    for (auto t : kTextual) {
        if (upper.find(t) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace schemadex::catalog
