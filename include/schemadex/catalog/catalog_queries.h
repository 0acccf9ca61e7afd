#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace schemadex::catalog {

/// DB2 for i catalog statements (QSYS2 views)
namespace queries {

/// User tables and physical files, optionally one schema, optionally paged
std::string tables(const std::optional<std::string>& schemaFilter,
                   std::optional<int64_t> limit = std::nullopt,
                   std::optional<int64_t> offset = std::nullopt);

/// Columns of every user table, optionally one schema
std::string columns(const std::optional<std::string>& schemaFilter);

/// Schemas with their table counts, largest first
std::string schemas();

/// Returns one row when the schema holds at least one user table
std::string schemaProbe(std::string_view schema);

/// `SELECT *` page over schema.table ordered by the first column
std::string tableContents(std::string_view schema, std::string_view table, int64_t limit,
                          int64_t offset, const std::string& whereClause = {});

/// " WHERE col = value" with the value quoted when quoteValue is set
std::string whereEquals(std::string_view column, std::string_view value, bool quoteValue);

/// Single-quoted SQL literal with embedded quotes doubled
std::string quoteLiteral(std::string_view value);

} // namespace queries

/// Character, text, date and time types compare as quoted literals; unknown types too
bool isStringType(std::string_view typeName);

} // namespace schemadex::catalog
