#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace schemadex::catalog {

/**
 * @brief A table as reported by the database catalog.
 *
 * Identity is (schema, name).
 */
struct TableDescriptor {
    std::string schema;
    std::string name;
    std::string remarks;

    std::string qualifiedName() const { return schema + "." + name; }

    bool operator==(const TableDescriptor& other) const = default;
};

enum class Nullable : uint8_t { No = 0, Yes = 1 };

/**
 * @brief A column as reported by the database catalog.
 *
 * Identity is (schema, table, name).
 */
struct ColumnDescriptor {
    std::string schema;
    std::string table;
    std::string name;
    std::string typeName;
    std::optional<int64_t> length;
    std::optional<int64_t> scale;
    Nullable nullable = Nullable::No;
    std::string remarks;

    std::string qualifiedName() const { return schema + "." + table + "." + name; }
    std::string tableKey() const { return schema + "." + table; }

    bool operator==(const ColumnDescriptor& other) const = default;
};

struct SchemaInfo {
    std::string name;
    int64_t tableCount = 0;

    bool operator==(const SchemaInfo& other) const = default;
};

/// Tables and columns loaded together for one (schema filter, page) request.
struct CatalogSnapshot {
    std::vector<TableDescriptor> tables;
    std::vector<ColumnDescriptor> columns;
};

// "Y"/"N" flag as stored in catalog views
inline const char* nullableFlag(Nullable n) {
    return n == Nullable::Yes ? "Y" : "N";
}

void to_json(nlohmann::json& j, const TableDescriptor& t);
void from_json(const nlohmann::json& j, TableDescriptor& t);
void to_json(nlohmann::json& j, const ColumnDescriptor& c);
void from_json(const nlohmann::json& j, ColumnDescriptor& c);

} // namespace schemadex::catalog
