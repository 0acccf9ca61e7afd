#pragma once

#include <schemadex/search/prefix_trie.h>
#include <schemadex/search/search_engine.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace schemadex::search {

/**
 * @brief Trie-backed reference search engine
 *
 * Keeps four tries (table names, table-name words, column names, column-name
 * words) keyed by the interned lower-cased name. A key maps to every row
 * carrying that name, since the same table or column name can appear in
 * many schemas.
 */
class ReferenceSearchEngine : public ISearchEngine {
public:
    explicit ReferenceSearchEngine(std::shared_ptr<StringInterner> interner = nullptr);

    void buildIndex(const std::vector<catalog::TableDescriptor>& tables,
                    const std::vector<catalog::ColumnDescriptor>& columns) override;

    std::vector<TableHit> searchTablesScored(std::string_view query) const override;
    std::vector<ColumnHit> searchColumnsScored(std::string_view query) const override;

    SearchIndexStats stats() const override;

    std::string_view name() const override { return "reference"; }

private:
    // Interned views; remarks are rarely shared so they are not interned
    struct TableRecord {
        std::string_view schema;
        std::string_view name;
        std::string remarks;
        std::string_view nameLower;
        std::string_view nameNormalized;
        std::string remarksLower;
    };

    struct ColumnRecord {
        std::string_view schema;
        std::string_view table;
        std::string_view name;
        std::string_view typeName;
        std::optional<int64_t> length;
        std::optional<int64_t> scale;
        catalog::Nullable nullable = catalog::Nullable::No;
        std::string remarks;
        std::string_view nameLower;
        std::string_view nameNormalized;
        std::string_view typeLower;
        std::string remarksLower;
    };

    using RowList = std::vector<uint32_t>;

    void clear();
    void collectRows(const PrefixTrie::KeySet& keys,
                     const std::unordered_map<std::string_view, RowList>& lookup,
                     std::vector<uint32_t>& rows) const;

    catalog::TableDescriptor toDescriptor(const TableRecord& r) const;
    catalog::ColumnDescriptor toDescriptor(const ColumnRecord& r) const;

    std::vector<TableRecord> tables_;
    std::vector<ColumnRecord> columns_;

    PrefixTrie tableNameTrie_;
    PrefixTrie tableWordTrie_;
    PrefixTrie columnNameTrie_;
    PrefixTrie columnWordTrie_;

    std::unordered_map<std::string_view, RowList> tableLookup_;
    std::unordered_map<std::string_view, RowList> columnLookup_;
};

} // namespace schemadex::search
