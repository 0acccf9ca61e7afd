#pragma once

#include <schemadex/search/search_engine.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schemadex::search {

/**
 * @brief Flat-index search engine
 *
 * Same contract and results as ReferenceSearchEngine, laid out for speed:
 * each searchable field is folded once into one contiguous text block, so a
 * substring query is a single scan over the block instead of one find() per
 * row, and name words live in a sorted array searched with binary search
 * instead of a pointer-linked trie. Descriptors are stored by value, so this
 * engine does not add to the shared interner.
 */
class AcceleratedSearchEngine : public ISearchEngine {
public:
    explicit AcceleratedSearchEngine(std::shared_ptr<StringInterner> interner = nullptr);

    void buildIndex(const std::vector<catalog::TableDescriptor>& tables,
                    const std::vector<catalog::ColumnDescriptor>& columns) override;

    std::vector<TableHit> searchTablesScored(std::string_view query) const override;
    std::vector<ColumnHit> searchColumnsScored(std::string_view query) const override;

    SearchIndexStats stats() const override;

    std::string_view name() const override { return "accelerated"; }

    std::string normalize(std::string_view text) const override;

    /// Runtime capability check used by the engine registry
    static bool probe();

private:
    // Rows packed back to back, each terminated by '\0'
    class TextBlock {
    public:
        void append(std::string_view text);
        std::string_view row(uint32_t index) const;
        void matchRows(std::string_view needle, std::vector<uint32_t>& rows) const;
        void clear();
        size_t size() const { return starts_.size(); }

    private:
        std::string text_;
        std::vector<uint32_t> starts_;
    };

    using WordIndex = std::vector<std::pair<std::string, uint32_t>>;

    static void prefixRows(const WordIndex& words, std::string_view prefix,
                           std::vector<uint32_t>& rows);
    static void finishRows(std::vector<uint32_t>& rows);

    std::string fold(std::string_view text) const;

    std::vector<catalog::TableDescriptor> tables_;
    TextBlock tableNames_;
    TextBlock tableNormalized_;
    TextBlock tableRemarks_;
    WordIndex tableWords_;

    std::vector<catalog::ColumnDescriptor> columns_;
    TextBlock columnNames_;
    TextBlock columnNormalized_;
    TextBlock columnTypes_;
    TextBlock columnRemarks_;
};

} // namespace schemadex::search
