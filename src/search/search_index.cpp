#include "scoring.h"

#include <schemadex/common/string_utils.h>
#include <schemadex/search/search_index.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace schemadex::search {

ReferenceSearchEngine::ReferenceSearchEngine(std::shared_ptr<StringInterner> interner)
    : ISearchEngine(std::move(interner)) {}

void ReferenceSearchEngine::clear() {
    tables_.clear();
    columns_.clear();
    tableNameTrie_.clear();
    tableWordTrie_.clear();
    columnNameTrie_.clear();
    columnWordTrie_.clear();
    tableLookup_.clear();
    columnLookup_.clear();
}

void ReferenceSearchEngine::buildIndex(const std::vector<catalog::TableDescriptor>& tables,
                                       const std::vector<catalog::ColumnDescriptor>& columns) {
    auto start = std::chrono::steady_clock::now();
    clear();

    tables_.reserve(tables.size());
    for (const auto& t : tables) {
        const auto row = static_cast<uint32_t>(tables_.size());

        TableRecord rec;
        rec.schema = intern(t.schema);
        rec.name = intern(t.name);
        rec.remarks = t.remarks;
        rec.nameLower = intern(common::toLower(t.name));
        rec.nameNormalized = intern(normalize(t.name));
        rec.remarksLower = common::toLower(t.remarks);

        const auto key = rec.nameLower;
        tableLookup_[key].push_back(row);
        tableNameTrie_.insert(rec.nameLower, key);
        for (const auto& word : common::splitIdentifierWords(rec.nameLower))
            tableWordTrie_.insert(word, key);

        tables_.push_back(std::move(rec));
    }

    columns_.reserve(columns.size());
    for (const auto& c : columns) {
        const auto row = static_cast<uint32_t>(columns_.size());

        ColumnRecord rec;
        rec.schema = intern(c.schema);
        rec.table = intern(c.table);
        rec.name = intern(c.name);
        rec.typeName = intern(c.typeName);
        rec.length = c.length;
        rec.scale = c.scale;
        rec.nullable = c.nullable;
        rec.remarks = c.remarks;
        rec.nameLower = intern(common::toLower(c.name));
        rec.nameNormalized = intern(normalize(c.name));
        rec.typeLower = intern(common::toLower(c.typeName));
        rec.remarksLower = common::toLower(c.remarks);

        const auto key = rec.nameLower;
        columnLookup_[key].push_back(row);
        columnNameTrie_.insert(rec.nameLower, key);
        for (const auto& word : common::splitIdentifierWords(rec.nameLower))
            columnWordTrie_.insert(word, key);

        columns_.push_back(std::move(rec));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("[SearchIndex] indexed {} tables, {} columns in {}ms ({} interned strings)",
                  tables_.size(), columns_.size(), elapsed.count(), interner_->size());
}

void ReferenceSearchEngine::collectRows(const PrefixTrie::KeySet& keys,
                                        const std::unordered_map<std::string_view, RowList>& lookup,
                                        std::vector<uint32_t>& rows) const {
    for (const auto& key : keys) {
        auto it = lookup.find(key);
        if (it != lookup.end())
            rows.insert(rows.end(), it->second.begin(), it->second.end());
    }
}

std::vector<TableHit> ReferenceSearchEngine::searchTablesScored(std::string_view query) const {
    std::vector<TableHit> hits;
    if (tables_.empty())
        return hits;

    if (query.empty()) {
        hits.reserve(tables_.size());
        for (const auto& rec : tables_)
            hits.push_back({toDescriptor(rec), 0.0});
        return hits;
    }

    const std::string q = common::toLower(query);

    std::vector<uint32_t> rows;
    collectRows(tableNameTrie_.searchPrefix(q), tableLookup_, rows);
    collectRows(tableWordTrie_.searchPrefix(q), tableLookup_, rows);
    for (const auto& word : common::splitIdentifierWords(q))
        collectRows(tableWordTrie_.searchPrefix(word), tableLookup_, rows);

    // The tries only reach prefixes of names and words. A substring in the
    // middle of a name ("accounts" in USER_ACCOUNTS) or a remarks hit needs
    // the scan; every trie candidate is also found here.
    for (uint32_t row = 0; row < tables_.size(); ++row) {
        const auto& rec = tables_[row];
        if (detail::contains(rec.nameLower, q) || detail::contains(rec.nameNormalized, q) ||
            detail::contains(rec.remarksLower, q)) {
            rows.push_back(row);
        }
    }

    std::ranges::sort(rows);
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());

    for (uint32_t row : rows) {
        const auto& rec = tables_[row];
        const double score =
            detail::scoreTable({rec.nameLower, rec.nameNormalized, rec.remarksLower}, q);
        if (score > 0.0)
            hits.push_back({toDescriptor(rec), score});
    }

    detail::rankHits(hits);
    return hits;
}

std::vector<ColumnHit> ReferenceSearchEngine::searchColumnsScored(std::string_view query) const {
    std::vector<ColumnHit> hits;
    if (columns_.empty())
        return hits;

    if (query.empty()) {
        hits.reserve(columns_.size());
        for (const auto& rec : columns_)
            hits.push_back({toDescriptor(rec), 0.0});
        return hits;
    }

    const std::string q = common::toLower(query);

    std::vector<uint32_t> rows;
    collectRows(columnNameTrie_.searchPrefix(q), columnLookup_, rows);
    collectRows(columnWordTrie_.searchPrefix(q), columnLookup_, rows);

    // Mid-name substrings, type names and remarks are only found by the scan
    for (uint32_t row = 0; row < columns_.size(); ++row) {
        const auto& rec = columns_[row];
        if (detail::contains(rec.nameLower, q) || detail::contains(rec.nameNormalized, q) ||
            detail::contains(rec.typeLower, q) || detail::contains(rec.remarksLower, q)) {
            rows.push_back(row);
        }
    }

    std::ranges::sort(rows);
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());

    for (uint32_t row : rows) {
        const auto& rec = columns_[row];
        const double score = detail::scoreColumn(
            {rec.nameLower, rec.nameNormalized, rec.typeLower, rec.remarksLower}, q);
        if (score > 0.0)
            hits.push_back({toDescriptor(rec), score});
    }

    detail::rankHits(hits);
    return hits;
}

SearchIndexStats ReferenceSearchEngine::stats() const {
    SearchIndexStats s;
    s.tableCount = tables_.size();
    s.columnCount = columns_.size();
    s.indexNodes = tableNameTrie_.nodeCount() + tableWordTrie_.nodeCount() +
                   columnNameTrie_.nodeCount() + columnWordTrie_.nodeCount();
    s.internedStrings = interner_->size();
    return s;
}

catalog::TableDescriptor ReferenceSearchEngine::toDescriptor(const TableRecord& r) const {
    return catalog::TableDescriptor{std::string(r.schema), std::string(r.name), r.remarks};
}

catalog::ColumnDescriptor ReferenceSearchEngine::toDescriptor(const ColumnRecord& r) const {
    catalog::ColumnDescriptor c;
    c.schema = r.schema;
    c.table = r.table;
    c.name = r.name;
    c.typeName = r.typeName;
    c.length = r.length;
    c.scale = r.scale;
    c.nullable = r.nullable;
    c.remarks = r.remarks;
    return c;
}

} // namespace schemadex::search
