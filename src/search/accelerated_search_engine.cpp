#include "scoring.h"

#include <schemadex/common/string_utils.h>
#include <schemadex/search/accelerated_search_engine.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>

namespace schemadex::search {

namespace {

constexpr char kRowTerminator = '\0';

// Byte-wise ASCII fold; bytes >= 0x80 map to themselves
constexpr std::array<char, 256> makeFoldTable() {
    std::array<char, 256> table{};
    for (int i = 0; i < 256; ++i) {
        char c = static_cast<char>(i);
        if (i >= 'A' && i <= 'Z')
            c = static_cast<char>(i - 'A' + 'a');
        table[static_cast<size_t>(i)] = c;
    }
    return table;
}

constexpr auto kFoldTable = makeFoldTable();

} // namespace

//-----------------------------------------------------------------------------
// TextBlock
//-----------------------------------------------------------------------------

void AcceleratedSearchEngine::TextBlock::append(std::string_view text) {
    starts_.push_back(static_cast<uint32_t>(text_.size()));
    text_.append(text);
    text_.push_back(kRowTerminator);
}

std::string_view AcceleratedSearchEngine::TextBlock::row(uint32_t index) const {
    const uint32_t begin = starts_[index];
    const uint32_t end = (index + 1 < starts_.size()) ? starts_[index + 1] - 1
                                                      : static_cast<uint32_t>(text_.size()) - 1;
    return std::string_view(text_).substr(begin, end - begin);
}

void AcceleratedSearchEngine::TextBlock::matchRows(std::string_view needle,
                                                   std::vector<uint32_t>& rows) const {
    if (starts_.empty() || needle.empty())
        return;

    const std::string_view text(text_);
    size_t pos = text.find(needle);
    while (pos != std::string_view::npos) {
        auto it = std::ranges::upper_bound(starts_, static_cast<uint32_t>(pos));
        const auto index = static_cast<uint32_t>(std::distance(starts_.begin(), it) - 1);
        const auto r = row(index);
        const size_t rowEnd = starts_[index] + r.size();

        if (pos + needle.size() <= rowEnd) {
            rows.push_back(index);
            // One hit per row is enough; resume at the next row
            if (index + 1 >= starts_.size())
                break;
            pos = text.find(needle, starts_[index + 1]);
        } else {
            pos = text.find(needle, pos + 1);
        }
    }
}

void AcceleratedSearchEngine::TextBlock::clear() {
    text_.clear();
    starts_.clear();
}

//-----------------------------------------------------------------------------
// AcceleratedSearchEngine
//-----------------------------------------------------------------------------

AcceleratedSearchEngine::AcceleratedSearchEngine(std::shared_ptr<StringInterner> interner)
    : ISearchEngine(std::move(interner)) {}

bool AcceleratedSearchEngine::probe() {
    // The fold table must agree with the reference case folding byte for byte
    std::string all(256, '\0');
    for (int i = 0; i < 256; ++i)
        all[static_cast<size_t>(i)] = static_cast<char>(i);

    const std::string expected = common::toLower(all);
    for (size_t i = 0; i < all.size(); ++i) {
        if (kFoldTable[static_cast<unsigned char>(all[i])] != expected[i])
            return false;
    }
    return true;
}

std::string AcceleratedSearchEngine::fold(std::string_view text) const {
    std::string out;
    out.resize(text.size());
    for (size_t i = 0; i < text.size(); ++i)
        out[i] = kFoldTable[static_cast<unsigned char>(text[i])];
    return out;
}

std::string AcceleratedSearchEngine::normalize(std::string_view text) const {
    std::string out = fold(text);
    std::ranges::replace(out, '_', ' ');
    return out;
}

void AcceleratedSearchEngine::buildIndex(const std::vector<catalog::TableDescriptor>& tables,
                                         const std::vector<catalog::ColumnDescriptor>& columns) {
    auto start = std::chrono::steady_clock::now();

    tables_.clear();
    tableNames_.clear();
    tableNormalized_.clear();
    tableRemarks_.clear();
    tableWords_.clear();
    columns_.clear();
    columnNames_.clear();
    columnNormalized_.clear();
    columnTypes_.clear();
    columnRemarks_.clear();

    tables_.reserve(tables.size());
    for (const auto& t : tables) {
        const auto row = static_cast<uint32_t>(tables_.size());
        tables_.push_back(t);

        const std::string lower = fold(t.name);
        tableNames_.append(lower);
        tableNormalized_.append(normalize(t.name));
        tableRemarks_.append(fold(t.remarks));
        for (auto& word : common::splitIdentifierWords(lower))
            tableWords_.emplace_back(std::move(word), row);
    }
    std::ranges::sort(tableWords_);

    columns_.reserve(columns.size());
    for (const auto& c : columns) {
        columns_.push_back(c);
        columnNames_.append(fold(c.name));
        columnNormalized_.append(normalize(c.name));
        columnTypes_.append(fold(c.typeName));
        columnRemarks_.append(fold(c.remarks));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("[AcceleratedSearch] indexed {} tables, {} columns in {}ms", tables_.size(),
                  columns_.size(), elapsed.count());
}

void AcceleratedSearchEngine::prefixRows(const WordIndex& words, std::string_view prefix,
                                         std::vector<uint32_t>& rows) {
    auto it = std::ranges::lower_bound(words, prefix, {},
                                       [](const auto& entry) { return std::string_view(entry.first); });
    for (; it != words.end() && std::string_view(it->first).starts_with(prefix); ++it)
        rows.push_back(it->second);
}

void AcceleratedSearchEngine::finishRows(std::vector<uint32_t>& rows) {
    std::ranges::sort(rows);
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
}

std::vector<TableHit> AcceleratedSearchEngine::searchTablesScored(std::string_view query) const {
    std::vector<TableHit> hits;
    if (tables_.empty())
        return hits;

    if (query.empty()) {
        hits.reserve(tables_.size());
        for (const auto& t : tables_)
            hits.push_back({t, 0.0});
        return hits;
    }

    const std::string q = fold(query);

    std::vector<uint32_t> rows;
    tableNames_.matchRows(q, rows);
    tableNormalized_.matchRows(q, rows);
    tableRemarks_.matchRows(q, rows);
    prefixRows(tableWords_, q, rows);
    finishRows(rows);

    for (uint32_t row : rows) {
        const double score = detail::scoreTable(
            {tableNames_.row(row), tableNormalized_.row(row), tableRemarks_.row(row)}, q);
        if (score > 0.0)
            hits.push_back({tables_[row], score});
    }

    detail::rankHits(hits);
    return hits;
}

std::vector<ColumnHit> AcceleratedSearchEngine::searchColumnsScored(std::string_view query) const {
    std::vector<ColumnHit> hits;
    if (columns_.empty())
        return hits;

    if (query.empty()) {
        hits.reserve(columns_.size());
        for (const auto& c : columns_)
            hits.push_back({c, 0.0});
        return hits;
    }

    const std::string q = fold(query);

    std::vector<uint32_t> rows;
    columnNames_.matchRows(q, rows);
    columnNormalized_.matchRows(q, rows);
    columnTypes_.matchRows(q, rows);
    columnRemarks_.matchRows(q, rows);
    finishRows(rows);

    for (uint32_t row : rows) {
        const double score =
            detail::scoreColumn({columnNames_.row(row), columnNormalized_.row(row),
                                 columnTypes_.row(row), columnRemarks_.row(row)},
                                q);
        if (score > 0.0)
            hits.push_back({columns_[row], score});
    }

    detail::rankHits(hits);
    return hits;
}

SearchIndexStats AcceleratedSearchEngine::stats() const {
    SearchIndexStats s;
    s.tableCount = tables_.size();
    s.columnCount = columns_.size();
    s.indexNodes = tableWords_.size() + tableNames_.size() + columnNames_.size();
    s.internedStrings = interner_->size();
    return s;
}

} // namespace schemadex::search
