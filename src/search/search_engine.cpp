#include <schemadex/common/string_utils.h>
#include <schemadex/search/search_engine.h>

#include <algorithm>
#include <unordered_map>

namespace schemadex::search {

ISearchEngine::ISearchEngine(std::shared_ptr<StringInterner> interner)
    : interner_(interner ? std::move(interner) : std::make_shared<StringInterner>()) {}

std::string ISearchEngine::normalize(std::string_view text) const {
    return common::normalize(text);
}

std::vector<std::string> ISearchEngine::splitWords(std::string_view text) const {
    return common::splitWords(text);
}

std::vector<catalog::TableDescriptor> ISearchEngine::searchTables(std::string_view query) const {
    auto hits = searchTablesScored(query);
    std::vector<catalog::TableDescriptor> out;
    out.reserve(hits.size());
    for (auto& hit : hits)
        out.push_back(std::move(hit.item));
    return out;
}

std::vector<catalog::ColumnDescriptor> ISearchEngine::searchColumns(std::string_view query) const {
    auto hits = searchColumnsScored(query);
    std::vector<catalog::ColumnDescriptor> out;
    out.reserve(hits.size());
    for (auto& hit : hits)
        out.push_back(std::move(hit.item));
    return out;
}

std::vector<TableColumnMatch> ISearchEngine::tablesWithMatchingColumns(std::string_view query) const {
    std::vector<TableColumnMatch> groups;
    std::unordered_map<std::string, size_t> groupIndex;

    for (const auto& hit : searchColumnsScored(query)) {
        auto key = hit.item.tableKey();
        auto [it, inserted] = groupIndex.try_emplace(key, groups.size());
        if (inserted) {
            groups.push_back(TableColumnMatch{hit.item.schema, hit.item.table, 0, hit.score});
        }
        auto& group = groups[it->second];
        ++group.matchCount;
        group.bestScore = std::max(group.bestScore, hit.score);
    }

    std::ranges::stable_sort(groups, [](const TableColumnMatch& a, const TableColumnMatch& b) {
        return a.bestScore > b.bestScore;
    });
    return groups;
}

} // namespace schemadex::search
