#include <schemadex/common/string_utils.h>
#include <schemadex/search/edit_distance.h>
#include <schemadex/search/fuzzy_match.h>

#include <algorithm>
#include <iterator>

namespace schemadex::search {

namespace {

bool isSubsequence(std::string_view text, std::string_view query) {
    if (query.size() > text.size())
        return false;
    size_t pos = 0;
    for (char ch : query) {
        pos = text.find(ch, pos);
        if (pos == std::string_view::npos)
            return false;
        ++pos;
    }
    return true;
}

} // namespace

bool fuzzyMatch(std::string_view text, std::string_view query) {
    if (query.empty())
        return true;
    if (text.empty())
        return false;

    const std::string textLower = common::toLower(text);
    const std::string queryLower = common::toLower(query);

    if (textLower.find(queryLower) != std::string::npos)
        return true;

    for (std::string_view token : common::splitAlnumTokens(textLower)) {
        if (token.starts_with(queryLower))
            return true;
        if (editDistanceBounded(token, queryLower, 1) <= 1)
            return true;
    }

    return isSubsequence(textLower, queryLower);
}

std::vector<catalog::TableDescriptor>
filterTables(const std::vector<catalog::TableDescriptor>& tables, std::string_view query) {
    if (query.empty())
        return tables;

    std::vector<catalog::TableDescriptor> out;
    std::ranges::copy_if(tables, std::back_inserter(out), [&](const auto& t) {
        return fuzzyMatch(t.name, query) || fuzzyMatch(t.remarks, query);
    });
    return out;
}

std::vector<catalog::ColumnDescriptor>
filterColumns(const std::vector<catalog::ColumnDescriptor>& columns, std::string_view query) {
    if (query.empty())
        return columns;

    std::vector<catalog::ColumnDescriptor> out;
    std::ranges::copy_if(columns, std::back_inserter(out), [&](const auto& c) {
        return fuzzyMatch(c.name, query) || fuzzyMatch(c.typeName, query);
    });
    return out;
}

} // namespace schemadex::search
