#pragma once

#include <algorithm>
#include <string_view>
#include <vector>

namespace schemadex::search::detail {

inline constexpr double kExactNameScore = 2.0;
inline constexpr double kNameSubstringScore = 1.0;
inline constexpr double kTableRemarksScore = 0.8;
inline constexpr double kTableWordPrefixScore = 0.6;
inline constexpr double kColumnTypeScore = 0.7;
inline constexpr double kColumnRemarksScore = 0.5;

// Pre-folded fields; all views are lower-case
struct TableFields {
    std::string_view nameLower;
    std::string_view nameNormalized; // '_' -> ' '
    std::string_view remarksLower;
};

struct ColumnFields {
    std::string_view nameLower;
    std::string_view nameNormalized;
    std::string_view typeLower;
    std::string_view remarksLower;
};

inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

inline bool anyWordStartsWith(std::string_view normalized, std::string_view query) {
    size_t i = 0;
    while (i < normalized.size()) {
        while (i < normalized.size() && normalized[i] == ' ')
            ++i;
        size_t end = normalized.find(' ', i);
        if (end == std::string_view::npos)
            end = normalized.size();
        if (end > i && normalized.substr(i, end - i).starts_with(query))
            return true;
        i = end;
    }
    return false;
}

inline double scoreTable(const TableFields& f, std::string_view queryLower) {
    if (f.nameLower == queryLower)
        return kExactNameScore;
    if (contains(f.nameLower, queryLower) || contains(f.nameNormalized, queryLower))
        return kNameSubstringScore;
    if (contains(f.remarksLower, queryLower))
        return kTableRemarksScore;
    if (anyWordStartsWith(f.nameNormalized, queryLower))
        return kTableWordPrefixScore;
    return 0.0;
}

inline double scoreColumn(const ColumnFields& f, std::string_view queryLower) {
    if (f.nameLower == queryLower)
        return kExactNameScore;
    if (contains(f.nameLower, queryLower) || contains(f.nameNormalized, queryLower))
        return kNameSubstringScore;
    if (contains(f.typeLower, queryLower))
        return kColumnTypeScore;
    if (contains(f.remarksLower, queryLower))
        return kColumnRemarksScore;
    return 0.0;
}

// Candidates arrive sorted by row; stable sort keeps insertion order on ties
template <typename Hit> void rankHits(std::vector<Hit>& hits) {
    std::ranges::stable_sort(hits, [](const Hit& a, const Hit& b) { return a.score > b.score; });
}

} // namespace schemadex::search::detail
