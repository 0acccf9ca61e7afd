#include <schemadex/search/edit_distance.h>

#include <algorithm>
#include <vector>

namespace schemadex::search {

size_t editDistance(std::string_view a, std::string_view b) {
    // Keep the DP row as short as possible
    if (a.size() < b.size())
        std::swap(a, b);

    const size_t m = a.size();
    const size_t n = b.size();
    if (n == 0)
        return m;

    std::vector<size_t> row(n + 1);
    for (size_t j = 0; j <= n; ++j)
        row[j] = j;

    for (size_t i = 1; i <= m; ++i) {
        size_t diag = row[0];
        row[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            const size_t above = row[j];
            const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            row[j] = std::min({
                above + 1,      // deletion
                row[j - 1] + 1, // insertion
                diag + cost     // substitution
            });
            diag = above;
        }
    }

    return row[n];
}

size_t editDistanceBounded(std::string_view a, std::string_view b, size_t maxDist) {
    if (a.size() < b.size())
        std::swap(a, b);

    const size_t m = a.size();
    const size_t n = b.size();

    // The distance never exceeds the longer length, so the bound cannot trigger
    if (maxDist >= m)
        return editDistance(a, b);

    const size_t overLimit = maxDist + 1;
    if (m - n > maxDist)
        return overLimit;
    if (n == 0)
        return m;

    std::vector<size_t> row(n + 1);
    for (size_t j = 0; j <= n; ++j)
        row[j] = j;

    for (size_t i = 1; i <= m; ++i) {
        size_t diag = row[0];
        row[0] = i;
        size_t rowMin = row[0];
        for (size_t j = 1; j <= n; ++j) {
            const size_t above = row[j];
            const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            row[j] = std::min({above + 1, row[j - 1] + 1, diag + cost});
            diag = above;
            rowMin = std::min(rowMin, row[j]);
        }
        // Values never decrease from one row to the next along any path
        if (rowMin > maxDist)
            return overLimit;
    }

    return row[n] > maxDist ? overLimit : row[n];
}

} // namespace schemadex::search
