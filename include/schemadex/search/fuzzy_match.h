#pragma once

#include <schemadex/catalog/descriptors.h>

#include <string_view>
#include <vector>

namespace schemadex::search {

/**
 * @brief Case-insensitive fuzzy predicate.
 *
 * Tried in order, first hit wins:
 *  1. empty query matches everything (including empty text)
 *  2. empty text never matches a non-empty query
 *  3. substring containment
 *  4. a token of text (split on non-alphanumerics) starts with the query,
 *     or is within one edit of it
 *  5. the query is a subsequence of the text ("TUT" in "TEST_USER_TABLE")
 */
bool fuzzyMatch(std::string_view text, std::string_view query);

/// Tables whose name or remarks fuzzy-match the query, in input order.
std::vector<catalog::TableDescriptor>
filterTables(const std::vector<catalog::TableDescriptor>& tables, std::string_view query);

/// Columns whose name or type name fuzzy-match the query, in input order.
std::vector<catalog::ColumnDescriptor>
filterColumns(const std::vector<catalog::ColumnDescriptor>& columns, std::string_view query);

} // namespace schemadex::search
