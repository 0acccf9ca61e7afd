#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace schemadex::common {

// ASCII case folding; bytes outside ASCII (UTF-8 sequences) pass through unchanged.
std::string toLower(std::string_view s);
std::string toUpper(std::string_view s);

/**
 * @brief Lower-case and turn underscores into spaces.
 *
 * "CUSTOMER_ORDER" -> "customer order". Empty input yields an empty string.
 */
std::string normalize(std::string_view s);

/// Split on ASCII whitespace, dropping empty pieces.
std::vector<std::string> splitWords(std::string_view s);

/// Split on whitespace and underscores (identifier words). Input is not lower-cased.
std::vector<std::string> splitIdentifierWords(std::string_view s);

/**
 * @brief Split on anything that is not alphanumeric.
 *
 * Non-ASCII bytes count as word characters so UTF-8 names stay whole.
 */
std::vector<std::string_view> splitAlnumTokens(std::string_view s);

} // namespace schemadex::common
