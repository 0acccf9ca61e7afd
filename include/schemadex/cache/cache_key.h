#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace schemadex::cache {

inline constexpr std::string_view kAllSchemasKey = "ALL_SCHEMAS";

/**
 * @brief Cache key for a (schema filter, limit, offset) request
 *
 * "ALL_SCHEMAS" without a filter, else the upper-cased filter. A limit adds
 * "_LIMIT{limit}_OFFSET{offset}" with offset defaulting to 0. Offset on its
 * own does not change the key.
 */
std::string cacheKey(const std::optional<std::string>& schemaFilter,
                     std::optional<int64_t> limit = std::nullopt,
                     std::optional<int64_t> offset = std::nullopt);

} // namespace schemadex::cache
