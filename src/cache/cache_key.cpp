#include <schemadex/cache/cache_key.h>
#include <schemadex/common/string_utils.h>

#include <fmt/format.h>

namespace schemadex::cache {

std::string cacheKey(const std::optional<std::string>& schemaFilter, std::optional<int64_t> limit,
                     std::optional<int64_t> offset) {
    std::string key = schemaFilter ? common::toUpper(*schemaFilter) : std::string(kAllSchemasKey);
    if (limit) {
        key += fmt::format("_LIMIT{}_OFFSET{}", *limit, offset.value_or(0));
    }
    return key;
}

} // namespace schemadex::cache
