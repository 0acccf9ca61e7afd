#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace schemadex::search {

/**
 * @brief Pool of unique strings.
 *
 * Large catalogs repeat the same schema and table names thousands of times;
 * interning keeps one copy of each. The returned view points into storage
 * owned by the interner and stays valid until the interner is destroyed, and
 * equal content always yields the same data() pointer.
 *
 * One instance is created by the composition root and handed to every
 * search engine and loader that needs it.
 */
class StringInterner {
public:
    StringInterner() = default;
    StringInterner(const StringInterner&) = delete;
    StringInterner& operator=(const StringInterner&) = delete;

    std::string_view intern(std::string_view s);

    size_t size() const;

    /// Approximate bytes held by pooled characters.
    size_t bytes() const;

private:
    struct Hash {
        using is_transparent = void;
        size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };

    mutable std::mutex mutex_;
    std::unordered_set<std::string, Hash, std::equal_to<>> pool_;
    size_t bytes_ = 0;
};

} // namespace schemadex::search
