#include <schemadex/search/string_interner.h>

namespace schemadex::search {

std::string_view StringInterner::intern(std::string_view s) {
    std::lock_guard lock(mutex_);

    if (auto it = pool_.find(s); it != pool_.end())
        return *it;

    // Node-based set: element addresses survive rehashing
    auto [it, inserted] = pool_.emplace(s);
    if (inserted)
        bytes_ += it->size();
    return *it;
}

size_t StringInterner::size() const {
    std::lock_guard lock(mutex_);
    return pool_.size();
}

size_t StringInterner::bytes() const {
    std::lock_guard lock(mutex_);
    return bytes_;
}

} // namespace schemadex::search
