#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace schemadex::search {

/**
 * @brief Character trie whose nodes aggregate keys.
 *
 * Every node stores the keys of all words inserted through it, not only the
 * words ending there, so a prefix lookup is a single walk of len(prefix)
 * steps regardless of corpus size.
 *
 * Nodes live in an arena owned by the trie and refer to children by index.
 * Keys are views and must outlive the trie (intern them).
 */
class PrefixTrie {
public:
    using Key = std::string_view;
    using KeySet = std::unordered_set<Key>;

    PrefixTrie();

    /**
     * @brief Insert a word (lower-cased on the way in) under the given key
     *
     * Iterative, so very long words cannot exhaust the stack.
     */
    void insert(std::string_view word, Key key);

    /**
     * @brief Keys of all words starting with prefix (case-insensitive)
     *
     * The reference is valid until the next insert() or clear(). An unknown
     * prefix yields an empty set. The empty prefix yields every key.
     */
    const KeySet& searchPrefix(std::string_view prefix) const;

    void clear();

    bool empty() const { return nodes_.size() == 1 && nodes_.front().keys.empty(); }
    size_t nodeCount() const { return nodes_.size(); }

private:
    struct Node {
        std::vector<std::pair<char, uint32_t>> children;
        KeySet keys;
    };

    static constexpr uint32_t kNoChild = UINT32_MAX;

    uint32_t findChild(uint32_t node, char c) const;

    std::vector<Node> nodes_;
};

} // namespace schemadex::search
