#include <schemadex/search/prefix_trie.h>

#include <cctype>

namespace schemadex::search {

namespace {

inline char foldCase(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

const PrefixTrie::KeySet& emptyKeySet() {
    static const PrefixTrie::KeySet empty;
    return empty;
}

} // namespace

PrefixTrie::PrefixTrie() {
    nodes_.emplace_back();
}

uint32_t PrefixTrie::findChild(uint32_t node, char c) const {
    for (const auto& [ch, idx] : nodes_[node].children) {
        if (ch == c)
            return idx;
    }
    return kNoChild;
}

void PrefixTrie::insert(std::string_view word, Key key) {
    uint32_t current = 0;
    nodes_[current].keys.insert(key);

    for (char raw : word) {
        const char c = foldCase(raw);
        uint32_t next = findChild(current, c);
        if (next == kNoChild) {
            next = static_cast<uint32_t>(nodes_.size());
            // emplace_back may reallocate; index the parent again afterwards
            nodes_.emplace_back();
            nodes_[current].children.emplace_back(c, next);
        }
        current = next;
        nodes_[current].keys.insert(key);
    }
}

const PrefixTrie::KeySet& PrefixTrie::searchPrefix(std::string_view prefix) const {
    uint32_t current = 0;
    for (char raw : prefix) {
        current = findChild(current, foldCase(raw));
        if (current == kNoChild)
            return emptyKeySet();
    }
    return nodes_[current].keys;
}

void PrefixTrie::clear() {
    nodes_.clear();
    nodes_.emplace_back();
}

} // namespace schemadex::search
