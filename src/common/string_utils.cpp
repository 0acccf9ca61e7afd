#include <schemadex/common/string_utils.h>

#include <algorithm>
#include <cctype>

namespace schemadex::common {

namespace {

inline bool isWordByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

} // namespace

std::string toLower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string toUpper(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string normalize(std::string_view s) {
    std::string out = toLower(s);
    std::ranges::replace(out, '_', ' ');
    return out;
}

std::vector<std::string> splitWords(std::string_view s) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        if (i > start)
            words.emplace_back(s.substr(start, i - start));
    }
    return words;
}

std::vector<std::string> splitIdentifierWords(std::string_view s) {
    std::string spaced(s);
    std::ranges::replace(spaced, '_', ' ');
    return splitWords(spaced);
}

std::vector<std::string_view> splitAlnumTokens(std::string_view s) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && !isWordByte(static_cast<unsigned char>(s[i])))
            ++i;
        size_t start = i;
        while (i < s.size() && isWordByte(static_cast<unsigned char>(s[i])))
            ++i;
        if (i > start)
            tokens.push_back(s.substr(start, i - start));
    }
    return tokens;
}

} // namespace schemadex::common
