#include "eventlog/TextMatch.hpp"

#include <cctype>

namespace eventlog {

std::string TextMatch::lowercase(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

bool TextMatch::equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool TextMatch::containsLowered(std::string_view haystack, std::string_view needleLower) {
    if (needleLower.empty()) return true;
    if (haystack.size() < needleLower.size()) return false;
    for (size_t start = 0; start + needleLower.size() <= haystack.size(); ++start) {
        size_t i = 0;
        while (i < needleLower.size() &&
               std::tolower(static_cast<unsigned char>(haystack[start + i])) == static_cast<unsigned char>(needleLower[i])) {
            ++i;
        }
        if (i == needleLower.size()) return true;
    }
    return false;
}

} // namespace eventlog
