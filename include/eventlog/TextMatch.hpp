#pragma once

#include <string>
#include <string_view>

namespace eventlog {

// Case folding helpers shared by the search filters; ASCII lowercase only.
class TextMatch {
public:
    static std::string lowercase(std::string_view text);
    static bool equalsIgnoreCase(std::string_view a, std::string_view b);
    // `needleLower` must already be lowercased.
    static bool containsLowered(std::string_view haystack, std::string_view needleLower);
};

} // namespace eventlog
