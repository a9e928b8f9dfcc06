#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <sstream>

namespace uiwire {

// One path segment: a static literal or a codec-encoded dynamic value. Never empty.
using Symbol = std::string;

// Root-to-leaf sequence of symbols. Equality is std::vector equality (length + element-wise).
using EventPath = std::vector<Symbol>;

inline std::string to_string(const EventPath& path) {
    std::ostringstream os;
    os << '[';
    bool first = true;
    for (const auto& s : path) {
        if (!first) os << ", ";
        os << '"' << s << '"';
        first = false;
    }
    os << ']';
    return os.str();
}

} // namespace uiwire
