#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

inline std::string display(char const x) {
    std::ostringstream oss;
    if(x >= 32 && x < 127) {
        oss << "'" << x << "'";
    } else {
        oss << "0x" << std::hex << std::uppercase << (unsigned int)uint8_t(x);
    }
    return oss.str();
}

inline std::string display(std::string_view const word) {
    std::string s;
    s.reserve(word.length() + 2);
    s.push_back('\'');
    s.append(word);
    s.push_back('\'');
    return s;
}

inline std::string display(std::pair<std::string, uint64_t> const& scored) {
    std::ostringstream oss;
    oss << "(" << display(std::string_view(scored.first)) << ", " << scored.second << ")";
    return oss.str();
}

// renders a list of items compactly, packing as many items into a line as fit into the given width
// continuation lines are indented by one space so that items align with the opening bracket
template<typename Item>
std::string display_list(std::vector<Item> const& items, size_t const width) {
    if(items.empty()) return "[]";

    std::string out = "[";
    size_t line_len = 1;
    for(size_t i = 0; i < items.size(); i++) {
        auto const s = display(items[i]);
        if(i > 0) {
            // nb: the item is followed by either a comma or the closing bracket
            if(line_len + 1 + s.length() + 1 > width) {
                out.append("\n ");
                line_len = 1;
            } else {
                out.push_back(' ');
                ++line_len;
            }
        }

        out.append(s);
        line_len += s.length();
        out.push_back((i + 1 < items.size()) ? ',' : ']');
        ++line_len;
    }
    return out;
}
