#include "lotmatch/util.hpp"

#include <algorithm>
#include <cctype>

namespace lotmatch {

std::string trim_copy(std::string_view value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    const auto first = std::find_if(value.begin(), value.end(), not_space);
    const auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string strip_thousands_separators(std::string_view value) {
    std::string stripped;
    stripped.reserve(value.size());
    for (char c : value) {
        if (c != ',') {
            stripped.push_back(c);
        }
    }
    return stripped;
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool ends_with_ci(std::string_view value, std::string_view suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    const auto tail = value.substr(value.size() - suffix.size());
    return to_lower_copy(std::string(tail)) == to_lower_copy(std::string(suffix));
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            joined.append(separator);
        }
        joined.append(parts[i]);
    }
    return joined;
}

} // namespace lotmatch
