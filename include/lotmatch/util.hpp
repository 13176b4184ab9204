#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lotmatch {

std::string trim_copy(std::string_view value);

// Removes every ',' used as a thousands separator ("1,234.50" -> "1234.50").
std::string strip_thousands_separators(std::string_view value);

std::string to_lower_copy(std::string value);

bool ends_with_ci(std::string_view value, std::string_view suffix);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

} // namespace lotmatch
