#pragma once

#include "lotmatch/result_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace lotmatch {

// Header line followed by one line per row. Values containing a comma,
// quote or line break are quoted.
void write_csv(std::ostream& output, const std::vector<std::string>& columns, const std::vector<ResultRow>& rows);

// Keys keep the row's column order.
nlohmann::ordered_json to_json(const ResultRow& row);

// One JSON object per line. Creates the parent directory when needed.
void write_json_lines(const std::filesystem::path& path, const std::vector<ResultRow>& rows);

} // namespace lotmatch
