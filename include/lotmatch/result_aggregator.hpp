#pragma once

#include "lotmatch/types.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lotmatch {

inline constexpr const char* kUnknown = "Unknown";
inline constexpr const char* kInvalidDate = "Invalid Date";

using CellValue = std::variant<std::string, double>;

// One matched lot of one sale, as a flat column -> value list.
struct ResultRow {
    std::vector<std::pair<std::string, CellValue>> cells;

    [[nodiscard]] const CellValue* find(const std::string& column) const;
};

struct AggregationOptions {
    std::string output_date_format = "%Y-%m-%d";
    bool include_currency = false;
    std::vector<std::string> extra_columns;
};

// Output column names, in row order.
std::vector<std::string> result_columns(const AggregationOptions& options);

std::vector<ResultRow> flatten_results(const std::vector<SaleResult>& sales, const AggregationOptions& options);

std::string to_display_string(const CellValue& value);

} // namespace lotmatch
