#include "lotmatch/result_aggregator.hpp"

#include "lotmatch/normalizer.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

namespace lotmatch {
namespace {

// Fewest significant digits that still read back as the same double.
constexpr int kShortPrecision = std::numeric_limits<double>::digits10;
constexpr int kFullPrecision = std::numeric_limits<double>::max_digits10;

CellValue date_cell(const std::optional<Timestamp>& date, const std::string& format, const char* when_missing) {
    if (!date) {
        return std::string(when_missing);
    }
    return format_date(*date, format);
}

CellValue optional_number(const std::optional<double>& value) {
    if (!value) {
        return std::string(kUnknown);
    }
    return *value;
}

std::string attribute_value(const Attributes& attributes, const std::string& name) {
    for (const auto& [key, value] : attributes) {
        if (key == name) {
            return value;
        }
    }
    return {};
}

// A configured column named like a fixed one replaces its value.
void set_cell(ResultRow& row, const std::string& column, CellValue value) {
    for (auto& [name, existing] : row.cells) {
        if (name == column) {
            existing = std::move(value);
            return;
        }
    }
    row.cells.emplace_back(column, std::move(value));
}

} // namespace

const CellValue* ResultRow::find(const std::string& column) const {
    for (const auto& [name, value] : cells) {
        if (name == column) {
            return &value;
        }
    }
    return nullptr;
}

std::vector<std::string> result_columns(const AggregationOptions& options) {
    std::vector<std::string> columns = {
        "Identifier", "Buy Date", "Buy Price", "Sell Date",
        "Sell Price", "Sell Qty", "Used Qty", "Gain/Loss"
    };
    if (options.include_currency) {
        columns.emplace_back("Currency");
    }
    for (const auto& column : options.extra_columns) {
        if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
            columns.push_back(column);
        }
    }
    return columns;
}

std::vector<ResultRow> flatten_results(const std::vector<SaleResult>& sales, const AggregationOptions& options) {
    std::vector<ResultRow> rows;
    for (const auto& sale : sales) {
        const auto sell_date = date_cell(sale.date, options.output_date_format, kInvalidDate);
        for (const auto& lot : sale.matched_lots) {
            ResultRow row;
            row.cells.reserve(8 + options.extra_columns.size() + 1);
            row.cells.emplace_back("Identifier", sale.identifier);
            if (lot.has_cost_basis()) {
                // A funded lot whose buy date did not parse still has a known cost.
                row.cells.emplace_back("Buy Date", date_cell(lot.acquisition_date, options.output_date_format, kInvalidDate));
            } else {
                row.cells.emplace_back("Buy Date", std::string(kUnknown));
            }
            row.cells.emplace_back("Buy Price", optional_number(lot.cost_basis));
            row.cells.emplace_back("Sell Date", sell_date);
            row.cells.emplace_back("Sell Price", sale.sale_price);
            row.cells.emplace_back("Sell Qty", sale.sale_quantity);
            row.cells.emplace_back("Used Qty", lot.used_quantity);
            row.cells.emplace_back("Gain/Loss", optional_number(lot.gain));
            if (options.include_currency) {
                row.cells.emplace_back("Currency", sale.currency);
            }
            for (const auto& column : options.extra_columns) {
                set_cell(row, column, attribute_value(sale.extra_attributes, column));
            }
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::string to_display_string(const CellValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    double number = std::get<double>(value);
    if (number == 0.0) {
        number = 0.0;   // drop the sign of negative zero
    }
    std::string text;
    for (int precision = kShortPrecision; precision <= kFullPrecision; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << number;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == number) {
            break;
        }
    }
    return text;
}

} // namespace lotmatch
