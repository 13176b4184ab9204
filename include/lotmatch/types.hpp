#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lotmatch {

using Timestamp = std::chrono::system_clock::time_point;

// Ordered column name -> value pairs carried through to the output.
using Attributes = std::vector<std::pair<std::string, std::string>>;

inline constexpr const char* kNoCurrency = "N/A";

enum class TransactionKind { Buy, Sell };

struct Transaction {
    std::optional<Timestamp> date;   // empty when the source date was unparsable
    TransactionKind kind = TransactionKind::Buy;
    double quantity = 0.0;           // always >= 0
    double price = 0.0;
    std::string identifier;
    std::string currency = kNoCurrency;
    Attributes extra_attributes;
    std::size_t source_row = 0;      // 0-based data row in the source table
};

// Unconsumed portion of a buy, waiting at the lot queue.
struct OpenLot {
    double remaining_quantity = 0.0;
    double unit_price = 0.0;
    std::optional<Timestamp> acquisition_date;
    double original_quantity = 0.0;   // bought quantity, scales the residue check
};

struct MatchedLot {
    double used_quantity = 0.0;
    std::optional<double> cost_basis;               // empty when no open lot funded the sale
    std::optional<Timestamp> acquisition_date;
    double sale_price = 0.0;
    std::optional<double> gain;                     // set iff cost_basis is set

    [[nodiscard]] bool has_cost_basis() const { return cost_basis.has_value(); }
};

struct SaleResult {
    std::optional<Timestamp> date;
    std::string identifier;
    std::string currency = kNoCurrency;
    double sale_price = 0.0;
    double sale_quantity = 0.0;
    double total_gain = 0.0;
    std::vector<MatchedLot> matched_lots;
    Attributes extra_attributes;
};

enum class RowIssueKind { MissingValue, InvalidNumber, InvalidDate };

struct RowIssue {
    std::size_t row_index = 0;
    RowIssueKind kind = RowIssueKind::MissingValue;
    std::string message;
};

struct RunDiagnostics {
    std::vector<RowIssue> skipped_rows;    // rows excluded from the computation
    std::vector<RowIssue> date_warnings;   // rows kept with an invalid date
    std::size_t ignored_rows = 0;          // type value is neither buy nor sell

    [[nodiscard]] std::size_t count(RowIssueKind kind) const;
};

const char* to_string(RowIssueKind kind);

} // namespace lotmatch
