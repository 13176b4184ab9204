#pragma once

#include "lotmatch/config.hpp"
#include "lotmatch/csv_table.hpp"
#include "lotmatch/types.hpp"

#include <cstddef>
#include <vector>

namespace lotmatch {

inline constexpr std::size_t kMinimumColumns = 4;

struct TransactionSet {
    std::vector<Transaction> transactions;   // source order
    RunDiagnostics diagnostics;
};

// Throws SchemaError when the table is narrower than kMinimumColumns or a
// mapped column is absent from its header.
void check_schema(const RawTable& table, const ColumnMapping& columns, const CalculatorConfig& config);

// Applies the column mapping to every row. Rows that are entirely empty are
// discarded; rows with a missing mapped value or a non-numeric quantity or
// price are skipped and reported; rows whose type is neither a buy nor a sell
// value are counted as ignored. Unparsable dates are kept as invalid dates.
TransactionSet build_transactions(const RawTable& table,
                                  const ColumnMapping& columns,
                                  const CalculatorConfig& config);

} // namespace lotmatch
