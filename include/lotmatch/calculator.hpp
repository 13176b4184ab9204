#pragma once

#include "lotmatch/config.hpp"
#include "lotmatch/csv_table.hpp"
#include "lotmatch/result_aggregator.hpp"
#include "lotmatch/types.hpp"

#include <string>
#include <vector>

namespace lotmatch {

struct CalculationResult {
    std::vector<SaleResult> sales;        // per group chronological, groups in encounter order
    std::vector<std::string> columns;
    std::vector<ResultRow> rows;
    RunDiagnostics diagnostics;

    [[nodiscard]] double total_gain() const;
};

// Runs FIFO matching over already normalized transactions. Throws ConfigError
// before any work when the configuration is unusable.
CalculationResult calculate(const std::vector<Transaction>& transactions,
                            const CalculatorConfig& config,
                            bool include_currency = false);

// Full pipeline from a raw table: schema and configuration checks, row
// normalization, matching and aggregation.
CalculationResult calculate(const RawTable& table, const AppConfig& config);

} // namespace lotmatch
