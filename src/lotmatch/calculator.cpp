#include "lotmatch/calculator.hpp"

#include "lotmatch/fifo_matcher.hpp"
#include "lotmatch/grouping.hpp"
#include "lotmatch/transaction_builder.hpp"

#include <iterator>
#include <numeric>
#include <utility>

namespace lotmatch {

double CalculationResult::total_gain() const {
    return std::accumulate(sales.begin(), sales.end(), 0.0, [](double sum, const SaleResult& sale) {
        return sum + sale.total_gain;
    });
}

CalculationResult calculate(const std::vector<Transaction>& transactions,
                            const CalculatorConfig& config,
                            bool include_currency) {
    config.validate();

    AggregationOptions options;
    options.output_date_format = config.output_date_format;
    options.include_currency = include_currency;
    options.extra_columns = config.extra_identification_columns;

    CalculationResult result;
    result.columns = result_columns(options);

    for (const auto& group : group_transactions(transactions)) {
        auto sales = FifoMatcher::match_group(group, config.round_gains);
        result.sales.insert(result.sales.end(),
                            std::make_move_iterator(sales.begin()),
                            std::make_move_iterator(sales.end()));
    }

    result.rows = flatten_results(result.sales, options);
    return result;
}

CalculationResult calculate(const RawTable& table, const AppConfig& config) {
    check_schema(table, config.columns, config.calculator);
    config.calculator.validate();

    auto built = build_transactions(table, config.columns, config.calculator);
    auto result = calculate(built.transactions, config.calculator, config.columns.currency.has_value());
    result.diagnostics = std::move(built.diagnostics);
    return result;
}

} // namespace lotmatch
