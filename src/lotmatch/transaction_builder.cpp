#include "lotmatch/transaction_builder.hpp"

#include "lotmatch/errors.hpp"
#include "lotmatch/normalizer.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace lotmatch {
namespace {

struct ResolvedColumns {
    std::size_t date = 0;
    std::size_t type = 0;
    std::size_t quantity = 0;
    std::size_t price = 0;
    std::size_t identifier = 0;
    std::optional<std::size_t> currency;
    std::vector<std::pair<std::string, std::size_t>> extra;
};

std::size_t resolve(const RawTable& table, const std::string& name, const char* role) {
    const auto index = table.column_index(name);
    if (!index) {
        throw SchemaError(std::string("Column '") + name + "' mapped as " + role + " is not in the table");
    }
    return *index;
}

ResolvedColumns resolve_columns(const RawTable& table, const ColumnMapping& columns, const CalculatorConfig& config) {
    ResolvedColumns resolved;
    resolved.date = resolve(table, columns.date, "date");
    resolved.type = resolve(table, columns.type, "transaction type");
    resolved.quantity = resolve(table, columns.quantity, "quantity");
    resolved.price = resolve(table, columns.price, "price");
    resolved.identifier = resolve(table, columns.identifier, "identifier");
    if (columns.currency) {
        resolved.currency = resolve(table, *columns.currency, "currency");
    }
    for (const auto& name : config.extra_identification_columns) {
        resolved.extra.emplace_back(name, resolve(table, name, "identification"));
    }
    return resolved;
}

bool is_blank(const std::vector<Cell>& row) {
    return std::all_of(row.begin(), row.end(), [](const Cell& cell) { return !cell.has_value(); });
}

const std::string& require(const RawTable& table, std::size_t row, std::size_t column) {
    const auto& cell = table.cell(row, column);
    if (!cell) {
        throw MissingValueError(table.header[column]);
    }
    return *cell;
}

} // namespace

void check_schema(const RawTable& table, const ColumnMapping& columns, const CalculatorConfig& config) {
    if (table.column_count() < kMinimumColumns) {
        throw SchemaError("Table must contain at least " + std::to_string(kMinimumColumns) +
                          " columns, found " + std::to_string(table.column_count()));
    }
    resolve_columns(table, columns, config);
}

TransactionSet build_transactions(const RawTable& table,
                                  const ColumnMapping& columns,
                                  const CalculatorConfig& config) {
    const auto resolved = resolve_columns(table, columns, config);

    TransactionSet result;
    auto& diagnostics = result.diagnostics;
    result.transactions.reserve(table.row_count());

    for (std::size_t row = 0; row < table.row_count(); ++row) {
        if (is_blank(table.rows[row])) {
            continue;
        }

        Transaction transaction;
        transaction.source_row = row;
        const std::string* date_text = nullptr;
        const std::string* type_text = nullptr;
        try {
            date_text = &require(table, row, resolved.date);
            type_text = &require(table, row, resolved.type);
            const auto& quantity_text = require(table, row, resolved.quantity);
            const auto& price_text = require(table, row, resolved.price);
            transaction.identifier = require(table, row, resolved.identifier);
            if (resolved.currency) {
                transaction.currency = require(table, row, *resolved.currency);
            }
            for (const auto& [name, index] : resolved.extra) {
                transaction.extra_attributes.emplace_back(name, require(table, row, index));
            }

            transaction.quantity = parse_quantity(quantity_text);
            transaction.price = parse_amount(price_text);
        } catch (const MissingValueError& ex) {
            diagnostics.skipped_rows.push_back(RowIssue{row, RowIssueKind::MissingValue, ex.what()});
            continue;
        } catch (const RowParseError& ex) {
            diagnostics.skipped_rows.push_back(RowIssue{row, RowIssueKind::InvalidNumber, ex.what()});
            continue;
        }

        if (config.buy_values.count(*type_text) != 0) {
            transaction.kind = TransactionKind::Buy;
        } else if (config.sell_values.count(*type_text) != 0) {
            transaction.kind = TransactionKind::Sell;
        } else {
            ++diagnostics.ignored_rows;
            continue;
        }

        transaction.date = parse_date(*date_text, config.input_date_format);
        if (!transaction.date) {
            diagnostics.date_warnings.push_back(
                RowIssue{row, RowIssueKind::InvalidDate, "could not parse date '" + *date_text + "'"});
        }

        result.transactions.push_back(std::move(transaction));
    }

    return result;
}

} // namespace lotmatch
