#include "lotmatch/calculator.hpp"
#include "lotmatch/config.hpp"
#include "lotmatch/csv_table.hpp"
#include "lotmatch/result_writer.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>
#include <string>

namespace {

std::filesystem::path data_dir() {
    const std::filesystem::path source_dir = std::filesystem::path(__FILE__).parent_path();
    const std::filesystem::path candidates[] = {
        std::filesystem::current_path() / "tests" / "data",
        source_dir / "data"
    };
    for (const auto& candidate : candidates) {
        if (std::filesystem::exists(candidate / "sample_config.json")) {
            return candidate;
        }
    }
    return source_dir / "data";
}

std::string cell_text(const lotmatch::ResultRow& row, const std::string& column) {
    const auto* value = row.find(column);
    REQUIRE(value != nullptr);
    return lotmatch::to_display_string(*value);
}

} // namespace

TEST_CASE("Broker export runs end to end", "[integration]") {
    const auto config = lotmatch::load_config(data_dir() / "sample_config.json");
    const auto table = lotmatch::load_csv(data_dir() / "sample_transactions.csv");
    REQUIRE(table.column_count() == 7);

    const auto result = lotmatch::calculate(table, config);

    const auto& diagnostics = result.diagnostics;
    CHECK(diagnostics.count(lotmatch::RowIssueKind::MissingValue) == 1);
    CHECK(diagnostics.count(lotmatch::RowIssueKind::InvalidNumber) == 1);
    CHECK(diagnostics.count(lotmatch::RowIssueKind::InvalidDate) == 1);
    CHECK(diagnostics.ignored_rows == 1);

    // Groups follow the first dated appearance: GBP lots, EUR lots, then USD.
    REQUIRE(result.sales.size() == 3);
    CHECK(result.sales[0].currency == "GBP");
    CHECK(result.sales[0].total_gain == Catch::Approx(-75.0));
    CHECK_FALSE(result.sales[0].date.has_value());
    CHECK(result.sales[1].currency == "EUR");
    CHECK(result.sales[1].total_gain == Catch::Approx(40.0));
    CHECK(result.sales[2].currency == "USD");
    CHECK(result.sales[2].total_gain == Catch::Approx(13980.0));
    CHECK(result.total_gain() == Catch::Approx(13945.0));

    REQUIRE(result.rows.size() == 5);
    CHECK(cell_text(result.rows[0], "Sell Date") == "Invalid Date");
    CHECK(cell_text(result.rows[0], "Name") == "Beta Plc");
    CHECK(cell_text(result.rows[2], "Buy Date") == "Unknown");
    CHECK(cell_text(result.rows[2], "Used Qty") == "20");
    CHECK(cell_text(result.rows[3], "Buy Date") == "2023-03-15");
    CHECK(cell_text(result.rows[3], "Gain/Loss") == "12975");
    CHECK(cell_text(result.rows[4], "Gain/Loss") == "1005");
    CHECK(cell_text(result.rows[4], "Sell Qty") == "120");
}

TEST_CASE("Exported CSV reads back with the same shape", "[integration]") {
    const auto config = lotmatch::load_config(data_dir() / "sample_config.json");
    const auto result = lotmatch::calculate(lotmatch::load_csv(data_dir() / "sample_transactions.csv"), config);

    std::stringstream buffer;
    lotmatch::write_csv(buffer, result.columns, result.rows);
    const auto exported = lotmatch::read_csv(buffer);

    CHECK(exported.header == result.columns);
    REQUIRE(exported.row_count() == result.rows.size());
    const auto name = exported.column_index("Name");
    REQUIRE(name.has_value());
    CHECK(exported.cell(4, *name) == std::optional<std::string>("Alpha Holdings"));
}
