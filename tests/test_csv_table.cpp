#include "lotmatch/csv_table.hpp"
#include "lotmatch/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

TEST_CASE("read_csv splits header and rows") {
    std::istringstream input("Date,Type,Qty,Price,Ticker\n2024-01-02,Buy,10,5,ABC\n2024-01-03,Sell,4,6,ABC\n");
    const auto table = lotmatch::read_csv(input);

    REQUIRE(table.column_count() == 5);
    REQUIRE(table.row_count() == 2);
    CHECK(table.header[4] == "Ticker");
    CHECK(table.column_index("Qty") == std::optional<std::size_t>(2));
    CHECK_FALSE(table.column_index("Missing").has_value());
    CHECK(table.cell(1, 1) == std::optional<std::string>("Sell"));
}

TEST_CASE("read_csv handles quoting and CRLF line endings") {
    std::istringstream input("Name,Qty\r\n\"Acme, Inc.\",\"1,000\"\r\n\"Say \"\"hi\"\"\",2\r\n\"multi\nline\",3\r\n");
    const auto table = lotmatch::read_csv(input);

    REQUIRE(table.row_count() == 3);
    CHECK(table.cell(0, 0) == std::optional<std::string>("Acme, Inc."));
    CHECK(table.cell(0, 1) == std::optional<std::string>("1,000"));
    CHECK(table.cell(1, 0) == std::optional<std::string>("Say \"hi\""));
    CHECK(table.cell(2, 0) == std::optional<std::string>("multi\nline"));
}

TEST_CASE("read_csv maps empty cells to missing values") {
    std::istringstream input("\xEF\xBB\xBF" "A,B,C\n1,,3\n4\n,,\n");
    const auto table = lotmatch::read_csv(input);

    CHECK(table.header[0] == "A");
    REQUIRE(table.row_count() == 3);
    CHECK_FALSE(table.cell(0, 1).has_value());
    CHECK(table.cell(0, 2) == std::optional<std::string>("3"));
    // short rows read as empty past their end
    CHECK_FALSE(table.cell(1, 2).has_value());
    CHECK_FALSE(table.cell(2, 0).has_value());
}

TEST_CASE("read_csv accepts empty input") {
    std::istringstream input("");
    const auto table = lotmatch::read_csv(input);
    CHECK(table.column_count() == 0);
    CHECK(table.row_count() == 0);
}

TEST_CASE("read_csv rejects an unterminated quote") {
    std::istringstream input("A,B\n\"open,1\n");
    CHECK_THROWS_AS(lotmatch::read_csv(input), lotmatch::FileLoadError);
}

TEST_CASE("load_csv reports unreadable and unsupported files") {
    CHECK_THROWS_AS(lotmatch::load_csv("/nonexistent/lotmatch/history.csv"), lotmatch::FileLoadError);
    CHECK_THROWS_AS(lotmatch::load_csv("history.xlsx"), lotmatch::FileLoadError);

    const auto path = std::filesystem::temp_directory_path() / "lotmatch_test_table.csv";
    {
        std::ofstream output(path);
        output << "Date,Type,Qty,Price\n2024-01-02,Buy,1,2\n";
    }
    const auto table = lotmatch::load_csv(path);
    CHECK(table.row_count() == 1);
    std::filesystem::remove(path);
}
