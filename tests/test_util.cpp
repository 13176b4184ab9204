#include "lotmatch/util.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("trim_copy strips surrounding whitespace") {
    using lotmatch::trim_copy;
    CHECK(trim_copy("  12.5 ") == "12.5");
    CHECK(trim_copy("\tBuy\r\n") == "Buy");
    CHECK(trim_copy("   ").empty());
    CHECK(trim_copy("inner space kept") == "inner space kept");
}

TEST_CASE("strip_thousands_separators removes every comma") {
    using lotmatch::strip_thousands_separators;
    CHECK(strip_thousands_separators("1,234,567.89") == "1234567.89");
    CHECK(strip_thousands_separators("42") == "42");
    CHECK(strip_thousands_separators(",,") == "");
}

TEST_CASE("ends_with_ci ignores case") {
    using lotmatch::ends_with_ci;
    CHECK(ends_with_ci("history.XLSX", ".xlsx"));
    CHECK(ends_with_ci("history.csv", ".CSV"));
    CHECK_FALSE(ends_with_ci("csv", ".csv"));
}

TEST_CASE("join preserves order") {
    using lotmatch::join;
    CHECK(join({"Date", "Type", "Qty"}, ", ") == "Date, Type, Qty");
    CHECK(join({}, ",").empty());
    CHECK(lotmatch::to_lower_copy("BuY") == "buy");
}
