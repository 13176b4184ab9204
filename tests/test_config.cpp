#include "lotmatch/config.hpp"
#include "lotmatch/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

namespace {

nlohmann::json minimal_config() {
    return nlohmann::json::parse(R"({
        "columns": {
            "date": "Date", "type": "Action", "quantity": "Qty",
            "price": "Price", "identifier": "Ticker"
        },
        "buy_values": ["Buy"],
        "sell_values": ["Sell"]
    })");
}

} // namespace

TEST_CASE("parse_config applies defaults") {
    const auto config = lotmatch::parse_config(minimal_config());
    CHECK(config.columns.date == "Date");
    CHECK(config.columns.identifier == "Ticker");
    CHECK_FALSE(config.columns.currency.has_value());
    CHECK(config.calculator.round_gains);
    CHECK_FALSE(config.calculator.input_date_format.has_value());
    CHECK(config.calculator.output_date_format == "%Y-%m-%d");
    CHECK(config.calculator.extra_identification_columns.empty());
    CHECK(config.calculator.buy_values == std::set<std::string>{"Buy"});
    CHECK_NOTHROW(config.calculator.validate());
}

TEST_CASE("parse_config reads every option") {
    auto json = minimal_config();
    json["columns"]["currency"] = "Ccy";
    json["columns"]["extra"] = {"Name", "ISIN"};
    json["round_gains"] = false;
    json["input_date_format"] = "%d/%m/%Y";
    json["output_date_format"] = "%d.%m.%Y";
    json["buy_values"] = {"Buy", "BUY"};

    const auto config = lotmatch::parse_config(json);
    REQUIRE(config.columns.currency.has_value());
    CHECK(*config.columns.currency == "Ccy");
    CHECK(config.calculator.extra_identification_columns == std::vector<std::string>{"Name", "ISIN"});
    CHECK_FALSE(config.calculator.round_gains);
    CHECK(config.calculator.input_date_format == std::optional<std::string>("%d/%m/%Y"));
    CHECK(config.calculator.output_date_format == "%d.%m.%Y");
    CHECK(config.calculator.buy_values.size() == 2);
}

TEST_CASE("parse_config treats an empty input format as auto-detect") {
    auto json = minimal_config();
    json["input_date_format"] = "";
    json["columns"]["currency"] = nullptr;
    const auto config = lotmatch::parse_config(json);
    CHECK_FALSE(config.calculator.input_date_format.has_value());
    CHECK_FALSE(config.columns.currency.has_value());
}

TEST_CASE("parse_config rejects malformed documents") {
    CHECK_THROWS_AS(lotmatch::parse_config(nlohmann::json::array()), lotmatch::ConfigError);
    CHECK_THROWS_AS(lotmatch::parse_config(nlohmann::json::object()), lotmatch::ConfigError);

    auto missing_price = minimal_config();
    missing_price["columns"].erase("price");
    CHECK_THROWS_AS(lotmatch::parse_config(missing_price), lotmatch::ConfigError);

    auto wrong_type = minimal_config();
    wrong_type["round_gains"] = "yes";
    CHECK_THROWS_AS(lotmatch::parse_config(wrong_type), lotmatch::ConfigError);
}

TEST_CASE("validate requires buy and sell values") {
    lotmatch::CalculatorConfig config;
    CHECK_THROWS_AS(config.validate(), lotmatch::ConfigError);

    config.buy_values = {"Buy"};
    CHECK_THROWS_AS(config.validate(), lotmatch::ConfigError);

    config.sell_values = {"Sell"};
    CHECK_NOTHROW(config.validate());

    config.sell_values.insert("Buy");
    CHECK_THROWS_AS(config.validate(), lotmatch::ConfigError);
}

TEST_CASE("load_config reads a file from disk") {
    const auto path = std::filesystem::temp_directory_path() / "lotmatch_test_config.json";
    {
        std::ofstream output(path);
        output << minimal_config().dump(2);
    }
    const auto config = lotmatch::load_config(path);
    CHECK(config.columns.type == "Action");
    std::filesystem::remove(path);

    CHECK_THROWS_AS(lotmatch::load_config(path), lotmatch::ConfigError);
}

TEST_CASE("load_config reports invalid JSON") {
    const auto path = std::filesystem::temp_directory_path() / "lotmatch_test_bad_config.json";
    {
        std::ofstream output(path);
        output << "{ \"columns\": ";
    }
    CHECK_THROWS_AS(lotmatch::load_config(path), lotmatch::ConfigError);
    std::filesystem::remove(path);
}
