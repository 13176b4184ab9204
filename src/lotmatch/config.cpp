#include "lotmatch/config.hpp"

#include "lotmatch/errors.hpp"
#include "lotmatch/util.hpp"

#include <fstream>
#include <vector>

namespace lotmatch {
namespace {

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigError(std::string("Config key '") + key + "' has the wrong type: " + ex.what());
    }
}

std::string required_column(const nlohmann::json& columns, const char* key) {
    const auto name = json_value_or<std::string>(columns, key, "");
    if (name.empty()) {
        throw ConfigError(std::string("Config is missing the '") + key + "' column mapping");
    }
    return name;
}

std::set<std::string> value_set(const nlohmann::json& j, const char* key) {
    const auto values = json_value_or<std::vector<std::string>>(j, key, {});
    return std::set<std::string>(values.begin(), values.end());
}

} // namespace

void CalculatorConfig::validate() const {
    if (buy_values.empty() || sell_values.empty()) {
        throw ConfigError("Select at least one Buy and one Sell transaction type");
    }

    std::vector<std::string> overlap;
    for (const auto& value : buy_values) {
        if (sell_values.count(value) != 0) {
            overlap.push_back(value);
        }
    }
    if (!overlap.empty()) {
        throw ConfigError("Transaction type values classified as both Buy and Sell: " + join(overlap, ", "));
    }

    if (output_date_format.empty()) {
        throw ConfigError("Output date format must not be empty");
    }
}

AppConfig parse_config(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }
    if (!json.contains("columns") || !json["columns"].is_object()) {
        throw ConfigError("Config is missing the 'columns' object");
    }

    AppConfig config;
    const auto& columns = json["columns"];
    config.columns.date = required_column(columns, "date");
    config.columns.type = required_column(columns, "type");
    config.columns.quantity = required_column(columns, "quantity");
    config.columns.price = required_column(columns, "price");
    config.columns.identifier = required_column(columns, "identifier");
    const auto currency = json_value_or<std::string>(columns, "currency", "");
    if (!currency.empty()) {
        config.columns.currency = currency;
    }

    auto& calculator = config.calculator;
    calculator.extra_identification_columns = json_value_or<std::vector<std::string>>(columns, "extra", {});
    calculator.round_gains = json_value_or<bool>(json, "round_gains", true);
    const auto input_format = json_value_or<std::string>(json, "input_date_format", "");
    if (!input_format.empty()) {
        calculator.input_date_format = input_format;
    }
    calculator.output_date_format = json_value_or<std::string>(json, "output_date_format", "%Y-%m-%d");
    calculator.buy_values = value_set(json, "buy_values");
    calculator.sell_values = value_set(json, "sell_values");

    return config;
}

AppConfig load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.good()) {
        throw ConfigError("Failed to open config file " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError("Failed to parse config file " + path.string() + ": " + ex.what());
    }
    return parse_config(json);
}

} // namespace lotmatch
