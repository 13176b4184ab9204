#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lotmatch {

// Source table column names for each canonical field.
struct ColumnMapping {
    std::string date;
    std::string type;
    std::string quantity;
    std::string price;
    std::string identifier;
    std::optional<std::string> currency;   // no currency column: every row gets "N/A"
};

struct CalculatorConfig {
    bool round_gains = true;                         // round each matched lot's gain to cents
    std::optional<std::string> input_date_format;    // empty: auto-detect
    std::string output_date_format = "%Y-%m-%d";
    std::set<std::string> buy_values;
    std::set<std::string> sell_values;
    std::vector<std::string> extra_identification_columns;

    // Throws ConfigError when buy or sell values are missing or overlap.
    void validate() const;
};

struct AppConfig {
    ColumnMapping columns;
    CalculatorConfig calculator;
};

AppConfig parse_config(const nlohmann::json& json);

// Reads and parses a JSON configuration file. Throws ConfigError.
AppConfig load_config(const std::filesystem::path& path);

} // namespace lotmatch
