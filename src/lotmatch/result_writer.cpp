#include "lotmatch/result_writer.hpp"

#include "lotmatch/errors.hpp"

#include <fstream>

namespace lotmatch {
namespace {

std::string quote_csv(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

void ensure_directory(const std::filesystem::path& path) {
    const auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

} // namespace

void write_csv(std::ostream& output, const std::vector<std::string>& columns, const std::vector<ResultRow>& rows) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i != 0) {
            output << ',';
        }
        output << quote_csv(columns[i]);
    }
    output << '\n';

    for (const auto& row : rows) {
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (i != 0) {
                output << ',';
            }
            if (const auto* value = row.find(columns[i])) {
                output << quote_csv(to_display_string(*value));
            }
        }
        output << '\n';
    }
}

nlohmann::ordered_json to_json(const ResultRow& row) {
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
    for (const auto& [name, value] : row.cells) {
        if (const auto* number = std::get_if<double>(&value)) {
            json[name] = *number;
        } else {
            json[name] = std::get<std::string>(value);
        }
    }
    return json;
}

void write_json_lines(const std::filesystem::path& path, const std::vector<ResultRow>& rows) {
    ensure_directory(path);

    std::ofstream output(path, std::ios::trunc);
    if (!output.good()) {
        throw FileLoadError("Failed to open " + path.string() + " for writing", path.string());
    }
    for (const auto& row : rows) {
        output << to_json(row).dump() << '\n';
    }
}

} // namespace lotmatch
