#include "lotmatch/csv_table.hpp"

#include "lotmatch/errors.hpp"
#include "lotmatch/util.hpp"

#include <fstream>
#include <iterator>

namespace lotmatch {
namespace {

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

struct Field {
    std::string text;
    bool quoted = false;
};

// Splits the whole document into records of fields.
std::vector<std::vector<Field>> split_records(const std::string& data, const std::string& source_name) {
    std::vector<std::vector<Field>> records;
    std::vector<Field> record;
    Field field;
    bool in_quotes = false;
    bool field_started = false;

    const auto end_field = [&]() {
        record.push_back(std::move(field));
        field = Field{};
        field_started = false;
    };
    const auto end_record = [&]() {
        end_field();
        records.push_back(std::move(record));
        record.clear();
    };

    for (std::size_t i = 0; i < data.size(); ++i) {
        const char c = data[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field.text.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.text.push_back(c);
            }
            continue;
        }

        if (c == '"' && !field_started) {
            in_quotes = true;
            field.quoted = true;
            field_started = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\r') {
            if (i + 1 < data.size() && data[i + 1] == '\n') {
                ++i;
            }
            end_record();
        } else if (c == '\n') {
            end_record();
        } else {
            field.text.push_back(c);
            field_started = true;
        }
    }

    if (in_quotes) {
        throw FileLoadError("Unterminated quoted field in " + source_name, source_name);
    }
    if (field_started || !record.empty()) {
        end_record();
    }
    return records;
}

Cell to_cell(Field field) {
    if (!field.quoted && trim_copy(field.text).empty()) {
        return std::nullopt;
    }
    if (field.text.empty()) {
        return std::nullopt;
    }
    return std::move(field.text);
}

} // namespace

std::optional<std::size_t> RawTable::column_index(const std::string& name) const {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

const Cell& RawTable::cell(std::size_t row, std::size_t column) const {
    static const Cell kEmpty;
    const auto& values = rows.at(row);
    if (column >= values.size()) {
        return kEmpty;
    }
    return values[column];
}

RawTable read_csv(std::istream& input, const std::string& source_name) {
    std::string data{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (data.rfind(kUtf8Bom, 0) == 0) {
        data.erase(0, 3);
    }

    auto records = split_records(data, source_name);
    RawTable table;
    if (records.empty()) {
        return table;
    }

    for (auto& field : records.front()) {
        table.header.push_back(trim_copy(field.text));
    }
    // A trailing delimiter on the header line yields an unnamed empty column.
    while (!table.header.empty() && table.header.back().empty()) {
        table.header.pop_back();
    }

    table.rows.reserve(records.size() - 1);
    for (std::size_t r = 1; r < records.size(); ++r) {
        std::vector<Cell> row;
        row.reserve(records[r].size());
        for (auto& field : records[r]) {
            row.push_back(to_cell(std::move(field)));
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

RawTable load_csv(const std::filesystem::path& path) {
    const auto name = path.string();
    if (ends_with_ci(name, ".xlsx") || ends_with_ci(name, ".xls")) {
        throw FileLoadError("Excel workbooks are not supported; export the sheet as CSV: " + name, name);
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw FileLoadError("Could not open file " + name, name);
    }
    return read_csv(input, name);
}

} // namespace lotmatch
