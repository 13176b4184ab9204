#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace lotmatch {

// Empty cells are std::nullopt.
using Cell = std::optional<std::string>;

struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<Cell>> rows;

    [[nodiscard]] std::size_t column_count() const { return header.size(); }
    [[nodiscard]] std::size_t row_count() const { return rows.size(); }
    [[nodiscard]] std::optional<std::size_t> column_index(const std::string& name) const;

    // Cell at (row, column); rows shorter than the header read as empty.
    [[nodiscard]] const Cell& cell(std::size_t row, std::size_t column) const;
};

// Parses comma separated text. The first record is the header; quoted fields
// may contain commas, doubled quotes and line breaks. Throws FileLoadError on
// an unterminated quote.
RawTable read_csv(std::istream& input, const std::string& source_name = "<stream>");

// Throws FileLoadError when the file cannot be opened or is not a CSV file.
RawTable load_csv(const std::filesystem::path& path);

} // namespace lotmatch
