#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace lotmatch {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

// The source table is too narrow or lacks a mapped column. Fatal.
class SchemaError : public Error {
public:
    using Error::Error;
};

// Unusable configuration (no buy or sell values, malformed file). Fatal.
class ConfigError : public Error {
public:
    using Error::Error;
};

class FileLoadError : public Error {
public:
    FileLoadError(const std::string& message, std::string path)
        : Error(message), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// A mapped column is empty on a row; the row is dropped.
class MissingValueError : public Error {
public:
    explicit MissingValueError(std::string column)
        : Error("missing value in column '" + column + "'"), column_(std::move(column)) {}

    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

// Quantity or price is not a number; the row is dropped.
class RowParseError : public Error {
public:
    RowParseError(const std::string& message, std::string value)
        : Error(message), value_(std::move(value)) {}

    [[nodiscard]] const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

} // namespace lotmatch
