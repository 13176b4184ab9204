#pragma once

#include "lotmatch/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lotmatch {

// Parses a price or amount such as "1,234.50" or " -12 ".
// Throws RowParseError when the text is not a finite number.
double parse_amount(std::string_view text);

// Same as parse_amount, with the sign discarded.
double parse_quantity(std::string_view text);

// Parses a date with an explicit strftime-style format, or by trying the
// common layouts when no format is given. Never throws: an unparsable value
// yields an empty optional.
std::optional<Timestamp> parse_date(std::string_view text,
                                    const std::optional<std::string>& format = std::nullopt);

// Renders a timestamp (UTC) with a strftime-style format.
std::string format_date(const Timestamp& timestamp, const std::string& format);

// Builds a UTC timestamp from calendar fields.
Timestamp make_timestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

} // namespace lotmatch
