#include "lotmatch/normalizer.hpp"

#include "lotmatch/errors.hpp"
#include "lotmatch/util.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lotmatch {
namespace {

// Tried in order when no input format is configured. Month-first precedes
// day-first for slash separated dates.
constexpr std::array<const char*, 22> kAutoDateFormats = {
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%dT%H:%M",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%d",
    "%Y/%m/%d %H:%M:%S",
    "%Y/%m/%d",
    "%m/%d/%Y %H:%M:%S",
    "%m/%d/%Y %H:%M",
    "%m/%d/%Y",
    "%d/%m/%Y %H:%M:%S",
    "%d/%m/%Y",
    "%m-%d-%Y",
    "%d-%m-%Y",
    "%d.%m.%Y %H:%M:%S",
    "%d.%m.%Y",
    "%Y%m%d",
    "%d %b %Y",
    "%d-%b-%Y",
    "%b %d, %Y",
    "%b %d %Y",
    "%B %d, %Y",
};

bool only_space_left(const char* cursor) {
    while (*cursor != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*cursor))) {
            return false;
        }
        ++cursor;
    }
    return true;
}

std::optional<Timestamp> parse_with_format(const std::string& text, const char* format) {
    std::tm fields{};
    fields.tm_mday = 1;
    const char* end = strptime(text.c_str(), format, &fields);
    if (end == nullptr || !only_space_left(end)) {
        return std::nullopt;
    }

    const int year = fields.tm_year;
    const int month = fields.tm_mon;
    const int day = fields.tm_mday;
    fields.tm_isdst = 0;
    const std::time_t seconds = timegm(&fields);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    // strptime accepts 31/02; timegm would silently roll it into March.
    std::tm check{};
    if (gmtime_r(&seconds, &check) == nullptr ||
        check.tm_year != year || check.tm_mon != month || check.tm_mday != day) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

} // namespace

double parse_amount(std::string_view text) {
    const auto cleaned = trim_copy(strip_thousands_separators(text));
    if (cleaned.empty()) {
        throw RowParseError("empty numeric value", std::string(text));
    }

    double value = 0.0;
    std::size_t consumed = 0;
    try {
        value = std::stod(cleaned, &consumed);
    } catch (const std::invalid_argument&) {
        throw RowParseError("could not convert '" + std::string(text) + "' to a number", std::string(text));
    } catch (const std::out_of_range&) {
        throw RowParseError("numeric value '" + std::string(text) + "' is out of range", std::string(text));
    }

    if (consumed != cleaned.size()) {
        throw RowParseError("could not convert '" + std::string(text) + "' to a number", std::string(text));
    }
    if (!std::isfinite(value)) {
        throw RowParseError("numeric value '" + std::string(text) + "' is not finite", std::string(text));
    }
    return value;
}

double parse_quantity(std::string_view text) {
    return std::fabs(parse_amount(text));
}

std::optional<Timestamp> parse_date(std::string_view text, const std::optional<std::string>& format) {
    auto cleaned = trim_copy(text);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    if (format && !format->empty()) {
        return parse_with_format(cleaned, format->c_str());
    }

    if (cleaned.back() == 'Z' || cleaned.back() == 'z') {
        cleaned.pop_back();
    }
    for (const char* candidate : kAutoDateFormats) {
        if (auto parsed = parse_with_format(cleaned, candidate)) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::string format_date(const Timestamp& timestamp, const std::string& format) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm fields{};
    gmtime_r(&seconds, &fields);

    std::ostringstream oss;
    oss << std::put_time(&fields, format.c_str());
    return oss.str();
}

Timestamp make_timestamp(int year, int month, int day, int hour, int minute, int second) {
    std::tm fields{};
    fields.tm_year = year - 1900;
    fields.tm_mon = month - 1;
    fields.tm_mday = day;
    fields.tm_hour = hour;
    fields.tm_min = minute;
    fields.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&fields));
}

} // namespace lotmatch
