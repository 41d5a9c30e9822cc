// src/core/time_utils.cpp
#include "trade_journal/core/time_utils.hpp"
#include <cstdio>
#include <regex>

namespace trade_journal {
namespace core {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

void civil_from_days(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

Result<Timestamp> invalid_timestamp(const std::string& text, const std::string& reason) {
    return make_error<Timestamp>(ErrorCode::INVALID_TIMESTAMP,
                                 "Invalid timestamp '" + text + "': " + reason, "TimeUtils");
}

bool validate_fields(int year, int month, int day, int hour, int minute, int second,
                     std::string& reason) {
    if (month < 1 || month > 12) {
        reason = "month out of range";
        return false;
    }
    if (day < 1 || day > days_in_month(year, month)) {
        reason = "day out of range";
        return false;
    }
    if (hour > 23 || minute > 59 || second > 59) {
        reason = "time of day out of range";
        return false;
    }
    return true;
}

// Date-only forms set date_only so range bounds can widen to the whole day
Result<Timestamp> parse_impl(const std::string& raw, bool& date_only) {
    static const std::regex iso_regex(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)?\s*(Z|z|[+-]\d{2}:?\d{2})?$)");
    static const std::regex us_regex(
        R"(^(\d{1,2})/(\d{1,2})/(\d{4})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?(?:\s+[A-Za-z]{2,5})?$)");

    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return invalid_timestamp(raw, "empty value");
    }
    const auto last = raw.find_last_not_of(" \t\r\n");
    const std::string text = raw.substr(first, last - first + 1);

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int64_t nanos = 0;
    int offset_minutes = 0;
    std::smatch m;

    if (std::regex_match(text, m, iso_regex)) {
        year = std::stoi(m[1].str());
        month = std::stoi(m[2].str());
        day = std::stoi(m[3].str());
        date_only = !m[4].matched;
        if (m[4].matched) {
            hour = std::stoi(m[4].str());
            minute = std::stoi(m[5].str());
        }
        if (m[6].matched) {
            second = std::stoi(m[6].str());
        }
        if (m[7].matched) {
            std::string fraction = m[7].str();
            fraction.resize(9, '0');
            nanos = std::stoll(fraction);
        }
        if (m[8].matched) {
            const std::string zone = m[8].str();
            if (zone != "Z" && zone != "z") {
                const int sign = zone[0] == '-' ? -1 : 1;
                const std::string digits =
                    zone.size() == 6 ? zone.substr(1, 2) + zone.substr(4, 2) : zone.substr(1, 4);
                const int zone_hours = std::stoi(digits.substr(0, 2));
                const int zone_minutes = std::stoi(digits.substr(2, 2));
                if (zone_hours > 23 || zone_minutes > 59) {
                    return invalid_timestamp(raw, "zone offset out of range");
                }
                offset_minutes = sign * (zone_hours * 60 + zone_minutes);
            }
        }
    } else if (std::regex_match(text, m, us_regex)) {
        month = std::stoi(m[1].str());
        day = std::stoi(m[2].str());
        year = std::stoi(m[3].str());
        date_only = !m[4].matched;
        if (m[4].matched) {
            hour = std::stoi(m[4].str());
            minute = std::stoi(m[5].str());
        }
        if (m[6].matched) {
            second = std::stoi(m[6].str());
        }
    } else {
        return invalid_timestamp(raw, "expected ISO-8601 or MM/DD/YYYY");
    }

    std::string reason;
    if (!validate_fields(year, month, day, hour, minute, second, reason)) {
        return invalid_timestamp(raw, reason);
    }

    Timestamp ts = make_utc_timestamp(year, month, day, hour, minute, second);
    ts -= std::chrono::minutes(offset_minutes);
    ts += std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(nanos));
    return Result<Timestamp>(ts);
}

}  // namespace

int64_t days_from_civil(int year, int month, int day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Timestamp make_utc_timestamp(int year, int month, int day, int hour, int minute, int second) {
    const int64_t seconds =
        days_from_civil(year, month, day) * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds)));
}

CalendarFields calendar_fields(const Timestamp& ts, int utc_offset_minutes) {
    const int64_t seconds =
        std::chrono::floor<std::chrono::seconds>(ts.time_since_epoch()).count() +
        static_cast<int64_t>(utc_offset_minutes) * 60;
    const int64_t days = floor_div(seconds, SECONDS_PER_DAY);
    const int64_t second_of_day = seconds - days * SECONDS_PER_DAY;

    CalendarFields fields;
    civil_from_days(days, fields.year, fields.month, fields.day);
    // 1970-01-01 was a Thursday
    fields.weekday = static_cast<int>(((days + 3) % 7 + 7) % 7);
    fields.hour = static_cast<int>(second_of_day / 3600);
    fields.minute = static_cast<int>((second_of_day % 3600) / 60);
    fields.second = static_cast<int>(second_of_day % 60);
    return fields;
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    bool date_only = false;
    return parse_impl(text, date_only);
}

Result<Timestamp> parse_range_bound(const std::string& text, bool is_end_bound) {
    bool date_only = false;
    auto parsed = parse_impl(text, date_only);
    if (parsed.is_error() || !is_end_bound || !date_only) {
        return parsed;
    }
    return Result<Timestamp>(parsed.value() + std::chrono::hours(24) - Timestamp::duration(1));
}

std::string format_iso8601(const Timestamp& ts) {
    const CalendarFields f = calendar_fields(ts);
    const auto since_epoch = ts.time_since_epoch();
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(since_epoch) -
                        std::chrono::floor<std::chrono::seconds>(since_epoch);

    char buffer[40];
    if (millis.count() != 0) {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", f.year,
                      f.month, f.day, f.hour, f.minute, f.second,
                      static_cast<int>(millis.count()));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ", f.year, f.month,
                      f.day, f.hour, f.minute, f.second);
    }
    return std::string(buffer);
}

std::string format_date(const Timestamp& ts, int utc_offset_minutes) {
    const CalendarFields f = calendar_fields(ts, utc_offset_minutes);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", f.year, f.month, f.day);
    return std::string(buffer);
}

}  // namespace core
}  // namespace trade_journal
