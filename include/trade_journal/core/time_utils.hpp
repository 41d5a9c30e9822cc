// include/trade_journal/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <string>
#include "trade_journal/core/error.hpp"
#include "trade_journal/core/types.hpp"

namespace trade_journal {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * This function provides a platform-independent way to get local time
 * using thread-safe variants of the standard library functions.
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Calendar breakdown of an instant
 */
struct CalendarFields {
    int year{1970};
    int month{1};    // 1..12
    int day{1};      // 1..31
    int weekday{3};  // 0 = Monday .. 6 = Sunday
    int hour{0};
    int minute{0};
    int second{0};
};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
int64_t days_from_civil(int year, int month, int day);

/**
 * @brief Build a UTC timestamp from calendar components
 */
Timestamp make_utc_timestamp(int year, int month, int day, int hour = 0, int minute = 0,
                             int second = 0);

/**
 * @brief Calendar fields of a timestamp in UTC shifted by a fixed offset
 * @param ts Instant to break down
 * @param utc_offset_minutes Offset of the trading session clock from UTC
 */
CalendarFields calendar_fields(const Timestamp& ts, int utc_offset_minutes = 0);

/**
 * @brief Parse a timestamp as written in requests, storage and broker exports
 *
 * Accepted forms:
 *   YYYY-MM-DD
 *   YYYY-MM-DD[T| ]HH:MM[:SS[.fraction]][Z|+HH:MM|-HH:MM]
 *   MM/DD/YYYY[ HH:MM[:SS]][ TZ]  (trailing zone abbreviations are read as UTC)
 *
 * @param text Timestamp text
 * @return Parsed instant or INVALID_TIMESTAMP
 */
Result<Timestamp> parse_timestamp(const std::string& text);

/**
 * @brief Parse one side of a request date range
 *
 * A date-only end bound covers the whole day.
 *
 * @param text Timestamp text
 * @param is_end_bound True when parsing the upper bound
 */
Result<Timestamp> parse_range_bound(const std::string& text, bool is_end_bound);

/**
 * @brief Format as ISO-8601 UTC ("2024-03-01T14:30:00Z", milliseconds when non-zero)
 */
std::string format_iso8601(const Timestamp& ts);

/**
 * @brief Format the calendar date ("2024-03-01") in UTC shifted by an offset
 */
std::string format_date(const Timestamp& ts, int utc_offset_minutes = 0);

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace trade_journal
