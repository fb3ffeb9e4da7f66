#pragma once

#include "oss-metrics/core/quarter_calendar.hpp"

#include <string>
#include <variant>

namespace ossmetrics::core {

/**
 * @brief Any of the date forms callers use to address a quarter.
 *
 * - `std::string`: calendar date `YYYY-MM-DD` (also `YYYY-MM` or `YYYY`);
 * - `EpochSeconds`: UNIX timestamp;
 * - `TimePoint`: system clock instant.
 */
using DateInput = std::variant<std::string, EpochSeconds, TimePoint>;

/**
 * @brief Parses a calendar date string.
 *
 * Accepts one to three dash-separated decimal components (year, month, day);
 * missing month and day default to 1 and components need not be zero padded.
 *
 * @throws MalformedDateError If the text is not a valid calendar date.
 */
CivilDate parseCalendarDate(const std::string &text);

/**
 * @brief Resolves a date to the key of the quarter containing it.
 *
 * Strings are read as calendar dates with no time zone. Timestamps are first
 * truncated to their UTC calendar date. Any two dates inside one quarter
 * resolve to the same key.
 *
 * @return Epoch seconds of 00:00:00 UTC on the first day of the quarter.
 * @throws MalformedDateError For unparseable strings.
 */
EpochSeconds dateToStart(const DateInput &date);

} // namespace ossmetrics::core
