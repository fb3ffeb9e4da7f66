#pragma once

#include "oss-metrics/utils/clock.hpp"

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

namespace ossmetrics::core {

using TimePoint = utils::TimePoint;

/// Seconds since 1970-01-01T00:00:00Z.
using EpochSeconds = std::int64_t;

/// Inclusive `[start, end]` bounds of one calendar quarter.
using QuarterInterval = std::pair<EpochSeconds, EpochSeconds>;

constexpr EpochSeconds kSecondsPerDay = 86400;

/**
 * @brief A date in the proleptic Gregorian calendar, no time of day.
 */
struct CivilDate {
	int year = 1970;
	unsigned month = 1; // 1-12
	unsigned day = 1;   // 1-31

	bool operator==(const CivilDate &other) const {
		return year == other.year && month == other.month && day == other.day;
	}
	bool operator!=(const CivilDate &other) const {
		return !(*this == other);
	}
};

// --------------------- Civil calendar arithmetic ---------------------
//
// All helpers work in UTC and never consult the process locale or TZ.

/// Days since the epoch for a civil date. Valid for any representable year.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day);

/// Inverse of daysFromCivil.
CivilDate civilFromDays(std::int64_t days);

bool isLeapYear(int year);

/// Number of days in `month` of `year`; 0 when month is outside 1-12.
unsigned daysInMonth(int year, unsigned month);

bool isValidCivilDate(int year, unsigned month, unsigned day);

/// Quarter number (1-4) that a month (1-12) belongs to.
unsigned quarterOfMonth(unsigned month);

/// First month (1, 4, 7 or 10) of the quarter containing `month`.
unsigned firstMonthOfQuarter(unsigned month);

/// UTC calendar date of an instant. Instants before the epoch floor toward
/// the earlier day.
CivilDate toCivil(EpochSeconds t);

EpochSeconds toEpochSeconds(const CivilDate &date);
EpochSeconds toEpochSeconds(TimePoint tp);
TimePoint fromEpochSeconds(EpochSeconds t);

EpochSeconds beginningOfDay(EpochSeconds t);

/// 00:00:00 of the first day of the quarter containing `t`.
EpochSeconds beginningOfQuarter(EpochSeconds t);
EpochSeconds beginningOfQuarter(const CivilDate &date);

/// 23:59:59 of the last day of the quarter containing `t`.
EpochSeconds endOfQuarter(EpochSeconds t);

/// Same calendar date and time of day `years` years earlier. February 29
/// maps to February 28 in non-leap years.
EpochSeconds yearsAgo(EpochSeconds t, int years);

// --------------------- Quarter intervals ---------------------

/**
 * @brief Builds quarter intervals covering a period.
 *
 * Boundaries that fall inside a quarter are expanded to that quarter, so the
 * first interval starts at the beginning of the quarter containing `from` and
 * the last one ends at the end of the quarter containing `to`. When `to`
 * lies in an earlier quarter than `from` the result is empty.
 *
 * @param from Period start.
 * @param to Period finish.
 * @return Ascending, contiguous `[start, end]` pairs, one per quarter.
 */
std::vector<QuarterInterval> buildQuartersIntervals(EpochSeconds from, EpochSeconds to);
std::vector<QuarterInterval> buildQuartersIntervals(TimePoint from, TimePoint to);

/**
 * @brief Builds quarter intervals for the year leading up to `now`.
 *
 * Equivalent to `buildQuartersIntervals(yearsAgo(now, 1), now)`.
 */
std::vector<QuarterInterval> buildQuartersIntervals(TimePoint now);

} // namespace ossmetrics::core
