#include "oss-metrics/core/quarter_calendar.hpp"

namespace ossmetrics::core {

namespace {

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
	std::int64_t quotient = value / divisor;
	if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
		--quotient;
	}
	return quotient;
}

// Start of the quarter that follows the one containing `date`.
EpochSeconds beginningOfNextQuarter(const CivilDate &date) {
	int year = date.year;
	unsigned month = firstMonthOfQuarter(date.month) + 3;
	if (month > 12) {
		month -= 12;
		++year;
	}
	return daysFromCivil(year, month, 1) * kSecondsPerDay;
}

} // namespace

// Era-based conversion: 400-year eras of 146097 days, years starting in March
// so the leap day is the last day of the shifted year.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = floorDiv(y, 400);
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = month > 2 ? month - 3 : month + 9;
	const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(day) - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	const std::int64_t z = days + 719468;
	const std::int64_t era = floorDiv(z, 146097);
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;

	CivilDate date;
	date.year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
	date.month = static_cast<unsigned>(m);
	date.day = static_cast<unsigned>(d);
	return date;
}

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
	switch (month) {
	case 1: case 3: case 5: case 7: case 8: case 10: case 12:
		return 31;
	case 4: case 6: case 9: case 11:
		return 30;
	case 2:
		return isLeapYear(year) ? 29 : 28;
	default:
		return 0;
	}
}

bool isValidCivilDate(int year, unsigned month, unsigned day) {
	return month >= 1 && month <= 12 && day >= 1 && day <= daysInMonth(year, month);
}

unsigned quarterOfMonth(unsigned month) {
	return (month - 1) / 3 + 1;
}

unsigned firstMonthOfQuarter(unsigned month) {
	return (quarterOfMonth(month) - 1) * 3 + 1;
}

CivilDate toCivil(EpochSeconds t) {
	return civilFromDays(floorDiv(t, kSecondsPerDay));
}

EpochSeconds toEpochSeconds(const CivilDate &date) {
	return daysFromCivil(date.year, date.month, date.day) * kSecondsPerDay;
}

EpochSeconds toEpochSeconds(TimePoint tp) {
	return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochSeconds(EpochSeconds t) {
	return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds{t})};
}

EpochSeconds beginningOfDay(EpochSeconds t) {
	return floorDiv(t, kSecondsPerDay) * kSecondsPerDay;
}

EpochSeconds beginningOfQuarter(const CivilDate &date) {
	return daysFromCivil(date.year, firstMonthOfQuarter(date.month), 1) * kSecondsPerDay;
}

EpochSeconds beginningOfQuarter(EpochSeconds t) {
	return beginningOfQuarter(toCivil(t));
}

EpochSeconds endOfQuarter(EpochSeconds t) {
	return beginningOfNextQuarter(toCivil(t)) - 1;
}

EpochSeconds yearsAgo(EpochSeconds t, int years) {
	const EpochSeconds seconds_of_day = t - beginningOfDay(t);
	const CivilDate date = toCivil(t);

	const int year = date.year - years;
	unsigned day = date.day;
	const unsigned month_length = daysInMonth(year, date.month);
	if (day > month_length) {
		day = month_length;
	}
	return daysFromCivil(year, date.month, day) * kSecondsPerDay + seconds_of_day;
}

std::vector<QuarterInterval> buildQuartersIntervals(EpochSeconds from, EpochSeconds to) {
	std::vector<QuarterInterval> intervals;

	EpochSeconds interval_start = beginningOfQuarter(from);
	const EpochSeconds finish = endOfQuarter(to);

	while (interval_start <= finish) {
		const EpochSeconds interval_end = endOfQuarter(interval_start);
		intervals.emplace_back(interval_start, interval_end);
		interval_start = interval_end + 1;
	}

	return intervals;
}

std::vector<QuarterInterval> buildQuartersIntervals(TimePoint from, TimePoint to) {
	return buildQuartersIntervals(toEpochSeconds(from), toEpochSeconds(to));
}

std::vector<QuarterInterval> buildQuartersIntervals(TimePoint now) {
	const EpochSeconds to = toEpochSeconds(now);
	return buildQuartersIntervals(yearsAgo(to, 1), to);
}

} // namespace ossmetrics::core
