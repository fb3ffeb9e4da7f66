#include <catch2/catch_test_macros.hpp>

#include "oss-metrics/core/quarter_calendar.hpp"
#include "common/quarter_helpers.hpp"

#include <vector>

using namespace ossmetrics::core;
using tests::helpers::utc;
using tests::helpers::utcTime;

TEST_CASE("Civil conversion round trips across eras", "[core][calendar]") {
	REQUIRE(daysFromCivil(1970, 1, 1) == 0);
	REQUIRE(daysFromCivil(2000, 3, 1) == 11017);
	REQUIRE(daysFromCivil(1969, 12, 31) == -1);

	for (std::int64_t days : {-719468LL, -1LL, 0LL, 59LL, 11016LL, 16801LL, 2932896LL}) {
		const CivilDate date = civilFromDays(days);
		REQUIRE(daysFromCivil(date.year, date.month, date.day) == days);
	}

	REQUIRE(civilFromDays(11016) == CivilDate{2000, 2, 29});
	REQUIRE(toCivil(-1) == CivilDate{1969, 12, 31});
}

TEST_CASE("Month lengths follow the Gregorian leap rules", "[core][calendar]") {
	REQUIRE(daysInMonth(2016, 2) == 29);
	REQUIRE(daysInMonth(2015, 2) == 28);
	REQUIRE(daysInMonth(1900, 2) == 28);
	REQUIRE(daysInMonth(2000, 2) == 29);
	REQUIRE(daysInMonth(2015, 9) == 30);
	REQUIRE(daysInMonth(2015, 13) == 0);

	REQUIRE(isValidCivilDate(2016, 2, 29));
	REQUIRE_FALSE(isValidCivilDate(2015, 2, 29));
	REQUIRE_FALSE(isValidCivilDate(2015, 0, 1));
}

TEST_CASE("Quarter boundaries", "[core][calendar]") {
	REQUIRE(quarterOfMonth(1) == 1);
	REQUIRE(quarterOfMonth(6) == 2);
	REQUIRE(quarterOfMonth(9) == 3);
	REQUIRE(quarterOfMonth(12) == 4);
	REQUIRE(firstMonthOfQuarter(11) == 10);

	REQUIRE(beginningOfQuarter(utc(2015, 9, 1, 13, 45, 10)) == utc(2015, 7, 1));
	REQUIRE(endOfQuarter(utc(2015, 9, 1, 13, 45, 10)) == utc(2015, 9, 30, 23, 59, 59));
	REQUIRE(endOfQuarter(utc(2015, 11, 3)) == utc(2015, 12, 31, 23, 59, 59));
	REQUIRE(endOfQuarter(utc(2016, 2, 10)) == utc(2016, 3, 31, 23, 59, 59));
	REQUIRE(beginningOfQuarter(utc(1969, 11, 20, 6)) == utc(1969, 10, 1));

	REQUIRE(beginningOfDay(utc(2015, 9, 1, 13, 45, 10)) == utc(2015, 9, 1));
	REQUIRE(beginningOfDay(-1) == -kSecondsPerDay);
}

TEST_CASE("yearsAgo keeps the calendar date", "[core][calendar]") {
	REQUIRE(yearsAgo(utc(2015, 9, 1, 8, 30), 1) == utc(2014, 9, 1, 8, 30));
	REQUIRE(yearsAgo(utc(2016, 2, 29, 12), 1) == utc(2015, 2, 28, 12));
	REQUIRE(yearsAgo(utc(2020, 1, 15), 10) == utc(2010, 1, 15));
}

TEST_CASE("buildQuartersIntervals expands the period to whole quarters", "[core][calendar][intervals]") {
	const auto intervals = buildQuartersIntervals(utc(2013, 9, 1), utc(2015, 9, 1));

	const std::vector<QuarterInterval> expected{
	    {utc(2013, 7, 1), utc(2013, 9, 30, 23, 59, 59)},  {utc(2013, 10, 1), utc(2013, 12, 31, 23, 59, 59)},
	    {utc(2014, 1, 1), utc(2014, 3, 31, 23, 59, 59)},  {utc(2014, 4, 1), utc(2014, 6, 30, 23, 59, 59)},
	    {utc(2014, 7, 1), utc(2014, 9, 30, 23, 59, 59)},  {utc(2014, 10, 1), utc(2014, 12, 31, 23, 59, 59)},
	    {utc(2015, 1, 1), utc(2015, 3, 31, 23, 59, 59)},  {utc(2015, 4, 1), utc(2015, 6, 30, 23, 59, 59)},
	    {utc(2015, 7, 1), utc(2015, 9, 30, 23, 59, 59)},
	};

	REQUIRE(intervals.size() == 9);
	REQUIRE(intervals == expected);
}

TEST_CASE("buildQuartersIntervals yields contiguous covering quarters", "[core][calendar][intervals]") {
	const EpochSeconds from = utc(2011, 2, 17, 9, 15);
	const EpochSeconds to = utc(2016, 12, 31, 23, 59, 59);
	const auto intervals = buildQuartersIntervals(from, to);

	REQUIRE_FALSE(intervals.empty());
	REQUIRE(intervals.front().first <= from);
	REQUIRE(intervals.back().second >= to);

	for (std::size_t i = 0; i < intervals.size(); ++i) {
		const auto &[start, end] = intervals[i];
		REQUIRE(start < end);
		REQUIRE(beginningOfQuarter(start) == start);
		REQUIRE(endOfQuarter(start) == end);
		if (i + 1 < intervals.size()) {
			REQUIRE(end + 1 == intervals[i + 1].first);
		}
	}

	for (EpochSeconds probe = from; probe <= to; probe += 17 * kSecondsPerDay) {
		bool covered = false;
		for (const auto &[start, end] : intervals) {
			covered = covered || (start <= probe && probe <= end);
		}
		REQUIRE(covered);
	}
}

TEST_CASE("buildQuartersIntervals handles edge periods", "[core][calendar][intervals]") {
	SECTION("Inverted period is empty") {
		REQUIRE(buildQuartersIntervals(utc(2015, 9, 1), utc(2013, 9, 1)).empty());
	}

	SECTION("Period inside one quarter gives that quarter") {
		const auto intervals = buildQuartersIntervals(utc(2015, 4, 2), utc(2015, 4, 30));
		REQUIRE(intervals.size() == 1);
		REQUIRE(intervals.front() == QuarterInterval{utc(2015, 4, 1), utc(2015, 6, 30, 23, 59, 59)});
	}

	SECTION("Trailing year defaults come from the reference time") {
		const auto intervals = buildQuartersIntervals(utcTime(2015, 9, 1, 12));
		REQUIRE(intervals.size() == 5);
		REQUIRE(intervals.front().first == utc(2014, 7, 1));
		REQUIRE(intervals.back().second == utc(2015, 9, 30, 23, 59, 59));
	}

	SECTION("Time points and seconds agree") {
		REQUIRE(buildQuartersIntervals(utcTime(2013, 9, 1), utcTime(2015, 9, 1)) ==
		        buildQuartersIntervals(utc(2013, 9, 1), utc(2015, 9, 1)));
	}
}
