#include <catch2/catch_test_macros.hpp>

#include "oss-metrics/stats/section.hpp"
#include "common/quarter_helpers.hpp"

#include <string>
#include <vector>

using namespace ossmetrics;
using tests::helpers::utc;
using tests::helpers::utcTime;

TEST_CASE("Community stats expose their schema", "[stats][community]") {
	const auto &metrics = stats::CommunityQuarterStats::metrics();
	REQUIRE(metrics.size() == 8);
	REQUIRE(metrics.back() == "stack_overflow_answered_questions_percent");
	REQUIRE(stats::CommunityQuarterStats::aggregatedMetrics() ==
	        std::vector<std::string>{"stack_overflow_answered_questions_percent"});

	stats::CommunityQuarterStats quarter;
	REQUIRE(quarter.stackOverflowQuestionsCount() == 0.0);

	quarter.setStackOverflowQuestionsCount(42);
	quarter.setStackOverflowAnsweredQuestionsPercent(87.5);
	quarter.setForksCount(3);

	REQUIRE(quarter.get("stack_overflow_questions_count") == 42.0);
	REQUIRE(quarter.toMapping().at("stack_overflow_answered_questions_percent") == 87.5);
	REQUIRE(quarter.metricValues()[5] == 3.0);
}

TEST_CASE("Agility stats average processing times", "[stats][agility]") {
	stats::AgilitySection section;

	core::EpochSeconds quarter_start = utc(2015, 1, 1);
	for (int i = 1; i <= 5; ++i) {
		auto &quarter = section.quarters[quarter_start];
		quarter.setIssuesClosedCount(10.0 * i);
		quarter.setIssuesProcessedInAvg(2.0 * i);
		quarter.setCommitsCount(100);
		quarter_start = core::endOfQuarter(quarter_start) + 1;
	}

	const auto year = section.quarters.lastYearAsHash(1);
	REQUIRE(year.at("issues_closed_count") == 100.0);
	REQUIRE(year.at("issues_processed_in_avg") == 5.0);
	REQUIRE(year.at("commits_count") == 400.0);
	REQUIRE(year.at("pr_processed_in_avg") == 0.0);
}

TEST_CASE("Section prepares time bounds", "[stats][section]") {
	core::QuarterStoreOptions options;
	options.clock = utils::fixedClock(utcTime(2017, 1, 1));
	stats::CommunitySection section(options);

	section.quarters[std::string("2010-04-15")].setStargazersCount(5);
	section.quarters[std::string("2016-10-01")].setStargazersCount(9);
	section.total.setStargazersCount(14);

	const auto [start, finish] = section.prepareTimeBounds();

	REQUIRE(start == utcTime(2010, 4, 1));
	REQUIRE(finish == utcTime(2016, 10, 1));
	REQUIRE(section.quarters.size() == 27);
	REQUIRE(section.total.stargazersCount() == 14.0);
}
