#include "oss-metrics/fetch/question_stats.hpp"
#include "oss-metrics/stats/section.hpp"
#include "oss-metrics/utils/logging.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace ossmetrics;

namespace {

// Deterministic stand-in for a Q&A site: roughly 40 questions per quarter,
// a quarter of them unanswered.
class SyntheticQuestionSource : public fetch::IQuestionSource {
public:
	std::int64_t questionsCount(core::EpochSeconds from, core::EpochSeconds to) override {
		return 40 * (to - from) / (91 * core::kSecondsPerDay);
	}

	std::int64_t noAnswersQuestionsCount(core::EpochSeconds from, core::EpochSeconds to) override {
		return questionsCount(from, to) / 4;
	}

	std::string getName() const override {
		return "SyntheticQuestionSource";
	}
};

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

std::string formatDate(core::EpochSeconds t) {
	const auto date = core::toCivil(t);
	std::ostringstream out;
	out << date.year << '-' << std::setw(2) << std::setfill('0') << date.month << '-' << std::setw(2) << date.day;
	return out.str();
}

void printAgility(const stats::AgilitySection &section) {
	section.quarters.eachSorted([](core::EpochSeconds key, const stats::AgilityQuarterStats &quarter) {
		std::cout << "  " << formatDate(key) << " | closed: " << std::setw(4) << quarter.issuesClosedCount()
		          << " | merged: " << std::setw(4) << quarter.prMergedCount()
		          << " | avg days: " << quarter.issuesProcessedInAvg() << "\n";
	});
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	printHeader("Agility quarters");
	stats::AgilitySection agility;
	agility.quarters[std::string("2015-02-10")].setIssuesClosedCount(12);
	agility.quarters[std::string("2015-05-03")].setIssuesClosedCount(18);
	agility.quarters[std::string("2015-12-24")].setIssuesClosedCount(25);
	agility.quarters[std::string("2016-01-15")].setIssuesClosedCount(30);
	agility.quarters[std::string("2016-04-02")].setIssuesClosedCount(9);
	agility.quarters.eachSorted([](core::EpochSeconds, stats::AgilityQuarterStats &quarter) {
		quarter.setPrMergedCount(quarter.issuesClosedCount() / 2);
		quarter.setIssuesProcessedInAvg(quarter.issuesClosedCount() / 3);
	});

	const auto [start, finish] = agility.prepareTimeBounds();
	std::cout << "Covered " << formatDate(core::toEpochSeconds(start)) << " .. "
	          << formatDate(core::toEpochSeconds(finish)) << " in " << agility.quarters.size() << " quarters\n";
	printAgility(agility);

	const auto year = agility.quarters.lastYearAsHash();
	std::cout << "\nTrailing year (offset 1):\n";
	for (const auto &[name, value] : year) {
		std::cout << "  " << std::setw(24) << std::left << name << std::right << value << "\n";
	}

	printHeader("Community questions");
	SyntheticQuestionSource source;
	stats::CommunitySection community;
	fetch::QuestionStatsCollector collector(source);
	collector.process(community);

	community.quarters.eachSorted([](core::EpochSeconds key, const stats::CommunityQuarterStats &quarter) {
		std::cout << "  " << formatDate(key) << " | questions: " << std::setw(3)
		          << quarter.stackOverflowQuestionsCount()
		          << " | answered: " << quarter.stackOverflowAnsweredQuestionsPercent() << "%\n";
	});
	std::cout << "  all time  | questions: " << community.total.stackOverflowQuestionsCount()
	          << " | answered: " << community.total.stackOverflowAnsweredQuestionsPercent() << "%\n";

	printHeader("Snapshot");
	std::cout << community.quarters.toJsonString() << "\n";

	return 0;
}
