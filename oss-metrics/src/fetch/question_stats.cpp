#include "oss-metrics/fetch/question_stats.hpp"
#include "oss-metrics/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace ossmetrics::fetch {

std::optional<double> answeredQuestionsPercent(std::int64_t total_questions, std::int64_t no_answers_questions) {
	if (total_questions == 0) {
		return std::nullopt;
	}

	const auto answered = static_cast<double>(total_questions - no_answers_questions);
	const double percent = (answered * 100.0) / static_cast<double>(total_questions);
	return std::round(percent * 100.0) / 100.0;
}

QuestionStatsCollector::QuestionStatsCollector(IQuestionSource &source, QuestionStatsConfig config)
    : source_(source), config_(std::move(config)) {
	if (config_.total_years <= 0) {
		throw std::invalid_argument("total_years must be positive.");
	}
}

void QuestionStatsCollector::process(stats::CommunitySection &section) {
	processQuartersStats(section);
	processTotalStats(section);
}

void QuestionStatsCollector::processQuartersStats(stats::CommunitySection &section) {
	section.quarters.withQuartersIntervals([&](core::EpochSeconds from, core::EpochSeconds to) {
		const auto total = source_.questionsCount(from, to);
		const auto no_answers = source_.noAnswersQuestionsCount(from, to);

		auto &quarter = section.quarters[from];
		quarter.setStackOverflowQuestionsCount(static_cast<double>(total));
		quarter.setStackOverflowAnsweredQuestionsPercent(answeredQuestionsPercent(total, no_answers).value_or(0.0));

		OSSM_DEBUG("{}: {} questions, {} unanswered in [{}, {}]", source_.getName(), total, no_answers, from, to);
	});
}

void QuestionStatsCollector::processTotalStats(stats::CommunitySection &section) {
	const auto [from, to] = totalCountTimeBoundaries();
	const auto total = source_.questionsCount(from, to);
	const auto no_answers = source_.noAnswersQuestionsCount(from, to);

	section.total.setStackOverflowQuestionsCount(static_cast<double>(total));
	section.total.setStackOverflowAnsweredQuestionsPercent(answeredQuestionsPercent(total, no_answers).value_or(0.0));

	OSSM_DEBUG("{}: {} questions in total", source_.getName(), total);
}

std::pair<core::EpochSeconds, core::EpochSeconds> QuestionStatsCollector::totalCountTimeBoundaries() const {
	const core::EpochSeconds now = core::toEpochSeconds(config_.clock());
	return {core::yearsAgo(now, config_.total_years), core::beginningOfDay(now)};
}

} // namespace ossmetrics::fetch
