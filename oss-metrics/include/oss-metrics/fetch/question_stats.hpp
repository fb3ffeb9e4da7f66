#pragma once

#include "oss-metrics/core/quarter_calendar.hpp"
#include "oss-metrics/stats/section.hpp"
#include "oss-metrics/utils/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ossmetrics::fetch {

/**
 * @class IQuestionSource
 * @brief Q&A site client that counts questions tagged with a project.
 *
 * Implementations talk to the remote service; they own paging, rate limits
 * and authentication, and report failures by throwing.
 */
class IQuestionSource {
public:
	virtual ~IQuestionSource() = default;

	/// Questions created within `[from, to]` (epoch seconds).
	virtual std::int64_t questionsCount(core::EpochSeconds from, core::EpochSeconds to) = 0;

	/// Questions created within `[from, to]` that have no answer.
	virtual std::int64_t noAnswersQuestionsCount(core::EpochSeconds from, core::EpochSeconds to) = 0;

	virtual std::string getName() const = 0;
};

/**
 * @brief Share of answered questions as a percentage rounded to 2 decimals.
 * @return Empty when there are no questions.
 */
std::optional<double> answeredQuestionsPercent(std::int64_t total_questions, std::int64_t no_answers_questions);

struct QuestionStatsConfig {
	utils::Clock clock = utils::systemClock();
	// Length of the all-time window, ending at the start of today.
	int total_years = 10;
};

/**
 * @class QuestionStatsCollector
 * @brief Writes question statistics from a source into a community section.
 */
class QuestionStatsCollector {
public:
	explicit QuestionStatsCollector(IQuestionSource &source, QuestionStatsConfig config = QuestionStatsConfig{});

	/// Quarterly statistics followed by all-time totals.
	void process(stats::CommunitySection &section);

	/**
	 * @brief Queries every window from `withQuartersIntervals` and stores the
	 * counts in the bucket of the window start.
	 */
	void processQuartersStats(stats::CommunitySection &section);

	void processTotalStats(stats::CommunitySection &section);

	/// `[now - total_years, beginning of today]`.
	std::pair<core::EpochSeconds, core::EpochSeconds> totalCountTimeBoundaries() const;

private:
	IQuestionSource &source_;
	QuestionStatsConfig config_;
};

} // namespace ossmetrics::fetch
