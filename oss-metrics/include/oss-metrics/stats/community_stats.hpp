#pragma once

#include "oss-metrics/core/metrics_container.hpp"

#include <string>
#include <vector>

namespace ossmetrics::stats {

/**
 * @class CommunityQuarterStats
 * @brief Community activity of a project within one quarter (or all time).
 *
 * Counts are summed across quarters; the answered-questions percentage is
 * averaged.
 */
class CommunityQuarterStats : public core::MetricsRecord {
public:
	static const core::MetricsSchema &schema();

	static const std::vector<std::string> &metrics() {
		return schema().metrics;
	}

	static const std::vector<std::string> &aggregatedMetrics() {
		return schema().aggregated_metrics;
	}

	CommunityQuarterStats();

	double usersCreatingIssuesCount() const;
	void setUsersCreatingIssuesCount(double value);

	double usersCommentingIssuesCount() const;
	void setUsersCommentingIssuesCount(double value);

	double usersCreatingPrCount() const;
	void setUsersCreatingPrCount(double value);

	double usersCommentingPrCount() const;
	void setUsersCommentingPrCount(double value);

	double stargazersCount() const;
	void setStargazersCount(double value);

	double forksCount() const;
	void setForksCount(double value);

	double stackOverflowQuestionsCount() const;
	void setStackOverflowQuestionsCount(double value);

	double stackOverflowAnsweredQuestionsPercent() const;
	void setStackOverflowAnsweredQuestionsPercent(double value);
};

} // namespace ossmetrics::stats
