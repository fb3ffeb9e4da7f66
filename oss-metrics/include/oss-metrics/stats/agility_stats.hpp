#pragma once

#include "oss-metrics/core/metrics_container.hpp"

#include <string>
#include <vector>

namespace ossmetrics::stats {

/**
 * @class AgilityQuarterStats
 * @brief Maintenance activity of a project within one quarter (or all time).
 *
 * Counts are summed across quarters; average processing times are averaged.
 */
class AgilityQuarterStats : public core::MetricsRecord {
public:
	static const core::MetricsSchema &schema();

	static const std::vector<std::string> &metrics() {
		return schema().metrics;
	}

	static const std::vector<std::string> &aggregatedMetrics() {
		return schema().aggregated_metrics;
	}

	AgilityQuarterStats();

	double issuesOpenCount() const;
	void setIssuesOpenCount(double value);

	double issuesClosedCount() const;
	void setIssuesClosedCount(double value);

	double prOpenCount() const;
	void setPrOpenCount(double value);

	double prMergedCount() const;
	void setPrMergedCount(double value);

	double commitsCount() const;
	void setCommitsCount(double value);

	double releasesCount() const;
	void setReleasesCount(double value);

	// Average days from opening to closing.
	double issuesProcessedInAvg() const;
	void setIssuesProcessedInAvg(double value);

	double prProcessedInAvg() const;
	void setPrProcessedInAvg(double value);
};

} // namespace ossmetrics::stats
