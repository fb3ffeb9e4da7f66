#include "oss-metrics/stats/agility_stats.hpp"

namespace ossmetrics::stats {

namespace {

enum AgilityMetric : std::size_t {
	ISSUES_OPEN,
	ISSUES_CLOSED,
	PR_OPEN,
	PR_MERGED,
	COMMITS,
	RELEASES,
	ISSUES_PROCESSED_AVG,
	PR_PROCESSED_AVG
};

core::MetricsSchema makeSchema() {
	core::MetricsSchema schema;
	schema.metrics = {
	    "issues_open_count", "issues_closed_count", "pr_open_count",           "pr_merged_count",
	    "commits_count",     "releases_count",      "issues_processed_in_avg", "pr_processed_in_avg",
	};
	schema.aggregated_metrics = {"issues_processed_in_avg", "pr_processed_in_avg"};
	schema.validate();
	return schema;
}

} // namespace

const core::MetricsSchema &AgilityQuarterStats::schema() {
	static const core::MetricsSchema instance = makeSchema();
	return instance;
}

AgilityQuarterStats::AgilityQuarterStats() : MetricsRecord(schema()) {
}

double AgilityQuarterStats::issuesOpenCount() const {
	return valueAt(ISSUES_OPEN);
}
void AgilityQuarterStats::setIssuesOpenCount(double value) {
	valueAt(ISSUES_OPEN) = value;
}

double AgilityQuarterStats::issuesClosedCount() const {
	return valueAt(ISSUES_CLOSED);
}
void AgilityQuarterStats::setIssuesClosedCount(double value) {
	valueAt(ISSUES_CLOSED) = value;
}

double AgilityQuarterStats::prOpenCount() const {
	return valueAt(PR_OPEN);
}
void AgilityQuarterStats::setPrOpenCount(double value) {
	valueAt(PR_OPEN) = value;
}

double AgilityQuarterStats::prMergedCount() const {
	return valueAt(PR_MERGED);
}
void AgilityQuarterStats::setPrMergedCount(double value) {
	valueAt(PR_MERGED) = value;
}

double AgilityQuarterStats::commitsCount() const {
	return valueAt(COMMITS);
}
void AgilityQuarterStats::setCommitsCount(double value) {
	valueAt(COMMITS) = value;
}

double AgilityQuarterStats::releasesCount() const {
	return valueAt(RELEASES);
}
void AgilityQuarterStats::setReleasesCount(double value) {
	valueAt(RELEASES) = value;
}

double AgilityQuarterStats::issuesProcessedInAvg() const {
	return valueAt(ISSUES_PROCESSED_AVG);
}
void AgilityQuarterStats::setIssuesProcessedInAvg(double value) {
	valueAt(ISSUES_PROCESSED_AVG) = value;
}

double AgilityQuarterStats::prProcessedInAvg() const {
	return valueAt(PR_PROCESSED_AVG);
}
void AgilityQuarterStats::setPrProcessedInAvg(double value) {
	valueAt(PR_PROCESSED_AVG) = value;
}

} // namespace ossmetrics::stats
