#include "oss-metrics/stats/community_stats.hpp"

namespace ossmetrics::stats {

namespace {

// Positions in the schema below.
enum CommunityMetric : std::size_t {
	USERS_CREATING_ISSUES,
	USERS_COMMENTING_ISSUES,
	USERS_CREATING_PR,
	USERS_COMMENTING_PR,
	STARGAZERS,
	FORKS,
	SO_QUESTIONS,
	SO_ANSWERED_PERCENT
};

core::MetricsSchema makeSchema() {
	core::MetricsSchema schema;
	schema.metrics = {
	    "users_creating_issues_count", "users_commenting_issues_count", "users_creating_pr_count",
	    "users_commenting_pr_count",   "stargazers_count",              "forks_count",
	    "stack_overflow_questions_count", "stack_overflow_answered_questions_percent",
	};
	schema.aggregated_metrics = {"stack_overflow_answered_questions_percent"};
	schema.validate();
	return schema;
}

} // namespace

const core::MetricsSchema &CommunityQuarterStats::schema() {
	static const core::MetricsSchema instance = makeSchema();
	return instance;
}

CommunityQuarterStats::CommunityQuarterStats() : MetricsRecord(schema()) {
}

double CommunityQuarterStats::usersCreatingIssuesCount() const {
	return valueAt(USERS_CREATING_ISSUES);
}
void CommunityQuarterStats::setUsersCreatingIssuesCount(double value) {
	valueAt(USERS_CREATING_ISSUES) = value;
}

double CommunityQuarterStats::usersCommentingIssuesCount() const {
	return valueAt(USERS_COMMENTING_ISSUES);
}
void CommunityQuarterStats::setUsersCommentingIssuesCount(double value) {
	valueAt(USERS_COMMENTING_ISSUES) = value;
}

double CommunityQuarterStats::usersCreatingPrCount() const {
	return valueAt(USERS_CREATING_PR);
}
void CommunityQuarterStats::setUsersCreatingPrCount(double value) {
	valueAt(USERS_CREATING_PR) = value;
}

double CommunityQuarterStats::usersCommentingPrCount() const {
	return valueAt(USERS_COMMENTING_PR);
}
void CommunityQuarterStats::setUsersCommentingPrCount(double value) {
	valueAt(USERS_COMMENTING_PR) = value;
}

double CommunityQuarterStats::stargazersCount() const {
	return valueAt(STARGAZERS);
}
void CommunityQuarterStats::setStargazersCount(double value) {
	valueAt(STARGAZERS) = value;
}

double CommunityQuarterStats::forksCount() const {
	return valueAt(FORKS);
}
void CommunityQuarterStats::setForksCount(double value) {
	valueAt(FORKS) = value;
}

double CommunityQuarterStats::stackOverflowQuestionsCount() const {
	return valueAt(SO_QUESTIONS);
}
void CommunityQuarterStats::setStackOverflowQuestionsCount(double value) {
	valueAt(SO_QUESTIONS) = value;
}

double CommunityQuarterStats::stackOverflowAnsweredQuestionsPercent() const {
	return valueAt(SO_ANSWERED_PERCENT);
}
void CommunityQuarterStats::setStackOverflowAnsweredQuestionsPercent(double value) {
	valueAt(SO_ANSWERED_PERCENT) = value;
}

} // namespace ossmetrics::stats
