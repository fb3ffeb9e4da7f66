#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace ossmetrics::core {

/**
 * @class MetricValues
 * @brief Name to value mapping that remembers insertion order.
 *
 * Used for container snapshots and for trailing-year aggregates, where the
 * canonical metric order has to survive the trip to the caller.
 */
class MetricValues {
public:
	using Entry = std::pair<std::string, double>;
	using const_iterator = std::vector<Entry>::const_iterator;

	MetricValues() = default;

	/**
	 * @brief Zips names with values.
	 * @throws std::invalid_argument If the lengths differ or a name repeats.
	 */
	MetricValues(const std::vector<std::string> &names, const std::vector<double> &values);

	/// Overwrites an existing entry in place or appends a new one.
	void set(const std::string &name, double value);

	/// @throws std::out_of_range If no entry has this name.
	double at(const std::string &name) const;

	const double *find(const std::string &name) const;

	bool contains(const std::string &name) const {
		return find(name) != nullptr;
	}

	std::size_t size() const {
		return entries_.size();
	}

	bool empty() const {
		return entries_.empty();
	}

	std::vector<std::string> names() const;
	std::vector<double> values() const;

	const_iterator begin() const {
		return entries_.begin();
	}
	const_iterator end() const {
		return entries_.end();
	}

	bool operator==(const MetricValues &other) const {
		return entries_ == other.entries_;
	}
	bool operator!=(const MetricValues &other) const {
		return !(*this == other);
	}

private:
	std::vector<Entry> entries_;
};

/**
 * @brief Class-level description of a metrics container.
 *
 * `metrics` fixes the order of every value list a container produces.
 * Metrics listed in `aggregated_metrics` are averaged when quarters are
 * combined; all others are summed.
 */
struct MetricsSchema {
	std::vector<std::string> metrics;
	std::vector<std::string> aggregated_metrics;

	bool isAggregated(const std::string &name) const;

	/// @throws std::out_of_range If the schema has no such metric.
	std::size_t indexOf(const std::string &name) const;

	/**
	 * @brief Checks that names are unique and aggregated metrics are known.
	 * @throws std::invalid_argument On the first violation found.
	 */
	void validate() const;
};

/**
 * @class MetricsRecord
 * @brief Storage shared by concrete quarter containers.
 *
 * Holds one value per schema metric, zeroed on construction. A concrete
 * container derives from it, exposes its schema through static `metrics()`
 * and `aggregatedMetrics()`, and adds named accessors for the fields its
 * fetchers write.
 */
class MetricsRecord {
public:
	const MetricsSchema &schema() const {
		return *schema_;
	}

	/// Current values, aligned with `schema().metrics`.
	const std::vector<double> &metricValues() const {
		return values_;
	}

	/// @throws std::out_of_range For names outside the schema.
	double get(const std::string &name) const;

	/// @throws std::out_of_range For names outside the schema.
	void set(const std::string &name, double value);

	MetricValues toMapping() const;

	/// Copies every known metric from `mapping`; unknown names are ignored.
	void assign(const MetricValues &mapping);

protected:
	explicit MetricsRecord(const MetricsSchema &schema);

	double &valueAt(std::size_t index) {
		return values_[index];
	}
	double valueAt(std::size_t index) const {
		return values_[index];
	}

private:
	const MetricsSchema *schema_;
	std::vector<double> values_;
};

/// Number of quarters in a trailing year.
constexpr std::size_t kQuartersPerYear = 4;

/**
 * @brief Combines per-quarter value lists into one trailing-year mapping.
 *
 * Every position is summed across `quarter_values` in the order given, then
 * metrics listed in `aggregated` are divided by 4.0. The divisor does not
 * shrink when fewer than four quarters are supplied.
 *
 * @param metrics Canonical metric order; keys of the result.
 * @param aggregated Metrics to average instead of sum.
 * @param quarter_values One value list per quarter, aligned with `metrics`.
 * @throws std::logic_error If a value list does not match `metrics` in length.
 */
MetricValues aggregateQuarters(const std::vector<std::string> &metrics, const std::vector<std::string> &aggregated,
                               const std::vector<std::vector<double>> &quarter_values);

} // namespace ossmetrics::core
