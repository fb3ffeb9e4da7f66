#include "oss-metrics/core/metrics_container.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace ossmetrics::core {

MetricValues::MetricValues(const std::vector<std::string> &names, const std::vector<double> &values) {
	if (names.size() != values.size()) {
		throw std::invalid_argument("Metric names and values must have the same size.");
	}
	entries_.reserve(names.size());
	for (std::size_t i = 0; i < names.size(); ++i) {
		if (contains(names[i])) {
			throw std::invalid_argument("Metric '" + names[i] + "' appears more than once.");
		}
		entries_.emplace_back(names[i], values[i]);
	}
}

void MetricValues::set(const std::string &name, double value) {
	for (auto &entry : entries_) {
		if (entry.first == name) {
			entry.second = value;
			return;
		}
	}
	entries_.emplace_back(name, value);
}

const double *MetricValues::find(const std::string &name) const {
	for (const auto &entry : entries_) {
		if (entry.first == name) {
			return &entry.second;
		}
	}
	return nullptr;
}

double MetricValues::at(const std::string &name) const {
	const double *value = find(name);
	if (!value) {
		throw std::out_of_range("Metric '" + name + "' not found.");
	}
	return *value;
}

std::vector<std::string> MetricValues::names() const {
	std::vector<std::string> result;
	result.reserve(entries_.size());
	for (const auto &entry : entries_) {
		result.push_back(entry.first);
	}
	return result;
}

std::vector<double> MetricValues::values() const {
	std::vector<double> result;
	result.reserve(entries_.size());
	for (const auto &entry : entries_) {
		result.push_back(entry.second);
	}
	return result;
}

bool MetricsSchema::isAggregated(const std::string &name) const {
	return std::find(aggregated_metrics.begin(), aggregated_metrics.end(), name) != aggregated_metrics.end();
}

std::size_t MetricsSchema::indexOf(const std::string &name) const {
	const auto it = std::find(metrics.begin(), metrics.end(), name);
	if (it == metrics.end()) {
		throw std::out_of_range("Metric '" + name + "' is not part of the schema.");
	}
	return static_cast<std::size_t>(it - metrics.begin());
}

void MetricsSchema::validate() const {
	std::unordered_set<std::string> seen;
	for (const auto &name : metrics) {
		if (!seen.insert(name).second) {
			throw std::invalid_argument("Metric '" + name + "' is declared more than once.");
		}
	}
	for (const auto &name : aggregated_metrics) {
		if (seen.count(name) == 0) {
			throw std::invalid_argument("Aggregated metric '" + name + "' is not declared in metrics.");
		}
	}
}

MetricsRecord::MetricsRecord(const MetricsSchema &schema) : schema_(&schema), values_(schema.metrics.size(), 0.0) {
}

double MetricsRecord::get(const std::string &name) const {
	return values_[schema_->indexOf(name)];
}

void MetricsRecord::set(const std::string &name, double value) {
	values_[schema_->indexOf(name)] = value;
}

MetricValues MetricsRecord::toMapping() const {
	return MetricValues(schema_->metrics, values_);
}

void MetricsRecord::assign(const MetricValues &mapping) {
	for (std::size_t i = 0; i < schema_->metrics.size(); ++i) {
		if (const double *value = mapping.find(schema_->metrics[i])) {
			values_[i] = *value;
		}
	}
}

MetricValues aggregateQuarters(const std::vector<std::string> &metrics, const std::vector<std::string> &aggregated,
                               const std::vector<std::vector<double>> &quarter_values) {
	std::vector<double> sums(metrics.size(), 0.0);

	for (const auto &values : quarter_values) {
		if (values.size() != metrics.size()) {
			throw std::logic_error("Quarter produced " + std::to_string(values.size()) + " values for " +
			                       std::to_string(metrics.size()) + " metrics.");
		}
		for (std::size_t i = 0; i < values.size(); ++i) {
			sums[i] += values[i];
		}
	}

	MetricValues result(metrics, sums);
	for (const auto &name : aggregated) {
		result.set(name, result.at(name) / static_cast<double>(kQuartersPerYear));
	}
	return result;
}

} // namespace ossmetrics::core
