#pragma once

#include "oss-metrics/core/errors.hpp"
#include "oss-metrics/core/metrics_container.hpp"
#include "oss-metrics/core/quarter_calendar.hpp"
#include "oss-metrics/core/quarter_key.hpp"
#include "oss-metrics/core/serialization.hpp"
#include "oss-metrics/utils/clock.hpp"
#include "oss-metrics/utils/logging.hpp"

#include <json/json.h>

#include <cstddef>
#include <iterator>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ossmetrics::core {

/// Distance between probes when filling gaps; always lands in the next quarter.
constexpr EpochSeconds kFillStepSeconds = 93 * kSecondsPerDay;

struct QuarterStoreOptions {
	// Source of "now" for default bounds and interval discovery.
	utils::Clock clock = utils::systemClock();
	// Raise DegenerateAggregationError instead of aggregating a short window.
	bool strict_aggregation = false;
};

/**
 * @class QuarterStore
 * @brief Sparse series of metric containers keyed by calendar quarter.
 *
 * Keys are quarter-start timestamps produced by dateToStart(); each key owns
 * exactly one container, created on first access and never replaced.
 *
 * `Quarter` must be default constructible and provide:
 *  - `static const std::vector<std::string> &metrics()`;
 *  - `static const std::vector<std::string> &aggregatedMetrics()`;
 *  - `metricValues()` returning values aligned with `metrics()`;
 *  - `MetricValues toMapping() const` and `void assign(const MetricValues &)`.
 *
 * Not synchronized: writers must be serialized by the caller.
 */
template <typename Quarter>
class QuarterStore {
	static_assert(std::is_default_constructible<Quarter>::value, "Quarter containers must be default constructible.");

public:
	using QuarterMap = std::map<EpochSeconds, Quarter>;

	explicit QuarterStore(QuarterStoreOptions options = QuarterStoreOptions{})
	    : options_(std::move(options)), start_date_(options_.clock()), end_date_(start_date_) {
	}

	/// @copydoc ossmetrics::core::buildQuartersIntervals(EpochSeconds, EpochSeconds)
	static std::vector<QuarterInterval> buildQuartersIntervals(EpochSeconds from, EpochSeconds to) {
		return core::buildQuartersIntervals(from, to);
	}

	/**
	 * @brief Strict lookup of the quarter containing `date`.
	 * @throws NotFoundError If that quarter has no bucket.
	 */
	Quarter &fetch(const DateInput &date) {
		return const_cast<Quarter &>(static_cast<const QuarterStore &>(*this).fetch(date));
	}

	const Quarter &fetch(const DateInput &date) const {
		const EpochSeconds key = dateToStart(date);
		const auto it = quarters_.find(key);
		if (it == quarters_.end()) {
			throw NotFoundError("No quarter stored for key " + quarterKeyToString(key) + ".");
		}
		return it->second;
	}

	/// Returns the bucket for the quarter containing `date`, creating it if needed.
	Quarter &findOrCreate(const DateInput &date) {
		const EpochSeconds key = dateToStart(date);
		auto [it, inserted] = quarters_.try_emplace(key);
		if (inserted) {
			OSSM_TRACE("Created quarter bucket {}", key);
		}
		return it->second;
	}

	Quarter &operator[](const DateInput &date) {
		return findOrCreate(date);
	}

	bool contains(const DateInput &date) const {
		return quarters_.count(dateToStart(date)) != 0;
	}

	std::size_t size() const {
		return quarters_.size();
	}

	bool empty() const {
		return quarters_.empty();
	}

	const QuarterMap &quarters() const {
		return quarters_;
	}

	/// Quarter keys in ascending order.
	std::vector<EpochSeconds> keys() const {
		std::vector<EpochSeconds> result;
		result.reserve(quarters_.size());
		for (const auto &entry : quarters_) {
			result.push_back(entry.first);
		}
		return result;
	}

	/// Earliest quarter after fullfill(); construction time before that.
	TimePoint startDate() const {
		return start_date_;
	}

	/// Latest quarter after fullfill(); construction time before that.
	TimePoint endDate() const {
		return end_date_;
	}

	/**
	 * @brief Creates empty buckets for every missing quarter between the first
	 * and last stored ones, then pins startDate()/endDate() to those quarters.
	 *
	 * Call once all data is gathered. Does nothing on an empty store.
	 */
	void fullfill() {
		if (quarters_.empty()) {
			return;
		}

		const EpochSeconds first = quarters_.begin()->first;
		const EpochSeconds last = quarters_.rbegin()->first;
		const std::size_t before = quarters_.size();

		// Each probe starts from a quarter start, so 93 days never skips past
		// the following quarter.
		for (EpochSeconds period = first; period <= last; period = dateToStart(period + kFillStepSeconds)) {
			findOrCreate(period);
		}

		start_date_ = fromEpochSeconds(first);
		end_date_ = fromEpochSeconds(last);
		OSSM_DEBUG("Filled {} missing quarters between {} and {}", quarters_.size() - before, first, last);
	}

	bool hasFullTrailingYear(std::size_t offset = 1) const {
		return quarters_.size() >= kQuartersPerYear + offset;
	}

	/**
	 * @brief Metric values combined over a trailing year.
	 *
	 * Takes the `4 + offset` most recent quarters and combines the oldest four
	 * of them, so `offset` quarters at the recent end are skipped. Summed
	 * metrics add up; aggregated metrics are averaged over 4.
	 *
	 * With fewer quarters stored the combination covers whatever is
	 * available, which under-counts; strict_aggregation turns that into an
	 * error.
	 *
	 * @param offset Quarters between the most recent one and the window end.
	 * @return Mapping in canonical metric order.
	 * @throws DegenerateAggregationError In strict mode, when the window is short.
	 */
	MetricValues lastYearAsHash(std::size_t offset = 1) const {
		const std::size_t window = kQuartersPerYear + offset;

		if (quarters_.size() < window) {
			if (options_.strict_aggregation) {
				throw DegenerateAggregationError("Trailing year needs " + std::to_string(window) +
				                                 " quarters, store has " + std::to_string(quarters_.size()) + ".");
			}
			OSSM_WARN("Trailing year with offset {} covers {} of {} quarters", offset, quarters_.size(), window);
		}

		auto it = quarters_.size() > window ? std::prev(quarters_.end(), static_cast<std::ptrdiff_t>(window))
		                                    : quarters_.begin();

		std::vector<std::vector<double>> selected;
		selected.reserve(kQuartersPerYear);
		for (; it != quarters_.end() && selected.size() < kQuartersPerYear; ++it) {
			const auto &values = it->second.metricValues();
			selected.emplace_back(values.begin(), values.end());
		}

		return aggregateQuarters(Quarter::metrics(), Quarter::aggregatedMetrics(), selected);
	}

	/// Values of lastYearAsHash() in canonical metric order.
	std::vector<double> lastYearData(std::size_t offset = 1) const {
		return lastYearAsHash(offset).values();
	}

	/// Ascending (quarter start, bucket) pairs.
	std::vector<std::pair<TimePoint, const Quarter *>> preview() const {
		std::vector<std::pair<TimePoint, const Quarter *>> result;
		result.reserve(quarters_.size());
		for (const auto &entry : quarters_) {
			result.emplace_back(fromEpochSeconds(entry.first), &entry.second);
		}
		return result;
	}

	/**
	 * @brief Calls `fn(key, bucket)` for every quarter in ascending order.
	 * @return The results of `fn` in call order, or nothing when `fn` returns void.
	 */
	template <typename Fn>
	auto eachSorted(Fn &&fn) {
		return visit(quarters_.begin(), quarters_.end(), fn);
	}

	template <typename Fn>
	auto eachSorted(Fn &&fn) const {
		return visit(quarters_.cbegin(), quarters_.cend(), fn);
	}

	/// Same as eachSorted() in descending order.
	template <typename Fn>
	auto reverseEachSorted(Fn &&fn) {
		return visit(quarters_.rbegin(), quarters_.rend(), fn);
	}

	template <typename Fn>
	auto reverseEachSorted(Fn &&fn) const {
		return visit(quarters_.crbegin(), quarters_.crend(), fn);
	}

	/**
	 * @brief Calls `fn(start, finish)` for every window a fetcher should query.
	 *
	 * With stored quarters the windows run from each quarter start to the next
	 * one, the last ending at the end of the current quarter. An empty store
	 * yields the quarters of the trailing year instead.
	 *
	 * The key list is taken up front, so `fn` may create buckets.
	 */
	template <typename Fn>
	void withQuartersIntervals(Fn &&fn) const {
		const TimePoint now = options_.clock();

		if (quarters_.empty()) {
			for (const auto &[start, finish] : core::buildQuartersIntervals(now)) {
				fn(start, finish);
			}
			return;
		}

		auto bounds = keys();
		bounds.push_back(endOfQuarter(toEpochSeconds(now)));
		for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
			fn(bounds[i], bounds[i + 1]);
		}
	}

	/// Document keyed by decimal quarter start, one snapshot object per bucket.
	Json::Value toJson() const {
		Json::Value document(Json::objectValue);
		for (const auto &[key, quarter] : quarters_) {
			document[quarterKeyToString(key)] = metricValuesToJson(quarter.toMapping());
		}
		return document;
	}

	std::string toJsonString() const {
		return writeJson(toJson());
	}

	/**
	 * @brief Rebuilds a store from a toJson() document.
	 *
	 * Keys are normalized through dateToStart(). Unknown metric names are
	 * ignored and absent ones stay at their default.
	 *
	 * @throws MalformedDocumentError On a non-object document, a non-numeric
	 * key or a non-numeric metric value.
	 */
	static QuarterStore fromJson(const Json::Value &document, QuarterStoreOptions options = QuarterStoreOptions{}) {
		if (!document.isObject()) {
			throw MalformedDocumentError("Quarter store document must be a JSON object.");
		}

		QuarterStore store(std::move(options));
		for (const auto &name : document.getMemberNames()) {
			const EpochSeconds key = quarterKeyFromString(name);
			store.findOrCreate(key).assign(metricValuesFromJson(document[name]));
		}
		return store;
	}

	static QuarterStore fromJsonString(const std::string &text, QuarterStoreOptions options = QuarterStoreOptions{}) {
		return fromJson(parseJson(text), std::move(options));
	}

private:
	template <typename Iterator, typename Fn>
	static auto visit(Iterator first, Iterator last, Fn &fn) {
		using Result = decltype(fn(first->first, first->second));
		if constexpr (std::is_void<Result>::value) {
			for (; first != last; ++first) {
				fn(first->first, first->second);
			}
		} else {
			std::vector<std::decay_t<Result>> results;
			for (; first != last; ++first) {
				results.push_back(fn(first->first, first->second));
			}
			return results;
		}
	}

	QuarterStoreOptions options_;
	QuarterMap quarters_;
	TimePoint start_date_;
	TimePoint end_date_;
};

} // namespace ossmetrics::core
