#pragma once

#include "oss-metrics/core/quarter_store.hpp"
#include "oss-metrics/stats/agility_stats.hpp"
#include "oss-metrics/stats/community_stats.hpp"

#include <utility>

namespace ossmetrics::stats {

/**
 * @brief One activity area of a project: its quarterly series plus all-time
 * totals of the same metrics.
 */
template <typename Quarter>
struct Section {
	explicit Section(core::QuarterStoreOptions options = core::QuarterStoreOptions{})
	    : quarters(std::move(options)) {
	}

	core::QuarterStore<Quarter> quarters;
	Quarter total;

	/**
	 * @brief Fills quarter gaps and returns the covered period.
	 * @return Start of the first and of the last stored quarter.
	 */
	std::pair<core::TimePoint, core::TimePoint> prepareTimeBounds() {
		quarters.fullfill();
		return {quarters.startDate(), quarters.endDate()};
	}
};

using CommunitySection = Section<CommunityQuarterStats>;
using AgilitySection = Section<AgilityQuarterStats>;

} // namespace ossmetrics::stats
