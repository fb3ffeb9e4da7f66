#pragma once

#include <chrono>
#include <functional>

namespace ossmetrics::utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Source of "now" for components that need the current time.
 *
 * Injected rather than read from the system so that interval discovery and
 * default ranges stay reproducible under test.
 */
using Clock = std::function<TimePoint()>;

inline Clock systemClock() {
	return [] { return std::chrono::system_clock::now(); };
}

inline Clock fixedClock(TimePoint now) {
	return [now] { return now; };
}

} // namespace ossmetrics::utils
