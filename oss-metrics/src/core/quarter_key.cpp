#include "oss-metrics/core/quarter_key.hpp"
#include "oss-metrics/core/errors.hpp"

#include <cctype>
#include <vector>

namespace ossmetrics::core {

namespace {

constexpr std::size_t kMaxComponentDigits = 9;

[[noreturn]] void malformed(const std::string &text, const char *reason) {
	throw MalformedDateError("Malformed date '" + text + "': " + reason);
}

std::vector<long> splitComponents(const std::string &text) {
	std::vector<long> components;
	std::size_t position = 0;

	while (true) {
		const std::size_t dash = text.find('-', position);
		const std::size_t end = dash == std::string::npos ? text.size() : dash;

		if (end == position) {
			malformed(text, "empty component");
		}
		if (end - position > kMaxComponentDigits) {
			malformed(text, "component too long");
		}

		long value = 0;
		for (std::size_t i = position; i < end; ++i) {
			const unsigned char ch = static_cast<unsigned char>(text[i]);
			if (!std::isdigit(ch)) {
				malformed(text, "expected digits");
			}
			value = value * 10 + (ch - '0');
		}
		components.push_back(value);

		if (dash == std::string::npos) {
			break;
		}
		position = dash + 1;
	}

	if (components.size() > 3) {
		malformed(text, "expected at most year, month and day");
	}
	return components;
}

} // namespace

CivilDate parseCalendarDate(const std::string &text) {
	const auto components = splitComponents(text);

	CivilDate date;
	date.year = static_cast<int>(components[0]);
	date.month = components.size() > 1 ? static_cast<unsigned>(components[1]) : 1U;
	date.day = components.size() > 2 ? static_cast<unsigned>(components[2]) : 1U;

	if (!isValidCivilDate(date.year, date.month, date.day)) {
		malformed(text, "no such calendar day");
	}
	return date;
}

EpochSeconds dateToStart(const DateInput &date) {
	if (const auto *text = std::get_if<std::string>(&date)) {
		return beginningOfQuarter(parseCalendarDate(*text));
	}
	if (const auto *seconds = std::get_if<EpochSeconds>(&date)) {
		return beginningOfQuarter(beginningOfDay(*seconds));
	}
	return beginningOfQuarter(beginningOfDay(toEpochSeconds(std::get<TimePoint>(date))));
}

} // namespace ossmetrics::core
