#pragma once

#include <stdexcept>
#include <string>

namespace ossmetrics::core {

// Strict lookup of a quarter that has no bucket.
class NotFoundError : public std::out_of_range {
public:
	using std::out_of_range::out_of_range;
};

// Calendar string that is not a valid YYYY[-MM[-DD]] date.
class MalformedDateError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

// Trailing-year aggregation requested over fewer quarters than it needs.
class DegenerateAggregationError : public std::domain_error {
public:
	using std::domain_error::domain_error;
};

// Serialized store that cannot be turned back into buckets.
class MalformedDocumentError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

} // namespace ossmetrics::core
