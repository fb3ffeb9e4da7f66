#pragma once

#include "oss-metrics/core/metrics_container.hpp"
#include "oss-metrics/core/quarter_calendar.hpp"

#include <json/json.h>

#include <string>

namespace ossmetrics::core {

/// JSON object `{name: value, ...}` in mapping order.
Json::Value metricValuesToJson(const MetricValues &values);

/**
 * @brief Reads a `{name: number, ...}` object.
 * @throws MalformedDocumentError If `value` is not an object of numbers.
 */
MetricValues metricValuesFromJson(const Json::Value &value);

/// Decimal text form of a quarter key, as used for document keys.
std::string quarterKeyToString(EpochSeconds key);

/**
 * @brief Parses a document key back to epoch seconds.
 * @throws MalformedDocumentError If the text is not a decimal integer.
 */
EpochSeconds quarterKeyFromString(const std::string &text);

/// Compact single-line rendering.
std::string writeJson(const Json::Value &value);

/**
 * @brief Parses JSON text.
 * @throws MalformedDocumentError With the parser's message on failure.
 */
Json::Value parseJson(const std::string &text);

} // namespace ossmetrics::core
