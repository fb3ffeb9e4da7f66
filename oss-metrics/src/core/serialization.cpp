#include "oss-metrics/core/serialization.hpp"
#include "oss-metrics/core/errors.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

namespace ossmetrics::core {

Json::Value metricValuesToJson(const MetricValues &values) {
	Json::Value object(Json::objectValue);
	for (const auto &[name, value] : values) {
		object[name] = value;
	}
	return object;
}

MetricValues metricValuesFromJson(const Json::Value &value) {
	if (!value.isObject()) {
		throw MalformedDocumentError("Quarter entry must be a JSON object.");
	}

	MetricValues values;
	for (const auto &name : value.getMemberNames()) {
		const Json::Value &member = value[name];
		if (!member.isNumeric()) {
			throw MalformedDocumentError("Metric '" + name + "' must be numeric.");
		}
		values.set(name, member.asDouble());
	}
	return values;
}

std::string quarterKeyToString(EpochSeconds key) {
	return std::to_string(key);
}

EpochSeconds quarterKeyFromString(const std::string &text) {
	const std::size_t digits_start = (!text.empty() && text.front() == '-') ? 1 : 0;
	if (text.size() == digits_start) {
		throw MalformedDocumentError("Quarter key must not be empty.");
	}
	for (std::size_t i = digits_start; i < text.size(); ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw MalformedDocumentError("Quarter key '" + text + "' is not an integer timestamp.");
		}
	}
	try {
		return static_cast<EpochSeconds>(std::stoll(text));
	} catch (const std::out_of_range &) {
		throw MalformedDocumentError("Quarter key '" + text + "' is out of range.");
	}
}

std::string writeJson(const Json::Value &value) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string &text) {
	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value root;
	std::string errors;
	if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
		throw MalformedDocumentError("Invalid JSON document: " + errors);
	}
	return root;
}

} // namespace ossmetrics::core
