#include <catch2/catch_test_macros.hpp>

#include "oss-metrics/core/quarter_store.hpp"
#include "common/quarter_helpers.hpp"

#include <json/json.h>

#include <string>
#include <vector>

using namespace ossmetrics::core;
using tests::helpers::CountRateStats;
using tests::helpers::utc;

namespace {

QuarterStore<CountRateStats> sampleStore() {
	QuarterStore<CountRateStats> store;
	auto &first = store.findOrCreate(std::string("2013-08-01"));
	first.set("count", 12.0);
	first.set("rate", 0.75);
	auto &second = store.findOrCreate(std::string("2014-02-01"));
	second.set("count", 3.0);
	second.set("rate", 41.25);
	return store;
}

} // namespace

TEST_CASE("toJson keys buckets by quarter start", "[core][quarter_store][serialization]") {
	const auto store = sampleStore();
	const Json::Value document = store.toJson();

	REQUIRE(document.isObject());
	REQUIRE(document.size() == 2);

	const std::string q3_2013 = std::to_string(utc(2013, 7, 1));
	const std::string q1_2014 = std::to_string(utc(2014, 1, 1));
	REQUIRE(q3_2013 == "1372636800");
	REQUIRE(document.isMember(q3_2013));
	REQUIRE(document.isMember(q1_2014));

	REQUIRE(document[q3_2013]["count"].asDouble() == 12.0);
	REQUIRE(document[q3_2013]["rate"].asDouble() == 0.75);
	REQUIRE(document[q1_2014]["rate"].asDouble() == 41.25);
}

TEST_CASE("Serialized stores round trip", "[core][quarter_store][serialization]") {
	const auto store = sampleStore();
	const std::string text = store.toJsonString();

	REQUIRE(text.find('\n') == std::string::npos);

	const auto restored = QuarterStore<CountRateStats>::fromJsonString(text);
	REQUIRE(restored.keys() == store.keys());
	for (const auto key : store.keys()) {
		REQUIRE(restored.fetch(key).toMapping() == store.fetch(key).toMapping());
	}
	REQUIRE(restored.toJsonString() == text);
}

TEST_CASE("fromJson tolerates partial snapshots", "[core][quarter_store][serialization]") {
	Json::Value document(Json::objectValue);
	// Key inside a quarter is normalized to the quarter start.
	document[std::to_string(utc(2015, 8, 15, 10))]["count"] = 7;
	document[std::to_string(utc(2015, 8, 15, 10))]["legacy_metric"] = 99.5;

	const auto store = QuarterStore<CountRateStats>::fromJson(document);

	REQUIRE(store.keys() == std::vector<EpochSeconds>{utc(2015, 7, 1)});
	REQUIRE(store.fetch(utc(2015, 7, 1)).get("count") == 7.0);
	REQUIRE(store.fetch(utc(2015, 7, 1)).get("rate") == 0.0);
}

TEST_CASE("fromJson rejects malformed documents", "[core][quarter_store][serialization][error]") {
	using Store = QuarterStore<CountRateStats>;

	REQUIRE_THROWS_AS(Store::fromJsonString("{not json"), MalformedDocumentError);
	REQUIRE_THROWS_AS(Store::fromJsonString("[1, 2, 3]"), MalformedDocumentError);
	REQUIRE_THROWS_AS(Store::fromJsonString(R"({"2015Q3": {"count": 1}})"), MalformedDocumentError);
	REQUIRE_THROWS_AS(Store::fromJsonString(R"({"1435708800": [1, 2]})"), MalformedDocumentError);
	REQUIRE_THROWS_AS(Store::fromJsonString(R"({"1435708800": {"count": "many"}})"), MalformedDocumentError);

	REQUIRE(Store::fromJsonString("{}").empty());
}
