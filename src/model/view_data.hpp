#pragma once

#include "common/ocagent_utils.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ocagent {

enum class AggregationType : uint8_t { COUNT = 0, SUM = 1, LAST_VALUE = 2, DISTRIBUTION = 3 };

enum class MeasureType : uint8_t { FLOAT64 = 0, INT64 = 1 };

struct Measure {
	std::string name;
	std::string description;
	std::string unit;
	MeasureType type = MeasureType::FLOAT64;
};

//! Aggregation kind plus, for distributions, the bucket bounds shared by every row
struct Aggregation {
	AggregationType type = AggregationType::COUNT;
	std::vector<double> buckets;

	static Aggregation Count();
	static Aggregation Sum();
	static Aggregation LastValue();
	static Aggregation Distribution(std::vector<double> bounds);
};

struct View {
	std::string name;
	std::string description;
	Measure measure;
	Aggregation aggregation;
	std::vector<std::string> tag_keys;
};

struct Tag {
	std::string key;
	std::string value;
};

struct CountData {
	int64_t value = 0;
};

struct SumData {
	double value = 0;
};

struct LastValueData {
	double value = 0;
};

//! Running statistics of a distribution aggregation
struct DistributionData {
	int64_t count = 0;
	double min = 0;
	double max = 0;
	double mean = 0;
	double sum_of_squared_dev = 0;
	std::vector<int64_t> count_per_bucket;
};

using AggregationData = std::variant<CountData, SumData, LastValueData, DistributionData>;

struct Row {
	std::vector<Tag> tags;
	AggregationData data;
};

//! Aggregated rows of one view over the window [start, end)
struct ViewData {
	View view;
	TimePoint start;
	TimePoint end;
	std::vector<Row> rows;
};

//! Convert aggregation type enum to string
std::string AggregationTypeToString(AggregationType type);

//! Aggregation type a row's data belongs to
AggregationType AggregationTypeOf(const AggregationData &data);

} // namespace ocagent
