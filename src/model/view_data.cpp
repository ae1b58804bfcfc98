#include "model/view_data.hpp"
#include "common/exception.hpp"

#include <utility>

namespace ocagent {

Aggregation Aggregation::Count() {
	return Aggregation {AggregationType::COUNT, {}};
}

Aggregation Aggregation::Sum() {
	return Aggregation {AggregationType::SUM, {}};
}

Aggregation Aggregation::LastValue() {
	return Aggregation {AggregationType::LAST_VALUE, {}};
}

Aggregation Aggregation::Distribution(std::vector<double> bounds) {
	return Aggregation {AggregationType::DISTRIBUTION, std::move(bounds)};
}

std::string AggregationTypeToString(AggregationType type) {
	switch (type) {
	case AggregationType::COUNT:
		return "count";
	case AggregationType::SUM:
		return "sum";
	case AggregationType::LAST_VALUE:
		return "last_value";
	case AggregationType::DISTRIBUTION:
		return "distribution";
	default:
		throw InternalException("Invalid aggregation type");
	}
}

namespace {

struct AggregationTypeVisitor {
	AggregationType operator()(const CountData &) const {
		return AggregationType::COUNT;
	}
	AggregationType operator()(const SumData &) const {
		return AggregationType::SUM;
	}
	AggregationType operator()(const LastValueData &) const {
		return AggregationType::LAST_VALUE;
	}
	AggregationType operator()(const DistributionData &) const {
		return AggregationType::DISTRIBUTION;
	}
};

} // namespace

AggregationType AggregationTypeOf(const AggregationData &data) {
	return std::visit(AggregationTypeVisitor {}, data);
}

} // namespace ocagent
