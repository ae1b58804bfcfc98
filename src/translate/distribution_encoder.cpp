#include "translate/distribution_encoder.hpp"

#include <spdlog/spdlog.h>

namespace ocagent {

namespace metricspb = opencensus::proto::metrics::v1;

metricspb::DistributionValue EncodeDistribution(const DistributionData &data, const std::vector<double> &bounds) {
	metricspb::DistributionValue proto;
	proto.set_count(data.count);
	proto.set_sum(data.mean * static_cast<double>(data.count));
	proto.set_sum_of_squared_deviation(data.sum_of_squared_dev);

	auto &explicit_bounds = *proto.mutable_bucket_options()->mutable_explicit_();
	for (auto bound : bounds) {
		explicit_bounds.add_bounds(bound);
	}

	int64_t bucket_total = 0;
	for (auto count : data.count_per_bucket) {
		proto.add_buckets()->set_count(count);
		bucket_total += count;
	}

	if (data.count_per_bucket.size() != bounds.size() + 1) {
		spdlog::warn("Distribution has {} buckets for {} bounds, expected {}", data.count_per_bucket.size(),
		             bounds.size(), bounds.size() + 1);
	}
	if (bucket_total != data.count) {
		spdlog::warn("Distribution bucket counts add up to {} but count is {}", bucket_total, data.count);
	}
	return proto;
}

} // namespace ocagent
