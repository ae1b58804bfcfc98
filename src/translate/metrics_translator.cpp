#include "translate/metrics_translator.hpp"
#include "translate/distribution_encoder.hpp"
#include "common/exception.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace ocagent {

namespace agentmetricspb = opencensus::proto::agent::metrics::v1;
namespace metricspb = opencensus::proto::metrics::v1;

namespace {

//! Helper: Find the value recorded for key among the row tags
const Tag *FindTag(const std::vector<Tag> &tags, const std::string &key) {
	for (const auto &tag : tags) {
		if (tag.key == key) {
			return &tag;
		}
	}
	return nullptr;
}

//! Helper: Int64 point value of a double aggregate over an int64 measure
int64_t ToInt64Point(double value) {
	return static_cast<int64_t>(std::llround(value));
}

struct PointValueVisitor {
	const View &view;
	metricspb::Point &point;

	void operator()(const CountData &data) {
		point.set_int64_value(data.value);
	}
	void operator()(const SumData &data) {
		if (view.measure.type == MeasureType::INT64) {
			point.set_int64_value(ToInt64Point(data.value));
		} else {
			point.set_double_value(data.value);
		}
	}
	void operator()(const LastValueData &data) {
		if (view.measure.type == MeasureType::INT64) {
			point.set_int64_value(ToInt64Point(data.value));
		} else {
			point.set_double_value(data.value);
		}
	}
	void operator()(const DistributionData &data) {
		*point.mutable_distribution_value() = EncodeDistribution(data, view.aggregation.buckets);
	}
};

} // namespace

agentmetricspb::ExportMetricsServiceRequest MetricsTranslator::TranslateViews(const std::vector<ViewData> &views) const {
	agentmetricspb::ExportMetricsServiceRequest request;
	request.mutable_metrics()->Reserve(static_cast<int>(views.size()));
	for (const auto &view_data : views) {
		TranslateView(view_data, *request.add_metrics());
	}
	spdlog::debug("Translated {} views", views.size());
	return request;
}

void MetricsTranslator::TranslateView(const ViewData &view_data, metricspb::Metric &proto) const {
	const auto &view = view_data.view;

	auto &descriptor = *proto.mutable_metric_descriptor();
	descriptor.set_name(view.name);
	descriptor.set_description(view.description);
	descriptor.set_unit(view.measure.unit);
	descriptor.set_type(DescriptorTypeFromView(view));
	for (const auto &key : view.tag_keys) {
		descriptor.add_label_keys()->set_key(key);
	}

	for (const auto &row : view_data.rows) {
		TranslateRow(view_data, row, *proto.add_timeseries());
	}
}

void MetricsTranslator::TranslateRow(const ViewData &view_data, const Row &row, metricspb::TimeSeries &proto) const {
	const auto &view = view_data.view;
	*proto.mutable_start_timestamp() = ToProtoTimestamp(view_data.start);

	for (const auto &key : view.tag_keys) {
		auto &label_value = *proto.add_label_values();
		auto tag = FindTag(row.tags, key);
		if (tag) {
			label_value.set_value(tag->value);
			label_value.set_has_value(true);
		} else {
			label_value.set_has_value(false);
		}
	}

	auto &point = *proto.add_points();
	*point.mutable_timestamp() = ToProtoTimestamp(view_data.end);
	SetPointValue(view, row.data, point);
}

void MetricsTranslator::SetPointValue(const View &view, const AggregationData &data, metricspb::Point &point) const {
	auto row_type = AggregationTypeOf(data);
	if (row_type != view.aggregation.type) {
		throw InternalException("View '" + view.name + "' has " + AggregationTypeToString(view.aggregation.type) +
		                        " aggregation but a row carries " + AggregationTypeToString(row_type) + " data");
	}
	std::visit(PointValueVisitor {view, point}, data);
}

metricspb::MetricDescriptor::Type MetricsTranslator::DescriptorTypeFromView(const View &view) {
	bool int64_measure = view.measure.type == MeasureType::INT64;
	switch (view.aggregation.type) {
	case AggregationType::COUNT:
		return metricspb::MetricDescriptor::CUMULATIVE_INT64;
	case AggregationType::SUM:
		return int64_measure ? metricspb::MetricDescriptor::CUMULATIVE_INT64
		                     : metricspb::MetricDescriptor::CUMULATIVE_DOUBLE;
	case AggregationType::LAST_VALUE:
		return int64_measure ? metricspb::MetricDescriptor::GAUGE_INT64 : metricspb::MetricDescriptor::GAUGE_DOUBLE;
	case AggregationType::DISTRIBUTION:
		return metricspb::MetricDescriptor::CUMULATIVE_DISTRIBUTION;
	default:
		throw InternalException("Invalid aggregation type");
	}
}

} // namespace ocagent
