#pragma once

#include "model/view_data.hpp"

// Generated protobuf stubs
#include "opencensus/proto/agent/metrics/v1/metrics_service.pb.h"
#include "opencensus/proto/metrics/v1/metrics.pb.h"

#include <vector>

namespace ocagent {

//! MetricsTranslator converts aggregated view data into the agent metrics export request.
//! Every view becomes one metric and every row one time series with a single point.
class MetricsTranslator {
public:
	//! One wire metric per view, in input order. Node and resource are left unset.
	opencensus::proto::agent::metrics::v1::ExportMetricsServiceRequest
	TranslateViews(const std::vector<ViewData> &views) const;

	//! Fill proto from a single view.
	//! Throws InternalException when a row's data does not belong to the view's aggregation.
	void TranslateView(const ViewData &view_data, opencensus::proto::metrics::v1::Metric &proto) const;

	//! Descriptor type for a view: count -> CUMULATIVE_INT64, sum -> CUMULATIVE_DOUBLE,
	//! last value -> GAUGE_DOUBLE, distribution -> CUMULATIVE_DISTRIBUTION.
	//! Sum and last value over an int64 measure use the INT64 variants.
	static opencensus::proto::metrics::v1::MetricDescriptor::Type DescriptorTypeFromView(const View &view);

private:
	void TranslateRow(const ViewData &view_data, const Row &row, opencensus::proto::metrics::v1::TimeSeries &proto) const;
	void SetPointValue(const View &view, const AggregationData &data, opencensus::proto::metrics::v1::Point &point) const;
};

} // namespace ocagent
