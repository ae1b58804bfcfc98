#include "translate/request_assembler.hpp"
#include "resource/resource_detector.hpp"

namespace ocagent {

namespace agentcommonpb = opencensus::proto::agent::common::v1;
namespace agentmetricspb = opencensus::proto::agent::metrics::v1;
namespace agenttracepb = opencensus::proto::agent::trace::v1;
namespace resourcepb = opencensus::proto::resource::v1;

namespace {

template <class REQUEST>
void SetResource(REQUEST &request, const resourcepb::Resource &resource) {
	*request.mutable_resource() = resource;
}

template <class REQUEST>
void SetOptionalResource(REQUEST &request, const std::optional<Resource> &resource) {
	if (!resource) {
		return;
	}
	*request.mutable_resource() = ResourceToProto(*resource);
}

template <class REQUEST>
void SetNode(REQUEST &request, const agentcommonpb::Node &node, TimePoint start_time) {
	auto &out = *request.mutable_node();
	out = node;
	*out.mutable_identifier()->mutable_start_timestamp() = ToProtoTimestamp(start_time);
}

} // namespace

void WithResource(agenttracepb::ExportTraceServiceRequest &request, const resourcepb::Resource &resource) {
	SetResource(request, resource);
}

void WithResource(agentmetricspb::ExportMetricsServiceRequest &request, const resourcepb::Resource &resource) {
	SetResource(request, resource);
}

void WithResource(agenttracepb::ExportTraceServiceRequest &request, const std::optional<Resource> &resource) {
	SetOptionalResource(request, resource);
}

void WithResource(agentmetricspb::ExportMetricsServiceRequest &request, const std::optional<Resource> &resource) {
	SetOptionalResource(request, resource);
}

void WithNode(agenttracepb::ExportTraceServiceRequest &request, const agentcommonpb::Node &node,
              TimePoint start_time) {
	SetNode(request, node, start_time);
}

void WithNode(agentmetricspb::ExportMetricsServiceRequest &request, const agentcommonpb::Node &node,
              TimePoint start_time) {
	SetNode(request, node, start_time);
}

} // namespace ocagent
