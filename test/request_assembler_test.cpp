#include "translate/request_assembler.hpp"
#include "test_fixtures.hpp"

#include <gmock/gmock.h>

namespace ocagent {
namespace {

namespace agentcommonpb = opencensus::proto::agent::common::v1;
namespace agentmetricspb = opencensus::proto::agent::metrics::v1;
namespace agenttracepb = opencensus::proto::agent::trace::v1;
namespace resourcepb = opencensus::proto::resource::v1;
using test::StartTime;
using test::ToNanos;

resourcepb::Resource K8sResource() {
	resourcepb::Resource resource;
	resource.set_type("k8s");
	(*resource.mutable_labels())["pod"] = "web-0";
	return resource;
}

agentcommonpb::Node ExampleNode() {
	agentcommonpb::Node node;
	node.mutable_identifier()->set_host_name("build-host");
	node.mutable_identifier()->set_pid(4242);
	node.mutable_service_info()->set_name("example");
	return node;
}

TEST(RequestAssembler, AttachesResourceToTraceRequest) {
	agenttracepb::ExportTraceServiceRequest request;
	request.add_spans()->mutable_name()->set_value("kept");
	WithResource(request, K8sResource());
	EXPECT_EQ(request.resource().type(), "k8s");
	EXPECT_EQ(request.resource().labels().at("pod"), "web-0");
	EXPECT_EQ(request.spans_size(), 1);
}

TEST(RequestAssembler, LastResourceWins) {
	agentmetricspb::ExportMetricsServiceRequest request;
	WithResource(request, K8sResource());
	resourcepb::Resource other;
	other.set_type("host");
	WithResource(request, other);
	EXPECT_EQ(request.resource().type(), "host");
	EXPECT_TRUE(request.resource().labels().empty());
}

TEST(RequestAssembler, AbsentResourceIsNoOp) {
	agenttracepb::ExportTraceServiceRequest request;
	WithResource(request, std::optional<Resource>());
	EXPECT_FALSE(request.has_resource());

	WithResource(request, K8sResource());
	WithResource(request, std::optional<Resource>());
	EXPECT_EQ(request.resource().type(), "k8s");
}

TEST(RequestAssembler, DetectedResourceIsConverted) {
	agentmetricspb::ExportMetricsServiceRequest request;
	WithResource(request, std::optional<Resource>(Resource {"container", {{"image", "app:1"}}}));
	EXPECT_EQ(request.resource().type(), "container");
	EXPECT_EQ(request.resource().labels().at("image"), "app:1");
}

TEST(RequestAssembler, NodeGetsStartTimestamp) {
	agenttracepb::ExportTraceServiceRequest request;
	WithNode(request, ExampleNode(), StartTime());
	EXPECT_EQ(request.node().identifier().host_name(), "build-host");
	EXPECT_EQ(request.node().identifier().pid(), 4242u);
	EXPECT_EQ(request.node().service_info().name(), "example");
	EXPECT_EQ(ToNanos(request.node().identifier().start_timestamp()), ToNanos(StartTime()));
}

TEST(RequestAssembler, NodeOnMetricsRequestReplacesEarlierNode) {
	agentmetricspb::ExportMetricsServiceRequest request;
	WithNode(request, ExampleNode(), StartTime());
	agentcommonpb::Node other;
	other.mutable_service_info()->set_name("other");
	WithNode(request, other, StartTime() + std::chrono::seconds(1));
	EXPECT_EQ(request.node().service_info().name(), "other");
	EXPECT_TRUE(request.node().identifier().host_name().empty());
	EXPECT_EQ(ToNanos(request.node().identifier().start_timestamp()), ToNanos(StartTime()) + 1000000000);
}

} // namespace
} // namespace ocagent
