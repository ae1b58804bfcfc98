#include "resource/node_builder.hpp"
#include "resource/resource_detector.hpp"
#include "translate/metrics_translator.hpp"
#include "translate/request_assembler.hpp"
#include "translate/trace_translator.hpp"
#include "test_fixtures.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>
#include <gmock/gmock.h>

namespace ocagent {
namespace {

using google::protobuf::util::MessageDifferencer;
using test::ExampleSpan;
using test::LatencyViewData;
using test::StartTime;
using ::testing::HasSubstr;

template <class MESSAGE>
MESSAGE BinaryRoundTrip(const MESSAGE &message) {
	std::string wire;
	EXPECT_TRUE(message.SerializeToString(&wire));
	MESSAGE parsed;
	EXPECT_TRUE(parsed.ParseFromString(wire));
	return parsed;
}

template <class MESSAGE>
MESSAGE JsonRoundTrip(const MESSAGE &message, std::string *json_out = nullptr) {
	std::string json;
	auto status = google::protobuf::util::MessageToJsonString(message, &json);
	EXPECT_TRUE(status.ok()) << status.ToString();
	MESSAGE parsed;
	status = google::protobuf::util::JsonStringToMessage(json, &parsed);
	EXPECT_TRUE(status.ok()) << status.ToString();
	if (json_out) {
		*json_out = json;
	}
	return parsed;
}

opencensus::proto::agent::trace::v1::ExportTraceServiceRequest ExampleTraceRequest() {
	auto request = TraceTranslator().TranslateSpans({ExampleSpan()});
	WithNode(request, NodeWithStartTime("example", StartTime(), ProcessIdentity {"build-host", 4242}, ""), StartTime());
	WithResource(request, std::optional<Resource>(Resource {"host", {{"rack", "r7"}}}));
	return request;
}

opencensus::proto::agent::metrics::v1::ExportMetricsServiceRequest ExampleMetricsRequest() {
	auto request = MetricsTranslator().TranslateViews({LatencyViewData()});
	WithNode(request, NodeWithStartTime("example", StartTime(), ProcessIdentity {"build-host", 4242}, ""), StartTime());
	return request;
}

TEST(WireRoundTrip, TraceRequestSurvivesBinaryEncoding) {
	auto request = ExampleTraceRequest();
	EXPECT_TRUE(MessageDifferencer::Equals(request, BinaryRoundTrip(request)));
}

TEST(WireRoundTrip, TraceRequestSurvivesJsonEncoding) {
	auto request = ExampleTraceRequest();
	std::string json;
	auto parsed = JsonRoundTrip(request, &json);
	EXPECT_TRUE(MessageDifferencer::Equals(request, parsed)) << json;
	EXPECT_THAT(json, HasSubstr("\"End-To-End Here\""));
	EXPECT_THAT(json, HasSubstr("\"CHILD_LINKED_SPAN\""));
}

TEST(WireRoundTrip, MetricsRequestSurvivesBinaryEncoding) {
	auto request = ExampleMetricsRequest();
	EXPECT_TRUE(MessageDifferencer::Equals(request, BinaryRoundTrip(request)));
}

TEST(WireRoundTrip, MetricsRequestSurvivesJsonEncoding) {
	auto request = ExampleMetricsRequest();
	std::string json;
	auto parsed = JsonRoundTrip(request, &json);
	EXPECT_TRUE(MessageDifferencer::Equals(request, parsed)) << json;
	EXPECT_THAT(json, HasSubstr("\"CUMULATIVE_DISTRIBUTION\""));
	EXPECT_THAT(json, HasSubstr("\"explicit\""));
}

} // namespace
} // namespace ocagent
