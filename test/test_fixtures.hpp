#pragma once

#include "model/span_data.hpp"
#include "model/view_data.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <chrono>
#include <cstdint>
#include <vector>

namespace ocagent {
namespace test {

//! 2019-04-01T12:00:00.123456789Z
inline TimePoint StartTime() {
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::nanoseconds(1554120000123456789LL)));
}

inline TimePoint EndTime() {
	return StartTime() + std::chrono::seconds(17);
}

inline int64_t ToNanos(const google::protobuf::Timestamp &ts) {
	return google::protobuf::util::TimeUtil::TimestampToNanoseconds(ts);
}

inline int64_t ToNanos(TimePoint time) {
	return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

//! A server span with a remote parent, one annotation, two message events and one link
inline SpanData ExampleSpan() {
	SpanData span;
	span.trace_id = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F};
	span.span_id = {0xFF, 0xFE, 0xFD, 0xFC, 0xFB, 0xFA, 0xF9, 0xF8};
	span.parent_span_id = {0xEF, 0xEE, 0xED, 0xEC, 0xEB, 0xEA, 0xE9, 0xE8};
	span.tracestate = {{"foo", "bar"}, {"a", "b"}};
	span.kind = SpanKind::SERVER;
	span.name = "End-To-End Here";
	span.start_time = StartTime();
	span.end_time = EndTime();

	Annotation annotation;
	annotation.time = StartTime();
	annotation.message = "start";
	annotation.attributes = {{"timeout_ns", int64_t {12000000000}},
	                         {"agent", std::string("ocagent")},
	                         {"cache_hit", true}};
	span.annotations.push_back(annotation);

	MessageEvent sent;
	sent.time = StartTime();
	sent.type = MessageEventType::SENT;
	sent.uncompressed_byte_size = 1024;
	sent.compressed_byte_size = 512;
	MessageEvent received;
	received.time = EndTime();
	received.type = MessageEventType::RECEIVED;
	received.uncompressed_byte_size = 1024;
	received.compressed_byte_size = 1000;
	span.message_events = {sent, received};

	Link link;
	link.trace_id = {0xE0, 0xE1, 0xE2, 0xE3, 0xE4, 0xE5, 0xE6, 0xE7, 0xE8, 0xE9, 0xEA, 0xEB, 0xEC, 0xED, 0xEE, 0xEF};
	link.span_id = {0xD0, 0xD1, 0xD2, 0xD3, 0xD4, 0xD5, 0xD6, 0xD7};
	link.type = LinkType::CHILD;
	span.links.push_back(link);

	span.status.code = 13;
	span.status.message = "This is not a drill!";
	span.has_remote_parent = true;
	span.attributes = {{"timeout_ns", int64_t {12000000000}},
	                   {"agent", std::string("ocagent")},
	                   {"cache_hit", true},
	                   {"ping_count", int32_t {25}}};
	return span;
}

inline Row DistributionRow(std::vector<Tag> tags, double value, std::vector<int64_t> counts) {
	DistributionData data;
	data.count = 1;
	data.min = value;
	data.max = value;
	data.mean = value;
	data.count_per_bucket = std::move(counts);
	return Row {std::move(tags), data};
}

//! Sprint latency distribution over the tag keys [field, name]
inline ViewData LatencyViewData() {
	ViewData view_data;
	view_data.start = StartTime();
	view_data.end = EndTime();
	view_data.view.name = "ocagent.io/latency";
	view_data.view.description = "latency of runners for a 100m dash";
	view_data.view.measure = Measure {"sprint_latency", "The time in which a sprinter completes the course", "ms",
	                                  MeasureType::FLOAT64};
	view_data.view.aggregation = Aggregation::Distribution({0, 10, 20, 30, 40});
	view_data.view.tag_keys = {"field", "name"};
	view_data.rows.push_back(
	    DistributionRow({{"field", "main-field"}, {"name", "sprinter-#10"}}, 11.9, {0, 1, 0, 0, 0, 0}));
	view_data.rows.push_back(DistributionRow({{"field", "small-field"}, {"name", ""}}, 20.2, {0, 0, 1, 0, 0, 0}));
	view_data.rows.push_back(
	    DistributionRow({{"field", "small-field"}, {"name", "sprinter-#yp"}}, 28.9, {0, 0, 1, 0, 0, 0}));
	return view_data;
}

} // namespace test
} // namespace ocagent
