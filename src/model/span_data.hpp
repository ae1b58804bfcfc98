#pragma once

#include "common/ocagent_utils.hpp"
#include "model/attribute_value.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ocagent {

using TraceID = std::array<uint8_t, 16>;
using SpanID = std::array<uint8_t, 8>;

enum class SpanKind : int32_t { UNSPECIFIED = 0, SERVER = 1, CLIENT = 2 };

enum class MessageEventType : int32_t { UNSPECIFIED = 0, SENT = 1, RECEIVED = 2 };

enum class LinkType : int32_t { UNSPECIFIED = 0, CHILD = 1, PARENT = 2 };

struct Status {
	int32_t code = 0;
	std::string message;
};

struct TracestateEntry {
	std::string key;
	std::string value;
};

struct Annotation {
	TimePoint time;
	std::string message;
	Attributes attributes;
};

struct MessageEvent {
	TimePoint time;
	MessageEventType type = MessageEventType::UNSPECIFIED;
	int64_t message_id = 0;
	int64_t uncompressed_byte_size = 0;
	int64_t compressed_byte_size = 0;
};

struct Link {
	TraceID trace_id {};
	SpanID span_id {};
	LinkType type = LinkType::UNSPECIFIED;
	Attributes attributes;
};

//! One finished span as handed over by the instrumentation library
struct SpanData {
	TraceID trace_id {};
	SpanID span_id {};
	//! All-zero means the span is a root span
	SpanID parent_span_id {};
	std::vector<TracestateEntry> tracestate;

	SpanKind kind = SpanKind::UNSPECIFIED;
	std::string name;
	TimePoint start_time;
	TimePoint end_time;

	Attributes attributes;
	std::vector<Annotation> annotations;
	std::vector<MessageEvent> message_events;
	std::vector<Link> links;

	Status status;
	bool has_remote_parent = false;

	// Counts already discarded by the instrumentation library before export
	int32_t dropped_attribute_count = 0;
	int32_t dropped_annotation_count = 0;
	int32_t dropped_message_event_count = 0;
	int32_t dropped_link_count = 0;
	int32_t child_span_count = 0;
};

} // namespace ocagent
