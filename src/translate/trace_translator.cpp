#include "translate/trace_translator.hpp"
#include "translate/attribute_normalizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ocagent {

namespace agenttracepb = opencensus::proto::agent::trace::v1;
namespace tracepb = opencensus::proto::trace::v1;

namespace {

//! Helper: Number of records kept under a limit
std::size_t KeptCount(std::size_t size, std::size_t limit) {
	return std::min(size, limit);
}

} // namespace

TraceTranslator::TraceTranslator(TranslatorOptions options) : options_(std::move(options)) {
	spdlog::debug("Trace translator limits: attributes={} annotations={} message_events={} links={}",
	              TranslatorOptions::LimitToString(options_.max_attributes),
	              TranslatorOptions::LimitToString(options_.max_annotations),
	              TranslatorOptions::LimitToString(options_.max_message_events),
	              TranslatorOptions::LimitToString(options_.max_links));
}

agenttracepb::ExportTraceServiceRequest TraceTranslator::TranslateSpans(const std::vector<SpanData> &spans) const {
	agenttracepb::ExportTraceServiceRequest request;
	request.mutable_spans()->Reserve(static_cast<int>(spans.size()));
	for (const auto &span : spans) {
		TranslateSpan(span, *request.add_spans());
	}
	spdlog::debug("Translated {} spans", spans.size());
	return request;
}

void TraceTranslator::TranslateSpan(const SpanData &span, tracepb::Span &proto) const {
	proto.set_trace_id(BytesToString(span.trace_id));
	proto.set_span_id(BytesToString(span.span_id));
	if (!IsAllZero(span.parent_span_id)) {
		proto.set_parent_span_id(BytesToString(span.parent_span_id));
		proto.mutable_same_process_as_parent_span()->set_value(!span.has_remote_parent);
	}

	if (!span.tracestate.empty()) {
		auto &tracestate = *proto.mutable_tracestate();
		for (const auto &entry : span.tracestate) {
			auto &out = *tracestate.add_entries();
			out.set_key(entry.key);
			out.set_value(entry.value);
		}
	}

	SetTruncatableString(*proto.mutable_name(), span.name);
	proto.set_kind(SpanKindToProto(span.kind));
	*proto.mutable_start_time() = ToProtoTimestamp(span.start_time);
	*proto.mutable_end_time() = ToProtoTimestamp(span.end_time);

	if (!span.attributes.empty() || span.dropped_attribute_count > 0) {
		ConvertAttributes(span.attributes, options_.max_attributes, span.dropped_attribute_count,
		                  *proto.mutable_attributes());
	}

	TranslateTimeEvents(span, proto);
	TranslateLinks(span, proto);

	auto &status = *proto.mutable_status();
	status.set_code(span.status.code);
	status.set_message(span.status.message);

	if (span.child_span_count > 0) {
		proto.mutable_child_span_count()->set_value(static_cast<uint32_t>(span.child_span_count));
	}
}

void TraceTranslator::TranslateTimeEvents(const SpanData &span, tracepb::Span &proto) const {
	if (span.annotations.empty() && span.message_events.empty() && span.dropped_annotation_count == 0 &&
	    span.dropped_message_event_count == 0) {
		return;
	}
	auto &time_events = *proto.mutable_time_events();

	auto annotations_kept = KeptCount(span.annotations.size(), options_.max_annotations);
	for (std::size_t i = 0; i < annotations_kept; i++) {
		const auto &annotation = span.annotations[i];
		auto &event = *time_events.add_time_event();
		*event.mutable_time() = ToProtoTimestamp(annotation.time);
		auto &out = *event.mutable_annotation();
		SetTruncatableString(*out.mutable_description(), annotation.message);
		if (!annotation.attributes.empty()) {
			ConvertAttributes(annotation.attributes, options_.max_annotation_attributes, 0, *out.mutable_attributes());
		}
	}

	auto message_events_kept = KeptCount(span.message_events.size(), options_.max_message_events);
	for (std::size_t i = 0; i < message_events_kept; i++) {
		const auto &message_event = span.message_events[i];
		auto &event = *time_events.add_time_event();
		*event.mutable_time() = ToProtoTimestamp(message_event.time);
		auto &out = *event.mutable_message_event();
		out.set_type(MessageEventTypeToProto(message_event.type));
		out.set_id(static_cast<uint64_t>(message_event.message_id));
		out.set_uncompressed_size(static_cast<uint64_t>(message_event.uncompressed_byte_size));
		out.set_compressed_size(static_cast<uint64_t>(message_event.compressed_byte_size));
	}

	auto annotations_dropped = span.annotations.size() - annotations_kept;
	auto message_events_dropped = span.message_events.size() - message_events_kept;
	if (annotations_dropped > 0 || message_events_dropped > 0) {
		spdlog::debug("Span {}: dropped {} annotations and {} message events", BytesToHex(span.span_id),
		              annotations_dropped, message_events_dropped);
	}
	time_events.set_dropped_annotations_count(span.dropped_annotation_count +
	                                          static_cast<int32_t>(annotations_dropped));
	time_events.set_dropped_message_events_count(span.dropped_message_event_count +
	                                             static_cast<int32_t>(message_events_dropped));
}

void TraceTranslator::TranslateLinks(const SpanData &span, tracepb::Span &proto) const {
	if (span.links.empty() && span.dropped_link_count == 0) {
		return;
	}
	auto &links = *proto.mutable_links();

	auto kept = KeptCount(span.links.size(), options_.max_links);
	for (std::size_t i = 0; i < kept; i++) {
		const auto &link = span.links[i];
		auto &out = *links.add_link();
		out.set_trace_id(BytesToString(link.trace_id));
		out.set_span_id(BytesToString(link.span_id));
		out.set_type(LinkTypeToProto(link.type));
		if (!link.attributes.empty()) {
			ConvertAttributes(link.attributes, options_.max_link_attributes, 0, *out.mutable_attributes());
		}
	}

	auto dropped = span.links.size() - kept;
	if (dropped > 0) {
		spdlog::debug("Span {}: dropped {} links", BytesToHex(span.span_id), dropped);
	}
	links.set_dropped_links_count(span.dropped_link_count + static_cast<int32_t>(dropped));
}

//===--------------------------------------------------------------------===//
// Enum mappings
//===--------------------------------------------------------------------===//

tracepb::Span::SpanKind TraceTranslator::SpanKindToProto(SpanKind kind) {
	switch (kind) {
	case SpanKind::SERVER:
		return tracepb::Span::SERVER;
	case SpanKind::CLIENT:
		return tracepb::Span::CLIENT;
	default:
		return tracepb::Span::SPAN_KIND_UNSPECIFIED;
	}
}

tracepb::Span::TimeEvent::MessageEvent::Type TraceTranslator::MessageEventTypeToProto(MessageEventType type) {
	switch (type) {
	case MessageEventType::SENT:
		return tracepb::Span::TimeEvent::MessageEvent::SENT;
	case MessageEventType::RECEIVED:
		return tracepb::Span::TimeEvent::MessageEvent::RECEIVED;
	default:
		return tracepb::Span::TimeEvent::MessageEvent::TYPE_UNSPECIFIED;
	}
}

tracepb::Span::Link::Type TraceTranslator::LinkTypeToProto(LinkType type) {
	switch (type) {
	case LinkType::CHILD:
		return tracepb::Span::Link::CHILD_LINKED_SPAN;
	case LinkType::PARENT:
		return tracepb::Span::Link::PARENT_LINKED_SPAN;
	default:
		return tracepb::Span::Link::TYPE_UNSPECIFIED;
	}
}

} // namespace ocagent
