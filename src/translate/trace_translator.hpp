#pragma once

#include "common/translator_options.hpp"
#include "model/span_data.hpp"

// Generated protobuf stubs
#include "opencensus/proto/agent/trace/v1/trace_service.pb.h"
#include "opencensus/proto/trace/v1/trace.pb.h"

#include <vector>

namespace ocagent {

//! TraceTranslator converts finished spans into the agent trace export request.
//! Node and resource are left unset; attach them with the request assembler.
class TraceTranslator {
public:
	explicit TraceTranslator(TranslatorOptions options = TranslatorOptions());

	//! One wire span per input span, in input order
	opencensus::proto::agent::trace::v1::ExportTraceServiceRequest
	TranslateSpans(const std::vector<SpanData> &spans) const;

	//! Fill proto from a single span
	void TranslateSpan(const SpanData &span, opencensus::proto::trace::v1::Span &proto) const;

	const TranslatorOptions &Options() const {
		return options_;
	}

	static opencensus::proto::trace::v1::Span::SpanKind SpanKindToProto(SpanKind kind);
	static opencensus::proto::trace::v1::Span::TimeEvent::MessageEvent::Type
	MessageEventTypeToProto(MessageEventType type);
	static opencensus::proto::trace::v1::Span::Link::Type LinkTypeToProto(LinkType type);

private:
	void TranslateTimeEvents(const SpanData &span, opencensus::proto::trace::v1::Span &proto) const;
	void TranslateLinks(const SpanData &span, opencensus::proto::trace::v1::Span &proto) const;

	TranslatorOptions options_;
};

} // namespace ocagent
