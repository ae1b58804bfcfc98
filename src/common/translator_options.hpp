#pragma once

#include <cstddef>
#include <limits>
#include <map>
#include <string>

namespace opencensus {
namespace proto {
namespace trace {
namespace v1 {
class TraceConfig;
}
} // namespace trace
} // namespace proto
} // namespace opencensus

namespace ocagent {

//! Truncation limits applied while translating spans. Every limit is independent:
//! each annotation and each link gets its own attribute budget.
struct TranslatorOptions {
	static constexpr std::size_t NO_LIMIT = std::numeric_limits<std::size_t>::max();

	std::size_t max_attributes = NO_LIMIT;
	std::size_t max_annotation_attributes = NO_LIMIT;
	std::size_t max_link_attributes = NO_LIMIT;
	std::size_t max_annotations = NO_LIMIT;
	std::size_t max_message_events = NO_LIMIT;
	std::size_t max_links = NO_LIMIT;

	//! Build options from string key/value pairs, e.g. {"max_attributes", "32"} or {"max_links", "unlimited"}.
	//! Throws InvalidInputException on unknown keys or malformed values.
	static TranslatorOptions FromOptionMap(const std::map<std::string, std::string> &options);

	//! Build options from the agent-pushed trace configuration. Zero or negative limits mean no limit.
	static TranslatorOptions FromTraceConfig(const opencensus::proto::trace::v1::TraceConfig &config);

	//! Render a limit for log output ("unlimited" or the number)
	static std::string LimitToString(std::size_t limit);
};

} // namespace ocagent
