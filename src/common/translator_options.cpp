#include "common/translator_options.hpp"
#include "common/exception.hpp"

#include "opencensus/proto/trace/v1/trace_config.pb.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace ocagent {

namespace {

std::size_t ParseLimit(const std::string &name, const std::string &raw) {
	std::string value = raw;
	value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
	value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
	            value.end());
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (value == "unlimited" || value == "none") {
		return TranslatorOptions::NO_LIMIT;
	}
	if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
		throw InvalidInputException(name + " must be a non-negative integer or 'unlimited', got: '" + raw + "'");
	}
	try {
		return static_cast<std::size_t>(std::stoull(value));
	} catch (const std::out_of_range &) {
		throw InvalidInputException(name + " is out of range: '" + raw + "'");
	}
}

std::size_t LimitFromConfig(int64_t configured) {
	if (configured <= 0) {
		return TranslatorOptions::NO_LIMIT;
	}
	return static_cast<std::size_t>(configured);
}

} // namespace

TranslatorOptions TranslatorOptions::FromOptionMap(const std::map<std::string, std::string> &options) {
	TranslatorOptions result;
	for (const auto &entry : options) {
		const auto &name = entry.first;
		if (name == "max_attributes") {
			result.max_attributes = ParseLimit(name, entry.second);
		} else if (name == "max_annotation_attributes") {
			result.max_annotation_attributes = ParseLimit(name, entry.second);
		} else if (name == "max_link_attributes") {
			result.max_link_attributes = ParseLimit(name, entry.second);
		} else if (name == "max_annotations") {
			result.max_annotations = ParseLimit(name, entry.second);
		} else if (name == "max_message_events") {
			result.max_message_events = ParseLimit(name, entry.second);
		} else if (name == "max_links") {
			result.max_links = ParseLimit(name, entry.second);
		} else {
			throw InvalidInputException("Unrecognized translator option: '" + name + "'");
		}
	}
	return result;
}

TranslatorOptions TranslatorOptions::FromTraceConfig(const opencensus::proto::trace::v1::TraceConfig &config) {
	TranslatorOptions result;
	// The agent carries a single attribute limit; it applies to every attribute bag of a span
	result.max_attributes = LimitFromConfig(config.max_number_of_attributes());
	result.max_annotation_attributes = result.max_attributes;
	result.max_link_attributes = result.max_attributes;
	result.max_annotations = LimitFromConfig(config.max_number_of_annotations());
	result.max_message_events = LimitFromConfig(config.max_number_of_message_events());
	result.max_links = LimitFromConfig(config.max_number_of_links());
	return result;
}

std::string TranslatorOptions::LimitToString(std::size_t limit) {
	if (limit == NO_LIMIT) {
		return "unlimited";
	}
	return std::to_string(limit);
}

} // namespace ocagent
