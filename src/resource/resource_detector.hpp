#pragma once

#include "model/resource.hpp"

// Generated protobuf stubs
#include "opencensus/proto/resource/v1/resource.pb.h"

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace ocagent {

//! Resolves the resource the process reports as. Implementations may read ambient state;
//! the translators only ever see the resolved value.
class ResourceDetector {
public:
	virtual ~ResourceDetector() = default;

	//! nullopt when no resource could be determined
	virtual std::optional<Resource> Detect() const = 0;
};

//! Reads OC_RESOURCE_TYPE and OC_RESOURCE_LABELS
class EnvResourceDetector : public ResourceDetector {
public:
	static constexpr const char *TYPE_VARIABLE = "OC_RESOURCE_TYPE";
	static constexpr const char *LABELS_VARIABLE = "OC_RESOURCE_LABELS";

	using Lookup = std::function<std::optional<std::string>(const std::string &name)>;

	//! Uses the process environment
	EnvResourceDetector();
	explicit EnvResourceDetector(Lookup lookup);

	//! Malformed labels are logged and yield nullopt
	std::optional<Resource> Detect() const override;

private:
	Lookup lookup_;
};

//! Parse `key=value` pairs separated by commas. Values may be double-quoted, whitespace around
//! pairs is ignored and a trailing comma is accepted. Keys hold 1 to 256 ASCII characters and
//! values 0 to 256. Throws InvalidInputException on malformed input.
std::map<std::string, std::string> DecodeResourceLabels(const std::string &labels);

//! Render labels as `k1="v1",k2="v2"` in key order, escaping quotes and backslashes
std::string EncodeResourceLabels(const std::map<std::string, std::string> &labels);

opencensus::proto::resource::v1::Resource ResourceToProto(const Resource &resource);

} // namespace ocagent
