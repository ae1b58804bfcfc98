#pragma once

#include <map>
#include <string>

namespace ocagent {

//! Entity producing the telemetry, e.g. a container or a cloud instance
struct Resource {
	std::string type;
	std::map<std::string, std::string> labels;
};

} // namespace ocagent
