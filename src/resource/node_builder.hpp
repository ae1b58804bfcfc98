#pragma once

#include "common/ocagent_utils.hpp"

// Generated protobuf stubs
#include "opencensus/proto/agent/common/v1/common.pb.h"

#include <cstdint>
#include <string>

namespace ocagent {

struct ProcessIdentity {
	std::string host_name;
	uint32_t pid = 0;
};

//! Source of the host name and pid reported in the node identifier
class ProcessIdentityProvider {
public:
	virtual ~ProcessIdentityProvider() = default;

	virtual ProcessIdentity GetIdentity() const = 0;
};

//! gethostname() / getpid() of the running process
class SystemProcessIdentityProvider : public ProcessIdentityProvider {
public:
	ProcessIdentity GetIdentity() const override;
};

//! Version string reported as the exporter version
std::string LibraryVersion();

//! Build the node describing this process: identifier (host, pid, start_time), library info
//! (language CPP, exporter version, core_library_version) and service_name.
opencensus::proto::agent::common::v1::Node NodeWithStartTime(const std::string &service_name, TimePoint start_time,
                                                             const ProcessIdentity &identity,
                                                             const std::string &core_library_version);

//! Same as above, querying provider for the identity
opencensus::proto::agent::common::v1::Node NodeWithStartTime(const std::string &service_name, TimePoint start_time,
                                                             const ProcessIdentityProvider &provider,
                                                             const std::string &core_library_version);

} // namespace ocagent
