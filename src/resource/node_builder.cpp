#include "resource/node_builder.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cerrno>
#include <cstring>

#ifndef OCAGENT_VERSION
#define OCAGENT_VERSION "0.0.0-dev"
#endif

namespace ocagent {

namespace agentcommonpb = opencensus::proto::agent::common::v1;

ProcessIdentity SystemProcessIdentityProvider::GetIdentity() const {
	ProcessIdentity identity;
	char host_name[256] = {0};
	if (gethostname(host_name, sizeof(host_name) - 1) == 0) {
		identity.host_name = host_name;
	} else {
		spdlog::warn("gethostname failed: {}", std::strerror(errno));
	}
	identity.pid = static_cast<uint32_t>(getpid());
	return identity;
}

std::string LibraryVersion() {
	return OCAGENT_VERSION;
}

agentcommonpb::Node NodeWithStartTime(const std::string &service_name, TimePoint start_time,
                                      const ProcessIdentity &identity, const std::string &core_library_version) {
	agentcommonpb::Node node;

	auto &identifier = *node.mutable_identifier();
	identifier.set_host_name(identity.host_name);
	identifier.set_pid(identity.pid);
	*identifier.mutable_start_timestamp() = ToProtoTimestamp(start_time);

	auto &library_info = *node.mutable_library_info();
	library_info.set_language(agentcommonpb::LibraryInfo::CPP);
	library_info.set_exporter_version(LibraryVersion());
	library_info.set_core_library_version(core_library_version);

	node.mutable_service_info()->set_name(service_name);
	return node;
}

agentcommonpb::Node NodeWithStartTime(const std::string &service_name, TimePoint start_time,
                                      const ProcessIdentityProvider &provider,
                                      const std::string &core_library_version) {
	return NodeWithStartTime(service_name, start_time, provider.GetIdentity(), core_library_version);
}

} // namespace ocagent
