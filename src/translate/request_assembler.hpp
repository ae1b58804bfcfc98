#pragma once

#include "common/ocagent_utils.hpp"
#include "model/resource.hpp"

// Generated protobuf stubs
#include "opencensus/proto/agent/common/v1/common.pb.h"
#include "opencensus/proto/agent/metrics/v1/metrics_service.pb.h"
#include "opencensus/proto/agent/trace/v1/trace_service.pb.h"
#include "opencensus/proto/resource/v1/resource.pb.h"

#include <optional>

namespace ocagent {

//===--------------------------------------------------------------------===//
// Request assembly
//===--------------------------------------------------------------------===//
// Pure setters on an already translated request. Calling one twice replaces the earlier value.

void WithResource(opencensus::proto::agent::trace::v1::ExportTraceServiceRequest &request,
                  const opencensus::proto::resource::v1::Resource &resource);
void WithResource(opencensus::proto::agent::metrics::v1::ExportMetricsServiceRequest &request,
                  const opencensus::proto::resource::v1::Resource &resource);

//! A detector that found nothing leaves the request untouched
void WithResource(opencensus::proto::agent::trace::v1::ExportTraceServiceRequest &request,
                  const std::optional<Resource> &resource);
void WithResource(opencensus::proto::agent::metrics::v1::ExportMetricsServiceRequest &request,
                  const std::optional<Resource> &resource);

//! Copy node into the request, stamping its process identifier with start_time
void WithNode(opencensus::proto::agent::trace::v1::ExportTraceServiceRequest &request,
              const opencensus::proto::agent::common::v1::Node &node, TimePoint start_time);
void WithNode(opencensus::proto::agent::metrics::v1::ExportMetricsServiceRequest &request,
              const opencensus::proto::agent::common::v1::Node &node, TimePoint start_time);

} // namespace ocagent
