#pragma once

#include "model/view_data.hpp"

// Generated protobuf stubs
#include "opencensus/proto/metrics/v1/metrics.pb.h"

#include <vector>

namespace ocagent {

//! Encode distribution statistics as a wire DistributionValue with explicit bucket bounds.
//! sum is reconstructed as mean * count. min and max have no wire field and are not carried.
//! bounds.size() + 1 == count_per_bucket.size() and sum(count_per_bucket) == count are expected;
//! a mismatch is logged and the data is copied as is.
opencensus::proto::metrics::v1::DistributionValue EncodeDistribution(const DistributionData &data,
                                                                     const std::vector<double> &bounds);

} // namespace ocagent
