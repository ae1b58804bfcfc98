#pragma once

#include "model/attribute_value.hpp"

// Generated protobuf stubs
#include "opencensus/proto/trace/v1/trace.pb.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ocagent {

//! The closed set of value kinds the wire attribute union can carry
enum class AttributeKind : uint8_t { STRING = 0, BOOL = 1, INT = 2, DOUBLE = 3 };

//! Convert attribute kind enum to string
std::string AttributeKindToString(AttributeKind kind);

//! Render any attribute value in `%v` style: "<nil>" for null, "[a b c]" for arrays,
//! ToString() for opaque objects, plain text for scalars.
std::string RenderAttributeValue(const AttributeValue &value);

//! Wire kind a value normalizes to. Never fails: unsupported kinds classify as STRING.
AttributeKind ClassifyAttributeValue(const AttributeValue &value);

//! Write the closed wire form of value into proto and return the kind that was set.
//! bool -> bool, strings -> string, 8..64-bit integers -> int64, float/double -> double,
//! anything else -> string holding RenderAttributeValue(value).
AttributeKind NormalizeAttributeValue(const AttributeValue &value, opencensus::proto::trace::v1::AttributeValue &proto);

//! Fill proto with the first max_attributes entries of attributes, in ascending key order.
//! dropped_attributes_count becomes the number of entries left out plus already_dropped.
void ConvertAttributes(const Attributes &attributes, std::size_t max_attributes, int32_t already_dropped,
                       opencensus::proto::trace::v1::Span::Attributes &proto);

//! Store value in a TruncatableString. No truncation is performed, truncated_byte_count stays 0.
void SetTruncatableString(opencensus::proto::trace::v1::TruncatableString &proto, const std::string &value);

} // namespace ocagent
