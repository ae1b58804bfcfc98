#include "translate/attribute_normalizer.hpp"
#include "common/exception.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ocagent {

namespace tracepb = opencensus::proto::trace::v1;

namespace {

//! Go-style `%v` rendering of every alternative
struct RenderVisitor {
	std::string operator()(std::monostate) const {
		return "<nil>";
	}
	std::string operator()(bool value) const {
		return value ? "true" : "false";
	}
	std::string operator()(const std::string &value) const {
		return value;
	}
	std::string operator()(const char *value) const {
		return value ? std::string(value) : "<nil>";
	}
	std::string operator()(int8_t value) const {
		return std::to_string(static_cast<int64_t>(value));
	}
	std::string operator()(int16_t value) const {
		return std::to_string(value);
	}
	std::string operator()(int32_t value) const {
		return std::to_string(value);
	}
	std::string operator()(int64_t value) const {
		return std::to_string(value);
	}
	std::string operator()(uint8_t value) const {
		return std::to_string(static_cast<uint64_t>(value));
	}
	std::string operator()(uint16_t value) const {
		return std::to_string(value);
	}
	std::string operator()(uint32_t value) const {
		return std::to_string(value);
	}
	std::string operator()(uint64_t value) const {
		return std::to_string(value);
	}
	std::string operator()(float value) const {
		return fmt::format("{}", value);
	}
	std::string operator()(double value) const {
		return fmt::format("{}", value);
	}
	std::string operator()(const std::vector<bool> &values) const {
		// vector<bool> hands out proxy references, so join it by hand
		std::string out = "[";
		for (std::size_t i = 0; i < values.size(); i++) {
			if (i > 0) {
				out += " ";
			}
			out += values[i] ? "true" : "false";
		}
		out += "]";
		return out;
	}
	template <typename T>
	std::string operator()(const std::vector<T> &values) const {
		return fmt::format("[{}]", fmt::join(values, " "));
	}
	std::string operator()(const std::shared_ptr<const OpaqueValue> &value) const {
		return value ? value->ToString() : "<nil>";
	}
};

//! Writes the wire union; scalar kinds map directly, everything else falls back to its rendering
struct AttributeVisitor {
	tracepb::AttributeValue &proto;

	AttributeKind operator()(bool value) {
		proto.set_bool_value(value);
		return AttributeKind::BOOL;
	}
	AttributeKind operator()(const std::string &value) {
		SetTruncatableString(*proto.mutable_string_value(), value);
		return AttributeKind::STRING;
	}
	AttributeKind operator()(const char *value) {
		if (!value) {
			return Fallback(std::monostate {});
		}
		SetTruncatableString(*proto.mutable_string_value(), value);
		return AttributeKind::STRING;
	}
	AttributeKind operator()(int8_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(int16_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(int32_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(int64_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(uint8_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(uint16_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(uint32_t value) {
		return SetInt(value);
	}
	// Values above INT64_MAX wrap around
	AttributeKind operator()(uint64_t value) {
		return SetInt(value);
	}
	AttributeKind operator()(float value) {
		proto.set_double_value(static_cast<double>(value));
		return AttributeKind::DOUBLE;
	}
	AttributeKind operator()(double value) {
		proto.set_double_value(value);
		return AttributeKind::DOUBLE;
	}
	// Null, arrays and opaque objects have no wire counterpart
	template <typename T>
	AttributeKind operator()(const T &value) {
		return Fallback(value);
	}

private:
	template <typename T>
	AttributeKind SetInt(T value) {
		proto.set_int_value(static_cast<int64_t>(value));
		return AttributeKind::INT;
	}

	template <typename T>
	AttributeKind Fallback(const T &value) {
		auto rendered = RenderVisitor {}(value);
		spdlog::debug("Attribute value without wire kind rendered as string: {}", rendered);
		SetTruncatableString(*proto.mutable_string_value(), rendered);
		return AttributeKind::STRING;
	}
};

struct ClassifyVisitor {
	AttributeKind operator()(bool) const {
		return AttributeKind::BOOL;
	}
	AttributeKind operator()(const std::string &) const {
		return AttributeKind::STRING;
	}
	AttributeKind operator()(const char *) const {
		return AttributeKind::STRING;
	}
	AttributeKind operator()(int8_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(int16_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(int32_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(int64_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(uint8_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(uint16_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(uint32_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(uint64_t) const {
		return AttributeKind::INT;
	}
	AttributeKind operator()(float) const {
		return AttributeKind::DOUBLE;
	}
	AttributeKind operator()(double) const {
		return AttributeKind::DOUBLE;
	}
	template <typename T>
	AttributeKind operator()(const T &) const {
		return AttributeKind::STRING;
	}
};

} // namespace

std::string AttributeKindToString(AttributeKind kind) {
	switch (kind) {
	case AttributeKind::STRING:
		return "STRING";
	case AttributeKind::BOOL:
		return "BOOL";
	case AttributeKind::INT:
		return "INT";
	case AttributeKind::DOUBLE:
		return "DOUBLE";
	default:
		throw InternalException("Invalid attribute kind");
	}
}

std::string RenderAttributeValue(const AttributeValue &value) {
	return std::visit(RenderVisitor {}, value);
}

AttributeKind ClassifyAttributeValue(const AttributeValue &value) {
	return std::visit(ClassifyVisitor {}, value);
}

AttributeKind NormalizeAttributeValue(const AttributeValue &value, tracepb::AttributeValue &proto) {
	return std::visit(AttributeVisitor {proto}, value);
}

void ConvertAttributes(const Attributes &attributes, std::size_t max_attributes, int32_t already_dropped,
                       tracepb::Span::Attributes &proto) {
	auto &map = *proto.mutable_attribute_map();
	std::size_t kept = 0;
	for (const auto &entry : attributes) {
		if (kept >= max_attributes) {
			break;
		}
		NormalizeAttributeValue(entry.second, map[entry.first]);
		kept++;
	}

	auto dropped = attributes.size() - kept;
	if (dropped > 0) {
		spdlog::debug("Attribute limit {} reached: kept {}, dropped {}", max_attributes, kept, dropped);
	}
	proto.set_dropped_attributes_count(already_dropped + static_cast<int32_t>(dropped));
}

void SetTruncatableString(tracepb::TruncatableString &proto, const std::string &value) {
	proto.set_value(value);
	proto.set_truncated_byte_count(0);
}

} // namespace ocagent
