#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace ocagent {

//! An attribute payload with no wire counterpart. Only its printable form survives translation.
class OpaqueValue {
public:
	virtual ~OpaqueValue() = default;

	virtual std::string ToString() const = 0;
};

//! Dynamically-typed attribute value as recorded by instrumentation.
//! std::monostate stands for a null value. A `const char *` must outlive the translation call.
using AttributeValue =
    std::variant<std::monostate, bool, std::string, const char *, int8_t, int16_t, int32_t, int64_t, uint8_t,
                 uint16_t, uint32_t, uint64_t, float, double, std::vector<bool>, std::vector<int64_t>,
                 std::vector<double>, std::vector<std::string>, std::shared_ptr<const OpaqueValue>>;

//! Attribute bag. Iteration (and therefore truncation) follows ascending key order.
using Attributes = std::map<std::string, AttributeValue>;

} // namespace ocagent
