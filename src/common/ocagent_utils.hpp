#pragma once

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>

namespace ocagent {

//! Wall-clock instant used for every time field of the in-process model
using TimePoint = std::chrono::system_clock::time_point;

//! Helper: Copy fixed-size identifier bytes into a protobuf `bytes` payload
template <std::size_t N>
inline std::string BytesToString(const std::array<uint8_t, N> &bytes) {
	return std::string(reinterpret_cast<const char *>(bytes.data()), N);
}

//! Helper: True when every byte of the identifier is zero (the "invalid"/"absent" id)
template <std::size_t N>
inline bool IsAllZero(const std::array<uint8_t, N> &bytes) {
	for (auto b : bytes) {
		if (b != 0) {
			return false;
		}
	}
	return true;
}

//! Helper: Convert identifier bytes to lowercase hex (used in log messages)
template <std::size_t N>
inline std::string BytesToHex(const std::array<uint8_t, N> &bytes) {
	static const char hex_chars[] = "0123456789abcdef";
	std::string result;
	result.reserve(N * 2);
	for (auto c : bytes) {
		result.push_back(hex_chars[c >> 4]);
		result.push_back(hex_chars[c & 0x0F]);
	}
	return result;
}

//! Helper: Convert a wall-clock time point to a protobuf Timestamp, keeping nanosecond precision
inline google::protobuf::Timestamp ToProtoTimestamp(TimePoint time) {
	auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
	return google::protobuf::util::TimeUtil::NanosecondsToTimestamp(static_cast<int64_t>(nanos));
}

} // namespace ocagent
