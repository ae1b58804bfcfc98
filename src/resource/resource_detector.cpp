#include "resource/resource_detector.hpp"
#include "common/exception.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <utility>

namespace ocagent {

namespace resourcepb = opencensus::proto::resource::v1;

namespace {

constexpr std::size_t MAX_LABEL_KEY_LENGTH = 256;
constexpr std::size_t MAX_LABEL_VALUE_LENGTH = 256;

bool IsSpace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsAscii(const std::string &s) {
	for (auto c : s) {
		if (static_cast<unsigned char>(c) > 0x7F) {
			return false;
		}
	}
	return true;
}

std::string Trim(const std::string &s) {
	std::size_t begin = 0;
	std::size_t end = s.size();
	while (begin < end && IsSpace(s[begin])) {
		begin++;
	}
	while (end > begin && IsSpace(s[end - 1])) {
		end--;
	}
	return s.substr(begin, end - begin);
}

std::optional<std::string> GetEnvironmentVariable(const std::string &name) {
	auto value = std::getenv(name.c_str());
	if (!value) {
		return std::nullopt;
	}
	return std::string(value);
}

//! Helper: Read a double-quoted value starting at pos (on the opening quote). Supports \" and \\ escapes.
std::string ReadQuotedValue(const std::string &labels, std::size_t &pos) {
	std::string value;
	pos++;
	while (pos < labels.size()) {
		auto c = labels[pos];
		if (c == '"') {
			pos++;
			return value;
		}
		if (c == '\\') {
			if (pos + 1 >= labels.size()) {
				break;
			}
			auto escaped = labels[pos + 1];
			if (escaped != '"' && escaped != '\\') {
				throw InvalidInputException("Invalid escape sequence '\\" + std::string(1, escaped) +
				                            "' in resource labels: '" + labels + "'");
			}
			value.push_back(escaped);
			pos += 2;
			continue;
		}
		value.push_back(c);
		pos++;
	}
	throw InvalidInputException("Unterminated quoted value in resource labels: '" + labels + "'");
}

} // namespace

//===--------------------------------------------------------------------===//
// EnvResourceDetector
//===--------------------------------------------------------------------===//

EnvResourceDetector::EnvResourceDetector() : lookup_(GetEnvironmentVariable) {
}

EnvResourceDetector::EnvResourceDetector(Lookup lookup) : lookup_(std::move(lookup)) {
}

std::optional<Resource> EnvResourceDetector::Detect() const {
	auto type = lookup_(TYPE_VARIABLE);
	auto labels = lookup_(LABELS_VARIABLE);
	if (!type && !labels) {
		return std::nullopt;
	}

	Resource resource;
	if (type) {
		resource.type = Trim(*type);
	}
	if (labels) {
		try {
			resource.labels = DecodeResourceLabels(*labels);
		} catch (const InvalidInputException &ex) {
			spdlog::warn("Ignoring resource from environment: {}", ex.what());
			return std::nullopt;
		}
	}
	return resource;
}

//===--------------------------------------------------------------------===//
// Label codec
//===--------------------------------------------------------------------===//

std::map<std::string, std::string> DecodeResourceLabels(const std::string &labels) {
	std::map<std::string, std::string> result;
	std::size_t pos = 0;
	while (pos < labels.size()) {
		auto eq = labels.find('=', pos);
		if (eq == std::string::npos) {
			auto remainder = Trim(labels.substr(pos));
			if (remainder.empty()) {
				break;
			}
			throw InvalidInputException("Invalid resource label formatting, remainder: '" + remainder + "'");
		}
		auto key = Trim(labels.substr(pos, eq - pos));
		if (key.empty() || key.size() > MAX_LABEL_KEY_LENGTH || !IsAscii(key) ||
		    key.find(',') != std::string::npos) {
			throw InvalidInputException("Invalid resource label key: '" + key + "'");
		}

		pos = eq + 1;
		while (pos < labels.size() && IsSpace(labels[pos])) {
			pos++;
		}

		std::string value;
		if (pos < labels.size() && labels[pos] == '"') {
			value = ReadQuotedValue(labels, pos);
			while (pos < labels.size() && IsSpace(labels[pos])) {
				pos++;
			}
			if (pos < labels.size() && labels[pos] != ',') {
				throw InvalidInputException("Unexpected text after quoted value of resource label '" + key + "'");
			}
		} else {
			auto comma = labels.find(',', pos);
			auto end = comma == std::string::npos ? labels.size() : comma;
			value = Trim(labels.substr(pos, end - pos));
			pos = end;
		}
		if (value.size() > MAX_LABEL_VALUE_LENGTH || !IsAscii(value)) {
			throw InvalidInputException("Invalid value for resource label '" + key + "'");
		}

		// skip the separator
		if (pos < labels.size()) {
			pos++;
		}
		result[key] = value;
	}
	return result;
}

std::string EncodeResourceLabels(const std::map<std::string, std::string> &labels) {
	std::string result;
	for (const auto &entry : labels) {
		if (!result.empty()) {
			result += ",";
		}
		result += entry.first + "=\"";
		for (auto c : entry.second) {
			if (c == '"' || c == '\\') {
				result.push_back('\\');
			}
			result.push_back(c);
		}
		result += "\"";
	}
	return result;
}

resourcepb::Resource ResourceToProto(const Resource &resource) {
	resourcepb::Resource proto;
	proto.set_type(resource.type);
	auto &labels = *proto.mutable_labels();
	for (const auto &entry : resource.labels) {
		labels[entry.first] = entry.second;
	}
	return proto;
}

} // namespace ocagent
