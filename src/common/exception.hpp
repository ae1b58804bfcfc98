#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ocagent {

enum class ExceptionType : uint8_t { INVALID_INPUT = 0, INTERNAL = 1 };

//! Base class of every exception raised by the library
class Exception : public std::runtime_error {
public:
	Exception(ExceptionType type, const std::string &message);

	ExceptionType Type() const {
		return type_;
	}

	static std::string ExceptionTypeToString(ExceptionType type);

private:
	ExceptionType type_;
};

//! Raised for malformed configuration or collaborator input (option maps, resource labels)
class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const std::string &message);
};

//! Raised when a caller breaks a structural contract of the translators
class InternalException : public Exception {
public:
	explicit InternalException(const std::string &message);
};

} // namespace ocagent
