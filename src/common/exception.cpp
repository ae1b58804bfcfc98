#include "common/exception.hpp"

namespace ocagent {

Exception::Exception(ExceptionType type, const std::string &message)
    : std::runtime_error(ExceptionTypeToString(type) + " Error: " + message), type_(type) {
}

std::string Exception::ExceptionTypeToString(ExceptionType type) {
	switch (type) {
	case ExceptionType::INVALID_INPUT:
		return "Invalid Input";
	case ExceptionType::INTERNAL:
		return "INTERNAL";
	default:
		return "Unknown";
	}
}

InvalidInputException::InvalidInputException(const std::string &message)
    : Exception(ExceptionType::INVALID_INPUT, message) {
}

InternalException::InternalException(const std::string &message) : Exception(ExceptionType::INTERNAL, message) {
}

} // namespace ocagent
