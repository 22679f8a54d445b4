#include "gridsearch/error.hpp"

namespace gridsearch {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OutOfBounds:      return "value is out-of-bounds";
        case ErrorCode::SizeMismatch:     return "source size does not match grid size";
        case ErrorCode::Unreachable:      return "destination unreachable";
        case ErrorCode::InvalidCost:      return "negative move cost";
        case ErrorCode::InvalidDirection: return "invalid direction";
        case ErrorCode::InvalidMovement:  return "invalid movement (position + direction)";
        case ErrorCode::Loop:             return "unexpected loop detected";
        case ErrorCode::Empty:            return "empty input";
    }
    return "unknown error";
}

Error::Error(ErrorCode code)
: std::runtime_error(errorCodeName(code)),
  code_(code)
{}

Error::Error(ErrorCode code, const std::string& detail)
: std::runtime_error(std::string(errorCodeName(code)) + ": " + detail),
  code_(code)
{}

} // namespace gridsearch
