#pragma once

#include <stdexcept>
#include <string>

namespace gridsearch {

enum class ErrorCode {
    OutOfBounds,
    SizeMismatch,
    Unreachable,
    InvalidCost,
    InvalidDirection,
    InvalidMovement,
    Loop,
    Empty
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief Typed failure raised by grid construction and search operations
 *
 * Every failure caused by valid-but-unsatisfiable input is reported with
 * this exception; the code tells the caller which one it was.
 */
class Error : public std::runtime_error {
public:
    explicit Error(ErrorCode code);
    Error(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace gridsearch
