#pragma once

#include <stdexcept>
#include <string>

namespace scheduling {

enum class ErrorCode {
    InvalidPattern,
    InvalidScope,
    RangeTooLarge,
    TransactionFailed,
    InvalidEntry,
    NotFound
};

const char* error_code_name(ErrorCode code);

class SchedulingError : public std::runtime_error {
public:
    SchedulingError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    ErrorCode code() const noexcept { return code_; }
private:
    ErrorCode code_;
};

}
