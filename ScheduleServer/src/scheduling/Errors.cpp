#include "Errors.h"

namespace scheduling {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPattern: return "invalid_pattern";
        case ErrorCode::InvalidScope: return "invalid_scope";
        case ErrorCode::RangeTooLarge: return "range_too_large";
        case ErrorCode::TransactionFailed: return "transaction_failed";
        case ErrorCode::InvalidEntry: return "invalid_entry";
        case ErrorCode::NotFound: return "not_found";
    }
    return "unknown";
}

}
