#include "coord/errors.h"

namespace coord {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:                     return "ok";
        case ErrorCode::InvalidArgs:            return "invalid_args";
        case ErrorCode::NotFound:               return "not_found";
        case ErrorCode::InvalidTransition:      return "invalid_transition";
        case ErrorCode::LockTimeout:            return "lock_timeout";
        case ErrorCode::CorruptStore:           return "corrupt_store";
        case ErrorCode::DuplicateId:            return "duplicate_id";
        case ErrorCode::IoError:                return "io_error";
        case ErrorCode::RecordTooLarge:         return "record_too_large";
        case ErrorCode::ReconciliationConflict: return "reconciliation_conflict";
        case ErrorCode::ClockUnavailable:       return "clock_unavailable";
    }
    return "unknown";
}

int exit_code_for(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:                     return 0;
        case ErrorCode::InvalidArgs:            return 1;
        case ErrorCode::NotFound:               return 3;
        case ErrorCode::InvalidTransition:      return 4;
        case ErrorCode::LockTimeout:            return 5;
        case ErrorCode::CorruptStore:           return 6;
        case ErrorCode::DuplicateId:            return 7;
        case ErrorCode::IoError:                return 8;
        case ErrorCode::RecordTooLarge:         return 9;
        case ErrorCode::ReconciliationConflict: return 10;
        case ErrorCode::ClockUnavailable:       return 11;
    }
    return 2;
}

} // namespace coord
