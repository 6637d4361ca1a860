#pragma once
#include <stdexcept>
#include <string>

namespace coord {

enum class ErrorCode {
    Ok = 0,
    InvalidArgs,
    NotFound,
    InvalidTransition,
    LockTimeout,
    CorruptStore,
    DuplicateId,
    IoError,
    RecordTooLarge,
    ReconciliationConflict,
    ClockUnavailable,
};

const char* error_code_name(ErrorCode c);

// Stable process exit status per error kind (automation branches on it).
int exit_code_for(ErrorCode c);

class CoordException : public std::runtime_error {
public:
    CoordException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidArgumentError : public CoordException {
public:
    explicit InvalidArgumentError(const std::string& msg)
        : CoordException(ErrorCode::InvalidArgs, msg) {}
};

class NotFoundError : public CoordException {
public:
    explicit NotFoundError(const std::string& id)
        : CoordException(ErrorCode::NotFound, "work item not found: " + id) {}
};

class InvalidTransitionError : public CoordException {
public:
    explicit InvalidTransitionError(const std::string& msg)
        : CoordException(ErrorCode::InvalidTransition, msg) {}
};

class LockTimeoutError : public CoordException {
public:
    explicit LockTimeoutError(const std::string& msg)
        : CoordException(ErrorCode::LockTimeout, msg) {}
};

class CorruptStoreError : public CoordException {
public:
    explicit CorruptStoreError(const std::string& msg)
        : CoordException(ErrorCode::CorruptStore, msg) {}
};

// Generator collision. Never expected; treated as fatal by callers.
class DuplicateIDError : public CoordException {
public:
    explicit DuplicateIDError(const std::string& id)
        : CoordException(ErrorCode::DuplicateId, "duplicate work item id: " + id) {}
};

class IoError : public CoordException {
public:
    explicit IoError(const std::string& msg)
        : CoordException(ErrorCode::IoError, msg) {}
};

class RecordTooLargeError : public CoordException {
public:
    explicit RecordTooLargeError(const std::string& msg)
        : CoordException(ErrorCode::RecordTooLarge, msg) {}
};

// Duplicate id replayed from the fast log. Logged by the reconciler, not thrown.
class ReconciliationConflictError : public CoordException {
public:
    explicit ReconciliationConflictError(const std::string& id)
        : CoordException(ErrorCode::ReconciliationConflict,
                         "duplicate fast-log entry dropped: " + id) {}
};

class ClockError : public CoordException {
public:
    explicit ClockError(const std::string& msg)
        : CoordException(ErrorCode::ClockUnavailable, msg) {}
};

} // namespace coord
