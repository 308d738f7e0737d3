#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class ErrorKind {
    NONE,
    VALIDATION,
    NOT_FOUND,
    AMBIGUOUS_UNIT,
    UNREACHABLE,
    PERMISSION,
    CAPABILITY_MISMATCH,
    INSUFFICIENT_SPACE,
    SNAPSHOT,
    TRANSFER,
    INTEGRITY,
    WORKLOAD,
    CANCELLED,
    ROLLBACK_FAILED
};

std::string ErrorKindName(ErrorKind kind);
ErrorKind ErrorKindFromName(const std::string& name);

class MigrationError : public std::runtime_error {
public:
    MigrationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message),
          kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public MigrationError {
public:
    explicit ValidationError(const std::string& message)
        : MigrationError(ErrorKind::VALIDATION, message) {}
};

class NotFoundError : public MigrationError {
public:
    explicit NotFoundError(const std::string& message)
        : MigrationError(ErrorKind::NOT_FOUND, message) {}
};

class AmbiguousUnitError : public MigrationError {
public:
    AmbiguousUnitError(const std::string& message, std::vector<std::string> candidates)
        : MigrationError(ErrorKind::AMBIGUOUS_UNIT, message),
          candidates_(std::move(candidates)) {}

    const std::vector<std::string>& Candidates() const { return candidates_; }

private:
    std::vector<std::string> candidates_;
};

class UnreachableError : public MigrationError {
public:
    explicit UnreachableError(const std::string& message)
        : MigrationError(ErrorKind::UNREACHABLE, message) {}
};

class PermissionError : public MigrationError {
public:
    explicit PermissionError(const std::string& message)
        : MigrationError(ErrorKind::PERMISSION, message) {}
};

class CapabilityMismatchError : public MigrationError {
public:
    explicit CapabilityMismatchError(const std::string& message)
        : MigrationError(ErrorKind::CAPABILITY_MISMATCH, message) {}
};

class InsufficientSpaceError : public MigrationError {
public:
    explicit InsufficientSpaceError(const std::string& message)
        : MigrationError(ErrorKind::INSUFFICIENT_SPACE, message) {}
};

class SnapshotError : public MigrationError {
public:
    explicit SnapshotError(const std::string& message)
        : MigrationError(ErrorKind::SNAPSHOT, message) {}
};

// Transient transfer errors are retried by the RetryPolicy; everything else
// (destination full, permission, source read) is fatal on first occurrence.
class TransferError : public MigrationError {
public:
    enum class Cause {
        TRANSIENT_NETWORK,
        DESTINATION_FULL,
        PERMISSION,
        SOURCE_READ,
        OTHER
    };

    TransferError(Cause cause, const std::string& message)
        : MigrationError(ErrorKind::TRANSFER, message),
          cause_(cause) {}

    Cause GetCause() const { return cause_; }
    bool IsTransient() const { return cause_ == Cause::TRANSIENT_NETWORK; }

private:
    Cause cause_;
};

class IntegrityError : public MigrationError {
public:
    explicit IntegrityError(const std::string& message)
        : MigrationError(ErrorKind::INTEGRITY, message) {}
};

// The container runtime refused to stop or start the workload.
class WorkloadError : public MigrationError {
public:
    explicit WorkloadError(const std::string& message)
        : MigrationError(ErrorKind::WORKLOAD, message) {}
};

class CancelledError : public MigrationError {
public:
    explicit CancelledError(const std::string& message)
        : MigrationError(ErrorKind::CANCELLED, message) {}
};

class RollbackFailedError : public MigrationError {
public:
    explicit RollbackFailedError(const std::string& message)
        : MigrationError(ErrorKind::ROLLBACK_FAILED, message) {}
};
