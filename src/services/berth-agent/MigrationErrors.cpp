#include "MigrationErrors.hpp"

#include <utility>

namespace {
const std::pair<ErrorKind, const char*> kErrorKindNames[] = {
    {ErrorKind::NONE, ""},
    {ErrorKind::VALIDATION, "ValidationError"},
    {ErrorKind::NOT_FOUND, "NotFoundError"},
    {ErrorKind::AMBIGUOUS_UNIT, "AmbiguousUnitError"},
    {ErrorKind::UNREACHABLE, "UnreachableError"},
    {ErrorKind::PERMISSION, "PermissionError"},
    {ErrorKind::CAPABILITY_MISMATCH, "CapabilityMismatchError"},
    {ErrorKind::INSUFFICIENT_SPACE, "InsufficientSpaceError"},
    {ErrorKind::SNAPSHOT, "SnapshotError"},
    {ErrorKind::TRANSFER, "TransferError"},
    {ErrorKind::INTEGRITY, "IntegrityError"},
    {ErrorKind::WORKLOAD, "WorkloadError"},
    {ErrorKind::CANCELLED, "CancelledError"},
    {ErrorKind::ROLLBACK_FAILED, "RollbackFailedError"},
};
} // namespace

std::string ErrorKindName(ErrorKind kind) {
    for (const auto& [value, name] : kErrorKindNames) {
        if (value == kind) {
            return name;
        }
    }
    return {};
}

ErrorKind ErrorKindFromName(const std::string& name) {
    for (const auto& [value, text] : kErrorKindNames) {
        if (name == text) {
            return value;
        }
    }
    return ErrorKind::NONE;
}
