#pragma once

#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class SnapshotManager {
public:
    using Dataset = std::pair<std::string, std::string>;

    SnapshotManager(std::chrono::seconds commandTimeout, std::chrono::hours retention = std::chrono::hours(0));

    // Takes one rollback point per data path. Paths on a ZFS dataset get an
    // O(1) snapshot; everything else is copied to a sibling directory. Any
    // failure destroys what was already taken and throws SnapshotError.
    SnapshotRecord CreateRollbackPoint(
        const std::string& jobId,
        const std::vector<std::string>& dataPaths,
        const RemoteExecutor& executor,
        const HostCapabilities& caps) const;

    RollbackResult Rollback(const SnapshotRecord& record, const RemoteExecutor& executor) const;

    // Destroys the rollback point, or marks it retained until the configured
    // retention elapses.
    void Release(SnapshotRecord& record, const RemoteExecutor& executor) const;

    // Destroys now regardless of retention. Returns false if anything remains.
    bool Discard(SnapshotRecord& record, const RemoteExecutor& executor) const;

    // Returns true when a retained record was destroyed.
    bool PruneExpired(SnapshotRecord& record, const RemoteExecutor& executor) const;

    static std::optional<Dataset> FindDataset(const std::string& path, const std::vector<Dataset>& datasets);
    static std::string BuildSnapshotName(const std::string& dataset, const std::string& jobId);
    static std::string BuildSnapshotReadPath(const Dataset& dataset, const std::string& snapshotName, const std::string& path);
    static std::string BuildBackupPath(const std::string& path, const std::string& jobId);

    static std::string BuildCreateCommand(const SnapshotEntry& entry);
    static std::string BuildRollbackCommand(const SnapshotEntry& entry);
    static std::string BuildDestroyCommand(const SnapshotEntry& entry);
    static std::string BuildSizeCommand(const std::string& path);

private:
    SnapshotEntry Take(const std::string& jobId, const std::string& path, const RemoteExecutor& executor, const HostCapabilities& caps) const;
    bool Destroy(const SnapshotEntry& entry, const RemoteExecutor& executor) const;

    std::chrono::seconds commandTimeout_;
    std::chrono::hours retention_;
};
