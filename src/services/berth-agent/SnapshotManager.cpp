#include "SnapshotManager.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace {
constexpr const char* kSnapshotPrefix = "berth-";
constexpr const char* kBackupSuffix = ".berth-rollback-";

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool IsWithin(const std::string& path, const std::string& mountpoint) {
    if (mountpoint == "/") {
        return !path.empty() && path.front() == '/';
    }
    return path == mountpoint || path.rfind(mountpoint + "/", 0) == 0;
}

// Entries on the same dataset share one snapshot; commands are issued once.
std::string EntryKey(const SnapshotEntry& entry) {
    return entry.method == SnapshotMethod::COW_SNAPSHOT ? entry.snapshotName : entry.backupPath;
}
} // namespace

SnapshotManager::SnapshotManager(std::chrono::seconds commandTimeout, std::chrono::hours retention)
    : commandTimeout_(commandTimeout),
      retention_(retention) {}

SnapshotRecord SnapshotManager::CreateRollbackPoint(
    const std::string& jobId,
    const std::vector<std::string>& dataPaths,
    const RemoteExecutor& executor,
    const HostCapabilities& caps) const {
    if (jobId.empty()) {
        throw SnapshotError("Rollback point requires a job id");
    }

    SnapshotRecord record;
    record.id = std::string(kSnapshotPrefix) + jobId;
    record.hostId = executor.HostId();
    record.createdAt = CurrentTimestamp();

    std::set<std::string> taken;
    try {
        for (const auto& path : dataPaths) {
            if (record.Covers(path)) {
                continue;
            }

            SnapshotEntry entry;
            const auto dataset = caps.cowAvailable ? FindDataset(path, caps.datasets) : std::nullopt;
            if (dataset && taken.count(BuildSnapshotName(dataset->first, jobId)) != 0) {
                entry.sourcePath = path;
                entry.method = SnapshotMethod::COW_SNAPSHOT;
                entry.dataset = dataset->first;
                entry.snapshotName = BuildSnapshotName(dataset->first, jobId);
                entry.readPath = BuildSnapshotReadPath(*dataset, entry.snapshotName, path);
                entry.rollbackCommand = BuildRollbackCommand(entry);
                entry.createdAt = record.createdAt;
            } else {
                entry = Take(jobId, path, executor, caps);
            }

            taken.insert(EntryKey(entry));
            record.entries.push_back(std::move(entry));
        }
    } catch (const SnapshotError&) {
        std::set<std::string> destroyed;
        for (const auto& entry : record.entries) {
            if (destroyed.insert(EntryKey(entry)).second && !Destroy(entry, executor)) {
                std::cerr << "[Snapshot] Cleanup of partial rollback point failed for " << entry.sourcePath << std::endl;
            }
        }
        throw;
    }

    std::cout << "[Snapshot] Rollback point " << record.id << " created on " << record.hostId
              << " for " << record.entries.size() << " path(s)." << std::endl;
    return record;
}

RollbackResult SnapshotManager::Rollback(const SnapshotRecord& record, const RemoteExecutor& executor) const {
    RollbackResult result;
    if (record.released && !record.retained) {
        result.errors.push_back("Rollback point " + record.id + " was already released");
        return result;
    }

    std::set<std::string> applied;
    for (const auto& entry : record.entries) {
        if (!applied.insert(EntryKey(entry)).second) {
            result.restored.push_back(entry.sourcePath);
            continue;
        }

        const CommandResult rollback = executor.Run(BuildRollbackCommand(entry), commandTimeout_);
        if (rollback.Ok()) {
            result.restored.push_back(entry.sourcePath);
        } else {
            result.errors.push_back(entry.sourcePath + ": " + Trim(rollback.output));
        }
    }

    result.success = result.errors.empty();
    if (result.success) {
        std::cout << "[Snapshot] Rolled back " << result.restored.size() << " path(s) from " << record.id << std::endl;
    } else {
        std::cerr << "[Snapshot] Rollback from " << record.id << " incomplete: " << result.errors.front() << std::endl;
    }
    return result;
}

void SnapshotManager::Release(SnapshotRecord& record, const RemoteExecutor& executor) const {
    if (record.released) {
        return;
    }

    if (retention_.count() > 0) {
        record.retained = true;
        record.retainUntil = TimestampAfter(std::chrono::duration_cast<std::chrono::seconds>(retention_).count());
        record.released = true;
        std::cout << "[Snapshot] Retaining " << record.id << " until " << record.retainUntil << std::endl;
        return;
    }

    if (!Discard(record, executor)) {
        throw SnapshotError("Failed to release rollback point " + record.id);
    }
}

bool SnapshotManager::Discard(SnapshotRecord& record, const RemoteExecutor& executor) const {
    if (record.released && !record.retained) {
        return true;
    }

    std::set<std::string> destroyed;
    bool ok = true;
    for (const auto& entry : record.entries) {
        if (destroyed.insert(EntryKey(entry)).second && !Destroy(entry, executor)) {
            ok = false;
        }
    }
    if (!ok) {
        return false;
    }

    record.released = true;
    record.retained = false;
    record.retainUntil.clear();
    std::cout << "[Snapshot] Released " << record.id << std::endl;
    return true;
}

bool SnapshotManager::PruneExpired(SnapshotRecord& record, const RemoteExecutor& executor) const {
    if (!record.retained || !TimestampPassed(record.retainUntil)) {
        return false;
    }

    std::cout << "[Snapshot] Retention of " << record.id << " expired" << std::endl;
    return Discard(record, executor);
}

std::optional<SnapshotManager::Dataset> SnapshotManager::FindDataset(
    const std::string& path,
    const std::vector<Dataset>& datasets) {
    std::optional<Dataset> best;
    for (const auto& dataset : datasets) {
        const auto& mountpoint = dataset.second;
        if (mountpoint.empty() || mountpoint.front() != '/' || !IsWithin(path, mountpoint)) {
            continue;
        }
        if (!best || mountpoint.size() > best->second.size()) {
            best = dataset;
        }
    }
    return best;
}

std::string SnapshotManager::BuildSnapshotName(const std::string& dataset, const std::string& jobId) {
    return dataset + "@" + kSnapshotPrefix + jobId;
}

std::string SnapshotManager::BuildSnapshotReadPath(
    const Dataset& dataset,
    const std::string& snapshotName,
    const std::string& path) {
    const auto at = snapshotName.find('@');
    const std::string shortName = at == std::string::npos ? snapshotName : snapshotName.substr(at + 1);
    const std::string mountpoint = dataset.second == "/" ? std::string() : dataset.second;
    const std::string subpath = path.substr(dataset.second == "/" ? 0 : dataset.second.size());
    return mountpoint + "/.zfs/snapshot/" + shortName + subpath;
}

std::string SnapshotManager::BuildBackupPath(const std::string& path, const std::string& jobId) {
    std::string base = path;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    return base + kBackupSuffix + jobId;
}

std::string SnapshotManager::BuildCreateCommand(const SnapshotEntry& entry) {
    if (entry.method == SnapshotMethod::COW_SNAPSHOT) {
        return "zfs snapshot " + RemoteExecutor::QuoteArgument(entry.snapshotName);
    }
    return "cp -a " + RemoteExecutor::QuoteArgument(entry.sourcePath) + " " + RemoteExecutor::QuoteArgument(entry.backupPath);
}

std::string SnapshotManager::BuildRollbackCommand(const SnapshotEntry& entry) {
    if (entry.method == SnapshotMethod::COW_SNAPSHOT) {
        return "zfs rollback -r " + RemoteExecutor::QuoteArgument(entry.snapshotName);
    }

    const std::string source = RemoteExecutor::QuoteArgument(entry.sourcePath);
    const std::string restore = RemoteExecutor::QuoteArgument(entry.sourcePath + ".berth-restore");
    std::ostringstream command;
    command << "rm -rf " << restore
            << " && cp -a " << RemoteExecutor::QuoteArgument(entry.backupPath) << " " << restore
            << " && rm -rf " << source
            << " && mv " << restore << " " << source;
    return command.str();
}

std::string SnapshotManager::BuildDestroyCommand(const SnapshotEntry& entry) {
    if (entry.method == SnapshotMethod::COW_SNAPSHOT) {
        return "zfs destroy " + RemoteExecutor::QuoteArgument(entry.snapshotName);
    }
    return "rm -rf " + RemoteExecutor::QuoteArgument(entry.backupPath);
}

std::string SnapshotManager::BuildSizeCommand(const std::string& path) {
    return "du -sb " + RemoteExecutor::QuoteArgument(path) + " | cut -f1";
}

SnapshotEntry SnapshotManager::Take(
    const std::string& jobId,
    const std::string& path,
    const RemoteExecutor& executor,
    const HostCapabilities& caps) const {
    SnapshotEntry entry;
    entry.sourcePath = path;
    entry.createdAt = CurrentTimestamp();

    const CommandResult size = executor.Run(BuildSizeCommand(path), commandTimeout_);
    if (size.Ok()) {
        try {
            entry.sizeBytes = std::stoll(Trim(size.output));
        } catch (const std::exception&) {
            entry.sizeBytes = 0;
        }
    }

    const auto dataset = caps.cowAvailable ? FindDataset(path, caps.datasets) : std::nullopt;
    if (dataset) {
        entry.method = SnapshotMethod::COW_SNAPSHOT;
        entry.dataset = dataset->first;
        entry.snapshotName = BuildSnapshotName(dataset->first, jobId);
        entry.readPath = BuildSnapshotReadPath(*dataset, entry.snapshotName, path);
    } else {
        entry.method = SnapshotMethod::DIRECTORY_COPY;
        entry.backupPath = BuildBackupPath(path, jobId);
        entry.readPath = entry.backupPath;
    }
    entry.rollbackCommand = BuildRollbackCommand(entry);

    const CommandResult created = executor.Run(BuildCreateCommand(entry), commandTimeout_);
    if (!created.Ok()) {
        if (entry.method == SnapshotMethod::DIRECTORY_COPY) {
            const CommandResult cleanup = executor.Run(BuildDestroyCommand(entry), commandTimeout_);
            if (!cleanup.Ok()) {
                std::cerr << "[Snapshot] Partial backup left at " << entry.backupPath << std::endl;
            }
        }
        throw SnapshotError(
            "Snapshot of " + path + " on " + executor.HostId() + " failed"
            + (created.timedOut ? std::string(" (timeout)") : std::string()) + ": " + Trim(created.output));
    }

    std::cout << "[Snapshot] " << path << " -> "
              << (entry.method == SnapshotMethod::COW_SNAPSHOT ? entry.snapshotName : entry.backupPath) << std::endl;
    return entry;
}

bool SnapshotManager::Destroy(const SnapshotEntry& entry, const RemoteExecutor& executor) const {
    const CommandResult result = executor.Run(BuildDestroyCommand(entry), commandTimeout_);
    if (!result.Ok()) {
        std::cerr << "[Snapshot] Destroy failed for " << EntryKey(entry) << ": " << Trim(result.output) << std::endl;
        return false;
    }
    return true;
}
