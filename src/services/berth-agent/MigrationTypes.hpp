#pragma once

#include "MigrationErrors.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

enum class MigrationState {
    INITIALIZING,
    VALIDATING,
    DISCOVERING,
    SNAPSHOTTING,
    CHECKSUMMING,
    TRANSFERRING,
    VERIFYING,
    CUTOVER,
    CLEANING,
    COMPLETED,
    FAILED,
    CANCELLED,
    ROLLBACK_FAILED
};

std::string MigrationStateName(MigrationState state);
MigrationState MigrationStateFromName(const std::string& name);
bool IsTerminal(MigrationState state);
int StateProgress(MigrationState state);

struct VolumeMount {
    std::string source;
    std::string destination;
    bool readOnly = false;
};

struct ContainerSpec {
    std::string id;
    std::string name;
    std::string image;
    std::string service;
    std::vector<std::string> networks;
    std::vector<std::string> environment;
    std::vector<VolumeMount> mounts;
};

struct ComposeProject {
    std::string name;
    std::string workingDir;
    std::string composeFile;
    std::vector<ContainerSpec> containers;
};

struct ContainerSet {
    std::string selector;
    std::vector<ContainerSpec> containers;
};

// Resolved once by discovery; downstream code switches on the variant and never
// re-infers whether it is dealing with a compose project.
struct MigrationUnit {
    std::variant<ComposeProject, ContainerSet> kind;
    std::vector<VolumeMount> volumes;
    std::vector<std::string> networks;

    bool IsCompose() const { return std::holds_alternative<ComposeProject>(kind); }
    std::string Name() const;
    const std::vector<ContainerSpec>& Containers() const;
};

enum class SnapshotMethod {
    COW_SNAPSHOT,
    DIRECTORY_COPY
};

struct SnapshotEntry {
    std::string sourcePath;
    SnapshotMethod method = SnapshotMethod::DIRECTORY_COPY;
    std::string dataset;
    std::string snapshotName;
    std::string backupPath;
    std::string readPath;
    std::string rollbackCommand;
    std::string createdAt;
    long long sizeBytes = 0;
};

struct SnapshotRecord {
    std::string id;
    std::string hostId;
    std::string createdAt;
    std::vector<SnapshotEntry> entries;
    bool released = false;
    bool retained = false;
    std::string retainUntil;

    const SnapshotEntry* Find(const std::string& sourcePath) const;
    bool Covers(const std::string& sourcePath) const { return Find(sourcePath) != nullptr; }
};

struct RollbackResult {
    bool success = false;
    std::vector<std::string> restored;
    std::vector<std::string> errors;
};

inline constexpr const char* kUnreadableHash = "unreadable";
// Symbolic links are recorded by target rather than content.
inline constexpr const char* kSymlinkPrefix = "link:";

struct ChecksumManifest {
    std::string root;
    std::map<std::string, std::string> entries;
    std::string aggregate;
    std::string generatedAt;

    bool Valid() const { return !aggregate.empty(); }
    unsigned long long UnreadableCount() const;
};

struct DiffResult {
    std::vector<std::string> matched;
    std::vector<std::string> mismatched;
    std::vector<std::string> missing;
    std::vector<std::string> extra;

    bool Clean() const { return mismatched.empty() && missing.empty(); }
};

enum class TransferMethod {
    BLOCK_CLONE,
    FILE_SYNC
};

std::string TransferMethodName(TransferMethod method);
TransferMethod TransferMethodFromName(const std::string& name);

struct TransferCheckpoint {
    std::string volumeSource;
    TransferMethod method = TransferMethod::FILE_SYNC;
    size_t fileCursor = 0;
    unsigned long long confirmedBytes = 0;
    std::string partialFile;
    std::string stagingPath;
    std::string finalPath;
    std::string resumeToken;
    std::string movedAsidePath;
    bool dryRunDone = false;
    bool staged = false;
    bool committed = false;
};

struct TransferResult {
    std::string volumeSource;
    TransferMethod method = TransferMethod::FILE_SYNC;
    size_t filesTransferred = 0;
    size_t filesSkipped = 0;
    unsigned long long bytesTransferred = 0;
    std::string stagingPath;
};

struct PathCapacity {
    std::string path;
    bool exists = false;
    bool writable = false;
    unsigned long long freeBytes = 0;
};

struct HostCapabilities {
    std::string hostId;
    bool reachable = false;
    long latencyMs = -1;
    bool runtimeAvailable = false;
    std::string runtimeVersion;
    bool cowAvailable = false;
    std::string cowSystem;
    std::vector<std::string> pools;
    std::vector<std::pair<std::string, std::string>> datasets;
    std::vector<PathCapacity> paths;
    std::vector<std::string> failedProbes;

    const PathCapacity* FindPath(const std::string& path) const;
    bool Partial() const { return !failedProbes.empty(); }
};

struct VolumePlan {
    VolumeMount mount;
    std::string readPath;
    std::string finalPath;
    std::string stagingPath;
    std::string asidePath;
    std::string sendSnapshot;
    std::string destDataset;
    TransferMethod method = TransferMethod::FILE_SYNC;
};

struct MigrationStep {
    MigrationState state = MigrationState::INITIALIZING;
    std::string message;
    std::string timestamp;
    int progress = 0;
};

struct MigrationJob {
    std::string id;
    std::string unitIdentifier;
    std::string sourceHostRef;
    std::string destHostRef;
    std::string destBasePath;

    std::optional<MigrationUnit> unit;
    std::vector<VolumePlan> volumes;
    std::vector<MigrationStep> steps;

    MigrationState status = MigrationState::INITIALIZING;
    int progress = 0;
    ErrorKind errorKind = ErrorKind::NONE;
    std::string error;
    std::string message;

    std::optional<SnapshotRecord> snapshot;
    // Keyed by volume source path. Job records persist manifests by aggregate
    // hash only; the JobStore keeps their content.
    std::map<std::string, ChecksumManifest> manifests;
    std::map<std::string, TransferCheckpoint> checkpoints;

    bool workloadStopped = false;
    bool destinationWrites = false;
    bool resumable = false;
    bool verified = false;

    std::string createdAt;
    std::string startedAt;
    std::string endedAt;

    std::string PairKey() const;
};

std::string CurrentTimestamp();
std::string TimestampAfter(long long seconds);
// ISO-8601 UTC instant with optional fractional seconds and a Z or +HH:MM suffix.
std::optional<std::time_t> ParseTimestamp(const std::string& timestamp);
// Missing or malformed timestamps count as passed.
bool TimestampPassed(const std::string& timestamp);

void to_json(nlohmann::json& json, const VolumeMount& value);
void from_json(const nlohmann::json& json, VolumeMount& value);
void to_json(nlohmann::json& json, const ContainerSpec& value);
void from_json(const nlohmann::json& json, ContainerSpec& value);
void to_json(nlohmann::json& json, const MigrationUnit& value);
void from_json(const nlohmann::json& json, MigrationUnit& value);
void to_json(nlohmann::json& json, const SnapshotEntry& value);
void from_json(const nlohmann::json& json, SnapshotEntry& value);
void to_json(nlohmann::json& json, const SnapshotRecord& value);
void from_json(const nlohmann::json& json, SnapshotRecord& value);
void to_json(nlohmann::json& json, const ChecksumManifest& value);
void from_json(const nlohmann::json& json, ChecksumManifest& value);
void to_json(nlohmann::json& json, const TransferCheckpoint& value);
void from_json(const nlohmann::json& json, TransferCheckpoint& value);
void to_json(nlohmann::json& json, const HostCapabilities& value);
void to_json(nlohmann::json& json, const VolumePlan& value);
void from_json(const nlohmann::json& json, VolumePlan& value);
void to_json(nlohmann::json& json, const MigrationStep& value);
void from_json(const nlohmann::json& json, MigrationStep& value);
void to_json(nlohmann::json& json, const MigrationJob& value);
void from_json(const nlohmann::json& json, MigrationJob& value);
