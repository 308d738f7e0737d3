#include "MigrationTypes.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace {
const std::pair<MigrationState, const char*> kStateNames[] = {
    {MigrationState::INITIALIZING, "initializing"},
    {MigrationState::VALIDATING, "validating"},
    {MigrationState::DISCOVERING, "discovering"},
    {MigrationState::SNAPSHOTTING, "snapshotting"},
    {MigrationState::CHECKSUMMING, "checksumming"},
    {MigrationState::TRANSFERRING, "transferring"},
    {MigrationState::VERIFYING, "verifying"},
    {MigrationState::CUTOVER, "cutover"},
    {MigrationState::CLEANING, "cleaning"},
    {MigrationState::COMPLETED, "completed"},
    {MigrationState::FAILED, "failed"},
    {MigrationState::CANCELLED, "cancelled"},
    {MigrationState::ROLLBACK_FAILED, "rollback_failed"},
};

constexpr const char* kTimestampFormat = "%Y-%m-%dT%H:%M:%SZ";

std::string FormatUtc(std::time_t value) {
    std::tm utcTime = {};
    gmtime_r(&value, &utcTime);

    std::ostringstream output;
    output << std::put_time(&utcTime, kTimestampFormat);
    return output.str();
}

const char* SnapshotMethodName(SnapshotMethod method) {
    return method == SnapshotMethod::COW_SNAPSHOT ? "cow-snapshot" : "directory-copy";
}

SnapshotMethod SnapshotMethodFromName(const std::string& name) {
    return name == "cow-snapshot" ? SnapshotMethod::COW_SNAPSHOT : SnapshotMethod::DIRECTORY_COPY;
}
} // namespace

std::string MigrationStateName(MigrationState state) {
    for (const auto& [value, name] : kStateNames) {
        if (value == state) {
            return name;
        }
    }
    return "unknown";
}

MigrationState MigrationStateFromName(const std::string& name) {
    for (const auto& [value, text] : kStateNames) {
        if (name == text) {
            return value;
        }
    }
    return MigrationState::FAILED;
}

bool IsTerminal(MigrationState state) {
    return state == MigrationState::COMPLETED
        || state == MigrationState::FAILED
        || state == MigrationState::CANCELLED
        || state == MigrationState::ROLLBACK_FAILED;
}

int StateProgress(MigrationState state) {
    switch (state) {
    case MigrationState::INITIALIZING:
        return 0;
    case MigrationState::VALIDATING:
        return 5;
    case MigrationState::DISCOVERING:
        return 10;
    case MigrationState::SNAPSHOTTING:
        return 20;
    case MigrationState::CHECKSUMMING:
        return 30;
    case MigrationState::TRANSFERRING:
        return 40;
    case MigrationState::VERIFYING:
        return 85;
    case MigrationState::CUTOVER:
        return 92;
    case MigrationState::CLEANING:
        return 97;
    case MigrationState::COMPLETED:
        return 100;
    default:
        return 0;
    }
}

std::string MigrationUnit::Name() const {
    if (const auto* project = std::get_if<ComposeProject>(&kind)) {
        return project->name;
    }
    return std::get<ContainerSet>(kind).selector;
}

const std::vector<ContainerSpec>& MigrationUnit::Containers() const {
    if (const auto* project = std::get_if<ComposeProject>(&kind)) {
        return project->containers;
    }
    return std::get<ContainerSet>(kind).containers;
}

const SnapshotEntry* SnapshotRecord::Find(const std::string& sourcePath) const {
    for (const auto& entry : entries) {
        if (entry.sourcePath == sourcePath) {
            return &entry;
        }
    }
    return nullptr;
}

unsigned long long ChecksumManifest::UnreadableCount() const {
    unsigned long long count = 0;
    for (const auto& [path, hash] : entries) {
        if (hash == kUnreadableHash) {
            ++count;
        }
    }
    return count;
}

std::string TransferMethodName(TransferMethod method) {
    return method == TransferMethod::BLOCK_CLONE ? "block-clone" : "file-sync";
}

TransferMethod TransferMethodFromName(const std::string& name) {
    return name == "block-clone" ? TransferMethod::BLOCK_CLONE : TransferMethod::FILE_SYNC;
}

const PathCapacity* HostCapabilities::FindPath(const std::string& path) const {
    for (const auto& capacity : paths) {
        if (capacity.path == path) {
            return &capacity;
        }
    }
    return nullptr;
}

std::string MigrationJob::PairKey() const {
    const std::string unitName = unit ? unit->Name() : unitIdentifier;
    return sourceHostRef + ":" + unitName + "->" + destHostRef;
}

std::string CurrentTimestamp() {
    return FormatUtc(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string TimestampAfter(long long seconds) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return FormatUtc(now + static_cast<std::time_t>(seconds));
}

std::optional<std::time_t> ParseTimestamp(const std::string& timestamp) {
    std::tm tm = {};
    std::istringstream stream(timestamp);
    stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(stream, rest);
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])) != 0) {
            ++pos;
        }
    }

    const std::string zone = rest.substr(pos);
    long offsetSeconds = 0;
    if (!zone.empty() && zone != "Z") {
        const bool shaped = zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':'
            && std::isdigit(static_cast<unsigned char>(zone[1])) != 0 && std::isdigit(static_cast<unsigned char>(zone[2])) != 0
            && std::isdigit(static_cast<unsigned char>(zone[4])) != 0 && std::isdigit(static_cast<unsigned char>(zone[5])) != 0;
        if (!shaped) {
            return std::nullopt;
        }
        const long hours = std::stol(zone.substr(1, 2));
        const long minutes = std::stol(zone.substr(4, 2));
        offsetSeconds = (hours * 3600 + minutes * 60) * (zone[0] == '+' ? 1 : -1);
    }

    return timegm(&tm) - static_cast<std::time_t>(offsetSeconds);
}

bool TimestampPassed(const std::string& timestamp) {
    const auto parsed = ParseTimestamp(timestamp);
    return !parsed || *parsed <= std::time(nullptr);
}

void to_json(nlohmann::json& json, const VolumeMount& value) {
    json = {
        {"source", value.source},
        {"destination", value.destination},
        {"readOnly", value.readOnly}
    };
}

void from_json(const nlohmann::json& json, VolumeMount& value) {
    value.source = json.value("source", "");
    value.destination = json.value("destination", "");
    value.readOnly = json.value("readOnly", false);
}

void to_json(nlohmann::json& json, const ContainerSpec& value) {
    json = {
        {"id", value.id},
        {"name", value.name},
        {"image", value.image},
        {"service", value.service},
        {"networks", value.networks},
        {"environment", value.environment},
        {"mounts", value.mounts}
    };
}

void from_json(const nlohmann::json& json, ContainerSpec& value) {
    value.id = json.value("id", "");
    value.name = json.value("name", "");
    value.image = json.value("image", "");
    value.service = json.value("service", "");
    value.networks = json.value("networks", std::vector<std::string>{});
    value.environment = json.value("environment", std::vector<std::string>{});
    value.mounts = json.value("mounts", std::vector<VolumeMount>{});
}

void to_json(nlohmann::json& json, const MigrationUnit& value) {
    json = {
        {"volumes", value.volumes},
        {"networks", value.networks}
    };

    if (const auto* project = std::get_if<ComposeProject>(&value.kind)) {
        json["type"] = "compose-project";
        json["name"] = project->name;
        json["workingDir"] = project->workingDir;
        json["composeFile"] = project->composeFile;
        json["containers"] = project->containers;
    } else {
        const auto& set = std::get<ContainerSet>(value.kind);
        json["type"] = "container-set";
        json["name"] = set.selector;
        json["containers"] = set.containers;
    }
}

void from_json(const nlohmann::json& json, MigrationUnit& value) {
    value.volumes = json.value("volumes", std::vector<VolumeMount>{});
    value.networks = json.value("networks", std::vector<std::string>{});

    if (json.value("type", "") == "compose-project") {
        ComposeProject project;
        project.name = json.value("name", "");
        project.workingDir = json.value("workingDir", "");
        project.composeFile = json.value("composeFile", "");
        project.containers = json.value("containers", std::vector<ContainerSpec>{});
        value.kind = std::move(project);
    } else {
        ContainerSet set;
        set.selector = json.value("name", "");
        set.containers = json.value("containers", std::vector<ContainerSpec>{});
        value.kind = std::move(set);
    }
}

void to_json(nlohmann::json& json, const SnapshotEntry& value) {
    json = {
        {"sourcePath", value.sourcePath},
        {"method", SnapshotMethodName(value.method)},
        {"dataset", value.dataset},
        {"snapshotName", value.snapshotName},
        {"backupPath", value.backupPath},
        {"readPath", value.readPath},
        {"rollbackCommand", value.rollbackCommand},
        {"createdAt", value.createdAt},
        {"sizeBytes", value.sizeBytes}
    };
}

void from_json(const nlohmann::json& json, SnapshotEntry& value) {
    value.sourcePath = json.value("sourcePath", "");
    value.method = SnapshotMethodFromName(json.value("method", ""));
    value.dataset = json.value("dataset", "");
    value.snapshotName = json.value("snapshotName", "");
    value.backupPath = json.value("backupPath", "");
    value.readPath = json.value("readPath", "");
    value.rollbackCommand = json.value("rollbackCommand", "");
    value.createdAt = json.value("createdAt", "");
    value.sizeBytes = json.value("sizeBytes", 0LL);
}

void to_json(nlohmann::json& json, const SnapshotRecord& value) {
    json = {
        {"id", value.id},
        {"hostId", value.hostId},
        {"createdAt", value.createdAt},
        {"entries", value.entries},
        {"released", value.released},
        {"retained", value.retained},
        {"retainUntil", value.retainUntil}
    };
}

void from_json(const nlohmann::json& json, SnapshotRecord& value) {
    value.id = json.value("id", "");
    value.hostId = json.value("hostId", "");
    value.createdAt = json.value("createdAt", "");
    value.entries = json.value("entries", std::vector<SnapshotEntry>{});
    value.released = json.value("released", false);
    value.retained = json.value("retained", false);
    value.retainUntil = json.value("retainUntil", "");
}

void to_json(nlohmann::json& json, const ChecksumManifest& value) {
    json = {
        {"root", value.root},
        {"entries", value.entries},
        {"aggregate", value.aggregate},
        {"generatedAt", value.generatedAt}
    };
}

void from_json(const nlohmann::json& json, ChecksumManifest& value) {
    value.root = json.value("root", "");
    value.entries = json.value("entries", std::map<std::string, std::string>{});
    value.aggregate = json.value("aggregate", "");
    value.generatedAt = json.value("generatedAt", "");
}

void to_json(nlohmann::json& json, const TransferCheckpoint& value) {
    json = {
        {"volumeSource", value.volumeSource},
        {"method", TransferMethodName(value.method)},
        {"fileCursor", value.fileCursor},
        {"confirmedBytes", value.confirmedBytes},
        {"partialFile", value.partialFile},
        {"stagingPath", value.stagingPath},
        {"finalPath", value.finalPath},
        {"resumeToken", value.resumeToken},
        {"movedAsidePath", value.movedAsidePath},
        {"dryRunDone", value.dryRunDone},
        {"staged", value.staged},
        {"committed", value.committed}
    };
}

void from_json(const nlohmann::json& json, TransferCheckpoint& value) {
    value.volumeSource = json.value("volumeSource", "");
    value.method = TransferMethodFromName(json.value("method", ""));
    value.fileCursor = json.value("fileCursor", static_cast<size_t>(0));
    value.confirmedBytes = json.value("confirmedBytes", 0ULL);
    value.partialFile = json.value("partialFile", "");
    value.stagingPath = json.value("stagingPath", "");
    value.finalPath = json.value("finalPath", "");
    value.resumeToken = json.value("resumeToken", "");
    value.movedAsidePath = json.value("movedAsidePath", "");
    value.dryRunDone = json.value("dryRunDone", false);
    value.staged = json.value("staged", false);
    value.committed = json.value("committed", false);
}

void to_json(nlohmann::json& json, const HostCapabilities& value) {
    nlohmann::json paths = nlohmann::json::array();
    for (const auto& capacity : value.paths) {
        paths.push_back({
            {"path", capacity.path},
            {"exists", capacity.exists},
            {"writable", capacity.writable},
            {"freeBytes", capacity.freeBytes}
        });
    }

    json = {
        {"hostId", value.hostId},
        {"reachable", value.reachable},
        {"latencyMs", value.latencyMs},
        {"runtimeAvailable", value.runtimeAvailable},
        {"runtimeVersion", value.runtimeVersion},
        {"cowAvailable", value.cowAvailable},
        {"cowSystem", value.cowSystem},
        {"pools", value.pools},
        {"paths", paths},
        {"failedProbes", value.failedProbes}
    };
}

void to_json(nlohmann::json& json, const VolumePlan& value) {
    json = {
        {"mount", value.mount},
        {"readPath", value.readPath},
        {"finalPath", value.finalPath},
        {"stagingPath", value.stagingPath},
        {"asidePath", value.asidePath},
        {"sendSnapshot", value.sendSnapshot},
        {"destDataset", value.destDataset},
        {"method", TransferMethodName(value.method)}
    };
}

void from_json(const nlohmann::json& json, VolumePlan& value) {
    if (json.contains("mount")) {
        value.mount = json["mount"].get<VolumeMount>();
    }
    value.readPath = json.value("readPath", "");
    value.finalPath = json.value("finalPath", "");
    value.stagingPath = json.value("stagingPath", "");
    value.asidePath = json.value("asidePath", "");
    value.sendSnapshot = json.value("sendSnapshot", "");
    value.destDataset = json.value("destDataset", "");
    value.method = TransferMethodFromName(json.value("method", ""));
}

void to_json(nlohmann::json& json, const MigrationStep& value) {
    json = {
        {"state", MigrationStateName(value.state)},
        {"message", value.message},
        {"timestamp", value.timestamp},
        {"progress", value.progress}
    };
}

void from_json(const nlohmann::json& json, MigrationStep& value) {
    value.state = MigrationStateFromName(json.value("state", ""));
    value.message = json.value("message", "");
    value.timestamp = json.value("timestamp", "");
    value.progress = json.value("progress", 0);
}

void to_json(nlohmann::json& json, const MigrationJob& value) {
    nlohmann::json manifestRefs = nlohmann::json::object();
    for (const auto& [source, manifest] : value.manifests) {
        manifestRefs[source] = {
            {"root", manifest.root},
            {"aggregate", manifest.aggregate},
            {"entryCount", manifest.entries.size()}
        };
    }

    nlohmann::json checkpoints = nlohmann::json::array();
    for (const auto& [source, checkpoint] : value.checkpoints) {
        checkpoints.push_back(checkpoint);
    }

    json = {
        {"id", value.id},
        {"unitIdentifier", value.unitIdentifier},
        {"sourceHostRef", value.sourceHostRef},
        {"destHostRef", value.destHostRef},
        {"destBasePath", value.destBasePath},
        {"volumes", value.volumes},
        {"steps", value.steps},
        {"status", MigrationStateName(value.status)},
        {"progress", value.progress},
        {"errorKind", ErrorKindName(value.errorKind)},
        {"error", value.error},
        {"message", value.message},
        {"manifests", manifestRefs},
        {"checkpoints", checkpoints},
        {"workloadStopped", value.workloadStopped},
        {"destinationWrites", value.destinationWrites},
        {"resumable", value.resumable},
        {"verified", value.verified},
        {"createdAt", value.createdAt},
        {"startedAt", value.startedAt},
        {"endedAt", value.endedAt}
    };

    json["unit"] = value.unit ? nlohmann::json(*value.unit) : nlohmann::json(nullptr);
    json["snapshot"] = value.snapshot ? nlohmann::json(*value.snapshot) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& json, MigrationJob& value) {
    value.id = json.value("id", "");
    value.unitIdentifier = json.value("unitIdentifier", "");
    value.sourceHostRef = json.value("sourceHostRef", "");
    value.destHostRef = json.value("destHostRef", "");
    value.destBasePath = json.value("destBasePath", "");
    value.volumes = json.value("volumes", std::vector<VolumePlan>{});
    value.steps = json.value("steps", std::vector<MigrationStep>{});
    value.status = MigrationStateFromName(json.value("status", ""));
    value.progress = json.value("progress", 0);
    value.errorKind = ErrorKindFromName(json.value("errorKind", ""));
    value.error = json.value("error", "");
    value.message = json.value("message", "");
    value.workloadStopped = json.value("workloadStopped", false);
    value.destinationWrites = json.value("destinationWrites", false);
    value.resumable = json.value("resumable", false);
    value.verified = json.value("verified", false);
    value.createdAt = json.value("createdAt", "");
    value.startedAt = json.value("startedAt", "");
    value.endedAt = json.value("endedAt", "");

    value.unit.reset();
    if (json.contains("unit") && json["unit"].is_object()) {
        value.unit = json["unit"].get<MigrationUnit>();
    }

    value.snapshot.reset();
    if (json.contains("snapshot") && json["snapshot"].is_object()) {
        value.snapshot = json["snapshot"].get<SnapshotRecord>();
    }

    value.manifests.clear();
    if (json.contains("manifests") && json["manifests"].is_object()) {
        for (const auto& [source, ref] : json["manifests"].items()) {
            ChecksumManifest manifest;
            manifest.root = ref.value("root", "");
            manifest.aggregate = ref.value("aggregate", "");
            value.manifests[source] = std::move(manifest);
        }
    }

    value.checkpoints.clear();
    if (json.contains("checkpoints") && json["checkpoints"].is_array()) {
        for (const auto& item : json["checkpoints"]) {
            auto checkpoint = item.get<TransferCheckpoint>();
            value.checkpoints[checkpoint.volumeSource] = std::move(checkpoint);
        }
    }
}
