#include "MigrationStateMachine.hpp"

#include "Tracing.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>

namespace {
std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::ostringstream out;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string StripTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string Basename(const std::string& path) {
    const std::string trimmed = StripTrailingSlash(path);
    const auto slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

bool IsWithin(const std::string& path, const std::string& root) {
    const std::string a = StripTrailingSlash(path);
    const std::string b = StripTrailingSlash(root);
    if (b == "/") {
        return true;
    }
    return a == b || a.rfind(b + "/", 0) == 0;
}

bool HasControlCharacters(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

void ValidateHostRef(const std::string& field, const std::string& value) {
    if (value.empty() || value.size() > 64) {
        throw ValidationError(field + " must be 1-64 characters");
    }
    for (const unsigned char c : value) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-') {
            throw ValidationError(field + " contains an invalid character: " + value);
        }
    }
}

void ValidateRequest(
    const std::string& unitIdentifier,
    const std::string& sourceHostRef,
    const std::string& destHostRef,
    const std::string& destBasePath) {
    if (unitIdentifier.empty() || unitIdentifier.size() > 255 || HasControlCharacters(unitIdentifier)) {
        throw ValidationError("Unit identifier must be 1-255 printable characters");
    }
    ValidateHostRef("Source host", sourceHostRef);
    ValidateHostRef("Destination host", destHostRef);

    if (destBasePath.empty() || destBasePath.front() != '/' || HasControlCharacters(destBasePath)) {
        throw ValidationError("Destination path must be absolute: " + destBasePath);
    }
    if (StripTrailingSlash(destBasePath) == "/") {
        throw ValidationError("Destination path must not be the filesystem root");
    }
    std::istringstream segments(destBasePath);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "..") {
            throw ValidationError("Destination path must not contain '..': " + destBasePath);
        }
    }
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::ostringstream out;
    for (size_t i = 0; i < names.size(); ++i) {
        out << (i == 0 ? "" : ", ") << names[i];
    }
    return out.str();
}

std::vector<std::string> SourcePaths(const std::vector<VolumePlan>& plans) {
    std::vector<std::string> paths;
    paths.reserve(plans.size());
    for (const auto& plan : plans) {
        paths.push_back(plan.mount.source);
    }
    return paths;
}
} // namespace

class MigrationStateMachine::AdmissionSlot {
public:
    AdmissionSlot(MigrationStateMachine& owner, const JobContext& ctx)
        : owner_(owner) {
        std::unique_lock<std::mutex> lock(owner_.mutex_);
        const size_t limit = std::max<size_t>(1, owner_.settings_.maxActiveTransfers);
        if (owner_.activeTransfers_ >= limit) {
            std::cout << "[Migration] " << ctx.job.id << " waiting for a transfer slot ("
                      << owner_.activeTransfers_ << "/" << limit << " busy)" << std::endl;
        }
        owner_.admission_.wait(lock, [&] {
            return owner_.activeTransfers_ < limit || ctx.cancelRequested.load();
        });
        if (ctx.cancelRequested.load()) {
            throw CancelledError("Cancelled while waiting for a transfer slot");
        }
        ++owner_.activeTransfers_;
    }

    ~AdmissionSlot() {
        {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            --owner_.activeTransfers_;
        }
        owner_.admission_.notify_all();
    }

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

private:
    MigrationStateMachine& owner_;
};

MigrationStateMachine::MigrationStateMachine(MigrationSettings settings, MigrationServices services)
    : settings_(std::move(settings)),
      services_(std::move(services)),
      prober_(settings_.sshTimeout),
      discovery_(settings_.commandTimeout),
      snapshots_(settings_.commandTimeout, settings_.snapshotRetention),
      checksums_(settings_.transferTimeout),
      verifier_(checksums_) {
    if (!services_.store || !services_.credentials || !services_.workloads) {
        throw std::invalid_argument("MigrationStateMachine requires a job store, credentials and a workload controller");
    }
}

MigrationStateMachine::~MigrationStateMachine() {
    std::vector<std::shared_ptr<JobContext>> contexts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : jobs_) {
            entry.second->cancelRequested = true;
            contexts.push_back(entry.second);
        }
    }
    admission_.notify_all();
    for (auto& ctx : contexts) {
        if (ctx->worker.joinable()) {
            ctx->worker.join();
        }
    }
}

std::string MigrationStateMachine::StartMigration(
    const std::string& unitIdentifier,
    const std::string& sourceHostRef,
    const std::string& destHostRef,
    const std::string& destBasePath) {
    ValidateRequest(unitIdentifier, sourceHostRef, destHostRef, destBasePath);

    MigrationJob job;
    job.unitIdentifier = unitIdentifier;
    job.sourceHostRef = sourceHostRef;
    job.destHostRef = destHostRef;
    job.destBasePath = StripTrailingSlash(destBasePath);

    const Hosts hosts = ConnectHosts(job);
    const auto units = discovery_.Resolve(unitIdentifier, *hosts.source);
    if (units.size() > 1) {
        std::vector<std::string> names;
        for (const auto& unit : units) {
            names.push_back(unit.Name());
        }
        throw AmbiguousUnitError("'" + unitIdentifier + "' matches " + std::to_string(units.size()) + " units: " + JoinNames(names), names);
    }
    job.unit = units.front();

    if (hosts.source->HostId() == hosts.destination->HostId()) {
        for (const auto& volume : job.unit->volumes) {
            if (IsWithin(job.destBasePath, volume.source) || IsWithin(volume.source, job.destBasePath)) {
                throw ValidationError("Destination path " + job.destBasePath + " overlaps source volume " + volume.source);
            }
        }
    }

    auto ctx = std::make_shared<JobContext>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string owner;
        if (PairBusyLocked(job.PairKey(), owner)) {
            throw ValidationError("A migration of " + job.unit->Name() + " from " + sourceHostRef + " to " + destHostRef
                                  + " is already active: job " + owner);
        }

        job.id = NewJobIdLocked();
        job.createdAt = CurrentTimestamp();
        job.startedAt = job.createdAt;
        job.message = "Migration of " + job.unit->Name() + " queued";
        job.steps.push_back({MigrationState::INITIALIZING, job.message, job.createdAt, 0});

        ctx->job = job;
        ctx->running = true;
        SaveLocked(ctx->job);
        jobs_[job.id] = ctx;
        ctx->worker = std::thread(&MigrationStateMachine::RunPipeline, this, ctx, false);
    }

    std::cout << "[Migration] Job " << job.id << " started for " << job.unit->Name()
              << " (" << sourceHostRef << " -> " << destHostRef << ":" << job.destBasePath << ")" << std::endl;
    Publish(job);
    return job.id;
}

std::optional<MigrationJob> MigrationStateMachine::GetStatus(const std::string& jobId) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(jobId);
        if (it != jobs_.end()) {
            return it->second->job;
        }
    }
    return services_.store->LoadJob(jobId);
}

std::vector<MigrationJob> MigrationStateMachine::ListJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MigrationJob> jobs;
    jobs.reserve(jobs_.size());
    for (const auto& entry : jobs_) {
        jobs.push_back(entry.second->job);
    }
    std::sort(jobs.begin(), jobs.end(), [](const MigrationJob& a, const MigrationJob& b) {
        return a.createdAt < b.createdAt;
    });
    return jobs;
}

void MigrationStateMachine::Cancel(const std::string& jobId, bool skipRollback) {
    const auto ctx = Find(jobId);
    if (!ctx) {
        throw NotFoundError("Unknown job " + jobId);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx->running) {
            ctx->skipRollback = skipRollback;
            ctx->cancelRequested = true;
            std::cout << "[Migration] Cancellation requested for " << jobId << std::endl;
            admission_.notify_all();
            return;
        }
        if (IsTerminal(ctx->job.status) && !Resumable(ctx->job)) {
            throw ValidationError("Job " + jobId + " already " + MigrationStateName(ctx->job.status));
        }
        ctx->skipRollback = skipRollback;
    }

    Abandon(ctx, MigrationState::CANCELLED, "Cancelled by request");
}

void MigrationStateMachine::Resume(const std::string& jobId) {
    const auto ctx = Find(jobId);
    if (!ctx) {
        throw NotFoundError("Unknown job " + jobId);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx->running) {
            throw ValidationError("Job " + jobId + " is still running");
        }
        if (!Resumable(ctx->job)) {
            throw ValidationError("Job " + jobId + " cannot be resumed from " + MigrationStateName(ctx->job.status));
        }
        if (ctx->worker.joinable()) {
            ctx->worker.join();
        }

        auto& job = ctx->job;
        job.resumable = false;
        job.error.clear();
        job.errorKind = ErrorKind::NONE;
        job.endedAt.clear();
        job.message = "Resuming transfer from checkpoint";
        job.steps.push_back({job.status, job.message, CurrentTimestamp(), job.progress});
        SaveLocked(job);

        ctx->cancelRequested = false;
        ctx->skipRollback = false;
        ctx->running = true;
        ctx->worker = std::thread(&MigrationStateMachine::RunPipeline, this, ctx, true);
    }
    std::cout << "[Migration] Resuming job " << jobId << std::endl;
}

void MigrationStateMachine::Cleanup(const std::string& jobId) {
    const auto ctx = Find(jobId);
    if (!ctx) {
        throw NotFoundError("Unknown job " + jobId);
    }

    bool abandon = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx->running) {
            throw ValidationError("Job " + jobId + " is running; cancel it before cleanup");
        }
        abandon = !IsTerminal(ctx->job.status) || Resumable(ctx->job);
    }
    if (abandon) {
        Abandon(ctx, MigrationState::CANCELLED, "Abandoned by cleanup");
    }

    std::optional<SnapshotRecord> snapshot;
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx->job;
        snapshot = ctx->job.snapshot;
    }

    if (snapshot && (!snapshot->released || snapshot->retained)) {
        const Hosts hosts = ConnectHosts(job);
        if (!snapshots_.Discard(*snapshot, *hosts.source)) {
            throw SnapshotError("Could not destroy rollback point " + snapshot->id + "; job " + jobId + " kept");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ctx->job.snapshot = snapshot;
        SaveLocked(ctx->job);
    }

    if (ctx->worker.joinable()) {
        ctx->worker.join();
    }
    if (!services_.store->RemoveJob(jobId)) {
        std::cerr << "[Migration] Failed to remove persisted state of " << jobId << std::endl;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.erase(jobId);
    }
    std::cout << "[Migration] Cleaned up job " << jobId << std::endl;
}

size_t MigrationStateMachine::PruneExpired() {
    std::vector<std::shared_ptr<JobContext>> contexts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : jobs_) {
            const auto& job = entry.second->job;
            if (!entry.second->running && job.snapshot && job.snapshot->retained && TimestampPassed(job.snapshot->retainUntil)) {
                contexts.push_back(entry.second);
            }
        }
    }

    size_t pruned = 0;
    for (const auto& ctx : contexts) {
        MigrationJob job;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            job = ctx->job;
        }
        try {
            const Hosts hosts = ConnectHosts(job);
            SnapshotRecord record = *job.snapshot;
            if (!snapshots_.PruneExpired(record, *hosts.source)) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            ctx->job.snapshot = record;
            SaveLocked(ctx->job);
            ++pruned;
        } catch (const MigrationError& ex) {
            std::cerr << "[Migration] Could not prune rollback point of " << job.id << ": " << ex.what() << std::endl;
        }
    }
    return pruned;
}

size_t MigrationStateMachine::RecoverJobs() {
    size_t recovered = 0;
    for (const auto& id : services_.store->ListJobs()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (jobs_.count(id) != 0) {
                continue;
            }
        }
        auto job = services_.store->LoadJob(id);
        if (!job) {
            std::cerr << "[Migration] Skipping unreadable job record " << id << std::endl;
            continue;
        }

        auto ctx = std::make_shared<JobContext>();
        ctx->job = std::move(*job);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!IsTerminal(ctx->job.status)) {
            ctx->job.message = "Interrupted in " + MigrationStateName(ctx->job.status) + "; resume, cancel or clean up";
            ctx->job.steps.push_back({ctx->job.status, ctx->job.message, CurrentTimestamp(), ctx->job.progress});
            SaveLocked(ctx->job);
            std::cout << "[Migration] Recovered interrupted job " << id << " (" << MigrationStateName(ctx->job.status) << ")" << std::endl;
        }
        jobs_[id] = ctx;
        ++recovered;
    }
    return recovered;
}

bool MigrationStateMachine::Wait(const std::string& jobId, std::chrono::milliseconds timeout) const {
    const auto ctx = Find(jobId);
    if (!ctx) {
        return true;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, timeout, [&] { return !ctx->running; });
}

std::string MigrationStateMachine::BuildSizeCommand(const std::vector<std::string>& paths) {
    std::string command = "du -sbc";
    for (const auto& path : paths) {
        command += " " + RemoteExecutor::QuoteArgument(path);
    }
    return command + " 2>/dev/null | tail -n 1 | cut -f1";
}

unsigned long long MigrationStateMachine::RequiredBytes(unsigned long long sourceBytes, double margin) {
    return static_cast<unsigned long long>(std::ceil(static_cast<double>(sourceBytes) * (1.0 + std::max(0.0, margin))));
}

std::string MigrationStateMachine::UniqueFinalPath(
    const std::string& destBasePath,
    const std::string& source,
    std::vector<std::string>& used) {
    std::string name = Basename(source);
    if (name.empty() || name == "/") {
        name = "volume";
    }
    const std::string base = StripTrailingSlash(destBasePath);
    const std::string prefix = (base == "/" ? std::string() : base) + "/" + name;

    std::string candidate = prefix;
    for (int suffix = 2; std::find(used.begin(), used.end(), candidate) != used.end(); ++suffix) {
        candidate = prefix + "-" + std::to_string(suffix);
    }
    used.push_back(candidate);
    return candidate;
}

PathRewrites MigrationStateMachine::BuildPathRewrites(const std::vector<VolumePlan>& plans) {
    PathRewrites rewrites;
    for (const auto& plan : plans) {
        rewrites[plan.mount.source] = plan.finalPath;
    }
    return rewrites;
}

void MigrationStateMachine::RunPipeline(std::shared_ptr<JobContext> ctx, bool resume) {
    Hosts hosts;
    ScopedSpan pipelineSpan(resume ? "migration.resume" : "migration.pipeline");
    Tracer::Instance().SetAttribute(pipelineSpan.Handle(), "job.id", ctx->job.id);

    auto step = [&](MigrationState state, const std::string& message, const std::function<void()>& body) {
        Transition(*ctx, state, message);
        ScopedSpan stepSpan("migration." + MigrationStateName(state), &pipelineSpan.Handle());
        Tracer::Instance().SetAttribute(stepSpan.Handle(), "job.id", ctx->job.id);
        Tracer::Instance().SetAttribute(stepSpan.Handle(), "job.state", MigrationStateName(state));
        body();
        stepSpan.MarkSuccess();
    };

    try {
        MigrationJob snapshotOfJob;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshotOfJob = ctx->job;
        }
        hosts = ConnectHosts(snapshotOfJob);

        if (!resume) {
            HostCapabilities sourceCaps;
            HostCapabilities destCaps;
            step(MigrationState::VALIDATING, "Probing hosts and checking capacity", [&] {
                Validate(*ctx, hosts, sourceCaps, destCaps);
            });
            ThrowIfCancelled(*ctx);
            step(MigrationState::DISCOVERING, "Planning volume placement", [&] { PlanVolumes(*ctx, hosts); });
            ThrowIfCancelled(*ctx);
            step(MigrationState::SNAPSHOTTING, "Stopping workload and creating rollback point", [&] {
                Snapshot(*ctx, hosts, sourceCaps, destCaps);
            });
            ThrowIfCancelled(*ctx);
            step(MigrationState::CHECKSUMMING, "Hashing source data", [&] { Checksum(*ctx, hosts); });
            ThrowIfCancelled(*ctx);
        } else {
            prober_.Probe(*hosts.source);
            prober_.Probe(*hosts.destination, {snapshotOfJob.destBasePath});
        }

        TransferVolumes(*ctx, hosts);
        ThrowIfCancelled(*ctx);
        step(MigrationState::VERIFYING, "Verifying destination against source manifest", [&] { VerifyVolumes(*ctx, hosts); });
        ThrowIfCancelled(*ctx);

        // No cancellation point past this line: the workload is about to move.
        step(MigrationState::CUTOVER, "Starting workload on destination", [&] { Cutover(*ctx, hosts); });
        step(MigrationState::CLEANING, "Releasing rollback point", [&] { Clean(*ctx, hosts); });
        Transition(*ctx, MigrationState::COMPLETED, "Migration completed");
        pipelineSpan.MarkSuccess();
    } catch (const CancelledError& ex) {
        Fail(*ctx, &hosts, MigrationState::CANCELLED, ErrorKind::CANCELLED, ex.what());
    } catch (const TransferError& ex) {
        if (ex.IsTransient()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ctx->job.errorKind = ErrorKind::TRANSFER;
                ctx->job.error = ex.what();
                ctx->job.resumable = true;
            }
            std::cerr << "[Migration] " << ctx->job.id << " transfer interrupted: " << ex.what() << std::endl;
            Transition(*ctx, MigrationState::FAILED, "Transfer interrupted; rollback point, staging data and checkpoint kept for resume");
        } else {
            Fail(*ctx, &hosts, MigrationState::FAILED, ErrorKind::TRANSFER, ex.what());
        }
    } catch (const MigrationError& ex) {
        Fail(*ctx, &hosts, MigrationState::FAILED, ex.Kind(), ex.what());
    } catch (const std::exception& ex) {
        Fail(*ctx, &hosts, MigrationState::FAILED, ErrorKind::NONE, std::string("Internal error: ") + ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx->job.status != MigrationState::COMPLETED) {
            Tracer::Instance().RecordError(pipelineSpan.Handle(), ErrorKindName(ctx->job.errorKind), ctx->job.error);
        }
        ctx->running = false;
    }
    changed_.notify_all();
}

void MigrationStateMachine::Validate(
    JobContext& ctx,
    const Hosts& hosts,
    HostCapabilities& sourceCaps,
    HostCapabilities& destCaps) {
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx.job;
    }

    sourceCaps = prober_.Probe(*hosts.source);
    destCaps = prober_.Probe(*hosts.destination, {job.destBasePath});

    if (settings_.requireRuntime) {
        if (!sourceCaps.runtimeAvailable) {
            throw CapabilityMismatchError("Container runtime not available on source " + sourceCaps.hostId);
        }
        if (!destCaps.runtimeAvailable) {
            throw CapabilityMismatchError("Container runtime not available on destination " + destCaps.hostId);
        }
    }

    unsigned long long sourceBytes = 0;
    std::vector<std::string> paths;
    for (const auto& volume : job.unit->volumes) {
        paths.push_back(volume.source);
    }
    if (!paths.empty()) {
        const CommandResult size = hosts.source->Run(BuildSizeCommand(paths), settings_.commandTimeout);
        if (size.timedOut || size.exitCode == SshExecutor::kSshConnectionFailure) {
            throw UnreachableError("Sizing source volumes on " + sourceCaps.hostId + " failed: " + Trim(size.output));
        }
        try {
            sourceBytes = std::stoull(Trim(size.output));
        } catch (const std::exception&) {
            throw ValidationError("Could not size source volumes on " + sourceCaps.hostId + ": " + Trim(size.output));
        }
    }

    const PathCapacity* capacity = destCaps.FindPath(job.destBasePath);
    if (capacity == nullptr) {
        throw UnreachableError("Could not inspect " + job.destBasePath + " on " + destCaps.hostId);
    }
    if (!capacity->writable) {
        throw PermissionError(job.destBasePath + " is not writable on " + destCaps.hostId);
    }
    const unsigned long long required = RequiredBytes(sourceBytes, settings_.spaceSafetyMargin);
    if (capacity->freeBytes < required) {
        throw InsufficientSpaceError(
            "Destination " + destCaps.hostId + ":" + job.destBasePath + " has " + std::to_string(capacity->freeBytes)
            + " bytes free, " + std::to_string(required) + " required");
    }

    Note(ctx, "Source data " + std::to_string(sourceBytes) + " bytes, " + std::to_string(required)
                  + " required with margin, " + std::to_string(capacity->freeBytes) + " free on destination");
}

void MigrationStateMachine::PlanVolumes(JobContext& ctx, const Hosts& hosts) {
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx.job;
    }

    std::vector<VolumePlan> plans;
    std::vector<std::string> used;
    for (const auto& volume : job.unit->volumes) {
        const CommandResult kind = hosts.source->Run(
            "[ -d " + RemoteExecutor::QuoteArgument(volume.source) + " ] && echo dir", settings_.commandTimeout);
        if (kind.timedOut || kind.exitCode == SshExecutor::kSshConnectionFailure) {
            throw UnreachableError("Source host stopped responding while inspecting " + volume.source);
        }
        if (Trim(kind.output) != "dir") {
            Note(ctx, "Skipping " + volume.source + ": not a directory");
            continue;
        }

        VolumePlan plan;
        plan.mount = volume;
        plan.readPath = volume.source;
        plan.finalPath = UniqueFinalPath(job.destBasePath, volume.source, used);
        plan.stagingPath = plan.finalPath + ".berth-staging-" + job.id;
        plan.asidePath = plan.finalPath + ".berth-previous-" + job.id;
        plans.push_back(std::move(plan));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.volumes = plans;
        SaveLocked(ctx.job);
    }
    Note(ctx, "Planned " + std::to_string(plans.size()) + " volume(s) under " + job.destBasePath);
}

void MigrationStateMachine::Snapshot(
    JobContext& ctx,
    const Hosts& hosts,
    const HostCapabilities& sourceCaps,
    const HostCapabilities& destCaps) {
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx.job;
    }

    services_.workloads->Stop(*job.unit, *hosts.source);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.workloadStopped = true;
        SaveLocked(ctx.job);
    }

    const SnapshotRecord record = snapshots_.CreateRollbackPoint(job.id, SourcePaths(job.volumes), *hosts.source, sourceCaps);

    std::string destDataset;
    if (destCaps.cowAvailable) {
        const auto dataset = SnapshotManager::FindDataset(job.destBasePath, destCaps.datasets);
        if (dataset) {
            destDataset = dataset->first;
        }
    }

    size_t cloned = 0;
    for (auto& plan : job.volumes) {
        const SnapshotEntry* entry = record.Find(plan.mount.source);
        if (entry == nullptr) {
            throw SnapshotError("Rollback point does not cover " + plan.mount.source);
        }
        plan.readPath = entry->readPath;
        plan.destDataset = destDataset;
        plan.method = TransferOrchestrator::SelectMethod(sourceCaps, destCaps, entry, destDataset, settings_.forceFileSync);
        if (plan.method == TransferMethod::BLOCK_CLONE) {
            plan.sendSnapshot = entry->snapshotName;
            plan.stagingPath = TransferOrchestrator::FinalDataset(plan) + "-berth-staging-" + job.id;
            ++cloned;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.snapshot = record;
        ctx.job.volumes = job.volumes;
        SaveLocked(ctx.job);
    }
    Note(ctx, "Rollback point " + record.id + " taken; " + std::to_string(cloned) + " of "
                  + std::to_string(job.volumes.size()) + " volume(s) use block-clone");
}

void MigrationStateMachine::Checksum(JobContext& ctx, const Hosts& hosts) {
    std::vector<VolumePlan> plans;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        plans = ctx.job.volumes;
    }

    size_t files = 0;
    for (const auto& plan : plans) {
        ThrowIfCancelled(ctx);
        ChecksumManifest manifest = checksums_.Generate(*hosts.source, plan.readPath);
        if (!manifest.Valid()) {
            throw IntegrityError("Could not hash " + plan.mount.source);
        }
        if (manifest.UnreadableCount() > 0) {
            throw TransferError(
                TransferError::Cause::SOURCE_READ,
                std::to_string(manifest.UnreadableCount()) + " file(s) under " + plan.mount.source + " are unreadable");
        }
        files += manifest.entries.size();

        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.manifests[plan.mount.source] = std::move(manifest);
        SaveLocked(ctx.job);
    }
    Note(ctx, "Hashed " + std::to_string(files) + " file(s)");
}

void MigrationStateMachine::TransferVolumes(JobContext& ctx, const Hosts& hosts) {
    std::vector<VolumePlan> plans;
    std::map<std::string, ChecksumManifest> manifests;
    std::map<std::string, TransferCheckpoint> checkpoints;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ctx.job.snapshot) {
            throw SnapshotError("No rollback point recorded; refusing to transfer");
        }
        for (const auto& plan : ctx.job.volumes) {
            if (!ctx.job.snapshot->Covers(plan.mount.source)) {
                throw SnapshotError("Rollback point does not cover " + plan.mount.source);
            }
            const auto manifest = ctx.job.manifests.find(plan.mount.source);
            if (manifest == ctx.job.manifests.end() || !manifest->second.Valid()) {
                throw IntegrityError("No source manifest for " + plan.mount.source);
            }
        }
        plans = ctx.job.volumes;
        manifests = ctx.job.manifests;
        checkpoints = ctx.job.checkpoints;
    }

    AdmissionSlot slot(*this, ctx);
    Transition(ctx, MigrationState::TRANSFERRING, "Transferring " + std::to_string(plans.size()) + " volume(s)");

    size_t totalFiles = 0;
    for (const auto& entry : manifests) {
        totalFiles += entry.second.entries.size();
    }

    const auto primitive = MakePrimitive(*hosts.source, *hosts.destination);
    RetryPolicy retry(settings_.retryAttempts, settings_.retryBaseDelay, settings_.retryMaxDelay, services_.sleeper);
    TransferOrchestrator orchestrator(
        *hosts.source,
        *hosts.destination,
        *primitive,
        retry,
        settings_.commandTimeout,
        settings_.transferTimeout,
        settings_.transferWorkers);

    TransferOrchestrator::Hooks hooks;
    hooks.cancelled = [&ctx] { return ctx.cancelRequested.load(); };
    hooks.onCheckpoint = [&](const TransferCheckpoint& checkpoint) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = ctx.job;
        job.checkpoints[checkpoint.volumeSource] = checkpoint;
        if (checkpoint.staged) {
            job.destinationWrites = true;
        }
        if (totalFiles > 0) {
            size_t confirmed = 0;
            for (const auto& entry : job.checkpoints) {
                confirmed += entry.second.fileCursor;
            }
            const int progress = StateProgress(MigrationState::TRANSFERRING)
                                 + static_cast<int>(40 * std::min(confirmed, totalFiles) / totalFiles);
            job.progress = std::max(job.progress, progress);
        }
        SaveLocked(job);
    };

    const auto results = orchestrator.TransferAll(plans, manifests, checkpoints, hooks);

    size_t files = 0;
    size_t skipped = 0;
    unsigned long long bytes = 0;
    for (const auto& result : results) {
        files += result.filesTransferred;
        skipped += result.filesSkipped;
        bytes += result.bytesTransferred;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.checkpoints = checkpoints;
        SaveLocked(ctx.job);
    }
    Note(ctx, "Transferred " + std::to_string(files) + " file(s), " + std::to_string(bytes) + " bytes; "
                  + std::to_string(skipped) + " already confirmed");
}

void MigrationStateMachine::VerifyVolumes(JobContext& ctx, const Hosts& hosts) {
    std::vector<VolumePlan> plans;
    std::map<std::string, ChecksumManifest> manifests;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        plans = ctx.job.volumes;
        manifests = ctx.job.manifests;
    }

    for (const auto& plan : plans) {
        ThrowIfCancelled(ctx);
        const VerificationResult result = verifier_.Verify(manifests.at(plan.mount.source), plan.finalPath, *hosts.destination);
        if (!result.Verified()) {
            throw IntegrityError("Verification of " + plan.finalPath + " failed: " + result.Summary());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.verified = true;
        SaveLocked(ctx.job);
    }
    Note(ctx, "Verified " + std::to_string(plans.size()) + " volume(s)");
}

void MigrationStateMachine::Cutover(JobContext& ctx, const Hosts& hosts) {
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx.job;
    }
    services_.workloads->Start(*job.unit, BuildPathRewrites(job.volumes), *hosts.destination);
}

void MigrationStateMachine::Clean(JobContext& ctx, const Hosts& hosts) {
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx.job;
    }

    if (job.snapshot) {
        try {
            snapshots_.Release(*job.snapshot, *hosts.source);
        } catch (const SnapshotError& ex) {
            Note(ctx, std::string("Rollback point left in place: ") + ex.what());
        }
    }

    std::vector<std::string> aside;
    for (const auto& entry : job.checkpoints) {
        if (!entry.second.movedAsidePath.empty()) {
            aside.push_back(entry.second.movedAsidePath);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.snapshot = job.snapshot;
        ctx.job.checkpoints.clear();
        ctx.job.resumable = false;
        SaveLocked(ctx.job);
    }
    if (!aside.empty()) {
        Note(ctx, "Previous destination content kept at " + JoinNames(aside));
    }
}

void MigrationStateMachine::Fail(
    JobContext& ctx,
    const Hosts* hosts,
    MigrationState terminal,
    ErrorKind kind,
    const std::string& message) {
    std::cerr << "[Migration] " << ctx.job.id << " " << MigrationStateName(terminal) << ": " << message << std::endl;

    bool needsRollback = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        needsRollback = ctx.job.snapshot || ctx.job.workloadStopped || !ctx.job.checkpoints.empty();
    }

    std::vector<std::string> errors;
    if (hosts != nullptr && hosts->source && hosts->destination) {
        errors = RollbackAll(ctx, *hosts);
    } else if (needsRollback) {
        errors.push_back("hosts unavailable for rollback");
    }

    std::string summary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = ctx.job;
        job.resumable = false;
        if (!errors.empty()) {
            terminal = MigrationState::ROLLBACK_FAILED;
            job.errorKind = ErrorKind::ROLLBACK_FAILED;
            job.error = message + "; rollback failed: " + JoinNames(errors);
            summary = "Rollback failed; manual recovery required";
        } else if (terminal == MigrationState::CANCELLED) {
            job.errorKind = ErrorKind::CANCELLED;
            job.error = message;
            summary = job.destinationWrites ? "Cancelled; rollback completed" : "Cancelled; no destination writes occurred";
        } else {
            job.errorKind = kind;
            job.error = message;
            summary = needsRollback ? message + "; rolled back" : message;
        }
    }
    Transition(ctx, terminal, summary);
}

std::vector<std::string> MigrationStateMachine::RollbackAll(JobContext& ctx, const Hosts& hosts) {
    MigrationJob job;
    bool skipRollback = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = ctx.job;
        skipRollback = ctx.skipRollback;
    }

    std::vector<std::string> errors;
    if (!job.checkpoints.empty()) {
        const auto primitive = MakePrimitive(*hosts.source, *hosts.destination);
        TransferOrchestrator orchestrator(
            *hosts.source,
            *hosts.destination,
            *primitive,
            RetryPolicy(1, std::chrono::milliseconds(0)),
            settings_.commandTimeout,
            settings_.transferTimeout,
            1);
        for (const auto& plan : job.volumes) {
            const auto it = job.checkpoints.find(plan.mount.source);
            if (it == job.checkpoints.end()) {
                continue;
            }
            std::string error;
            if (orchestrator.RollbackDestination(plan, it->second, error)) {
                job.checkpoints.erase(it);
            } else {
                errors.push_back(error);
            }
        }
    }

    if (job.snapshot && !job.snapshot->released) {
        if (skipRollback) {
            std::cout << "[Migration] " << job.id << " source rollback skipped by request" << std::endl;
        } else {
            const RollbackResult result = snapshots_.Rollback(*job.snapshot, *hosts.source);
            for (const auto& error : result.errors) {
                errors.push_back("source " + error);
            }
        }
        if (errors.empty()) {
            try {
                snapshots_.Release(*job.snapshot, *hosts.source);
            } catch (const SnapshotError& ex) {
                std::cerr << "[Migration] " << job.id << " rollback point left in place: " << ex.what() << std::endl;
            }
        }
    }

    if (job.workloadStopped && job.unit) {
        try {
            services_.workloads->Start(*job.unit, {}, *hosts.source);
            job.workloadStopped = false;
        } catch (const WorkloadError& ex) {
            errors.push_back(std::string("restart on source: ") + ex.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.job.checkpoints = job.checkpoints;
        ctx.job.snapshot = job.snapshot;
        ctx.job.workloadStopped = job.workloadStopped;
        SaveLocked(ctx.job);
    }
    return errors;
}

void MigrationStateMachine::Abandon(
    const std::shared_ptr<JobContext>& ctx,
    MigrationState terminal,
    const std::string& reason) {
    MigrationJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx->running) {
            throw ValidationError("Job " + ctx->job.id + " is running");
        }
        if (ctx->worker.joinable()) {
            ctx->worker.join();
        }
        ctx->running = true;
        job = ctx->job;
    }

    Hosts hosts;
    try {
        hosts = ConnectHosts(job);
    } catch (const MigrationError& ex) {
        std::cerr << "[Migration] Could not reach hosts to roll back " << job.id << ": " << ex.what() << std::endl;
    }
    Fail(*ctx, &hosts, terminal, terminal == MigrationState::CANCELLED ? ErrorKind::CANCELLED : ErrorKind::NONE, reason);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx->running = false;
    }
    changed_.notify_all();
}

void MigrationStateMachine::Transition(JobContext& ctx, MigrationState state, const std::string& message, int progress) {
    MigrationJob copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = ctx.job;
        job.status = state;
        job.progress = std::max(job.progress, progress >= 0 ? progress : StateProgress(state));
        job.message = message;
        const std::string now = CurrentTimestamp();
        job.steps.push_back({state, message, now, job.progress});
        if (IsTerminal(state)) {
            job.endedAt = now;
        }
        SaveLocked(job);
        copy = job;
    }
    std::cout << "[Migration] " << copy.id << " " << MigrationStateName(state) << " (" << copy.progress << "%): " << message << std::endl;
    Publish(copy);
}

void MigrationStateMachine::Note(JobContext& ctx, const std::string& message) {
    MigrationJob copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = ctx.job;
        job.message = message;
        job.steps.push_back({job.status, message, CurrentTimestamp(), job.progress});
        SaveLocked(job);
        copy = job;
    }
    std::cout << "[Migration] " << copy.id << " " << message << std::endl;
    Publish(copy);
}

void MigrationStateMachine::ThrowIfCancelled(const JobContext& ctx) const {
    if (ctx.cancelRequested.load()) {
        throw CancelledError("Cancellation requested");
    }
}

void MigrationStateMachine::SaveLocked(const MigrationJob& job) {
    if (!services_.store->SaveJob(job)) {
        std::cerr << "[Migration] Failed to persist job " << job.id << std::endl;
    }
}

void MigrationStateMachine::Publish(const MigrationJob& job) const {
    if (!services_.onJobUpdate) {
        return;
    }
    try {
        services_.onJobUpdate(job);
    } catch (const std::exception& ex) {
        std::cerr << "[Migration] Status publish failed for " << job.id << ": " << ex.what() << std::endl;
    }
}

MigrationStateMachine::Hosts MigrationStateMachine::ConnectHosts(const MigrationJob& job) const {
    const HostCredentials source = services_.credentials->Resolve(job.sourceHostRef);
    const HostCredentials destination = services_.credentials->Resolve(job.destHostRef);
    if (!source.local && destination.local) {
        throw ValidationError(
            "Destination '" + job.destHostRef + "' is the agent host; register it with a reachable address to migrate from "
            + job.sourceHostRef);
    }

    Hosts hosts;
    if (services_.executorFactory) {
        hosts.source = services_.executorFactory(source);
        hosts.destination = services_.executorFactory(destination);
    } else {
        hosts.source = MakeExecutor(source, settings_.sshTimeout);
        hosts.destination = MakeExecutor(destination, settings_.sshTimeout);
    }
    return hosts;
}

std::unique_ptr<SyncPrimitive> MigrationStateMachine::MakePrimitive(
    const RemoteExecutor& source,
    const RemoteExecutor& destination) const {
    if (services_.primitiveFactory) {
        return services_.primitiveFactory(source, destination);
    }
    if (source.IsLocal() && destination.IsLocal()) {
        return std::make_unique<LocalCopyPrimitive>();
    }
    return std::make_unique<RsyncPrimitive>(source, destination.Credentials(), settings_.sshTimeout, settings_.transferTimeout);
}

std::shared_ptr<MigrationStateMachine::JobContext> MigrationStateMachine::Find(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(jobId);
    return it == jobs_.end() ? nullptr : it->second;
}

bool MigrationStateMachine::PairBusyLocked(const std::string& pairKey, std::string& ownerId) const {
    for (const auto& entry : jobs_) {
        const auto& job = entry.second->job;
        if (job.PairKey() != pairKey) {
            continue;
        }
        if (entry.second->running || !IsTerminal(job.status) || job.resumable) {
            ownerId = job.id;
            return true;
        }
    }
    return false;
}

std::string MigrationStateMachine::NewJobIdLocked() const {
    for (;;) {
        const std::string id = RandomHex(8);
        if (jobs_.count(id) == 0 && !services_.store->LoadJob(id)) {
            return id;
        }
    }
}

bool MigrationStateMachine::Resumable(const MigrationJob& job) {
    if (job.status == MigrationState::FAILED) {
        return job.resumable;
    }
    return !IsTerminal(job.status) && job.snapshot.has_value() && !job.checkpoints.empty();
}
