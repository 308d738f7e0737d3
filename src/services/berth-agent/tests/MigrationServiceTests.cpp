#include "JobStore.hpp"
#include "MigrationStateMachine.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
constexpr std::chrono::seconds kJobTimeout{60};
const std::string kSmallFile = "0123456789";

std::string InspectOutput(const std::string& source) {
    nlohmann::json container = {
        {"Id", "c0ffee"},
        {"Name", "/web"},
        {"Config", {{"Image", "nginx:1.25"}, {"Env", {"MODE=prod"}}, {"Labels", nlohmann::json::object()}}},
        {"Mounts", {{{"Type", "bind"}, {"Source", source}, {"Destination", "/data"}, {"RW", true}}}},
        {"NetworkSettings", {{"Networks", {{"bridge", nlohmann::json::object()}}}}}
    };
    return nlohmann::json::array({container}).dump();
}

struct Harness {
    TempDir root{"berth-migration"};
    fs::path source;
    fs::path destBase;
    std::shared_ptr<CommandScript> script = std::make_shared<CommandScript>();
    std::shared_ptr<FileJobStore> store;
    std::shared_ptr<StaticCredentialResolver> credentials = std::make_shared<StaticCredentialResolver>();
    std::shared_ptr<FakeWorkloadController> workloads = std::make_shared<FakeWorkloadController>();
    MigrationSettings settings;
    MigrationServices services;

    Harness() {
        source = root.Path() / "src" / "data";
        destBase = root.Path() / "dest";
        fs::create_directories(destBase);
        fs::create_directories(source / "logs");
        WriteFile(source / "a.txt", kSmallFile);
        WriteFile(source / "b.txt", "");
        WriteFile(source / "c.bin", std::string(1024 * 1024, 'x'));

        script->On("docker ps -a --format", "");
        script->On("docker ps --filter 'name=web'", "c0ffee\n");
        script->On("docker ps --filter 'name=db'", "");
        script->On("docker inspect 'c0ffee'", InspectOutput(source.string()));
        script->On("docker version", "24.0.7\n");
        script->On("zfs version", "zfs: command not found", 127);

        store = std::make_shared<FileJobStore>(root.Path() / "state");
        credentials->Add(LocalHost("alpha"));
        credentials->Add(LocalHost("beta"));

        settings.retryAttempts = 2;
        settings.retryBaseDelay = std::chrono::milliseconds(1);

        services.store = store;
        services.credentials = credentials;
        services.workloads = workloads;
        auto scripted = script;
        services.executorFactory = [scripted](const HostCredentials& host) -> std::unique_ptr<RemoteExecutor> {
            return std::make_unique<LocalExecutor>(host, scripted->Runner());
        };
        services.sleeper = [](std::chrono::milliseconds) {};
    }

    std::unique_ptr<MigrationStateMachine> Build() {
        return std::make_unique<MigrationStateMachine>(settings, services);
    }

    fs::path Final() const { return destBase / "data"; }
    fs::path Staging(const std::string& id) const { return destBase / ("data.berth-staging-" + id); }
    fs::path Aside(const std::string& id) const { return destBase / ("data.berth-previous-" + id); }
    fs::path Backup(const std::string& id) const { return root.Path() / "src" / ("data.berth-rollback-" + id); }
};

struct PrimitiveState {
    std::mutex mutex;
    std::vector<std::string> copied;
    std::string target;
    int transientFailures = 0;
    bool destinationFull = false;
    bool corrupt = false;
    std::string liveSource;
};

// Wraps the local copy and injects faults for one file.
class FaultyPrimitive : public SyncPrimitive {
public:
    explicit FaultyPrimitive(std::shared_ptr<PrimitiveState> state)
        : state_(std::move(state)) {}

    void DryRun(const std::string& sourceRoot, const std::string& stagingRoot) const override {
        inner_.DryRun(sourceRoot, stagingRoot);
    }

    unsigned long long CopyFile(
        const std::string& sourceRoot,
        const std::string& relativePath,
        const std::string& stagingRoot) const override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (relativePath == state_->target && state_->transientFailures > 0) {
                --state_->transientFailures;
                throw TransferError(TransferError::Cause::TRANSIENT_NETWORK, "Connection reset by peer");
            }
            if (relativePath == state_->target && state_->destinationFull) {
                WriteFile(fs::path(state_->liveSource) / "a.txt", "clobbered");
                throw TransferError(TransferError::Cause::DESTINATION_FULL, "No space left on device");
            }
        }

        const unsigned long long bytes = inner_.CopyFile(sourceRoot, relativePath, stagingRoot);

        std::lock_guard<std::mutex> lock(state_->mutex);
        if (relativePath == state_->target && state_->corrupt) {
            WriteFile(fs::path(stagingRoot) / relativePath, "tampered");
        }
        state_->copied.push_back(relativePath);
        return bytes;
    }

    void SyncDirectories(const std::string& sourceRoot, const std::string& stagingRoot) const override {
        inner_.SyncDirectories(sourceRoot, stagingRoot);
    }

private:
    std::shared_ptr<PrimitiveState> state_;
    LocalCopyPrimitive inner_;
};

void UseFaultyPrimitive(Harness& harness, const std::shared_ptr<PrimitiveState>& state) {
    harness.services.primitiveFactory = [state](const RemoteExecutor&, const RemoteExecutor&) -> std::unique_ptr<SyncPrimitive> {
        return std::make_unique<FaultyPrimitive>(state);
    };
}

class Gate {
public:
    void Arrive() {
        std::unique_lock<std::mutex> lock(mutex_);
        reached_ = true;
        changed_.notify_all();
        changed_.wait(lock, [this] { return open_; });
    }

    bool WaitReached() {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, kJobTimeout, [this] { return reached_; });
    }

    void Open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        changed_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    bool reached_ = false;
    bool open_ = false;
};

// Declared after the state machine so the gate opens before workers are joined.
struct GateOpener {
    std::shared_ptr<Gate> gate;
    ~GateOpener() { gate->Open(); }
};

bool HasStep(const MigrationJob& job, const std::string& fragment) {
    return std::any_of(job.steps.begin(), job.steps.end(), [&](const MigrationStep& step) {
        return step.message.find(fragment) != std::string::npos;
    });
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

int TestEndToEnd() {
    Harness harness;
    auto machine = harness.Build();

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string() + "/");
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Migration did not finish in time.");
    }

    const auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::COMPLETED) {
        return Fail("Migration should complete, got " + (job ? MigrationStateName(job->status) + ": " + job->error : "no job"));
    }
    if (job->progress != 100 || !job->verified || job->errorKind != ErrorKind::NONE) {
        return Fail("Completed job has unexpected progress or verification flags.");
    }
    if (job->destBasePath != harness.destBase.string()) {
        return Fail("Trailing slash not stripped from destination path: " + job->destBasePath);
    }

    if (ReadFile(harness.Final() / "a.txt") != kSmallFile) {
        return Fail("Small file content differs at destination.");
    }
    if (!fs::exists(harness.Final() / "b.txt") || fs::file_size(harness.Final() / "b.txt") != 0) {
        return Fail("Empty file was not transferred.");
    }
    if (fs::file_size(harness.Final() / "c.bin") != 1024 * 1024) {
        return Fail("Large file size differs at destination.");
    }
    if (!fs::is_directory(harness.Final() / "logs")) {
        return Fail("Empty directory was not recreated.");
    }
    if (fs::exists(harness.Staging(id)) || fs::exists(harness.Backup(id))) {
        return Fail("Staging or rollback copy left behind after success.");
    }
    if (!job->snapshot || !job->snapshot->released || job->snapshot->retained) {
        return Fail("Rollback point should be released without retention.");
    }
    if (!job->checkpoints.empty() || job->resumable) {
        return Fail("Checkpoints should be cleared after success.");
    }

    const auto stops = harness.workloads->Stops();
    const auto starts = harness.workloads->Starts();
    if (stops.size() != 1 || stops.front().host != "alpha") {
        return Fail("Workload should be stopped once on the source.");
    }
    if (starts.size() != 1 || starts.front().host != "beta") {
        return Fail("Workload should be started once on the destination.");
    }
    const auto rewrite = starts.front().rewrites.find(harness.source.string());
    if (rewrite == starts.front().rewrites.end() || rewrite->second != harness.Final().string()) {
        return Fail("Start did not rewrite the volume to its destination path.");
    }

    int lastProgress = -1;
    std::vector<MigrationState> order;
    for (const auto& step : job->steps) {
        if (step.progress < lastProgress) {
            return Fail("Progress went backwards at " + MigrationStateName(step.state));
        }
        lastProgress = step.progress;
        if (order.empty() || order.back() != step.state) {
            order.push_back(step.state);
        }
    }
    const std::vector<MigrationState> expected = {
        MigrationState::INITIALIZING, MigrationState::VALIDATING, MigrationState::DISCOVERING,
        MigrationState::SNAPSHOTTING, MigrationState::CHECKSUMMING, MigrationState::TRANSFERRING,
        MigrationState::VERIFYING, MigrationState::CUTOVER, MigrationState::CLEANING, MigrationState::COMPLETED};
    if (order != expected) {
        return Fail("Pipeline visited states out of order.");
    }

    const auto persisted = harness.store->LoadJob(id);
    if (!persisted || persisted->status != MigrationState::COMPLETED) {
        return Fail("Completed job was not persisted.");
    }

    if (!Throws<ValidationError>([&] { machine->Cancel(id); })) {
        return Fail("Cancelling a completed job should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->Resume(id); })) {
        return Fail("Resuming a completed job should be rejected.");
    }
    return 0;
}

int TestResumeFromCheckpoint() {
    Harness harness;
    auto state = std::make_shared<PrimitiveState>();
    state->target = "b.txt";
    state->transientFailures = 2;
    UseFaultyPrimitive(harness, state);
    auto machine = harness.Build();

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Interrupted migration did not settle in time.");
    }

    auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::FAILED || !job->resumable || job->errorKind != ErrorKind::TRANSFER) {
        return Fail("Exhausted transient retries should leave a resumable failure.");
    }
    const auto checkpoint = job->checkpoints.find(harness.source.string());
    if (checkpoint == job->checkpoints.end() || checkpoint->second.fileCursor != 1 || checkpoint->second.partialFile != "b.txt") {
        return Fail("Checkpoint should sit after a.txt with b.txt partial.");
    }
    if (!fs::exists(harness.Backup(id)) || !fs::exists(harness.Staging(id))) {
        return Fail("Rollback point and staging data should be kept for resume.");
    }
    if (!harness.workloads->Starts().empty()) {
        return Fail("Workload must stay stopped while the job is resumable.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "alpha", "beta", harness.destBase.string()); })) {
        return Fail("A resumable job should keep the host pair busy.");
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->copied.clear();
    }
    machine->Resume(id);
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Resumed migration did not finish in time.");
    }

    job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::COMPLETED) {
        return Fail("Resumed migration should complete, got " + (job ? job->error : "no job"));
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->copied != std::vector<std::string>{"b.txt", "c.bin"}) {
            return Fail("Resume should copy only files after the checkpoint.");
        }
    }
    if (ReadFile(harness.Final() / "a.txt") != kSmallFile || !HasStep(*job, "Resuming transfer from checkpoint")) {
        return Fail("Resumed destination or step history is wrong.");
    }
    return 0;
}

int TestFatalTransferRollsBack() {
    Harness harness;
    auto state = std::make_shared<PrimitiveState>();
    state->target = "c.bin";
    state->destinationFull = true;
    state->liveSource = harness.source.string();
    UseFaultyPrimitive(harness, state);
    auto machine = harness.Build();

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Failing migration did not settle in time.");
    }

    const auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::FAILED || job->errorKind != ErrorKind::TRANSFER || job->resumable) {
        return Fail("Destination full should fail the job without resume.");
    }
    if (job->error.find("No space left") == std::string::npos) {
        return Fail("Job error should carry the transfer cause: " + job->error);
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->copied.size() != 2) {
            return Fail("Non-transient failure must not be retried.");
        }
    }
    if (fs::exists(harness.Final()) || fs::exists(harness.Staging(id))) {
        return Fail("Destination should hold neither partial nor final data.");
    }
    if (ReadFile(harness.source / "a.txt") != kSmallFile) {
        return Fail("Source data was not restored from the rollback point.");
    }
    if (fs::exists(harness.Backup(id))) {
        return Fail("Rollback copy should be removed after restore.");
    }

    const auto starts = harness.workloads->Starts();
    if (starts.size() != 1 || starts.front().host != "alpha" || !starts.front().rewrites.empty()) {
        return Fail("Workload should be restarted in place on the source.");
    }
    return 0;
}

int TestCorruptionFailsVerification() {
    Harness harness;
    auto state = std::make_shared<PrimitiveState>();
    state->target = "a.txt";
    state->corrupt = true;
    UseFaultyPrimitive(harness, state);
    auto machine = harness.Build();

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Corrupted migration did not settle in time.");
    }

    const auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::FAILED || job->errorKind != ErrorKind::INTEGRITY) {
        return Fail("Corrupted transfer should fail with an integrity error.");
    }
    if (job->error.find("a.txt") == std::string::npos) {
        return Fail("Integrity error should name the mismatched file: " + job->error);
    }
    if (fs::exists(harness.Final()) || fs::exists(harness.Staging(id))) {
        return Fail("Committed but unverified data must be removed on rollback.");
    }
    if (harness.workloads->Starts().size() != 1 || harness.workloads->Starts().front().host != "alpha") {
        return Fail("Workload should be restarted on the source after integrity failure.");
    }
    return 0;
}

int TestDuplicateAndCancel() {
    Harness harness;
    auto gate = std::make_shared<Gate>();
    harness.workloads->onStop = [gate] { gate->Arrive(); };
    auto machine = harness.Build();
    GateOpener opener{gate};

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
    if (!gate->WaitReached()) {
        return Fail("Pipeline never reached the workload stop.");
    }

    try {
        machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
        return Fail("Second migration of the same pair should be rejected.");
    } catch (const ValidationError& ex) {
        if (std::string(ex.what()).find(id) == std::string::npos) {
            return Fail("Rejection should name the active job: " + std::string(ex.what()));
        }
    }

    if (!Throws<ValidationError>([&] { machine->Resume(id); })) {
        return Fail("Resuming a running job should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->Cleanup(id); })) {
        return Fail("Cleaning up a running job should be rejected.");
    }

    machine->Cancel(id);
    gate->Open();
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Cancelled migration did not settle in time.");
    }

    const auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::CANCELLED || job->errorKind != ErrorKind::CANCELLED) {
        return Fail("Job should end CANCELLED.");
    }
    if (job->message != "Cancelled; no destination writes occurred" || job->destinationWrites) {
        return Fail("Unexpected cancel summary: " + job->message);
    }
    if (fs::exists(harness.Final()) || fs::exists(harness.Backup(id))) {
        return Fail("Cancel should leave no destination data and no rollback copy.");
    }
    if (ReadFile(harness.source / "a.txt") != kSmallFile) {
        return Fail("Source should be intact after cancel.");
    }
    if (harness.workloads->Starts().size() != 1 || harness.workloads->Starts().front().host != "alpha") {
        return Fail("Cancel should restart the workload on the source.");
    }
    if (!Throws<NotFoundError>([&] { machine->Cancel("0000000000000000"); })) {
        return Fail("Cancelling an unknown job should report not found.");
    }
    return 0;
}

int TestExistingDestinationMovedAside() {
    Harness harness;
    WriteFile(harness.Final() / "old.txt", "previous");
    auto machine = harness.Build();

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Migration did not finish in time.");
    }

    const auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::COMPLETED) {
        return Fail("Migration over existing content should complete, got " + (job ? job->error : "no job"));
    }
    if (fs::exists(harness.Final() / "old.txt") || ReadFile(harness.Aside(id) / "old.txt") != "previous") {
        return Fail("Existing destination content should be moved aside intact.");
    }
    if (ReadFile(harness.Final() / "a.txt") != kSmallFile) {
        return Fail("New content missing from final path.");
    }
    if (!HasStep(*job, "Previous destination content kept at")) {
        return Fail("Moved-aside path should be reported in the job history.");
    }
    return 0;
}

int TestRequestValidation() {
    Harness harness;
    harness.credentials->Add(RemoteHost("far", "10.0.0.9"));
    auto machine = harness.Build();
    const std::string dest = harness.destBase.string();

    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "alpha", "beta", "relative/path"); })) {
        return Fail("Relative destination should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "alpha", "beta", "/"); })) {
        return Fail("Filesystem root destination should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "alpha", "beta", dest + "/../etc"); })) {
        return Fail("Destination with '..' should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "bad host", "beta", dest); })) {
        return Fail("Malformed host reference should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("", "alpha", "beta", dest); })) {
        return Fail("Empty unit identifier should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "ghost", "beta", dest); })) {
        return Fail("Unknown host reference should be rejected.");
    }
    if (!Throws<ValidationError>([&] { machine->StartMigration("web", "far", "alpha", dest); })) {
        return Fail("Remote source with the agent host as destination should be rejected.");
    }
    if (!Throws<ValidationError>([&] {
            machine->StartMigration("web", "alpha", "alpha", harness.source.string() + "/nested");
        })) {
        return Fail("Destination inside a source volume on the same host should be rejected.");
    }
    if (!Throws<NotFoundError>([&] { machine->StartMigration("db", "alpha", "beta", dest); })) {
        return Fail("Unknown unit should report not found.");
    }

    harness.script->On("docker ps -a --format", "shop-a\nshop-b\n");
    harness.script->On("docker ps -a --filter 'label=com.docker.compose.project=shop-", "c0ffee\n");
    harness.script->On("docker inspect --format", "{}");
    try {
        machine->StartMigration("shop", "alpha", "beta", dest);
        return Fail("Identifier matching two projects should be ambiguous.");
    } catch (const AmbiguousUnitError& ex) {
        if (ex.Candidates() != std::vector<std::string>{"shop-a", "shop-b"}) {
            return Fail("Ambiguity should list every candidate.");
        }
    }
    if (!machine->ListJobs().empty()) {
        return Fail("Rejected requests must not create jobs.");
    }
    return 0;
}

int TestRecoveryAndCleanup() {
    Harness harness;
    harness.settings.snapshotRetention = std::chrono::hours(1);

    std::string completedId;
    {
        auto machine = harness.Build();
        completedId = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
        if (!machine->Wait(completedId, kJobTimeout)) {
            return Fail("Migration did not finish in time.");
        }
    }
    if (!fs::exists(harness.Backup(completedId))) {
        return Fail("Retained rollback copy should survive completion.");
    }

    MigrationJob interrupted;
    interrupted.id = "deadbeefdeadbeef";
    interrupted.unitIdentifier = "other";
    interrupted.sourceHostRef = "alpha";
    interrupted.destHostRef = "beta";
    interrupted.destBasePath = harness.destBase.string();
    interrupted.status = MigrationState::TRANSFERRING;
    interrupted.progress = 50;
    interrupted.createdAt = CurrentTimestamp();
    if (!harness.store->SaveJob(interrupted)) {
        return Fail("Could not seed interrupted job.");
    }

    auto machine = harness.Build();
    if (machine->RecoverJobs() != 2) {
        return Fail("Both persisted jobs should be recovered.");
    }

    auto recovered = machine->GetStatus(interrupted.id);
    if (!recovered || recovered->status != MigrationState::TRANSFERRING || !HasStep(*recovered, "Interrupted in TRANSFERRING")) {
        return Fail("Interrupted job should be reported as interrupted.");
    }
    if (machine->PruneExpired() != 0) {
        return Fail("Unexpired rollback point must not be pruned.");
    }

    machine->Cleanup(interrupted.id);
    if (machine->GetStatus(interrupted.id) || harness.store->LoadJob(interrupted.id)) {
        return Fail("Cleanup should forget the interrupted job.");
    }

    machine->Cleanup(completedId);
    if (fs::exists(harness.Backup(completedId))) {
        return Fail("Cleanup should destroy the retained rollback copy.");
    }
    if (!machine->ListJobs().empty()) {
        return Fail("No jobs should remain after cleanup.");
    }
    if (!fs::exists(harness.Final() / "a.txt")) {
        return Fail("Cleanup must not touch migrated data.");
    }
    return 0;
}
int TestResumeAfterAgentRestart() {
    Harness harness;
    auto state = std::make_shared<PrimitiveState>();
    state->target = "b.txt";
    state->transientFailures = 2;
    UseFaultyPrimitive(harness, state);

    std::string id;
    {
        auto machine = harness.Build();
        id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
        if (!machine->Wait(id, kJobTimeout)) {
            return Fail("Interrupted migration did not settle in time.");
        }
        const auto job = machine->GetStatus(id);
        if (!job || !job->resumable) {
            return Fail("Transient exhaustion should leave the job resumable.");
        }
    }
    if (fs::exists(harness.Final()) || !fs::exists(harness.Staging(id))) {
        return Fail("Nothing may appear at the final path before commit.");
    }

    // The agent died mid-transfer: the record still says TRANSFERRING.
    auto persisted = harness.store->LoadJob(id);
    if (!persisted || persisted->checkpoints.empty() || !persisted->snapshot) {
        return Fail("Checkpoint and rollback point should be persisted.");
    }
    persisted->status = MigrationState::TRANSFERRING;
    persisted->resumable = false;
    persisted->endedAt.clear();
    if (!harness.store->SaveJob(*persisted)) {
        return Fail("Could not rewrite the job record.");
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->copied.clear();
    }
    auto restarted = harness.Build();
    if (restarted->RecoverJobs() != 1) {
        return Fail("The interrupted job should be recovered from the store.");
    }
    auto job = restarted->GetStatus(id);
    if (!job || job->status != MigrationState::TRANSFERRING || !HasStep(*job, "Interrupted in TRANSFERRING")) {
        return Fail("Recovered job should be reported as interrupted.");
    }

    restarted->Resume(id);
    if (!restarted->Wait(id, kJobTimeout)) {
        return Fail("Resumed migration did not finish in time.");
    }
    job = restarted->GetStatus(id);
    if (!job || job->status != MigrationState::COMPLETED || !job->verified) {
        return Fail("Resume after restart should complete, got " + (job ? job->error : "no job"));
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->copied != std::vector<std::string>{"b.txt", "c.bin"}) {
            return Fail("Resume after restart should continue from the persisted cursor.");
        }
    }
    if (ReadFile(harness.Final() / "a.txt") != kSmallFile || fs::file_size(harness.Final() / "c.bin") != 1024 * 1024) {
        return Fail("Destination content wrong after resume.");
    }
    if (fs::exists(harness.Staging(id)) || harness.workloads->Starts().size() != 1) {
        return Fail("Resumed job should clean staging and start the workload once.");
    }
    return 0;
}

int TestSymlinksMigrate() {
    Harness harness;
    fs::create_symlink("a.txt", harness.source / "current");
    fs::create_directory_symlink("logs", harness.source / "latest");
    auto machine = harness.Build();

    const std::string id = machine->StartMigration("web", "alpha", "beta", harness.destBase.string());
    if (!machine->Wait(id, kJobTimeout)) {
        return Fail("Migration did not finish in time.");
    }
    const auto job = machine->GetStatus(id);
    if (!job || job->status != MigrationState::COMPLETED) {
        return Fail("Migration with symlinks should complete, got " + (job ? job->error : "no job"));
    }
    if (!fs::is_symlink(harness.Final() / "current") || fs::read_symlink(harness.Final() / "current") != "a.txt") {
        return Fail("File symlink should arrive as a link.");
    }
    if (!fs::is_symlink(harness.Final() / "latest") || fs::read_symlink(harness.Final() / "latest") != "logs") {
        return Fail("Directory symlink should arrive as a link.");
    }
    return 0;
}
} // namespace

int main() {
    const std::vector<std::pair<const char*, int (*)()>> tests = {
        {"end to end", TestEndToEnd},
        {"resume from checkpoint", TestResumeFromCheckpoint},
        {"fatal transfer rolls back", TestFatalTransferRollsBack},
        {"corruption fails verification", TestCorruptionFailsVerification},
        {"duplicate and cancel", TestDuplicateAndCancel},
        {"existing destination moved aside", TestExistingDestinationMovedAside},
        {"request validation", TestRequestValidation},
        {"recovery and cleanup", TestRecoveryAndCleanup},
        {"resume after agent restart", TestResumeAfterAgentRestart},
        {"symlinks migrate", TestSymlinksMigrate},
    };

    for (const auto& [name, test] : tests) {
        if (test() != 0) {
            std::cerr << "Failed: " << name << std::endl;
            return 1;
        }
    }
    return 0;
}
