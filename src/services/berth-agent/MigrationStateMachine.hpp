#pragma once

#include "CapabilityProber.hpp"
#include "ChecksumEngine.hpp"
#include "CredentialResolver.hpp"
#include "DiscoveryService.hpp"
#include "JobStore.hpp"
#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"
#include "RetryPolicy.hpp"
#include "SnapshotManager.hpp"
#include "SyncPrimitive.hpp"
#include "TransferOrchestrator.hpp"
#include "Verifier.hpp"
#include "WorkloadController.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct MigrationSettings {
    size_t maxActiveTransfers = 2;
    size_t transferWorkers = 4;
    int retryAttempts = 5;
    std::chrono::milliseconds retryBaseDelay{1000};
    std::chrono::milliseconds retryMaxDelay{60000};
    std::chrono::seconds sshTimeout{30};
    std::chrono::seconds commandTimeout{300};
    std::chrono::seconds transferTimeout{3600};
    std::chrono::hours snapshotRetention{0};
    bool forceFileSync = false;
    bool requireRuntime = true;
    double spaceSafetyMargin = 0.2;
};

// Collaborators the pipeline talks to. Factories default to the production
// implementations when left empty.
struct MigrationServices {
    using ExecutorFactory = std::function<std::unique_ptr<RemoteExecutor>(const HostCredentials&)>;
    using PrimitiveFactory = std::function<std::unique_ptr<SyncPrimitive>(const RemoteExecutor&, const RemoteExecutor&)>;

    std::shared_ptr<JobStore> store;
    std::shared_ptr<CredentialResolver> credentials;
    std::shared_ptr<WorkloadController> workloads;
    ExecutorFactory executorFactory;
    PrimitiveFactory primitiveFactory;
    RetryPolicy::Sleeper sleeper;
    std::function<void(const MigrationJob&)> onJobUpdate;
};

class MigrationStateMachine {
public:
    MigrationStateMachine(MigrationSettings settings, MigrationServices services);
    ~MigrationStateMachine();

    MigrationStateMachine(const MigrationStateMachine&) = delete;
    MigrationStateMachine& operator=(const MigrationStateMachine&) = delete;

    // Validates the request and resolves the unit on the source before the job
    // exists. Throws ValidationError, NotFoundError or AmbiguousUnitError.
    std::string StartMigration(
        const std::string& unitIdentifier,
        const std::string& sourceHostRef,
        const std::string& destHostRef,
        const std::string& destBasePath);

    std::optional<MigrationJob> GetStatus(const std::string& jobId) const;
    std::vector<MigrationJob> ListJobs() const;

    // Running jobs stop at the next step or file boundary; idle interrupted
    // jobs are rolled back immediately.
    void Cancel(const std::string& jobId, bool skipRollback = false);
    void Resume(const std::string& jobId);

    // Abandons an unfinished job (with rollback), destroys retained snapshots
    // and forgets the job.
    void Cleanup(const std::string& jobId);

    // Destroys retained rollback points whose retention elapsed. Returns the
    // number pruned.
    size_t PruneExpired();

    // Reloads persisted jobs; non-terminal ones are left interrupted.
    size_t RecoverJobs();

    bool Wait(const std::string& jobId, std::chrono::milliseconds timeout) const;

    static std::string BuildSizeCommand(const std::vector<std::string>& paths);
    static unsigned long long RequiredBytes(unsigned long long sourceBytes, double margin);
    static std::string UniqueFinalPath(const std::string& destBasePath, const std::string& source, std::vector<std::string>& used);
    static PathRewrites BuildPathRewrites(const std::vector<VolumePlan>& plans);

private:
    struct JobContext {
        MigrationJob job;
        std::atomic<bool> cancelRequested{false};
        bool skipRollback = false;
        bool running = false;
        std::thread worker;
    };

    struct Hosts {
        std::unique_ptr<RemoteExecutor> source;
        std::unique_ptr<RemoteExecutor> destination;
    };

    class AdmissionSlot;

    void RunPipeline(std::shared_ptr<JobContext> ctx, bool resume);
    void Validate(JobContext& ctx, const Hosts& hosts, HostCapabilities& sourceCaps, HostCapabilities& destCaps);
    void PlanVolumes(JobContext& ctx, const Hosts& hosts);
    void Snapshot(JobContext& ctx, const Hosts& hosts, const HostCapabilities& sourceCaps, const HostCapabilities& destCaps);
    void Checksum(JobContext& ctx, const Hosts& hosts);
    void TransferVolumes(JobContext& ctx, const Hosts& hosts);
    void VerifyVolumes(JobContext& ctx, const Hosts& hosts);
    void Cutover(JobContext& ctx, const Hosts& hosts);
    void Clean(JobContext& ctx, const Hosts& hosts);

    void Fail(JobContext& ctx, const Hosts* hosts, MigrationState terminal, ErrorKind kind, const std::string& message);
    std::vector<std::string> RollbackAll(JobContext& ctx, const Hosts& hosts);
    void Abandon(const std::shared_ptr<JobContext>& ctx, MigrationState terminal, const std::string& reason);

    void Transition(JobContext& ctx, MigrationState state, const std::string& message, int progress = -1);
    void Note(JobContext& ctx, const std::string& message);
    void ThrowIfCancelled(const JobContext& ctx) const;
    void SaveLocked(const MigrationJob& job);
    void Publish(const MigrationJob& job) const;

    Hosts ConnectHosts(const MigrationJob& job) const;
    std::unique_ptr<SyncPrimitive> MakePrimitive(const RemoteExecutor& source, const RemoteExecutor& destination) const;
    std::shared_ptr<JobContext> Find(const std::string& jobId) const;
    bool PairBusyLocked(const std::string& pairKey, std::string& ownerId) const;
    std::string NewJobIdLocked() const;
    static bool Resumable(const MigrationJob& job);

    MigrationSettings settings_;
    MigrationServices services_;

    CapabilityProber prober_;
    DiscoveryService discovery_;
    SnapshotManager snapshots_;
    ChecksumEngine checksums_;
    Verifier verifier_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::condition_variable admission_;
    size_t activeTransfers_ = 0;
    std::map<std::string, std::shared_ptr<JobContext>> jobs_;
};
