#include "AgentSettings.hpp"
#include "CapabilityProber.hpp"
#include "CommandPoller.hpp"
#include "CredentialResolver.hpp"
#include "JobStore.hpp"
#include "MigrationStateMachine.hpp"
#include "NetworkClient.hpp"
#include "Tracing.hpp"
#include "WorkloadController.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace {
std::atomic<bool> g_stop{false};

void HandleSignal(int) {
    g_stop = true;
}

std::string DetectKernelVersion() {
    struct utsname info;
    if (uname(&info) == 0) {
        return info.release;
    }
    return {};
}

std::string DetectHostname() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer)) == 0) {
        return buffer;
    }
    return "unknown-host";
}

bool WaitForTlsFiles(const TlsSettings& settings, int timeoutSeconds) {
    if (settings.certPath.empty() || settings.keyPath.empty() || settings.caPath.empty()) {
        return false;
    }

    for (int attempt = 0; attempt < timeoutSeconds; ++attempt) {
        if (std::filesystem::exists(settings.certPath)
            && std::filesystem::exists(settings.keyPath)
            && std::filesystem::exists(settings.caPath)) {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    return false;
}

// Held for the lifetime of a process that mutates jobs, so a CLI invocation
// cannot roll back a job the agent daemon is still driving.
class StateLock {
public:
    explicit StateLock(const std::filesystem::path& stateDir) {
        std::error_code error;
        std::filesystem::create_directories(stateDir, error);
        const std::string path = (stateDir / "agent.lock").string();
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT, 0600);
        if (fd_ >= 0 && ::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ~StateLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    StateLock(const StateLock&) = delete;
    StateLock& operator=(const StateLock&) = delete;

    bool Held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

MigrationServices BuildServices(const AgentSettings& settings) {
    MigrationServices services;
    services.store = std::make_shared<FileJobStore>(settings.stateDir);
    services.credentials = std::make_shared<FileCredentialResolver>(settings.credentialsFile);
    services.workloads = std::make_shared<DockerWorkloadController>(settings.migration.commandTimeout);
    return services;
}

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  berth-agent                                   run as agent\n"
              << "  berth-agent migrate <unit> <source> <destination> <path> [--no-wait]\n"
              << "  berth-agent resume <job-id> [--no-wait]\n"
              << "  berth-agent status <job-id>\n"
              << "  berth-agent cancel <job-id> [--skip-rollback]\n"
              << "  berth-agent cleanup <job-id>\n"
              << "  berth-agent list\n"
              << "  berth-agent prune" << std::endl;
}

bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
    for (const auto& arg : args) {
        if (arg == flag) {
            return true;
        }
    }
    return false;
}

int ExitCodeFor(const MigrationJob& job) {
    return job.status == MigrationState::COMPLETED ? 0 : 1;
}

int WaitForJob(MigrationStateMachine& migrations, const std::string& jobId) {
    while (!migrations.Wait(jobId, std::chrono::seconds(1))) {
        if (g_stop) {
            std::cerr << "[Agent] Interrupted; cancelling " << jobId << std::endl;
            migrations.Cancel(jobId);
            g_stop = false;
        }
    }

    const auto job = migrations.GetStatus(jobId);
    if (!job) {
        return 1;
    }
    std::cout << "[Agent] Job " << jobId << " finished: " << MigrationStateName(job->status);
    if (!job->error.empty()) {
        std::cout << " (" << job->error << ")";
    }
    std::cout << std::endl;
    return ExitCodeFor(*job);
}

void PrintJobLine(const MigrationJob& job) {
    std::cout << job.id << "  " << MigrationStateName(job.status) << "  " << job.progress << "%  "
              << (job.unit ? job.unit->Name() : job.unitIdentifier) << "  "
              << job.sourceHostRef << " -> " << job.destHostRef << ":" << job.destBasePath << std::endl;
}

// Reads the store directly; safe while an agent process owns the state directory.
int RunReadOnly(const AgentSettings& settings, const std::vector<std::string>& args) {
    FileJobStore store(settings.stateDir);
    if (args.front() == "list") {
        for (const auto& id : store.ListJobs()) {
            const auto job = store.LoadJob(id);
            if (job) {
                PrintJobLine(*job);
            }
        }
        return 0;
    }

    if (args.size() < 2) {
        PrintUsage();
        return 2;
    }
    const auto job = store.LoadJob(args[1]);
    if (!job) {
        std::cerr << "[Agent] Unknown job " << args[1] << std::endl;
        return 1;
    }
    std::cout << nlohmann::json(*job).dump(2) << std::endl;
    return 0;
}

int RunCli(const AgentSettings& settings, const std::vector<std::string>& args) {
    const std::string& command = args.front();
    const bool readOnly = command == "status" || command == "list";

    if (readOnly) {
        return RunReadOnly(settings, args);
    }

    StateLock lock(settings.stateDir);
    if (!lock.Held()) {
        std::cerr << "[Agent] Another berth-agent process owns " << settings.stateDir
                  << "; send the command through it instead." << std::endl;
        return 2;
    }

    MigrationStateMachine migrations(settings.migration, BuildServices(settings));
    migrations.RecoverJobs();

    try {
        if (command == "migrate" && args.size() >= 5) {
            const std::string jobId = migrations.StartMigration(args[1], args[2], args[3], args[4]);
            std::cout << jobId << std::endl;
            return HasFlag(args, "--no-wait") ? 0 : WaitForJob(migrations, jobId);
        }
        if (command == "resume" && args.size() >= 2) {
            migrations.Resume(args[1]);
            return HasFlag(args, "--no-wait") ? 0 : WaitForJob(migrations, args[1]);
        }
        if (command == "cancel" && args.size() >= 2) {
            migrations.Cancel(args[1], HasFlag(args, "--skip-rollback"));
            migrations.Wait(args[1], std::chrono::hours(24));
            const auto job = migrations.GetStatus(args[1]);
            std::cout << "[Agent] Job " << args[1] << " " << (job ? MigrationStateName(job->status) : std::string("gone")) << std::endl;
            return job && job->status == MigrationState::CANCELLED ? 0 : 1;
        }
        if (command == "cleanup" && args.size() >= 2) {
            migrations.Cleanup(args[1]);
            return 0;
        }
        if (command == "prune") {
            std::cout << "[Agent] Pruned " << migrations.PruneExpired() << " rollback point(s)" << std::endl;
            return 0;
        }
    } catch (const AmbiguousUnitError& ex) {
        std::cerr << "[Agent] " << ex.what() << std::endl;
        for (const auto& candidate : ex.Candidates()) {
            std::cerr << "  " << candidate << std::endl;
        }
        return 1;
    } catch (const MigrationError& ex) {
        std::cerr << "[Agent] " << ErrorKindName(ex.Kind()) << ": " << ex.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 2;
}

int RunAgent(AgentSettings settings) {
    if (settings.tls.enabled) {
        if (settings.coreUrl.rfind("https://", 0) != 0) {
            std::cerr << "[Agent] BERTH_MTLS_ENABLED requires an https core URL." << std::endl;
            return 1;
        }

        if (!WaitForTlsFiles(settings.tls, 30)) {
            std::cerr << "[Agent] mTLS enabled but certificate files are missing." << std::endl;
            return 1;
        }
    }

    StateLock lock(settings.stateDir);
    if (!lock.Held()) {
        std::cerr << "[Agent] Another berth-agent process owns " << settings.stateDir << std::endl;
        return 1;
    }

    NetworkClient client(settings.coreUrl, settings.tls, settings.apiKey);

    LocalExecutor localHost;
    HostCapabilities localCaps;
    try {
        localCaps = CapabilityProber(settings.migration.sshTimeout).Probe(localHost);
    } catch (const MigrationError& ex) {
        std::cerr << "[Agent] Local capability probe failed: " << ex.what() << std::endl;
    }

    AgentCapabilities capabilities;
    capabilities.kernelVersion = DetectKernelVersion();
    capabilities.runtimeAvailable = localCaps.runtimeAvailable;
    capabilities.runtimeVersion = localCaps.runtimeVersion;
    capabilities.cowAvailable = localCaps.cowAvailable;
    capabilities.cowSystem = localCaps.cowSystem;
    capabilities.maxActiveTransfers = settings.migration.maxActiveTransfers;

    const std::string hostname = DetectHostname();
    std::string token;
    std::string agentId;
    AgentConfig agentConfig;
    while (!g_stop) {
        if (client.Register(hostname, "Linux", capabilities, token, agentId, &agentConfig)) {
            std::cout << "[Agent] Registered with Core as " << agentId << std::endl;
            break;
        }

        std::cerr << "[Agent] Waiting for Core..." << std::endl;
        std::this_thread::sleep_for(std::chrono::seconds(5));
    }
    if (g_stop) {
        return 0;
    }

    if (agentConfig.maxActiveTransfers > 0) {
        settings.migration.maxActiveTransfers = agentConfig.maxActiveTransfers;
    }
    settings.migration.forceFileSync = settings.migration.forceFileSync || agentConfig.forceFileSync;
    std::cout << "[Agent] Config: maxActiveTransfers=" << settings.migration.maxActiveTransfers
              << ", forceFileSync=" << (settings.migration.forceFileSync ? "on" : "off") << std::endl;

    MigrationServices services = BuildServices(settings);
    services.onJobUpdate = [&client, agentId](const MigrationJob& job) {
        if (!client.ReportJobStatus(agentId, job)) {
            std::cerr << "[Agent] Failed to report status of job " << job.id << std::endl;
        }
    };

    MigrationStateMachine migrations(settings.migration, std::move(services));
    const size_t recovered = migrations.RecoverJobs();
    if (recovered > 0) {
        std::cout << "[Agent] Loaded " << recovered << " job record(s) from " << settings.stateDir << std::endl;
    }

    CommandDispatcher dispatcher(client, migrations, agentId);
    CommandPoller poller(client, dispatcher, agentId, settings.pollInterval);
    poller.Start();

    constexpr int kPruneEveryHeartbeats = 60;
    for (int beat = 0; !g_stop; ++beat) {
        size_t active = 0;
        for (const auto& job : migrations.ListJobs()) {
            if (!IsTerminal(job.status)) {
                ++active;
            }
        }

        if (!client.SendHeartbeat(token, agentId, active > 0 ? "BUSY" : "IDLE", active)) {
            std::cerr << "[Agent] Failed to send heartbeat" << std::endl;
        }

        if (beat % kPruneEveryHeartbeats == 0) {
            const size_t pruned = migrations.PruneExpired();
            if (pruned > 0) {
                std::cout << "[Agent] Pruned " << pruned << " expired rollback point(s)" << std::endl;
            }
        }

        std::this_thread::sleep_for(std::chrono::seconds(5));
    }

    std::cout << "[Agent] Shutting down." << std::endl;
    poller.Stop();
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    AgentSettings settings = AgentSettings::FromEnvironment();
    Tracer::Instance().Configure(settings.trace);

    int code = 0;
    if (argc > 1) {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.front() == "-h" || args.front() == "--help") {
            PrintUsage();
            return 0;
        }
        code = RunCli(settings, args);
    } else {
        std::cout << "Berth Agent Starting..." << std::endl;
        code = RunAgent(std::move(settings));
    }

    Tracer::Instance().Shutdown();
    return code;
}
