#include "TransferOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace {
std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool HasLine(const std::string& output, const std::string& line) {
    std::istringstream stream(output);
    std::string current;
    while (std::getline(stream, current)) {
        if (Trim(current) == line) {
            return true;
        }
    }
    return false;
}

std::string Basename(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string Dirname(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return ".";
    }
    return slash == 0 ? "/" : path.substr(0, slash);
}

std::string Quote(const std::string& value) {
    return RemoteExecutor::QuoteArgument(value);
}

std::string DatasetExists(const std::string& dataset) {
    return "zfs list -H -o name " + Quote(dataset) + " >/dev/null 2>&1";
}

void Notify(const TransferOrchestrator::Hooks& hooks, const TransferCheckpoint& checkpoint) {
    if (hooks.onCheckpoint) {
        hooks.onCheckpoint(checkpoint);
    }
}

void ThrowIfCancelled(const TransferOrchestrator::Hooks& hooks, const std::string& volume) {
    if (hooks.cancelled && hooks.cancelled()) {
        throw CancelledError("Transfer of " + volume + " cancelled");
    }
}

// Lower is more severe; a worker stopped because a sibling failed reports as
// cancelled and must not mask the sibling's error.
int FailureRank(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return 2;
    } catch (const TransferError& ex) {
        return ex.IsTransient() ? 1 : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

bool WholeDatasetSnapshot(const SnapshotEntry& snapshot) {
    const auto at = snapshot.snapshotName.find('@');
    if (at == std::string::npos) {
        return false;
    }
    const std::string suffix = "/.zfs/snapshot/" + snapshot.snapshotName.substr(at + 1);
    const auto& path = snapshot.readPath;
    return path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

TransferOrchestrator::TransferOrchestrator(
    const RemoteExecutor& source,
    const RemoteExecutor& destination,
    const SyncPrimitive& primitive,
    RetryPolicy retry,
    std::chrono::seconds commandTimeout,
    std::chrono::seconds transferTimeout,
    size_t workers)
    : source_(source),
      destination_(destination),
      primitive_(primitive),
      retry_(std::move(retry)),
      commandTimeout_(commandTimeout),
      transferTimeout_(transferTimeout),
      workers_(std::max<size_t>(1, workers)) {}

TransferMethod TransferOrchestrator::SelectMethod(
    const HostCapabilities& sourceCaps,
    const HostCapabilities& destCaps,
    const SnapshotEntry* snapshot,
    const std::string& destDataset,
    bool forceFileSync) {
    if (forceFileSync || snapshot == nullptr || destDataset.empty()) {
        return TransferMethod::FILE_SYNC;
    }
    if (!sourceCaps.cowAvailable || !destCaps.cowAvailable || sourceCaps.cowSystem != destCaps.cowSystem) {
        return TransferMethod::FILE_SYNC;
    }
    if (snapshot->method != SnapshotMethod::COW_SNAPSHOT || !WholeDatasetSnapshot(*snapshot)) {
        return TransferMethod::FILE_SYNC;
    }
    return TransferMethod::BLOCK_CLONE;
}

TransferResult TransferOrchestrator::Transfer(
    const VolumePlan& plan,
    const ChecksumManifest& manifest,
    TransferCheckpoint& checkpoint,
    const Hooks& hooks) const {
    checkpoint = TransferCheckpoint();
    checkpoint.volumeSource = plan.mount.source;
    checkpoint.method = plan.method;
    checkpoint.stagingPath = plan.stagingPath;
    checkpoint.finalPath = plan.finalPath;
    return Execute(plan, manifest, checkpoint, hooks);
}

TransferResult TransferOrchestrator::Resume(
    const VolumePlan& plan,
    const ChecksumManifest& manifest,
    TransferCheckpoint& checkpoint,
    const Hooks& hooks) const {
    if (checkpoint.volumeSource != plan.mount.source || checkpoint.method != plan.method) {
        throw TransferError(TransferError::Cause::OTHER, "Checkpoint does not belong to volume " + plan.mount.source);
    }

    std::cout << "[Transfer] Resuming " << plan.mount.source << " at file " << checkpoint.fileCursor
              << "/" << manifest.entries.size()
              << (checkpoint.partialFile.empty() ? std::string() : ", re-copying " + checkpoint.partialFile) << std::endl;
    return Execute(plan, manifest, checkpoint, hooks);
}

std::vector<TransferResult> TransferOrchestrator::TransferAll(
    const std::vector<VolumePlan>& plans,
    const std::map<std::string, ChecksumManifest>& manifests,
    std::map<std::string, TransferCheckpoint>& checkpoints,
    const Hooks& hooks) const {
    std::vector<TransferCheckpoint*> slots;
    for (const auto& plan : plans) {
        if (manifests.find(plan.mount.source) == manifests.end()) {
            throw TransferError(TransferError::Cause::OTHER, "No checksum manifest for " + plan.mount.source);
        }
        slots.push_back(&checkpoints[plan.mount.source]);
    }

    std::vector<TransferResult> results(plans.size());
    std::vector<std::exception_ptr> errors(plans.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> abort{false};

    Hooks workerHooks;
    workerHooks.onCheckpoint = hooks.onCheckpoint;
    workerHooks.cancelled = [&]() { return abort.load() || (hooks.cancelled && hooks.cancelled()); };

    auto work = [&]() {
        for (size_t index = next.fetch_add(1); index < plans.size(); index = next.fetch_add(1)) {
            const auto& plan = plans[index];
            const auto& manifest = manifests.at(plan.mount.source);
            try {
                results[index] = slots[index]->dryRunDone
                    ? Resume(plan, manifest, *slots[index], workerHooks)
                    : Transfer(plan, manifest, *slots[index], workerHooks);
            } catch (const std::exception&) {
                errors[index] = std::current_exception();
                abort = true;
            }
        }
    };

    const size_t threads = std::min(workers_, plans.size());
    std::vector<std::thread> pool;
    for (size_t i = 1; i < threads; ++i) {
        pool.emplace_back(work);
    }
    work();
    for (auto& thread : pool) {
        thread.join();
    }

    std::exception_ptr worst;
    int worstRank = 3;
    for (const auto& error : errors) {
        if (!error) {
            continue;
        }
        const int rank = FailureRank(error);
        if (rank < worstRank) {
            worst = error;
            worstRank = rank;
        }
    }
    if (worst) {
        std::rethrow_exception(worst);
    }
    return results;
}

bool TransferOrchestrator::RollbackDestination(
    const VolumePlan& plan,
    TransferCheckpoint& checkpoint,
    std::string& error) const {
    if (!checkpoint.staged && !checkpoint.committed) {
        return true;
    }

    std::ostringstream command;
    command << "set -e; ";
    if (plan.method == TransferMethod::BLOCK_CLONE) {
        const std::string finalDataset = FinalDataset(plan);
        command << "if ! " << DatasetExists(plan.stagingPath) << " && " << DatasetExists(finalDataset)
                << "; then zfs destroy -r " << Quote(finalDataset) << "; fi; "
                << "if " << DatasetExists(plan.stagingPath) << "; then zfs destroy -r " << Quote(plan.stagingPath) << "; fi";
    } else {
        const std::string finalPath = Quote(plan.finalPath);
        const std::string staging = Quote(plan.stagingPath);
        const std::string aside = Quote(plan.asidePath);
        command << "if [ ! -e " << staging << " ] && [ -e " << finalPath << " ]; then rm -rf " << finalPath << "; fi; "
                << "if [ -e " << aside << " ] && [ ! -e " << finalPath << " ]; then mv -T " << aside << " " << finalPath << "; fi; "
                << "rm -rf " << staging;
    }

    const CommandResult result = destination_.Run(command.str(), commandTimeout_);
    if (!result.Ok()) {
        error = "Destination rollback of " + plan.finalPath + " on " + destination_.HostId() + " failed: " + Trim(result.output);
        std::cerr << "[Transfer] " << error << std::endl;
        return false;
    }

    const std::string volume = checkpoint.volumeSource;
    const TransferMethod method = checkpoint.method;
    checkpoint = TransferCheckpoint();
    checkpoint.volumeSource = volume;
    checkpoint.method = method;
    std::cout << "[Transfer] Destination " << plan.finalPath << " restored on " << destination_.HostId() << std::endl;
    return true;
}

std::string TransferOrchestrator::FinalDataset(const VolumePlan& plan) {
    return plan.destDataset + "/" + Basename(plan.finalPath);
}

std::string TransferOrchestrator::BuildDestinationCheckCommand(const VolumePlan& plan) {
    std::ostringstream command;
    command << "p=" << Quote(Dirname(plan.finalPath)) << "; "
            << "while [ ! -d \"$p\" ]; do p=$(dirname \"$p\"); done; "
            << "[ -w \"$p\" ] && echo writable=1; "
            << "[ -e " << Quote(plan.finalPath) << " ] && echo final=1; ";
    if (plan.method == TransferMethod::BLOCK_CLONE) {
        command << DatasetExists(plan.destDataset) << " && echo dataset=1; "
                << DatasetExists(FinalDataset(plan)) << " && echo final=1; "
                << DatasetExists(plan.stagingPath) << " && echo staging=1; ";
    } else {
        command << "[ -e " << Quote(plan.stagingPath) << " ] && echo staging=1; "
                << "[ -e " << Quote(plan.asidePath) << " ] && echo aside=1; ";
    }
    command << "true";
    return command.str();
}

std::string TransferOrchestrator::BuildFileCommitCommand(const VolumePlan& plan) {
    const std::string finalPath = Quote(plan.finalPath);
    const std::string staging = Quote(plan.stagingPath);
    const std::string aside = Quote(plan.asidePath);

    // Re-running after an interrupted commit must not move our own data aside.
    std::ostringstream command;
    command << "set -e; "
            << "if [ ! -e " << staging << " ] && [ -e " << finalPath << " ]; then "
            << "if [ -e " << aside << " ]; then echo aside=1; fi; echo committed=1; exit 0; fi; "
            << "if [ -e " << finalPath << " ]; then mv -T " << finalPath << " " << aside << "; fi; "
            << "if [ -e " << aside << " ]; then echo aside=1; fi; "
            << "mv -T " << staging << " " << finalPath << "; echo committed=1";
    return command.str();
}

std::string TransferOrchestrator::BuildDatasetCommitCommand(const VolumePlan& plan) {
    const std::string finalDataset = FinalDataset(plan);
    std::ostringstream command;
    command << "set -e; "
            << "if ! " << DatasetExists(finalDataset) << "; then zfs rename " << Quote(plan.stagingPath) << " "
            << Quote(finalDataset) << "; fi; "
            << "zfs set mountpoint=" << Quote(plan.finalPath) << " " << Quote(finalDataset) << "; "
            << "if [ \"$(zfs get -H -o value mounted " << Quote(finalDataset) << ")\" != yes ]; then zfs mount "
            << Quote(finalDataset) << "; fi; echo committed=1";
    return command.str();
}

std::string TransferOrchestrator::BuildSendCommand(const VolumePlan& plan, const std::string& resumeToken) const {
    const std::string send = resumeToken.empty()
        ? "zfs send " + Quote(plan.sendSnapshot)
        : "zfs send -t " + Quote(resumeToken);
    const std::string receive = "zfs receive -s -u " + Quote(plan.stagingPath);

    if (destination_.IsLocal() && source_.IsLocal()) {
        return send + " | " + receive;
    }

    const auto& credentials = destination_.Credentials();
    return send + " | " + RemoteExecutor::BuildSshTransport(credentials, commandTimeout_) + " "
        + credentials.user + "@" + credentials.host + " " + Quote(receive);
}

TransferResult TransferOrchestrator::Execute(
    const VolumePlan& plan,
    const ChecksumManifest& manifest,
    TransferCheckpoint& checkpoint,
    const Hooks& hooks) const {
    TransferResult result;
    result.volumeSource = plan.mount.source;
    result.method = plan.method;
    result.stagingPath = plan.stagingPath;

    if (!manifest.Valid()) {
        throw TransferError(TransferError::Cause::OTHER, "No valid checksum manifest for " + plan.mount.source);
    }
    if (manifest.UnreadableCount() > 0) {
        throw TransferError(
            TransferError::Cause::SOURCE_READ,
            std::to_string(manifest.UnreadableCount()) + " unreadable file(s) in snapshot of " + plan.mount.source);
    }

    if (!checkpoint.dryRunDone) {
        ThrowIfCancelled(hooks, plan.mount.source);
        DryRun(plan, checkpoint);
        checkpoint.dryRunDone = true;
        Notify(hooks, checkpoint);
    }

    if (checkpoint.committed) {
        result.filesSkipped = manifest.entries.size();
        return result;
    }

    if (checkpoint.staged && RecoverInterruptedCommit(plan, manifest, checkpoint, hooks)) {
        result.filesSkipped = manifest.entries.size();
        return result;
    }

    ThrowIfCancelled(hooks, plan.mount.source);
    if (plan.method == TransferMethod::BLOCK_CLONE) {
        CloneDataset(plan, manifest, checkpoint, result, hooks);
    } else {
        SyncFiles(plan, manifest, checkpoint, result, hooks);
    }

    Commit(plan, checkpoint, hooks);
    std::cout << "[Transfer] " << plan.mount.source << " -> " << destination_.HostId() << ":" << plan.finalPath
              << " via " << TransferMethodName(plan.method) << " (" << result.filesTransferred << " copied, "
              << result.filesSkipped << " skipped, " << result.bytesTransferred << " bytes)" << std::endl;
    return result;
}

// The commit rename can land on the destination without the checkpoint
// recording it. Staging gone with the final path present means it did.
bool TransferOrchestrator::RecoverInterruptedCommit(
    const VolumePlan& plan,
    const ChecksumManifest& manifest,
    TransferCheckpoint& checkpoint,
    const Hooks& hooks) const {
    const CommandResult check = RunDestination(BuildDestinationCheckCommand(plan), "staging check");
    if (HasLine(check.output, "staging=1")) {
        return false;
    }

    const bool copiedAll = checkpoint.fileCursor >= manifest.entries.size();
    if (HasLine(check.output, "final=1") && copiedAll) {
        std::cout << "[Transfer] " << plan.finalPath << " already holds the staged copy of " << plan.mount.source
                  << "; finishing commit" << std::endl;
        Commit(plan, checkpoint, hooks);
        return true;
    }

    if (plan.method == TransferMethod::FILE_SYNC && checkpoint.fileCursor > 0) {
        throw TransferError(
            TransferError::Cause::OTHER,
            "Staging data at " + plan.stagingPath + " disappeared after " + std::to_string(checkpoint.fileCursor) + " file(s)");
    }
    return false;
}

void TransferOrchestrator::DryRun(const VolumePlan& plan, const TransferCheckpoint& checkpoint) const {
    const CommandResult check = RunDestination(BuildDestinationCheckCommand(plan), "destination check");
    if (!HasLine(check.output, "writable=1")) {
        throw TransferError(
            TransferError::Cause::PERMISSION,
            "Destination " + Dirname(plan.finalPath) + " is not writable on " + destination_.HostId());
    }
    if (HasLine(check.output, "staging=1") && !checkpoint.staged) {
        throw TransferError(TransferError::Cause::OTHER, "Stale staging data at " + plan.stagingPath);
    }

    if (plan.method == TransferMethod::BLOCK_CLONE) {
        if (!HasLine(check.output, "dataset=1")) {
            throw TransferError(TransferError::Cause::OTHER, "Destination dataset " + plan.destDataset + " does not exist");
        }
        if (HasLine(check.output, "final=1")) {
            throw TransferError(TransferError::Cause::OTHER, "Destination " + plan.finalPath + " already exists");
        }

        retry_.Run("dry-run of " + plan.mount.source, [&]() {
            const CommandResult estimate = source_.Run("zfs send -nv " + Quote(plan.sendSnapshot), commandTimeout_);
            if (!estimate.Ok()) {
                throw TransferError(SyncPrimitive::ClassifyFailure(estimate), "zfs send dry-run failed: " + Trim(estimate.output));
            }
        });
        return;
    }

    if (HasLine(check.output, "aside=1")) {
        throw TransferError(TransferError::Cause::OTHER, "Path conflict at " + plan.asidePath);
    }

    RunDestination("mkdir -p " + Quote(Dirname(plan.finalPath)), "destination base");
    retry_.Run("dry-run of " + plan.mount.source, [&]() { primitive_.DryRun(plan.readPath, plan.stagingPath); });
}

void TransferOrchestrator::SyncFiles(
    const VolumePlan& plan,
    const ChecksumManifest& manifest,
    TransferCheckpoint& checkpoint,
    TransferResult& result,
    const Hooks& hooks) const {
    if (!checkpoint.staged) {
        RunDestination("mkdir -p " + Quote(plan.stagingPath), "staging directory");
        checkpoint.staged = true;
        Notify(hooks, checkpoint);
    }

    retry_.Run(
        "directory tree of " + plan.mount.source,
        [&]() { primitive_.SyncDirectories(plan.readPath, plan.stagingPath); },
        hooks.cancelled);

    size_t index = 0;
    for (const auto& [relative, hash] : manifest.entries) {
        if (index < checkpoint.fileCursor) {
            ++index;
            ++result.filesSkipped;
            continue;
        }

        ThrowIfCancelled(hooks, plan.mount.source);
        checkpoint.partialFile = relative;
        Notify(hooks, checkpoint);

        const unsigned long long bytes = retry_.Run(
            relative,
            [&]() { return primitive_.CopyFile(plan.readPath, relative, plan.stagingPath); },
            hooks.cancelled);

        ++index;
        checkpoint.fileCursor = index;
        checkpoint.confirmedBytes += bytes;
        checkpoint.partialFile.clear();
        Notify(hooks, checkpoint);

        ++result.filesTransferred;
        result.bytesTransferred += bytes;
    }

    // Copying files bumps directory mtimes; set them again now the tree is complete.
    retry_.Run(
        "directory metadata of " + plan.mount.source,
        [&]() { primitive_.SyncDirectories(plan.readPath, plan.stagingPath); },
        hooks.cancelled);
}

void TransferOrchestrator::CloneDataset(
    const VolumePlan& plan,
    const ChecksumManifest& manifest,
    TransferCheckpoint& checkpoint,
    TransferResult& result,
    const Hooks& hooks) const {
    if (!checkpoint.staged) {
        checkpoint.staged = true;
        Notify(hooks, checkpoint);
    }

    retry_.Run(
        "send of " + plan.sendSnapshot,
        [&]() {
            if (checkpoint.resumeToken.empty()) {
                RunDestination(
                    "if " + DatasetExists(plan.stagingPath) + "; then zfs destroy -r " + Quote(plan.stagingPath) + "; fi",
                    "staging reset");
            }

            const CommandResult sent = source_.Run(BuildSendCommand(plan, checkpoint.resumeToken), transferTimeout_);
            if (sent.Ok()) {
                return;
            }

            const CommandResult token = destination_.Run(
                "zfs get -H -o value receive_resume_token " + Quote(plan.stagingPath), commandTimeout_);
            const std::string value = Trim(token.output);
            if (token.Ok() && !value.empty() && value != "-") {
                checkpoint.resumeToken = value;
                Notify(hooks, checkpoint);
            }
            throw TransferError(SyncPrimitive::ClassifyFailure(sent), "zfs send of " + plan.sendSnapshot + " failed: " + Trim(sent.output));
        },
        hooks.cancelled);

    checkpoint.resumeToken.clear();
    checkpoint.fileCursor = manifest.entries.size();
    Notify(hooks, checkpoint);
    result.filesTransferred = manifest.entries.size();
}

void TransferOrchestrator::Commit(const VolumePlan& plan, TransferCheckpoint& checkpoint, const Hooks& hooks) const {
    const std::string command = plan.method == TransferMethod::BLOCK_CLONE
        ? BuildDatasetCommitCommand(plan)
        : BuildFileCommitCommand(plan);
    const CommandResult committed = RunDestination(command, "commit of " + plan.finalPath);

    if (HasLine(committed.output, "aside=1")) {
        checkpoint.movedAsidePath = plan.asidePath;
        std::cout << "[Transfer] Existing " << plan.finalPath << " moved aside to " << plan.asidePath << std::endl;
    }
    checkpoint.committed = HasLine(committed.output, "committed=1");
    checkpoint.partialFile.clear();
    Notify(hooks, checkpoint);

    if (!checkpoint.committed) {
        throw TransferError(TransferError::Cause::OTHER, "Commit of " + plan.finalPath + " did not complete");
    }
}

CommandResult TransferOrchestrator::RunDestination(const std::string& command, const std::string& what) const {
    CommandResult result = destination_.Run(command, commandTimeout_);
    if (!result.Ok()) {
        throw TransferError(
            SyncPrimitive::ClassifyFailure(result),
            what + " on " + destination_.HostId() + " failed: " + Trim(result.output));
    }
    return result;
}
