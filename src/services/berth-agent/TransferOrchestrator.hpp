#pragma once

#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"
#include "RetryPolicy.hpp"
#include "SyncPrimitive.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

class TransferOrchestrator {
public:
    struct Hooks {
        // Called after every confirmed unit; must persist before returning.
        std::function<void(const TransferCheckpoint&)> onCheckpoint;
        std::function<bool()> cancelled;
    };

    TransferOrchestrator(
        const RemoteExecutor& source,
        const RemoteExecutor& destination,
        const SyncPrimitive& primitive,
        RetryPolicy retry,
        std::chrono::seconds commandTimeout,
        std::chrono::seconds transferTimeout,
        size_t workers);

    // Block-clone needs the same copy-on-write system on both hosts, a snapshot
    // of a whole dataset on the source and a parent dataset on the destination.
    static TransferMethod SelectMethod(
        const HostCapabilities& sourceCaps,
        const HostCapabilities& destCaps,
        const SnapshotEntry* snapshot,
        const std::string& destDataset,
        bool forceFileSync = false);

    // Fresh transfer: resets the checkpoint and always dry-runs first.
    TransferResult Transfer(
        const VolumePlan& plan,
        const ChecksumManifest& manifest,
        TransferCheckpoint& checkpoint,
        const Hooks& hooks) const;

    // Skips confirmed units and re-copies the partial one from the start.
    TransferResult Resume(
        const VolumePlan& plan,
        const ChecksumManifest& manifest,
        TransferCheckpoint& checkpoint,
        const Hooks& hooks) const;

    // Runs every plan on the bounded worker pool, resuming plans whose
    // checkpoint has already passed the dry-run.
    std::vector<TransferResult> TransferAll(
        const std::vector<VolumePlan>& plans,
        const std::map<std::string, ChecksumManifest>& manifests,
        std::map<std::string, TransferCheckpoint>& checkpoints,
        const Hooks& hooks) const;

    // Undoes every destination-side effect recorded in the checkpoint. Returns
    // false and fills error when the destination could not be restored.
    bool RollbackDestination(const VolumePlan& plan, TransferCheckpoint& checkpoint, std::string& error) const;

    static std::string FinalDataset(const VolumePlan& plan);
    static std::string BuildDestinationCheckCommand(const VolumePlan& plan);
    static std::string BuildFileCommitCommand(const VolumePlan& plan);
    static std::string BuildDatasetCommitCommand(const VolumePlan& plan);
    std::string BuildSendCommand(const VolumePlan& plan, const std::string& resumeToken) const;

private:
    TransferResult Execute(
        const VolumePlan& plan,
        const ChecksumManifest& manifest,
        TransferCheckpoint& checkpoint,
        const Hooks& hooks) const;
    bool RecoverInterruptedCommit(
        const VolumePlan& plan,
        const ChecksumManifest& manifest,
        TransferCheckpoint& checkpoint,
        const Hooks& hooks) const;
    void DryRun(const VolumePlan& plan, const TransferCheckpoint& checkpoint) const;
    void SyncFiles(
        const VolumePlan& plan,
        const ChecksumManifest& manifest,
        TransferCheckpoint& checkpoint,
        TransferResult& result,
        const Hooks& hooks) const;
    void CloneDataset(
        const VolumePlan& plan,
        const ChecksumManifest& manifest,
        TransferCheckpoint& checkpoint,
        TransferResult& result,
        const Hooks& hooks) const;
    void Commit(const VolumePlan& plan, TransferCheckpoint& checkpoint, const Hooks& hooks) const;
    CommandResult RunDestination(const std::string& command, const std::string& what) const;

    const RemoteExecutor& source_;
    const RemoteExecutor& destination_;
    const SyncPrimitive& primitive_;
    RetryPolicy retry_;
    std::chrono::seconds commandTimeout_;
    std::chrono::seconds transferTimeout_;
    size_t workers_;
};
