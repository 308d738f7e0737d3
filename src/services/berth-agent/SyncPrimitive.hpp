#pragma once

#include "MigrationErrors.hpp"
#include "RemoteExecutor.hpp"

#include <chrono>
#include <string>

// File-level copy from a source root into a staging root on the destination.
// Every failure is reported as a TransferError with its cause classified.
class SyncPrimitive {
public:
    virtual ~SyncPrimitive() = default;

    // Exercises the full path without writing data.
    virtual void DryRun(const std::string& sourceRoot, const std::string& stagingRoot) const = 0;

    // Copies sourceRoot/relativePath to stagingRoot/relativePath, overwriting any
    // partial copy left by an earlier attempt. Returns the bytes written.
    virtual unsigned long long CopyFile(
        const std::string& sourceRoot,
        const std::string& relativePath,
        const std::string& stagingRoot) const = 0;

    // Recreates the directory tree (including empty directories) and its modes.
    virtual void SyncDirectories(const std::string& sourceRoot, const std::string& stagingRoot) const = 0;

    static TransferError::Cause ClassifyFailure(const CommandResult& result);
};

// Both ends on the agent's own filesystem.
class LocalCopyPrimitive : public SyncPrimitive {
public:
    void DryRun(const std::string& sourceRoot, const std::string& stagingRoot) const override;
    unsigned long long CopyFile(
        const std::string& sourceRoot,
        const std::string& relativePath,
        const std::string& stagingRoot) const override;
    void SyncDirectories(const std::string& sourceRoot, const std::string& stagingRoot) const override;
};

// rsync over SSH, run on the source host and pushing to the destination.
class RsyncPrimitive : public SyncPrimitive {
public:
    RsyncPrimitive(
        const RemoteExecutor& source,
        HostCredentials destination,
        std::chrono::seconds connectTimeout,
        std::chrono::seconds transferTimeout);

    void DryRun(const std::string& sourceRoot, const std::string& stagingRoot) const override;
    unsigned long long CopyFile(
        const std::string& sourceRoot,
        const std::string& relativePath,
        const std::string& stagingRoot) const override;
    void SyncDirectories(const std::string& sourceRoot, const std::string& stagingRoot) const override;

    std::string BuildCopyCommand(const std::string& sourceRoot, const std::string& relativePath, const std::string& stagingRoot, bool dryRun) const;
    std::string BuildDirectoryCommand(const std::string& sourceRoot, const std::string& stagingRoot) const;
    static unsigned long long ParseTransferredBytes(const std::string& output);

private:
    std::string Target(const std::string& stagingRoot) const;
    CommandResult RunChecked(const std::string& command, const std::string& what) const;

    const RemoteExecutor& source_;
    HostCredentials destination_;
    std::chrono::seconds connectTimeout_;
    std::chrono::seconds transferTimeout_;
};
