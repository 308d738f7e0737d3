#include "SyncPrimitive.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
constexpr int kRsyncSocketError = 10;
constexpr int kRsyncProtocolError = 12;
constexpr int kRsyncTimeout = 30;
constexpr int kRsyncConnectTimeout = 35;

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

TransferError::Cause ClassifyErrorCode(const std::error_code& ec) {
    if (ec.value() == ENOSPC || ec.value() == EDQUOT) {
        return TransferError::Cause::DESTINATION_FULL;
    }
    if (ec.value() == EACCES || ec.value() == EPERM || ec.value() == EROFS) {
        return TransferError::Cause::PERMISSION;
    }
    return TransferError::Cause::OTHER;
}

std::filesystem::path NearestExisting(std::filesystem::path path) {
    std::error_code ec;
    while (!path.empty() && !std::filesystem::exists(path, ec)) {
        const auto parent = path.parent_path();
        if (parent == path) {
            break;
        }
        path = parent;
    }
    return path;
}

std::error_code LastError() {
    return std::error_code(errno, std::generic_category());
}

struct stat StatNoFollow(const std::filesystem::path& path) {
    struct stat info {};
    if (lstat(path.c_str(), &info) != 0) {
        const std::error_code ec = LastError();
        throw TransferError(TransferError::Cause::SOURCE_READ, "Cannot stat " + path.string() + ": " + ec.message());
    }
    return info;
}

// Ownership is only carried over when running as root; timestamps always are.
void CopyMetadata(const struct stat& source, const std::filesystem::path& target) {
    if (geteuid() == 0 && lchown(target.c_str(), source.st_uid, source.st_gid) != 0) {
        const std::error_code ec = LastError();
        throw TransferError(ClassifyErrorCode(ec), "Cannot set owner of " + target.string() + ": " + ec.message());
    }
    // chown clears setuid and setgid bits
    if (!S_ISLNK(source.st_mode) && chmod(target.c_str(), source.st_mode & 07777) != 0) {
        const std::error_code ec = LastError();
        throw TransferError(ClassifyErrorCode(ec), "Cannot set mode of " + target.string() + ": " + ec.message());
    }
    const struct timespec times[2] = {source.st_atim, source.st_mtim};
    if (utimensat(AT_FDCWD, target.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        const std::error_code ec = LastError();
        throw TransferError(ClassifyErrorCode(ec), "Cannot set times of " + target.string() + ": " + ec.message());
    }
}

std::string JoinPath(const std::string& root, const std::string& relative) {
    if (root.empty() || root.back() == '/') {
        return root + relative;
    }
    return root + "/" + relative;
}
} // namespace

TransferError::Cause SyncPrimitive::ClassifyFailure(const CommandResult& result) {
    const std::string& output = result.output;
    if (Contains(output, "No space left on device") || Contains(output, "Disk quota exceeded")) {
        return TransferError::Cause::DESTINATION_FULL;
    }
    if (Contains(output, "[sender]") || Contains(output, "send_files failed") || Contains(output, "link_stat")) {
        return TransferError::Cause::SOURCE_READ;
    }
    if (result.timedOut
        || result.exitCode == SshExecutor::kSshConnectionFailure
        || result.exitCode == kRsyncSocketError
        || result.exitCode == kRsyncProtocolError
        || result.exitCode == kRsyncTimeout
        || result.exitCode == kRsyncConnectTimeout
        || Contains(output, "Connection refused")
        || Contains(output, "Connection reset")
        || Contains(output, "Connection timed out")
        || Contains(output, "Broken pipe")
        || Contains(output, "connection unexpectedly closed")
        || Contains(output, "Network is unreachable")
        || Contains(output, "No route to host")) {
        return TransferError::Cause::TRANSIENT_NETWORK;
    }
    if (Contains(output, "Permission denied") || Contains(output, "Read-only file system")) {
        return TransferError::Cause::PERMISSION;
    }
    return TransferError::Cause::OTHER;
}

void LocalCopyPrimitive::DryRun(const std::string& sourceRoot, const std::string& stagingRoot) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(sourceRoot, ec) || access(sourceRoot.c_str(), R_OK | X_OK) != 0) {
        throw TransferError(TransferError::Cause::SOURCE_READ, "Source root " + sourceRoot + " is not readable");
    }

    const auto anchor = NearestExisting(stagingRoot);
    if (anchor.empty() || !std::filesystem::is_directory(anchor, ec)) {
        throw TransferError(TransferError::Cause::OTHER, "Staging path " + stagingRoot + " conflicts with a non-directory");
    }
    if (access(anchor.c_str(), W_OK | X_OK) != 0) {
        throw TransferError(TransferError::Cause::PERMISSION, "Staging path " + stagingRoot + " is not writable");
    }
}

unsigned long long LocalCopyPrimitive::CopyFile(
    const std::string& sourceRoot,
    const std::string& relativePath,
    const std::string& stagingRoot) const {
    const std::filesystem::path source = JoinPath(sourceRoot, relativePath);
    const std::filesystem::path target = JoinPath(stagingRoot, relativePath);

    const struct stat sourceInfo = StatNoFollow(source);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw TransferError(ClassifyErrorCode(ec), "Cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    const bool targetIsLink = std::filesystem::is_symlink(std::filesystem::symlink_status(target, ec));
    if (S_ISLNK(sourceInfo.st_mode) || targetIsLink) {
        std::filesystem::remove(target, ec);
        if (ec) {
            throw TransferError(ClassifyErrorCode(ec), "Cannot replace " + target.string() + ": " + ec.message());
        }
    }

    if (S_ISLNK(sourceInfo.st_mode)) {
        std::filesystem::copy_symlink(source, target, ec);
        if (ec) {
            throw TransferError(ClassifyErrorCode(ec), "Link copy of " + relativePath + " failed: " + ec.message());
        }
        CopyMetadata(sourceInfo, target);
        return 0;
    }

    {
        std::ifstream readable(source, std::ios::binary);
        if (!readable) {
            throw TransferError(TransferError::Cause::SOURCE_READ, "Cannot read source file " + source.string());
        }
    }

    std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw TransferError(ClassifyErrorCode(ec), "Copy of " + relativePath + " failed: " + ec.message());
    }
    CopyMetadata(sourceInfo, target);

    const auto size = std::filesystem::file_size(target, ec);
    return ec ? 0 : static_cast<unsigned long long>(size);
}

void LocalCopyPrimitive::SyncDirectories(const std::string& sourceRoot, const std::string& stagingRoot) const {
    std::error_code ec;
    const std::filesystem::path root(sourceRoot);
    const std::filesystem::path staging(stagingRoot);

    std::filesystem::create_directories(staging, ec);
    if (ec) {
        throw TransferError(ClassifyErrorCode(ec), "Cannot create " + stagingRoot + ": " + ec.message());
    }

    std::filesystem::recursive_directory_iterator it(root, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (!it->is_directory(entryError) || it->is_symlink(entryError)) {
            continue;
        }

        const auto target = staging / it->path().lexically_relative(root);
        std::filesystem::create_directories(target, entryError);
        if (entryError) {
            throw TransferError(ClassifyErrorCode(entryError), "Cannot create " + target.string() + ": " + entryError.message());
        }
        CopyMetadata(StatNoFollow(it->path()), target);
    }
    if (ec) {
        throw TransferError(TransferError::Cause::SOURCE_READ, "Directory walk of " + sourceRoot + " failed: " + ec.message());
    }

    CopyMetadata(StatNoFollow(root), staging);
}

RsyncPrimitive::RsyncPrimitive(
    const RemoteExecutor& source,
    HostCredentials destination,
    std::chrono::seconds connectTimeout,
    std::chrono::seconds transferTimeout)
    : source_(source),
      destination_(std::move(destination)),
      connectTimeout_(connectTimeout),
      transferTimeout_(transferTimeout) {}

void RsyncPrimitive::DryRun(const std::string& sourceRoot, const std::string& stagingRoot) const {
    std::ostringstream command;
    command << "rsync -anR --partial"
            << " -e " << RemoteExecutor::QuoteArgument(RemoteExecutor::BuildSshTransport(destination_, connectTimeout_))
            << " " << RemoteExecutor::QuoteArgument(JoinPath(sourceRoot, "./"))
            << " " << RemoteExecutor::QuoteArgument(Target(stagingRoot));
    RunChecked(command.str(), "dry-run of " + sourceRoot);
}

unsigned long long RsyncPrimitive::CopyFile(
    const std::string& sourceRoot,
    const std::string& relativePath,
    const std::string& stagingRoot) const {
    const CommandResult result = RunChecked(BuildCopyCommand(sourceRoot, relativePath, stagingRoot, false), relativePath);
    return ParseTransferredBytes(result.output);
}

void RsyncPrimitive::SyncDirectories(const std::string& sourceRoot, const std::string& stagingRoot) const {
    RunChecked(BuildDirectoryCommand(sourceRoot, stagingRoot), "directory tree of " + sourceRoot);
}

std::string RsyncPrimitive::BuildCopyCommand(
    const std::string& sourceRoot,
    const std::string& relativePath,
    const std::string& stagingRoot,
    bool dryRun) const {
    std::ostringstream command;
    command << "rsync -aR --partial --out-format='%l %n'" << (dryRun ? " -n" : "")
            << " -e " << RemoteExecutor::QuoteArgument(RemoteExecutor::BuildSshTransport(destination_, connectTimeout_))
            << " " << RemoteExecutor::QuoteArgument(JoinPath(sourceRoot, "./" + relativePath))
            << " " << RemoteExecutor::QuoteArgument(Target(stagingRoot));
    return command.str();
}

std::string RsyncPrimitive::BuildDirectoryCommand(const std::string& sourceRoot, const std::string& stagingRoot) const {
    std::ostringstream command;
    command << "rsync -a --include='*/' --exclude='*'"
            << " -e " << RemoteExecutor::QuoteArgument(RemoteExecutor::BuildSshTransport(destination_, connectTimeout_))
            << " " << RemoteExecutor::QuoteArgument(JoinPath(sourceRoot, ""))
            << " " << RemoteExecutor::QuoteArgument(Target(stagingRoot));
    return command.str();
}

unsigned long long RsyncPrimitive::ParseTransferredBytes(const std::string& output) {
    unsigned long long total = 0;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const auto space = line.find(' ');
        if (space == std::string::npos || line.back() == '/') {
            continue;
        }
        try {
            total += std::stoull(line.substr(0, space));
        } catch (const std::exception&) {
            continue;
        }
    }
    return total;
}

std::string RsyncPrimitive::Target(const std::string& stagingRoot) const {
    return destination_.user + "@" + destination_.host + ":" + JoinPath(stagingRoot, "");
}

CommandResult RsyncPrimitive::RunChecked(const std::string& command, const std::string& what) const {
    CommandResult result = source_.Run(command, transferTimeout_);
    if (!result.Ok()) {
        const auto cause = ClassifyFailure(result);
        throw TransferError(cause, "rsync " + what + " from " + source_.HostId() + " failed (exit "
            + std::to_string(result.exitCode) + "): " + result.output);
    }
    return result;
}
