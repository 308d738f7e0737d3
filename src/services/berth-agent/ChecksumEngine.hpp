#pragma once

#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

class ChecksumEngine {
public:
    explicit ChecksumEngine(std::chrono::seconds remoteTimeout = std::chrono::seconds(3600));

    // Streams every regular file under root through SHA-256 and records each
    // symlink by its target without following it. Files that vanish or cannot
    // be opened are recorded as unreadable, and so is any directory that cannot
    // be listed (keyed "dir/", or "./" for the root).
    ChecksumManifest Generate(const std::string& root) const;

    // Same contract against any host; local executors take the streaming path,
    // remote ones run sha256sum over the shell and parse the listing.
    ChecksumManifest Generate(const RemoteExecutor& executor, const std::string& root) const;

    static DiffResult Compare(const ChecksumManifest& expected, const ChecksumManifest& actual);

    static std::string HashFile(const std::filesystem::path& path, bool& ok);
    static std::string AggregateHash(std::vector<std::pair<std::string, std::string>> entries);
    static std::string AggregateHash(const std::map<std::string, std::string>& entries);

    static std::string BuildListCommand(const std::string& root);
    static std::string BuildHashCommand(const std::string& root);
    // NUL-separated "f <path>", "l <path>" <target> and "u <dir>" records.
    // Regular files map to an empty value until hashed.
    static std::map<std::string, std::string> ParseFileListing(const std::string& output);
    // NUL-terminated sha256sum -z records.
    static std::map<std::string, std::string> ParseHashListing(const std::string& output);

private:
    std::chrono::seconds remoteTimeout_;
};
