#pragma once

#include "MigrationTypes.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class JobStore {
public:
    virtual ~JobStore() = default;

    virtual bool SaveJob(const MigrationJob& job) = 0;
    virtual std::optional<MigrationJob> LoadJob(const std::string& jobId) = 0;
    virtual std::vector<std::string> ListJobs() = 0;
    virtual bool RemoveJob(const std::string& jobId) = 0;
};

// One JSON record per job under <stateDir>/jobs and manifests stored once by
// aggregate hash under <stateDir>/manifests.
class FileJobStore : public JobStore {
public:
    explicit FileJobStore(std::filesystem::path stateDir);

    bool SaveJob(const MigrationJob& job) override;
    std::optional<MigrationJob> LoadJob(const std::string& jobId) override;
    std::vector<std::string> ListJobs() override;
    bool RemoveJob(const std::string& jobId) override;

    std::filesystem::path JobPath(const std::string& jobId) const;
    std::filesystem::path ManifestPath(const std::string& aggregate) const;

private:
    bool SaveManifest(const ChecksumManifest& manifest);
    std::optional<ChecksumManifest> LoadManifest(const std::string& aggregate) const;
    static bool WriteFileAtomically(const std::filesystem::path& path, const std::string& payload);

    std::filesystem::path stateDir_;
    std::mutex mutex_;
};
