#pragma once

#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

class CapabilityProber {
public:
    explicit CapabilityProber(
        std::chrono::seconds probeTimeout,
        std::vector<std::string> candidatePaths = DefaultCandidatePaths());

    // Read-only. Throws UnreachableError or PermissionError when the shell
    // itself is unusable; every other sub-probe failure is reported through
    // HostCapabilities::failedProbes with the matching flag left false.
    HostCapabilities Probe(const RemoteExecutor& executor, const std::vector<std::string>& extraPaths = {}) const;

    static std::vector<std::string> DefaultCandidatePaths();

    static std::string BuildPathProbeCommand(const std::string& path);
    static PathCapacity ParsePathProbe(const std::string& path, const std::string& output);
    static std::vector<std::pair<std::string, std::string>> ParseDatasetList(const std::string& output);
    static std::vector<std::string> ParseLines(const std::string& output);

private:
    std::chrono::seconds probeTimeout_;
    std::vector<std::string> candidatePaths_;
};
