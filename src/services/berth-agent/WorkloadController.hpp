#pragma once

#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

using PathRewrites = std::map<std::string, std::string>;

class WorkloadController {
public:
    virtual ~WorkloadController() = default;

    virtual void Stop(const MigrationUnit& unit, const RemoteExecutor& host) = 0;
    // Empty rewrites restart the workload in place.
    virtual void Start(const MigrationUnit& unit, const PathRewrites& rewrites, const RemoteExecutor& host) = 0;
};

// Drives the Docker CLI. Throws WorkloadError when the runtime refuses.
class DockerWorkloadController : public WorkloadController {
public:
    explicit DockerWorkloadController(std::chrono::seconds commandTimeout);

    void Stop(const MigrationUnit& unit, const RemoteExecutor& host) override;
    void Start(const MigrationUnit& unit, const PathRewrites& rewrites, const RemoteExecutor& host) override;

    static std::string RewritePath(const std::string& path, const PathRewrites& rewrites);
    static std::string BuildStopCommand(const MigrationUnit& unit);
    static std::vector<std::string> BuildStartCommands(const MigrationUnit& unit, const PathRewrites& rewrites);
    static std::string BuildRunCommand(const ContainerSpec& container, const PathRewrites& rewrites);

private:
    void RunChecked(const std::string& command, const RemoteExecutor& host, const std::string& what) const;

    std::chrono::seconds commandTimeout_;
};
