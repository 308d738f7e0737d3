#pragma once

#include "MigrationTypes.hpp"
#include "RemoteExecutor.hpp"

#include <chrono>
#include <string>
#include <vector>

class DiscoveryService {
public:
    explicit DiscoveryService(std::chrono::seconds commandTimeout);

    // Returns every matching unit; more than one element means the identifier
    // is ambiguous and the caller must pick. Never returns an empty vector.
    std::vector<MigrationUnit> Resolve(const std::string& identifier, const RemoteExecutor& executor) const;

    static const std::vector<std::string>& ComposeFileNames();
    static std::string BuildComposeFileLookupCommand(const std::string& directory);
    static std::string BuildProjectListCommand();
    static std::string BuildProjectContainersCommand(const std::string& project);
    static std::string BuildRunningContainersCommand(const std::string& identifier);

    static std::vector<ContainerSpec> ParseInspect(const std::string& output);
    static MigrationUnit ParseComposeConfig(const std::string& output, const std::string& composeFile);
    static std::vector<VolumeMount> DeduplicateVolumes(const std::vector<VolumeMount>& volumes);
    static std::vector<std::string> CollectNetworks(const std::vector<ContainerSpec>& containers);

private:
    std::vector<MigrationUnit> ResolveComposePath(const std::string& directory, const RemoteExecutor& executor) const;
    std::vector<MigrationUnit> ResolveComposeProjects(const std::string& identifier, const RemoteExecutor& executor) const;
    std::vector<MigrationUnit> ResolveContainerSet(const std::string& identifier, const RemoteExecutor& executor) const;
    std::vector<ContainerSpec> Inspect(const std::vector<std::string>& ids, const RemoteExecutor& executor) const;
    CommandResult RunChecked(const RemoteExecutor& executor, const std::string& command) const;

    std::chrono::seconds commandTimeout_;
};
