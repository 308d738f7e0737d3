#include "DiscoveryService.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace {
constexpr const char* kProjectLabel = "com.docker.compose.project";
constexpr const char* kServiceLabel = "com.docker.compose.service";
constexpr const char* kWorkingDirLabel = "com.docker.compose.project.working_dir";
constexpr const char* kConfigFilesLabel = "com.docker.compose.project.config_files";

std::vector<std::string> SplitLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

bool IsDefaultNetwork(const std::string& name) {
    return name == "bridge" || name == "host" || name == "none";
}

std::string LabelValue(const nlohmann::json& labels, const char* key) {
    if (!labels.is_object() || !labels.contains(key) || !labels[key].is_string()) {
        return {};
    }
    return labels[key].get<std::string>();
}

std::string FirstConfigFile(const std::string& configFiles) {
    const auto comma = configFiles.find(',');
    return comma == std::string::npos ? configFiles : configFiles.substr(0, comma);
}

std::vector<VolumeMount> CollectVolumes(const std::vector<ContainerSpec>& containers) {
    std::vector<VolumeMount> volumes;
    for (const auto& container : containers) {
        volumes.insert(volumes.end(), container.mounts.begin(), container.mounts.end());
    }
    return DiscoveryService::DeduplicateVolumes(volumes);
}

bool IsWithin(const std::string& path, const std::string& directory) {
    return path == directory || path.rfind(directory + "/", 0) == 0;
}

// The project directory travels with the data so the destination can bring the
// project back up from its own copy. Mounts nested inside it are covered by it.
void AttachProjectDirectory(MigrationUnit& unit, const std::string& directory) {
    if (directory.empty()) {
        return;
    }

    std::vector<VolumeMount> volumes{VolumeMount{directory, directory, false}};
    for (const auto& volume : unit.volumes) {
        if (!IsWithin(volume.source, directory)) {
            volumes.push_back(volume);
        }
    }
    unit.volumes = std::move(volumes);
}
} // namespace

DiscoveryService::DiscoveryService(std::chrono::seconds commandTimeout)
    : commandTimeout_(commandTimeout) {}

std::vector<MigrationUnit> DiscoveryService::Resolve(const std::string& identifier, const RemoteExecutor& executor) const {
    if (identifier.empty()) {
        throw ValidationError("Migration unit identifier is empty");
    }

    std::vector<MigrationUnit> units;
    if (identifier.front() == '/') {
        units = ResolveComposePath(identifier, executor);
    }
    if (units.empty()) {
        units = ResolveComposeProjects(identifier, executor);
    }
    if (units.empty()) {
        units = ResolveContainerSet(identifier, executor);
    }
    if (units.empty()) {
        throw NotFoundError("No compose project or running container matches '" + identifier + "' on " + executor.HostId());
    }

    for (const auto& unit : units) {
        std::cout << "[Discovery] Resolved '" << identifier << "' to " << (unit.IsCompose() ? "compose project " : "container set ")
                  << unit.Name() << " (" << unit.Containers().size() << " container(s), "
                  << unit.volumes.size() << " volume(s))" << std::endl;
    }
    return units;
}

const std::vector<std::string>& DiscoveryService::ComposeFileNames() {
    static const std::vector<std::string> names = {
        "docker-compose.yml", "docker-compose.yaml", "compose.yml", "compose.yaml"};
    return names;
}

std::string DiscoveryService::BuildComposeFileLookupCommand(const std::string& directory) {
    std::ostringstream command;
    command << "for f in";
    for (const auto& name : ComposeFileNames()) {
        command << " " << name;
    }
    command << "; do [ -f " << RemoteExecutor::QuoteArgument(directory) << "/\"$f\" ] && echo \"$f\" && break; done; true";
    return command.str();
}

std::string DiscoveryService::BuildProjectListCommand() {
    return std::string("docker ps -a --format '{{.Label \"") + kProjectLabel + "\"}}'";
}

std::string DiscoveryService::BuildProjectContainersCommand(const std::string& project) {
    return std::string("docker ps -a --filter ")
        + RemoteExecutor::QuoteArgument(std::string("label=") + kProjectLabel + "=" + project)
        + " --format '{{.ID}}'";
}

std::string DiscoveryService::BuildRunningContainersCommand(const std::string& identifier) {
    std::string filter;
    if (identifier.find('=') != std::string::npos) {
        filter = "label=" + identifier;
    } else {
        filter = "name=" + identifier;
    }
    return "docker ps --filter " + RemoteExecutor::QuoteArgument(filter) + " --format '{{.ID}}'";
}

std::vector<MigrationUnit> DiscoveryService::ResolveComposePath(const std::string& directory, const RemoteExecutor& executor) const {
    const CommandResult lookup = RunChecked(executor, BuildComposeFileLookupCommand(directory));
    const auto names = SplitLines(lookup.output);
    if (names.empty()) {
        return {};
    }

    const std::string composeFile = directory + "/" + names.front();
    const CommandResult config = RunChecked(
        executor,
        "docker compose -f " + RemoteExecutor::QuoteArgument(composeFile) + " config --format json");
    if (!config.Ok()) {
        std::cerr << "[Discovery] compose config failed for " << composeFile << ": " << config.output << std::endl;
        return {};
    }

    MigrationUnit unit = ParseComposeConfig(config.output, composeFile);
    auto& project = std::get<ComposeProject>(unit.kind);
    if (project.name.empty()) {
        return {};
    }

    AttachProjectDirectory(unit, project.workingDir);

    const CommandResult ids = RunChecked(executor, BuildProjectContainersCommand(project.name));
    const auto running = Inspect(SplitLines(ids.output), executor);
    for (auto& container : project.containers) {
        for (const auto& live : running) {
            if (live.service == container.service) {
                container.id = live.id;
                container.name = live.name;
            }
        }
    }
    return {unit};
}

std::vector<MigrationUnit> DiscoveryService::ResolveComposeProjects(const std::string& identifier, const RemoteExecutor& executor) const {
    const CommandResult listing = RunChecked(executor, BuildProjectListCommand());
    if (!listing.Ok()) {
        return {};
    }

    std::set<std::string> projects;
    for (const auto& name : SplitLines(listing.output)) {
        projects.insert(name);
    }

    std::vector<std::string> matches;
    if (projects.count(identifier) != 0) {
        matches.push_back(identifier);
    } else {
        for (const auto& name : projects) {
            if (name.find(identifier) != std::string::npos) {
                matches.push_back(name);
            }
        }
    }

    std::vector<MigrationUnit> units;
    for (const auto& name : matches) {
        const CommandResult ids = RunChecked(executor, BuildProjectContainersCommand(name));
        auto containers = Inspect(SplitLines(ids.output), executor);
        if (containers.empty()) {
            continue;
        }

        ComposeProject project;
        project.name = name;

        // Working directory and compose file come from the labels of any member.
        const CommandResult labels = RunChecked(
            executor,
            "docker inspect --format '{{json .Config.Labels}}' " + RemoteExecutor::QuoteArgument(containers.front().id));
        const auto parsed = nlohmann::json::parse(labels.output, nullptr, false);
        if (labels.Ok() && !parsed.is_discarded()) {
            project.workingDir = LabelValue(parsed, kWorkingDirLabel);
            project.composeFile = FirstConfigFile(LabelValue(parsed, kConfigFilesLabel));
        }

        MigrationUnit unit;
        unit.networks = CollectNetworks(containers);
        unit.volumes = CollectVolumes(containers);
        AttachProjectDirectory(unit, project.workingDir);
        project.containers = std::move(containers);
        unit.kind = std::move(project);
        units.push_back(std::move(unit));
    }
    return units;
}

std::vector<MigrationUnit> DiscoveryService::ResolveContainerSet(const std::string& identifier, const RemoteExecutor& executor) const {
    const CommandResult ids = RunChecked(executor, BuildRunningContainersCommand(identifier));
    if (!ids.Ok()) {
        return {};
    }

    auto containers = Inspect(SplitLines(ids.output), executor);
    if (containers.empty()) {
        return {};
    }

    ContainerSet set;
    set.selector = identifier;
    MigrationUnit unit;
    unit.networks = CollectNetworks(containers);
    unit.volumes = CollectVolumes(containers);
    set.containers = std::move(containers);
    unit.kind = std::move(set);
    return {unit};
}

std::vector<ContainerSpec> DiscoveryService::Inspect(const std::vector<std::string>& ids, const RemoteExecutor& executor) const {
    if (ids.empty()) {
        return {};
    }

    std::string command = "docker inspect";
    for (const auto& id : ids) {
        command += " " + RemoteExecutor::QuoteArgument(id);
    }

    const CommandResult result = RunChecked(executor, command);
    if (!result.Ok()) {
        std::cerr << "[Discovery] docker inspect failed: " << result.output << std::endl;
        return {};
    }
    return ParseInspect(result.output);
}

CommandResult DiscoveryService::RunChecked(const RemoteExecutor& executor, const std::string& command) const {
    CommandResult result = executor.Run(command, commandTimeout_);
    if (result.timedOut || result.exitCode == SshExecutor::kSshConnectionFailure) {
        throw UnreachableError("Discovery command on " + executor.HostId() + " failed: " + result.output);
    }
    return result;
}

std::vector<ContainerSpec> DiscoveryService::ParseInspect(const std::string& output) {
    std::vector<ContainerSpec> containers;
    const auto parsed = nlohmann::json::parse(output, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return containers;
    }

    for (const auto& item : parsed) {
        ContainerSpec container;
        container.id = item.value("Id", "");
        container.name = item.value("Name", "");
        if (!container.name.empty() && container.name.front() == '/') {
            container.name.erase(0, 1);
        }

        if (item.contains("Config") && item["Config"].is_object()) {
            const auto& config = item["Config"];
            container.image = config.value("Image", "");
            if (config.contains("Env") && config["Env"].is_array()) {
                container.environment = config["Env"].get<std::vector<std::string>>();
            }
            if (config.contains("Labels")) {
                container.service = LabelValue(config["Labels"], kServiceLabel);
            }
        }

        if (item.contains("Mounts") && item["Mounts"].is_array()) {
            for (const auto& mount : item["Mounts"]) {
                const std::string type = mount.value("Type", "");
                const std::string source = mount.value("Source", "");
                if ((type != "bind" && type != "volume") || source.empty()) {
                    continue;
                }
                container.mounts.push_back(VolumeMount{source, mount.value("Destination", ""), !mount.value("RW", true)});
            }
        }

        if (item.contains("NetworkSettings") && item["NetworkSettings"].contains("Networks")) {
            for (const auto& [name, network] : item["NetworkSettings"]["Networks"].items()) {
                container.networks.push_back(name);
            }
        }

        if (!container.id.empty()) {
            containers.push_back(std::move(container));
        }
    }
    return containers;
}

MigrationUnit DiscoveryService::ParseComposeConfig(const std::string& output, const std::string& composeFile) {
    MigrationUnit unit;
    ComposeProject project;
    project.composeFile = composeFile;
    const auto slash = composeFile.find_last_of('/');
    project.workingDir = slash == std::string::npos ? std::string(".") : composeFile.substr(0, slash);

    const auto parsed = nlohmann::json::parse(output, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        unit.kind = std::move(project);
        return unit;
    }

    project.name = parsed.value("name", "");

    if (parsed.contains("services") && parsed["services"].is_object()) {
        for (const auto& [serviceName, service] : parsed["services"].items()) {
            ContainerSpec container;
            container.service = serviceName;
            container.name = service.value("container_name", project.name + "-" + serviceName + "-1");
            container.image = service.value("image", "");

            if (service.contains("environment") && service["environment"].is_object()) {
                for (const auto& [key, value] : service["environment"].items()) {
                    container.environment.push_back(key + "=" + (value.is_string() ? value.get<std::string>() : std::string()));
                }
            }

            if (service.contains("networks") && service["networks"].is_object()) {
                for (const auto& [network, settings] : service["networks"].items()) {
                    container.networks.push_back(network);
                }
            }

            if (service.contains("volumes") && service["volumes"].is_array()) {
                for (const auto& volume : service["volumes"]) {
                    if (volume.value("type", "") != "bind") {
                        continue;
                    }
                    const std::string source = volume.value("source", "");
                    if (source.empty()) {
                        continue;
                    }
                    container.mounts.push_back(VolumeMount{source, volume.value("target", ""), volume.value("read_only", false)});
                }
            }

            project.containers.push_back(std::move(container));
        }
    }

    if (parsed.contains("networks") && parsed["networks"].is_object()) {
        for (const auto& [key, network] : parsed["networks"].items()) {
            const std::string name = network.is_object() ? network.value("name", key) : key;
            if (!IsDefaultNetwork(name)) {
                unit.networks.push_back(name);
            }
        }
    }

    unit.volumes = CollectVolumes(project.containers);
    unit.kind = std::move(project);
    return unit;
}

std::vector<VolumeMount> DiscoveryService::DeduplicateVolumes(const std::vector<VolumeMount>& volumes) {
    std::vector<VolumeMount> unique;
    std::set<std::string> seen;
    for (const auto& volume : volumes) {
        if (seen.insert(volume.source).second) {
            unique.push_back(volume);
        }
    }
    return unique;
}

std::vector<std::string> DiscoveryService::CollectNetworks(const std::vector<ContainerSpec>& containers) {
    std::vector<std::string> networks;
    std::set<std::string> seen;
    for (const auto& container : containers) {
        for (const auto& network : container.networks) {
            if (!IsDefaultNetwork(network) && seen.insert(network).second) {
                networks.push_back(network);
            }
        }
    }
    return networks;
}
