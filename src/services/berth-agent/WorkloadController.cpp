#include "WorkloadController.hpp"

#include <iostream>
#include <sstream>

namespace {
std::string Quote(const std::string& value) {
    return RemoteExecutor::QuoteArgument(value);
}

std::string Basename(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool IsWithin(const std::string& path, const std::string& directory) {
    return path == directory || path.rfind(directory + "/", 0) == 0;
}

std::string EscapeSed(const std::string& value) {
    std::string escaped;
    for (const char ch : value) {
        if (ch == '|' || ch == '\\' || ch == '&' || ch == '.' || ch == '[' || ch == ']' || ch == '*' || ch == '^' || ch == '$') {
            escaped += '\\';
        }
        escaped += ch;
    }
    return escaped;
}

std::string BuildNetworkEnsureCommand(const std::string& network) {
    return "docker network inspect " + Quote(network) + " >/dev/null 2>&1 || docker network create " + Quote(network);
}
} // namespace

DockerWorkloadController::DockerWorkloadController(std::chrono::seconds commandTimeout)
    : commandTimeout_(commandTimeout) {}

void DockerWorkloadController::Stop(const MigrationUnit& unit, const RemoteExecutor& host) {
    const std::string command = BuildStopCommand(unit);
    if (command.empty()) {
        return;
    }

    RunChecked(command, host, "stop of " + unit.Name());
    std::cout << "[Workload] Stopped " << unit.Name() << " on " << host.HostId() << std::endl;
}

void DockerWorkloadController::Start(const MigrationUnit& unit, const PathRewrites& rewrites, const RemoteExecutor& host) {
    for (const auto& command : BuildStartCommands(unit, rewrites)) {
        RunChecked(command, host, "start of " + unit.Name());
    }
    std::cout << "[Workload] Started " << unit.Name() << " on " << host.HostId()
              << (rewrites.empty() ? " in place" : " against migrated data") << std::endl;
}

std::string DockerWorkloadController::RewritePath(const std::string& path, const PathRewrites& rewrites) {
    const std::pair<const std::string, std::string>* best = nullptr;
    for (const auto& rewrite : rewrites) {
        if (IsWithin(path, rewrite.first) && (best == nullptr || rewrite.first.size() > best->first.size())) {
            best = &rewrite;
        }
    }
    if (best == nullptr) {
        return path;
    }
    return best->second + path.substr(best->first.size());
}

std::string DockerWorkloadController::BuildStopCommand(const MigrationUnit& unit) {
    if (const auto* project = std::get_if<ComposeProject>(&unit.kind)) {
        return "docker compose -p " + Quote(project->name) + " stop";
    }

    const auto& containers = unit.Containers();
    if (containers.empty()) {
        return {};
    }

    std::string command = "docker stop";
    for (const auto& container : containers) {
        command += " " + Quote(container.id.empty() ? container.name : container.id);
    }
    return command;
}

std::vector<std::string> DockerWorkloadController::BuildStartCommands(const MigrationUnit& unit, const PathRewrites& rewrites) {
    std::vector<std::string> commands;

    if (const auto* project = std::get_if<ComposeProject>(&unit.kind)) {
        if (project->workingDir.empty()) {
            commands.push_back("docker compose -p " + Quote(project->name) + " start");
            return commands;
        }

        const std::string workingDir = RewritePath(project->workingDir, rewrites);
        const std::string composeFile = project->composeFile.empty()
            ? std::string()
            : RewritePath(project->composeFile, rewrites);

        // Bind sources inside the project directory moved with it; the rest
        // are absolute paths that the compose file must be pointed at.
        if (!composeFile.empty()) {
            for (const auto& [from, to] : rewrites) {
                if (from == to || IsWithin(from, project->workingDir)) {
                    continue;
                }
                commands.push_back(
                    "sed -i " + Quote("s|" + EscapeSed(from) + "|" + EscapeSed(to) + "|g") + " " + Quote(composeFile));
            }
        }

        std::string up = "cd " + Quote(workingDir) + " && docker compose -p " + Quote(project->name);
        if (!composeFile.empty()) {
            up += " -f " + Quote(Basename(composeFile));
        }
        commands.push_back(up + " up -d");
        return commands;
    }

    const auto& containers = unit.Containers();
    if (rewrites.empty()) {
        std::string command = "docker start";
        for (const auto& container : containers) {
            command += " " + Quote(container.id.empty() ? container.name : container.id);
        }
        if (!containers.empty()) {
            commands.push_back(command);
        }
        return commands;
    }

    for (const auto& network : unit.networks) {
        commands.push_back(BuildNetworkEnsureCommand(network));
    }
    for (const auto& container : containers) {
        commands.push_back(BuildRunCommand(container, rewrites));
        for (size_t i = 1; i < container.networks.size(); ++i) {
            commands.push_back("docker network connect " + Quote(container.networks[i]) + " " + Quote(container.name));
        }
    }
    return commands;
}

std::string DockerWorkloadController::BuildRunCommand(const ContainerSpec& container, const PathRewrites& rewrites) {
    std::ostringstream command;
    command << "docker run -d";
    if (!container.name.empty()) {
        command << " --name " << Quote(container.name);
    }
    if (!container.networks.empty()) {
        command << " --network " << Quote(container.networks.front());
    }
    for (const auto& variable : container.environment) {
        command << " -e " << Quote(variable);
    }
    for (const auto& mount : container.mounts) {
        std::string spec = RewritePath(mount.source, rewrites) + ":" + mount.destination;
        if (mount.readOnly) {
            spec += ":ro";
        }
        command << " -v " << Quote(spec);
    }
    command << " " << Quote(container.image);
    return command.str();
}

void DockerWorkloadController::RunChecked(const std::string& command, const RemoteExecutor& host, const std::string& what) const {
    const CommandResult result = host.Run(command, commandTimeout_);
    if (!result.Ok()) {
        throw WorkloadError(
            what + " on " + host.HostId() + " failed"
            + (result.timedOut ? std::string(" (timeout)") : std::string()) + ": " + result.output);
    }
}
