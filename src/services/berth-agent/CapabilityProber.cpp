#include "CapabilityProber.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace {
constexpr const char* kProbeMarker = "berth-probe";

bool ContainsInsensitive(const std::string& haystack, const std::string& needle) {
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
    return it != haystack.end();
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}
} // namespace

CapabilityProber::CapabilityProber(std::chrono::seconds probeTimeout, std::vector<std::string> candidatePaths)
    : probeTimeout_(probeTimeout),
      candidatePaths_(std::move(candidatePaths)) {}

std::vector<std::string> CapabilityProber::DefaultCandidatePaths() {
    return {"/mnt/cache/appdata", "/mnt/user/appdata", "/opt/appdata", "/opt/docker", "/srv"};
}

HostCapabilities CapabilityProber::Probe(const RemoteExecutor& executor, const std::vector<std::string>& extraPaths) const {
    HostCapabilities caps;
    caps.hostId = executor.HostId();

    const auto started = std::chrono::steady_clock::now();
    const CommandResult reach = executor.Run(std::string("echo ") + kProbeMarker, probeTimeout_);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (ContainsInsensitive(reach.output, "permission denied")) {
        throw PermissionError("Shell credentials rejected by " + caps.hostId + ": " + Trim(reach.output));
    }
    if (!reach.Ok() || reach.output.find(kProbeMarker) == std::string::npos) {
        throw UnreachableError(
            "Host " + caps.hostId + " unreachable"
            + (reach.timedOut ? std::string(" (timeout)") : std::string()) + ": " + Trim(reach.output));
    }

    caps.reachable = true;
    caps.latencyMs = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

    const CommandResult runtime = executor.Run("docker version --format '{{.Server.Version}}'", probeTimeout_);
    if (runtime.Ok() && !Trim(runtime.output).empty()) {
        caps.runtimeAvailable = true;
        caps.runtimeVersion = Trim(runtime.output);
    } else {
        caps.failedProbes.push_back("runtime: " + Trim(runtime.output));
    }

    const CommandResult zfsVersion = executor.Run("zfs version", probeTimeout_);
    if (zfsVersion.Ok()) {
        const CommandResult pools = executor.Run("zpool list -H -o name", probeTimeout_);
        const CommandResult datasets = executor.Run("zfs list -H -o name,mountpoint", probeTimeout_);
        if (pools.Ok() && datasets.Ok()) {
            caps.cowAvailable = true;
            caps.cowSystem = "zfs";
            caps.pools = ParseLines(pools.output);
            caps.datasets = ParseDatasetList(datasets.output);
        } else {
            caps.failedProbes.push_back("cow: pool listing failed");
        }
    } else {
        caps.failedProbes.push_back("cow: zfs unavailable");
    }

    std::set<std::string> seen;
    std::vector<std::string> paths = extraPaths;
    paths.insert(paths.end(), candidatePaths_.begin(), candidatePaths_.end());
    for (const auto& path : paths) {
        if (path.empty() || !seen.insert(path).second) {
            continue;
        }

        const CommandResult probe = executor.Run(BuildPathProbeCommand(path), probeTimeout_);
        if (!probe.Ok()) {
            caps.failedProbes.push_back("path " + path + ": " + Trim(probe.output));
            continue;
        }
        caps.paths.push_back(ParsePathProbe(path, probe.output));
    }

    if (caps.Partial()) {
        std::cout << "[Probe] " << caps.hostId << " probed with " << caps.failedProbes.size()
                  << " degraded sub-probe(s)." << std::endl;
    }
    return caps;
}

std::string CapabilityProber::BuildPathProbeCommand(const std::string& path) {
    const std::string quoted = RemoteExecutor::QuoteArgument(path);
    std::ostringstream command;
    command << "p=" << quoted << "; "
            << "[ -d \"$p\" ] && echo exists=1; "
            << "while [ ! -d \"$p\" ]; do p=$(dirname \"$p\"); done; "
            << "[ -w \"$p\" ] && echo writable=1; "
            << "echo avail=$(df -B1 --output=avail \"$p\" | tail -n 1)";
    return command.str();
}

PathCapacity CapabilityProber::ParsePathProbe(const std::string& path, const std::string& output) {
    PathCapacity capacity;
    capacity.path = path;

    for (const auto& line : ParseLines(output)) {
        if (line == "exists=1") {
            capacity.exists = true;
        } else if (line == "writable=1") {
            capacity.writable = true;
        } else if (line.rfind("avail=", 0) == 0) {
            try {
                capacity.freeBytes = std::stoull(Trim(line.substr(6)));
            } catch (const std::exception&) {
                capacity.freeBytes = 0;
            }
        }
    }
    return capacity;
}

std::vector<std::pair<std::string, std::string>> CapabilityProber::ParseDatasetList(const std::string& output) {
    std::vector<std::pair<std::string, std::string>> datasets;
    for (const auto& line : ParseLines(output)) {
        const auto tab = line.find('\t');
        if (tab == std::string::npos) {
            continue;
        }
        datasets.emplace_back(line.substr(0, tab), line.substr(tab + 1));
    }
    return datasets;
}

std::vector<std::string> CapabilityProber::ParseLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = Trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}
