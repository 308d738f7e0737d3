#include "CapabilityProber.hpp"
#include "TestSupport.hpp"

#include <string>

int main() {
    const PathCapacity capacity = CapabilityProber::ParsePathProbe("/srv", "exists=1\nwritable=1\navail=123456\n");
    if (!capacity.exists || !capacity.writable || capacity.freeBytes != 123456) {
        return Fail("Path probe output not parsed.");
    }
    const PathCapacity missing = CapabilityProber::ParsePathProbe("/nope", "avail=garbage\n");
    if (missing.exists || missing.writable || missing.freeBytes != 0) {
        return Fail("Absent path should report nothing.");
    }

    const auto datasets = CapabilityProber::ParseDatasetList("tank\t/mnt/tank\ntank/apps\t/mnt/tank/apps\nbroken\n");
    if (datasets.size() != 2 || datasets[1].first != "tank/apps" || datasets[1].second != "/mnt/tank/apps") {
        return Fail("Dataset list not parsed.");
    }

    CommandScript script;
    script.SetPassthrough(false);
    script.On("echo berth-probe", "berth-probe\n");
    script.On("docker version", "24.0.7\n");
    script.On("zfs version", "zfs-2.2.2\n");
    script.On("zpool list", "tank\n");
    script.On("zfs list -H -o name,mountpoint", "tank\t/mnt/tank\ntank/apps\t/mnt/tank/apps\n");
    script.On("p='/mnt/tank/apps/stack'", "writable=1\navail=5000000000\n");

    LocalExecutor host(LocalHost("nas"), script.Runner());
    CapabilityProber prober(std::chrono::seconds(5), {"/srv", "/mnt/tank/apps/stack"});
    const HostCapabilities caps = prober.Probe(host, {"/mnt/tank/apps/stack"});

    if (!caps.reachable || caps.hostId != "nas" || caps.latencyMs < 0) {
        return Fail("Reachable host not reported.");
    }
    if (!caps.runtimeAvailable || caps.runtimeVersion != "24.0.7") {
        return Fail("Runtime version not captured.");
    }
    if (!caps.cowAvailable || caps.cowSystem != "zfs" || caps.pools != std::vector<std::string>{"tank"} || caps.datasets.size() != 2) {
        return Fail("Copy-on-write capabilities not captured.");
    }
    const PathCapacity* stack = caps.FindPath("/mnt/tank/apps/stack");
    if (stack == nullptr || stack->exists || !stack->writable || stack->freeBytes != 5000000000ULL) {
        return Fail("Destination path capacity missing.");
    }
    if (script.Count("p='/mnt/tank/apps/stack'") != 1) {
        return Fail("Duplicate paths should be probed once.");
    }
    if (!caps.Partial() || caps.FindPath("/srv") != nullptr) {
        return Fail("Failed path probe should degrade, not abort.");
    }

    CommandScript bare;
    bare.SetPassthrough(false);
    bare.On("echo berth-probe", "berth-probe\n");
    bare.On("docker version", "Cannot connect to the Docker daemon", 1);
    bare.On("zfs version", "sh: zfs: not found", 127);
    LocalExecutor plainHost(LocalHost("pi"), bare.Runner());
    const HostCapabilities plain = CapabilityProber(std::chrono::seconds(5), {}).Probe(plainHost);
    if (plain.runtimeAvailable || plain.cowAvailable || plain.failedProbes.size() != 2) {
        return Fail("Missing runtime and COW should be recorded as failed sub-probes.");
    }

    CommandScript refused;
    refused.SetPassthrough(false);
    refused.On("ssh ", "ssh: connect to host 10.0.0.9 port 22: Connection timed out", SshExecutor::kSshConnectionFailure);
    SshExecutor offline(RemoteHost("far", "10.0.0.9"), std::chrono::seconds(5), refused.Runner());
    try {
        prober.Probe(offline);
        return Fail("Offline host should be unreachable.");
    } catch (const UnreachableError&) {
    }
    if (refused.Count("ssh ") != 1) {
        return Fail("No sub-probe should run after the reachability check fails.");
    }

    CommandScript denied;
    denied.SetPassthrough(false);
    denied.On("ssh ", "root@10.0.0.9: Permission denied (publickey).", SshExecutor::kSshConnectionFailure);
    SshExecutor locked(RemoteHost("far", "10.0.0.9"), std::chrono::seconds(5), denied.Runner());
    try {
        prober.Probe(locked);
        return Fail("Rejected credentials should throw.");
    } catch (const PermissionError&) {
    }

    return 0;
}
