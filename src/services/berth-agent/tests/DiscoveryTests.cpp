#include "DiscoveryService.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace {
nlohmann::json Container(const std::string& id, const std::string& name, const std::string& project, const std::string& source) {
    nlohmann::json labels = nlohmann::json::object();
    if (!project.empty()) {
        labels["com.docker.compose.project"] = project;
        labels["com.docker.compose.service"] = name;
    }
    return {
        {"Id", id},
        {"Name", "/" + name},
        {"Config", {{"Image", "postgres:16"}, {"Env", {"PGDATA=/var/lib/postgresql/data"}}, {"Labels", labels}}},
        {"Mounts", {
            {{"Type", "bind"}, {"Source", source}, {"Destination", "/var/lib/postgresql/data"}, {"RW", true}},
            {{"Type", "bind"}, {"Source", "/etc/localtime"}, {"Destination", "/etc/localtime"}, {"RW", false}},
            {{"Type", "tmpfs"}, {"Source", ""}, {"Destination", "/run"}}
        }},
        {"NetworkSettings", {{"Networks", {{"bridge", nlohmann::json::object()}, {project.empty() ? "backend" : project + "_default", nlohmann::json::object()}}}}}
    };
}
} // namespace

int main() {
    const std::string inspect = nlohmann::json::array({Container("a1", "db", "", "/srv/db")}).dump();
    const auto containers = DiscoveryService::ParseInspect(inspect);
    if (containers.size() != 1 || containers[0].name != "db" || containers[0].image != "postgres:16") {
        return Fail("Inspect output not parsed.");
    }
    if (containers[0].mounts.size() != 2 || !containers[0].mounts[1].readOnly || containers[0].mounts[0].readOnly) {
        return Fail("Bind mounts and read-only flags not parsed; tmpfs must be skipped.");
    }
    if (DiscoveryService::CollectNetworks(containers) != std::vector<std::string>{"backend"}) {
        return Fail("Default networks should be excluded.");
    }
    if (!DiscoveryService::ParseInspect("not json").empty()) {
        return Fail("Malformed inspect output should yield nothing.");
    }

    const auto unique = DiscoveryService::DeduplicateVolumes({{"/a", "/x", false}, {"/b", "/y", false}, {"/a", "/z", true}});
    if (unique.size() != 2 || unique[0].destination != "/x") {
        return Fail("Volumes should be deduplicated by source, first wins.");
    }

    if (DiscoveryService::BuildRunningContainersCommand("app=web")
        != "docker ps --filter 'label=app=web' --format '{{.ID}}'") {
        return Fail("Label selector should filter by label.");
    }
    if (DiscoveryService::BuildRunningContainersCommand("web") != "docker ps --filter 'name=web' --format '{{.ID}}'") {
        return Fail("Plain selector should filter by name.");
    }

    const std::string config = nlohmann::json{
        {"name", "stack"},
        {"services", {
            {"app", {
                {"image", "ghcr.io/acme/app:2"},
                {"environment", {{"MODE", "prod"}}},
                {"networks", {{"front", nullptr}}},
                {"volumes", {
                    {{"type", "bind"}, {"source", "/opt/stack/config"}, {"target", "/config"}, {"read_only", true}},
                    {{"type", "volume"}, {"source", "cache"}, {"target", "/cache"}},
                    {{"type", "bind"}, {"source", "/mnt/media"}, {"target", "/media"}}
                }}
            }}
        }},
        {"networks", {{"front", {{"name", "stack_front"}}}, {"default", {{"name", "bridge"}}}}}
    }.dump();
    const MigrationUnit parsed = DiscoveryService::ParseComposeConfig(config, "/opt/stack/compose.yml");
    const auto& project = std::get<ComposeProject>(parsed.kind);
    if (project.name != "stack" || project.workingDir != "/opt/stack" || project.containers.size() != 1) {
        return Fail("Compose config not parsed.");
    }
    if (project.containers[0].name != "stack-app-1" || project.containers[0].environment != std::vector<std::string>{"MODE=prod"}) {
        return Fail("Compose service defaults not applied.");
    }
    if (parsed.volumes.size() != 2 || !parsed.volumes[0].readOnly || parsed.networks != std::vector<std::string>{"stack_front"}) {
        return Fail("Compose bind mounts or networks not collected.");
    }

    // Container set by name.
    CommandScript script;
    script.SetPassthrough(false);
    script.On("docker ps -a --format", "shop-a\nshop-b\n\n");
    script.On("docker ps --filter 'name=db'", "a1\n");
    script.On("docker ps --filter 'name=ghost'", "");
    script.On("docker inspect 'a1'", inspect);
    LocalExecutor host(LocalHost("nas"), script.Runner());
    DiscoveryService discovery(std::chrono::seconds(5));

    const auto single = discovery.Resolve("db", host);
    if (single.size() != 1 || single[0].IsCompose() || single[0].Name() != "db" || single[0].volumes.size() != 2) {
        return Fail("Container set not resolved.");
    }

    try {
        discovery.Resolve("ghost", host);
        return Fail("Unknown identifier should throw.");
    } catch (const NotFoundError&) {
    }
    try {
        discovery.Resolve("", host);
        return Fail("Empty identifier should throw.");
    } catch (const ValidationError&) {
    }

    // Two compose projects match a fragment.
    script.On("docker ps -a --filter 'label=com.docker.compose.project=shop-a'", "b1\n");
    script.On("docker ps -a --filter 'label=com.docker.compose.project=shop-b'", "b2\n");
    script.On("docker inspect 'b1'", nlohmann::json::array({Container("b1", "db", "shop-a", "/opt/shop-a/data")}).dump());
    script.On("docker inspect 'b2'", nlohmann::json::array({Container("b2", "db", "shop-b", "/opt/shop-b/data")}).dump());
    script.On("docker inspect --format '{{json .Config.Labels}}' 'b1'",
        R"({"com.docker.compose.project.working_dir":"/opt/shop-a","com.docker.compose.project.config_files":"/opt/shop-a/compose.yml,/opt/shop-a/override.yml"})");
    script.On("docker inspect --format '{{json .Config.Labels}}' 'b2'", "{}");

    const auto ambiguous = discovery.Resolve("shop", host);
    if (ambiguous.size() != 2 || !ambiguous[0].IsCompose() || ambiguous[0].Name() != "shop-a" || ambiguous[1].Name() != "shop-b") {
        return Fail("Fragment should match both compose projects.");
    }

    const auto exact = discovery.Resolve("shop-a", host);
    if (exact.size() != 1) {
        return Fail("Exact project name should win over fragments.");
    }
    const auto& shop = std::get<ComposeProject>(exact[0].kind);
    if (shop.workingDir != "/opt/shop-a" || shop.composeFile != "/opt/shop-a/compose.yml") {
        return Fail("Compose labels not applied.");
    }
    if (exact[0].volumes.size() != 2 || exact[0].volumes[0].source != "/opt/shop-a") {
        return Fail("Project directory should travel and cover nested mounts.");
    }

    // Compose project by directory.
    script.On("for f in", "compose.yml\n");
    script.On("docker compose -f '/opt/stack/compose.yml' config --format json", config);
    script.On("docker ps -a --filter 'label=com.docker.compose.project=stack'", "");
    const auto byPath = discovery.Resolve("/opt/stack", host);
    if (byPath.size() != 1 || !byPath[0].IsCompose() || byPath[0].Name() != "stack") {
        return Fail("Compose directory not resolved.");
    }
    if (byPath[0].volumes.front().source != "/opt/stack" || byPath[0].volumes.size() != 2) {
        return Fail("Compose directory volumes not assembled.");
    }

    CommandScript offline;
    offline.SetPassthrough(false);
    CommandResult timedOut;
    timedOut.exitCode = 124;
    timedOut.timedOut = true;
    offline.On("docker ps", timedOut);
    LocalExecutor stuck(LocalHost("nas"), offline.Runner());
    try {
        discovery.Resolve("db", stuck);
        return Fail("Timed out discovery should be unreachable.");
    } catch (const UnreachableError&) {
    }

    return 0;
}
