#include "SnapshotManager.hpp"
#include "TestSupport.hpp"

#include <string>

namespace fs = std::filesystem;

int main() {
    const std::vector<SnapshotManager::Dataset> datasets = {
        {"rpool", "/"}, {"tank", "/mnt/tank"}, {"tank/apps", "/mnt/tank/apps"}, {"tank/legacy", "legacy"}};
    const auto apps = SnapshotManager::FindDataset("/mnt/tank/apps/web", datasets);
    if (!apps || apps->first != "tank/apps") {
        return Fail("Deepest dataset should win.");
    }
    const auto root = SnapshotManager::FindDataset("/mnt/tankx/data", datasets);
    if (!root || root->first != "rpool") {
        return Fail("Mountpoint prefix must match whole path segments.");
    }
    if (SnapshotManager::FindDataset("/srv", {{"tank", "/mnt/tank"}})) {
        return Fail("Path outside every dataset should not match.");
    }

    if (SnapshotManager::BuildSnapshotName("tank/apps", "j1") != "tank/apps@berth-j1") {
        return Fail("Unexpected snapshot name.");
    }
    if (SnapshotManager::BuildSnapshotReadPath({"tank/apps", "/mnt/tank/apps"}, "tank/apps@berth-j1", "/mnt/tank/apps/web")
        != "/mnt/tank/apps/.zfs/snapshot/berth-j1/web") {
        return Fail("Unexpected snapshot read path.");
    }
    if (SnapshotManager::BuildSnapshotReadPath({"rpool", "/"}, "rpool@berth-j1", "/srv/web") != "/.zfs/snapshot/berth-j1/srv/web") {
        return Fail("Unexpected read path on a root dataset.");
    }
    if (SnapshotManager::BuildBackupPath("/srv/data/", "j1") != "/srv/data.berth-rollback-j1") {
        return Fail("Unexpected backup path.");
    }

    SnapshotEntry cow;
    cow.method = SnapshotMethod::COW_SNAPSHOT;
    cow.snapshotName = "tank/apps@berth-j1";
    if (SnapshotManager::BuildCreateCommand(cow) != "zfs snapshot 'tank/apps@berth-j1'"
        || SnapshotManager::BuildRollbackCommand(cow) != "zfs rollback -r 'tank/apps@berth-j1'"
        || SnapshotManager::BuildDestroyCommand(cow) != "zfs destroy 'tank/apps@berth-j1'") {
        return Fail("Unexpected zfs commands.");
    }

    // Directory copy against the real filesystem.
    TempDir dir("berth-snapshot");
    const fs::path data = dir.Path() / "data";
    WriteFile(data / "db.sqlite", "original");
    WriteFile(data / "conf" / "app.ini", "x=1");

    LocalExecutor local(LocalHost("alpha"));
    HostCapabilities plain;
    SnapshotManager manager(std::chrono::seconds(30));
    SnapshotRecord record = manager.CreateRollbackPoint("j1", {data.string(), data.string()}, local, plain);
    if (record.id != "berth-j1" || record.hostId != "alpha" || record.entries.size() != 1) {
        return Fail("Duplicate paths should share one rollback entry.");
    }
    const SnapshotEntry& entry = record.entries.front();
    if (entry.method != SnapshotMethod::DIRECTORY_COPY || entry.readPath != entry.backupPath || entry.sizeBytes <= 0) {
        return Fail("Directory copy entry incomplete.");
    }
    if (ReadFile(fs::path(entry.backupPath) / "db.sqlite") != "original") {
        return Fail("Backup copy missing data.");
    }

    WriteFile(data / "db.sqlite", "mutated");
    WriteFile(data / "stray.tmp", "junk");
    const RollbackResult rolledBack = manager.Rollback(record, local);
    if (!rolledBack.success || rolledBack.restored.size() != 1) {
        return Fail("Directory rollback failed.");
    }
    if (ReadFile(data / "db.sqlite") != "original" || fs::exists(data / "stray.tmp") || ReadFile(data / "conf" / "app.ini") != "x=1") {
        return Fail("Rollback should restore the exact prior tree.");
    }
    if (fs::exists(data.string() + ".berth-restore")) {
        return Fail("Restore scratch directory left behind.");
    }

    manager.Release(record, local);
    if (!record.released || record.retained || fs::exists(entry.backupPath)) {
        return Fail("Release without retention should destroy the backup.");
    }
    if (manager.Rollback(record, local).success) {
        return Fail("Rollback from a released point must fail.");
    }

    SnapshotManager retaining(std::chrono::seconds(30), std::chrono::hours(24));
    SnapshotRecord kept = retaining.CreateRollbackPoint("j2", {data.string()}, local, plain);
    retaining.Release(kept, local);
    if (!kept.released || !kept.retained || kept.retainUntil.empty() || !fs::exists(kept.entries.front().backupPath)) {
        return Fail("Retention should keep the backup.");
    }
    if (retaining.PruneExpired(kept, local)) {
        return Fail("Unexpired rollback point must not be pruned.");
    }
    kept.retainUntil = "2000-01-01T00:00:00Z";
    if (!retaining.PruneExpired(kept, local) || fs::exists(kept.entries.front().backupPath) || kept.retained) {
        return Fail("Expired rollback point should be destroyed.");
    }

    try {
        manager.CreateRollbackPoint("j3", {(dir.Path() / "absent").string()}, local, plain);
        return Fail("Snapshot of a missing path should fail.");
    } catch (const SnapshotError&) {
    }

    // Copy-on-write snapshots through a scripted host.
    HostCapabilities zfs;
    zfs.cowAvailable = true;
    zfs.cowSystem = "zfs";
    zfs.datasets = {{"tank/apps", "/mnt/tank/apps"}, {"tank/media", "/mnt/tank/media"}};
    const std::vector<std::string> paths = {"/mnt/tank/apps/web", "/mnt/tank/apps/db", "/mnt/tank/media"};

    CommandScript failing;
    failing.SetPassthrough(false);
    failing.On("du -sb", "100\n");
    failing.On("zfs snapshot", "");
    failing.On("zfs snapshot 'tank/media@berth-j4'", "cannot create snapshot: out of space", 1);
    failing.On("zfs destroy", "");
    LocalExecutor failingHost(LocalHost("nas"), failing.Runner());
    try {
        manager.CreateRollbackPoint("j4", paths, failingHost, zfs);
        return Fail("Failed zfs snapshot should abort the rollback point.");
    } catch (const SnapshotError&) {
    }
    if (failing.Count("zfs snapshot 'tank/apps@berth-j4'") != 1 || !failing.Saw("zfs destroy 'tank/apps@berth-j4'")) {
        return Fail("Partial rollback point should be destroyed.");
    }

    CommandScript scripted;
    scripted.SetPassthrough(false);
    scripted.On("du -sb", "100\n");
    scripted.On("zfs", "");
    LocalExecutor nas(LocalHost("nas"), scripted.Runner());
    SnapshotRecord snapshots = manager.CreateRollbackPoint("j5", paths, nas, zfs);
    if (snapshots.entries.size() != 3 || scripted.Count("zfs snapshot") != 2) {
        return Fail("Paths on one dataset should share one snapshot.");
    }
    const SnapshotEntry* db = snapshots.Find("/mnt/tank/apps/db");
    if (db == nullptr || db->method != SnapshotMethod::COW_SNAPSHOT || db->readPath != "/mnt/tank/apps/.zfs/snapshot/berth-j5/db") {
        return Fail("Shared snapshot entry has the wrong read path.");
    }
    const RollbackResult cowRollback = manager.Rollback(snapshots, nas);
    if (!cowRollback.success || cowRollback.restored.size() != 3 || scripted.Count("zfs rollback -r") != 2) {
        return Fail("Each snapshot should be rolled back once.");
    }
    if (!manager.Discard(snapshots, nas) || scripted.Count("zfs destroy") != 2) {
        return Fail("Each snapshot should be destroyed once.");
    }

    return 0;
}
