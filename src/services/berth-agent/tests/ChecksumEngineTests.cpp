#include "ChecksumEngine.hpp"
#include "TestSupport.hpp"
#include "Verifier.hpp"

#include <map>
#include <string>

#include <unistd.h>

namespace {
constexpr const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
} // namespace

int main() {
    TempDir dir("berth-checksum");
    WriteFile(dir.Path() / "abc.txt", "abc");
    WriteFile(dir.Path() / "empty", "");
    WriteFile(dir.Path() / "nested" / "deep" / "abc.txt", "abc");
    std::filesystem::create_directories(dir.Path() / "hollow");

    ChecksumEngine engine;
    const ChecksumManifest manifest = engine.Generate(dir.Str());
    if (!manifest.Valid() || manifest.root != dir.Str()) {
        return Fail("Manifest should be valid and rooted at the scanned directory.");
    }
    if (manifest.entries.size() != 3) {
        return Fail("Manifest should list exactly the three regular files.");
    }
    if (manifest.entries.at("abc.txt") != kAbcDigest || manifest.entries.at("nested/deep/abc.txt") != kAbcDigest) {
        return Fail("Unexpected SHA-256 for abc.txt: " + manifest.entries.at("abc.txt"));
    }
    if (manifest.entries.at("empty") != kEmptyDigest) {
        return Fail("Unexpected SHA-256 for empty file.");
    }
    if (manifest.UnreadableCount() != 0) {
        return Fail("No file should be unreadable.");
    }

    const ChecksumManifest again = engine.Generate(dir.Str());
    if (again.aggregate != manifest.aggregate) {
        return Fail("Aggregate must be stable across scans.");
    }
    std::vector<std::pair<std::string, std::string>> shuffled(manifest.entries.rbegin(), manifest.entries.rend());
    if (ChecksumEngine::AggregateHash(shuffled) != manifest.aggregate) {
        return Fail("Aggregate must not depend on entry order.");
    }

    const ChecksumManifest missingRoot = engine.Generate((dir.Path() / "absent").string());
    if (!missingRoot.Valid() || !missingRoot.entries.empty()) {
        return Fail("Missing root should produce an empty but valid manifest.");
    }

    TempDir linked("berth-checksum-links");
    WriteFile(linked.Path() / "data" / "real.txt", "abc");
    std::filesystem::create_symlink("data/real.txt", linked.Path() / "current");
    std::filesystem::create_directory_symlink("data", linked.Path() / "latest");
    std::filesystem::create_symlink("nowhere", linked.Path() / "dangling");
    const ChecksumManifest links = engine.Generate(linked.Str());
    if (links.entries.size() != 4 || links.entries.at("data/real.txt") != kAbcDigest) {
        return Fail("Symlinks should be listed once each and never followed.");
    }
    if (links.entries.at("current") != "link:data/real.txt" || links.entries.at("latest") != "link:data"
        || links.entries.at("dangling") != "link:nowhere") {
        return Fail("Symlinks should be recorded by target.");
    }
    ChecksumManifest retargeted = links;
    retargeted.entries["current"] = "link:data/other.txt";
    if (ChecksumEngine::Compare(links, retargeted).mismatched != std::vector<std::string>{"current"}) {
        return Fail("A changed link target should mismatch.");
    }

    if (geteuid() != 0) {
        TempDir locked("berth-checksum-locked");
        WriteFile(locked.Path() / "open" / "a.txt", "abc");
        WriteFile(locked.Path() / "sealed" / "b.txt", "abc");
        WriteFile(locked.Path() / "z.txt", "abc");
        std::filesystem::permissions(locked.Path() / "sealed", std::filesystem::perms::none);
        const ChecksumManifest partial = engine.Generate(locked.Str());
        std::filesystem::permissions(locked.Path() / "sealed", std::filesystem::perms::owner_all);
        if (partial.entries.count("sealed/") != 1 || partial.entries.at("sealed/") != kUnreadableHash) {
            return Fail("A directory that cannot be listed should be recorded as unreadable.");
        }
        if (partial.entries.count("open/a.txt") != 1 || partial.entries.count("z.txt") != 1) {
            return Fail("Siblings of an unreadable directory must still be scanned.");
        }
    }

    ChecksumManifest actual = manifest;
    actual.entries["abc.txt"] = kEmptyDigest;
    actual.entries.erase("empty");
    actual.entries["stray.log"] = kAbcDigest;
    const DiffResult diff = ChecksumEngine::Compare(manifest, actual);
    if (diff.mismatched != std::vector<std::string>{"abc.txt"} || diff.missing != std::vector<std::string>{"empty"}
        || diff.extra != std::vector<std::string>{"stray.log"} || diff.matched.size() != 1 || diff.Clean()) {
        return Fail("Compare misclassified entries.");
    }

    ChecksumManifest withExtra = manifest;
    withExtra.entries["stray.log"] = kAbcDigest;
    if (!ChecksumEngine::Compare(manifest, withExtra).Clean()) {
        return Fail("Extra destination files alone must not make a diff unclean.");
    }

    ChecksumManifest unreadable = manifest;
    unreadable.entries["abc.txt"] = kUnreadableHash;
    if (ChecksumEngine::Compare(unreadable, unreadable).mismatched.size() != 1) {
        return Fail("Unreadable entries never verify.");
    }

    using namespace std::string_literals;
    const auto listing = ChecksumEngine::ParseFileListing(
        "f ./a b.txt\0f ./dir/c\0l ./cur\0dir/c\0u ./locked\0find: warning\0"s);
    const std::map<std::string, std::string> expectedListing = {
        {"a b.txt", ""}, {"dir/c", ""}, {"cur", "link:dir/c"}, {"locked/", kUnreadableHash}};
    if (listing != expectedListing) {
        return Fail("File listing parse failed.");
    }
    const auto hashes = ChecksumEngine::ParseHashListing(
        std::string(kAbcDigest) + "  ./a b.txt\0"s + kEmptyDigest + " *./dir/c\0not-a-hash  ./x\0"s);
    if (hashes.size() != 2 || hashes.at("a b.txt") != kAbcDigest || hashes.at("dir/c") != kEmptyDigest) {
        return Fail("Hash listing parse failed.");
    }
    const auto awkward = ChecksumEngine::ParseHashListing(
        std::string(kAbcDigest) + "  ./back\\slash\0"s + kEmptyDigest + "  ./line\nbreak\0"s);
    if (awkward.size() != 2 || awkward.at("back\\slash") != kAbcDigest || awkward.at("line\nbreak") != kEmptyDigest) {
        return Fail("Names with backslashes or newlines must survive verbatim.");
    }
    if (ChecksumEngine::BuildHashCommand("/srv").find("sha256sum -z") == std::string::npos
        || ChecksumEngine::BuildListCommand("/srv").find("-printf") == std::string::npos) {
        return Fail("Remote scans should use NUL-separated output.");
    }

    // Remote hosts go through the shell listing; files missing from the hash
    // output are recorded as unreadable.
    const std::string remoteHashes = std::string(kAbcDigest) + "  ./abc.txt\0"s;
    const std::string remoteListing = "f ./abc.txt\0f ./locked\0l ./latest\0nested\0"s;
    SshExecutor remote(RemoteHost("far", "10.0.0.9"), std::chrono::seconds(5),
        [&](const std::string& command, std::chrono::seconds) {
            CommandResult result;
            result.exitCode = 0;
            result.output = command.find("sha256sum") != std::string::npos ? remoteHashes : remoteListing;
            return result;
        });
    const ChecksumManifest remoteManifest = engine.Generate(remote, "/srv/data");
    if (remoteManifest.entries.size() != 3 || remoteManifest.entries.at("abc.txt") != kAbcDigest
        || remoteManifest.entries.at("locked") != kUnreadableHash || remoteManifest.UnreadableCount() != 1
        || remoteManifest.entries.at("latest") != "link:nested") {
        return Fail("Remote manifest did not merge listing and hashes.");
    }

    SshExecutor refused(RemoteHost("far", "10.0.0.9"), std::chrono::seconds(5),
        [](const std::string&, std::chrono::seconds) {
            CommandResult result;
            result.exitCode = 1;
            result.output = "sh: cd: /srv/data: Permission denied";
            return result;
        });
    const ChecksumManifest refusedManifest = engine.Generate(refused, "/srv/data");
    if (refusedManifest.entries.count("./") != 1 || refusedManifest.UnreadableCount() != 1) {
        return Fail("A root that cannot be entered should be recorded as unreadable.");
    }

    SshExecutor down(RemoteHost("far", "10.0.0.9"), std::chrono::seconds(5),
        [](const std::string&, std::chrono::seconds) {
            CommandResult result;
            result.exitCode = SshExecutor::kSshConnectionFailure;
            result.output = "ssh: connect to host 10.0.0.9 port 22: Connection refused";
            return result;
        });
    try {
        engine.Generate(down, "/srv/data");
        return Fail("Unreachable host should throw.");
    } catch (const UnreachableError&) {
    }

    TempDir copy("berth-verify");
    std::filesystem::copy(dir.Path(), copy.Path(), std::filesystem::copy_options::recursive);
    WriteFile(copy.Path() / "extra.txt", "new");
    LocalExecutor local;
    Verifier verifier(engine);
    const VerificationResult verified = verifier.Verify(manifest, copy.Str(), local);
    if (!verified.Verified() || verified.diff.extra.size() != 1) {
        return Fail("Faithful copy with an extra file should verify: " + verified.Summary());
    }

    WriteFile(copy.Path() / "nested" / "deep" / "abc.txt", "abd");
    const VerificationResult corrupted = verifier.Verify(manifest, copy.Str(), local);
    if (corrupted.Verified() || corrupted.Summary().find("nested/deep/abc.txt") == std::string::npos) {
        return Fail("Changed file should fail verification: " + corrupted.Summary());
    }

    return 0;
}
