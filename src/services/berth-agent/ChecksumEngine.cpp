#include "ChecksumEngine.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>

namespace {
constexpr size_t kReadChunkBytes = 64 * 1024;
constexpr size_t kSha256HexLength = 64;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContextPtr NewSha256Context() {
    DigestContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return ctx;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::string FinishHex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return {};
    }

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (unsigned int i = 0; i < length; ++i) {
        out << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

bool IsHexDigest(const std::string& value) {
    return value.size() == kSha256HexLength
        && std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isxdigit(ch) != 0; });
}

std::string StripDotSlash(std::string path) {
    if (path.rfind("./", 0) == 0) {
        path.erase(0, 2);
    }
    return path;
}

std::string DirectoryKey(const std::string& relative) {
    if (relative.empty() || relative == ".") {
        return "./";
    }
    return relative + "/";
}

bool IsConnectionFailure(const CommandResult& result) {
    return result.timedOut || result.exitCode == SshExecutor::kSshConnectionFailure;
}

std::vector<std::string> SplitNul(const std::string& output) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < output.size()) {
        const size_t end = output.find('\0', start);
        if (end == std::string::npos) {
            tokens.push_back(output.substr(start));
            break;
        }
        tokens.push_back(output.substr(start, end - start));
        start = end + 1;
    }
    return tokens;
}

void ScanDirectory(const std::filesystem::path& rootPath, const std::filesystem::path& dir,
    std::map<std::string, std::string>& entries) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end;
    std::vector<std::filesystem::path> subdirectories;
    while (!ec && it != end) {
        const std::filesystem::path path = it->path();
        const std::string relative = path.lexically_relative(rootPath).generic_string();

        std::error_code statusError;
        const std::filesystem::file_status status = it->symlink_status(statusError);
        if (statusError) {
            entries[relative] = kUnreadableHash;
            std::cerr << "[Checksum] Cannot stat " << path.string() << ": " << statusError.message() << std::endl;
        } else if (std::filesystem::is_symlink(status)) {
            const std::filesystem::path target = std::filesystem::read_symlink(path, statusError);
            entries[relative] = statusError ? std::string(kUnreadableHash) : kSymlinkPrefix + target.string();
        } else if (std::filesystem::is_regular_file(status)) {
            bool ok = false;
            const std::string hash = ChecksumEngine::HashFile(path, ok);
            entries[relative] = ok ? hash : kUnreadableHash;
            if (!ok) {
                std::cerr << "[Checksum] Unreadable file during scan: " << path.string() << std::endl;
            }
        } else if (std::filesystem::is_directory(status)) {
            subdirectories.push_back(path);
        }

        it.increment(ec);
    }

    if (ec) {
        entries[DirectoryKey(dir.lexically_relative(rootPath).generic_string())] = kUnreadableHash;
        std::cerr << "[Checksum] Cannot list " << dir.string() << ": " << ec.message() << std::endl;
    }

    for (const auto& subdirectory : subdirectories) {
        ScanDirectory(rootPath, subdirectory, entries);
    }
}
} // namespace

ChecksumEngine::ChecksumEngine(std::chrono::seconds remoteTimeout)
    : remoteTimeout_(remoteTimeout) {}

ChecksumManifest ChecksumEngine::Generate(const std::string& root) const {
    ChecksumManifest manifest;
    manifest.root = root;
    manifest.generatedAt = CurrentTimestamp();

    std::error_code ec;
    const std::filesystem::path rootPath(root);
    if (!std::filesystem::is_directory(rootPath, ec)) {
        manifest.aggregate = AggregateHash(manifest.entries);
        return manifest;
    }

    ScanDirectory(rootPath, rootPath, manifest.entries);

    manifest.aggregate = AggregateHash(manifest.entries);
    return manifest;
}

ChecksumManifest ChecksumEngine::Generate(const RemoteExecutor& executor, const std::string& root) const {
    if (executor.IsLocal()) {
        return Generate(root);
    }

    ChecksumManifest manifest;
    manifest.root = root;
    manifest.generatedAt = CurrentTimestamp();

    const CommandResult listing = executor.Run(BuildListCommand(root), remoteTimeout_);
    if (IsConnectionFailure(listing)) {
        throw UnreachableError("Checksum listing on " + executor.HostId() + " failed: " + listing.output);
    }

    const CommandResult hashes = executor.Run(BuildHashCommand(root), remoteTimeout_);
    if (IsConnectionFailure(hashes)) {
        throw UnreachableError("Checksum scan on " + executor.HostId() + " failed: " + hashes.output);
    }

    const auto hashed = ParseHashListing(hashes.output);
    for (const auto& [path, value] : ParseFileListing(listing.output)) {
        if (!value.empty()) {
            manifest.entries[path] = value;
            continue;
        }
        const auto found = hashed.find(path);
        manifest.entries[path] = found != hashed.end() ? found->second : kUnreadableHash;
    }
    if (listing.exitCode != 0) {
        manifest.entries[DirectoryKey("")] = kUnreadableHash;
        std::cerr << "[Checksum] Listing " << root << " on " << executor.HostId() << " exited with " << listing.exitCode
                  << ": " << listing.output << std::endl;
    }

    manifest.aggregate = AggregateHash(manifest.entries);
    return manifest;
}

DiffResult ChecksumEngine::Compare(const ChecksumManifest& expected, const ChecksumManifest& actual) {
    DiffResult diff;
    for (const auto& [path, hash] : expected.entries) {
        const auto found = actual.entries.find(path);
        if (found == actual.entries.end()) {
            diff.missing.push_back(path);
            continue;
        }

        const bool unreadable = hash == kUnreadableHash || found->second == kUnreadableHash;
        if (unreadable || hash != found->second) {
            diff.mismatched.push_back(path);
        } else {
            diff.matched.push_back(path);
        }
    }

    for (const auto& [path, hash] : actual.entries) {
        if (expected.entries.find(path) == expected.entries.end()) {
            diff.extra.push_back(path);
        }
    }
    return diff;
}

std::string ChecksumEngine::HashFile(const std::filesystem::path& path, bool& ok) {
    ok = false;
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return {};
    }

    auto ctx = NewSha256Context();
    if (!ctx) {
        std::cerr << "[Checksum] OpenSSL SHA-256 context unavailable" << std::endl;
        return {};
    }

    std::array<char, kReadChunkBytes> buffer{};
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = input.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            return {};
        }
    }

    if (input.bad()) {
        return {};
    }

    std::string hex = FinishHex(ctx.get());
    ok = !hex.empty();
    return hex;
}

std::string ChecksumEngine::AggregateHash(std::vector<std::pair<std::string, std::string>> entries) {
    std::sort(entries.begin(), entries.end());

    auto ctx = NewSha256Context();
    if (!ctx) {
        return {};
    }

    for (const auto& [path, hash] : entries) {
        const std::string record = path + '\0' + hash + '\n';
        if (EVP_DigestUpdate(ctx.get(), record.data(), record.size()) != 1) {
            return {};
        }
    }
    return FinishHex(ctx.get());
}

std::string ChecksumEngine::AggregateHash(const std::map<std::string, std::string>& entries) {
    return AggregateHash(std::vector<std::pair<std::string, std::string>>(entries.begin(), entries.end()));
}

// Needs GNU find for -printf, -readable and -executable.
std::string ChecksumEngine::BuildListCommand(const std::string& root) {
    const std::string quoted = RemoteExecutor::QuoteArgument(root);
    return "[ -d " + quoted + " ] || exit 0; cd " + quoted + " || exit 1; find ."
        " \\( -type d \\( ! -readable -o ! -executable \\) -printf 'u %p\\0' -prune \\)"
        " -o \\( -type f -printf 'f %p\\0' \\)"
        " -o \\( -type l -printf 'l %p\\0%l\\0' \\) 2>/dev/null";
}

std::string ChecksumEngine::BuildHashCommand(const std::string& root) {
    return "cd " + RemoteExecutor::QuoteArgument(root)
        + " && find . \\( -type d \\( ! -readable -o ! -executable \\) -prune \\) -o -type f -print0 2>/dev/null"
          " | xargs -0 -r sha256sum -z -- 2>/dev/null";
}

std::map<std::string, std::string> ChecksumEngine::ParseFileListing(const std::string& output) {
    std::map<std::string, std::string> listing;
    const auto tokens = SplitNul(output);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (token.size() < 3 || token[1] != ' ') {
            continue;
        }
        const std::string path = token.substr(2);
        if (token[0] == 'u') {
            listing[DirectoryKey(StripDotSlash(path))] = kUnreadableHash;
        } else if (path.rfind("./", 0) != 0) {
            continue;
        } else if (token[0] == 'f') {
            listing[StripDotSlash(path)];
        } else if (token[0] == 'l' && i + 1 < tokens.size()) {
            listing[StripDotSlash(path)] = kSymlinkPrefix + tokens[++i];
        }
    }
    return listing;
}

std::map<std::string, std::string> ChecksumEngine::ParseHashListing(const std::string& output) {
    std::map<std::string, std::string> hashes;
    for (const auto& record : SplitNul(output)) {
        // "<hex>  ./path" or "<hex> *./path" in binary mode
        if (record.size() < kSha256HexLength + 3) {
            continue;
        }

        const std::string hash = record.substr(0, kSha256HexLength);
        if (!IsHexDigest(hash) || record[kSha256HexLength] != ' ') {
            continue;
        }

        hashes[StripDotSlash(record.substr(kSha256HexLength + 2))] = hash;
    }
    return hashes;
}
