#include "JobStore.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace {
constexpr const char* kJobsDir = "jobs";
constexpr const char* kManifestsDir = "manifests";
constexpr const char* kRecordExtension = ".json";

bool IsSafeName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

std::optional<nlohmann::json> ReadJson(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::nullopt;
    }

    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        std::cerr << "[Store] Corrupt record " << path.string() << std::endl;
        return std::nullopt;
    }
    return json;
}
} // namespace

FileJobStore::FileJobStore(std::filesystem::path stateDir)
    : stateDir_(std::move(stateDir)) {}

bool FileJobStore::SaveJob(const MigrationJob& job) {
    if (!IsSafeName(job.id)) {
        std::cerr << "[Store] Refusing to save job with invalid id '" << job.id << "'" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [source, manifest] : job.manifests) {
        if (!manifest.entries.empty() && !SaveManifest(manifest)) {
            return false;
        }
    }

    const nlohmann::json record = job;
    return WriteFileAtomically(JobPath(job.id), record.dump(2));
}

std::optional<MigrationJob> FileJobStore::LoadJob(const std::string& jobId) {
    if (!IsSafeName(jobId)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto json = ReadJson(JobPath(jobId));
    if (!json) {
        return std::nullopt;
    }

    MigrationJob job;
    try {
        job = json->get<MigrationJob>();
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[Store] Job record " << jobId << " unreadable: " << ex.what() << std::endl;
        return std::nullopt;
    }

    for (auto& [source, manifest] : job.manifests) {
        const auto stored = LoadManifest(manifest.aggregate);
        if (stored) {
            manifest = *stored;
        } else {
            std::cerr << "[Store] Manifest " << manifest.aggregate << " for job " << jobId << " is missing" << std::endl;
        }
    }
    return job;
}

std::vector<std::string> FileJobStore::ListJobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> ids;

    std::error_code ec;
    const auto dir = stateDir_ / kJobsDir;
    if (!std::filesystem::is_directory(dir, ec)) {
        return {};
    }

    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() == kRecordExtension) {
            ids.insert(path.stem().string());
        }
    }
    return {ids.begin(), ids.end()};
}

bool FileJobStore::RemoveJob(const std::string& jobId) {
    if (!IsSafeName(jobId)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto removedRecord = ReadJson(JobPath(jobId));

    std::error_code ec;
    std::filesystem::remove(JobPath(jobId), ec);
    if (ec) {
        std::cerr << "[Store] Failed to remove job " << jobId << ": " << ec.message() << std::endl;
        return false;
    }

    if (!removedRecord || !removedRecord->contains("manifests")) {
        return true;
    }

    // Manifests are shared by content; drop only those no other job references.
    std::set<std::string> referenced;
    for (std::filesystem::directory_iterator it(stateDir_ / kJobsDir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto other = ReadJson(it->path());
        if (!other || !other->contains("manifests") || !(*other)["manifests"].is_object()) {
            continue;
        }
        for (const auto& [source, ref] : (*other)["manifests"].items()) {
            referenced.insert(ref.value("aggregate", ""));
        }
    }

    for (const auto& [source, ref] : (*removedRecord)["manifests"].items()) {
        const std::string aggregate = ref.value("aggregate", "");
        if (!aggregate.empty() && referenced.count(aggregate) == 0) {
            std::error_code removeError;
            std::filesystem::remove(ManifestPath(aggregate), removeError);
        }
    }
    return true;
}

std::filesystem::path FileJobStore::JobPath(const std::string& jobId) const {
    return stateDir_ / kJobsDir / (jobId + kRecordExtension);
}

std::filesystem::path FileJobStore::ManifestPath(const std::string& aggregate) const {
    return stateDir_ / kManifestsDir / (aggregate + kRecordExtension);
}

bool FileJobStore::SaveManifest(const ChecksumManifest& manifest) {
    if (!IsSafeName(manifest.aggregate)) {
        return false;
    }

    const auto path = ManifestPath(manifest.aggregate);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return true;
    }

    const nlohmann::json record = manifest;
    return WriteFileAtomically(path, record.dump());
}

std::optional<ChecksumManifest> FileJobStore::LoadManifest(const std::string& aggregate) const {
    if (!IsSafeName(aggregate)) {
        return std::nullopt;
    }

    const auto json = ReadJson(ManifestPath(aggregate));
    if (!json) {
        return std::nullopt;
    }

    try {
        return json->get<ChecksumManifest>();
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[Store] Manifest " << aggregate << " unreadable: " << ex.what() << std::endl;
        return std::nullopt;
    }
}

bool FileJobStore::WriteFileAtomically(const std::filesystem::path& path, const std::string& payload) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        std::cerr << "[Store] Cannot create " << path.parent_path().string() << ": " << ec.message() << std::endl;
        return false;
    }

    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            std::cerr << "[Store] Cannot write " << temp.string() << std::endl;
            return false;
        }
        output.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        output.flush();
        if (!output.good()) {
            std::cerr << "[Store] Short write to " << temp.string() << std::endl;
            return false;
        }
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::cerr << "[Store] Cannot replace " << path.string() << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}
