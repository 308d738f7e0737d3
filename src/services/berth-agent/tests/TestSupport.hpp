#pragma once

#include "CredentialResolver.hpp"
#include "MigrationErrors.hpp"
#include "RemoteExecutor.hpp"
#include "WorkloadController.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

inline int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

// Answers commands whose text starts with a registered prefix; everything else
// runs through the real shell unless passthrough is disabled. Later rules win.
class CommandScript {
public:
    void On(const std::string& prefix, const std::string& output, int exitCode = 0) {
        CommandResult result;
        result.exitCode = exitCode;
        result.output = output;
        On(prefix, result);
    }

    void On(const std::string& prefix, CommandResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.insert(rules_.begin(), std::make_pair(prefix, std::move(result)));
    }

    void SetPassthrough(bool passthrough) {
        std::lock_guard<std::mutex> lock(mutex_);
        passthrough_ = passthrough;
    }

    CommandResult Run(const std::string& command, std::chrono::seconds timeout) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.push_back(command);
            for (const auto& rule : rules_) {
                if (command.rfind(rule.first, 0) == 0) {
                    return rule.second;
                }
            }
            if (!passthrough_) {
                CommandResult missing;
                missing.exitCode = 127;
                missing.output = "not scripted: " + command;
                return missing;
            }
        }
        return RemoteExecutor::RunShellCommand(command, timeout);
    }

    RemoteExecutor::CommandRunner Runner() {
        return [this](const std::string& command, std::chrono::seconds timeout) { return Run(command, timeout); };
    }

    bool Saw(const std::string& prefix) const {
        return Count(prefix) > 0;
    }

    size_t Count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& command : commands_) {
            if (command.rfind(prefix, 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::string> Commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, CommandResult>> rules_;
    std::vector<std::string> commands_;
    bool passthrough_ = true;
};

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "berth-test") {
        std::mt19937_64 rng{std::random_device{}()};
        std::ostringstream name;
        name << prefix << "-" << std::hex << rng();
        path_ = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string Str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

struct WorkloadCall {
    std::string unit;
    std::string host;
    PathRewrites rewrites;
};

class FakeWorkloadController : public WorkloadController {
public:
    void Stop(const MigrationUnit& unit, const RemoteExecutor& host) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stops_.push_back({unit.Name(), host.HostId(), {}});
        }
        if (onStop) {
            onStop();
        }
    }

    void Start(const MigrationUnit& unit, const PathRewrites& rewrites, const RemoteExecutor& host) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failStart) {
            throw WorkloadError("runtime refused to start " + unit.Name());
        }
        starts_.push_back({unit.Name(), host.HostId(), rewrites});
    }

    std::vector<WorkloadCall> Stops() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stops_;
    }

    std::vector<WorkloadCall> Starts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return starts_;
    }

    std::function<void()> onStop;
    bool failStart = false;

private:
    mutable std::mutex mutex_;
    std::vector<WorkloadCall> stops_;
    std::vector<WorkloadCall> starts_;
};

class StaticCredentialResolver : public CredentialResolver {
public:
    void Add(HostCredentials credentials) {
        hosts_[credentials.hostRef] = std::move(credentials);
    }

    HostCredentials Resolve(const std::string& hostRef) const override {
        const auto found = hosts_.find(hostRef);
        if (found != hosts_.end()) {
            return found->second;
        }
        if (hostRef == FileCredentialResolver::kLocalHostRef) {
            HostCredentials local;
            local.hostRef = hostRef;
            local.host = "localhost";
            local.local = true;
            return local;
        }
        throw ValidationError("Unknown host reference '" + hostRef + "'");
    }

private:
    std::map<std::string, HostCredentials> hosts_;
};

inline HostCredentials LocalHost(const std::string& hostRef) {
    HostCredentials credentials;
    credentials.hostRef = hostRef;
    credentials.host = "localhost";
    credentials.local = true;
    return credentials;
}

inline HostCredentials RemoteHost(const std::string& hostRef, const std::string& host) {
    HostCredentials credentials;
    credentials.hostRef = hostRef;
    credentials.host = host;
    credentials.user = "root";
    credentials.port = 22;
    return credentials;
}
