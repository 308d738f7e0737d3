#pragma once

#include "MigrationTypes.hpp"

#include <string>
#include <vector>

struct CommandPayload {
    std::string commandId;
    std::string jobId;
    std::string action;
    std::string parameters;
    std::string nonce;
    std::string expiresAt;
};

struct CommandFeedback {
    std::string commandId;
    std::string status;
    std::string result;
    std::string error;
};

struct AgentCapabilities {
    std::string kernelVersion;
    std::string runtimeVersion;
    bool runtimeAvailable = false;
    bool cowAvailable = false;
    std::string cowSystem;
    size_t maxActiveTransfers = 0;
};

// Overrides the coordinator may hand out at registration; zero keeps the local value.
struct AgentConfig {
    size_t maxActiveTransfers = 0;
    bool forceFileSync = false;
};

struct TlsSettings {
    bool enabled = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = false;
};

class NetworkClient {
public:
    explicit NetworkClient(std::string baseUrl, TlsSettings tlsSettings = {}, std::string apiKey = {});

    bool Register(
        const std::string& hostname,
        const std::string& os,
        const AgentCapabilities& capabilities,
        std::string& outToken,
        std::string& outAgentId,
        AgentConfig* outConfig = nullptr);
    bool SendHeartbeat(const std::string& token, const std::string& agentId, const std::string& state, size_t activeJobs);
    bool PollCommands(const std::string& agentId, std::vector<CommandPayload>& outCommands);
    bool SendFeedback(const std::string& agentId, const CommandFeedback& feedback);
    bool ReportJobStatus(const std::string& agentId, const MigrationJob& job);

    static bool ParseCommands(const std::string& body, std::vector<CommandPayload>& outCommands);

private:
    struct PostResult {
        bool ok = false;
        std::string body;
    };

    PostResult Post(
        const std::string& path,
        const std::string& spanName,
        const std::string& payload,
        const std::string& token,
        int maxAttempts) const;

    std::string baseUrl_;
    TlsSettings tlsSettings_;
    std::string apiKey_;
};
