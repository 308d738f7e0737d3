#include "NetworkClient.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace {
constexpr int kMaxRetries = 3;
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr auto kRequestTimeout = std::chrono::seconds(10);

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    if (baseUrl.back() == '/') {
        return baseUrl.substr(0, baseUrl.size() - 1) + path;
    }

    return baseUrl + path;
}

bool IsSuccessStatus(const cpr::Response& response) {
    return response.status_code >= 200 && response.status_code < 300;
}

int BackoffSeconds(int attempt) {
    return 1 << attempt;
}

void LogRetry(const std::string& what, int attempt, int maxAttempts) {
    std::cerr << "[Network] " << what << " failed (Attempt " << (attempt + 1) << "/" << maxAttempts
              << "). Retrying in " << BackoffSeconds(attempt) << "s..." << std::endl;
}

cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    return cpr::Ssl(
        cpr::ssl::CaInfo{settings.caPath},
        cpr::ssl::CertFile{settings.certPath},
        cpr::ssl::KeyFile{settings.keyPath},
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
}

cpr::Header BuildHeaders(const std::string& traceparent, const std::string& apiKey, const std::string& token) {
    cpr::Header headers{{"Content-Type", "application/json"}, {"traceparent", traceparent}};
    if (!apiKey.empty()) {
        headers["X-API-Key"] = apiKey;
    }
    if (!token.empty()) {
        headers["Authorization"] = "Bearer " + token;
    }
    return headers;
}

nlohmann::json JobSummary(const MigrationJob& job) {
    nlohmann::json steps = nlohmann::json::array();
    if (!job.steps.empty()) {
        steps.push_back(job.steps.back());
    }
    return {
        {"jobId", job.id},
        {"unit", job.unit ? job.unit->Name() : job.unitIdentifier},
        {"sourceHost", job.sourceHostRef},
        {"destinationHost", job.destHostRef},
        {"destinationPath", job.destBasePath},
        {"status", MigrationStateName(job.status)},
        {"progress", job.progress},
        {"message", job.message},
        {"error", job.error},
        {"errorKind", ErrorKindName(job.errorKind)},
        {"resumable", job.resumable},
        {"lastStep", steps},
        {"startedAt", job.startedAt},
        {"endedAt", job.endedAt}
    };
}
} // namespace

NetworkClient::NetworkClient(std::string baseUrl, TlsSettings tlsSettings, std::string apiKey)
    : baseUrl_(std::move(baseUrl)),
      tlsSettings_(std::move(tlsSettings)),
      apiKey_(std::move(apiKey)) {}

bool NetworkClient::Register(
    const std::string& hostname,
    const std::string& os,
    const AgentCapabilities& capabilities,
    std::string& outToken,
    std::string& outAgentId,
    AgentConfig* outConfig) {
    nlohmann::json payload = {
        {"hostname", hostname},
        {"os", os},
        {"capabilities", {
            {"kernelVersion", capabilities.kernelVersion},
            {"runtimeAvailable", capabilities.runtimeAvailable},
            {"runtimeVersion", capabilities.runtimeVersion},
            {"cowAvailable", capabilities.cowAvailable},
            {"cowSystem", capabilities.cowSystem},
            {"supportsBlockClone", capabilities.cowAvailable},
            {"supportsResume", true},
            {"maxActiveTransfers", capabilities.maxActiveTransfers}
        }}
    };

    const PostResult result = Post("/api/v1/agent/register", "agent.register", payload.dump(), {}, 1);
    if (!result.ok) {
        return false;
    }

    auto json = nlohmann::json::parse(result.body, nullptr, false);
    if (json.is_discarded() || !json.contains("token") || !json.contains("agentId")) {
        std::cerr << "[Agent] register response missing token or agentId" << std::endl;
        return false;
    }

    outToken = json.value("token", "");
    outAgentId = json.value("agentId", "");
    if (outConfig != nullptr && json.contains("config") && json["config"].is_object()) {
        const auto& config = json["config"];
        const int limit = config.value("maxActiveTransfers", 0);
        outConfig->maxActiveTransfers = limit > 0 ? static_cast<size_t>(limit) : 0;
        outConfig->forceFileSync = config.value("forceFileSync", false);
    }
    return !outToken.empty() && !outAgentId.empty();
}

bool NetworkClient::SendHeartbeat(const std::string& token, const std::string& agentId, const std::string& state, size_t activeJobs) {
    nlohmann::json payload = {
        {"agentId", agentId},
        {"state", state},
        {"activeJobs", activeJobs}
    };
    return Post("/api/v1/agent/heartbeat", "agent.heartbeat", payload.dump(), token, kMaxRetries).ok;
}

bool NetworkClient::PollCommands(const std::string& agentId, std::vector<CommandPayload>& outCommands) {
    outCommands.clear();

    if (agentId.empty()) {
        return false;
    }

    auto span = Tracer::Instance().StartSpan("agent.poll");
    Tracer::Instance().SetAttribute(span, "http.method", "GET");
    Tracer::Instance().SetAttribute(span, "http.url", BuildUrl(baseUrl_, "/api/v1/agent/poll"));

    const cpr::Header headers = BuildHeaders(span.traceparent, apiKey_, {});
    cpr::Response response = tlsSettings_.enabled
        ? cpr::Get(
            cpr::Url{BuildUrl(baseUrl_, "/api/v1/agent/poll")},
            cpr::Parameters{{"agentId", agentId}},
            headers,
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{kRequestTimeout},
            BuildSslOptions(tlsSettings_))
        : cpr::Get(
            cpr::Url{BuildUrl(baseUrl_, "/api/v1/agent/poll")},
            cpr::Parameters{{"agentId", agentId}},
            headers,
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{kRequestTimeout});

    const bool requestOk = response.error.code == cpr::ErrorCode::OK;
    const bool statusOk = response.status_code < 400;
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, requestOk && statusOk);

    if (!requestOk) {
        std::cerr << "[Agent] poll failed: " << response.error.message << std::endl;
        return false;
    }

    if (!statusOk) {
        std::cerr << "[Agent] poll failed with HTTP " << response.status_code << std::endl;
        return false;
    }

    return ParseCommands(response.text, outCommands);
}

bool NetworkClient::SendFeedback(const std::string& agentId, const CommandFeedback& feedback) {
    nlohmann::json payload = {
        {"agentId", agentId},
        {"commandId", feedback.commandId},
        {"status", feedback.status},
        {"result", feedback.result},
        {"error", feedback.error}
    };
    return Post("/api/v1/agent/feedback", "agent.feedback", payload.dump(), {}, kMaxRetries).ok;
}

bool NetworkClient::ReportJobStatus(const std::string& agentId, const MigrationJob& job) {
    nlohmann::json payload = JobSummary(job);
    payload["agentId"] = agentId;
    return Post("/api/v1/agent/jobs/" + job.id, "agent.job_status", payload.dump(), {}, 1).ok;
}

bool NetworkClient::ParseCommands(const std::string& body, std::vector<CommandPayload>& outCommands) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.contains("commands") || !json["commands"].is_array()) {
        return true;
    }

    for (const auto& item : json["commands"]) {
        if (!item.is_object()) {
            continue;
        }
        CommandPayload command;
        command.commandId = item.value("commandId", "");
        command.jobId = item.value("jobId", "");
        command.action = item.value("action", "");
        command.nonce = item.value("nonce", "");
        command.expiresAt = item.value("expiresAt", "");

        if (item.contains("parameters")) {
            if (item["parameters"].is_string()) {
                command.parameters = item.value("parameters", "");
            } else {
                command.parameters = item["parameters"].dump();
            }
        }

        if (!command.commandId.empty()) {
            outCommands.push_back(std::move(command));
        }
    }

    return true;
}

NetworkClient::PostResult NetworkClient::Post(
    const std::string& path,
    const std::string& spanName,
    const std::string& payload,
    const std::string& token,
    int maxAttempts) const {
    PostResult result;
    const std::string url = BuildUrl(baseUrl_, path);

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        auto span = Tracer::Instance().StartSpan(spanName);
        Tracer::Instance().SetAttribute(span, "http.method", "POST");
        Tracer::Instance().SetAttribute(span, "http.url", url);
        Tracer::Instance().SetAttribute(span, "retry.attempt", static_cast<int64_t>(attempt + 1));

        const cpr::Header headers = BuildHeaders(span.traceparent, apiKey_, token);
        cpr::Response response = tlsSettings_.enabled
            ? cpr::Post(
                cpr::Url{url},
                cpr::Body{payload},
                headers,
                cpr::ConnectTimeout{kConnectTimeout},
                cpr::Timeout{kRequestTimeout},
                BuildSslOptions(tlsSettings_))
            : cpr::Post(
                cpr::Url{url},
                cpr::Body{payload},
                headers,
                cpr::ConnectTimeout{kConnectTimeout},
                cpr::Timeout{kRequestTimeout});

        const bool requestOk = response.error.code == cpr::ErrorCode::OK;
        const bool statusOk = IsSuccessStatus(response);
        Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
        Tracer::Instance().EndSpan(span, requestOk && statusOk);

        if (requestOk && statusOk) {
            result.ok = true;
            result.body = std::move(response.text);
            return result;
        }

        if (attempt + 1 < maxAttempts) {
            LogRetry(spanName, attempt, maxAttempts);
            std::this_thread::sleep_for(std::chrono::seconds(BackoffSeconds(attempt)));
            continue;
        }

        if (!requestOk) {
            std::cerr << "[Network] " << spanName << " failed: " << response.error.message << std::endl;
        } else {
            std::cerr << "[Network] " << spanName << " failed with HTTP " << response.status_code << std::endl;
        }
    }

    return result;
}
