#include "CommandDispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>

namespace {
nlohmann::json ParseParameters(const std::string& parameters) {
    if (parameters.empty()) {
        return nlohmann::json::object();
    }

    auto parsed = nlohmann::json::parse(parameters, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }

    return parsed;
}

std::string RequireString(const nlohmann::json& parameters, const char* key) {
    const auto it = parameters.find(key);
    if (it == parameters.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ValidationError(std::string("Missing parameter '") + key + "'");
    }
    return it->get<std::string>();
}
} // namespace

CommandDispatcher::CommandDispatcher(NetworkClient& client, MigrationStateMachine& migrations, std::string agentId)
    : client_(client),
      migrations_(migrations),
      agentId_(std::move(agentId)) {}

void CommandDispatcher::Dispatch(const CommandPayload& command) {
    if (command.nonce.empty()) {
        ReportResult(command, "FAILED", "Invalid nonce", "Missing nonce");
        return;
    }

    if (IsDuplicateNonce(command.nonce)) {
        ReportResult(command, "COMPLETED", "Duplicate", "Duplicate nonce");
        return;
    }

    const std::string action = ToUpper(command.action);
    try {
        Execute(command, action);
    } catch (const MigrationError& ex) {
        std::cerr << "[Agent] " << action << " rejected: " << ex.what() << std::endl;
        ReportResult(command, "FAILED", ErrorKindName(ex.Kind()), ex.what());
    } catch (const std::exception& ex) {
        std::cerr << "[Agent] " << action << " failed: " << ex.what() << std::endl;
        ReportResult(command, "FAILED", "Internal error", ex.what());
    }
}

void CommandDispatcher::Execute(const CommandPayload& command, const std::string& action) {
    const nlohmann::json parameters = ParseParameters(command.parameters);
    const std::string jobId = command.jobId.empty() ? parameters.value("jobId", "") : command.jobId;

    if (action == "MIGRATE") {
        const std::string started = migrations_.StartMigration(
            RequireString(parameters, "unit"),
            RequireString(parameters, "sourceHost"),
            RequireString(parameters, "destinationHost"),
            RequireString(parameters, "destinationPath"));
        ReportResult(command, "COMPLETED", nlohmann::json{{"jobId", started}}.dump(), "");
        return;
    }

    if (action == "LIST") {
        nlohmann::json jobs = nlohmann::json::array();
        for (const auto& job : migrations_.ListJobs()) {
            jobs.push_back({
                {"jobId", job.id},
                {"unit", job.unit ? job.unit->Name() : job.unitIdentifier},
                {"status", MigrationStateName(job.status)},
                {"progress", job.progress}
            });
        }
        ReportResult(command, "COMPLETED", jobs.dump(), "");
        return;
    }

    if (action == "PRUNE") {
        const size_t pruned = migrations_.PruneExpired();
        ReportResult(command, "COMPLETED", nlohmann::json{{"pruned", pruned}}.dump(), "");
        return;
    }

    if (jobId.empty()) {
        throw ValidationError("Missing jobId for " + action);
    }

    if (action == "STATUS") {
        const auto job = migrations_.GetStatus(jobId);
        if (!job) {
            throw NotFoundError("Unknown job " + jobId);
        }
        ReportResult(command, "COMPLETED", nlohmann::json(*job).dump(), "");
        return;
    }

    if (action == "CANCEL") {
        migrations_.Cancel(jobId, parameters.value("skipRollback", false));
        ReportResult(command, "COMPLETED", "Cancellation requested", "");
        return;
    }

    if (action == "RESUME") {
        migrations_.Resume(jobId);
        ReportResult(command, "COMPLETED", "Resumed", "");
        return;
    }

    if (action == "CLEANUP") {
        migrations_.Cleanup(jobId);
        ReportResult(command, "COMPLETED", "Cleaned up", "");
        return;
    }

    ReportResult(command, "FAILED", "Unsupported action", "Unsupported action " + action);
}

void CommandDispatcher::ReportExpired(const CommandPayload& command) {
    ReportResult(command, "FAILED", "Expired", "Command expired");
}

void CommandDispatcher::ReportResult(
    const CommandPayload& command,
    const std::string& status,
    const std::string& result,
    const std::string& error) {
    CommandFeedback feedback;
    feedback.commandId = command.commandId;
    feedback.status = status;
    feedback.result = result;
    feedback.error = error;

    if (!client_.SendFeedback(agentId_, feedback)) {
        std::cerr << "[Agent] Failed to send feedback for command " << command.commandId << std::endl;
    }
}

bool CommandDispatcher::IsDuplicateNonce(const std::string& nonce) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = processedNonces_.insert(nonce);
    (void)it;
    return !inserted;
}

std::string CommandDispatcher::ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}
