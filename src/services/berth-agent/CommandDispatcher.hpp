#pragma once

#include "MigrationStateMachine.hpp"
#include "NetworkClient.hpp"

#include <mutex>
#include <set>
#include <string>

// Maps coordinator commands onto the migration state machine. Results are
// reported back as command feedback; job progress is reported separately.
class CommandDispatcher {
public:
    CommandDispatcher(NetworkClient& client, MigrationStateMachine& migrations, std::string agentId);

    void Dispatch(const CommandPayload& command);
    void ReportExpired(const CommandPayload& command);

private:
    void Execute(const CommandPayload& command, const std::string& action);
    void ReportResult(const CommandPayload& command, const std::string& status, const std::string& result, const std::string& error);
    bool IsDuplicateNonce(const std::string& nonce);
    static std::string ToUpper(std::string value);

    NetworkClient& client_;
    MigrationStateMachine& migrations_;
    std::string agentId_;
    std::set<std::string> processedNonces_;
    std::mutex mutex_;
};
