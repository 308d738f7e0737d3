#pragma once

#include "MigrationStateMachine.hpp"
#include "NetworkClient.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <string>

struct AgentSettings {
    std::string coreUrl = "http://core-service:8080";
    std::string apiKey;
    TlsSettings tls;
    TraceConfig trace;
    std::string stateDir = "/var/lib/berth";
    std::string credentialsFile = "/etc/berth/hosts.json";
    std::chrono::seconds pollInterval{2};
    MigrationSettings migration;

    // Reads BERTH_* variables; malformed numbers keep their defaults.
    static AgentSettings FromEnvironment();
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
long long GetEnvInt(const char* name, long long defaultValue, long long minValue);
