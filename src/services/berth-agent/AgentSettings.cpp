#include "AgentSettings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    std::cerr << "[Agent] Ignoring " << name << "=" << value << ": expected a boolean" << std::endl;
    return defaultValue;
}

long long GetEnvInt(const char* name, long long defaultValue, long long minValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }

    char* end = nullptr;
    const long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0' || parsed < minValue) {
        std::cerr << "[Agent] Ignoring " << name << "=" << value << ": expected an integer >= " << minValue << std::endl;
        return defaultValue;
    }
    return parsed;
}

AgentSettings AgentSettings::FromEnvironment() {
    AgentSettings settings;
    settings.coreUrl = GetEnvOrDefault("BERTH_CORE_URL", settings.coreUrl);
    settings.apiKey = GetEnvOrDefault("BERTH_API_KEY", "");

    settings.tls.enabled = GetEnvBool("BERTH_MTLS_ENABLED", false);
    if (settings.tls.enabled) {
        settings.tls.certPath = GetEnvOrDefault("BERTH_MTLS_CERT_PATH", "");
        settings.tls.keyPath = GetEnvOrDefault("BERTH_MTLS_KEY_PATH", "");
        settings.tls.caPath = GetEnvOrDefault("BERTH_MTLS_CA_PATH", "");
        settings.tls.verifyPeer = GetEnvBool("BERTH_MTLS_VERIFY_PEER", true);
        settings.tls.verifyHost = GetEnvBool("BERTH_MTLS_VERIFY_HOST", false);
    }

    settings.trace.enabled = GetEnvBool("BERTH_OTEL_ENABLED", false);
    settings.trace.endpoint = GetEnvOrDefault("BERTH_OTEL_ENDPOINT", "");
    settings.trace.serviceName = "berth-agent";

    settings.stateDir = GetEnvOrDefault("BERTH_STATE_DIR", settings.stateDir);
    settings.credentialsFile = GetEnvOrDefault("BERTH_CREDENTIALS_FILE", settings.credentialsFile);
    settings.pollInterval = std::chrono::seconds(GetEnvInt("BERTH_POLL_INTERVAL_SECONDS", settings.pollInterval.count(), 1));

    auto& migration = settings.migration;
    migration.maxActiveTransfers = static_cast<size_t>(
        GetEnvInt("BERTH_MAX_ACTIVE_TRANSFERS", static_cast<long long>(migration.maxActiveTransfers), 1));
    migration.transferWorkers = static_cast<size_t>(
        GetEnvInt("BERTH_TRANSFER_WORKERS", static_cast<long long>(migration.transferWorkers), 1));
    migration.retryAttempts = static_cast<int>(GetEnvInt("BERTH_RETRY_ATTEMPTS", migration.retryAttempts, 1));
    migration.retryBaseDelay = std::chrono::milliseconds(GetEnvInt("BERTH_RETRY_BASE_MS", migration.retryBaseDelay.count(), 0));
    migration.retryMaxDelay = std::chrono::milliseconds(GetEnvInt("BERTH_RETRY_MAX_MS", migration.retryMaxDelay.count(), 0));
    migration.sshTimeout = std::chrono::seconds(GetEnvInt("BERTH_SSH_TIMEOUT_SECONDS", migration.sshTimeout.count(), 1));
    migration.commandTimeout = std::chrono::seconds(GetEnvInt("BERTH_COMMAND_TIMEOUT_SECONDS", migration.commandTimeout.count(), 1));
    migration.transferTimeout = std::chrono::seconds(GetEnvInt("BERTH_TRANSFER_TIMEOUT_SECONDS", migration.transferTimeout.count(), 1));
    migration.snapshotRetention = std::chrono::hours(GetEnvInt("BERTH_SNAPSHOT_RETENTION_HOURS", migration.snapshotRetention.count(), 0));
    migration.forceFileSync = GetEnvBool("BERTH_FORCE_FILE_SYNC", migration.forceFileSync);
    migration.requireRuntime = GetEnvBool("BERTH_REQUIRE_RUNTIME", migration.requireRuntime);
    return settings;
}
