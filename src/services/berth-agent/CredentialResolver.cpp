#include "CredentialResolver.hpp"

#include "MigrationErrors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

FileCredentialResolver::FileCredentialResolver(std::string path)
    : path_(std::move(path)) {
    if (!Reload()) {
        std::cerr << "[Credentials] Ignoring unreadable credentials file " << path_ << std::endl;
    }
}

HostCredentials FileCredentialResolver::Resolve(const std::string& hostRef) const {
    const auto found = hosts_.find(hostRef);
    if (found != hosts_.end()) {
        return found->second;
    }

    if (hostRef == kLocalHostRef) {
        HostCredentials credentials;
        credentials.hostRef = hostRef;
        credentials.host = "localhost";
        credentials.local = true;
        return credentials;
    }

    throw ValidationError("Unknown host reference '" + hostRef + "'");
}

bool FileCredentialResolver::Reload() {
    hosts_.clear();
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return true;
    }

    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return Parse(text, hosts_);
}

bool FileCredentialResolver::Parse(const std::string& text, std::map<std::string, HostCredentials>& outHosts) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("hosts") || !json["hosts"].is_object()) {
        return false;
    }

    for (const auto& [ref, entry] : json["hosts"].items()) {
        if (!entry.is_object()) {
            continue;
        }

        HostCredentials credentials;
        credentials.hostRef = ref;
        try {
            credentials.host = entry.value("host", "");
            credentials.user = entry.value("user", "root");
            credentials.port = entry.value("port", 22);
            credentials.identityFile = entry.value("identityFile", "");
            credentials.local = entry.value("local", false);
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[Credentials] Malformed entry for " << ref << ": " << ex.what() << std::endl;
            return false;
        }

        if (credentials.host.empty() && !credentials.local) {
            std::cerr << "[Credentials] Host reference " << ref << " has no host" << std::endl;
            continue;
        }
        if (credentials.host.empty()) {
            credentials.host = "localhost";
        }
        outHosts[ref] = std::move(credentials);
    }
    return true;
}
