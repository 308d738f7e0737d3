#pragma once

#include "RemoteExecutor.hpp"

#include <map>
#include <string>

// Maps a host reference to shell credentials. Requests only ever carry the
// reference; credentials never travel inline.
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;

    // Throws ValidationError for unknown references.
    virtual HostCredentials Resolve(const std::string& hostRef) const = 0;
};

class FileCredentialResolver : public CredentialResolver {
public:
    static constexpr const char* kLocalHostRef = "local";

    explicit FileCredentialResolver(std::string path);

    HostCredentials Resolve(const std::string& hostRef) const override;

    // Re-reads the file; returns false when it exists but cannot be parsed.
    bool Reload();
    static bool Parse(const std::string& text, std::map<std::string, HostCredentials>& outHosts);

private:
    std::string path_;
    std::map<std::string, HostCredentials> hosts_;
};
