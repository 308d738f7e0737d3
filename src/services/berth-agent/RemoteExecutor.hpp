#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

struct HostCredentials {
    std::string hostRef;
    std::string host;
    std::string user = "root";
    int port = 22;
    std::string identityFile;
    bool local = false;
};

struct CommandResult {
    int exitCode = -1;
    std::string output;
    bool timedOut = false;

    bool Ok() const { return exitCode == 0 && !timedOut; }
};

// Runs shell commands on one host. Components never build transport strings
// themselves; they only see this interface.
class RemoteExecutor {
public:
    using CommandRunner = std::function<CommandResult(const std::string&, std::chrono::seconds)>;

    virtual ~RemoteExecutor() = default;

    virtual CommandResult Run(const std::string& command, std::chrono::seconds timeout) const = 0;
    virtual std::string HostId() const = 0;
    virtual bool IsLocal() const = 0;
    virtual const HostCredentials& Credentials() const = 0;

    static std::string QuoteArgument(const std::string& value);
    static std::string BuildSshTransport(const HostCredentials& credentials, std::chrono::seconds connectTimeout);
    static std::string BuildSshCommand(
        const HostCredentials& credentials,
        const std::string& remoteCommand,
        std::chrono::seconds connectTimeout);

    // Executes through /bin/sh under coreutils timeout; stderr is folded into output.
    static CommandResult RunShellCommand(const std::string& command, std::chrono::seconds timeout);
};

class LocalExecutor : public RemoteExecutor {
public:
    explicit LocalExecutor(HostCredentials credentials = {}, CommandRunner runner = CommandRunner());

    CommandResult Run(const std::string& command, std::chrono::seconds timeout) const override;
    std::string HostId() const override;
    bool IsLocal() const override { return true; }
    const HostCredentials& Credentials() const override { return credentials_; }

private:
    HostCredentials credentials_;
    CommandRunner runner_;
};

class SshExecutor : public RemoteExecutor {
public:
    SshExecutor(HostCredentials credentials, std::chrono::seconds connectTimeout, CommandRunner runner = CommandRunner());

    CommandResult Run(const std::string& command, std::chrono::seconds timeout) const override;
    std::string HostId() const override;
    bool IsLocal() const override { return false; }
    const HostCredentials& Credentials() const override { return credentials_; }

    static constexpr int kSshConnectionFailure = 255;

private:
    HostCredentials credentials_;
    std::chrono::seconds connectTimeout_;
    CommandRunner runner_;
};

std::unique_ptr<RemoteExecutor> MakeExecutor(
    const HostCredentials& credentials,
    std::chrono::seconds connectTimeout,
    RemoteExecutor::CommandRunner runner = RemoteExecutor::CommandRunner());
