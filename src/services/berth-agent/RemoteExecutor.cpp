#include "RemoteExecutor.hpp"

#include <array>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <utility>

#include <sys/wait.h>

namespace {
constexpr int kTimeoutExitCode = 124;
constexpr int kTimeoutKillAfterSeconds = 5;
} // namespace

std::string RemoteExecutor::QuoteArgument(const std::string& value) {
    std::string quoted = "'";
    for (const char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}

std::string RemoteExecutor::BuildSshTransport(const HostCredentials& credentials, std::chrono::seconds connectTimeout) {
    std::ostringstream command;
    command << "ssh -p " << credentials.port
            << " -o BatchMode=yes"
            << " -o ConnectTimeout=" << connectTimeout.count()
            << " -o ServerAliveInterval=15";
    if (!credentials.identityFile.empty()) {
        command << " -i " << QuoteArgument(credentials.identityFile);
    }
    return command.str();
}

std::string RemoteExecutor::BuildSshCommand(
    const HostCredentials& credentials,
    const std::string& remoteCommand,
    std::chrono::seconds connectTimeout) {
    if (credentials.host.empty() || remoteCommand.empty()) {
        return {};
    }

    std::ostringstream command;
    command << BuildSshTransport(credentials, connectTimeout)
            << " " << credentials.user << "@" << credentials.host
            << " " << QuoteArgument(remoteCommand);
    return command.str();
}

CommandResult RemoteExecutor::RunShellCommand(const std::string& command, std::chrono::seconds timeout) {
    CommandResult result;
    if (command.empty()) {
        return result;
    }

    std::ostringstream wrapped;
    wrapped << "timeout --kill-after=" << kTimeoutKillAfterSeconds << " " << timeout.count()
            << " sh -c " << QuoteArgument(command) << " 2>&1";

    FILE* pipe = popen(wrapped.str().c_str(), "r");
    if (pipe == nullptr) {
        std::cerr << "[Executor] popen failed for command: " << command << std::endl;
        return result;
    }

    std::array<char, 4096> buffer{};
    size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), read);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    result.timedOut = result.exitCode == kTimeoutExitCode || result.exitCode == 128 + 9;
    return result;
}

LocalExecutor::LocalExecutor(HostCredentials credentials, CommandRunner runner)
    : credentials_(std::move(credentials)),
      runner_(std::move(runner)) {
    credentials_.local = true;
    if (credentials_.host.empty()) {
        credentials_.host = "localhost";
    }
}

CommandResult LocalExecutor::Run(const std::string& command, std::chrono::seconds timeout) const {
    if (runner_) {
        return runner_(command, timeout);
    }
    return RunShellCommand(command, timeout);
}

std::string LocalExecutor::HostId() const {
    return credentials_.hostRef.empty() ? credentials_.host : credentials_.hostRef;
}

SshExecutor::SshExecutor(HostCredentials credentials, std::chrono::seconds connectTimeout, CommandRunner runner)
    : credentials_(std::move(credentials)),
      connectTimeout_(connectTimeout),
      runner_(std::move(runner)) {}

CommandResult SshExecutor::Run(const std::string& command, std::chrono::seconds timeout) const {
    const std::string sshCommand = BuildSshCommand(credentials_, command, connectTimeout_);
    if (sshCommand.empty()) {
        return {};
    }

    if (runner_) {
        return runner_(sshCommand, timeout);
    }
    return RunShellCommand(sshCommand, timeout);
}

std::string SshExecutor::HostId() const {
    return credentials_.hostRef.empty() ? credentials_.host : credentials_.hostRef;
}

std::unique_ptr<RemoteExecutor> MakeExecutor(
    const HostCredentials& credentials,
    std::chrono::seconds connectTimeout,
    RemoteExecutor::CommandRunner runner) {
    if (credentials.local) {
        return std::make_unique<LocalExecutor>(credentials, std::move(runner));
    }
    return std::make_unique<SshExecutor>(credentials, connectTimeout, std::move(runner));
}
