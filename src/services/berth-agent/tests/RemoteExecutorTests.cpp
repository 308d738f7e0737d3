#include "RemoteExecutor.hpp"
#include "TestSupport.hpp"

#include <string>

int main() {
    if (RemoteExecutor::QuoteArgument("plain") != "'plain'") {
        return Fail("Plain argument quoting failed.");
    }
    if (RemoteExecutor::QuoteArgument("it's") != "'it'\\''s'") {
        return Fail("Embedded quote not escaped: " + RemoteExecutor::QuoteArgument("it's"));
    }

    HostCredentials credentials = RemoteHost("nas", "10.0.0.5");
    credentials.port = 2222;
    credentials.identityFile = "/etc/berth/id_ed25519";
    const std::string ssh = RemoteExecutor::BuildSshCommand(credentials, "echo hi", std::chrono::seconds(7));
    const std::string expected =
        "ssh -p 2222 -o BatchMode=yes -o ConnectTimeout=7 -o ServerAliveInterval=15 -i '/etc/berth/id_ed25519' "
        "root@10.0.0.5 'echo hi'";
    if (ssh != expected) {
        return Fail("Unexpected ssh command: " + ssh);
    }
    if (!RemoteExecutor::BuildSshCommand(HostCredentials{}, "echo hi", std::chrono::seconds(7)).empty()) {
        return Fail("Missing host should yield no command.");
    }

    const CommandResult echo = RemoteExecutor::RunShellCommand("echo hi", std::chrono::seconds(10));
    if (!echo.Ok() || echo.output != "hi\n") {
        return Fail("Shell echo failed: " + echo.output);
    }
    const CommandResult failing = RemoteExecutor::RunShellCommand("echo oops >&2; exit 3", std::chrono::seconds(10));
    if (failing.exitCode != 3 || failing.timedOut || failing.output != "oops\n") {
        return Fail("Exit code or folded stderr not captured.");
    }
    const CommandResult slow = RemoteExecutor::RunShellCommand("sleep 5", std::chrono::seconds(1));
    if (!slow.timedOut || slow.Ok()) {
        return Fail("Slow command should time out.");
    }

    std::string seen;
    SshExecutor remote(credentials, std::chrono::seconds(7), [&](const std::string& command, std::chrono::seconds) {
        seen = command;
        CommandResult result;
        result.exitCode = 0;
        return result;
    });
    remote.Run("echo hi", std::chrono::seconds(3));
    if (seen != expected || remote.HostId() != "nas" || remote.IsLocal()) {
        return Fail("Ssh executor did not wrap the command.");
    }

    LocalExecutor local(LocalHost("alpha"));
    if (local.HostId() != "alpha" || !local.IsLocal() || local.Run("printf ok", std::chrono::seconds(5)).output != "ok") {
        return Fail("Local executor misbehaved.");
    }
    if (LocalExecutor().HostId() != "localhost") {
        return Fail("Anonymous local executor should report localhost.");
    }

    if (!MakeExecutor(LocalHost("alpha"), std::chrono::seconds(5))->IsLocal()
        || MakeExecutor(credentials, std::chrono::seconds(5))->IsLocal()) {
        return Fail("MakeExecutor picked the wrong transport.");
    }

    return 0;
}
