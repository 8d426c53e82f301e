#include "SshChannel.hpp"
#include "TestSupport.hpp"
#include "ZoneErrors.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace {
SshSettings MakeSettings() {
    SshSettings settings;
    settings.host = "gz.example.com";
    settings.user = "root";
    settings.port = 2200;
    settings.controlDir = "/tmp/zone-driver-ssh-test";
    return settings;
}

std::string Join(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}
} // namespace

int main() {
    if (ShellQuote("plain/path-1.cfg") != "plain/path-1.cfg") {
        return Fail("Safe argument was quoted.");
    }
    if (ShellQuote("") != "''") {
        return Fail("Empty argument not quoted.");
    }
    if (ShellQuote("a b") != "'a b'" || ShellQuote("it's") != "'it'\\''s'" || ShellQuote("$(reboot)") != "'$(reboot)'") {
        return Fail("Unsafe arguments not quoted correctly.");
    }

    const RemoteCommand injected{"/usr/sbin/zoneadm", "-z", "demo; rm -rf /", "boot"};
    if (injected.ToShellLine() != "/usr/sbin/zoneadm -z 'demo; rm -rf /' boot") {
        return Fail("Command line not built from quoted arguments: " + injected.ToShellLine());
    }

    std::vector<std::string> capturedArgv;
    std::optional<std::string> capturedInput;
    CancellationToken* capturedCancel = nullptr;
    int exitStatus = 0;
    SshChannel channel(MakeSettings(), [&](const std::vector<std::string>& argv,
                                           const std::optional<std::string>& input,
                                           std::chrono::milliseconds,
                                           CancellationToken* cancel) {
        capturedArgv = argv;
        capturedInput = input;
        capturedCancel = cancel;
        ProcessResult result;
        result.exitStatus = exitStatus;
        result.stdoutText = "out";
        result.stderrText = "err";
        return result;
    });

    const std::string options =
        "-o BatchMode=yes -o StrictHostKeyChecking=accept-new -o ServerAliveInterval=30 "
        "-o ControlMaster=auto -o ControlPersist=600 -o ControlPath=/tmp/zone-driver-ssh-test/%C";

    RemoteCommand nat{"/usr/sbin/ipnat", "-f", "-"};
    nat.WithStdin("rdr net0 0.0.0.0/0 port 2222 -> 10.0.0.5 port 22\n");
    const CommandResult ok = channel.Exec(nat);
    if (Join(capturedArgv) != "ssh " + options + " -T -p 2200 -l root gz.example.com -- /usr/sbin/ipnat -f -") {
        return Fail("Unexpected ssh argv: " + Join(capturedArgv));
    }
    if (!capturedInput || *capturedInput != *nat.stdinData) {
        return Fail("Stdin not forwarded to ssh.");
    }
    if (!ok.Ok() || ok.stdoutText != "out" || ok.stderrText != "err") {
        return Fail("Result not passed through.");
    }

    exitStatus = 1;
    const CommandResult failed = channel.Exec(RemoteCommand{"/usr/sbin/zoneadm", "-z", "demo", "halt"});
    if (failed.exitStatus != 1) {
        return Fail("Remote exit status not reported.");
    }

    exitStatus = 255;
    try {
        channel.Exec(RemoteCommand{"true"});
        return Fail("ssh transport failure should throw.");
    } catch (const RemoteChannelError&) {
    }

    exitStatus = 0;
    const std::string artifact = "/tmp/zone-driver-ssh-test-artifact.cfg";
    {
        std::ofstream output(artifact);
        output << "create -b\n";
    }
    CancellationToken uploadCancel;
    channel.Upload(artifact, "/systems/zones/kitchen_tmp/tmp.1", &uploadCancel);
    std::filesystem::remove(artifact);
    if (capturedCancel != &uploadCancel) {
        return Fail("scp does not observe the caller's cancellation token.");
    }
    if (Join(capturedArgv) != "scp -q -p " + options + " -P 2200 -- " + artifact
            + " root@gz.example.com:/systems/zones/kitchen_tmp/tmp.1/") {
        return Fail("Unexpected scp argv: " + Join(capturedArgv));
    }

    channel.Close();
    if (Join(capturedArgv) != "ssh " + options + " -O exit -p 2200 -l root gz.example.com") {
        return Fail("Unexpected control exit argv: " + Join(capturedArgv));
    }

    const ProcessResult local = RunProcess({"/bin/sh", "-c", "cat; echo warn >&2; exit 3"},
        std::string("hello"), std::chrono::seconds(10), nullptr);
    if (local.exitStatus != 3 || local.stdoutText != "hello" || local.stderrText != "warn\n") {
        return Fail("RunProcess did not capture output and status.");
    }

    try {
        RunProcess({"/bin/sh", "-c", "sleep 5"}, std::nullopt, std::chrono::milliseconds(200), nullptr);
        return Fail("Slow process should time out.");
    } catch (const CommandTimeoutError&) {
    }

    CancellationToken cancel;
    cancel.Cancel();
    try {
        RunProcess({"/bin/sh", "-c", "sleep 5"}, std::nullopt, std::chrono::seconds(10), &cancel);
        return Fail("Cancelled process should not run to completion.");
    } catch (const OperationCancelled&) {
    }

    try {
        RunProcess({"/nonexistent/zone-driver-ssh"}, std::nullopt, std::chrono::seconds(1), nullptr);
        return Fail("Missing binary should throw.");
    } catch (const RemoteChannelError&) {
    }

    return 0;
}
