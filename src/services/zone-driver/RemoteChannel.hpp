#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;

// A remote command as an argument vector. Nothing is interpolated into a
// shell string; ToShellLine() quotes every argument exactly once.
struct RemoteCommand {
    std::vector<std::string> args;
    std::optional<std::string> stdinData;

    RemoteCommand() = default;
    RemoteCommand(std::initializer_list<std::string> arguments)
        : args(arguments) {}

    RemoteCommand& WithStdin(std::string data);

    std::string ToShellLine() const;
    std::string ToString() const;
};

struct CommandResult {
    int exitStatus = -1;
    std::string stdoutText;
    std::string stderrText;

    bool Ok() const { return exitStatus == 0; }
};

std::string ShellQuote(const std::string& value);

// One administrative session to the global zone.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    // Runs synchronously. A non-zero exit status is reported, not thrown;
    // transport failures, timeouts and cancellation throw.
    virtual CommandResult Exec(const RemoteCommand& command, CancellationToken* cancel = nullptr) = 0;

    // Copies a local file into an existing remote directory.
    virtual void Upload(const std::string& localPath, const std::string& remoteDir,
        CancellationToken* cancel = nullptr) = 0;
};
