#pragma once

#include "RemoteChannel.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct SshSettings {
    std::string host;
    std::string user = "root";
    int port = 22;
    // Directory holding the ControlMaster socket.
    std::string controlDir;
    std::chrono::seconds controlPersist{600};
    std::chrono::seconds commandTimeout{900};
    std::string sshBinary = "ssh";
    std::string scpBinary = "scp";
};

struct ProcessResult {
    int exitStatus = -1;
    std::string stdoutText;
    std::string stderrText;
};

// Runs argv without a shell. Throws CommandTimeoutError / OperationCancelled
// after killing the child, RemoteChannelError when it cannot be started.
ProcessResult RunProcess(
    const std::vector<std::string>& argv,
    const std::optional<std::string>& input,
    std::chrono::milliseconds timeout,
    CancellationToken* cancel);

// RemoteChannel over the OpenSSH client. All invocations share one
// ControlMaster connection, opened by the first command and reopened by
// OpenSSH whenever it has gone away.
class SshChannel : public RemoteChannel {
public:
    using ProcessRunner = std::function<ProcessResult(
        const std::vector<std::string>&,
        const std::optional<std::string>&,
        std::chrono::milliseconds,
        CancellationToken*)>;

    explicit SshChannel(SshSettings settings, ProcessRunner runner = ProcessRunner());
    ~SshChannel() override;

    SshChannel(const SshChannel&) = delete;
    SshChannel& operator=(const SshChannel&) = delete;

    CommandResult Exec(const RemoteCommand& command, CancellationToken* cancel = nullptr) override;
    void Upload(const std::string& localPath, const std::string& remoteDir,
        CancellationToken* cancel = nullptr) override;

    // Tears down the master connection. Safe to call when none is open.
    void Close();

    std::vector<std::string> BuildExecArgv(const RemoteCommand& command) const;
    std::vector<std::string> BuildUploadArgv(const std::string& localPath, const std::string& remoteDir) const;
    std::vector<std::string> BuildExitArgv() const;

private:
    std::vector<std::string> CommonOptions() const;
    std::string ScpTarget(const std::string& remoteDir) const;
    void PrepareSession();
    ProcessResult Run(
        const std::vector<std::string>& argv,
        const std::optional<std::string>& input,
        CancellationToken* cancel);

    SshSettings settings_;
    ProcessRunner runner_;
    std::mutex mutex_;
    bool sessionUsed_ = false;
};
