#include "SshChannel.hpp"

#include "CancellationToken.hpp"
#include "ZoneErrors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr int kSshTransportFailure = 255;
constexpr int kPollSliceMs = 100;

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw RemoteChannelError(std::string("pipe failed: ") + std::strerror(errno));
        }
    }
    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int Read() const { return fds_[0]; }
    int Write() const { return fds_[1]; }
    void CloseRead() { CloseFd(fds_[0]); }
    void CloseWrite() { CloseFd(fds_[1]); }

private:
    static void CloseFd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void KillAndReap(pid_t pid) {
    kill(pid, SIGTERM);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

bool WriteAll(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

// Returns false on EOF.
bool Drain(int fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        const ssize_t count = read(fd, buffer, sizeof(buffer));
        if (count > 0) {
            sink.append(buffer, static_cast<size_t>(count));
            return true;
        }
        if (count == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return false;
    }
}
} // namespace

ProcessResult RunProcess(
    const std::vector<std::string>& argv,
    const std::optional<std::string>& input,
    std::chrono::milliseconds timeout,
    CancellationToken* cancel) {
    if (argv.empty()) {
        throw RemoteChannelError("empty argument vector");
    }

    Pipe stdinPipe;
    Pipe stdoutPipe;
    Pipe stderrPipe;
    Pipe execErrorPipe;

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        throw RemoteChannelError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // The driver blocks SIGINT/SIGTERM and ignores SIGPIPE; the client
        // must not inherit either.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);
        dup2(stdinPipe.Read(), STDIN_FILENO);
        dup2(stdoutPipe.Write(), STDOUT_FILENO);
        dup2(stderrPipe.Write(), STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        const int error = errno;
        ssize_t ignored = write(execErrorPipe.Write(), &error, sizeof(error));
        (void)ignored;
        _exit(127);
    }

    stdinPipe.CloseRead();
    stdoutPipe.CloseWrite();
    stderrPipe.CloseWrite();
    execErrorPipe.CloseWrite();

    int execError = 0;
    if (read(execErrorPipe.Read(), &execError, sizeof(execError)) == static_cast<ssize_t>(sizeof(execError))) {
        int status = 0;
        waitpid(pid, &status, 0);
        throw RemoteChannelError("unable to start " + argv[0] + ": " + std::strerror(execError));
    }

    // Inputs are a few hundred bytes at most, well under the pipe buffer.
    if (input && !WriteAll(stdinPipe.Write(), *input)) {
        KillAndReap(pid);
        throw RemoteChannelError("unable to write stdin of " + argv[0] + ": " + std::strerror(errno));
    }
    stdinPipe.CloseWrite();

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool stdoutOpen = true;
    bool stderrOpen = true;
    while (stdoutOpen || stderrOpen) {
        if (cancel && cancel->IsCancelled()) {
            KillAndReap(pid);
            throw OperationCancelled("Cancelled while running " + argv[0]);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            KillAndReap(pid);
            throw CommandTimeoutError(argv[0] + " did not finish within "
                + std::to_string(timeout.count()) + "ms");
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (stdoutOpen) {
            fds[count++] = pollfd{stdoutPipe.Read(), POLLIN, 0};
        }
        if (stderrOpen) {
            fds[count++] = pollfd{stderrPipe.Read(), POLLIN, 0};
        }

        const int ready = poll(fds, count, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            KillAndReap(pid);
            throw RemoteChannelError(std::string("poll failed: ") + std::strerror(errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == stdoutPipe.Read()) {
                stdoutOpen = Drain(fds[i].fd, result.stdoutText);
            } else {
                stderrOpen = Drain(fds[i].fd, result.stderrText);
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw RemoteChannelError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    result.exitStatus = DecodeStatus(status);
    return result;
}

SshChannel::SshChannel(SshSettings settings, ProcessRunner runner)
    : settings_(std::move(settings)),
      runner_(runner ? std::move(runner) : ProcessRunner(RunProcess)) {}

SshChannel::~SshChannel() {
    Close();
}

CommandResult SshChannel::Exec(const RemoteCommand& command, CancellationToken* cancel) {
    if (command.args.empty()) {
        throw RemoteChannelError("Refusing to run an empty remote command");
    }

    PrepareSession();
    const ProcessResult process = Run(BuildExecArgv(command), command.stdinData, cancel);
    if (process.exitStatus == kSshTransportFailure) {
        throw RemoteChannelError("ssh to " + settings_.host + " failed: " + process.stderrText);
    }

    CommandResult result;
    result.exitStatus = process.exitStatus;
    result.stdoutText = process.stdoutText;
    result.stderrText = process.stderrText;
    return result;
}

void SshChannel::Upload(const std::string& localPath, const std::string& remoteDir, CancellationToken* cancel) {
    if (localPath.empty() || remoteDir.empty()) {
        throw RemoteChannelError("Upload requires a local path and a remote directory");
    }
    if (!std::filesystem::exists(localPath)) {
        throw RemoteChannelError("Upload source not found: " + localPath);
    }

    PrepareSession();
    const ProcessResult process = Run(BuildUploadArgv(localPath, remoteDir), std::nullopt, cancel);
    if (process.exitStatus != 0) {
        throw RemoteChannelError("scp of " + localPath + " to " + settings_.host + ":" + remoteDir
            + " failed: " + process.stderrText);
    }
}

void SshChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sessionUsed_) {
            return;
        }
        sessionUsed_ = false;
    }

    try {
        const ProcessResult process = Run(BuildExitArgv(), std::nullopt, nullptr);
        if (process.exitStatus != 0) {
            std::cerr << "[Ssh] Control master for " << settings_.host << " was not running" << std::endl;
        }
    } catch (const ZoneError& ex) {
        std::cerr << "[Ssh] Failed to close session to " << settings_.host << ": " << ex.what() << std::endl;
    }
}

std::vector<std::string> SshChannel::BuildExecArgv(const RemoteCommand& command) const {
    std::vector<std::string> argv{settings_.sshBinary};
    const auto options = CommonOptions();
    argv.insert(argv.end(), options.begin(), options.end());
    argv.push_back("-T");
    argv.push_back("-p");
    argv.push_back(std::to_string(settings_.port));
    argv.push_back("-l");
    argv.push_back(settings_.user);
    argv.push_back(settings_.host);
    argv.push_back("--");
    argv.push_back(command.ToShellLine());
    return argv;
}

std::vector<std::string> SshChannel::BuildUploadArgv(const std::string& localPath, const std::string& remoteDir) const {
    std::vector<std::string> argv{settings_.scpBinary, "-q", "-p"};
    const auto options = CommonOptions();
    argv.insert(argv.end(), options.begin(), options.end());
    argv.push_back("-P");
    argv.push_back(std::to_string(settings_.port));
    argv.push_back("--");
    argv.push_back(localPath);
    argv.push_back(ScpTarget(remoteDir));
    return argv;
}

std::vector<std::string> SshChannel::BuildExitArgv() const {
    std::vector<std::string> argv{settings_.sshBinary};
    const auto options = CommonOptions();
    argv.insert(argv.end(), options.begin(), options.end());
    argv.push_back("-O");
    argv.push_back("exit");
    argv.push_back("-p");
    argv.push_back(std::to_string(settings_.port));
    argv.push_back("-l");
    argv.push_back(settings_.user);
    argv.push_back(settings_.host);
    return argv;
}

std::vector<std::string> SshChannel::CommonOptions() const {
    std::vector<std::string> options{
        "-o", "BatchMode=yes",
        "-o", "StrictHostKeyChecking=accept-new",
        "-o", "ServerAliveInterval=30",
        "-o", "ControlMaster=auto",
        "-o", "ControlPersist=" + std::to_string(settings_.controlPersist.count()),
    };
    if (!settings_.controlDir.empty()) {
        options.push_back("-o");
        options.push_back("ControlPath=" + (std::filesystem::path(settings_.controlDir) / "%C").string());
    }
    return options;
}

std::string SshChannel::ScpTarget(const std::string& remoteDir) const {
    std::string host = settings_.host;
    if (host.find(':') != std::string::npos) {
        host = "[" + host + "]";
    }

    std::string dir = remoteDir;
    if (dir.back() != '/') {
        dir += '/';
    }
    return settings_.user + "@" + host + ":" + dir;
}

void SshChannel::PrepareSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessionUsed_) {
        return;
    }

    if (!settings_.controlDir.empty()) {
        std::error_code error;
        std::filesystem::create_directories(settings_.controlDir, error);
        if (error) {
            throw RemoteChannelError("Unable to create ssh control directory " + settings_.controlDir
                + ": " + error.message());
        }
        std::filesystem::permissions(settings_.controlDir, std::filesystem::perms::owner_all,
            std::filesystem::perm_options::replace, error);
        if (error) {
            throw RemoteChannelError("Unable to restrict ssh control directory " + settings_.controlDir
                + ": " + error.message());
        }
    }

    std::cout << "[Ssh] Opening administrative session to " << settings_.user << "@" << settings_.host << std::endl;
    sessionUsed_ = true;
}

ProcessResult SshChannel::Run(
    const std::vector<std::string>& argv,
    const std::optional<std::string>& input,
    CancellationToken* cancel) {
    return runner_(argv, input, std::chrono::duration_cast<std::chrono::milliseconds>(settings_.commandTimeout), cancel);
}
