#pragma once

#include "CancellationToken.hpp"
#include "RemoteChannel.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

inline int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        std::random_device device;
        path_ = std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string File(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::string ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

struct RecordedUpload {
    std::string localPath;
    std::string remoteDir;
    std::string content;
    CancellationToken* cancel = nullptr;
};

// Records every command and answers from a scripted handler. Unhandled
// commands succeed with empty output.
class FakeRemoteChannel : public RemoteChannel {
public:
    using Handler = std::function<CommandResult(const RemoteCommand&)>;

    CommandResult Exec(const RemoteCommand& command, CancellationToken* cancel = nullptr) override {
        (void)cancel;
        commands.push_back(command);
        if (handler) {
            return handler(command);
        }
        return Success();
    }

    void Upload(const std::string& localPath, const std::string& remoteDir,
        CancellationToken* cancel = nullptr) override {
        uploads.push_back(RecordedUpload{localPath, remoteDir, ReadFile(localPath), cancel});
    }

    size_t CountStartingWith(const std::string& prefix) const {
        size_t count = 0;
        for (const auto& command : commands) {
            if (command.ToString().rfind(prefix, 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::string> Lines() const {
        std::vector<std::string> lines;
        for (const auto& command : commands) {
            lines.push_back(command.ToString());
        }
        return lines;
    }

    static CommandResult Success(const std::string& out = "") {
        CommandResult result;
        result.exitStatus = 0;
        result.stdoutText = out;
        return result;
    }

    static CommandResult Failure(int status, const std::string& err) {
        CommandResult result;
        result.exitStatus = status;
        result.stderrText = err;
        return result;
    }

    Handler handler;
    std::vector<RemoteCommand> commands;
    std::vector<RecordedUpload> uploads;
};
