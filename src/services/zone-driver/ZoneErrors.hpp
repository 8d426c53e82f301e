#pragma once

#include <stdexcept>
#include <string>
#include <utility>

/*
  Error types raised by the driver.

  Everything derives from ZoneError so the CLI can report any failure with a
  single handler. Destroy never throws these for remote failures; it records
  them in its report instead.
*/

class ZoneError : public std::runtime_error {
public:
    explicit ZoneError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigError : public ZoneError {
public:
    explicit ConfigError(const std::string& msg) : ZoneError(msg) {}
};

class KeyPairError : public ZoneError {
public:
    explicit KeyPairError(const std::string& msg) : ZoneError(msg) {}
};

class ArtifactError : public ZoneError {
public:
    explicit ArtifactError(const std::string& msg) : ZoneError(msg) {}
};

// Transport-level failure: the command never ran or its outcome is unknown.
class RemoteChannelError : public ZoneError {
public:
    explicit RemoteChannelError(const std::string& msg) : ZoneError(msg) {}
};

class CommandTimeoutError : public RemoteChannelError {
public:
    explicit CommandTimeoutError(const std::string& msg) : RemoteChannelError(msg) {}
};

// The run state could not be written; remote work must not outlive it.
class StatePersistenceError : public ZoneError {
public:
    explicit StatePersistenceError(const std::string& msg) : ZoneError(msg) {}
};

class OperationCancelled : public ZoneError {
public:
    explicit OperationCancelled(const std::string& msg) : ZoneError(msg) {}
};

// A remote step ran and exited non-zero.
class ZoneCommandError : public ZoneError {
public:
    ZoneCommandError(const std::string& msg, std::string command, int exitStatus, std::string stderrText)
        : ZoneError(msg),
          command_(std::move(command)),
          exitStatus_(exitStatus),
          stderrText_(std::move(stderrText)) {}

    const std::string& Command() const { return command_; }
    int ExitStatus() const { return exitStatus_; }
    const std::string& StderrText() const { return stderrText_; }

private:
    std::string command_;
    int exitStatus_;
    std::string stderrText_;
};

class NetworkTimeoutError : public ZoneError {
public:
    NetworkTimeoutError(const std::string& msg, int attempts)
        : ZoneError(msg),
          attempts_(attempts) {}

    int Attempts() const { return attempts_; }

private:
    int attempts_;
};
