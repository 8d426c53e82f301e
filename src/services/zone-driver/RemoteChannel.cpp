#include "RemoteChannel.hpp"

#include <utility>

namespace {
bool IsShellSafe(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')
        || ch == '-' || ch == '_' || ch == '.' || ch == '/' || ch == ':' || ch == '=' || ch == '@'
        || ch == ',' || ch == '+';
}
} // namespace

std::string ShellQuote(const std::string& value) {
    if (value.empty()) {
        return "''";
    }

    bool safe = true;
    for (char ch : value) {
        if (!IsShellSafe(ch)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return value;
    }

    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}

RemoteCommand& RemoteCommand::WithStdin(std::string data) {
    stdinData = std::move(data);
    return *this;
}

std::string RemoteCommand::ToShellLine() const {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += ' ';
        }
        line += ShellQuote(arg);
    }
    return line;
}

std::string RemoteCommand::ToString() const {
    std::string text;
    for (const auto& arg : args) {
        if (!text.empty()) {
            text += ' ';
        }
        text += arg;
    }
    return text;
}
