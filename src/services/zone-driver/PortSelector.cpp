#include "PortSelector.hpp"

#include "RemoteChannel.hpp"
#include "ZoneErrors.hpp"

#include <iostream>
#include <random>
#include <regex>
#include <sstream>
#include <utility>

namespace {
constexpr int kMaxDraws = 64;

int UniformPort() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(kMinForwardPort, kMaxForwardPort);
    return dist(rng);
}
} // namespace

PortSelector::PortSelector(RemoteChannel& channel, RandomPort random)
    : channel_(channel),
      random_(random ? std::move(random) : RandomPort(UniformPort)) {}

int PortSelector::Select(int configuredPort) {
    if (configuredPort != 0) {
        return configuredPort;
    }

    std::set<int> inUse;
    if (!ListRedirectedPorts(inUse)) {
        std::cerr << "[Zone] Unable to list active redirections; choosing a port blindly" << std::endl;
    }

    int port = random_();
    for (int draw = 1; draw < kMaxDraws && inUse.count(port) != 0; ++draw) {
        port = random_();
    }
    return port;
}

std::set<int> PortSelector::ParseRedirectedPorts(const std::string& ipnatListing) {
    static const std::regex rdrPort(R"(^\s*rdr\s+\S+\s+\S+\s+port\s+(\d{1,5})\s*->)");

    std::set<int> ports;
    std::istringstream lines(ipnatListing);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch match;
        if (std::regex_search(line, match, rdrPort)) {
            ports.insert(std::stoi(match[1].str()));
        }
    }
    return ports;
}

bool PortSelector::ListRedirectedPorts(std::set<int>& outPorts) {
    try {
        const CommandResult result = channel_.Exec(RemoteCommand{"/usr/sbin/ipnat", "-l"});
        if (!result.Ok()) {
            return false;
        }
        outPorts = ParseRedirectedPorts(result.stdoutText);
        return true;
    } catch (const RemoteChannelError& ex) {
        std::cerr << "[Zone] ipnat -l failed: " << ex.what() << std::endl;
        return false;
    }
}
