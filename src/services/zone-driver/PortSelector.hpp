#pragma once

#include <functional>
#include <set>
#include <string>

class RemoteChannel;

constexpr int kMinForwardPort = 1025;
constexpr int kMaxForwardPort = 65535;

// Picks the external port for a zone's SSH redirection, avoiding ports that
// already have an rdr rule on the global zone.
class PortSelector {
public:
    using RandomPort = std::function<int()>;

    explicit PortSelector(RemoteChannel& channel, RandomPort random = RandomPort());

    int Select(int configuredPort);

    // Ports named on the left-hand side of "rdr ... port N ->" lines.
    static std::set<int> ParseRedirectedPorts(const std::string& ipnatListing);

private:
    bool ListRedirectedPorts(std::set<int>& outPorts);

    RemoteChannel& channel_;
    RandomPort random_;
};
