#pragma once

#include <optional>
#include <string>

enum class ZonePhase {
    IDLE,
    KEYS_READY,
    ARTIFACTS_STAGED,
    ZONE_CONFIGURED,
    ZONE_CLONED,
    ZONE_BOOTED,
    NETWORK_PENDING,
    NETWORK_READY,
    NAT_REMOVED,
    ZONE_UNINSTALLED,
    ZONE_DELETED
};

const char* ToString(ZonePhase phase);
std::optional<ZonePhase> ParseZonePhase(const std::string& text);

// Everything destroy needs. Fields are empty/unset until the step that
// produces them has happened on the remote side.
struct RunState {
    std::string zoneName;
    std::string zoneIp;
    int zonePort = 0;

    // Endpoint for the test transport.
    std::string hostname;
    int port = 0;
    std::string username;

    ZonePhase phase = ZonePhase::IDLE;

    bool HasZone() const { return !zoneName.empty(); }
    bool HasForward() const { return zonePort != 0 && !zoneIp.empty(); }
    bool Empty() const { return zoneName.empty() && zoneIp.empty() && zonePort == 0; }
};
