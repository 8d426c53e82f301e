#pragma once

#include <chrono>
#include <string>

// Resolved once per run by ConfigResolver; components receive it by const
// reference and never consult the environment themselves.
struct DriverConfig {
    std::string instanceName;

    // Administrative connection to the global zone.
    std::string globalZoneHost;
    std::string globalZoneUsername = "root";
    int globalZonePort = 22;
    std::string sshControlDir;

    // Account created inside the zone and the key pair it authenticates with.
    std::string kitchenUserName = "kitchen";
    std::string sshPublicKey;
    std::string sshPrivateKey;

    // Host the test transport connects to; defaults to globalZoneHost.
    std::string transportHost;

    std::string zoneComment;
    std::string zoneLowerLink = "kitchenstub0";
    std::string zonePathRoot = "/systems/zones/";
    std::string zoneTemplate = "kitchen-template";

    // Empty means generate; 0 means pick a free port.
    std::string zoneName;
    int zonePort = 0;

    bool keepConfig = false;

    // Local scratch directory for rendered artifacts.
    std::string artifactDir;
    std::string stateDir;

    std::chrono::seconds zoneReadyInterval{5};
    int zoneReadyAttempts = 120;
    std::chrono::seconds zoneReadyTimeout{600};
    std::chrono::seconds commandTimeout{900};
};
