#pragma once

#include <string>

struct ZoneConfigParams {
    std::string zonePath;
    std::string zoneLowerLink;
    std::string zoneComment;
};

struct ProfileParams {
    std::string zoneName;
    std::string kitchenUserName;
    std::string sshPublicKey;
};

// Renders the two documents the zone tools consume. Both functions are pure;
// missing required values throw ArtifactError.
class ArtifactRenderer {
public:
    // Command file for `zonecfg -f`.
    static std::string RenderZoneConfig(const ZoneConfigParams& params);

    // System configuration profile for `zoneadm clone -c`.
    static std::string RenderProfile(const ProfileParams& params);

    static std::string EscapeXml(const std::string& value);
};
