#include "ArtifactRenderer.hpp"

#include "ZoneErrors.hpp"

#include <sstream>

namespace {
void RequireValue(const std::string& value, const char* name) {
    if (value.empty()) {
        throw ArtifactError(std::string(name) + " must not be empty");
    }
}

// zonecfg has no escape for quotes inside a quoted value.
std::string ZonecfgValue(const std::string& value, const char* name) {
    if (value.find_first_of("\"\n\r") != std::string::npos) {
        throw ArtifactError(std::string(name) + " must not contain quotes or line breaks");
    }
    return "\"" + value + "\"";
}

void RequireSingleLine(const std::string& value, const char* name) {
    if (value.find_first_of("\n\r") != std::string::npos) {
        throw ArtifactError(std::string(name) + " must be a single line");
    }
}
} // namespace

std::string ArtifactRenderer::RenderZoneConfig(const ZoneConfigParams& params) {
    RequireValue(params.zonePath, "zone_path");
    RequireValue(params.zoneLowerLink, "zone_lower_link");

    std::ostringstream out;
    out << "create -b\n"
        << "set brand=solaris\n"
        << "set zonepath=" << ZonecfgValue(params.zonePath, "zone_path") << "\n"
        << "set autoboot=false\n"
        << "set ip-type=exclusive\n"
        << "add anet\n"
        << "set linkname=net0\n"
        << "set lower-link=" << ZonecfgValue(params.zoneLowerLink, "zone_lower_link") << "\n"
        << "set mac-address=random\n"
        << "end\n";
    if (!params.zoneComment.empty()) {
        out << "add attr\n"
            << "set name=comment\n"
            << "set type=string\n"
            << "set value=" << ZonecfgValue(params.zoneComment, "zone_comment") << "\n"
            << "end\n";
    }
    out << "verify\n"
        << "commit\n";
    return out.str();
}

std::string ArtifactRenderer::RenderProfile(const ProfileParams& params) {
    RequireValue(params.zoneName, "zone_name");
    RequireValue(params.kitchenUserName, "kitchen_user_name");
    RequireValue(params.sshPublicKey, "ssh_public_key");
    RequireSingleLine(params.sshPublicKey, "ssh_public_key");

    const std::string nodename = EscapeXml(params.zoneName);
    const std::string user = EscapeXml(params.kitchenUserName);
    const std::string key = EscapeXml(params.sshPublicKey);

    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"US-ASCII\"?>\n"
        << "<!DOCTYPE service_bundle SYSTEM \"/usr/share/lib/xml/dtd/service_bundle.dtd.1\">\n"
        << "<service_bundle type=\"profile\" name=\"sysconfig\">\n"
        << "  <service version=\"1\" type=\"service\" name=\"system/identity\">\n"
        << "    <instance enabled=\"true\" name=\"node\">\n"
        << "      <property_group type=\"application\" name=\"config\">\n"
        << "        <propval type=\"astring\" name=\"nodename\" value=\"" << nodename << "\"/>\n"
        << "      </property_group>\n"
        << "    </instance>\n"
        << "  </service>\n"
        << "  <service version=\"1\" type=\"service\" name=\"network/install\">\n"
        << "    <instance enabled=\"true\" name=\"default\">\n"
        << "      <property_group type=\"application\" name=\"install_ipv4_interface\">\n"
        << "        <propval type=\"astring\" name=\"name\" value=\"net0/v4\"/>\n"
        << "        <propval type=\"astring\" name=\"address_type\" value=\"dhcp\"/>\n"
        << "      </property_group>\n"
        << "    </instance>\n"
        << "  </service>\n"
        << "  <service version=\"1\" type=\"service\" name=\"system/name-service/switch\">\n"
        << "    <property_group type=\"application\" name=\"config\">\n"
        << "      <propval type=\"astring\" name=\"default\" value=\"files\"/>\n"
        << "      <propval type=\"astring\" name=\"host\" value=\"files dns\"/>\n"
        << "    </property_group>\n"
        << "    <instance enabled=\"true\" name=\"default\"/>\n"
        << "  </service>\n"
        << "  <service version=\"1\" type=\"service\" name=\"system/config-user\">\n"
        << "    <instance enabled=\"true\" name=\"default\">\n"
        << "      <property_group type=\"application\" name=\"root_account\">\n"
        << "        <propval type=\"astring\" name=\"login\" value=\"root\"/>\n"
        << "        <propval type=\"astring\" name=\"type\" value=\"role\"/>\n"
        << "      </property_group>\n"
        << "      <property_group type=\"application\" name=\"user_account\">\n"
        << "        <propval type=\"astring\" name=\"login\" value=\"" << user << "\"/>\n"
        << "        <propval type=\"astring\" name=\"type\" value=\"normal\"/>\n"
        << "        <propval type=\"astring\" name=\"shell\" value=\"/usr/bin/bash\"/>\n"
        << "        <propval type=\"astring\" name=\"roles\" value=\"root\"/>\n"
        << "        <propval type=\"astring\" name=\"profiles\" value=\"System Administrator\"/>\n"
        << "        <propval type=\"astring\" name=\"sudoers\" value=\"ALL=(ALL) NOPASSWD: ALL\"/>\n"
        << "        <propval type=\"astring\" name=\"ssh_public_key\" value=\"" << key << "\"/>\n"
        << "      </property_group>\n"
        << "    </instance>\n"
        << "  </service>\n"
        << "  <service version=\"1\" type=\"service\" name=\"system/timezone\">\n"
        << "    <instance enabled=\"true\" name=\"default\">\n"
        << "      <property_group type=\"application\" name=\"timezone\">\n"
        << "        <propval type=\"astring\" name=\"localtime\" value=\"UTC\"/>\n"
        << "      </property_group>\n"
        << "    </instance>\n"
        << "  </service>\n"
        << "</service_bundle>\n";
    return out.str();
}

std::string ArtifactRenderer::EscapeXml(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        case '\'':
            escaped += "&apos;";
            break;
        default:
            escaped += ch;
        }
    }
    return escaped;
}
