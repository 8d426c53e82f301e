#include "StateStore.hpp"

#include "ZoneErrors.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace {
constexpr std::array<std::pair<ZonePhase, const char*>, 11> kPhaseNames{{
    {ZonePhase::IDLE, "idle"},
    {ZonePhase::KEYS_READY, "keys_ready"},
    {ZonePhase::ARTIFACTS_STAGED, "artifacts_staged"},
    {ZonePhase::ZONE_CONFIGURED, "zone_configured"},
    {ZonePhase::ZONE_CLONED, "zone_cloned"},
    {ZonePhase::ZONE_BOOTED, "zone_booted"},
    {ZonePhase::NETWORK_PENDING, "network_pending"},
    {ZonePhase::NETWORK_READY, "network_ready"},
    {ZonePhase::NAT_REMOVED, "nat_removed"},
    {ZonePhase::ZONE_UNINSTALLED, "zone_uninstalled"},
    {ZonePhase::ZONE_DELETED, "zone_deleted"},
}};

bool IsFileNameChar(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')
        || ch == '-' || ch == '_' || ch == '.';
}

// FNV-1a; stable across builds and platforms.
uint32_t HashName(const std::string& name) {
    uint32_t hash = 2166136261u;
    for (char ch : name) {
        hash ^= static_cast<unsigned char>(ch);
        hash *= 16777619u;
    }
    return hash;
}
} // namespace

const char* ToString(ZonePhase phase) {
    for (const auto& entry : kPhaseNames) {
        if (entry.first == phase) {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<ZonePhase> ParseZonePhase(const std::string& text) {
    for (const auto& entry : kPhaseNames) {
        if (text == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

StateStore::StateStore(std::string stateDir)
    : stateDir_(std::move(stateDir)) {}

RunState StateStore::Load(const std::string& instanceName) const {
    const std::string path = PathFor(instanceName);
    std::ifstream input(path);
    if (!input) {
        return {};
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Deserialize(buffer.str());
}

void StateStore::Save(const std::string& instanceName, const RunState& state) const {
    const std::string path = PathFor(instanceName);
    std::error_code error;

    if (state.Empty()) {
        std::filesystem::remove(path, error);
        if (error) {
            throw StatePersistenceError("Unable to remove state file " + path + ": " + error.message());
        }
        return;
    }

    std::filesystem::create_directories(stateDir_, error);
    if (error) {
        throw StatePersistenceError("Unable to create state directory " + stateDir_ + ": " + error.message());
    }

    const std::string tempPath = path + ".tmp";
    {
        std::ofstream output(tempPath, std::ios::binary | std::ios::trunc);
        output << Serialize(state);
        if (!output.good()) {
            throw StatePersistenceError("Unable to write state file " + tempPath);
        }
    }

    std::filesystem::rename(tempPath, path, error);
    if (error) {
        throw StatePersistenceError("Unable to replace state file " + path + ": " + error.message());
    }
}

std::string StateStore::PathFor(const std::string& instanceName) const {
    return (std::filesystem::path(stateDir_) / (FileStem(instanceName) + ".json")).string();
}

std::string StateStore::FileStem(const std::string& instanceName) {
    std::string stem = instanceName;
    bool changed = stem.empty();
    for (auto& ch : stem) {
        if (!IsFileNameChar(ch)) {
            ch = '-';
            changed = true;
        }
    }
    // No hidden files, and never "." or "..".
    if (!stem.empty() && stem.front() == '.') {
        stem.front() = '_';
        changed = true;
    }
    if (!changed) {
        return stem;
    }

    std::ostringstream suffix;
    suffix << std::hex << std::setw(8) << std::setfill('0') << HashName(instanceName);
    return stem + "-" + suffix.str();
}

std::string StateStore::Serialize(const RunState& state) {
    nlohmann::json json = nlohmann::json::object();
    if (!state.zoneName.empty()) {
        json["zone_name"] = state.zoneName;
    }
    if (!state.zoneIp.empty()) {
        json["zone_ip"] = state.zoneIp;
    }
    if (state.zonePort != 0) {
        json["zone_port"] = state.zonePort;
    }
    if (!state.hostname.empty()) {
        json["hostname"] = state.hostname;
    }
    if (state.port != 0) {
        json["port"] = state.port;
    }
    if (!state.username.empty()) {
        json["username"] = state.username;
    }
    json["phase"] = ToString(state.phase);
    return json.dump(2) + "\n";
}

RunState StateStore::Deserialize(const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw ZoneError("State file is not a JSON object");
    }

    RunState state;
    try {
        state.zoneName = json.value("zone_name", "");
        state.zoneIp = json.value("zone_ip", "");
        state.zonePort = json.value("zone_port", 0);
        state.hostname = json.value("hostname", "");
        state.port = json.value("port", 0);
        state.username = json.value("username", "");
        state.phase = ParseZonePhase(json.value("phase", "idle")).value_or(ZonePhase::IDLE);
    } catch (const nlohmann::json::exception& ex) {
        throw ZoneError(std::string("Malformed state file: ") + ex.what());
    }
    return state;
}
