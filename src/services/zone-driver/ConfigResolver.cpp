#include "ConfigResolver.hpp"

#include "ZoneErrors.hpp"
#include "ZoneName.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include <unistd.h>

namespace {
std::optional<std::string> ProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

nlohmann::json LoadConfigFile(const std::string& path) {
    if (path.empty()) {
        return nlohmann::json::object();
    }

    std::ifstream input(path);
    if (!input) {
        throw ConfigError("Unable to read config file " + path);
    }

    auto json = nlohmann::json::parse(input, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw ConfigError("Config file " + path + " is not a JSON object");
    }
    return json;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool ParseBool(const std::string& key, const std::string& value) {
    if (auto parsed = ParseBoolValue(value)) {
        return *parsed;
    }
    throw ConfigError("Invalid boolean for " + key + ": " + value);
}

long long ParseInt(const std::string& key, const std::string& value) {
    try {
        size_t index = 0;
        const long long parsed = std::stoll(value, &index);
        if (index == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    throw ConfigError("Invalid integer for " + key + ": " + value);
}

std::string ExpandPath(const std::string& path, const std::string& workingDir, const std::string& home) {
    if (path.empty()) {
        return path;
    }

    std::filesystem::path expanded(path);
    if (path == "~" || path.rfind("~/", 0) == 0) {
        expanded = std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
    }
    if (expanded.is_relative()) {
        expanded = std::filesystem::path(workingDir) / expanded;
    }
    return expanded.lexically_normal().string();
}
} // namespace

std::optional<bool> ParseBoolValue(const std::string& text) {
    const std::string normalized = ToLower(text);
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }
    return std::nullopt;
}

ConfigResolver::ConfigResolver(EnvLookup env)
    : env_(env ? std::move(env) : EnvLookup(ProcessEnv)) {}

DriverConfig ConfigResolver::Resolve(const std::string& instanceName, const std::string& configFile) const {
    return Resolve(instanceName, configFile, CaptureAmbient());
}

DriverConfig ConfigResolver::Resolve(
    const std::string& instanceName,
    const std::string& configFile,
    const AmbientContext& ambient) const {
    const nlohmann::json file = LoadConfigFile(configFile);

    // Environment wins over the file; file values may be strings, numbers or
    // booleans and are normalized to text before typed parsing.
    auto raw = [&](const std::string& key) -> std::optional<std::string> {
        if (auto fromEnv = Lookup(key)) {
            return fromEnv;
        }
        if (!file.contains(key) || file[key].is_null()) {
            return std::nullopt;
        }
        const auto& value = file[key];
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_boolean()) {
            return value.get<bool>() ? std::string("true") : std::string("false");
        }
        if (value.is_number_integer()) {
            return std::to_string(value.get<long long>());
        }
        throw ConfigError("Unsupported value type for " + key);
    };
    auto text = [&](const std::string& key, std::string& target) {
        if (auto value = raw(key)) {
            target = *value;
        }
    };
    auto integer = [&](const std::string& key, long long minimum, long long maximum) -> std::optional<long long> {
        auto value = raw(key);
        if (!value) {
            return std::nullopt;
        }
        const long long parsed = ParseInt(key, *value);
        if (parsed < minimum || parsed > maximum) {
            throw ConfigError(key + " out of range: " + *value);
        }
        return parsed;
    };

    if (instanceName.empty()) {
        throw ConfigError("Instance name must not be empty");
    }

    DriverConfig config;
    config.instanceName = instanceName;

    text("global_zone_host", config.globalZoneHost);
    text("global_zone_username", config.globalZoneUsername);
    if (auto port = integer("global_zone_port", 1, 65535)) {
        config.globalZonePort = static_cast<int>(*port);
    }
    text("kitchen_user_name", config.kitchenUserName);

    const std::string home = Lookup("HOME").value_or(ambient.workingDir);
    const std::string keyDir = ambient.workingDir + "/." + config.kitchenUserName;
    config.sshPublicKey = keyDir + "/id_rsa.pub";
    config.sshPrivateKey = keyDir + "/id_rsa";
    text("ssh_public_key", config.sshPublicKey);
    text("ssh_private_key", config.sshPrivateKey);
    config.sshPublicKey = ExpandPath(config.sshPublicKey, ambient.workingDir, home);
    config.sshPrivateKey = ExpandPath(config.sshPrivateKey, ambient.workingDir, home);

    config.zoneComment = "Test Kitchen created by " + ambient.login + " on " + ambient.hostname
        + " at " + ambient.timestamp;
    text("zone_comment", config.zoneComment);
    text("zone_lower_link", config.zoneLowerLink);
    text("zone_path_root", config.zonePathRoot);
    text("zone_template", config.zoneTemplate);
    text("zone_name", config.zoneName);
    if (auto port = integer("zone_port", 1, 65535)) {
        config.zonePort = static_cast<int>(*port);
    }
    if (auto keep = raw("keep_config")) {
        config.keepConfig = ParseBool("keep_config", *keep);
    }

    text("transport_host", config.transportHost);
    config.sshControlDir = "/tmp/zone-driver-ssh-" + ambient.login;
    text("ssh_control_dir", config.sshControlDir);
    config.artifactDir = keyDir;
    config.stateDir = ambient.workingDir + "/.kitchen";
    text("state_dir", config.stateDir);
    config.sshControlDir = ExpandPath(config.sshControlDir, ambient.workingDir, home);
    config.stateDir = ExpandPath(config.stateDir, ambient.workingDir, home);

    if (auto interval = integer("zone_ready_interval", 0, 3600)) {
        config.zoneReadyInterval = std::chrono::seconds(*interval);
    }
    if (auto attempts = integer("zone_ready_attempts", 1, 1000000)) {
        config.zoneReadyAttempts = static_cast<int>(*attempts);
    }
    if (auto timeout = integer("zone_ready_timeout", 1, 86400)) {
        config.zoneReadyTimeout = std::chrono::seconds(*timeout);
    }
    if (auto timeout = integer("command_timeout", 1, 86400)) {
        config.commandTimeout = std::chrono::seconds(*timeout);
    }

    if (config.globalZoneHost.empty()) {
        throw ConfigError("global_zone_host is required");
    }
    if (config.globalZoneUsername.empty() || config.kitchenUserName.empty()) {
        throw ConfigError("global_zone_username and kitchen_user_name must not be empty");
    }
    if (!config.zoneName.empty() && !IsValidZoneName(config.zoneName)) {
        throw ConfigError("zone_name is not a valid zone name: " + config.zoneName);
    }
    if (config.transportHost.empty()) {
        config.transportHost = config.globalZoneHost;
    }
    if (!config.zonePathRoot.empty() && config.zonePathRoot.back() != '/') {
        config.zonePathRoot += '/';
    }

    return config;
}

AmbientContext ConfigResolver::CaptureAmbient() {
    AmbientContext ambient;

    char loginBuffer[256] = {};
    if (getlogin_r(loginBuffer, sizeof(loginBuffer)) == 0 && loginBuffer[0] != '\0') {
        ambient.login = loginBuffer;
    } else if (const char* user = std::getenv("USER")) {
        ambient.login = user;
    } else {
        ambient.login = "unknown";
    }

    char hostnameBuffer[256] = {};
    if (gethostname(hostnameBuffer, sizeof(hostnameBuffer)) == 0) {
        ambient.hostname = hostnameBuffer;
    } else {
        ambient.hostname = "unknown-host";
    }

    const auto nowTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime = {};
    localtime_r(&nowTime, &localTime);
    std::ostringstream timestamp;
    timestamp << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S %z");
    ambient.timestamp = timestamp.str();

    std::error_code error;
    const auto cwd = std::filesystem::current_path(error);
    ambient.workingDir = error ? std::string(".") : cwd.string();
    return ambient;
}

std::string ConfigResolver::EnvName(const std::string& key) {
    std::string name = "ZONE_DRIVER_";
    for (char ch : key) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return name;
}

std::optional<std::string> ConfigResolver::Lookup(const std::string& key) const {
    if (key == "HOME") {
        return env_("HOME");
    }
    return env_(EnvName(key));
}
