#pragma once

#include "DriverConfig.hpp"

#include <functional>
#include <optional>
#include <string>

// Accepts 1/0, true/false, yes/no in any case.
std::optional<bool> ParseBoolValue(const std::string& text);

// Snapshot of the ambient values the defaults are derived from.
struct AmbientContext {
    std::string login;
    std::string hostname;
    std::string timestamp;
    std::string workingDir;
};

class ConfigResolver {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    explicit ConfigResolver(EnvLookup env = EnvLookup());

    // Defaults, then the JSON file (if any), then ZONE_DRIVER_* variables.
    DriverConfig Resolve(const std::string& instanceName, const std::string& configFile) const;
    DriverConfig Resolve(const std::string& instanceName, const std::string& configFile, const AmbientContext& ambient) const;

    static AmbientContext CaptureAmbient();
    static std::string EnvName(const std::string& key);

private:
    std::optional<std::string> Lookup(const std::string& key) const;

    EnvLookup env_;
};
