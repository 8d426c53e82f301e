#pragma once

#include <cstddef>
#include <string>

constexpr std::size_t kMaxZoneNameLength = 64;
constexpr std::size_t kZoneNameSuffixLength = 8;

// Zone naming rules: starts alphanumeric, [A-Za-z0-9_.-] only, at most 64
// characters, not "global" and not starting with "SUNW".
bool IsValidZoneName(const std::string& name);

// Turns an arbitrary instance name into a label that stays valid once a
// "-<suffix>" is appended.
std::string SanitizeZoneLabel(const std::string& instanceName);

std::string BuildZoneName(const std::string& instanceName, const std::string& suffix);
std::string GenerateZoneName(const std::string& instanceName);
std::string RandomZoneSuffix();
