#include "ZoneName.hpp"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace {
bool IsAlnum(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

bool IsNameChar(char ch) {
    return IsAlnum(ch) || ch == '_' || ch == '-' || ch == '.';
}

bool IsReserved(const std::string& name) {
    return name == "global" || name.rfind("SUNW", 0) == 0;
}
} // namespace

bool IsValidZoneName(const std::string& name) {
    if (name.empty() || name.size() > kMaxZoneNameLength || !IsAlnum(name.front())) {
        return false;
    }

    for (char ch : name) {
        if (!IsNameChar(ch)) {
            return false;
        }
    }

    return !IsReserved(name);
}

std::string SanitizeZoneLabel(const std::string& instanceName) {
    std::string label = instanceName;
    for (auto& ch : label) {
        if (!IsNameChar(ch)) {
            ch = '-';
        }
    }

    if (label.empty() || !IsAlnum(label.front())) {
        label = "z" + label;
    }
    if (IsReserved(label)) {
        label = "k-" + label;
    }

    const std::size_t maxLabel = kMaxZoneNameLength - kZoneNameSuffixLength - 1;
    if (label.size() > maxLabel) {
        label.resize(maxLabel);
    }
    return label;
}

std::string BuildZoneName(const std::string& instanceName, const std::string& suffix) {
    return SanitizeZoneLabel(instanceName) + "-" + suffix;
}

std::string GenerateZoneName(const std::string& instanceName) {
    return BuildZoneName(instanceName, RandomZoneSuffix());
}

std::string RandomZoneSuffix() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (std::size_t i = 0; i < kZoneNameSuffixLength / 2; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}
