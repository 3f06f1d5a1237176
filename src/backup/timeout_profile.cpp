#include "backup/timeout_profile.hpp"
#include <algorithm>
#include <cctype>

using namespace std::chrono_literals;

TimeoutProfile TimeoutProfile::forQuality(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::Good:
            return {45s, 30s, 10s};
        case NetworkQuality::Poor:
            return {135s, 90s, 30s};
        case NetworkQuality::Terrible:
            // Long but finite so that a dead mount still ends the run eventually
            return {3600s, 1800s, 600s};
    }
    return {45s, 30s, 10s};
}

bool operator==(const TimeoutProfile& lhs, const TimeoutProfile& rhs) {
    return lhs.io == rhs.io && lhs.cmd == rhs.cmd && lhs.probe == rhs.probe;
}

std::optional<NetworkQuality> parseNetworkQuality(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "good" || lower == "0") {
        return NetworkQuality::Good;
    }
    if (lower == "poor" || lower == "1") {
        return NetworkQuality::Poor;
    }
    if (lower == "terrible" || lower == "2") {
        return NetworkQuality::Terrible;
    }
    return std::nullopt;
}

std::string networkQualityToString(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::Good:     return "good";
        case NetworkQuality::Poor:     return "poor";
        case NetworkQuality::Terrible: return "terrible";
    }
    return "good";
}
