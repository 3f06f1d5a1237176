#pragma once

#include <chrono>
#include <optional>
#include <string>

enum class NetworkQuality {
    Good,
    Poor,
    Terrible
};

// Per-operation bounds chosen once per run from the network-quality tier.
struct TimeoutProfile {
    std::chrono::seconds io;     // each open/read/write/close on the remote
    std::chrono::seconds cmd;    // directory creation, remote mount helper
    std::chrono::seconds probe;  // remote existence test

    static TimeoutProfile forQuality(NetworkQuality quality);
};

bool operator==(const TimeoutProfile& lhs, const TimeoutProfile& rhs);

// Accepts "good", "poor", "terrible" or the numeric form 0, 1, 2.
std::optional<NetworkQuality> parseNetworkQuality(const std::string& text);
std::string networkQualityToString(NetworkQuality quality);
