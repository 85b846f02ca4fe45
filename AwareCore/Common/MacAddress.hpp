#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <string>

namespace AWR {

using MacAddress = std::array<uint8_t, 6>;

inline constexpr MacAddress kAllZeroMac{};

[[nodiscard]] inline bool IsAllZero(const MacAddress& mac) noexcept {
    return mac == kAllZeroMac;
}

// "aa:bb:cc:dd:ee:ff"
[[nodiscard]] inline std::string ToString(const MacAddress& mac) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return std::string(buf);
}

} // namespace AWR
