#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace AWR::Config {

// Integer-valued service properties supplied by the hosting daemon before the
// core starts. Booleans are stored as 0/1.
using PropertyMap = std::map<std::string, int64_t, std::less<>>;

inline std::optional<int64_t> FindProperty(const PropertyMap& properties, std::string_view key) {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace AWR::Config
