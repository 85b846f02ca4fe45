#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "../Common/Error.hpp"

namespace AWR::Config {

enum class NanBand : uint8_t {
    k24GHz = 0,
    k5GHz = 1,
    k6GHz = 2,
};

inline constexpr size_t kNanBandCount = 3;

// Per-client cluster configuration contribution. Equality is field-wise so the
// merged result can be compared with the configuration active in the HAL.
struct ConfigRequest {
    static constexpr int32_t kClusterIdMin = 0;
    static constexpr int32_t kClusterIdMax = 0xFFFF;
    static constexpr int32_t kDwIntervalNotInit = -1;
    static constexpr int32_t kDwDisable = 0;
    static constexpr int32_t kDwIntervalMax = 5;

    bool support5gBand{false};
    bool support6gBand{false};
    int32_t masterPreference{0};
    int32_t clusterLow{kClusterIdMin};
    int32_t clusterHigh{kClusterIdMax};
    std::array<int32_t, kNanBandCount> discoveryWindowInterval{
        kDwIntervalNotInit, kDwIntervalNotInit, kDwIntervalNotInit};

    bool operator==(const ConfigRequest&) const = default;

    [[nodiscard]] int32_t DiscoveryWindow(NanBand band) const noexcept {
        return discoveryWindowInterval[static_cast<size_t>(band)];
    }

    // Range checks performed by the front door before a connect is posted.
    [[nodiscard]] Result<void> Validate() const noexcept;
};

/**
 * \brief Merge cluster configuration requests into one effective configuration.
 *
 * \param existing Configuration requests of every attached client.
 * \param incoming Request of a client being attached, if any.
 * \return Merged configuration, or std::nullopt when the requests are incompatible
 *         (cluster ranges differ) or when there is nothing to merge.
 *
 * \par Rules
 * - band support flags are ORed
 * - master preference is the maximum
 * - cluster range must be identical; the first participant seeds the comparison
 * - discovery window per band: unset stays unset, DW_DISABLE is replaced by any
 *   concrete value, otherwise the minimum wins
 *
 * The result does not depend on the order of \p existing.
 */
[[nodiscard]] std::optional<ConfigRequest> MergeConfigRequests(
    std::span<const ConfigRequest* const> existing,
    const ConfigRequest* incoming);

} // namespace AWR::Config
