#include "ConfigRequest.hpp"

#include <algorithm>

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace AWR::Config {

namespace {

int32_t MergeDiscoveryWindow(int32_t current, int32_t other) {
    if (current == ConfigRequest::kDwIntervalNotInit) {
        return other;
    }
    if (other == ConfigRequest::kDwIntervalNotInit) {
        return current;
    }
    if (current == ConfigRequest::kDwDisable) {
        return other;
    }
    if (other == ConfigRequest::kDwDisable) {
        return current;
    }
    return std::min(current, other);
}

} // namespace

Result<void> ConfigRequest::Validate() const noexcept {
    if (masterPreference < 0 || masterPreference > 255) {
        return AWR_ERROR_INVALID("Master preference out of range [0, 255]");
    }
    if (clusterLow < kClusterIdMin || clusterLow > kClusterIdMax) {
        return AWR_ERROR_INVALID("Cluster low out of range");
    }
    if (clusterHigh < kClusterIdMin || clusterHigh > kClusterIdMax) {
        return AWR_ERROR_INVALID("Cluster high out of range");
    }
    if (clusterLow > clusterHigh) {
        return AWR_ERROR_INVALID("Cluster low exceeds cluster high");
    }
    for (int32_t dw : discoveryWindowInterval) {
        if (dw != kDwIntervalNotInit && (dw < kDwDisable || dw > kDwIntervalMax)) {
            return AWR_ERROR_INVALID("Discovery window interval out of range");
        }
    }
    return {};
}

std::optional<ConfigRequest> MergeConfigRequests(std::span<const ConfigRequest* const> existing,
                                                 const ConfigRequest* incoming) {
    if (existing.empty() && incoming == nullptr) {
        AWR_LOG_ERROR(Config, "MergeConfigRequests: called with no clients and no request");
        return std::nullopt;
    }

    ConfigRequest merged;
    bool clusterSeeded = false;
    if (incoming != nullptr) {
        merged = *incoming;
        clusterSeeded = true;
    }

    for (const ConfigRequest* request : existing) {
        if (request == nullptr) {
            continue;
        }

        merged.support5gBand = merged.support5gBand || request->support5gBand;
        merged.support6gBand = merged.support6gBand || request->support6gBand;
        merged.masterPreference = std::max(merged.masterPreference, request->masterPreference);

        if (!clusterSeeded) {
            clusterSeeded = true;
            merged.clusterLow = request->clusterLow;
            merged.clusterHigh = request->clusterHigh;
        } else if (merged.clusterLow != request->clusterLow ||
                   merged.clusterHigh != request->clusterHigh) {
            AWR_LOG_V1(Config, "MergeConfigRequests: cluster range mismatch [%d,%d] vs [%d,%d]",
                       merged.clusterLow, merged.clusterHigh,
                       request->clusterLow, request->clusterHigh);
            return std::nullopt;
        }

        for (size_t band = 0; band < kNanBandCount; ++band) {
            merged.discoveryWindowInterval[band] = MergeDiscoveryWindow(
                merged.discoveryWindowInterval[band], request->discoveryWindowInterval[band]);
        }
    }

    return merged;
}

} // namespace AWR::Config
