#pragma once

#include <cstdint>

namespace AWR::Config {

// Hardware limits and feature flags, queried once from the HAL and cached.
struct Capabilities {
    int32_t maxConcurrentAwareClusters{0};
    int32_t maxPublishes{0};
    int32_t maxSubscribes{0};
    int32_t maxServiceNameLen{0};
    int32_t maxMatchFilterLen{0};
    int32_t maxTotalMatchFilterLen{0};
    int32_t maxServiceSpecificInfoLen{0};
    int32_t maxExtendedServiceSpecificInfoLen{0};
    int32_t maxNdiInterfaces{0};
    int32_t maxNdpSessions{0};
    int32_t maxAppInfoLen{0};
    int32_t maxQueuedTransmitMessages{0};
    int32_t maxSubscribeInterfaceAddresses{0};
    uint32_t supportedDataPathCipherSuites{0};
    uint32_t supportedPairingCipherSuites{0};
    bool isInstantCommunicationModeSupported{false};
    bool isSetClusterIdSupported{false};
    bool isNanPairingSupported{false};
    bool isSuspensionSupported{false};
    bool is6gSupported{false};
    bool isHeSupported{false};

    bool operator==(const Capabilities&) const = default;
};

// Application-facing projection of Capabilities.
struct Characteristics {
    int32_t maxServiceNameLength{0};
    int32_t maxServiceSpecificInfoLength{0};
    int32_t maxMatchFilterLength{0};
    uint32_t supportedDataPathCipherSuites{0};
    uint32_t supportedPairingCipherSuites{0};
    bool isInstantCommunicationModeSupported{false};
    int32_t maxNdpNumber{0};
    int32_t maxNdiNumber{0};
    int32_t maxPublishNumber{0};
    int32_t maxSubscribeNumber{0};
    bool isPairingSupported{false};
    bool isSuspensionSupported{false};

    bool operator==(const Characteristics&) const = default;
};

// Remaining NDP / publish / subscribe slots.
struct AwareResources {
    int32_t availableDataPaths{0};
    int32_t availablePublishSessions{0};
    int32_t availableSubscribeSessions{0};

    bool operator==(const AwareResources&) const = default;
};

// Suspension is reported only when both the hardware and the local feature
// switch allow it. Service-specific info length is the larger of the two limits.
[[nodiscard]] Characteristics ToCharacteristics(const Capabilities& caps,
                                                bool suspensionFeatureEnabled);

// Counts are reported as computed; a negative count indicates bookkeeping drift
// and is logged.
[[nodiscard]] AwareResources ComputeAvailableResources(const Capabilities& caps,
                                                       int32_t ndpsInUse,
                                                       int32_t publishesInUse,
                                                       int32_t subscribesInUse);

} // namespace AWR::Config
