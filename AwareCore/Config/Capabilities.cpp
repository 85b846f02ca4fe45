#include "Capabilities.hpp"

#include <algorithm>

#include "../Logging/Logging.hpp"

namespace AWR::Config {

Characteristics ToCharacteristics(const Capabilities& caps, bool suspensionFeatureEnabled) {
    Characteristics chars;
    chars.maxServiceNameLength = caps.maxServiceNameLen;
    chars.maxServiceSpecificInfoLength =
        std::max(caps.maxExtendedServiceSpecificInfoLen, caps.maxServiceSpecificInfoLen);
    chars.maxMatchFilterLength = caps.maxMatchFilterLen;
    chars.supportedDataPathCipherSuites = caps.supportedDataPathCipherSuites;
    chars.supportedPairingCipherSuites = caps.supportedPairingCipherSuites;
    chars.isInstantCommunicationModeSupported = caps.isInstantCommunicationModeSupported;
    chars.maxNdpNumber = caps.maxNdpSessions;
    chars.maxNdiNumber = caps.maxNdiInterfaces;
    chars.maxPublishNumber = caps.maxPublishes;
    chars.maxSubscribeNumber = caps.maxSubscribes;
    chars.isPairingSupported = caps.isNanPairingSupported;
    chars.isSuspensionSupported = suspensionFeatureEnabled && caps.isSuspensionSupported;
    return chars;
}

AwareResources ComputeAvailableResources(const Capabilities& caps,
                                         int32_t ndpsInUse,
                                         int32_t publishesInUse,
                                         int32_t subscribesInUse) {
    AwareResources resources;
    resources.availableDataPaths = caps.maxNdpSessions - ndpsInUse;
    resources.availablePublishSessions = caps.maxPublishes - publishesInUse;
    resources.availableSubscribeSessions = caps.maxSubscribes - subscribesInUse;

    if (resources.availableDataPaths < 0 || resources.availablePublishSessions < 0 ||
        resources.availableSubscribeSessions < 0) {
        AWR_LOG_ERROR(Config, "Available resources negative: ndp=%d pub=%d sub=%d "
                      "(in use ndp=%d pub=%d sub=%d)",
                      resources.availableDataPaths, resources.availablePublishSessions,
                      resources.availableSubscribeSessions,
                      ndpsInUse, publishesInUse, subscribesInUse);
    }
    return resources;
}

} // namespace AWR::Config
