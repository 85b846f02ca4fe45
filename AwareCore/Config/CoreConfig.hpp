#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "PropertyMap.hpp"

namespace AWR::Config {

// Immutable tunables for the state manager. Values are populated by the hosting
// daemon before the event loop starts so the core remains pure C++.
struct CoreConfig {
    std::chrono::milliseconds commandTimeout{5000};
    std::chrono::milliseconds dataPathConfirmTimeout{20000};
    std::chrono::milliseconds pairingConfirmTimeout{20000};
    std::chrono::milliseconds bootstrappingConfirmTimeout{20000};
    std::chrono::milliseconds sendMessageTimeout{10000};
    std::chrono::milliseconds instantModeDuration{30000};

    // Host-side follow-on messages allowed per uid before enqueue is refused.
    int32_t messageQueueDepthPerUid{50};

    // Instant communication channels (MHz). A zero 5 GHz channel falls back to 2.4 GHz.
    int32_t instantModeChannel24GHz{2437};
    int32_t instantModeChannel5GHz{5745};

    std::string dataInterfacePrefix{"aware_data"};
    // 0 uses Capabilities::maxNdiInterfaces.
    int32_t maxDataInterfacesOverride{0};

    bool suspensionFeatureEnabled{true};

    // When false, a regular attach while an offload client holds Aware first
    // disables Aware and re-enables it for the new configuration.
    bool offloadFirmwareHandlesPriority{false};

    static CoreConfig MakeDefault();

    // Keys: AwareCommandTimeoutMs, AwareDataPathConfirmTimeoutMs,
    // AwarePairingConfirmTimeoutMs, AwareBootstrappingConfirmTimeoutMs,
    // AwareSendMessageTimeoutMs, AwareInstantModeDurationMs, AwareMessageQueueDepthPerUid,
    // AwareInstantModeChannel24GHz, AwareInstantModeChannel5GHz, AwareMaxDataInterfaces,
    // AwareSuspensionEnabled, AwareOffloadFirmwareHandlesPriority. Missing or
    // non-positive timeouts keep their default.
    static CoreConfig FromProperties(const PropertyMap& properties);
};

} // namespace AWR::Config
