#include "CoreConfig.hpp"

#include "../Logging/Logging.hpp"

namespace AWR::Config {

namespace {

void ReadTimeout(const PropertyMap& properties, const char* key, std::chrono::milliseconds& out) {
    auto value = FindProperty(properties, key);
    if (!value) {
        return;
    }
    if (*value <= 0) {
        AWR_LOG_ERROR(Config, "Property '%{public}s' = %lld ignored (must be positive)",
                      key, static_cast<long long>(*value));
        return;
    }
    out = std::chrono::milliseconds(*value);
    AWR_LOG_INFO(Config, "Property '%{public}s' = %lld ms", key, static_cast<long long>(*value));
}

void ReadInt(const PropertyMap& properties, const char* key, int32_t& out) {
    if (auto value = FindProperty(properties, key)) {
        out = static_cast<int32_t>(*value);
        AWR_LOG_INFO(Config, "Property '%{public}s' = %d", key, out);
    }
}

} // namespace

CoreConfig CoreConfig::MakeDefault() {
    return CoreConfig{};
}

CoreConfig CoreConfig::FromProperties(const PropertyMap& properties) {
    CoreConfig config = MakeDefault();

    ReadTimeout(properties, "AwareCommandTimeoutMs", config.commandTimeout);
    ReadTimeout(properties, "AwareDataPathConfirmTimeoutMs", config.dataPathConfirmTimeout);
    ReadTimeout(properties, "AwarePairingConfirmTimeoutMs", config.pairingConfirmTimeout);
    ReadTimeout(properties, "AwareBootstrappingConfirmTimeoutMs",
                config.bootstrappingConfirmTimeout);
    ReadTimeout(properties, "AwareSendMessageTimeoutMs", config.sendMessageTimeout);
    ReadTimeout(properties, "AwareInstantModeDurationMs", config.instantModeDuration);

    ReadInt(properties, "AwareMessageQueueDepthPerUid", config.messageQueueDepthPerUid);
    ReadInt(properties, "AwareInstantModeChannel24GHz", config.instantModeChannel24GHz);
    ReadInt(properties, "AwareInstantModeChannel5GHz", config.instantModeChannel5GHz);
    ReadInt(properties, "AwareMaxDataInterfaces", config.maxDataInterfacesOverride);

    if (auto value = FindProperty(properties, "AwareSuspensionEnabled")) {
        config.suspensionFeatureEnabled = *value != 0;
    }
    if (auto value = FindProperty(properties, "AwareOffloadFirmwareHandlesPriority")) {
        config.offloadFirmwareHandlesPriority = *value != 0;
    }

    if (config.messageQueueDepthPerUid <= 0) {
        AWR_LOG_ERROR(Config, "Message queue depth %d invalid, using 50",
                      config.messageQueueDepthPerUid);
        config.messageQueueDepthPerUid = 50;
    }

    return config;
}

} // namespace AWR::Config
