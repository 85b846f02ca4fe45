#pragma once

#include <span>
#include <string>

#include "HalTypes.hpp"
#include "../Common/Error.hpp"

namespace AWR::Hal {

/**
 * @brief Request side of the Aware HAL binding.
 *
 * Every call is asynchronous. A successful Result means the HAL accepted the
 * request and will report the outcome through IAwareHalCallback using the same
 * transaction ID. An error Result is a synchronous rejection; no callback follows.
 *
 * Transaction ID 0 (kTransactionIdIgnore) is used for requests whose response
 * nobody waits for (stop publish/subscribe on terminate).
 */
class IAwareHal {
public:
    virtual ~IAwareHal() = default;

    virtual Result<void> GetCapabilities(TransactionId txid) = 0;
    virtual Result<void> EnableAndConfigure(TransactionId txid, const EnableRequest& request) = 0;
    virtual Result<void> Disable(TransactionId txid) = 0;

    /// publishId 0 starts a new publish, otherwise updates the existing one.
    virtual Result<void> Publish(TransactionId txid, PubSubId publishId,
                                 const PublishConfig& config) = 0;
    /// subscribeId 0 starts a new subscribe, otherwise updates the existing one.
    virtual Result<void> Subscribe(TransactionId txid, PubSubId subscribeId,
                                   const SubscribeConfig& config) = 0;
    virtual Result<void> StopPublish(TransactionId txid, PubSubId publishId) = 0;
    virtual Result<void> StopSubscribe(TransactionId txid, PubSubId subscribeId) = 0;

    virtual Result<void> SendMessage(TransactionId txid, PubSubId pubSubId,
                                     InstanceId requestorInstanceId, const MacAddress& destMac,
                                     std::span<const uint8_t> message, int32_t messageId) = 0;

    virtual Result<void> CreateDataInterface(TransactionId txid, const std::string& name) = 0;
    virtual Result<void> DeleteDataInterface(TransactionId txid, const std::string& name) = 0;
    virtual Result<void> InitiateDataPath(TransactionId txid,
                                          const InitiateDataPathRequest& request) = 0;
    virtual Result<void> RespondToDataPathRequest(TransactionId txid,
                                                  const Hal::RespondToDataPathRequest& request) = 0;
    virtual Result<void> EndDataPath(TransactionId txid, NdpId ndpId) = 0;

    virtual Result<void> InitiatePairing(TransactionId txid,
                                         const InitiatePairingRequest& request) = 0;
    virtual Result<void> RespondToPairingRequest(TransactionId txid,
                                                 const Hal::RespondToPairingRequest& request) = 0;
    virtual Result<void> EndPairing(TransactionId txid, PairingId pairingId) = 0;

    virtual Result<void> InitiateBootstrapping(TransactionId txid,
                                               const InitiateBootstrappingRequest& request) = 0;
    virtual Result<void> RespondToBootstrappingRequest(TransactionId txid,
                                                       BootstrappingId bootstrappingId,
                                                       bool accept, PubSubId pubSubId) = 0;

    virtual Result<void> Suspend(TransactionId txid, PubSubId pubSubId) = 0;
    virtual Result<void> Resume(TransactionId txid, PubSubId pubSubId) = 0;
};

} // namespace AWR::Hal
