#pragma once

#include <vector>

#include "HalTypes.hpp"
#include "../Config/Capabilities.hpp"

namespace AWR::Hal {

/**
 * @brief Result and event side of the Aware HAL binding.
 *
 * Registered once with the interface provider. Methods may be invoked from any
 * thread; implementations must hand the event over to their own event loop.
 *
 * Responses carry the transaction ID of the request they complete. Notifications
 * are not correlated with a request, except for follow-on message delivery
 * results which carry the transaction ID of the original send.
 */
class IAwareHalCallback {
public:
    virtual ~IAwareHalCallback() = default;

    // ------------------------------------------------------------------------
    // Responses
    // ------------------------------------------------------------------------

    virtual void OnCapabilitiesUpdateResponse(TransactionId txid,
                                              const Config::Capabilities& capabilities) = 0;
    virtual void OnConfigSuccessResponse(TransactionId txid) = 0;
    virtual void OnConfigFailedResponse(TransactionId txid, NanStatus reason) = 0;
    virtual void OnDisableResponse(TransactionId txid, NanStatus status) = 0;

    virtual void OnSessionConfigSuccessResponse(TransactionId txid, bool isPublish,
                                                PubSubId pubSubId) = 0;
    virtual void OnSessionConfigFailResponse(TransactionId txid, bool isPublish,
                                             NanStatus reason) = 0;

    virtual void OnMessageSendQueuedSuccessResponse(TransactionId txid) = 0;
    virtual void OnMessageSendQueuedFailResponse(TransactionId txid, NanStatus reason) = 0;

    virtual void OnCreateDataInterfaceResponse(TransactionId txid, bool success,
                                               NanStatus reason) = 0;
    virtual void OnDeleteDataInterfaceResponse(TransactionId txid, bool success,
                                               NanStatus reason) = 0;
    virtual void OnInitiateDataPathResponse(TransactionId txid, bool success, NanStatus reason,
                                            NdpId ndpId) = 0;
    virtual void OnRespondToDataPathRequestResponse(TransactionId txid, bool success,
                                                    NanStatus reason) = 0;
    virtual void OnEndDataPathResponse(TransactionId txid, bool success, NanStatus reason) = 0;

    virtual void OnInitiatePairingResponse(TransactionId txid, bool success, NanStatus reason,
                                           PairingId pairingId) = 0;
    virtual void OnRespondToPairingResponse(TransactionId txid, bool success,
                                            NanStatus reason) = 0;
    virtual void OnEndPairingResponse(TransactionId txid, bool success, NanStatus reason) = 0;

    virtual void OnInitiateBootstrappingResponse(TransactionId txid, bool success,
                                                 NanStatus reason,
                                                 BootstrappingId bootstrappingId) = 0;
    virtual void OnRespondToBootstrappingResponse(TransactionId txid, bool success,
                                                  NanStatus reason) = 0;

    virtual void OnSuspendResponse(TransactionId txid, NanStatus status) = 0;
    virtual void OnResumeResponse(TransactionId txid, NanStatus status) = 0;

    // ------------------------------------------------------------------------
    // Notifications
    // ------------------------------------------------------------------------

    virtual void OnInterfaceAddressChange(const MacAddress& mac) = 0;
    virtual void OnClusterChange(ClusterEventType eventType, const MacAddress& clusterId) = 0;
    virtual void OnMatch(const MatchEvent& event) = 0;
    virtual void OnMatchExpired(PubSubId pubSubId, InstanceId requestorInstanceId) = 0;
    virtual void OnSessionTerminated(PubSubId pubSubId, NanStatus reason, bool isPublish) = 0;
    virtual void OnMessageReceived(const MessageReceivedEvent& event) = 0;
    virtual void OnAwareDown(NanStatus reason) = 0;
    virtual void OnMessageSendSuccess(TransactionId txid) = 0;
    virtual void OnMessageSendFail(TransactionId txid, NanStatus reason) = 0;
    virtual void OnDataPathRequest(const DataPathRequestEvent& event) = 0;
    virtual void OnDataPathConfirm(const DataPathConfirmEvent& event) = 0;
    virtual void OnDataPathEnd(NdpId ndpId) = 0;
    virtual void OnDataPathScheduleUpdate(const DataPathScheduleUpdateEvent& event) = 0;
    virtual void OnPairingRequest(const PairingRequestEvent& event) = 0;
    virtual void OnPairingConfirm(const PairingConfirmEvent& event) = 0;
    virtual void OnBootstrappingRequest(const BootstrappingRequestEvent& event) = 0;
    virtual void OnBootstrappingConfirm(const BootstrappingConfirmEvent& event) = 0;
    virtual void OnSuspensionModeChanged(bool isSuspended) = 0;
};

} // namespace AWR::Hal
