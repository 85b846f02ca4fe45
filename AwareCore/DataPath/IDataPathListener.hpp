#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../Common/Identifiers.hpp"
#include "../Common/MacAddress.hpp"
#include "../Common/StatusCodes.hpp"
#include "../Hal/HalTypes.hpp"

namespace AWR::DataPath {

// Host-chosen handle correlating an initiate request with its NDP ID.
using DataPathRequestId = int32_t;

/**
 * @brief Receives data-path (NDP) lifecycle events.
 *
 * Implemented by the network layer of the hosting daemon. Called on the core's
 * event loop.
 */
class IDataPathListener {
public:
    virtual ~IDataPathListener() = default;

    virtual void OnInitiateSuccess(DataPathRequestId requestId, NdpId ndpId) = 0;
    virtual void OnInitiateFail(DataPathRequestId requestId, NanStatus reason) = 0;

    // Responder side: a peer asked for a data path. Answer with
    // AwareStateManager::RespondToDataPathRequest().
    virtual void OnRequest(NdpId ndpId, PubSubId pubSubId, const MacAddress& peerMac,
                           const std::vector<uint8_t>& message) = 0;
    virtual void OnRespondFail(NdpId ndpId, NanStatus reason) = 0;

    virtual void OnConfirm(NdpId ndpId, const MacAddress& peerMac, bool accept, NanStatus reason,
                           const std::vector<uint8_t>& message,
                           const std::vector<Hal::ChannelInfo>& channels) = 0;
    virtual void OnScheduleUpdate(NdpId ndpId, const std::vector<Hal::ChannelInfo>& channels) = 0;
    virtual void OnEnd(NdpId ndpId) = 0;

    // No confirm arrived in time; the NDP has been ended.
    virtual void OnConfirmTimeout(NdpId ndpId) = 0;
};

} // namespace AWR::DataPath
