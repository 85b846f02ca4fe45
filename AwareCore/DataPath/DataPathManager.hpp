#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "IDataPathListener.hpp"

namespace AWR::DataPath {

/**
 * @brief Commands the data-path manager issues back into the state manager.
 *
 * Each call queues a command; the HAL result returns through DataPathManager's
 * On* methods.
 */
class IDataPathControl {
public:
    virtual ~IDataPathControl() = default;

    virtual void CreateDataInterface(const std::string& name) = 0;
    virtual void DeleteDataInterface(const std::string& name) = 0;
    virtual void EndDataPath(NdpId ndpId) = 0;
};

enum class NdpRole : uint8_t {
    kInitiator,
    kResponder,
};

enum class NdpState : uint8_t {
    kResponderWaitForRespond,  // request received, host has not answered yet
    kWaitForConfirm,           // HAL accepted initiate/respond, confirm pending
    kConfirmed,
};

struct NdpRecord {
    NdpId ndpId{0};
    NdpRole role{NdpRole::kInitiator};
    NdpState state{NdpState::kWaitForConfirm};
    DataPathRequestId requestId{0};
    PubSubId pubSubId{0};
    MacAddress peerMac{};
    std::string interfaceName;
    std::vector<Hal::ChannelInfo> channels;
};

/**
 * @brief NDI interfaces and NDP records.
 *
 * Loop-thread only. The state manager forwards HAL results and notifications here
 * and arms the confirm timeout whenever an On* call returns true.
 */
class DataPathManager {
public:
    DataPathManager(IDataPathControl& control, std::string interfacePrefix);

    void SetListener(std::shared_ptr<IDataPathListener> listener) {
        listener_ = std::move(listener);
    }

    // ------------------------------------------------------------------------
    // Data interfaces (NDIs)
    // ------------------------------------------------------------------------

    // Requests `count` interfaces named <prefix>0..<prefix>count-1. Already known
    // names are skipped.
    void CreateAllInterfaces(int32_t count);
    void DeleteAllInterfaces();
    void OnInterfaceCreated(const std::string& name);
    void OnInterfaceDeleted(const std::string& name);
    void OnInterfaceCreateFailed(const std::string& name) { pendingCreate_.erase(name); }
    [[nodiscard]] const std::set<std::string>& Interfaces() const noexcept { return interfaces_; }

    // ------------------------------------------------------------------------
    // NDPs
    // ------------------------------------------------------------------------

    // Returns true when a confirm timeout should be armed.
    bool OnInitiateSuccess(DataPathRequestId requestId, NdpId ndpId, const MacAddress& peerMac,
                           const std::string& interfaceName);
    void OnInitiateFail(DataPathRequestId requestId, NanStatus reason);

    void OnRequest(const Hal::DataPathRequestEvent& event);
    // Returns true when a confirm timeout should be armed.
    bool OnRespondResult(NdpId ndpId, bool accept, const std::string& interfaceName,
                         bool success, NanStatus reason);

    // Returns true when the NDP was known (the confirm timeout can be dropped).
    bool OnConfirm(const Hal::DataPathConfirmEvent& event);
    void OnScheduleUpdate(const Hal::DataPathScheduleUpdateEvent& event);
    void OnEnd(NdpId ndpId);
    void OnConfirmTimeout(NdpId ndpId);

    // Radio went down: every NDP is gone and every interface with it.
    void OnAwareDown();

    [[nodiscard]] int32_t NumOfNdps() const noexcept {
        return static_cast<int32_t>(ndps_.size());
    }
    [[nodiscard]] const NdpRecord* Find(NdpId ndpId) const;

private:
    IDataPathControl& control_;
    std::string interfacePrefix_;
    std::shared_ptr<IDataPathListener> listener_;

    std::set<std::string> interfaces_;
    std::set<std::string> pendingCreate_;
    std::map<NdpId, NdpRecord> ndps_;
};

} // namespace AWR::DataPath
