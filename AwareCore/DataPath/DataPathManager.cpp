#include "DataPathManager.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::DataPath {

DataPathManager::DataPathManager(IDataPathControl& control, std::string interfacePrefix)
    : control_(control), interfacePrefix_(std::move(interfacePrefix)) {}

void DataPathManager::CreateAllInterfaces(int32_t count) {
    AWR_LOG_V2(DataPath, "CreateAllInterfaces: count=%d known=%zu", count, interfaces_.size());
    for (int32_t i = 0; i < count; ++i) {
        std::string name = interfacePrefix_ + std::to_string(i);
        if (interfaces_.contains(name) || pendingCreate_.contains(name)) {
            continue;
        }
        pendingCreate_.insert(name);
        control_.CreateDataInterface(name);
    }
}

void DataPathManager::DeleteAllInterfaces() {
    AWR_LOG_V2(DataPath, "DeleteAllInterfaces: known=%zu", interfaces_.size());
    pendingCreate_.clear();
    for (const auto& name : interfaces_) {
        control_.DeleteDataInterface(name);
    }
}

void DataPathManager::OnInterfaceCreated(const std::string& name) {
    pendingCreate_.erase(name);
    interfaces_.insert(name);
    AWR_LOG_V1(DataPath, "Interface created: %{public}s", name.c_str());
}

void DataPathManager::OnInterfaceDeleted(const std::string& name) {
    pendingCreate_.erase(name);
    interfaces_.erase(name);
    AWR_LOG_V1(DataPath, "Interface deleted: %{public}s", name.c_str());
}

bool DataPathManager::OnInitiateSuccess(DataPathRequestId requestId, NdpId ndpId,
                                        const MacAddress& peerMac,
                                        const std::string& interfaceName) {
    if (ndps_.contains(ndpId)) {
        AWR_LOG_ERROR(DataPath, "OnInitiateSuccess: ndpId=%d already tracked (requestId=%d)",
                      ndpId, requestId);
        return false;
    }

    NdpRecord record;
    record.ndpId = ndpId;
    record.role = NdpRole::kInitiator;
    record.state = NdpState::kWaitForConfirm;
    record.requestId = requestId;
    record.peerMac = peerMac;
    record.interfaceName = interfaceName;
    ndps_.emplace(ndpId, std::move(record));

    AWR_LOG_V1(DataPath, "Initiator NDP %d (requestId=%d) waiting for confirm", ndpId, requestId);
    if (listener_) {
        listener_->OnInitiateSuccess(requestId, ndpId);
    }
    return true;
}

void DataPathManager::OnInitiateFail(DataPathRequestId requestId, NanStatus reason) {
    AWR_LOG(DataPath, "Initiate failed: requestId=%d reason=%{public}s", requestId,
            ToString(reason).data());
    if (listener_) {
        listener_->OnInitiateFail(requestId, reason);
    }
}

void DataPathManager::OnRequest(const Hal::DataPathRequestEvent& event) {
    if (ndps_.contains(event.ndpId)) {
        AWR_LOG_ERROR(DataPath, "OnRequest: ndpId=%d already tracked - ignoring", event.ndpId);
        return;
    }

    NdpRecord record;
    record.ndpId = event.ndpId;
    record.role = NdpRole::kResponder;
    record.state = NdpState::kResponderWaitForRespond;
    record.pubSubId = event.pubSubId;
    record.peerMac = event.peerMac;
    ndps_.emplace(event.ndpId, std::move(record));

    if (listener_) {
        listener_->OnRequest(event.ndpId, event.pubSubId, event.peerMac, event.message);
    }
}

bool DataPathManager::OnRespondResult(NdpId ndpId, bool accept, const std::string& interfaceName,
                                      bool success, NanStatus reason) {
    auto it = ndps_.find(ndpId);
    if (it == ndps_.end()) {
        AWR_LOG_ERROR(DataPath, "OnRespondResult: unknown ndpId=%d", ndpId);
        return false;
    }

    if (!success) {
        ndps_.erase(it);
        if (listener_) {
            listener_->OnRespondFail(ndpId, reason);
        }
        return false;
    }
    if (!accept) {
        ndps_.erase(it);
        return false;
    }

    it->second.state = NdpState::kWaitForConfirm;
    it->second.interfaceName = interfaceName;
    return true;
}

bool DataPathManager::OnConfirm(const Hal::DataPathConfirmEvent& event) {
    auto it = ndps_.find(event.ndpId);
    if (it == ndps_.end()) {
        AWR_LOG_ERROR(DataPath, "OnConfirm: unknown ndpId=%d", event.ndpId);
        return false;
    }

    if (event.accept) {
        it->second.state = NdpState::kConfirmed;
        it->second.peerMac = event.peerMac;
        it->second.channels = event.channelInfo;
    } else {
        ndps_.erase(it);
    }

    AWR_LOG_V1(DataPath, "Confirm ndpId=%d accept=%d reason=%{public}s", event.ndpId,
               event.accept, ToString(event.reason).data());
    if (listener_) {
        listener_->OnConfirm(event.ndpId, event.peerMac, event.accept, event.reason,
                             event.message, event.channelInfo);
    }
    return true;
}

void DataPathManager::OnScheduleUpdate(const Hal::DataPathScheduleUpdateEvent& event) {
    for (NdpId ndpId : event.ndpIds) {
        auto it = ndps_.find(ndpId);
        if (it == ndps_.end()) {
            AWR_LOG_V2(DataPath, "OnScheduleUpdate: unknown ndpId=%d", ndpId);
            continue;
        }
        it->second.channels = event.channelInfo;
        if (listener_) {
            listener_->OnScheduleUpdate(ndpId, event.channelInfo);
        }
    }
}

void DataPathManager::OnEnd(NdpId ndpId) {
    if (ndps_.erase(ndpId) == 0) {
        AWR_LOG_V2(DataPath, "OnEnd: unknown ndpId=%d", ndpId);
        return;
    }
    if (listener_) {
        listener_->OnEnd(ndpId);
    }
}

void DataPathManager::OnConfirmTimeout(NdpId ndpId) {
    auto it = ndps_.find(ndpId);
    if (it == ndps_.end() || it->second.state == NdpState::kConfirmed) {
        return;
    }

    AWR_LOG(DataPath, "Confirm timeout: ending ndpId=%d", ndpId);
    ndps_.erase(it);
    control_.EndDataPath(ndpId);
    if (listener_) {
        listener_->OnConfirmTimeout(ndpId);
    }
}

void DataPathManager::OnAwareDown() {
    AWR_LOG_V1(DataPath, "OnAwareDown: dropping %zu NDPs", ndps_.size());
    auto ndps = std::move(ndps_);
    ndps_.clear();
    if (!listener_) {
        return;
    }
    for (const auto& [ndpId, record] : ndps) {
        listener_->OnEnd(ndpId);
    }
}

const NdpRecord* DataPathManager::Find(NdpId ndpId) const {
    auto it = ndps_.find(ndpId);
    return it == ndps_.end() ? nullptr : &it->second;
}

} // namespace AWR::DataPath
