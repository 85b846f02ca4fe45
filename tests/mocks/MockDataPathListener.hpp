#pragma once

#include <gmock/gmock.h>

#include "../../AwareCore/DataPath/DataPathManager.hpp"

namespace AWR::DataPath::Mocks {

class MockDataPathListener : public IDataPathListener {
public:
    MOCK_METHOD(void, OnInitiateSuccess, (DataPathRequestId requestId, NdpId ndpId), (override));
    MOCK_METHOD(void, OnInitiateFail, (DataPathRequestId requestId, NanStatus reason), (override));
    MOCK_METHOD(void, OnRequest,
                (NdpId ndpId, PubSubId pubSubId, const MacAddress& peerMac,
                 const std::vector<uint8_t>& message),
                (override));
    MOCK_METHOD(void, OnRespondFail, (NdpId ndpId, NanStatus reason), (override));
    MOCK_METHOD(void, OnConfirm,
                (NdpId ndpId, const MacAddress& peerMac, bool accept, NanStatus reason,
                 const std::vector<uint8_t>& message,
                 const std::vector<Hal::ChannelInfo>& channels),
                (override));
    MOCK_METHOD(void, OnScheduleUpdate,
                (NdpId ndpId, const std::vector<Hal::ChannelInfo>& channels), (override));
    MOCK_METHOD(void, OnEnd, (NdpId ndpId), (override));
    MOCK_METHOD(void, OnConfirmTimeout, (NdpId ndpId), (override));
};

// Records the commands DataPathManager issues.
class MockDataPathControl : public IDataPathControl {
public:
    MOCK_METHOD(void, CreateDataInterface, (const std::string& name), (override));
    MOCK_METHOD(void, DeleteDataInterface, (const std::string& name), (override));
    MOCK_METHOD(void, EndDataPath, (NdpId ndpId), (override));
};

} // namespace AWR::DataPath::Mocks
