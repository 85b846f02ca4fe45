#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "../AwareCore/Session/ClientState.hpp"
#include "mocks/MockAwareHal.hpp"
#include "mocks/MockDiscoverySessionCallback.hpp"
#include "mocks/MockEventCallback.hpp"

using namespace AWR;
using namespace AWR::Session;
using namespace std::chrono_literals;
using AWR::Callbacks::Mocks::MockDiscoverySessionCallback;
using AWR::Callbacks::Mocks::MockEventCallback;
using AWR::Hal::Mocks::MockAwareHal;
using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::StrictMock;

namespace {

constexpr MacAddress kMacA{0x02, 0x00, 0x00, 0x00, 0x00, 0x0A};
constexpr MacAddress kMacB{0x02, 0x00, 0x00, 0x00, 0x00, 0x0B};
constexpr MacAddress kCluster{0x50, 0x6F, 0x9A, 0x01, 0x00, 0x01};

} // anonymous namespace

class ClientStateTests : public ::testing::Test {
protected:
    std::unique_ptr<ClientState> MakeClient(bool notifyIdentityChange, bool locationPermitted) {
        ClientIdentity identity{.clientId = 1, .uid = 1000, .pid = 42,
                                .callingPackage = "com.example.aware"};
        return std::make_unique<ClientState>(identity, callback, Config::ConfigRequest{},
                                             notifyIdentityChange, locationPermitted, false,
                                             start);
    }

    std::unique_ptr<DiscoverySession> MakeSession(SessionId sessionId, PubSubId pubSubId,
                                                  DiscoverySessionParams params = {}) {
        params.sessionId = sessionId;
        params.pubSubId = pubSubId;
        params.isPublish = true;
        return std::make_unique<DiscoverySession>(params, sessionCallback, start);
    }

    std::shared_ptr<StrictMock<MockEventCallback>> callback =
        std::make_shared<StrictMock<MockEventCallback>>();
    std::shared_ptr<NiceMock<MockDiscoverySessionCallback>> sessionCallback =
        std::make_shared<NiceMock<MockDiscoverySessionCallback>>();
    NiceMock<MockAwareHal> hal;
    Scheduling::TimePoint start = Scheduling::TimePoint{} + 1h;
};

// ============================================================================
// Sessions
// ============================================================================

// Sessions are found by session ID and by pubSubId.
TEST_F(ClientStateTests, SessionLookup) {
    auto client = MakeClient(false, false);
    client->AddSession(MakeSession(1, 10));
    client->AddSession(MakeSession(2, 20));

    ASSERT_NE(client->GetSession(2), nullptr);
    EXPECT_EQ(client->GetSession(2)->GetPubSubId(), 20);
    ASSERT_NE(client->GetSessionForPubSubId(10), nullptr);
    EXPECT_EQ(client->GetSessionForPubSubId(10)->GetSessionId(), 1);
    EXPECT_EQ(client->GetSessionForPubSubId(30), nullptr);
}

// A duplicate session ID is refused.
TEST_F(ClientStateTests, AddSession_DuplicateIgnored) {
    auto client = MakeClient(false, false);
    client->AddSession(MakeSession(1, 10));
    client->AddSession(MakeSession(1, 11));
    ASSERT_EQ(client->Sessions().size(), 1u);
    EXPECT_EQ(client->GetSession(1)->GetPubSubId(), 10);
}

// Terminating a session stops it in the HAL and forgets it.
TEST_F(ClientStateTests, TerminateSession) {
    auto client = MakeClient(false, false);
    client->AddSession(MakeSession(1, 10));

    EXPECT_CALL(*sessionCallback, OnSessionTerminated(NanStatus::kSuccess));
    EXPECT_CALL(hal, StopPublish(kTransactionIdIgnore, 10));
    EXPECT_TRUE(client->TerminateSession(1, &hal));
    EXPECT_EQ(client->GetSession(1), nullptr);
    EXPECT_FALSE(client->TerminateSession(1, &hal));
}

// Destroy terminates every session before reporting OnAttachTerminate.
TEST_F(ClientStateTests, Destroy_TerminatesSessionsThenClient) {
    auto client = MakeClient(false, false);
    client->AddSession(MakeSession(1, 10));
    client->AddSession(MakeSession(2, 20));

    {
        InSequence order;
        EXPECT_CALL(*sessionCallback, OnSessionTerminated(NanStatus::kSuccess)).Times(2);
        EXPECT_CALL(*callback, OnAttachTerminate());
    }
    client->Destroy(&hal);
    EXPECT_TRUE(client->Sessions().empty());
}

// ============================================================================
// Identity notifications
// ============================================================================

// Address changes are reported only to clients that asked, and only on change.
TEST_F(ClientStateTests, InterfaceAddressChange_NotifiesOnChange) {
    auto client = MakeClient(true, true);
    EXPECT_CALL(*callback, OnIdentityChanged(kMacA)).Times(1);
    client->OnInterfaceAddressChange(kMacA);
    client->OnInterfaceAddressChange(kMacA);

    auto silent = MakeClient(false, true);
    silent->OnInterfaceAddressChange(kMacB);
}

// Without location permission the MAC is zeroed.
TEST_F(ClientStateTests, InterfaceAddressChange_RedactedWithoutLocation) {
    auto client = MakeClient(true, false);
    EXPECT_CALL(*callback, OnIdentityChanged(kAllZeroMac));
    client->OnInterfaceAddressChange(kMacA);
}

// Cluster changes report the new identity and the cluster ID once each.
TEST_F(ClientStateTests, ClusterChange_ReportsIdentityAndCluster) {
    auto client = MakeClient(true, true);
    EXPECT_CALL(*callback, OnIdentityChanged(kMacA));
    EXPECT_CALL(*callback, OnClusterIdChanged(ClusterEventType::kStartedCluster, kCluster));
    client->OnClusterChange(ClusterEventType::kStartedCluster, kCluster, kMacA);

    // Same cluster, same MAC: nothing new
    client->OnClusterChange(ClusterEventType::kJoinedCluster, kCluster, kMacA);
}

// ============================================================================
// Aggregate session state
// ============================================================================

// Any ranging session makes the client ranging.
TEST_F(ClientStateTests, RangingEnabledIfAnySession) {
    auto client = MakeClient(false, false);
    client->AddSession(MakeSession(1, 10));
    EXPECT_FALSE(client->IsRangingEnabled());

    DiscoverySessionParams params;
    params.rangingEnabled = true;
    client->AddSession(MakeSession(2, 20, params));
    EXPECT_TRUE(client->IsRangingEnabled());
}

// 5 GHz instant mode outranks 2.4 GHz.
TEST_F(ClientStateTests, InstantMode_5GHzWins) {
    auto client = MakeClient(false, false);
    DiscoverySessionParams low;
    low.instantModeEnabled = true;
    low.instantModeBand = Hal::InstantModeBand::k24GHz;
    client->AddSession(MakeSession(1, 10, low));
    EXPECT_EQ(client->GetInstantMode(start, 30s), Hal::InstantMode::k24GHz);

    DiscoverySessionParams high = low;
    high.instantModeBand = Hal::InstantModeBand::k5GHz;
    client->AddSession(MakeSession(2, 20, high));
    EXPECT_EQ(client->GetInstantMode(start, 30s), Hal::InstantMode::k5GHz);
    EXPECT_EQ(client->GetInstantMode(start + 1min, 30s), Hal::InstantMode::kDisabled);
}
