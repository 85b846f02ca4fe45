#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <future>
#include <thread>

#include "../AwareCore/Core/AwareStateManager.hpp"
#include "../AwareCore/Session/PeerRegistry.hpp"
#include "mocks/FakeInterfaceProvider.hpp"
#include "mocks/MockDataPathListener.hpp"
#include "mocks/MockDiscoverySessionCallback.hpp"
#include "mocks/MockEventCallback.hpp"
#include "mocks/MockInterfaceConflictArbiter.hpp"

using namespace AWR;
using namespace AWR::Core;
using namespace std::chrono_literals;
using AWR::Callbacks::Mocks::MockDiscoverySessionCallback;
using AWR::Callbacks::Mocks::MockEventCallback;
using AWR::Core::Mocks::MockInterfaceConflictArbiter;
using AWR::DataPath::Mocks::MockDataPathListener;
using AWR::Hal::Fakes::FakeInterfaceProvider;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

using EventCallback = NiceMock<MockEventCallback>;
using SessionCallback = NiceMock<MockDiscoverySessionCallback>;
using FakeHal = FakeInterfaceProvider::FakeHal;

constexpr MacAddress kPeerMac{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
constexpr PubSubId kPubSubId = 3;
constexpr InstanceId kPeerInstanceId = 7;

Config::Capabilities MakeCapabilities() {
    Config::Capabilities caps;
    caps.maxConcurrentAwareClusters = 1;
    caps.maxPublishes = 8;
    caps.maxSubscribes = 8;
    caps.maxServiceNameLen = 255;
    caps.maxMatchFilterLen = 255;
    caps.maxTotalMatchFilterLen = 255;
    caps.maxServiceSpecificInfoLen = 255;
    caps.maxNdpSessions = 1;
    caps.isSuspensionSupported = true;
    return caps;
}

Hal::PublishConfig MakePublishConfig(bool suspendable = false) {
    Hal::PublishConfig config;
    config.serviceName = "_aware_test._tcp";
    config.suspendable = suspendable;
    return config;
}

Hal::MatchEvent MakeMatch(InstanceId instanceId = kPeerInstanceId,
                          const MacAddress& mac = kPeerMac) {
    Hal::MatchEvent event;
    event.pubSubId = kPubSubId;
    event.requestorInstanceId = instanceId;
    event.peerMac = mac;
    return event;
}

Session::ClientIdentity Identity(ClientId clientId) {
    return Session::ClientIdentity{.clientId = clientId, .uid = 1000 + clientId, .pid = 4000};
}

} // anonymous namespace

class AwareStateManagerTests : public ::testing::Test {
protected:
    void SetUp() override {
        Session::PeerRegistry::ResetPeerIdCounter();
        ON_CALL(*arbiter, Decide(_)).WillByDefault(Return(ConflictDecision::kExecute));
        provider->onCreate = [this](FakeHal& hal) { InstallHal(hal); };

        manager = std::make_unique<AwareStateManager>(
            config, loop,
            AwareStateManager::Dependencies{provider, arbiter, listener});
        manager->EnableUsage();
        loop.RunPending();
    }

    void TearDown() override {
        manager.reset();
        loop.RunPending();
    }

    // Records every transaction the core hands to the HAL.
    void InstallHal(FakeHal& hal) {
        ON_CALL(hal, EnableAndConfigure(_, _))
            .WillByDefault([this](TransactionId txid, const Hal::EnableRequest& request) {
                configTxids.push_back(txid);
                enableRequests.push_back(request);
                return Result<void>{};
            });
        ON_CALL(hal, GetCapabilities(_)).WillByDefault([this](TransactionId txid) {
            capsTxids.push_back(txid);
            return Result<void>{};
        });
        ON_CALL(hal, Disable(_)).WillByDefault([this](TransactionId txid) {
            disableTxids.push_back(txid);
            return Result<void>{};
        });
        ON_CALL(hal, Publish(_, _, _))
            .WillByDefault([this](TransactionId txid, PubSubId, const Hal::PublishConfig&) {
                sessionTxids.push_back(txid);
                return Result<void>{};
            });
        ON_CALL(hal, CreateDataInterface(_, _))
            .WillByDefault([this](TransactionId txid, const std::string& name) {
                dataInterfaceTxids.push_back(txid);
                dataInterfaceNames.push_back(name);
                return Result<void>{};
            });
        ON_CALL(hal, SendMessage(_, _, _, _, _, _))
            .WillByDefault([this](TransactionId txid, PubSubId, InstanceId, const MacAddress&,
                                  std::span<const uint8_t>, int32_t messageId) {
                sendTxids.push_back(txid);
                sentMessageIds.push_back(messageId);
                return Result<void>{};
            });
    }

    // Attaches `clientId` and plays the HAL side until the connect has completed.
    std::shared_ptr<EventCallback> Attach(ClientId clientId,
                                          const Config::ConfigRequest& request = {}) {
        auto callback = std::make_shared<EventCallback>();
        EXPECT_CALL(*callback, OnConnectSuccess(clientId));

        const size_t configs = configTxids.size();
        EXPECT_TRUE(manager->Connect(Identity(clientId), callback, request, false, false)
                        .has_value());
        loop.RunPending();
        if (configTxids.size() > configs) {
            manager->OnConfigSuccessResponse(configTxids.back());
            loop.RunPending();
        }
        AnswerCapabilities();
        return callback;
    }

    void AnswerCapabilities() {
        if (capsTxids.size() > capsAnswered) {
            manager->OnCapabilitiesUpdateResponse(capsTxids.back(), caps);
            capsAnswered = capsTxids.size();
            loop.RunPending();
        }
    }

    // Starts a publish session and returns the session ID the client was given.
    SessionId StartPublish(ClientId clientId, const std::shared_ptr<SessionCallback>& callback,
                           const Hal::PublishConfig& publish = MakePublishConfig()) {
        SessionId started = 0;
        EXPECT_CALL(*callback, OnSessionStarted(_)).WillOnce(SaveArg<0>(&started));

        const size_t sessions = sessionTxids.size();
        EXPECT_TRUE(manager->Publish(clientId, publish, callback).has_value());
        loop.RunPending();
        if (sessionTxids.size() == sessions) {
            ADD_FAILURE() << "Publish never reached the HAL";
            return 0;
        }
        manager->OnSessionConfigSuccessResponse(sessionTxids.back(), true, kPubSubId);
        loop.RunPending();
        return started;
    }

    // Plays the firmware accepting the last transmit into its queue.
    void QueueLastSend() {
        ASSERT_FALSE(sendTxids.empty());
        manager->OnMessageSendQueuedSuccessResponse(sendTxids.back());
        loop.RunPending();
    }

    Config::CoreConfig config = Config::CoreConfig::MakeDefault();
    Config::Capabilities caps = MakeCapabilities();
    Scheduling::ManualClock clock;
    Scheduling::EventLoop loop{clock};
    std::shared_ptr<FakeInterfaceProvider> provider = std::make_shared<FakeInterfaceProvider>();
    std::shared_ptr<NiceMock<MockInterfaceConflictArbiter>> arbiter =
        std::make_shared<NiceMock<MockInterfaceConflictArbiter>>();
    std::shared_ptr<NiceMock<MockDataPathListener>> listener =
        std::make_shared<NiceMock<MockDataPathListener>>();
    std::unique_ptr<AwareStateManager> manager;

    std::vector<TransactionId> configTxids;
    std::vector<Hal::EnableRequest> enableRequests;
    std::vector<TransactionId> capsTxids;
    size_t capsAnswered{0};
    std::vector<TransactionId> disableTxids;
    std::vector<TransactionId> sessionTxids;
    std::vector<TransactionId> sendTxids;
    std::vector<int32_t> sentMessageIds;
    std::vector<TransactionId> dataInterfaceTxids;
    std::vector<std::string> dataInterfaceNames;
};

// ============================================================================
// Startup and attach
// ============================================================================

// Start reads capabilities through a temporary interface and gives it back.
TEST_F(AwareStateManagerTests, Start_ReadsCapabilitiesAndReleasesInterface) {
    manager->Start();
    loop.RunPending();
    ASSERT_EQ(capsTxids.size(), 1u);
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kAwaitingResponse);

    AnswerCapabilities();
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWait);
    EXPECT_EQ(provider->createCount, 1);
    EXPECT_EQ(provider->removeCount, 1);
    ASSERT_TRUE(manager->GetCapabilities().has_value());
    EXPECT_EQ(manager->GetCapabilities()->maxPublishes, 8);
}

// The first attach brings up the interface with an initial configuration.
TEST_F(AwareStateManagerTests, Connect_FirstAttachConfiguresHal) {
    auto callback = Attach(1);

    ASSERT_EQ(enableRequests.size(), 1u);
    EXPECT_TRUE(enableRequests[0].initialConfiguration);
    EXPECT_EQ(provider->createCount, 1);
    EXPECT_EQ(manager->ClientCount(), 1u);
    EXPECT_TRUE(manager->GetCapabilities().has_value());
}

// A second attach whose configuration merges to the active one needs no HAL call.
TEST_F(AwareStateManagerTests, Connect_SameConfigAttachesImmediately) {
    auto first = Attach(1);
    auto second = Attach(2);

    EXPECT_EQ(enableRequests.size(), 1u);
    EXPECT_EQ(manager->ClientCount(), 2u);
}

// Attach while usage is disabled fails without touching the interface.
TEST_F(AwareStateManagerTests, Connect_UsageDisabledFails) {
    manager->DisableUsage(false);
    loop.RunPending();
    EXPECT_FALSE(manager->IsUsageEnabled());

    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectFail(NanStatus::kInternalFailure));
    EXPECT_CALL(*callback, OnConnectSuccess(_)).Times(0);
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    loop.RunPending();

    EXPECT_EQ(provider->createCount, 0);
    EXPECT_EQ(manager->ClientCount(), 0u);
}

// Out-of-range configuration is refused at the front door.
TEST_F(AwareStateManagerTests, Connect_InvalidConfigRejected) {
    Config::ConfigRequest request;
    request.masterPreference = 300;

    auto callback = std::make_shared<EventCallback>();
    auto result = manager->Connect(Identity(1), callback, request, false, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().status, NanStatus::kInvalidArgs);
}

// A client with a different cluster range cannot join; the attached client is untouched.
TEST_F(AwareStateManagerTests, Connect_IncompatibleClusterRangeFails) {
    auto first = Attach(1);

    Config::ConfigRequest narrow;
    narrow.clusterLow = 5;
    narrow.clusterHigh = 10;
    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectFail(NanStatus::kInternalFailure));
    ASSERT_TRUE(manager->Connect(Identity(2), callback, narrow, false, false).has_value());
    loop.RunPending();

    EXPECT_EQ(enableRequests.size(), 1u);
    EXPECT_EQ(manager->ClientCount(), 1u);
}

// ============================================================================
// Band merge
// ============================================================================

// 2.4 GHz client plus 5 GHz client enables both bands; the 5 GHz client
// leaving triggers exactly one reconfigure back to 2.4 GHz only.
TEST_F(AwareStateManagerTests, BandMerge_DetachReconfiguresOnce) {
    Config::ConfigRequest only24;
    only24.support5gBand = false;
    Config::ConfigRequest with5;
    with5.support5gBand = true;

    auto a = Attach(1, only24);
    ASSERT_EQ(enableRequests.size(), 1u);
    EXPECT_FALSE(enableRequests[0].config.support5gBand);

    auto b = Attach(2, with5);
    ASSERT_EQ(enableRequests.size(), 2u);
    EXPECT_TRUE(enableRequests[1].config.support5gBand);
    EXPECT_FALSE(enableRequests[1].initialConfiguration);

    manager->Disconnect(2);
    loop.RunPending();
    ASSERT_EQ(enableRequests.size(), 3u);
    EXPECT_FALSE(enableRequests[2].config.support5gBand);

    manager->OnConfigSuccessResponse(configTxids.back());
    loop.RunPending();
    EXPECT_EQ(enableRequests.size(), 3u);
    EXPECT_TRUE(disableTxids.empty());
    EXPECT_EQ(manager->ClientCount(), 1u);
}

// Detaching a client whose configuration matched the merge changes nothing in the HAL.
TEST_F(AwareStateManagerTests, Disconnect_UnchangedMergeSkipsReconfigure) {
    auto a = Attach(1);
    auto b = Attach(2);

    EXPECT_CALL(*b, OnAttachTerminate());
    manager->Disconnect(2);
    loop.RunPending();

    EXPECT_EQ(enableRequests.size(), 1u);
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWait);
}

// The last client leaving disables Aware and releases the interface.
TEST_F(AwareStateManagerTests, Disconnect_LastClientDisables) {
    auto callback = Attach(1);
    EXPECT_CALL(*callback, OnAttachTerminate());

    manager->Disconnect(1);
    loop.RunPending();
    ASSERT_EQ(disableTxids.size(), 1u);
    EXPECT_NE(provider->CurrentHal(), nullptr);

    manager->OnDisableResponse(disableTxids[0], NanStatus::kSuccess);
    loop.RunPending();
    EXPECT_EQ(provider->removeCount, 1);
    EXPECT_EQ(provider->CurrentHal(), nullptr);
    EXPECT_EQ(manager->ClientCount(), 0u);
}

// An attach that reaches the front of the queue behind a pending Disable waits for it,
// then brings the interface up again from scratch.
TEST_F(AwareStateManagerTests, Connect_WaitsBehindPendingDisable) {
    auto first = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    ASSERT_TRUE(manager->Publish(1, MakePublishConfig(), session).has_value());
    loop.RunPending();
    ASSERT_EQ(sessionTxids.size(), 1u);

    auto second = std::make_shared<EventCallback>();
    manager->Disconnect(1);
    ASSERT_TRUE(manager->Connect(Identity(2), second, {}, false, false).has_value());
    loop.RunPending();
    EXPECT_TRUE(disableTxids.empty());

    manager->OnSessionConfigSuccessResponse(sessionTxids[0], true, kPubSubId);
    loop.RunPending();
    ASSERT_EQ(disableTxids.size(), 1u);
    EXPECT_EQ(configTxids.size(), 1u);
    EXPECT_EQ(manager->ClientCount(), 0u);

    EXPECT_CALL(*second, OnConnectSuccess(2));
    manager->OnDisableResponse(disableTxids[0], NanStatus::kSuccess);
    loop.RunPending();
    EXPECT_EQ(provider->removeCount, 1);
    EXPECT_EQ(provider->createCount, 2);
    ASSERT_EQ(enableRequests.size(), 2u);
    EXPECT_TRUE(enableRequests[1].initialConfiguration);

    manager->OnConfigSuccessResponse(configTxids.back());
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 1u);
}

// ============================================================================
// Data interfaces
// ============================================================================

// Data interfaces lost with an externally destroyed HAL are created again on re-attach.
TEST_F(AwareStateManagerTests, DataInterface_RecreatedAfterInterfaceLost) {
    caps.maxNdiInterfaces = 1;
    auto first = Attach(1);
    ASSERT_EQ(dataInterfaceNames.size(), 1u);
    manager->OnCreateDataInterfaceResponse(dataInterfaceTxids[0], true, NanStatus::kSuccess);
    loop.RunPending();

    provider->DestroyExternally();
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 0u);
    EXPECT_TRUE(manager->IsUsageEnabled());

    auto second = Attach(2);
    EXPECT_EQ(provider->createCount, 2);
    ASSERT_EQ(dataInterfaceNames.size(), 2u);
    EXPECT_EQ(dataInterfaceNames[1], config.dataInterfacePrefix + "0");
}

// A delete that never gets an answer still forgets the interface.
TEST_F(AwareStateManagerTests, DataInterface_DeleteTimeoutForgetsInterface) {
    caps.maxNdiInterfaces = 1;
    auto first = Attach(1);
    ASSERT_EQ(dataInterfaceNames.size(), 1u);
    manager->OnCreateDataInterfaceResponse(dataInterfaceTxids[0], true, NanStatus::kSuccess);
    loop.RunPending();

    EXPECT_CALL(*provider->CurrentHal(), DeleteDataInterface(_, config.dataInterfacePrefix + "0"));
    manager->Disconnect(1);
    loop.RunPending();
    EXPECT_TRUE(disableTxids.empty());

    clock.Advance(config.commandTimeout);
    loop.RunPending();
    ASSERT_EQ(disableTxids.size(), 1u);
    manager->OnDisableResponse(disableTxids[0], NanStatus::kSuccess);
    loop.RunPending();

    auto second = Attach(2);
    ASSERT_EQ(dataInterfaceNames.size(), 2u);
    EXPECT_EQ(dataInterfaceNames[1], config.dataInterfacePrefix + "0");
}

// ============================================================================
// Dispatcher
// ============================================================================

// Two attaches posted together reach the HAL one at a time.
TEST_F(AwareStateManagerTests, Dispatch_AtMostOneCommandInFlight) {
    Config::ConfigRequest with5;
    with5.support5gBand = true;
    auto a = std::make_shared<EventCallback>();
    auto b = std::make_shared<EventCallback>();

    ASSERT_TRUE(manager->Connect(Identity(1), a, {}, false, false).has_value());
    ASSERT_TRUE(manager->Connect(Identity(2), b, with5, false, false).has_value());
    loop.RunPending();
    ASSERT_EQ(configTxids.size(), 1u);
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kAwaitingResponse);

    manager->OnConfigSuccessResponse(configTxids[0]);
    loop.RunPending();
    ASSERT_EQ(configTxids.size(), 2u);
    EXPECT_TRUE(capsTxids.empty());

    manager->OnConfigSuccessResponse(configTxids[1]);
    loop.RunPending();
    EXPECT_EQ(capsTxids.size(), 1u);
    EXPECT_EQ(manager->ClientCount(), 2u);
}

// A response carrying an unexpected transaction ID is dropped.
TEST_F(AwareStateManagerTests, Dispatch_StaleTransactionIgnored) {
    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectSuccess(1)).Times(1);
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    loop.RunPending();
    ASSERT_EQ(configTxids.size(), 1u);

    manager->OnConfigSuccessResponse(static_cast<TransactionId>(configTxids[0] + 100));
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 0u);
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kAwaitingResponse);

    manager->OnConfigSuccessResponse(configTxids[0]);
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 1u);
}

// No response within the command timeout fails the attach; the late response is dropped.
TEST_F(AwareStateManagerTests, Dispatch_CommandTimeoutFailsConnect) {
    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectFail(NanStatus::kInternalFailure));
    EXPECT_CALL(*callback, OnConnectSuccess(_)).Times(0);
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    loop.RunPending();
    ASSERT_EQ(configTxids.size(), 1u);

    clock.Advance(config.commandTimeout - 1ms);
    loop.RunPending();
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kAwaitingResponse);

    clock.Advance(1ms);
    loop.RunPending();
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWait);
    EXPECT_EQ(provider->removeCount, 1);
    ASSERT_TRUE(manager->LastTransition().has_value());
    EXPECT_EQ(manager->LastTransition()->reason, "timeout");

    manager->OnConfigSuccessResponse(configTxids[0]);
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 0u);
}

// ============================================================================
// Interface conflict
// ============================================================================

// A parked attach blocks the queue until approved, then runs first.
TEST_F(AwareStateManagerTests, Conflict_WaitForUserThenApproved) {
    EXPECT_CALL(*arbiter, Decide(_)).WillOnce(Return(ConflictDecision::kWaitForUser));
    EXPECT_CALL(*arbiter, Reset());

    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectSuccess(1));
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    manager->Reconfigure();
    loop.RunPending();
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWaitingForInterfaceConflict);
    EXPECT_EQ(provider->createCount, 0);

    manager->ResolveInterfaceConflict(true);
    loop.RunPending();
    ASSERT_EQ(configTxids.size(), 1u);

    manager->OnConfigSuccessResponse(configTxids[0]);
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 1u);
}

// A rejected prompt fails the parked attach.
TEST_F(AwareStateManagerTests, Conflict_WaitForUserThenRejected) {
    EXPECT_CALL(*arbiter, Decide(_)).WillOnce(Return(ConflictDecision::kWaitForUser));

    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectFail(NanStatus::kNoResourcesAvailable));
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    loop.RunPending();

    manager->ResolveInterfaceConflict(false);
    loop.RunPending();
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWait);
    EXPECT_EQ(provider->createCount, 0);
}

// An abort decision fails the attach at once.
TEST_F(AwareStateManagerTests, Conflict_AbortFailsConnect) {
    EXPECT_CALL(*arbiter, Decide(_)).WillOnce(Return(ConflictDecision::kAbort));

    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectFail(NanStatus::kNoResourcesAvailable));
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    loop.RunPending();

    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWait);
    EXPECT_EQ(provider->createCount, 0);
}

// ============================================================================
// Discovery and peers
// ============================================================================

// A brand-new peer gets handle 100, keeps it on rematch, and loses it on expiry.
TEST_F(AwareStateManagerTests, Peers_AllocatedReusedAndExpired) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    EXPECT_EQ(sessionId, 1);

    EXPECT_CALL(*session, OnMatch(100, _, _, _, _, _, _)).Times(2);
    manager->OnMatch(MakeMatch());
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    auto macs = manager->RequestMacAddresses(1001, {100});
    ASSERT_EQ(macs.size(), 1u);
    EXPECT_EQ(macs[100], kPeerMac);

    EXPECT_CALL(*session, OnMatchExpired(100));
    manager->OnMatchExpired(kPubSubId, kPeerInstanceId);
    loop.RunPending();
    EXPECT_TRUE(manager->RequestMacAddresses(1001, {100}).empty());

    // The released handle is never handed out again.
    EXPECT_CALL(*session, OnMatch(101, _, _, _, _, _, _));
    manager->OnMatch(MakeMatch());
    loop.RunPending();
}

// Peer lookups are limited to the caller's own sessions.
TEST_F(AwareStateManagerTests, Peers_MacLookupScopedToUid) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    EXPECT_TRUE(manager->RequestMacAddresses(2002, {100}).empty());
}

// A firmware-side termination reaches the client and drops the session.
TEST_F(AwareStateManagerTests, Session_TerminatedByFirmware) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    StartPublish(1, session);

    EXPECT_CALL(*session, OnSessionTerminated(NanStatus::kInternalFailure));
    manager->OnSessionTerminated(kPubSubId, NanStatus::kInternalFailure, true);
    loop.RunPending();

    EXPECT_CALL(*session, OnMatch(_, _, _, _, _, _, _)).Times(0);
    manager->OnMatch(MakeMatch());
    loop.RunPending();
}

// A publish rejected by the HAL is reported through the session callback.
TEST_F(AwareStateManagerTests, Publish_ConfigFailureReported) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    EXPECT_CALL(*session, OnSessionStarted(_)).Times(0);
    EXPECT_CALL(*session, OnSessionConfigFail(NanStatus::kNoResourcesAvailable));

    ASSERT_TRUE(manager->Publish(1, MakePublishConfig(), session).has_value());
    loop.RunPending();
    ASSERT_EQ(sessionTxids.size(), 1u);
    manager->OnSessionConfigFailResponse(sessionTxids[0], true, NanStatus::kNoResourcesAvailable);
    loop.RunPending();
}

// A service name longer than the hardware allows never reaches the HAL.
TEST_F(AwareStateManagerTests, Publish_ServiceNameTooLong) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    auto publish = MakePublishConfig();
    publish.serviceName.assign(256, 'x');

    auto result = manager->Publish(1, publish, session);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().status, NanStatus::kInvalidArgs);
}

// ============================================================================
// Follow-on messages
// ============================================================================

// Two NO_OTA_ACK failures are retried silently; the third failure is reported
// once with the caller's message ID.
TEST_F(AwareStateManagerTests, SendMessage_RetriesThenFailsOnce) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    EXPECT_CALL(*session, OnMessageSendSuccess(_)).Times(0);
    EXPECT_CALL(*session, OnMessageSendFail(42, NanStatus::kNoOtaAck)).Times(1);

    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x01, 0x02}, 42, 2).has_value());
    loop.RunPending();

    for (size_t attempt = 1; attempt <= 3; ++attempt) {
        ASSERT_EQ(sendTxids.size(), attempt);
        QueueLastSend();
        manager->OnMessageSendFail(sendTxids.back(), NanStatus::kNoOtaAck);
        loop.RunPending();
    }
    EXPECT_EQ(sendTxids.size(), 3u);
    EXPECT_EQ(sentMessageIds, (std::vector<int32_t>{42, 42, 42}));
}

// A non-retryable failure is final even with retry budget left.
TEST_F(AwareStateManagerTests, SendMessage_NonRetryableFailureIsFinal) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    EXPECT_CALL(*session, OnMessageSendFail(7, NanStatus::kProtocolFailure));
    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x01}, 7, 5).has_value());
    loop.RunPending();
    QueueLastSend();
    manager->OnMessageSendFail(sendTxids.back(), NanStatus::kProtocolFailure);
    loop.RunPending();

    EXPECT_EQ(sendTxids.size(), 1u);
}

// A full firmware queue holds the rejected message until a delivery result frees a slot.
TEST_F(AwareStateManagerTests, SendMessage_QueueFullBlocksUntilDelivery) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x01}, 1, 0).has_value());
    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x02}, 2, 0).has_value());
    loop.RunPending();
    ASSERT_EQ(sendTxids.size(), 1u);
    const TransactionId first = sendTxids[0];

    QueueLastSend();
    ASSERT_EQ(sendTxids.size(), 2u);
    manager->OnMessageSendQueuedFailResponse(sendTxids[1], NanStatus::kFollowupTxQueueFull);
    loop.RunPending();

    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x03}, 3, 0).has_value());
    loop.RunPending();
    EXPECT_EQ(sendTxids.size(), 2u);

    EXPECT_CALL(*session, OnMessageSendSuccess(1));
    manager->OnMessageSendSuccess(first);
    loop.RunPending();
    ASSERT_EQ(sendTxids.size(), 3u);
    EXPECT_EQ(sentMessageIds.back(), 2);
}

// A failure for a transaction the firmware queue does not hold leaves the queue blocked.
TEST_F(AwareStateManagerTests, SendMessage_UnknownFailureKeepsQueueBlocked) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x01}, 1, 0).has_value());
    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x02}, 2, 0).has_value());
    loop.RunPending();
    const TransactionId first = sendTxids[0];
    QueueLastSend();
    ASSERT_EQ(sendTxids.size(), 2u);
    manager->OnMessageSendQueuedFailResponse(sendTxids[1], NanStatus::kFollowupTxQueueFull);
    loop.RunPending();

    EXPECT_CALL(*session, OnMessageSendFail(_, _)).Times(0);
    manager->OnMessageSendFail(static_cast<TransactionId>(first + 100), NanStatus::kNoOtaAck);
    loop.RunPending();
    EXPECT_EQ(sendTxids.size(), 2u);

    manager->OnMessageSendSuccess(first);
    loop.RunPending();
    EXPECT_EQ(sendTxids.size(), 3u);
}

// Nothing heard back within the send timeout fails the oldest firmware message.
TEST_F(AwareStateManagerTests, SendMessage_TimeoutFailsQueuedMessage) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();

    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 100, {0x01}, 9, 0).has_value());
    loop.RunPending();
    QueueLastSend();

    EXPECT_CALL(*session, OnMessageSendFail(9, NanStatus::kInternalFailure));
    clock.Advance(config.sendMessageTimeout);
    loop.RunPending();

    // A delivery result after the timeout no longer matches anything.
    EXPECT_CALL(*session, OnMessageSendSuccess(_)).Times(0);
    manager->OnMessageSendSuccess(sendTxids.back());
    loop.RunPending();
}

// Retry counts beyond the supported budget are refused at the front door.
TEST_F(AwareStateManagerTests, SendMessage_RetryCountOutOfRange) {
    auto result = manager->SendMessage(1001, 1, 1, 100, {0x01}, 1,
                                       AwareStateManager::kMaxSendRetryCount + 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().status, NanStatus::kInvalidArgs);
    EXPECT_FALSE(manager->SendMessage(1001, 1, 1, 100, {0x01}, 1, -1).has_value());
}

// Sending to a peer that never matched fails without a HAL round-trip.
TEST_F(AwareStateManagerTests, SendMessage_UnknownPeerFails) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);

    EXPECT_CALL(*session, OnMessageSendFail(5, NanStatus::kInternalFailure));
    ASSERT_TRUE(manager->SendMessage(1001, 1, sessionId, 555, {0x01}, 5, 0).has_value());
    loop.RunPending();
    EXPECT_TRUE(sendTxids.empty());
    EXPECT_EQ(manager->CurrentDispatchState(), DispatchState::kWait);
}

// ============================================================================
// Suspension
// ============================================================================

// Suspending a session that was not created suspendable fails locally.
TEST_F(AwareStateManagerTests, Suspend_NotSuspendableRejected) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session, MakePublishConfig(false));

    EXPECT_CALL(*provider->CurrentHal(), Suspend(_, _)).Times(0);
    EXPECT_CALL(*provider->CurrentHal(), Resume(_, _)).Times(0);
    EXPECT_CALL(*session, OnSuspendFailed(SuspendFailReason::kInvalidSession));
    EXPECT_CALL(*session, OnResumeFailed(ResumeFailReason::kInvalidSession));
    manager->Suspend(1, sessionId);
    manager->Resume(1, sessionId);
    loop.RunPending();
}

// Suspend and resume round-trip once; repeating either is a redundant request.
TEST_F(AwareStateManagerTests, Suspend_RedundantRequestsRejected) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session, MakePublishConfig(true));
    FakeHal& hal = *provider->CurrentHal();

    EXPECT_CALL(*session, OnResumeFailed(ResumeFailReason::kRedundantRequest)).Times(2);
    manager->Resume(1, sessionId);
    loop.RunPending();

    TransactionId suspendTxid = kTransactionIdIgnore;
    EXPECT_CALL(hal, Suspend(_, kPubSubId))
        .WillOnce(DoAll(SaveArg<0>(&suspendTxid), Return(Result<void>{})));
    EXPECT_CALL(*session, OnSuspendSucceeded());
    manager->Suspend(1, sessionId);
    loop.RunPending();
    manager->OnSuspendResponse(suspendTxid, NanStatus::kSuccess);
    loop.RunPending();

    EXPECT_CALL(*session, OnSuspendFailed(SuspendFailReason::kRedundantRequest));
    manager->Suspend(1, sessionId);
    loop.RunPending();

    TransactionId resumeTxid = kTransactionIdIgnore;
    EXPECT_CALL(hal, Resume(_, kPubSubId))
        .WillOnce(DoAll(SaveArg<0>(&resumeTxid), Return(Result<void>{})));
    EXPECT_CALL(*session, OnResumeSucceeded());
    manager->Resume(1, sessionId);
    loop.RunPending();
    manager->OnResumeResponse(resumeTxid, NanStatus::kSuccess);
    manager->OnSuspensionModeChanged(false);
    loop.RunPending();

    manager->Resume(1, sessionId);
    loop.RunPending();
}

// ============================================================================
// Pairing
// ============================================================================

// An accepted setup with no confirm in time ends the pairing and reports failure.
TEST_F(AwareStateManagerTests, Pairing_ConfirmTimeoutEndsPairing) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();
    FakeHal& hal = *provider->CurrentHal();

    TransactionId initiateTxid = kTransactionIdIgnore;
    EXPECT_CALL(hal, InitiatePairing(_, _))
        .WillOnce(DoAll(SaveArg<0>(&initiateTxid), Return(Result<void>{})));
    ASSERT_TRUE(manager
                    ->InitiatePairing(1, sessionId, 100, Hal::PairingRequestType::kSetup,
                                      Hal::PairingSecurity{}, "kitchen")
                    .has_value());
    loop.RunPending();
    manager->OnInitiatePairingResponse(initiateTxid, true, NanStatus::kSuccess, 5);
    loop.RunPending();

    clock.Advance(config.pairingConfirmTimeout - 1ms);
    loop.RunPending();

    EXPECT_CALL(hal, EndPairing(_, 5));
    EXPECT_CALL(*session, OnPairingSetupConfirmed(100, false, "kitchen"));
    clock.Advance(1ms);
    loop.RunPending();

    // The record is gone; a late confirm reports nothing.
    EXPECT_CALL(*session, OnPairingSetupConfirmed(_, _, _)).Times(0);
    manager->OnPairingConfirm(Hal::PairingConfirmEvent{.pairingId = 5, .accept = true});
    loop.RunPending();
}

// Verification requests are refused since no pairing keys are cached.
TEST_F(AwareStateManagerTests, Pairing_VerificationRequestRejected) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    StartPublish(1, session);
    FakeHal& hal = *provider->CurrentHal();

    Hal::RespondToPairingRequest sent;
    EXPECT_CALL(hal, RespondToPairingRequest(_, _))
        .WillOnce(DoAll(SaveArg<1>(&sent), Return(Result<void>{})));
    EXPECT_CALL(*session, OnPairingSetupRequestReceived(_, _)).Times(0);

    manager->OnPairingRequest(Hal::PairingRequestEvent{
        .pubSubId = kPubSubId,
        .requestorInstanceId = kPeerInstanceId,
        .peerMac = kPeerMac,
        .pairingId = 6,
        .requestType = Hal::PairingRequestType::kVerification,
    });
    loop.RunPending();

    EXPECT_EQ(sent.pairingId, 6);
    EXPECT_FALSE(sent.accept);
    EXPECT_EQ(sent.requestType, Hal::PairingRequestType::kVerification);
}

// A setup confirmed with caching requested does not make a later verification succeed.
TEST_F(AwareStateManagerTests, Pairing_VerificationRejectedAfterCachedSetup) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();
    FakeHal& hal = *provider->CurrentHal();

    TransactionId initiateTxid = kTransactionIdIgnore;
    EXPECT_CALL(hal, InitiatePairing(_, _))
        .WillOnce(DoAll(SaveArg<0>(&initiateTxid), Return(Result<void>{})));
    ASSERT_TRUE(manager
                    ->InitiatePairing(1, sessionId, 100, Hal::PairingRequestType::kSetup,
                                      Hal::PairingSecurity{}, "kitchen")
                    .has_value());
    loop.RunPending();
    manager->OnInitiatePairingResponse(initiateTxid, true, NanStatus::kSuccess, 5);
    loop.RunPending();

    EXPECT_CALL(*session, OnPairingSetupConfirmed(100, true, "kitchen"));
    manager->OnPairingConfirm(Hal::PairingConfirmEvent{
        .pairingId = 5,
        .accept = true,
        .requestType = Hal::PairingRequestType::kSetup,
        .enableCache = true,
    });
    loop.RunPending();

    Hal::RespondToPairingRequest sent;
    EXPECT_CALL(hal, RespondToPairingRequest(_, _))
        .WillOnce(DoAll(SaveArg<1>(&sent), Return(Result<void>{})));
    manager->OnPairingRequest(Hal::PairingRequestEvent{
        .pubSubId = kPubSubId,
        .requestorInstanceId = kPeerInstanceId,
        .peerMac = kPeerMac,
        .pairingId = 8,
        .requestType = Hal::PairingRequestType::kVerification,
    });
    loop.RunPending();

    EXPECT_EQ(sent.pairingId, 8);
    EXPECT_FALSE(sent.accept);
}

// ============================================================================
// Bootstrapping
// ============================================================================

// One COMEBACK re-initiates after the requested delay; a second one is a rejection.
TEST_F(AwareStateManagerTests, Bootstrapping_SingleComebackHonoured) {
    auto client = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    const SessionId sessionId = StartPublish(1, session);
    manager->OnMatch(MakeMatch());
    loop.RunPending();
    FakeHal& hal = *provider->CurrentHal();

    std::vector<TransactionId> txids;
    std::vector<bool> comebacks;
    EXPECT_CALL(hal, InitiateBootstrapping(_, _))
        .Times(2)
        .WillRepeatedly([&](TransactionId txid, const Hal::InitiateBootstrappingRequest& r) {
            txids.push_back(txid);
            comebacks.push_back(r.isComeback);
            return Result<void>{};
        });

    ASSERT_TRUE(manager->InitiateBootstrapping(1, sessionId, 100, 0x4).has_value());
    loop.RunPending();
    ASSERT_EQ(txids.size(), 1u);
    manager->OnInitiateBootstrappingResponse(txids[0], true, NanStatus::kSuccess, 20);
    manager->OnBootstrappingConfirm(Hal::BootstrappingConfirmEvent{
        .bootstrappingId = 20,
        .responseCode = Hal::BootstrappingResponseCode::kComeback,
        .comebackDelaySec = 2,
        .cookie = {0xC0},
    });
    loop.RunPending();

    clock.Advance(2s);
    loop.RunPending();
    ASSERT_EQ(txids.size(), 2u);
    EXPECT_EQ(comebacks, (std::vector<bool>{false, true}));

    EXPECT_CALL(*session, OnBootstrappingVerificationConfirmed(100, false, 0x4));
    manager->OnInitiateBootstrappingResponse(txids[1], true, NanStatus::kSuccess, 21);
    manager->OnBootstrappingConfirm(Hal::BootstrappingConfirmEvent{
        .bootstrappingId = 21,
        .responseCode = Hal::BootstrappingResponseCode::kComeback,
        .comebackDelaySec = 2,
    });
    loop.RunPending();
}

// ============================================================================
// Radio down
// ============================================================================

// Aware going down tears down every client and forgets the configuration.
TEST_F(AwareStateManagerTests, AwareDown_TerminatesClients) {
    auto a = Attach(1);
    auto session = std::make_shared<SessionCallback>();
    StartPublish(1, session);

    EXPECT_CALL(*a, OnAttachTerminate());
    EXPECT_CALL(*session, OnSessionTerminated(NanStatus::kSuccess));
    manager->OnAwareDown(NanStatus::kInternalFailure);
    loop.RunPending();
    EXPECT_EQ(manager->ClientCount(), 0u);

    // The next attach starts from an initial configuration again.
    auto b = Attach(2);
    ASSERT_EQ(enableRequests.size(), 2u);
    EXPECT_TRUE(enableRequests[1].initialConfiguration);
}

// ============================================================================
// Teardown
// ============================================================================

// Destroying the manager from another thread waits for the work item it is running.
TEST_F(AwareStateManagerTests, Destroy_WaitsForRunningWork) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    EXPECT_CALL(*arbiter, Decide(_))
        .WillOnce([&entered, released](const Session::ClientIdentity&) {
            entered.set_value();
            released.wait();
            return ConflictDecision::kAbort;
        });
    auto callback = std::make_shared<EventCallback>();
    EXPECT_CALL(*callback, OnConnectFail(NanStatus::kNoResourcesAvailable));

    loop.Start();
    ASSERT_TRUE(manager->Connect(Identity(1), callback, {}, false, false).has_value());
    entered.get_future().wait();

    std::atomic<bool> destroyed{false};
    std::thread destroyer([&] {
        manager.reset();
        destroyed = true;
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(destroyed);

    release.set_value();
    destroyer.join();
    EXPECT_TRUE(destroyed);
    loop.Stop();
}
