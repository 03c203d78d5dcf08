#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "network/subscription_manager.hpp"
#include "event_test_harness.hpp"

using namespace cadence;
using namespace cadence::network;
using cadence::test::PayloadBuilder;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Eq;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const Endpoint kHostA{"10.0.0.1", 1400};
const Endpoint kHostB{"10.0.0.2", 1400};
const std::string kPlaybackPath = "/MediaRenderer/AVTransport/Event";
const std::string kVolumePath = "/MediaRenderer/RenderingControl/Event";
const std::string kTopologyPath = "/ZoneGroupTopology/Event";

} // namespace

class SubscriptionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<NiceMock<test::MockEventTransport>>();
        config_ = test::fast_test_config();
        roster_ = {test::make_device("RINCON_A", kHostA.host), test::make_device("RINCON_B", kHostB.host)};

        ON_CALL(*transport_, subscribe(_, _, _, _, _, _))
            .WillByDefault(Invoke([this](const Endpoint& endpoint, const std::string& path, const std::string&,
                                         std::chrono::seconds requested, LeaseGrant& grant, StreamError&) {
                grant.sid = "uuid:" + endpoint.host + path + "#" + std::to_string(++sid_counter_);
                grant.duration = requested;
                return true;
            }));
        ON_CALL(*transport_, renew(_, _, _, _, _, _))
            .WillByDefault(Invoke([](const Endpoint&, const std::string&, const std::string& sid,
                                     std::chrono::seconds requested, LeaseGrant& grant, StreamError&) {
                grant.sid = sid;
                grant.duration = requested;
                return true;
            }));
        ON_CALL(*transport_, unsubscribe(_, _, _, _)).WillByDefault(Return(true));

        // Tests narrow these with their own expectations
        EXPECT_CALL(*transport_, subscribe(_, _, _, _, _, _)).Times(AnyNumber());
        EXPECT_CALL(*transport_, renew(_, _, _, _, _, _)).Times(AnyNumber());
        EXPECT_CALL(*transport_, unsubscribe(_, _, _, _)).Times(AnyNumber());
    }

    void TearDown() override {
        if (manager_) {
            manager_->stop();
        }
    }

    void start(const std::vector<ServiceType>& services = {}) {
        manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
        manager_->start(roster_, services);
    }

    std::string lease_of(const std::optional<DeviceId>& device, ServiceType type) {
        auto sub = manager_->subscription(device, type);
        return sub ? sub->lease_id : std::string();
    }

    std::optional<SubscriptionStatus> status_of(const std::optional<DeviceId>& device, ServiceType type) {
        auto sub = manager_->subscription(device, type);
        return sub ? std::optional<SubscriptionStatus>(sub->status) : std::nullopt;
    }

    bool dispatch(const std::string& sid, uint32_t seq, const std::string& body) {
        RawNotification notification;
        notification.sid = sid;
        notification.seq = seq;
        notification.body = body;
        return manager_->dispatch(notification);
    }

    std::vector<StateChange> drain() {
        std::vector<StateChange> out;
        while (auto change = manager_->event_stream()->try_recv()) {
            out.push_back(std::move(*change));
        }
        return out;
    }

    std::shared_ptr<NiceMock<test::MockEventTransport>> transport_;
    StreamConfig config_;
    std::vector<DeviceInfo> roster_;
    std::unique_ptr<SubscriptionManager> manager_;
    std::atomic<int> sid_counter_{0};
};

TEST_F(SubscriptionManagerTest, InvalidConfigurationThrows) {
    config_.retry_attempts = 0;
    EXPECT_THROW(SubscriptionManager(config_, transport_), ConfigurationError);
}

TEST_F(SubscriptionManagerTest, OperationsBeforeStartAreRejected) {
    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    EXPECT_FALSE(manager_->is_running());
    EXPECT_FALSE(manager_->add_device("RINCON_C", Endpoint{"10.0.0.3", 1400}));
    EXPECT_FALSE(manager_->subscribe("RINCON_A", ServiceType::PLAYBACK));
    EXPECT_FALSE(dispatch("uuid:nothing", 0, "<x/>"));
    EXPECT_EQ(manager_->callback_port(), 0);
}

TEST_F(SubscriptionManagerTest, StartSubscribesEveryPairAndOneNetworkLease) {
    EXPECT_CALL(*transport_, subscribe(_, Eq(kPlaybackPath), _, _, _, _)).Times(2);
    EXPECT_CALL(*transport_, subscribe(_, Eq(kVolumePath), _, _, _, _)).Times(2);
    EXPECT_CALL(*transport_, subscribe(_, Eq(kTopologyPath), _, _, _, _)).Times(1);

    start();

    EXPECT_TRUE(manager_->is_running());
    auto subscriptions = manager_->subscriptions();
    ASSERT_EQ(subscriptions.size(), 5u);
    for (const auto& sub : subscriptions) {
        EXPECT_EQ(sub.status, SubscriptionStatus::ACTIVE);
        EXPECT_FALSE(sub.lease_id.empty());
        EXPECT_EQ(sub.granted, config_.lease_duration);
    }

    auto topology = manager_->subscription(std::nullopt, ServiceType::GROUP_TOPOLOGY);
    ASSERT_TRUE(topology.has_value());
    EXPECT_FALSE(topology->device_id.has_value());
    EXPECT_EQ(topology->scope, SubscriptionScope::NETWORK_WIDE);

    auto stats = manager_->statistics();
    EXPECT_EQ(stats.active_subscriptions, 5u);
    EXPECT_EQ(stats.subscribes_succeeded, 5u);
}

TEST_F(SubscriptionManagerTest, DevicesReceiveTheCallbackUrl) {
    std::mutex mutex;
    std::vector<std::string> urls;
    EXPECT_CALL(*transport_, subscribe(_, _, _, _, _, _))
        .WillRepeatedly(Invoke([&](const Endpoint&, const std::string&, const std::string& url,
                                   std::chrono::seconds requested, LeaseGrant& grant, StreamError&) {
            std::lock_guard<std::mutex> lock(mutex);
            urls.push_back(url);
            grant.sid = "uuid:sid-" + std::to_string(urls.size());
            grant.duration = requested;
            return true;
        }));

    start({ServiceType::PLAYBACK});

    const std::string expected = "http://127.0.0.1:" + std::to_string(manager_->callback_port()) + "/notify";
    EXPECT_EQ(manager_->callback_url(), expected);
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(urls.size(), 2u);
    for (const auto& url : urls) {
        EXPECT_EQ(url, expected);
    }
}

TEST_F(SubscriptionManagerTest, RenewsBeforeExpiry) {
    roster_.resize(1);
    ON_CALL(*transport_, subscribe(_, _, _, _, _, _)).WillByDefault(test::GrantLease("uuid:short", 2));
    EXPECT_CALL(*transport_, renew(Eq(kHostA), Eq(kPlaybackPath), Eq("uuid:short"), config_.lease_duration, _, _))
        .Times(1);

    start({ServiceType::PLAYBACK});
    auto before = manager_->subscription(std::string("RINCON_A"), ServiceType::PLAYBACK);
    ASSERT_TRUE(before.has_value());

    ASSERT_TRUE(test::wait_until([&] { return manager_->statistics().renewals_succeeded == 1; }));
    auto after = manager_->subscription(std::string("RINCON_A"), ServiceType::PLAYBACK);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->status, SubscriptionStatus::ACTIVE);
    EXPECT_EQ(after->lease_id, "uuid:short");
    EXPECT_GT(after->expires_at, before->expires_at);
    EXPECT_EQ(after->granted, config_.lease_duration);
}

TEST_F(SubscriptionManagerTest, RenewalWithNewTokenRekeysLease) {
    roster_.resize(1);
    ON_CALL(*transport_, subscribe(_, _, _, _, _, _)).WillByDefault(test::GrantLease("uuid:first", 2));
    ON_CALL(*transport_, renew(_, _, _, _, _, _)).WillByDefault(test::GrantLease("uuid:second", 600));

    start({ServiceType::RENDERING_VOLUME});
    EXPECT_TRUE(manager_->is_lease_active("uuid:first"));

    ASSERT_TRUE(test::wait_until([&] { return manager_->is_lease_active("uuid:second"); }));
    EXPECT_FALSE(manager_->is_lease_active("uuid:first"));
    EXPECT_FALSE(dispatch("uuid:first", 1, PayloadBuilder::rendering_control("5", std::nullopt)));
}

TEST_F(SubscriptionManagerTest, FailingDeviceDoesNotAffectOthers) {
    ON_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostB.host)), _, _, _, _, _))
        .WillByDefault(test::FailWithNetworkError());

    std::mutex mutex;
    std::vector<SubscriptionFailed> failures;
    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    manager_->set_subscription_failed_callback([&](const SubscriptionFailed& failure) {
        std::lock_guard<std::mutex> lock(mutex);
        failures.push_back(failure);
    });
    manager_->start(roster_, {ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME});

    ASSERT_TRUE(test::wait_until([&] { return manager_->failed_subscriptions().size() == 2; }));

    for (auto type : {ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME}) {
        EXPECT_EQ(status_of(std::string("RINCON_A"), type), SubscriptionStatus::ACTIVE);
        auto failed = manager_->subscription(std::string("RINCON_B"), type);
        ASSERT_TRUE(failed.has_value());
        EXPECT_EQ(failed->status, SubscriptionStatus::FAILED);
        EXPECT_EQ(failed->retry_count, config_.retry_attempts);
        EXPECT_TRUE(failed->lease_id.empty());
        EXPECT_FALSE(failed->last_error.empty());
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(failures.size(), 2u);
        EXPECT_EQ(failures[0].device_id, "RINCON_B");
        EXPECT_TRUE(failures[0].fatal);
    }

    auto events = drain();
    size_t fatal = 0;
    for (const auto& event : events) {
        if (const auto* failure = event.as<SubscriptionFailed>()) {
            EXPECT_EQ(failure->device_id, "RINCON_B");
            fatal += failure->fatal ? 1 : 0;
        }
    }
    EXPECT_EQ(fatal, 2u);
    EXPECT_EQ(manager_->statistics().subscribes_failed, 2u * config_.retry_attempts);
}

TEST_F(SubscriptionManagerTest, ServiceUnavailableFailsImmediately) {
    EXPECT_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostB.host)), Eq(kPlaybackPath), _, _, _, _))
        .WillOnce(test::RejectWithStatus(503));
    EXPECT_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostA.host)), _, _, _, _, _))
        .Times(AnyNumber());

    start({ServiceType::PLAYBACK});

    auto failed = manager_->subscription(std::string("RINCON_B"), ServiceType::PLAYBACK);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, SubscriptionStatus::FAILED);
    EXPECT_EQ(failed->retry_count, 1u);
    EXPECT_EQ(status_of(std::string("RINCON_A"), ServiceType::PLAYBACK), SubscriptionStatus::ACTIVE);
}

TEST_F(SubscriptionManagerTest, ForgottenLeaseIsResubscribed) {
    roster_.resize(1);
    std::atomic<int> subscribes{0};
    ON_CALL(*transport_, subscribe(_, _, _, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint&, const std::string&, const std::string&, std::chrono::seconds,
                                  LeaseGrant& grant, StreamError&) {
            int n = ++subscribes;
            grant.sid = "uuid:lease-" + std::to_string(n);
            grant.duration = std::chrono::seconds(n == 1 ? 2 : 600);
            return true;
        }));
    EXPECT_CALL(*transport_, renew(_, _, Eq("uuid:lease-1"), _, _, _)).WillOnce(test::RejectWithStatus(412));

    start({ServiceType::PLAYBACK});

    ASSERT_TRUE(test::wait_until([&] { return manager_->is_lease_active("uuid:lease-2"); }));
    EXPECT_EQ(subscribes.load(), 2);
    EXPECT_FALSE(manager_->is_lease_active("uuid:lease-1"));
    EXPECT_EQ(status_of(std::string("RINCON_A"), ServiceType::PLAYBACK), SubscriptionStatus::ACTIVE);
    EXPECT_EQ(manager_->statistics().renewals_failed, 1u);
}

TEST_F(SubscriptionManagerTest, ExhaustedRenewalsMarkPairFailed) {
    roster_.resize(1);
    ON_CALL(*transport_, subscribe(_, _, _, _, _, _)).WillByDefault(test::GrantLease("uuid:doomed", 2));
    EXPECT_CALL(*transport_, renew(_, _, _, _, _, _))
        .Times(static_cast<int>(config_.retry_attempts))
        .WillRepeatedly(test::FailWithNetworkError());

    start({ServiceType::PLAYBACK});
    EXPECT_TRUE(manager_->is_lease_active("uuid:doomed"));

    ASSERT_TRUE(test::wait_until(
        [&] { return status_of(std::string("RINCON_A"), ServiceType::PLAYBACK) == SubscriptionStatus::FAILED; },
        std::chrono::milliseconds(4000)));
    EXPECT_FALSE(manager_->is_lease_active("uuid:doomed"));
    EXPECT_EQ(manager_->statistics().renewals_failed, config_.retry_attempts);

    bool reported = false;
    for (const auto& event : drain()) {
        if (const auto* failure = event.as<SubscriptionFailed>()) {
            reported = failure->fatal && failure->service_type == ServiceType::PLAYBACK;
        }
    }
    EXPECT_TRUE(reported);
}

TEST_F(SubscriptionManagerTest, RenewalFailuresStayWithTheirPair) {
    ON_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostA.host)), Eq(kPlaybackPath), _, _, _, _))
        .WillByDefault(test::GrantLease("uuid:A-playback", 2));
    EXPECT_CALL(*transport_, renew(_, _, Eq("uuid:A-playback"), _, _, _))
        .Times(3)
        .WillRepeatedly(test::FailWithNetworkError());

    start({ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME});

    ASSERT_TRUE(test::wait_until(
        [&] { return status_of(std::string("RINCON_A"), ServiceType::PLAYBACK) == SubscriptionStatus::FAILED; }));
    EXPECT_EQ(status_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME), SubscriptionStatus::ACTIVE);
    EXPECT_EQ(status_of(std::string("RINCON_B"), ServiceType::PLAYBACK), SubscriptionStatus::ACTIVE);
    EXPECT_EQ(status_of(std::string("RINCON_B"), ServiceType::RENDERING_VOLUME), SubscriptionStatus::ACTIVE);
}

TEST_F(SubscriptionManagerTest, NotificationsUpdateCacheAndStream) {
    start({ServiceType::RENDERING_VOLUME, ServiceType::PLAYBACK});
    const auto volume_sid = lease_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME);
    const auto playback_sid = lease_of(std::string("RINCON_A"), ServiceType::PLAYBACK);

    ASSERT_TRUE(dispatch(volume_sid, 0, PayloadBuilder::rendering_control("35", "0")));
    PayloadBuilder::Transport transport;
    transport.state = "PLAYING";
    ASSERT_TRUE(dispatch(playback_sid, 0, PayloadBuilder::av_transport(transport)));

    ASSERT_TRUE(test::wait_until([&] { return manager_->statistics().events_published == 2; }));
    auto state = manager_->state_cache().get("RINCON_A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->volume, 35);
    EXPECT_FALSE(state->muted);
    EXPECT_EQ(state->playback_state, PlaybackState::PLAYING);

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    for (const auto& event : events) {
        EXPECT_EQ(event.deviceId(), "RINCON_A");
    }
    EXPECT_EQ(manager_->subscription(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME)->notifications, 1u);
}

TEST_F(SubscriptionManagerTest, UnknownLeaseIsRejected) {
    start({ServiceType::PLAYBACK});
    EXPECT_FALSE(dispatch("uuid:tok-unknown", 0, PayloadBuilder::rendering_control("1", std::nullopt)));
    EXPECT_EQ(manager_->statistics().notifications_rejected, 1u);
    EXPECT_TRUE(drain().empty());
}

TEST_F(SubscriptionManagerTest, StaleSequenceNumbersAreDropped) {
    roster_.resize(1);
    start({ServiceType::RENDERING_VOLUME});
    const auto sid = lease_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME);

    dispatch(sid, 0, PayloadBuilder::rendering_control("10", std::nullopt));
    dispatch(sid, 1, PayloadBuilder::rendering_control("11", std::nullopt));
    dispatch(sid, 1, PayloadBuilder::rendering_control("99", std::nullopt));
    dispatch(sid, 0, PayloadBuilder::rendering_control("98", std::nullopt));
    dispatch(sid, 2, PayloadBuilder::rendering_control("12", std::nullopt));

    ASSERT_TRUE(test::wait_until([&] {
        auto stats = manager_->statistics();
        return stats.events_published + stats.notifications_duplicate == 5;
    }));
    EXPECT_EQ(manager_->statistics().notifications_duplicate, 2u);
    EXPECT_EQ(manager_->state_cache().get("RINCON_A")->volume, 12);

    std::vector<uint8_t> levels;
    for (const auto& event : drain()) {
        levels.push_back(event.as<VolumeChanged>()->level.value_or(0));
    }
    EXPECT_EQ(levels, (std::vector<uint8_t>{10, 11, 12}));
}

TEST(SequenceTest, SerialNumberArithmetic) {
    EXPECT_TRUE(sequence_newer(1, 0));
    EXPECT_TRUE(sequence_newer(0, 0xFFFFFFFFu));
    EXPECT_FALSE(sequence_newer(5, 5));
    EXPECT_FALSE(sequence_newer(4, 5));
    EXPECT_FALSE(sequence_newer(0xFFFFFFF0u, 3));
}

TEST_F(SubscriptionManagerTest, MalformedPayloadKeepsLeaseActive) {
    roster_.resize(1);
    start({ServiceType::RENDERING_VOLUME});
    const auto sid = lease_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME);

    ASSERT_TRUE(dispatch(sid, 0, "<e:propertyset><broken"));
    ASSERT_TRUE(test::wait_until([&] { return manager_->statistics().parse_failures == 1; }));

    EXPECT_EQ(status_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME), SubscriptionStatus::ACTIVE);
    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    const auto* failure = events[0].as<SubscriptionFailed>();
    ASSERT_NE(failure, nullptr);
    EXPECT_FALSE(failure->fatal);
    EXPECT_EQ(failure->service_type, ServiceType::RENDERING_VOLUME);
    EXPECT_FALSE(manager_->state_cache().contains("RINCON_A"));
}

TEST_F(SubscriptionManagerTest, AddDeviceSubscribesItsServices) {
    std::mutex mutex;
    std::vector<DeviceId> connected;
    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    manager_->set_device_connected_callback([&](const DeviceId& id) {
        std::lock_guard<std::mutex> lock(mutex);
        connected.push_back(id);
    });
    manager_->start(roster_, {ServiceType::PLAYBACK, ServiceType::GROUP_TOPOLOGY});

    EXPECT_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq("10.0.0.3")), Eq(kPlaybackPath), _, _, _, _))
        .Times(1);
    ASSERT_TRUE(manager_->add_device("RINCON_C", Endpoint{"10.0.0.3", 1400}));
    EXPECT_FALSE(manager_->add_device("RINCON_C", Endpoint{"10.0.0.3", 1400}));

    EXPECT_EQ(status_of(std::string("RINCON_C"), ServiceType::PLAYBACK), SubscriptionStatus::ACTIVE);
    EXPECT_EQ(manager_->subscriptions().size(), 4u);

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(connected.size(), 3u);
    EXPECT_EQ(connected.back(), "RINCON_C");
}

TEST_F(SubscriptionManagerTest, RemoveDeviceReleasesItsLeases) {
    std::mutex mutex;
    std::vector<DeviceId> disconnected;
    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    manager_->set_device_disconnected_callback([&](const DeviceId& id) {
        std::lock_guard<std::mutex> lock(mutex);
        disconnected.push_back(id);
    });
    manager_->start(roster_, {ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME});

    const auto sid = lease_of(std::string("RINCON_B"), ServiceType::PLAYBACK);
    EXPECT_CALL(*transport_, unsubscribe(Eq(kHostB), Eq(kPlaybackPath), Eq(sid), _)).Times(1);
    EXPECT_CALL(*transport_, unsubscribe(Eq(kHostB), Eq(kVolumePath), _, _)).Times(1);

    ASSERT_TRUE(manager_->remove_device("RINCON_B"));
    EXPECT_FALSE(manager_->remove_device("RINCON_B"));

    EXPECT_FALSE(manager_->subscription(std::string("RINCON_B"), ServiceType::PLAYBACK).has_value());
    EXPECT_FALSE(manager_->is_lease_active(sid));
    EXPECT_EQ(manager_->subscriptions().size(), 2u);

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(disconnected, (std::vector<DeviceId>{"RINCON_B"}));
}

TEST_F(SubscriptionManagerTest, RemovingTopologyHostMovesNetworkLease) {
    start({ServiceType::GROUP_TOPOLOGY});
    auto before = manager_->subscription(std::nullopt, ServiceType::GROUP_TOPOLOGY);
    ASSERT_TRUE(before.has_value());
    ASSERT_EQ(before->endpoint, kHostA);

    EXPECT_CALL(*transport_, unsubscribe(Eq(kHostA), Eq(kTopologyPath), Eq(before->lease_id), _)).Times(1);
    ASSERT_TRUE(manager_->remove_device("RINCON_A"));

    auto after = manager_->subscription(std::nullopt, ServiceType::GROUP_TOPOLOGY);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->status, SubscriptionStatus::ACTIVE);
    EXPECT_EQ(after->endpoint, kHostB);
    EXPECT_NE(after->lease_id, before->lease_id);
}

TEST_F(SubscriptionManagerTest, NetworkLeaseFailsOverToNextDevice) {
    ON_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostA.host)), Eq(kTopologyPath), _, _, _, _))
        .WillByDefault(test::FailWithNetworkError());

    start({ServiceType::GROUP_TOPOLOGY});

    ASSERT_TRUE(test::wait_until(
        [&] { return status_of(std::nullopt, ServiceType::GROUP_TOPOLOGY) == SubscriptionStatus::ACTIVE; }));
    auto lease = manager_->subscription(std::nullopt, ServiceType::GROUP_TOPOLOGY);
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->endpoint, kHostB);
    EXPECT_EQ(lease->retry_count, 0u);
}

TEST_F(SubscriptionManagerTest, ExplicitSubscribeRevivesFailedPair) {
    std::atomic<bool> satellite{true};
    ON_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostB.host)), _, _, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint&, const std::string&, const std::string&, std::chrono::seconds,
                                  LeaseGrant& grant, StreamError& error) {
            if (satellite.load()) {
                error = StreamError(ErrorKind::SUBSCRIPTION, "not hosted", 503);
                return false;
            }
            grant = LeaseGrant{"uuid:revived", std::chrono::seconds(600)};
            return true;
        }));

    start({ServiceType::PLAYBACK});
    ASSERT_EQ(status_of(std::string("RINCON_B"), ServiceType::PLAYBACK), SubscriptionStatus::FAILED);

    satellite = false;
    EXPECT_TRUE(manager_->subscribe("RINCON_B", ServiceType::PLAYBACK));
    EXPECT_EQ(status_of(std::string("RINCON_B"), ServiceType::PLAYBACK), SubscriptionStatus::ACTIVE);
    EXPECT_TRUE(manager_->is_lease_active("uuid:revived"));

    // Active pairs are left alone
    EXPECT_TRUE(manager_->subscribe("RINCON_B", ServiceType::PLAYBACK));
    EXPECT_EQ(lease_of(std::string("RINCON_B"), ServiceType::PLAYBACK), "uuid:revived");
    EXPECT_FALSE(manager_->subscribe("RINCON_Z", ServiceType::PLAYBACK));
}

TEST_F(SubscriptionManagerTest, RecoverFailedReportsRecoveredPairs) {
    std::atomic<bool> reachable{false};
    ON_CALL(*transport_, subscribe(Field(&Endpoint::host, Eq(kHostB.host)), _, _, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint&, const std::string& path, const std::string&,
                                  std::chrono::seconds requested, LeaseGrant& grant, StreamError& error) {
            if (!reachable.load()) {
                error = StreamError(ErrorKind::SUBSCRIPTION, "not hosted", 503);
                return false;
            }
            grant = LeaseGrant{"uuid:B" + path, requested};
            return true;
        }));

    start({ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME});
    ASSERT_EQ(manager_->failed_subscriptions().size(), 2u);
    EXPECT_EQ(manager_->recover_failed(), 0u);
    ASSERT_EQ(manager_->failed_subscriptions().size(), 2u);

    reachable = true;
    EXPECT_EQ(manager_->recover_failed(), 2u);
    EXPECT_TRUE(manager_->failed_subscriptions().empty());
    EXPECT_EQ(manager_->recover_failed(), 0u);
}

TEST_F(SubscriptionManagerTest, UnsubscribeTerminatesOnePair) {
    start({ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME});
    const auto sid = lease_of(std::string("RINCON_A"), ServiceType::PLAYBACK);

    EXPECT_CALL(*transport_, unsubscribe(Eq(kHostA), Eq(kPlaybackPath), Eq(sid), _)).Times(1);
    EXPECT_TRUE(manager_->unsubscribe("RINCON_A", ServiceType::PLAYBACK));
    EXPECT_FALSE(manager_->unsubscribe("RINCON_A", ServiceType::PLAYBACK));

    EXPECT_FALSE(manager_->subscription(std::string("RINCON_A"), ServiceType::PLAYBACK).has_value());
    EXPECT_EQ(status_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME), SubscriptionStatus::ACTIVE);
    EXPECT_FALSE(dispatch(sid, 1, PayloadBuilder::property_set({{"TransportState", "PLAYING"}})));
}

TEST_F(SubscriptionManagerTest, StopReleasesEveryLeaseAndClosesStream) {
    std::atomic<bool> stopped{false};
    std::atomic<bool> started{false};
    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    manager_->set_stream_started_callback([&] { started = true; });
    manager_->set_stream_stopped_callback([&] { stopped = true; });
    manager_->start(roster_);
    EXPECT_TRUE(started.load());

    EXPECT_CALL(*transport_, unsubscribe(_, _, _, _)).Times(5);
    auto stream = manager_->event_stream();
    manager_->stop();

    EXPECT_FALSE(manager_->is_running());
    EXPECT_TRUE(stream->is_closed());
    EXPECT_TRUE(stopped.load());
    EXPECT_TRUE(manager_->subscriptions().empty());
    EXPECT_FALSE(stream->recv().has_value());

    // Second stop is a no-op
    manager_->stop();
}

TEST_F(SubscriptionManagerTest, UnsubscribeFailuresDuringStopAreIgnored) {
    ON_CALL(*transport_, unsubscribe(_, _, _, _)).WillByDefault(Return(false));
    start({ServiceType::PLAYBACK});
    manager_->stop();
    EXPECT_FALSE(manager_->is_running());
}

TEST_F(SubscriptionManagerTest, DeviceAddedDuringStopLeavesNoLiveLease) {
    std::mutex mutex;
    std::set<std::string> granted;
    std::set<std::string> released;
    ON_CALL(*transport_, subscribe(_, _, _, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint& endpoint, const std::string& path, const std::string&,
                                  std::chrono::seconds requested, LeaseGrant& grant, StreamError&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            grant.sid = "uuid:" + endpoint.host + path + "#" + std::to_string(++sid_counter_);
            grant.duration = requested;
            std::lock_guard<std::mutex> lock(mutex);
            granted.insert(grant.sid);
            return true;
        }));
    ON_CALL(*transport_, unsubscribe(_, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint&, const std::string&, const std::string& sid, StreamError&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            std::lock_guard<std::mutex> lock(mutex);
            released.insert(sid);
            return true;
        }));

    for (int round = 0; round < 20; ++round) {
        manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
        manager_->start(roster_, {ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME});

        std::thread adder([&] {
            manager_->add_device("RINCON_C" + std::to_string(round), Endpoint{"10.0.0.3", 1400});
        });
        manager_->stop();
        adder.join();

        EXPECT_TRUE(manager_->subscriptions().empty()) << "round " << round;
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& sid : granted) {
            EXPECT_EQ(released.count(sid), 1u) << sid << " still leased after round " << round;
            EXPECT_FALSE(manager_->is_lease_active(sid));
        }
    }
}

TEST_F(SubscriptionManagerTest, LeaseOperationsUseBoundedWorkers) {
    config_.receiver_threads = 2;
    roster_.clear();
    for (int i = 0; i < 6; ++i) {
        roster_.push_back(test::make_device("RINCON_" + std::to_string(i), "10.0.1." + std::to_string(i)));
    }

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    auto track = [&] {
        int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --in_flight;
    };
    ON_CALL(*transport_, subscribe(_, _, _, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint& endpoint, const std::string& path, const std::string&,
                                  std::chrono::seconds requested, LeaseGrant& grant, StreamError&) {
            track();
            grant.sid = "uuid:" + endpoint.host + path + "#" + std::to_string(++sid_counter_);
            grant.duration = requested;
            return true;
        }));
    ON_CALL(*transport_, unsubscribe(_, _, _, _))
        .WillByDefault(Invoke([&](const Endpoint&, const std::string&, const std::string&, StreamError&) {
            track();
            return true;
        }));

    start();
    EXPECT_EQ(manager_->statistics().active_subscriptions, 13u);
    EXPECT_LE(peak.load(), 2);

    peak = 0;
    manager_->stop();
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST_F(SubscriptionManagerTest, StreamOverflowWarns) {
    config_.buffer_capacity = 2;
    roster_.resize(1);

    std::atomic<int> warnings{0};
    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    manager_->set_warning_callback([&](const std::string&) { warnings++; });
    manager_->start(roster_, {ServiceType::RENDERING_VOLUME});
    const auto sid = lease_of(std::string("RINCON_A"), ServiceType::RENDERING_VOLUME);

    for (uint32_t seq = 0; seq < 5; ++seq) {
        dispatch(sid, seq, PayloadBuilder::rendering_control(std::to_string(seq), std::nullopt));
    }

    ASSERT_TRUE(test::wait_until([&] { return manager_->statistics().events_published == 5; }));
    EXPECT_EQ(manager_->statistics().events_dropped, 3u);
    EXPECT_GE(warnings.load(), 1);

    std::vector<uint8_t> levels;
    for (const auto& event : drain()) {
        levels.push_back(event.as<VolumeChanged>()->level.value_or(0));
    }
    EXPECT_EQ(levels, (std::vector<uint8_t>{3, 4}));
}

TEST_F(SubscriptionManagerTest, InitialTopologySeedsCache) {
    Topology initial;
    Group group;
    group.id = "RINCON_A:1";
    group.coordinator = "RINCON_A";
    group.members.push_back(GroupMember{"RINCON_A", {}});
    initial.groups.push_back(group);

    manager_ = std::make_unique<SubscriptionManager>(config_, transport_);
    manager_->start(roster_, {ServiceType::GROUP_TOPOLOGY}, initial);

    auto topology = manager_->state_cache().get_topology();
    ASSERT_TRUE(topology.has_value());
    EXPECT_EQ(*topology, initial);
}

TEST_F(SubscriptionManagerTest, DiagnosticsReportIsJson) {
    start({ServiceType::PLAYBACK, ServiceType::GROUP_TOPOLOGY});

    auto report = nlohmann::json::parse(manager_->get_diagnostics_report());
    EXPECT_TRUE(report["running"].get<bool>());
    EXPECT_EQ(report["callback_url"].get<std::string>(), manager_->callback_url());
    ASSERT_EQ(report["subscriptions"].size(), 3u);
    EXPECT_EQ(report["statistics"]["active"].get<size_t>(), 3u);
    EXPECT_EQ(report["stream"]["capacity"].get<size_t>(), config_.buffer_capacity);
    EXPECT_TRUE(report["cached_devices"].empty());

    PayloadBuilder::Transport transport;
    transport.state = "STOPPED";
    ASSERT_TRUE(dispatch(lease_of(std::string("RINCON_B"), ServiceType::PLAYBACK), 0,
                         PayloadBuilder::av_transport(transport)));
    ASSERT_TRUE(test::wait_until([&] { return manager_->state_cache().contains("RINCON_B"); }));

    report = nlohmann::json::parse(manager_->get_diagnostics_report());
    EXPECT_EQ(report["cached_devices"], nlohmann::json::array({"RINCON_B"}));
}
