#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "network/state_cache.hpp"

using namespace cadence;
using namespace cadence::network;

class StateCacheTest : public ::testing::Test {
protected:
    StateChange playback(const DeviceId& device, PlaybackState state, SystemClock::time_point at) {
        PlaybackChanged change;
        change.device_id = device;
        change.state = state;
        return StateChange(change, at);
    }

    StateChange volume(const DeviceId& device, std::optional<uint8_t> level, std::optional<bool> muted,
                       SystemClock::time_point at) {
        VolumeChanged change;
        change.device_id = device;
        change.level = level;
        change.muted = muted;
        return StateChange(change, at);
    }

    Topology topology_with(const std::string& group_id, const std::vector<DeviceId>& members) {
        Group group;
        group.id = group_id;
        group.coordinator = members.front();
        for (const auto& member : members) {
            group.members.push_back(GroupMember{member, {}});
        }
        Topology topology;
        topology.groups.push_back(group);
        return topology;
    }

    StateCache cache_;
    SystemClock::time_point t0_ = SystemClock::now();
};

TEST_F(StateCacheTest, UnknownDeviceHasNoState) {
    EXPECT_FALSE(cache_.get("RINCON_X").has_value());
    EXPECT_FALSE(cache_.get_topology().has_value());
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(StateCacheTest, FirstChangeCreatesEntry) {
    EXPECT_TRUE(cache_.apply(playback("RINCON_A", PlaybackState::PLAYING, t0_)));

    auto state = cache_.get("RINCON_A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->playback_state, PlaybackState::PLAYING);
    EXPECT_EQ(state->volume, 0);
    EXPECT_EQ(state->last_updated, t0_);
    EXPECT_TRUE(cache_.contains("RINCON_A"));
}

TEST_F(StateCacheTest, MergesOnlyPresentFields) {
    cache_.apply(volume("RINCON_A", 30, false, t0_));
    cache_.apply(volume("RINCON_A", std::nullopt, true, t0_ + std::chrono::seconds(1)));

    auto state = cache_.get("RINCON_A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->volume, 30);
    EXPECT_TRUE(state->muted);
    EXPECT_EQ(state->last_updated, t0_ + std::chrono::seconds(1));
}

TEST_F(StateCacheTest, PlaybackAndVolumeShareOneEntry) {
    cache_.apply(playback("RINCON_A", PlaybackState::PAUSED, t0_));
    cache_.apply(volume("RINCON_A", 12, std::nullopt, t0_));

    auto state = cache_.get("RINCON_A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->playback_state, PlaybackState::PAUSED);
    EXPECT_EQ(state->volume, 12);
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(StateCacheTest, ApplyingSameChangeTwiceIsIdempotent) {
    PlaybackChanged change;
    change.device_id = "RINCON_A";
    change.state = PlaybackState::PLAYING;
    TrackInfo track;
    track.title = "Song";
    track.duration_ms = 180000;
    change.track = track;
    change.position_ms = 1000;
    StateChange record(change, t0_);

    cache_.apply(record);
    auto once = cache_.get("RINCON_A");
    cache_.apply(record);
    auto twice = cache_.get("RINCON_A");

    ASSERT_TRUE(once && twice);
    EXPECT_EQ(*once, *twice);
}

TEST_F(StateCacheTest, OlderTimestampDoesNotMoveLastUpdatedBackwards) {
    cache_.apply(volume("RINCON_A", 10, std::nullopt, t0_ + std::chrono::seconds(5)));
    cache_.apply(volume("RINCON_A", 20, std::nullopt, t0_));

    auto state = cache_.get("RINCON_A");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->volume, 20);
    EXPECT_EQ(state->last_updated, t0_ + std::chrono::seconds(5));
}

TEST_F(StateCacheTest, TopologyIsReplacedAsWhole) {
    cache_.apply(StateChange(TopologyChanged{topology_with("G1", {"A", "B"})}));
    cache_.apply(StateChange(TopologyChanged{topology_with("G2", {"C"})}));

    auto topology = cache_.get_topology();
    ASSERT_TRUE(topology.has_value());
    ASSERT_EQ(topology->groups.size(), 1u);
    EXPECT_EQ(topology->groups[0].id, "G2");
    EXPECT_EQ(topology->findGroup("G1"), nullptr);
    ASSERT_NE(topology->groupOf("C"), nullptr);
}

TEST_F(StateCacheTest, FailureRecordsDoNotTouchState) {
    SubscriptionFailed failure;
    failure.device_id = "RINCON_A";
    failure.service_type = ServiceType::PLAYBACK;
    failure.reason = "gone";

    EXPECT_FALSE(cache_.apply(StateChange(failure)));
    EXPECT_FALSE(cache_.contains("RINCON_A"));
}

TEST_F(StateCacheTest, SeededTopologyIsVisible) {
    cache_.set_topology(topology_with("G1", {"A"}));
    auto topology = cache_.get_topology();
    ASSERT_TRUE(topology.has_value());
    EXPECT_EQ(topology->groups[0].coordinator, "A");
}

TEST_F(StateCacheTest, DevicesAreListedSorted) {
    cache_.apply(volume("C", 1, std::nullopt, t0_));
    cache_.apply(volume("A", 1, std::nullopt, t0_));
    cache_.apply(volume("B", 1, std::nullopt, t0_));

    EXPECT_EQ(cache_.devices(), (std::vector<DeviceId>{"A", "B", "C"}));
    EXPECT_EQ(cache_.size(), 3u);
}

TEST_F(StateCacheTest, ConcurrentReadersNeverSeeTornTopology) {
    const auto small = topology_with("G1", {"A"});
    const auto large = topology_with("G2", {"B", "C", "D", "E"});
    std::atomic<bool> running{true};
    std::atomic<int> torn{0};

    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            cache_.apply(StateChange(TopologyChanged{i % 2 ? small : large}));
        }
        running = false;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (running.load()) {
                auto topology = cache_.get_topology();
                if (topology && !(*topology == small) && !(*topology == large)) {
                    torn++;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(torn.load(), 0);
}

TEST_F(StateCacheTest, ConcurrentWritersToDifferentDevices) {
    std::vector<std::thread> writers;
    for (int d = 0; d < 8; ++d) {
        writers.emplace_back([this, d] {
            for (int i = 0; i <= 100; ++i) {
                cache_.apply(volume("D" + std::to_string(d), static_cast<uint8_t>(i), std::nullopt, t0_));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(cache_.size(), 8u);
    for (int d = 0; d < 8; ++d) {
        EXPECT_EQ(cache_.get("D" + std::to_string(d))->volume, 100);
    }
}
