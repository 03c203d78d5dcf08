#pragma once

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>

namespace cadence {

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;

// Opaque stable device identifier (e.g. "RINCON_000E58A0B1C2")
using DeviceId = std::string;

// Device network address used for control and lease requests
struct Endpoint {
    std::string host;
    uint16_t port = 1400;

    std::string toString() const { return host + ":" + std::to_string(port); }
    bool operator==(const Endpoint& other) const { return host == other.host && port == other.port; }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

// Roster entry handed over by the discovery collaborator
struct DeviceInfo {
    DeviceId id;
    Endpoint endpoint;
};

enum class ServiceType {
    PLAYBACK,
    RENDERING_VOLUME,
    GROUP_TOPOLOGY
};

enum class SubscriptionScope {
    PER_DEVICE,
    NETWORK_WIDE
};

enum class SubscriptionStatus {
    PENDING,
    ACTIVE,
    RENEWING,
    FAILED,
    TERMINATED
};

enum class PlaybackState {
    UNKNOWN,
    STOPPED,
    PLAYING,
    PAUSED,
    TRANSITIONING
};

struct TrackInfo {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> uri;
    std::optional<uint64_t> duration_ms;

    bool empty() const { return !title && !artist && !album && !uri && !duration_ms; }

    bool operator==(const TrackInfo& other) const {
        return title == other.title && artist == other.artist && album == other.album &&
               uri == other.uri && duration_ms == other.duration_ms;
    }
    bool operator!=(const TrackInfo& other) const { return !(*this == other); }
};

struct GroupMember {
    DeviceId device_id;
    std::vector<DeviceId> satellites;

    bool operator==(const GroupMember& other) const {
        return device_id == other.device_id && satellites == other.satellites;
    }
};

struct Group {
    std::string id;
    DeviceId coordinator;
    std::vector<GroupMember> members;

    bool contains(const DeviceId& device_id) const;

    bool operator==(const Group& other) const {
        return id == other.id && coordinator == other.coordinator && members == other.members;
    }
};

struct VanishedDevice {
    DeviceId device_id;
    std::string reason;

    bool operator==(const VanishedDevice& other) const {
        return device_id == other.device_id && reason == other.reason;
    }
};

// Whole-network grouping snapshot; always replaced as a unit
struct Topology {
    std::vector<Group> groups;
    std::vector<VanishedDevice> vanished;

    const Group* findGroup(const std::string& group_id) const;
    const Group* groupOf(const DeviceId& device_id) const;

    bool operator==(const Topology& other) const {
        return groups == other.groups && vanished == other.vanished;
    }
};

struct DeviceState {
    uint8_t volume = 0;
    bool muted = false;
    PlaybackState playback_state = PlaybackState::UNKNOWN;
    std::optional<TrackInfo> track_info;
    uint64_t position_ms = 0;
    SystemClock::time_point last_updated{};

    bool operator==(const DeviceState& other) const {
        return volume == other.volume && muted == other.muted &&
               playback_state == other.playback_state && track_info == other.track_info &&
               position_ms == other.position_ms && last_updated == other.last_updated;
    }
};

// StateChange payloads

struct PlaybackChanged {
    DeviceId device_id;
    std::optional<PlaybackState> state;
    std::optional<TrackInfo> track;
    std::optional<uint64_t> position_ms;
};

struct VolumeChanged {
    DeviceId device_id;
    std::optional<uint8_t> level;
    std::optional<bool> muted;
};

struct TopologyChanged {
    Topology snapshot;
};

struct SubscriptionFailed {
    std::optional<DeviceId> device_id;
    ServiceType service_type = ServiceType::PLAYBACK;
    std::string reason;
    bool fatal = true;  // false: payload diagnostic, lease still Active
};

struct StateChange {
    using Payload = std::variant<PlaybackChanged, VolumeChanged, TopologyChanged, SubscriptionFailed>;

    Payload payload;
    SystemClock::time_point timestamp = SystemClock::now();

    StateChange() = default;
    StateChange(Payload p, SystemClock::time_point ts = SystemClock::now())
        : payload(std::move(p)), timestamp(ts) {}

    template<typename T>
    const T* as() const { return std::get_if<T>(&payload); }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(payload); }

    // Device the change refers to, if any
    std::optional<DeviceId> deviceId() const;
};

// String helpers
std::string to_string(ServiceType type);
std::string to_string(SubscriptionScope scope);
std::string to_string(SubscriptionStatus status);
std::string to_string(PlaybackState state);
std::string describe(const StateChange& change);

bool parse_service_type(const std::string& text, ServiceType& type);
SubscriptionScope scope_of(ServiceType type);

} // namespace cadence
