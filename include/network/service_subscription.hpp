#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "network_types.hpp"
#include "network/event_transport.hpp"
#include "network/stream_errors.hpp"

namespace cadence::network {

/**
 * One lease as seen from outside the registry. device_id is absent for
 * NetworkWide leases; endpoint is the device currently hosting the lease.
 */
struct Subscription {
    std::optional<DeviceId> device_id;
    ServiceType service_type = ServiceType::PLAYBACK;
    SubscriptionScope scope = SubscriptionScope::PER_DEVICE;
    std::string lease_id;
    SteadyClock::time_point expires_at{};
    SubscriptionStatus status = SubscriptionStatus::PENDING;
    uint32_t retry_count = 0;

    Endpoint endpoint;
    std::chrono::seconds granted{0};
    std::string last_error;
    uint64_t notifications = 0;
};

/**
 * AVTransport events: transport state, current track and position.
 */
struct PlaybackService {
    static constexpr ServiceType kType = ServiceType::PLAYBACK;
    static constexpr SubscriptionScope kScope = SubscriptionScope::PER_DEVICE;
    static constexpr const char* kEventPath = "/MediaRenderer/AVTransport/Event";

    bool parse(const std::optional<DeviceId>& device_id, const std::string& payload,
               std::optional<StateChange::Payload>& change, StreamError& error) const;
};

/**
 * RenderingControl events: master volume and mute.
 */
struct RenderingVolumeService {
    static constexpr ServiceType kType = ServiceType::RENDERING_VOLUME;
    static constexpr SubscriptionScope kScope = SubscriptionScope::PER_DEVICE;
    static constexpr const char* kEventPath = "/MediaRenderer/RenderingControl/Event";

    bool parse(const std::optional<DeviceId>& device_id, const std::string& payload,
               std::optional<StateChange::Payload>& change, StreamError& error) const;
};

/**
 * ZoneGroupTopology events: one lease for the whole network, every event
 * carries the complete grouping.
 */
struct GroupTopologyService {
    static constexpr ServiceType kType = ServiceType::GROUP_TOPOLOGY;
    static constexpr SubscriptionScope kScope = SubscriptionScope::NETWORK_WIDE;
    static constexpr const char* kEventPath = "/ZoneGroupTopology/Event";

    bool parse(const std::optional<DeviceId>& device_id, const std::string& payload,
               std::optional<StateChange::Payload>& change, StreamError& error) const;
};

using ServiceVariant = std::variant<PlaybackService, RenderingVolumeService, GroupTopologyService>;

ServiceVariant make_service(ServiceType type);
const char* event_path(ServiceType type);

/**
 * Uniform subscribe/renew/unsubscribe/parse contract over the closed set of
 * services, selected by ServiceType. Lease calls go through the shared
 * EventTransport; each call is a single attempt.
 */
class ServiceSubscription {
public:
    ServiceSubscription(ServiceType type, std::shared_ptr<EventTransport> transport);

    ServiceType type() const;
    SubscriptionScope scope() const;
    std::string event_path() const;

    bool subscribe(const Endpoint& endpoint,
                   const std::optional<DeviceId>& device_id,
                   const std::string& callback_url,
                   std::chrono::seconds lease,
                   Subscription& subscription,
                   StreamError& error) const;

    bool renew(const Subscription& current,
               std::chrono::seconds lease,
               Subscription& renewed,
               StreamError& error) const;

    bool unsubscribe(const Subscription& subscription, StreamError& error) const;

    /**
     * Parses a notification body. Returns false with a Parse error for
     * malformed payloads. A well-formed payload without relevant fields
     * returns true and leaves `change` empty.
     */
    bool parse(const std::optional<DeviceId>& device_id,
               const std::string& payload,
               SystemClock::time_point received,
               std::optional<StateChange>& change,
               StreamError& error) const;

private:
    ServiceVariant service_;
    std::shared_ptr<EventTransport> transport_;
};

// Payload helpers shared by the parsers
namespace payload {

// Drops a "uuid:" prefix and any "::" suffix
std::string normalize_device_id(const std::string& raw);

// "H:MM:SS[.mmm]" to milliseconds
bool parse_clock_time(const std::string& text, uint64_t& ms);

bool parse_transport_state(const std::string& text, PlaybackState& state);

} // namespace payload

} // namespace cadence::network
