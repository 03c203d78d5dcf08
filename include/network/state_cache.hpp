#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "network_types.hpp"

namespace cadence::network {

/**
 * Concurrent store of derived per-device state plus the last-known topology.
 *
 * The device map lock is only held to find or insert an entry; merges run
 * under the entry's own lock, so unrelated devices never wait on each
 * other. Readers get copies.
 */
class StateCache {
public:
    StateCache() = default;

    StateCache(const StateCache&) = delete;
    StateCache& operator=(const StateCache&) = delete;

    /**
     * Merges a change. Entries are created on the first change for a device.
     * Returns true if the change touched cached state. Idempotent.
     */
    bool apply(const StateChange& change);

    std::optional<DeviceState> get(const DeviceId& device_id) const;
    std::optional<Topology> get_topology() const;

    // Seeds the topology slot (initial snapshot from discovery)
    void set_topology(Topology topology);

    std::vector<DeviceId> devices() const;
    size_t size() const;
    bool contains(const DeviceId& device_id) const;

private:
    struct Entry {
        mutable std::shared_mutex mutex;
        DeviceState state;
    };

    std::shared_ptr<Entry> find_entry(const DeviceId& device_id) const;
    std::shared_ptr<Entry> find_or_create_entry(const DeviceId& device_id);

    void merge(DeviceState& state, const PlaybackChanged& change, SystemClock::time_point timestamp);
    void merge(DeviceState& state, const VolumeChanged& change, SystemClock::time_point timestamp);

    mutable std::shared_mutex entries_mutex_;
    std::unordered_map<DeviceId, std::shared_ptr<Entry>> entries_;

    mutable std::mutex topology_mutex_;
    std::shared_ptr<const Topology> topology_;
};

} // namespace cadence::network
