#include "network/state_cache.hpp"
#include "utils/logger.hpp"

#include <algorithm>

namespace cadence::network {

bool StateCache::apply(const StateChange& change) {
    if (auto* playback = change.as<PlaybackChanged>()) {
        auto entry = find_or_create_entry(playback->device_id);
        std::unique_lock<std::shared_mutex> lock(entry->mutex);
        merge(entry->state, *playback, change.timestamp);
        return true;
    }

    if (auto* volume = change.as<VolumeChanged>()) {
        auto entry = find_or_create_entry(volume->device_id);
        std::unique_lock<std::shared_mutex> lock(entry->mutex);
        merge(entry->state, *volume, change.timestamp);
        return true;
    }

    if (auto* topology = change.as<TopologyChanged>()) {
        // Built outside the lock; readers keep whatever snapshot they already hold.
        auto snapshot = std::make_shared<const Topology>(topology->snapshot);
        std::lock_guard<std::mutex> lock(topology_mutex_);
        topology_ = std::move(snapshot);
        return true;
    }

    // SubscriptionFailed carries no device state
    return false;
}

std::optional<DeviceState> StateCache::get(const DeviceId& device_id) const {
    auto entry = find_entry(device_id);
    if (!entry) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    return entry->state;
}

std::optional<Topology> StateCache::get_topology() const {
    std::shared_ptr<const Topology> snapshot;
    {
        std::lock_guard<std::mutex> lock(topology_mutex_);
        snapshot = topology_;
    }
    if (!snapshot) {
        return std::nullopt;
    }
    return *snapshot;
}

void StateCache::set_topology(Topology topology) {
    auto snapshot = std::make_shared<const Topology>(std::move(topology));
    std::lock_guard<std::mutex> lock(topology_mutex_);
    topology_ = std::move(snapshot);
}

std::vector<DeviceId> StateCache::devices() const {
    std::vector<DeviceId> out;
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t StateCache::size() const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    return entries_.size();
}

bool StateCache::contains(const DeviceId& device_id) const {
    return find_entry(device_id) != nullptr;
}

std::shared_ptr<StateCache::Entry> StateCache::find_entry(const DeviceId& device_id) const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(device_id);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<StateCache::Entry> StateCache::find_or_create_entry(const DeviceId& device_id) {
    if (auto existing = find_entry(device_id)) {
        return existing;
    }

    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    auto& slot = entries_[device_id];
    if (!slot) {
        slot = std::make_shared<Entry>();
        Logger::debug("StateCache: tracking device {}", device_id);
    }
    return slot;
}

void StateCache::merge(DeviceState& state, const PlaybackChanged& change, SystemClock::time_point timestamp) {
    if (change.state) {
        state.playback_state = *change.state;
    }
    if (change.track) {
        state.track_info = change.track;
    }
    if (change.position_ms) {
        state.position_ms = *change.position_ms;
    }
    state.last_updated = std::max(state.last_updated, timestamp);
}

void StateCache::merge(DeviceState& state, const VolumeChanged& change, SystemClock::time_point timestamp) {
    if (change.level) {
        state.volume = *change.level;
    }
    if (change.muted) {
        state.muted = *change.muted;
    }
    state.last_updated = std::max(state.last_updated, timestamp);
}

} // namespace cadence::network
