#include "network_types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cadence {

bool Group::contains(const DeviceId& device_id) const {
    if (coordinator == device_id) {
        return true;
    }
    for (const auto& member : members) {
        if (member.device_id == device_id) {
            return true;
        }
        if (std::find(member.satellites.begin(), member.satellites.end(), device_id) !=
            member.satellites.end()) {
            return true;
        }
    }
    return false;
}

const Group* Topology::findGroup(const std::string& group_id) const {
    auto it = std::find_if(groups.begin(), groups.end(),
                           [&](const Group& g) { return g.id == group_id; });
    return it == groups.end() ? nullptr : &*it;
}

const Group* Topology::groupOf(const DeviceId& device_id) const {
    auto it = std::find_if(groups.begin(), groups.end(),
                           [&](const Group& g) { return g.contains(device_id); });
    return it == groups.end() ? nullptr : &*it;
}

std::optional<DeviceId> StateChange::deviceId() const {
    if (auto* p = as<PlaybackChanged>()) {
        return p->device_id;
    }
    if (auto* v = as<VolumeChanged>()) {
        return v->device_id;
    }
    if (auto* f = as<SubscriptionFailed>()) {
        return f->device_id;
    }
    return std::nullopt;
}

std::string to_string(ServiceType type) {
    switch (type) {
        case ServiceType::PLAYBACK: return "Playback";
        case ServiceType::RENDERING_VOLUME: return "RenderingVolume";
        case ServiceType::GROUP_TOPOLOGY: return "GroupTopology";
    }
    return "Unknown";
}

std::string to_string(SubscriptionScope scope) {
    switch (scope) {
        case SubscriptionScope::PER_DEVICE: return "PerDevice";
        case SubscriptionScope::NETWORK_WIDE: return "NetworkWide";
    }
    return "Unknown";
}

std::string to_string(SubscriptionStatus status) {
    switch (status) {
        case SubscriptionStatus::PENDING: return "Pending";
        case SubscriptionStatus::ACTIVE: return "Active";
        case SubscriptionStatus::RENEWING: return "Renewing";
        case SubscriptionStatus::FAILED: return "Failed";
        case SubscriptionStatus::TERMINATED: return "Terminated";
    }
    return "Unknown";
}

std::string to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::UNKNOWN: return "Unknown";
        case PlaybackState::STOPPED: return "Stopped";
        case PlaybackState::PLAYING: return "Playing";
        case PlaybackState::PAUSED: return "Paused";
        case PlaybackState::TRANSITIONING: return "Transitioning";
    }
    return "Unknown";
}

std::string describe(const StateChange& change) {
    std::ostringstream ss;
    if (auto* p = change.as<PlaybackChanged>()) {
        ss << "PlaybackChanged{" << p->device_id;
        if (p->state) {
            ss << " state=" << to_string(*p->state);
        }
        if (p->track && p->track->title) {
            ss << " title=\"" << *p->track->title << "\"";
        }
        if (p->position_ms) {
            ss << " position=" << *p->position_ms << "ms";
        }
        ss << "}";
    } else if (auto* v = change.as<VolumeChanged>()) {
        ss << "VolumeChanged{" << v->device_id;
        if (v->level) {
            ss << " level=" << static_cast<int>(*v->level);
        }
        if (v->muted) {
            ss << " muted=" << (*v->muted ? "true" : "false");
        }
        ss << "}";
    } else if (auto* t = change.as<TopologyChanged>()) {
        ss << "TopologyChanged{groups=" << t->snapshot.groups.size()
           << " vanished=" << t->snapshot.vanished.size() << "}";
    } else if (auto* f = change.as<SubscriptionFailed>()) {
        ss << "SubscriptionFailed{" << (f->device_id ? *f->device_id : std::string("<network>"))
           << " " << to_string(f->service_type) << (f->fatal ? " fatal" : "")
           << " reason=\"" << f->reason << "\"}";
    }
    return ss.str();
}

bool parse_service_type(const std::string& text, ServiceType& type) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    if (lower == "playback" || lower == "avtransport") {
        type = ServiceType::PLAYBACK;
    } else if (lower == "renderingvolume" || lower == "renderingcontrol" || lower == "volume") {
        type = ServiceType::RENDERING_VOLUME;
    } else if (lower == "grouptopology" || lower == "zonegrouptopology" || lower == "topology") {
        type = ServiceType::GROUP_TOPOLOGY;
    } else {
        return false;
    }
    return true;
}

SubscriptionScope scope_of(ServiceType type) {
    return type == ServiceType::GROUP_TOPOLOGY ? SubscriptionScope::NETWORK_WIDE
                                              : SubscriptionScope::PER_DEVICE;
}

} // namespace cadence
