#include "network/service_subscription.hpp"
#include "xml_document.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace cadence::network {

namespace {

using PropertyMap = std::map<std::string, std::string>;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimmed(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool parse_error(StreamError& error, const std::string& message) {
    error = StreamError(ErrorKind::PARSE, message);
    return false;
}

/**
 * Reads an <e:propertyset> document into name -> text. Each <e:property>
 * carries one or more variables; later values win.
 */
bool read_propertyset(const std::string& payload, XmlDocument& doc, PropertyMap& properties,
                      StreamError& error) {
    std::string xml_error;
    if (!doc.parse(payload, xml_error)) {
        return parse_error(error, xml_error);
    }
    XmlElement root = doc.root();
    if (root.local_name() != "propertyset") {
        return parse_error(error, "unexpected root element <" + root.name() + ">, expected propertyset");
    }
    for (const auto& property : root.children("property")) {
        for (const auto& variable : property.children()) {
            properties[variable.local_name()] = variable.text();
        }
    }
    return true;
}

/**
 * LastChange carries an escaped <Event><InstanceID val="0">...</InstanceID></Event>
 * document. Returns the InstanceID element of instance 0, or the first one.
 */
bool read_last_change(const std::string& text, XmlDocument& doc, XmlElement& instance, StreamError& error) {
    std::string xml_error;
    if (!doc.parse(text, xml_error)) {
        return parse_error(error, "LastChange: " + xml_error);
    }
    XmlElement root = doc.root();
    if (root.local_name() != "Event") {
        return parse_error(error, "LastChange: unexpected root <" + root.name() + ">");
    }
    auto instances = root.children("InstanceID");
    instance = XmlElement();
    for (const auto& candidate : instances) {
        if (candidate.attribute("val").value_or("0") == "0") {
            instance = candidate;
            break;
        }
    }
    if (!instance && !instances.empty()) {
        instance = instances.front();
    }
    return true;
}

bool is_master_channel(const XmlElement& element) {
    auto channel = element.attribute("channel");
    return !channel || channel->empty() || *channel == "Master";
}

// DIDL-Lite metadata: dc:title, dc:creator, upnp:album
void read_track_metadata(const std::string& didl, TrackInfo& track) {
    std::string text = trimmed(didl);
    if (text.empty() || text == "NOT_IMPLEMENTED") {
        return;
    }

    XmlDocument doc;
    std::string xml_error;
    if (!doc.parse(text, xml_error)) {
        Logger::debug("PlaybackService: ignoring unreadable track metadata: {}", xml_error);
        return;
    }

    XmlElement item = doc.root().find("item");
    XmlElement scope = item ? item : doc.root();
    auto pick = [&scope](const char* local) -> std::optional<std::string> {
        XmlElement element = scope.find(local);
        if (!element) {
            return std::nullopt;
        }
        std::string value = trimmed(element.text());
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    };

    track.title = pick("title");
    track.artist = pick("creator");
    if (!track.artist) {
        track.artist = pick("artist");
    }
    track.album = pick("album");
}

bool parse_volume_value(const std::string& text, uint8_t& level, StreamError& error) {
    std::string value = trimmed(text);
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        return parse_error(error, "Volume is not an integer: \"" + value + "\"");
    }
    if (value.size() > 3 || std::stoi(value) > 100) {
        return parse_error(error, "Volume out of range 0..100: " + value);
    }
    level = static_cast<uint8_t>(std::stoi(value));
    return true;
}

bool parse_mute_value(const std::string& text, bool& muted, StreamError& error) {
    std::string value = lowercase(trimmed(text));
    if (value == "1" || value == "true") {
        muted = true;
    } else if (value == "0" || value == "false") {
        muted = false;
    } else {
        return parse_error(error, "Mute is not a boolean: \"" + value + "\"");
    }
    return true;
}

bool require_device(const std::optional<DeviceId>& device_id, const char* service, StreamError& error) {
    if (!device_id || device_id->empty()) {
        error = StreamError(ErrorKind::PARSE, std::string(service) + " notification without a device");
        return false;
    }
    return true;
}

} // namespace

namespace payload {

std::string normalize_device_id(const std::string& raw) {
    std::string id = trimmed(raw);
    const std::string prefix = "uuid:";
    if (id.size() >= prefix.size() && lowercase(id.substr(0, prefix.size())) == prefix) {
        id = id.substr(prefix.size());
    }
    auto suffix = id.find("::");
    if (suffix != std::string::npos) {
        id.resize(suffix);
    }
    return id;
}

bool parse_clock_time(const std::string& text, uint64_t& ms) {
    std::string value = trimmed(text);
    if (value.empty() || value == "NOT_IMPLEMENTED") {
        return false;
    }

    std::string fraction;
    auto dot = value.find('.');
    if (dot != std::string::npos) {
        fraction = value.substr(dot + 1);
        value.resize(dot);
    }

    std::vector<std::string> parts;
    std::istringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ':')) {
        parts.push_back(part);
    }
    if (parts.size() != 3) {
        return false;
    }

    uint64_t total = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& field = parts[i];
        if (field.empty() || field.size() > 6 ||
            !std::all_of(field.begin(), field.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        uint64_t number = std::stoull(field);
        if (i > 0 && number >= 60) {
            return false;
        }
        total = total * 60 + number;
    }
    ms = total * 1000;

    if (!fraction.empty()) {
        if (!std::all_of(fraction.begin(), fraction.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        fraction = fraction.substr(0, 3);
        while (fraction.size() < 3) {
            fraction.push_back('0');
        }
        ms += std::stoull(fraction);
    }
    return true;
}

bool parse_transport_state(const std::string& text, PlaybackState& state) {
    std::string value = trimmed(text);
    if (value == "PLAYING") {
        state = PlaybackState::PLAYING;
    } else if (value == "PAUSED_PLAYBACK" || value == "PAUSED") {
        state = PlaybackState::PAUSED;
    } else if (value == "STOPPED" || value == "NO_MEDIA_PRESENT") {
        state = PlaybackState::STOPPED;
    } else if (value == "TRANSITIONING") {
        state = PlaybackState::TRANSITIONING;
    } else {
        return false;
    }
    return true;
}

} // namespace payload

// PlaybackService

bool PlaybackService::parse(const std::optional<DeviceId>& device_id, const std::string& text,
                            std::optional<StateChange::Payload>& change, StreamError& error) const {
    if (!require_device(device_id, "Playback", error)) {
        return false;
    }

    XmlDocument doc;
    PropertyMap fields;
    if (!read_propertyset(text, doc, fields, error)) {
        return false;
    }

    auto last_change = fields.find("LastChange");
    if (last_change != fields.end() && !trimmed(last_change->second).empty()) {
        XmlDocument inner;
        XmlElement instance;
        if (!read_last_change(last_change->second, inner, instance, error)) {
            return false;
        }
        for (const auto& variable : instance.children()) {
            auto value = variable.attribute("val");
            if (value) {
                fields[variable.local_name()] = *value;
            }
        }
    }

    PlaybackChanged result;
    result.device_id = *device_id;

    auto state_field = fields.find("TransportState");
    if (state_field != fields.end()) {
        PlaybackState state;
        if (payload::parse_transport_state(state_field->second, state)) {
            result.state = state;
        } else {
            Logger::debug("PlaybackService: ignoring unknown TransportState \"{}\"", state_field->second);
        }
    }

    TrackInfo track;
    auto metadata = fields.find("CurrentTrackMetaData");
    if (metadata != fields.end()) {
        read_track_metadata(metadata->second, track);
    }
    auto uri = fields.find("CurrentTrackURI");
    if (uri != fields.end() && !trimmed(uri->second).empty()) {
        track.uri = trimmed(uri->second);
    }
    auto duration = fields.find("CurrentTrackDuration");
    uint64_t duration_ms = 0;
    if (duration != fields.end() && payload::parse_clock_time(duration->second, duration_ms)) {
        track.duration_ms = duration_ms;
    }
    if (!track.empty()) {
        result.track = track;
    }

    for (const char* name : {"RelativeTimePosition", "RelTime"}) {
        auto position = fields.find(name);
        uint64_t position_ms = 0;
        if (position != fields.end() && payload::parse_clock_time(position->second, position_ms)) {
            result.position_ms = position_ms;
            break;
        }
    }

    if (result.state || result.track || result.position_ms) {
        change = std::move(result);
    } else {
        change.reset();
    }
    return true;
}

// RenderingVolumeService

bool RenderingVolumeService::parse(const std::optional<DeviceId>& device_id, const std::string& text,
                                   std::optional<StateChange::Payload>& change, StreamError& error) const {
    if (!require_device(device_id, "RenderingVolume", error)) {
        return false;
    }

    XmlDocument doc;
    PropertyMap fields;
    if (!read_propertyset(text, doc, fields, error)) {
        return false;
    }

    std::optional<std::string> volume_text;
    std::optional<std::string> mute_text;

    auto direct_volume = fields.find("Volume");
    if (direct_volume != fields.end()) {
        volume_text = direct_volume->second;
    }
    auto direct_mute = fields.find("Mute");
    if (direct_mute != fields.end()) {
        mute_text = direct_mute->second;
    }

    auto last_change = fields.find("LastChange");
    if (last_change != fields.end() && !trimmed(last_change->second).empty()) {
        XmlDocument inner;
        XmlElement instance;
        if (!read_last_change(last_change->second, inner, instance, error)) {
            return false;
        }
        for (const auto& element : instance.children("Volume")) {
            if (is_master_channel(element)) {
                volume_text = element.attribute("val").value_or("");
            }
        }
        for (const auto& element : instance.children("Mute")) {
            if (is_master_channel(element)) {
                mute_text = element.attribute("val").value_or("");
            }
        }
    }

    VolumeChanged result;
    result.device_id = *device_id;
    if (volume_text) {
        uint8_t level = 0;
        if (!parse_volume_value(*volume_text, level, error)) {
            return false;
        }
        result.level = level;
    }
    if (mute_text) {
        bool muted = false;
        if (!parse_mute_value(*mute_text, muted, error)) {
            return false;
        }
        result.muted = muted;
    }

    if (result.level || result.muted) {
        change = std::move(result);
    } else {
        change.reset();
    }
    return true;
}

// GroupTopologyService

bool GroupTopologyService::parse(const std::optional<DeviceId>&, const std::string& text,
                                 std::optional<StateChange::Payload>& change, StreamError& error) const {
    XmlDocument doc;
    PropertyMap fields;
    if (!read_propertyset(text, doc, fields, error)) {
        return false;
    }

    auto state_field = fields.find("ZoneGroupState");
    if (state_field == fields.end() || trimmed(state_field->second).empty()) {
        change.reset();
        return true;
    }

    XmlDocument inner;
    std::string xml_error;
    if (!inner.parse(state_field->second, xml_error)) {
        return parse_error(error, "ZoneGroupState: " + xml_error);
    }

    XmlElement root = inner.root();
    XmlElement zone_groups;
    XmlElement vanished_devices;
    if (root.local_name() == "ZoneGroupState") {
        zone_groups = root.child("ZoneGroups");
        vanished_devices = root.child("VanishedDevices");
    } else if (root.local_name() == "ZoneGroups") {
        zone_groups = root;
    } else {
        return parse_error(error, "ZoneGroupState: unexpected root <" + root.name() + ">");
    }

    Topology topology;
    for (const auto& zone : zone_groups.children("ZoneGroup")) {
        Group group;
        group.coordinator = payload::normalize_device_id(zone.attribute("Coordinator").value_or(""));
        if (group.coordinator.empty()) {
            Logger::debug("GroupTopologyService: skipping ZoneGroup without coordinator");
            continue;
        }
        group.id = trimmed(zone.attribute("ID").value_or(""));
        if (group.id.empty()) {
            group.id = group.coordinator + ":1";
        }

        for (const auto& member_element : zone.children("ZoneGroupMember")) {
            GroupMember member;
            member.device_id = payload::normalize_device_id(member_element.attribute("UUID").value_or(""));
            if (member.device_id.empty()) {
                continue;
            }

            auto add_satellite = [&member](const std::string& raw) {
                std::string id = payload::normalize_device_id(raw);
                if (!id.empty() &&
                    std::find(member.satellites.begin(), member.satellites.end(), id) == member.satellites.end()) {
                    member.satellites.push_back(id);
                }
            };

            std::istringstream listed(member_element.attribute("Satellites").value_or(""));
            std::string entry;
            while (std::getline(listed, entry, ',')) {
                add_satellite(entry);
            }
            for (const auto& satellite : member_element.children("Satellite")) {
                add_satellite(satellite.attribute("UUID").value_or(""));
            }

            group.members.push_back(std::move(member));
        }

        topology.groups.push_back(std::move(group));
    }

    for (const auto& device : vanished_devices.children("Device")) {
        VanishedDevice vanished;
        vanished.device_id = payload::normalize_device_id(device.attribute("UUID").value_or(""));
        if (vanished.device_id.empty()) {
            continue;
        }
        vanished.reason = trimmed(device.attribute("Reason").value_or(""));
        topology.vanished.push_back(std::move(vanished));
    }

    change = TopologyChanged{std::move(topology)};
    return true;
}

// ServiceSubscription

ServiceVariant make_service(ServiceType type) {
    switch (type) {
        case ServiceType::PLAYBACK: return PlaybackService{};
        case ServiceType::RENDERING_VOLUME: return RenderingVolumeService{};
        case ServiceType::GROUP_TOPOLOGY: return GroupTopologyService{};
    }
    throw std::invalid_argument("make_service: unknown service type");
}

const char* event_path(ServiceType type) {
    return std::visit([](const auto& service) { return std::decay_t<decltype(service)>::kEventPath; },
                      make_service(type));
}

ServiceSubscription::ServiceSubscription(ServiceType type, std::shared_ptr<EventTransport> transport)
    : service_(make_service(type)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("ServiceSubscription: transport must not be null");
    }
}

ServiceType ServiceSubscription::type() const {
    return std::visit([](const auto& service) { return std::decay_t<decltype(service)>::kType; }, service_);
}

SubscriptionScope ServiceSubscription::scope() const {
    return std::visit([](const auto& service) { return std::decay_t<decltype(service)>::kScope; }, service_);
}

std::string ServiceSubscription::event_path() const {
    return std::visit([](const auto& service) { return std::string(std::decay_t<decltype(service)>::kEventPath); },
                      service_);
}

namespace {

// Grants are bounded by the requested lease so expiry arithmetic stays in range
std::chrono::seconds bounded_grant(std::chrono::seconds granted, std::chrono::seconds requested) {
    if (granted <= std::chrono::seconds(0) || granted > requested) {
        return requested;
    }
    return granted;
}

} // namespace

bool ServiceSubscription::subscribe(const Endpoint& endpoint,
                                    const std::optional<DeviceId>& device_id,
                                    const std::string& callback_url,
                                    std::chrono::seconds lease,
                                    Subscription& subscription,
                                    StreamError& error) const {
    LeaseGrant grant;
    if (!transport_->subscribe(endpoint, event_path(), callback_url, lease, grant, error)) {
        return false;
    }

    subscription.device_id = scope() == SubscriptionScope::PER_DEVICE ? device_id : std::nullopt;
    subscription.service_type = type();
    subscription.scope = scope();
    subscription.lease_id = grant.sid;
    subscription.granted = bounded_grant(grant.duration, lease);
    subscription.expires_at = SteadyClock::now() + subscription.granted;
    subscription.status = SubscriptionStatus::ACTIVE;
    subscription.retry_count = 0;
    subscription.endpoint = endpoint;
    subscription.last_error.clear();
    return true;
}

bool ServiceSubscription::renew(const Subscription& current,
                                std::chrono::seconds lease,
                                Subscription& renewed,
                                StreamError& error) const {
    if (current.lease_id.empty()) {
        error = StreamError(ErrorKind::SUBSCRIPTION, "cannot renew a lease without token");
        return false;
    }

    LeaseGrant grant;
    if (!transport_->renew(current.endpoint, event_path(), current.lease_id, lease, grant, error)) {
        return false;
    }

    renewed = current;
    renewed.lease_id = grant.sid;
    renewed.granted = bounded_grant(grant.duration, lease);
    renewed.expires_at = SteadyClock::now() + renewed.granted;
    renewed.status = SubscriptionStatus::ACTIVE;
    renewed.retry_count = 0;
    renewed.last_error.clear();
    return true;
}

bool ServiceSubscription::unsubscribe(const Subscription& subscription, StreamError& error) const {
    if (subscription.lease_id.empty()) {
        return true;
    }
    return transport_->unsubscribe(subscription.endpoint, event_path(), subscription.lease_id, error);
}

bool ServiceSubscription::parse(const std::optional<DeviceId>& device_id,
                                const std::string& payload,
                                SystemClock::time_point received,
                                std::optional<StateChange>& change,
                                StreamError& error) const {
    std::optional<StateChange::Payload> parsed;
    bool ok = std::visit([&](const auto& service) { return service.parse(device_id, payload, parsed, error); },
                         service_);
    if (!ok) {
        change.reset();
        return false;
    }
    if (parsed) {
        change = StateChange(std::move(*parsed), received);
    } else {
        change.reset();
    }
    return true;
}

} // namespace cadence::network
