#include "network/subscription_manager.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <system_error>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cadence::network {

namespace {

constexpr size_t kMaxQueuedPerShard = 10000;
constexpr uint64_t kDropWarningInterval = 1000;

bool is_live(SubscriptionStatus status) {
    return status == SubscriptionStatus::ACTIVE || status == SubscriptionStatus::RENEWING;
}

} // namespace

bool sequence_newer(uint32_t candidate, uint32_t last) {
    return static_cast<int32_t>(candidate - last) > 0;
}

// SubscriptionManager implementation
SubscriptionManager::SubscriptionManager(const StreamConfig& config, std::shared_ptr<EventTransport> transport)
    : config_(config), transport_(std::move(transport)) {
    auto validation = ConfigValidator::validate(config_);
    if (!validation.isValid) {
        throw ConfigurationError("SubscriptionManager: invalid configuration: " + validation.summary());
    }
    for (const auto& warning : validation.warnings) {
        Logger::warn("SubscriptionManager: configuration: {}", warning);
    }

    if (!transport_) {
        transport_ = std::make_shared<HttpEventTransport>(config_.request_timeout);
    }
    stream_ = std::make_shared<EventStream>(config_.buffer_capacity, config_.push_timeout);

    Logger::info("SubscriptionManager: created (lease={}s, margin={}s, retries={}, buffer={})",
                 config_.lease_duration.count(), config_.renewal_margin.count(),
                 config_.retry_attempts, config_.buffer_capacity);
}

SubscriptionManager::~SubscriptionManager() {
    stop();
}

void SubscriptionManager::start(const std::vector<DeviceInfo>& roster,
                                const std::vector<ServiceType>& service_types,
                                std::optional<Topology> initial_topology) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        Logger::warn("SubscriptionManager: already running");
        return;
    }

    std::vector<ServiceType> services;
    for (auto type : service_types.empty() ? config_.enabled_services : service_types) {
        if (std::find(services.begin(), services.end(), type) == services.end()) {
            services.push_back(type);
        }
    }

    {
        std::lock_guard<std::mutex> lock(roster_mutex_);
        roster_.clear();
        roster_order_.clear();
        for (const auto& device : roster) {
            if (device.id.empty()) {
                Logger::warn("SubscriptionManager: ignoring roster entry without id ({})", device.endpoint.toString());
                continue;
            }
            if (roster_.emplace(device.id, device.endpoint).second) {
                roster_order_.push_back(device.id);
            }
        }
        services_ = services;
    }

    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (stream_->is_closed()) {
            stream_ = std::make_shared<EventStream>(config_.buffer_capacity, config_.push_timeout);
        }
    }

    stopping_.store(false);
    start_dispatch_workers();

    CallbackReceiver::Config receiver_config;
    receiver_config.port_start = config_.callback_port_start;
    receiver_config.port_end = config_.callback_port_end;
    receiver_config.path = config_.callback_path;
    receiver_config.host = config_.callback_host;
    receiver_config.handler_threads = config_.receiver_threads;
    receiver_config.max_body_bytes = config_.max_notification_bytes;
    receiver_config.read_timeout = config_.request_timeout;

    try {
        receiver_ = std::make_unique<CallbackReceiver>(
            receiver_config,
            [this](const std::string& sid) { return is_lease_active(sid); },
            [this](RawNotification notification) { enqueue_notification(std::move(notification)); });
        receiver_->set_warning_callback([this](const std::string& message) { emit_warning(message); });
        receiver_->start();
    } catch (const std::exception& e) {
        Logger::error("SubscriptionManager: cannot start callback receiver: {}", e.what());
        receiver_.reset();
        stop_dispatch_workers();
        throw;
    }

    if (initial_topology) {
        cache_.set_topology(std::move(*initial_topology));
    }

    Logger::info("SubscriptionManager: starting with {} devices, callback {}", roster_order().size(),
                 receiver_->callback_url());

    std::vector<std::pair<std::shared_ptr<LeaseEntry>, LeaseAction>> initial;
    for (const auto& device_id : roster_order()) {
        for (auto type : per_device_services()) {
            if (auto entry = create_entry(device_id, type)) {
                initial.emplace_back(entry, LeaseAction::SUBSCRIBE);
            }
        }
    }
    if (network_service_enabled()) {
        if (auto entry = create_entry(std::nullopt, ServiceType::GROUP_TOPOLOGY)) {
            initial.emplace_back(entry, LeaseAction::SUBSCRIBE);
        }
    }
    run_actions(initial);

    scheduler_running_.store(true);
    scheduler_thread_ = std::thread(&SubscriptionManager::scheduler_loop, this);
    running_.store(true);

    auto stats = statistics();
    Logger::info("SubscriptionManager: started, {} active, {} pending, {} failed",
                 stats.active_subscriptions, stats.pending_subscriptions, stats.failed_subscriptions);

    StreamCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = stream_started_callback_;
    }
    if (callback) {
        callback();
    }
}

void SubscriptionManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    Logger::info("SubscriptionManager: stopping");
    stopping_.store(true);

    // Scheduler first: waits for any renewal in flight
    scheduler_running_.store(false);
    scheduler_cv_.notify_all();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }

    // Best-effort release of every live lease
    std::vector<std::pair<Subscription, std::shared_ptr<LeaseEntry>>> releases;
    for (const auto& entry : snapshot_entries()) {
        Subscription sub;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            sub = entry->sub;
            entry->sub.status = SubscriptionStatus::TERMINATED;
        }
        if (is_live(sub.status)) {
            releases.emplace_back(std::move(sub), entry);
        }
    }
    run_parallel(releases.size(), [this, &releases](size_t index) {
        release_lease(releases[index].first, releases[index].second->service);
    });
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        leases_.clear();
        sid_index_.clear();
    }

    if (receiver_) {
        receiver_->stop();
    }
    stop_dispatch_workers();

    std::shared_ptr<EventStream> stream = event_stream();
    stream->close();

    std::vector<DeviceId> disconnected;
    {
        std::lock_guard<std::mutex> lock(presence_mutex_);
        disconnected.assign(connected_devices_.begin(), connected_devices_.end());
        connected_devices_.clear();
    }

    DeviceCallback on_disconnected;
    StreamCallback on_stopped;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        on_disconnected = device_disconnected_callback_;
        on_stopped = stream_stopped_callback_;
    }
    if (on_disconnected) {
        for (const auto& device_id : disconnected) {
            on_disconnected(device_id);
        }
    }

    Logger::info("SubscriptionManager: stopped ({} events published, {} dropped)",
                 events_published_.load(), stream->dropped_count());
    if (on_stopped) {
        on_stopped();
    }
}

bool SubscriptionManager::add_device(const DeviceId& device_id, const Endpoint& endpoint) {
    if (!running_.load()) {
        Logger::error("SubscriptionManager: Cannot add device {} - not running", device_id);
        return false;
    }
    if (device_id.empty()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(roster_mutex_);
        if (!roster_.emplace(device_id, endpoint).second) {
            Logger::warn("SubscriptionManager: device {} already in roster", device_id);
            return false;
        }
        roster_order_.push_back(device_id);
    }
    Logger::info("SubscriptionManager: adding device {} at {}", device_id, endpoint.toString());

    std::vector<std::pair<std::shared_ptr<LeaseEntry>, LeaseAction>> actions;
    for (auto type : per_device_services()) {
        if (auto entry = create_entry(device_id, type)) {
            actions.emplace_back(entry, LeaseAction::SUBSCRIBE);
        }
    }
    run_actions(actions);
    return true;
}

bool SubscriptionManager::remove_device(const DeviceId& device_id) {
    if (!running_.load()) {
        return false;
    }

    Endpoint endpoint;
    {
        std::lock_guard<std::mutex> lock(roster_mutex_);
        auto it = roster_.find(device_id);
        if (it == roster_.end()) {
            return false;
        }
        endpoint = it->second;
        roster_.erase(it);
        roster_order_.erase(std::remove(roster_order_.begin(), roster_order_.end(), device_id),
                            roster_order_.end());
    }
    Logger::info("SubscriptionManager: removing device {}", device_id);

    for (auto type : {ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME}) {
        if (auto entry = find_entry(make_key(device_id, type))) {
            terminate(entry);
        }
    }

    // Move the network-wide lease off the departing device
    auto network = find_entry(make_key(std::nullopt, ServiceType::GROUP_TOPOLOGY));
    if (network) {
        bool hosted = false;
        {
            std::lock_guard<std::mutex> lock(network->mutex);
            hosted = !network->sub.lease_id.empty() && network->sub.endpoint == endpoint;
        }
        if (hosted) {
            Logger::info("SubscriptionManager: {} hosted the topology lease, failing over", device_id);
            terminate(network);
            if (auto replacement = create_entry(std::nullopt, ServiceType::GROUP_TOPOLOGY)) {
                run_action(replacement, LeaseAction::SUBSCRIBE);
            }
        }
    }

    refresh_presence(device_id);
    return true;
}

bool SubscriptionManager::subscribe(const DeviceId& device_id, ServiceType type) {
    if (!running_.load()) {
        Logger::error("SubscriptionManager: Cannot subscribe {} {} - not running", device_id, to_string(type));
        return false;
    }

    Endpoint endpoint;
    if (!roster_endpoint(device_id, endpoint)) {
        Logger::error("SubscriptionManager: Cannot subscribe unknown device {}", device_id);
        return false;
    }

    const bool network_wide = scope_of(type) == SubscriptionScope::NETWORK_WIDE;
    const std::optional<DeviceId> owner = network_wide ? std::nullopt : std::optional<DeviceId>(device_id);

    auto entry = find_entry(make_key(owner, type));
    if (entry) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->sub.status != SubscriptionStatus::FAILED) {
            // At most one lease per pair; an existing one already covers it
            return true;
        }
        entry->sub.status = SubscriptionStatus::PENDING;
        entry->sub.retry_count = 0;
        entry->sub.lease_id.clear();
        entry->force_resubscribe = false;
        entry->in_flight = true;
        if (network_wide) {
            entry->preferred_host = device_id;
        }
    } else {
        entry = create_entry(owner, type);
        if (!entry) {
            return subscribe(device_id, type);
        }
        if (network_wide) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->preferred_host = device_id;
        }
    }

    Logger::info("SubscriptionManager: subscribing {} {}", device_id, to_string(type));
    return activate(entry);
}

bool SubscriptionManager::unsubscribe(const DeviceId& device_id, ServiceType type) {
    const bool network_wide = scope_of(type) == SubscriptionScope::NETWORK_WIDE;
    auto entry = find_entry(make_key(network_wide ? std::nullopt : std::optional<DeviceId>(device_id), type));
    if (!entry) {
        return false;
    }

    Logger::info("SubscriptionManager: unsubscribing {} {}", network_wide ? "<network>" : device_id, to_string(type));
    terminate(entry);
    if (!network_wide) {
        refresh_presence(device_id);
    }
    return true;
}

size_t SubscriptionManager::recover_failed() {
    if (!running_.load()) {
        return 0;
    }

    std::vector<std::pair<std::shared_ptr<LeaseEntry>, LeaseAction>> actions;
    for (const auto& entry : snapshot_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->sub.status != SubscriptionStatus::FAILED || entry->in_flight) {
            continue;
        }
        entry->sub.status = SubscriptionStatus::PENDING;
        entry->sub.retry_count = 0;
        entry->sub.lease_id.clear();
        entry->force_resubscribe = false;
        entry->in_flight = true;
        actions.emplace_back(entry, LeaseAction::SUBSCRIBE);
    }

    if (actions.empty()) {
        return 0;
    }
    Logger::info("SubscriptionManager: recovering {} failed subscriptions", actions.size());
    run_actions(actions);

    size_t recovered = 0;
    for (const auto& action : actions) {
        std::lock_guard<std::mutex> lock(action.first->mutex);
        if (action.first->sub.status == SubscriptionStatus::ACTIVE) {
            ++recovered;
        }
    }
    Logger::info("SubscriptionManager: recovered {}/{} subscriptions", recovered, actions.size());
    return recovered;
}

bool SubscriptionManager::dispatch(RawNotification notification) {
    if (!running_.load() || !is_lease_active(notification.sid)) {
        notifications_rejected_.fetch_add(1);
        Logger::debug("SubscriptionManager: rejected notification for unknown lease {}", notification.sid);
        return false;
    }
    if (notification.received_at == SystemClock::time_point{}) {
        notification.received_at = SystemClock::now();
    }
    enqueue_notification(std::move(notification));
    return true;
}

bool SubscriptionManager::is_lease_active(const std::string& sid) const {
    auto entry = find_by_sid(sid);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->sub.lease_id == sid && is_live(entry->sub.status);
}

std::vector<Subscription> SubscriptionManager::subscriptions() const {
    std::vector<Subscription> out;
    for (const auto& entry : snapshot_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        out.push_back(entry->sub);
    }
    std::sort(out.begin(), out.end(), [](const Subscription& a, const Subscription& b) {
        if (a.device_id != b.device_id) {
            return a.device_id < b.device_id;
        }
        return a.service_type < b.service_type;
    });
    return out;
}

std::vector<Subscription> SubscriptionManager::failed_subscriptions() const {
    std::vector<Subscription> out;
    for (auto& sub : subscriptions()) {
        if (sub.status == SubscriptionStatus::FAILED) {
            out.push_back(std::move(sub));
        }
    }
    return out;
}

std::optional<Subscription> SubscriptionManager::subscription(const std::optional<DeviceId>& device_id,
                                                              ServiceType type) const {
    const bool network_wide = scope_of(type) == SubscriptionScope::NETWORK_WIDE;
    auto entry = find_entry(make_key(network_wide ? std::nullopt : device_id, type));
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->sub;
}

SubscriptionManager::Statistics SubscriptionManager::statistics() const {
    Statistics stats;
    for (const auto& sub : subscriptions()) {
        switch (sub.status) {
            case SubscriptionStatus::ACTIVE: stats.active_subscriptions++; break;
            case SubscriptionStatus::PENDING: stats.pending_subscriptions++; break;
            case SubscriptionStatus::RENEWING: stats.renewing_subscriptions++; break;
            case SubscriptionStatus::FAILED: stats.failed_subscriptions++; break;
            case SubscriptionStatus::TERMINATED: break;
        }
    }

    stats.notifications_accepted = notifications_accepted_.load();
    stats.notifications_rejected = notifications_rejected_.load();
    if (receiver_) {
        stats.notifications_rejected += receiver_->get_statistics().rejected;
    }
    stats.notifications_duplicate = notifications_duplicate_.load();
    stats.parse_failures = parse_failures_.load();
    stats.subscribes_succeeded = subscribes_succeeded_.load();
    stats.subscribes_failed = subscribes_failed_.load();
    stats.renewals_succeeded = renewals_succeeded_.load();
    stats.renewals_failed = renewals_failed_.load();
    stats.events_published = events_published_.load();
    stats.events_dropped = event_stream()->dropped_count();
    stats.devices_tracked = cache_.size();
    return stats;
}

std::string SubscriptionManager::get_diagnostics_report() const {
    const auto now = SteadyClock::now();
    const auto stats = statistics();
    auto stream = event_stream();

    json report;
    report["running"] = running_.load();
    report["callback_url"] = callback_url();

    json leases = json::array();
    for (const auto& sub : subscriptions()) {
        json lease;
        lease["device_id"] = sub.device_id ? json(*sub.device_id) : json(nullptr);
        lease["service"] = to_string(sub.service_type);
        lease["scope"] = to_string(sub.scope);
        lease["status"] = to_string(sub.status);
        lease["lease_id"] = sub.lease_id;
        lease["endpoint"] = sub.endpoint.host.empty() ? std::string() : sub.endpoint.toString();
        lease["retry_count"] = sub.retry_count;
        lease["notifications"] = sub.notifications;
        if (!sub.lease_id.empty()) {
            lease["expires_in_s"] =
                std::chrono::duration_cast<std::chrono::seconds>(sub.expires_at - now).count();
        }
        if (!sub.last_error.empty()) {
            lease["last_error"] = sub.last_error;
        }
        leases.push_back(std::move(lease));
    }
    report["subscriptions"] = std::move(leases);

    report["statistics"] = {
        {"active", stats.active_subscriptions},
        {"pending", stats.pending_subscriptions},
        {"renewing", stats.renewing_subscriptions},
        {"failed", stats.failed_subscriptions},
        {"notifications_accepted", stats.notifications_accepted},
        {"notifications_rejected", stats.notifications_rejected},
        {"notifications_duplicate", stats.notifications_duplicate},
        {"parse_failures", stats.parse_failures},
        {"subscribes_succeeded", stats.subscribes_succeeded},
        {"subscribes_failed", stats.subscribes_failed},
        {"renewals_succeeded", stats.renewals_succeeded},
        {"renewals_failed", stats.renewals_failed},
        {"events_published", stats.events_published},
        {"events_dropped", stats.events_dropped},
        {"devices_tracked", stats.devices_tracked},
    };
    report["stream"] = {
        {"size", stream->size()},
        {"capacity", stream->capacity()},
        {"pushed", stream->pushed_count()},
        {"dropped", stream->dropped_count()},
        {"closed", stream->is_closed()},
    };
    report["cached_devices"] = cache_.devices();

    json transport = json::object();
    for (const char* operation : {"gena.subscribe", "gena.renew", "gena.unsubscribe"}) {
        auto metrics = Logger::getPerformanceMetrics(operation);
        if (metrics.totalOperations == 0) {
            continue;
        }
        transport[operation] = {
            {"count", metrics.totalOperations},
            {"avg_ms", metrics.avgLatency},
            {"max_ms", metrics.maxLatency},
            {"error_rate", metrics.errorRate},
        };
    }
    report["transport"] = std::move(transport);

    return report.dump(2);
}

std::string SubscriptionManager::callback_url() const {
    return receiver_ && receiver_->is_running() ? receiver_->callback_url() : std::string();
}

uint16_t SubscriptionManager::callback_port() const {
    return receiver_ && receiver_->is_running() ? receiver_->port() : 0;
}

std::shared_ptr<EventStream> SubscriptionManager::event_stream() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return stream_;
}

void SubscriptionManager::set_device_connected_callback(DeviceCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    device_connected_callback_ = std::move(callback);
}

void SubscriptionManager::set_device_disconnected_callback(DeviceCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    device_disconnected_callback_ = std::move(callback);
}

void SubscriptionManager::set_subscription_failed_callback(SubscriptionFailedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    subscription_failed_callback_ = std::move(callback);
}

void SubscriptionManager::set_warning_callback(WarningCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    warning_callback_ = std::move(callback);
}

void SubscriptionManager::set_stream_started_callback(StreamCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    stream_started_callback_ = std::move(callback);
}

void SubscriptionManager::set_stream_stopped_callback(StreamCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    stream_stopped_callback_ = std::move(callback);
}

// Registry helpers

std::string SubscriptionManager::make_key(const std::optional<DeviceId>& device_id, ServiceType type) {
    if (scope_of(type) == SubscriptionScope::NETWORK_WIDE || !device_id) {
        return "*|" + to_string(type);
    }
    return *device_id + "|" + to_string(type);
}

std::shared_ptr<SubscriptionManager::LeaseEntry> SubscriptionManager::find_entry(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = leases_.find(key);
    return it == leases_.end() ? nullptr : it->second;
}

std::shared_ptr<SubscriptionManager::LeaseEntry> SubscriptionManager::find_by_sid(const std::string& sid) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto index = sid_index_.find(sid);
    if (index == sid_index_.end()) {
        return nullptr;
    }
    auto it = leases_.find(index->second);
    return it == leases_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<SubscriptionManager::LeaseEntry>> SubscriptionManager::snapshot_entries() const {
    std::vector<std::shared_ptr<LeaseEntry>> out;
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    out.reserve(leases_.size());
    for (const auto& [key, entry] : leases_) {
        out.push_back(entry);
    }
    return out;
}

// Returns nullptr if the pair already has an entry. New entries start
// Pending and in flight; the caller runs the first attempt.
std::shared_ptr<SubscriptionManager::LeaseEntry> SubscriptionManager::create_entry(
    const std::optional<DeviceId>& device_id, ServiceType type) {
    const std::string key = make_key(device_id, type);
    auto entry = std::make_shared<LeaseEntry>(key, ServiceSubscription(type, transport_));
    entry->sub.device_id = scope_of(type) == SubscriptionScope::PER_DEVICE ? device_id : std::nullopt;
    entry->sub.service_type = type;
    entry->sub.scope = scope_of(type);
    entry->sub.status = SubscriptionStatus::PENDING;
    entry->in_flight = true;

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    if (!leases_.emplace(key, entry).second) {
        return nullptr;
    }
    return entry;
}

// Tokens are only indexed for entries the registry still holds
bool SubscriptionManager::index_sid(const std::string& old_sid, const std::string& new_sid,
                                    const std::shared_ptr<LeaseEntry>& entry) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    if (!old_sid.empty() && old_sid != new_sid) {
        auto it = sid_index_.find(old_sid);
        if (it != sid_index_.end() && it->second == entry->key) {
            sid_index_.erase(it);
        }
    }
    auto registered = leases_.find(entry->key);
    if (registered == leases_.end() || registered->second != entry) {
        return false;
    }
    if (!new_sid.empty()) {
        sid_index_[new_sid] = entry->key;
    }
    return true;
}

void SubscriptionManager::erase_entry(const std::shared_ptr<LeaseEntry>& entry) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = leases_.find(entry->key);
    if (it == leases_.end() || it->second != entry) {
        // A newer lease for the same pair owns the key and its tokens
        return;
    }
    leases_.erase(it);
    for (auto index = sid_index_.begin(); index != sid_index_.end();) {
        if (index->second == entry->key) {
            index = sid_index_.erase(index);
        } else {
            ++index;
        }
    }
}

// Lease operations

bool SubscriptionManager::resolve_target(const std::shared_ptr<LeaseEntry>& entry, Endpoint& target,
                                         StreamError& error) {
    std::optional<DeviceId> device_id;
    std::optional<DeviceId> preferred;
    size_t failover_index = 0;
    SubscriptionScope scope;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        device_id = entry->sub.device_id;
        preferred = entry->preferred_host;
        failover_index = entry->failover_index;
        scope = entry->sub.scope;
    }

    if (scope == SubscriptionScope::PER_DEVICE) {
        if (!device_id || !roster_endpoint(*device_id, target)) {
            error = StreamError(ErrorKind::SUBSCRIPTION, "device is no longer in the roster");
            return false;
        }
        return true;
    }

    if (preferred && roster_endpoint(*preferred, target)) {
        return true;
    }
    auto order = roster_order();
    if (order.empty()) {
        error = StreamError(ErrorKind::SUBSCRIPTION, "no device available to host the network-wide lease");
        return false;
    }
    return roster_endpoint(order[failover_index % order.size()], target);
}

void SubscriptionManager::run_action(const std::shared_ptr<LeaseEntry>& entry, LeaseAction action) {
    try {
        Subscription current;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            current = entry->sub;
            if (action == LeaseAction::RENEW && (entry->force_resubscribe || current.lease_id.empty())) {
                action = LeaseAction::SUBSCRIBE;
            }
        }

        StreamError error;
        Subscription result;
        bool ok = false;
        if (action == LeaseAction::SUBSCRIBE) {
            Endpoint target;
            ok = resolve_target(entry, target, error) &&
                 entry->service.subscribe(target, current.device_id, callback_url(), config_.lease_duration,
                                          result, error);
        } else {
            ok = entry->service.renew(current, config_.lease_duration, result, error);
        }

        if (action == LeaseAction::SUBSCRIBE) {
            (ok ? subscribes_succeeded_ : subscribes_failed_).fetch_add(1);
        } else {
            (ok ? renewals_succeeded_ : renewals_failed_).fetch_add(1);
        }

        const std::string what = (current.device_id ? *current.device_id : std::string("<network>")) + " " +
                                 to_string(current.service_type);
        std::string old_sid;
        bool failed = false;
        bool orphaned = false;
        Subscription final_state;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->in_flight = false;
            old_sid = entry->sub.lease_id;

            if (entry->sub.status == SubscriptionStatus::TERMINATED || stopping_.load()) {
                // Unsubscribed or stopped while the request was out
                entry->sub.status = SubscriptionStatus::TERMINATED;
                orphaned = true;
            } else if (ok) {
                result.notifications = entry->sub.notifications;
                if (result.lease_id != entry->sub.lease_id) {
                    entry->last_seq.reset();
                }
                entry->sub = result;
                entry->force_resubscribe = false;
                entry->preferred_host.reset();
            } else {
                const bool initial = entry->sub.status == SubscriptionStatus::PENDING;
                entry->sub.retry_count++;
                entry->sub.last_error = error.describe();
                if (action == LeaseAction::SUBSCRIBE && entry->sub.scope == SubscriptionScope::NETWORK_WIDE) {
                    entry->failover_index++;
                    entry->preferred_host.reset();
                }
                if (action == LeaseAction::RENEW && error.http_status == 412) {
                    entry->force_resubscribe = true;
                }

                const bool unsupported = initial && error.http_status == 503;
                if (unsupported || entry->sub.retry_count >= config_.retry_attempts) {
                    entry->sub.status = SubscriptionStatus::FAILED;
                    entry->sub.lease_id.clear();
                    failed = true;
                } else {
                    entry->next_attempt_at = SteadyClock::now() + backoff_delay(config_, entry->sub.retry_count);
                }
            }
            final_state = entry->sub;
        }

        if (!orphaned && ok && !index_sid(old_sid, final_state.lease_id, entry)) {
            // Entry left the registry while the request was out
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->sub.status = SubscriptionStatus::TERMINATED;
            orphaned = true;
        }

        if (orphaned) {
            erase_entry(entry);
            if (ok) {
                release_lease(result, entry->service);
            }
            return;
        } else if (ok) {
            Logger::info("SubscriptionManager: {} {} {} (lease {} for {}s)", what,
                         action == LeaseAction::SUBSCRIBE ? "subscribed" : "renewed",
                         final_state.endpoint.toString(), final_state.lease_id, final_state.granted.count());
        } else if (failed) {
            index_sid(old_sid, std::string(), entry);
            report_failure(final_state, error.describe());
        } else {
            Logger::warn("SubscriptionManager: {} {} attempt {}/{} failed: {}", what,
                         action == LeaseAction::SUBSCRIBE ? "subscribe" : "renewal", final_state.retry_count,
                         config_.retry_attempts, error.describe());
        }

        if (final_state.device_id) {
            refresh_presence(*final_state.device_id);
        }
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->in_flight = false;
        }
        Logger::error("SubscriptionManager: lease operation for {} failed: {}", entry->key, e.what());
        emit_warning(std::string("lease operation failed: ") + e.what());
    }
}

void SubscriptionManager::run_actions(
    const std::vector<std::pair<std::shared_ptr<LeaseEntry>, LeaseAction>>& actions) {
    run_parallel(actions.size(), [this, &actions](size_t index) {
        run_action(actions[index].first, actions[index].second);
    });
}

// Runs task(0..count-1) on at most `receiver_threads` workers and waits for all of them
void SubscriptionManager::run_parallel(size_t count, const std::function<void(size_t)>& task) {
    std::atomic<size_t> next{0};
    auto worker = [&next, count, &task] {
        for (size_t index = next.fetch_add(1); index < count; index = next.fetch_add(1)) {
            task(index);
        }
    };

    const size_t workers = std::min(count, static_cast<size_t>(config_.receiver_threads));
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 1; i < workers; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            Logger::warn("SubscriptionManager: cannot start lease worker: {}", e.what());
            break;
        }
    }
    // The calling thread is one of the workers
    worker();
    for (auto& thread : threads) {
        thread.join();
    }
}

bool SubscriptionManager::activate(const std::shared_ptr<LeaseEntry>& entry) {
    run_action(entry, LeaseAction::SUBSCRIBE);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->sub.status == SubscriptionStatus::ACTIVE;
}

void SubscriptionManager::release_lease(const Subscription& subscription, const ServiceSubscription& service) {
    if (subscription.lease_id.empty()) {
        return;
    }
    StreamError error;
    if (!service.unsubscribe(subscription, error)) {
        Logger::debug("SubscriptionManager: unsubscribe of {} ignored: {}", subscription.lease_id, error.describe());
    }
}

void SubscriptionManager::terminate(const std::shared_ptr<LeaseEntry>& entry) {
    Subscription sub;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        sub = entry->sub;
        entry->sub.status = SubscriptionStatus::TERMINATED;
    }
    erase_entry(entry);
    if (is_live(sub.status)) {
        release_lease(sub, entry->service);
    }
}

// Scheduler

void SubscriptionManager::scheduler_loop() {
    Logger::debug("SubscriptionManager: scheduler started (scan every {} ms)", config_.scan_interval.count());

    while (scheduler_running_.load()) {
        try {
            scan_once();
        } catch (const std::exception& e) {
            Logger::error("SubscriptionManager: scheduler error: {}", e.what());
            emit_warning(std::string("scheduler error: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(scheduler_mutex_);
        scheduler_cv_.wait_for(lock, config_.scan_interval, [this] { return !scheduler_running_.load(); });
    }

    Logger::debug("SubscriptionManager: scheduler stopped");
}

void SubscriptionManager::scan_once() {
    const auto now = SteadyClock::now();
    std::vector<std::pair<std::shared_ptr<LeaseEntry>, LeaseAction>> due;

    for (const auto& entry : snapshot_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->in_flight) {
            continue;
        }
        switch (entry->sub.status) {
            case SubscriptionStatus::ACTIVE:
                if (now >= entry->sub.expires_at - effective_margin(entry->sub)) {
                    entry->sub.status = SubscriptionStatus::RENEWING;
                    entry->in_flight = true;
                    due.emplace_back(entry, LeaseAction::RENEW);
                }
                break;
            case SubscriptionStatus::RENEWING:
                if (now >= entry->next_attempt_at) {
                    entry->in_flight = true;
                    due.emplace_back(entry, LeaseAction::RENEW);
                }
                break;
            case SubscriptionStatus::PENDING:
                if (now >= entry->next_attempt_at) {
                    entry->in_flight = true;
                    due.emplace_back(entry, LeaseAction::SUBSCRIBE);
                }
                break;
            case SubscriptionStatus::FAILED:
            case SubscriptionStatus::TERMINATED:
                break;
        }
    }

    if (!due.empty()) {
        Logger::debug("SubscriptionManager: {} leases due", due.size());
        run_actions(due);
    }
}

// Dispatch

void SubscriptionManager::start_dispatch_workers() {
    dispatch_running_.store(true);
    shards_.clear();
    for (uint32_t i = 0; i < config_.dispatch_workers; ++i) {
        shards_.push_back(std::make_unique<DispatchShard>());
    }
    for (auto& shard : shards_) {
        shard->thread = std::thread(&SubscriptionManager::dispatch_loop, this, shard.get());
    }
}

void SubscriptionManager::stop_dispatch_workers() {
    dispatch_running_.store(false);
    for (auto& shard : shards_) {
        {
            std::lock_guard<std::mutex> lock(shard->mutex);
            shard->queue.clear();
        }
        shard->cv.notify_all();
    }
    for (auto& shard : shards_) {
        if (shard->thread.joinable()) {
            shard->thread.join();
        }
    }
    shards_.clear();
}

void SubscriptionManager::enqueue_notification(RawNotification notification) {
    if (!dispatch_running_.load() || shards_.empty()) {
        return;
    }

    // Same lease, same worker: per-lease arrival order is kept
    DispatchShard& shard = *shards_[std::hash<std::string>{}(notification.sid) % shards_.size()];
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (shard.queue.size() >= kMaxQueuedPerShard) {
            shard.queue.pop_front();
            Logger::warn("SubscriptionManager: dispatch queue full, dropped oldest notification");
        }
        shard.queue.push_back(std::move(notification));
    }
    notifications_accepted_.fetch_add(1);
    shard.cv.notify_one();
}

void SubscriptionManager::dispatch_loop(DispatchShard* shard) {
    while (true) {
        RawNotification notification;
        {
            std::unique_lock<std::mutex> lock(shard->mutex);
            shard->cv.wait(lock, [&] { return !dispatch_running_.load() || !shard->queue.empty(); });
            if (!dispatch_running_.load()) {
                return;
            }
            notification = std::move(shard->queue.front());
            shard->queue.pop_front();
        }

        try {
            process_notification(notification);
        } catch (const std::exception& e) {
            Logger::error("SubscriptionManager: failed to process notification for {}: {}", notification.sid,
                          e.what());
            emit_warning(std::string("notification processing failed: ") + e.what());
        }
    }
}

void SubscriptionManager::process_notification(const RawNotification& notification) {
    auto entry = find_by_sid(notification.sid);
    if (!entry) {
        notifications_rejected_.fetch_add(1);
        Logger::debug("SubscriptionManager: lease {} ended before its notification was processed", notification.sid);
        return;
    }

    std::optional<DeviceId> device_id;
    ServiceType type;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->sub.lease_id != notification.sid || !is_live(entry->sub.status)) {
            notifications_rejected_.fetch_add(1);
            return;
        }
        if (entry->last_seq && !sequence_newer(notification.seq, *entry->last_seq)) {
            notifications_duplicate_.fetch_add(1);
            Logger::debug("SubscriptionManager: dropping stale SEQ {} (last {}) for {}", notification.seq,
                          *entry->last_seq, notification.sid);
            return;
        }
        entry->last_seq = notification.seq;
        entry->sub.notifications++;
        device_id = entry->sub.device_id;
        type = entry->sub.service_type;
    }

    std::optional<StateChange> change;
    StreamError error;
    if (!entry->service.parse(device_id, notification.body, notification.received_at, change, error)) {
        parse_failures_.fetch_add(1);
        Logger::warn("SubscriptionManager: unparseable {} notification from {}: {}", to_string(type),
                     device_id ? *device_id : notification.remote_address, error.message);

        SubscriptionFailed diagnostic;
        diagnostic.device_id = device_id;
        diagnostic.service_type = type;
        diagnostic.reason = error.describe();
        diagnostic.fatal = false;
        publish(StateChange(std::move(diagnostic), notification.received_at));
        return;
    }

    if (!change) {
        Logger::trace("SubscriptionManager: {} notification SEQ {} carried no changes", to_string(type),
                      notification.seq);
        return;
    }
    if (stopping_.load()) {
        return;
    }

    cache_.apply(*change);
    publish(std::move(*change));
}

// Events and callbacks

void SubscriptionManager::publish(StateChange change) {
    auto stream = event_stream();
    if (stream->is_closed()) {
        return;
    }

    Logger::trace("SubscriptionManager: publishing {}", describe(change));
    auto result = stream->push(std::move(change));
    if (result == EventStream::PushResult::CLOSED) {
        return;
    }
    events_published_.fetch_add(1);

    if (result == EventStream::PushResult::DROPPED_OLDEST) {
        uint64_t dropped = stream->dropped_count();
        if (dropped == 1 || dropped % kDropWarningInterval == 0) {
            emit_warning("event stream full, " + std::to_string(dropped) + " events dropped so far");
        }
    }
}

void SubscriptionManager::report_failure(const Subscription& subscription, const std::string& reason) {
    Logger::error("SubscriptionManager: {} {} failed after {} attempts: {}",
                  subscription.device_id ? *subscription.device_id : std::string("<network>"),
                  to_string(subscription.service_type), subscription.retry_count, reason);

    SubscriptionFailed failure;
    failure.device_id = subscription.device_id;
    failure.service_type = subscription.service_type;
    failure.reason = reason;
    failure.fatal = true;

    if (!stopping_.load()) {
        publish(StateChange(failure));
    }

    SubscriptionFailedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = subscription_failed_callback_;
    }
    if (callback) {
        callback(failure);
    }
}

void SubscriptionManager::refresh_presence(const DeviceId& device_id) {
    bool live = false;
    for (auto type : {ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME}) {
        auto entry = find_entry(make_key(device_id, type));
        if (!entry) {
            continue;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (is_live(entry->sub.status)) {
            live = true;
            break;
        }
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(presence_mutex_);
        changed = live ? connected_devices_.insert(device_id).second : connected_devices_.erase(device_id) > 0;
    }
    if (!changed) {
        return;
    }

    Logger::info("SubscriptionManager: device {} {}", device_id, live ? "connected" : "disconnected");
    DeviceCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = live ? device_connected_callback_ : device_disconnected_callback_;
    }
    if (callback) {
        callback(device_id);
    }
}

void SubscriptionManager::emit_warning(const std::string& message) {
    Logger::warn("SubscriptionManager: {}", message);
    WarningCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = warning_callback_;
    }
    if (callback) {
        callback(message);
    }
}

std::vector<DeviceId> SubscriptionManager::roster_order() const {
    std::lock_guard<std::mutex> lock(roster_mutex_);
    return roster_order_;
}

bool SubscriptionManager::roster_endpoint(const DeviceId& device_id, Endpoint& endpoint) const {
    std::lock_guard<std::mutex> lock(roster_mutex_);
    auto it = roster_.find(device_id);
    if (it == roster_.end()) {
        return false;
    }
    endpoint = it->second;
    return true;
}

std::vector<ServiceType> SubscriptionManager::per_device_services() const {
    std::vector<ServiceType> out;
    std::lock_guard<std::mutex> lock(roster_mutex_);
    for (auto type : services_) {
        if (scope_of(type) == SubscriptionScope::PER_DEVICE) {
            out.push_back(type);
        }
    }
    return out;
}

bool SubscriptionManager::network_service_enabled() const {
    std::lock_guard<std::mutex> lock(roster_mutex_);
    return std::find(services_.begin(), services_.end(), ServiceType::GROUP_TOPOLOGY) != services_.end();
}

// Short grants renew at half their duration
std::chrono::seconds SubscriptionManager::effective_margin(const Subscription& subscription) const {
    return std::min(config_.renewal_margin, subscription.granted / 2);
}

} // namespace cadence::network
