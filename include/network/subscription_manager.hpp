#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "network_types.hpp"
#include "network/callback_receiver.hpp"
#include "network/event_stream.hpp"
#include "network/event_transport.hpp"
#include "network/service_subscription.hpp"
#include "network/state_cache.hpp"
#include "network/stream_config.hpp"
#include "network/stream_errors.hpp"

namespace cadence::network {

/**
 * Subscription manager for device event leases
 *
 * Owns the lease registry and everything that keeps it current:
 * - initial subscribe for every (device, service) pair and one network-wide
 *   topology lease
 * - a single scheduler thread that renews leases before expiry and retries
 *   failures with exponential backoff
 * - per-pair failure isolation: an exhausted pair becomes Failed, nothing
 *   else changes
 * - validation of inbound notifications and sharded dispatch to the
 *   service parsers, the StateCache and the EventStream
 *
 * Registry locking: the map lock is held only for lookups and inserts; each
 * lease has its own mutex. No lock is held across network I/O.
 */
class SubscriptionManager {
public:
    struct Statistics {
        size_t active_subscriptions = 0;
        size_t pending_subscriptions = 0;
        size_t renewing_subscriptions = 0;
        size_t failed_subscriptions = 0;

        uint64_t notifications_accepted = 0;
        uint64_t notifications_rejected = 0;
        uint64_t notifications_duplicate = 0;
        uint64_t parse_failures = 0;

        uint64_t subscribes_succeeded = 0;
        uint64_t subscribes_failed = 0;
        uint64_t renewals_succeeded = 0;
        uint64_t renewals_failed = 0;

        uint64_t events_published = 0;
        uint64_t events_dropped = 0;
        size_t devices_tracked = 0;
    };

    using DeviceCallback = std::function<void(const DeviceId&)>;
    using SubscriptionFailedCallback = std::function<void(const SubscriptionFailed&)>;
    using WarningCallback = std::function<void(const std::string&)>;
    using StreamCallback = std::function<void()>;

    /**
     * Validates and copies the configuration. Throws ConfigurationError
     * listing every problem. A null transport selects HttpEventTransport.
     */
    explicit SubscriptionManager(const StreamConfig& config,
                                 std::shared_ptr<EventTransport> transport = nullptr);
    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    // Lifecycle
    /**
     * Binds the callback receiver and subscribes every roster device for
     * each PerDevice service, plus one NetworkWide lease. Only receiver
     * failures throw (InitializationFailed); lease failures are retried in
     * the background. An empty service list means the configured services.
     */
    void start(const std::vector<DeviceInfo>& roster,
               const std::vector<ServiceType>& service_types = {},
               std::optional<Topology> initial_topology = std::nullopt);

    /**
     * Best-effort unsubscribe of every live lease, then shuts everything
     * down. No StateChange is published after this returns.
     */
    void stop();
    bool is_running() const { return running_.load(); }

    // Runtime roster changes
    bool add_device(const DeviceId& device_id, const Endpoint& endpoint);
    bool remove_device(const DeviceId& device_id);

    // Explicit (re)subscribe of one pair; revives Failed pairs
    bool subscribe(const DeviceId& device_id, ServiceType type);
    // Deliberate termination of one pair
    bool unsubscribe(const DeviceId& device_id, ServiceType type);
    // Re-subscribes every Failed pair; returns how many became Active
    size_t recover_failed();

    /**
     * Validates a raw notification and queues it for its dispatch worker.
     * Returns false, without side effects, for unknown or inactive leases.
     */
    bool dispatch(RawNotification notification);
    bool is_lease_active(const std::string& sid) const;

    // Queries
    std::vector<Subscription> subscriptions() const;
    std::vector<Subscription> failed_subscriptions() const;
    std::optional<Subscription> subscription(const std::optional<DeviceId>& device_id, ServiceType type) const;

    Statistics statistics() const;
    std::string get_diagnostics_report() const;

    std::string callback_url() const;
    uint16_t callback_port() const;

    std::shared_ptr<EventStream> event_stream() const;
    const StateCache& state_cache() const { return cache_; }
    const StreamConfig& config() const { return config_; }

    // Lifecycle callbacks; register before start()
    void set_device_connected_callback(DeviceCallback callback);
    void set_device_disconnected_callback(DeviceCallback callback);
    void set_subscription_failed_callback(SubscriptionFailedCallback callback);
    void set_warning_callback(WarningCallback callback);
    void set_stream_started_callback(StreamCallback callback);
    void set_stream_stopped_callback(StreamCallback callback);

private:
    enum class LeaseAction {
        SUBSCRIBE,
        RENEW
    };

    struct LeaseEntry {
        LeaseEntry(std::string k, ServiceSubscription s) : key(std::move(k)), service(std::move(s)) {}

        const std::string key;
        const ServiceSubscription service;

        std::mutex mutex;
        Subscription sub;
        std::optional<uint32_t> last_seq;
        SteadyClock::time_point next_attempt_at{};
        bool in_flight = false;
        bool force_resubscribe = false;
        size_t failover_index = 0;
        std::optional<DeviceId> preferred_host;
    };

    struct DispatchShard {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<RawNotification> queue;
        std::thread thread;
    };

    // Registry
    static std::string make_key(const std::optional<DeviceId>& device_id, ServiceType type);
    std::shared_ptr<LeaseEntry> find_entry(const std::string& key) const;
    std::shared_ptr<LeaseEntry> find_by_sid(const std::string& sid) const;
    std::vector<std::shared_ptr<LeaseEntry>> snapshot_entries() const;
    std::shared_ptr<LeaseEntry> create_entry(const std::optional<DeviceId>& device_id, ServiceType type);
    bool index_sid(const std::string& old_sid, const std::string& new_sid, const std::shared_ptr<LeaseEntry>& entry);
    void erase_entry(const std::shared_ptr<LeaseEntry>& entry);

    // Lease operations
    void run_action(const std::shared_ptr<LeaseEntry>& entry, LeaseAction action);
    void run_actions(const std::vector<std::pair<std::shared_ptr<LeaseEntry>, LeaseAction>>& actions);
    void run_parallel(size_t count, const std::function<void(size_t)>& task);
    bool resolve_target(const std::shared_ptr<LeaseEntry>& entry, Endpoint& target, StreamError& error);
    bool activate(const std::shared_ptr<LeaseEntry>& entry);
    void release_lease(const Subscription& subscription, const ServiceSubscription& service);
    void terminate(const std::shared_ptr<LeaseEntry>& entry);

    // Scheduler
    void scheduler_loop();
    void scan_once();

    // Dispatch
    void start_dispatch_workers();
    void stop_dispatch_workers();
    void enqueue_notification(RawNotification notification);
    void dispatch_loop(DispatchShard* shard);
    void process_notification(const RawNotification& notification);

    // Events and callbacks
    void publish(StateChange change);
    void report_failure(const Subscription& subscription, const std::string& reason);
    void refresh_presence(const DeviceId& device_id);
    void emit_warning(const std::string& message);

    std::vector<DeviceId> roster_order() const;
    bool roster_endpoint(const DeviceId& device_id, Endpoint& endpoint) const;
    std::vector<ServiceType> per_device_services() const;
    bool network_service_enabled() const;
    std::chrono::seconds effective_margin(const Subscription& subscription) const;

    // Configuration
    const StreamConfig config_;
    std::shared_ptr<EventTransport> transport_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    mutable std::mutex lifecycle_mutex_;

    // Registry: key -> lease, lease token -> key
    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<LeaseEntry>> leases_;
    std::unordered_map<std::string, std::string> sid_index_;

    // Roster in discovery order; drives NetworkWide fail-over
    mutable std::mutex roster_mutex_;
    std::map<DeviceId, Endpoint> roster_;
    std::vector<DeviceId> roster_order_;
    std::vector<ServiceType> services_;

    std::unique_ptr<CallbackReceiver> receiver_;
    StateCache cache_;
    mutable std::mutex stream_mutex_;
    std::shared_ptr<EventStream> stream_;

    // Scheduler thread
    std::thread scheduler_thread_;
    std::atomic<bool> scheduler_running_{false};
    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;

    // Dispatch workers, sharded by lease token
    std::vector<std::unique_ptr<DispatchShard>> shards_;
    std::atomic<bool> dispatch_running_{false};

    // Devices with at least one live PerDevice lease
    std::mutex presence_mutex_;
    std::unordered_set<DeviceId> connected_devices_;

    // Statistics
    std::atomic<uint64_t> notifications_accepted_{0};
    std::atomic<uint64_t> notifications_rejected_{0};
    std::atomic<uint64_t> notifications_duplicate_{0};
    std::atomic<uint64_t> parse_failures_{0};
    std::atomic<uint64_t> subscribes_succeeded_{0};
    std::atomic<uint64_t> subscribes_failed_{0};
    std::atomic<uint64_t> renewals_succeeded_{0};
    std::atomic<uint64_t> renewals_failed_{0};
    std::atomic<uint64_t> events_published_{0};

    // Event callbacks
    mutable std::mutex callbacks_mutex_;
    DeviceCallback device_connected_callback_;
    DeviceCallback device_disconnected_callback_;
    SubscriptionFailedCallback subscription_failed_callback_;
    WarningCallback warning_callback_;
    StreamCallback stream_started_callback_;
    StreamCallback stream_stopped_callback_;
};

// True if `candidate` follows `last` in GENA SEQ order (serial arithmetic mod 2^32)
bool sequence_newer(uint32_t candidate, uint32_t last);

} // namespace cadence::network
