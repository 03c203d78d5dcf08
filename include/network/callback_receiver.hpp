#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "network_types.hpp"

namespace cadence::network {

// A validated inbound NOTIFY, queued for asynchronous processing
struct RawNotification {
    std::string sid;
    uint32_t seq = 0;
    std::string body;
    SystemClock::time_point received_at{};
    std::string remote_address;
};

/**
 * HTTP listener for GENA NOTIFY callbacks.
 *
 * Binds the first free port of the configured range. Each accepted
 * connection is read, checked and answered by one handler thread; accepted
 * notifications go to the sink before the 200 is written, and nothing
 * downstream runs on the handler thread.
 */
class CallbackReceiver {
public:
    struct Config {
        uint16_t port_start = 3400;
        uint16_t port_end = 3500;
        std::string path = "/notify";
        std::string host;  // empty: detect a non-loopback IPv4 address
        uint32_t handler_threads = 4;
        size_t max_body_bytes = 1024 * 1024;
        std::chrono::milliseconds read_timeout{5000};
    };

    // True if the SID names an Active or Renewing lease
    using LeaseValidator = std::function<bool(const std::string& sid)>;
    // Must only enqueue
    using NotificationSink = std::function<void(RawNotification notification)>;
    using WarningCallback = std::function<void(const std::string& message)>;

    struct Statistics {
        uint64_t connections = 0;
        uint64_t accepted = 0;
        uint64_t rejected = 0;
        uint64_t malformed = 0;
    };

    CallbackReceiver(const Config& config, LeaseValidator validator, NotificationSink sink);
    ~CallbackReceiver();

    CallbackReceiver(const CallbackReceiver&) = delete;
    CallbackReceiver& operator=(const CallbackReceiver&) = delete;

    void set_warning_callback(WarningCallback callback);

    /**
     * Binds and starts serving. Throws InitializationFailed when no port in
     * the range can be bound.
     */
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    uint16_t port() const { return port_; }
    const std::string& host() const { return host_; }
    std::string callback_url() const;
    bool using_fallback_address() const { return fallback_address_; }

    Statistics get_statistics() const;

    /**
     * First non-loopback IPv4 address of an interface that is up. Returns
     * "127.0.0.1" and sets `fallback` when there is none.
     */
    static std::string detect_local_address(bool& fallback);

private:
    void accept_loop();
    void handler_loop();
    void handle_connection(int client_fd, const std::string& remote);
    void emit_warning(const std::string& message);

    Config config_;
    LeaseValidator validator_;
    NotificationSink sink_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::string host_;
    bool fallback_address_ = false;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::vector<std::thread> handler_threads_;

    struct PendingConnection {
        int fd;
        std::string remote;
    };

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::deque<PendingConnection> pending_;

    mutable std::mutex callbacks_mutex_;
    WarningCallback warning_callback_;

    std::atomic<uint64_t> connections_{0};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> malformed_{0};
};

} // namespace cadence::network
