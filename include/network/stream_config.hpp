#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "network_types.hpp"

namespace cadence::network {

/**
 * Event subsystem configuration
 *
 * Plain value, validated once and copied into the SubscriptionManager at
 * construction. Never mutated afterwards.
 */
struct StreamConfig {
    // Event stream
    size_t buffer_capacity = 1000;
    std::chrono::milliseconds push_timeout{50};

    // Leases
    std::chrono::seconds lease_duration{1800};
    std::chrono::seconds renewal_margin{300};
    uint32_t retry_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::vector<ServiceType> enabled_services = {
        ServiceType::PLAYBACK, ServiceType::RENDERING_VOLUME, ServiceType::GROUP_TOPOLOGY};

    // Callback receiver
    uint16_t callback_port_start = 3400;
    uint16_t callback_port_end = 3500;
    std::string callback_path = "/notify";
    std::string callback_host;  // empty: auto-detect
    uint32_t receiver_threads = 4;
    size_t max_notification_bytes = 1024 * 1024;

    // Scheduling
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds scan_interval{1000};
    uint32_t dispatch_workers = 2;

    bool service_enabled(ServiceType type) const;
};

class ConfigValidator {
public:
    struct ValidationResult {
        bool isValid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        // All errors joined with "; "
        std::string summary() const;
    };

    static ValidationResult validate(const StreamConfig& config);
};

// Backoff delay before retry number `attempt` (1-based): base * 2^(attempt-1)
std::chrono::milliseconds backoff_delay(const StreamConfig& config, uint32_t attempt);

} // namespace cadence::network
