#include "network/stream_config.hpp"

#include <algorithm>
#include <set>

namespace cadence::network {

bool StreamConfig::service_enabled(ServiceType type) const {
    return std::find(enabled_services.begin(), enabled_services.end(), type) != enabled_services.end();
}

std::string ConfigValidator::ValidationResult::summary() const {
    std::string out;
    for (const auto& error : errors) {
        if (!out.empty()) {
            out += "; ";
        }
        out += error;
    }
    return out;
}

ConfigValidator::ValidationResult ConfigValidator::validate(const StreamConfig& config) {
    ValidationResult result;
    auto fail = [&result](std::string message) {
        result.isValid = false;
        result.errors.push_back(std::move(message));
    };

    if (config.buffer_capacity < 1 || config.buffer_capacity > 100000) {
        fail("buffer_capacity must be within 1..100000 (got " + std::to_string(config.buffer_capacity) + ")");
    }
    if (config.push_timeout.count() < 0) {
        fail("push_timeout must not be negative");
    }

    const auto lease = config.lease_duration.count();
    if (lease < 60 || lease > 86400) {
        fail("lease_duration must be within 60..86400 seconds (got " + std::to_string(lease) + ")");
    }
    if (config.renewal_margin.count() < 0 || config.renewal_margin >= config.lease_duration) {
        fail("renewal_margin must be non-negative and shorter than lease_duration");
    } else if (config.renewal_margin < config.scan_interval) {
        result.warnings.push_back("renewal_margin is shorter than scan_interval; renewals may run late");
    }

    if (config.retry_attempts < 1 || config.retry_attempts > 10) {
        fail("retry_attempts must be within 1..10 (got " + std::to_string(config.retry_attempts) + ")");
    }
    if (config.backoff_base.count() <= 0) {
        fail("backoff_base must be positive");
    }

    if (config.enabled_services.empty()) {
        fail("enabled_services must not be empty");
    } else {
        std::set<ServiceType> unique(config.enabled_services.begin(), config.enabled_services.end());
        if (unique.size() != config.enabled_services.size()) {
            result.warnings.push_back("enabled_services lists a service more than once");
        }
    }

    if (config.callback_port_start < 1024) {
        fail("callback port range must start at or above 1024 (got " +
             std::to_string(config.callback_port_start) + ")");
    }
    if (config.callback_port_start > config.callback_port_end) {
        fail("callback port range is empty (" + std::to_string(config.callback_port_start) + ".." +
             std::to_string(config.callback_port_end) + ")");
    }
    if (config.callback_path.empty() || config.callback_path.front() != '/') {
        fail("callback_path must start with '/'");
    }

    if (config.request_timeout.count() <= 0) {
        fail("request_timeout must be positive");
    }
    if (config.scan_interval.count() <= 0) {
        fail("scan_interval must be positive");
    }
    if (config.dispatch_workers < 1 || config.dispatch_workers > 64) {
        fail("dispatch_workers must be within 1..64");
    }
    if (config.receiver_threads < 1 || config.receiver_threads > 64) {
        fail("receiver_threads must be within 1..64");
    }
    if (config.max_notification_bytes == 0) {
        fail("max_notification_bytes must be positive");
    }

    const auto worst_case_retry = config.backoff_base * ((1u << std::min<uint32_t>(config.retry_attempts, 10)) - 1);
    if (config.renewal_margin.count() > 0 &&
        worst_case_retry > std::chrono::duration_cast<std::chrono::milliseconds>(config.renewal_margin)) {
        result.warnings.push_back("retry backoff can outlast renewal_margin; leases may expire before retries finish");
    }

    return result;
}

std::chrono::milliseconds backoff_delay(const StreamConfig& config, uint32_t attempt) {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    const uint32_t shift = std::min<uint32_t>(attempt - 1, 16);
    return config.backoff_base * (1u << shift);
}

} // namespace cadence::network
