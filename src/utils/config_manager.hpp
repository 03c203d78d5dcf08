#pragma once

#include "network_types.hpp"
#include "network/stream_config.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace cadence {

/**
 * @brief Loads the event subsystem configuration and the device roster
 *
 * Sources are layered: defaults, then a JSON file or string, then
 * CADENCE_* environment variables. Every load is validated as a whole; a
 * rejected load leaves the current configuration untouched.
 *
 * JSON keys are the StreamConfig field names. Durations take an "_ms" or
 * "_s" suffix ("lease_duration_s": 1800, "push_timeout_ms": 50).
 */
class ConfigManager {
public:
    ConfigManager();

    // Configuration loading
    bool loadFromFile(const std::string& filePath);
    bool loadFromString(const std::string& json);
    bool loadFromEnvironment();

    std::string saveToString() const;

    // Configuration access
    network::StreamConfig getConfiguration() const;
    bool updateConfiguration(const network::StreamConfig& config);
    std::string getLastError() const;

    struct ConfigStats {
        uint64_t loadCount = 0;
        uint64_t validationFailures = 0;
        std::chrono::steady_clock::time_point lastLoad;
    };

    ConfigStats getStatistics() const;

    // Roster: [{"id": "...", "host": "...", "port": 1400}, ...]
    static bool loadRoster(const std::string& filePath, std::vector<DeviceInfo>& roster, std::string& error);
    static bool parseRoster(const std::string& json, std::vector<DeviceInfo>& roster, std::string& error);

private:
    bool parseConfigurationJson(const std::string& json, network::StreamConfig& config, std::string& error) const;
    bool commit(const network::StreamConfig& candidate, const std::string& source);

    mutable std::mutex m_mutex;
    network::StreamConfig m_configuration;
    std::string m_lastError;
    ConfigStats m_stats;
};

} // namespace cadence
