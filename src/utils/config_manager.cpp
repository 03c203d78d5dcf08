#include "utils/config_manager.hpp"
#include "utils/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cadence {

namespace {

const std::set<std::string> kKnownKeys = {
    "buffer_capacity", "push_timeout_ms", "push_timeout_s",
    "lease_duration_ms", "lease_duration_s", "renewal_margin_ms", "renewal_margin_s",
    "retry_attempts", "backoff_base_ms", "backoff_base_s", "enabled_services",
    "callback_port_start", "callback_port_end", "callback_path", "callback_host",
    "receiver_threads", "max_notification_bytes",
    "request_timeout_ms", "request_timeout_s", "scan_interval_ms", "scan_interval_s",
    "dispatch_workers"};

template<typename T>
void read_unsigned(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
    auto value = it->get<int64_t>();
    if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw std::out_of_range(std::string(key) + " is out of range");
    }
    target = static_cast<T>(value);
}

// No configured duration may exceed the longest lease a device can grant
constexpr int64_t kMaxDurationMs = 86400LL * 1000;

template<typename Duration>
void read_duration(const json& object, const std::string& base, Duration& target) {
    for (const auto& [suffix, to_ms] : {std::make_pair(std::string("_ms"), int64_t{1}),
                                        std::make_pair(std::string("_s"), int64_t{1000})}) {
        auto it = object.find(base + suffix);
        if (it == object.end()) {
            continue;
        }
        if (!it->is_number_integer()) {
            throw std::invalid_argument(base + suffix + " must be an integer");
        }
        auto value = it->template get<int64_t>();
        if (value < 0) {
            throw std::out_of_range(base + suffix + " must not be negative");
        }
        if (value > kMaxDurationMs / to_ms) {
            throw std::out_of_range(base + suffix + " exceeds " + std::to_string(kMaxDurationMs / to_ms));
        }
        target = std::chrono::duration_cast<Duration>(std::chrono::milliseconds(value * to_ms));
    }
}

void read_string(const json& object, const char* key, std::string& target) {
    auto it = object.find(key);
    if (it == object.end()) {
        return;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string(key) + " must be a string");
    }
    target = it->get<std::string>();
}

bool parse_services(const std::vector<std::string>& names, std::vector<ServiceType>& services, std::string& error) {
    services.clear();
    for (const auto& name : names) {
        ServiceType type;
        if (!parse_service_type(name, type)) {
            error = "unknown service type '" + name + "'";
            return false;
        }
        services.push_back(type);
    }
    return true;
}

bool parse_number(const char* text, uint64_t max, uint64_t& value) {
    try {
        size_t consumed = 0;
        std::string input(text);
        unsigned long long parsed = std::stoull(input, &consumed);
        if (consumed != input.size() || parsed > max) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool read_file(const std::string& filePath, std::string& content) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

} // namespace

ConfigManager::ConfigManager() = default;

bool ConfigManager::loadFromFile(const std::string& filePath) {
    std::string content;
    if (!read_file(filePath, content)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastError = "cannot open configuration file " + filePath;
        Logger::error("ConfigManager: {}", m_lastError);
        return false;
    }
    Logger::info("ConfigManager: loading configuration from {}", filePath);
    return loadFromString(content);
}

bool ConfigManager::loadFromString(const std::string& json) {
    network::StreamConfig candidate = getConfiguration();
    std::string error;
    if (!parseConfigurationJson(json, candidate, error)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastError = error;
        m_stats.validationFailures++;
        Logger::error("ConfigManager: {}", error);
        return false;
    }
    return commit(candidate, "json");
}

bool ConfigManager::loadFromEnvironment() {
    network::StreamConfig candidate = getConfiguration();
    std::vector<std::string> errors;
    bool any = false;

    auto number = [&](const char* name, uint64_t max, auto apply) {
        const char* value = std::getenv(name);
        if (!value) {
            return;
        }
        any = true;
        uint64_t parsed = 0;
        if (!parse_number(value, max, parsed)) {
            errors.push_back(std::string(name) + " is not a valid number: '" + value + "'");
            return;
        }
        apply(parsed);
    };

    number("CADENCE_BUFFER_CAPACITY", std::numeric_limits<uint32_t>::max(),
           [&](uint64_t v) { candidate.buffer_capacity = static_cast<size_t>(v); });
    number("CADENCE_LEASE_SECONDS", std::numeric_limits<uint32_t>::max(),
           [&](uint64_t v) { candidate.lease_duration = std::chrono::seconds(v); });
    number("CADENCE_RETRY_ATTEMPTS", std::numeric_limits<uint32_t>::max(),
           [&](uint64_t v) { candidate.retry_attempts = static_cast<uint32_t>(v); });
    number("CADENCE_BACKOFF_MS", std::numeric_limits<uint32_t>::max(),
           [&](uint64_t v) { candidate.backoff_base = std::chrono::milliseconds(v); });
    number("CADENCE_PORT_START", std::numeric_limits<uint16_t>::max(),
           [&](uint64_t v) { candidate.callback_port_start = static_cast<uint16_t>(v); });
    number("CADENCE_PORT_END", std::numeric_limits<uint16_t>::max(),
           [&](uint64_t v) { candidate.callback_port_end = static_cast<uint16_t>(v); });

    if (const char* host = std::getenv("CADENCE_CALLBACK_HOST")) {
        any = true;
        candidate.callback_host = host;
    }

    if (const char* services = std::getenv("CADENCE_SERVICES")) {
        any = true;
        std::vector<std::string> names;
        std::stringstream stream(services);
        std::string name;
        while (std::getline(stream, name, ',')) {
            if (!name.empty()) {
                names.push_back(name);
            }
        }
        std::string error;
        if (!parse_services(names, candidate.enabled_services, error)) {
            errors.push_back("CADENCE_SERVICES: " + error);
        }
    }

    if (!errors.empty()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastError.clear();
        for (const auto& error : errors) {
            m_lastError += (m_lastError.empty() ? "" : "; ") + error;
        }
        m_stats.validationFailures++;
        Logger::error("ConfigManager: environment rejected: {}", m_lastError);
        return false;
    }
    if (!any) {
        return true;
    }
    return commit(candidate, "environment");
}

std::string ConfigManager::saveToString() const {
    network::StreamConfig config = getConfiguration();

    json services = json::array();
    for (auto type : config.enabled_services) {
        services.push_back(to_string(type));
    }

    json document = {
        {"buffer_capacity", config.buffer_capacity},
        {"push_timeout_ms", config.push_timeout.count()},
        {"lease_duration_s", config.lease_duration.count()},
        {"renewal_margin_s", config.renewal_margin.count()},
        {"retry_attempts", config.retry_attempts},
        {"backoff_base_ms", config.backoff_base.count()},
        {"enabled_services", services},
        {"callback_port_start", config.callback_port_start},
        {"callback_port_end", config.callback_port_end},
        {"callback_path", config.callback_path},
        {"callback_host", config.callback_host},
        {"receiver_threads", config.receiver_threads},
        {"max_notification_bytes", config.max_notification_bytes},
        {"request_timeout_ms", config.request_timeout.count()},
        {"scan_interval_ms", config.scan_interval.count()},
        {"dispatch_workers", config.dispatch_workers},
    };
    return document.dump(2);
}

network::StreamConfig ConfigManager::getConfiguration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration;
}

bool ConfigManager::updateConfiguration(const network::StreamConfig& config) {
    return commit(config, "update");
}

std::string ConfigManager::getLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

ConfigManager::ConfigStats ConfigManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

bool ConfigManager::loadRoster(const std::string& filePath, std::vector<DeviceInfo>& roster, std::string& error) {
    std::string content;
    if (!read_file(filePath, content)) {
        error = "cannot open roster file " + filePath;
        return false;
    }
    return parseRoster(content, roster, error);
}

bool ConfigManager::parseRoster(const std::string& text, std::vector<DeviceInfo>& roster, std::string& error) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("roster is not valid JSON: ") + e.what();
        return false;
    }
    if (!document.is_array()) {
        error = "roster must be a JSON array";
        return false;
    }

    std::vector<DeviceInfo> devices;
    for (size_t i = 0; i < document.size(); ++i) {
        const auto& item = document[i];
        const std::string where = "roster entry " + std::to_string(i);
        if (!item.is_object()) {
            error = where + " is not an object";
            return false;
        }

        DeviceInfo device;
        try {
            read_string(item, "id", device.id);
            read_string(item, "host", device.endpoint.host);
            read_unsigned(item, "port", device.endpoint.port);
        } catch (const std::exception& e) {
            error = where + ": " + e.what();
            return false;
        }
        if (device.id.empty() || device.endpoint.host.empty() || device.endpoint.port == 0) {
            error = where + " needs a non-empty id, host and port";
            return false;
        }
        devices.push_back(std::move(device));
    }

    roster = std::move(devices);
    return true;
}

bool ConfigManager::parseConfigurationJson(const std::string& text, network::StreamConfig& config,
                                           std::string& error) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("configuration is not valid JSON: ") + e.what();
        return false;
    }
    if (!document.is_object()) {
        error = "configuration must be a JSON object";
        return false;
    }

    for (const auto& item : document.items()) {
        if (kKnownKeys.find(item.key()) == kKnownKeys.end()) {
            Logger::warn("ConfigManager: ignoring unknown key '{}'", item.key());
        }
    }

    try {
        read_unsigned(document, "buffer_capacity", config.buffer_capacity);
        read_duration(document, "push_timeout", config.push_timeout);
        read_duration(document, "lease_duration", config.lease_duration);
        read_duration(document, "renewal_margin", config.renewal_margin);
        read_unsigned(document, "retry_attempts", config.retry_attempts);
        read_duration(document, "backoff_base", config.backoff_base);

        auto services = document.find("enabled_services");
        if (services != document.end()) {
            if (!services->is_array()) {
                error = "enabled_services must be an array of service names";
                return false;
            }
            if (!parse_services(services->get<std::vector<std::string>>(), config.enabled_services, error)) {
                return false;
            }
        }

        read_unsigned(document, "callback_port_start", config.callback_port_start);
        read_unsigned(document, "callback_port_end", config.callback_port_end);
        read_string(document, "callback_path", config.callback_path);
        read_string(document, "callback_host", config.callback_host);
        read_unsigned(document, "receiver_threads", config.receiver_threads);
        read_unsigned(document, "max_notification_bytes", config.max_notification_bytes);
        read_duration(document, "request_timeout", config.request_timeout);
        read_duration(document, "scan_interval", config.scan_interval);
        read_unsigned(document, "dispatch_workers", config.dispatch_workers);
    } catch (const json::exception& e) {
        error = std::string("configuration has a wrong type: ") + e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    } catch (const std::out_of_range& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool ConfigManager::commit(const network::StreamConfig& candidate, const std::string& source) {
    auto result = network::ConfigValidator::validate(candidate);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!result.isValid) {
        m_lastError = result.summary();
        m_stats.validationFailures++;
        Logger::error("ConfigManager: {} configuration rejected: {}", source, m_lastError);
        return false;
    }
    for (const auto& warning : result.warnings) {
        Logger::warn("ConfigManager: {}", warning);
    }

    m_configuration = candidate;
    m_lastError.clear();
    m_stats.loadCount++;
    m_stats.lastLoad = std::chrono::steady_clock::now();
    Logger::debug("ConfigManager: {} configuration applied", source);
    return true;
}

} // namespace cadence
