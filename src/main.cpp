#include <atomic>
#include <chrono>
#include <csignal>
#include <vector>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "network_types.hpp"
#include "network/stream_errors.hpp"
#include "network/subscription_manager.hpp"

#include "utils/config_manager.hpp"
#include "utils/logger.hpp"

using namespace cadence;

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

namespace {

struct Options {
    std::string config_file;
    std::string roster_file;
    std::string log_file;
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config file.json] --roster roster.json [--log file] [--verbose]" << std::endl;
}

bool parse_arguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value" << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!value(options.config_file)) return false;
        } else if (arg == "--roster") {
            if (!value(options.roster_file)) return false;
        } else if (arg == "--log") {
            if (!value(options.log_file)) return false;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return !options.roster_file.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }

    // Setup signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Logger::initialize(options.log_file, options.verbose ? Logger::Level::Debug : Logger::Level::Info);
        Logger::info("cadence-eventd starting");
        Logger::info("Build Date: {}", __DATE__);

        // Load configuration
        ConfigManager config_manager;
        if (!options.config_file.empty() && !config_manager.loadFromFile(options.config_file)) {
            Logger::error("Failed to load configuration: {}", config_manager.getLastError());
            return 1;
        }
        if (!config_manager.loadFromEnvironment()) {
            Logger::error("Invalid environment configuration: {}", config_manager.getLastError());
            return 1;
        }

        std::vector<DeviceInfo> roster;
        std::string error;
        if (!ConfigManager::loadRoster(options.roster_file, roster, error)) {
            Logger::error("Failed to load roster: {}", error);
            return 1;
        }
        Logger::info("Roster: {} devices", roster.size());

        const auto config = config_manager.getConfiguration();
        network::SubscriptionManager manager(config);
        manager.set_subscription_failed_callback([](const SubscriptionFailed& failure) {
            Logger::error("Subscription failed: {} {}: {}", failure.device_id.value_or("<network>"),
                          to_string(failure.service_type), failure.reason);
        });
        manager.set_device_connected_callback([](const DeviceId& id) { Logger::info("Device connected: {}", id); });
        manager.set_device_disconnected_callback(
            [](const DeviceId& id) { Logger::info("Device disconnected: {}", id); });

        manager.start(roster);
        Logger::info("Listening for events at {}", manager.callback_url());
        Logger::info("Press Ctrl+C to stop");

        auto stream = manager.event_stream();
        while (!g_shutdown_requested) {
            auto change = stream->recv_timeout(std::chrono::milliseconds(200));
            if (change) {
                Logger::info("{}", describe(*change));
            } else if (stream->is_closed()) {
                break;
            }
        }

        // Graceful shutdown
        Logger::info("Shutting down gracefully...");
        if (options.verbose) {
            Logger::debug("Final state:\n{}", manager.get_diagnostics_report());
        }
        manager.stop();

        Logger::info("cadence-eventd stopped");
        Logger::shutdown();
        return 0;

    } catch (const network::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const network::InitializationFailed& e) {
        std::cerr << "Initialization failed: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
