#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <unordered_map>

#include <fmt/format.h>

namespace cadence {

/**
 * @brief Process-wide logger for the event subsystem
 *
 * Static facade over a single instance. Logging is inert until initialize()
 * is called, so library users and tests opt in explicitly. Messages use
 * fmt-style "{}" placeholders.
 */
class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Critical = 5
    };

    Logger();
    ~Logger();

    // Initialization
    static bool initialize(const std::string& logFile = "",
                           Level minLevel = Level::Info,
                           bool enableConsole = true);
    static void shutdown();
    static bool isInitialized();

    // Configuration
    static void setLevel(Level level);
    static Level getLevel();
    static void setConsoleOutput(bool enable);
    static void setFileOutput(bool enable);
    static void setMaxFileSize(size_t maxSize);
    static void setMaxBackupFiles(size_t maxBackups);

    // Logging methods
    template<typename... Args>
    static void trace(const std::string& format, Args&&... args) {
        log(Level::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(Level::Error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(const std::string& format, Args&&... args) {
        log(Level::Critical, format, std::forward<Args>(args)...);
    }

    // Performance logging
    static void logLatency(const std::string& operation, double latencyMs);

    struct PerformanceMetrics {
        double avgLatency = 0.0;
        double maxLatency = 0.0;
        double minLatency = 0.0;
        uint64_t totalOperations = 0;
        double errorRate = 0.0;
    };

    static void updatePerformanceMetrics(const std::string& operation, double latencyMs, bool success);
    static PerformanceMetrics getPerformanceMetrics(const std::string& operation);
    static void resetPerformanceMetrics();

    static void flush();

private:
    template<typename... Args>
    static void log(Level level, const std::string& format, Args&&... args) {
        if (!s_initialized.load() || level < s_currentLevel.load()) {
            return;
        }

        try {
            std::string body = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
            write(level, body);
        } catch (const std::exception& e) {
            // Avoid recursive logging errors
            std::cerr << "Logger error: " << e.what() << " (format: " << format << ")" << std::endl;
        }
    }

    static void write(Level level, const std::string& body);
    static std::string levelToString(Level level);
    static void writeToConsole(Level level, const std::string& message);
    static void writeToFile(const std::string& message);
    static void rotateLogFile();

    // Instance data
    std::mutex m_mutex;
    std::ofstream m_logFile;
    std::string m_logFilePath;
    size_t m_currentFileSize = 0;
    size_t m_maxFileSize = 10 * 1024 * 1024; // 10MB default
    size_t m_maxBackupFiles = 5;

    struct OperationMetrics {
        double totalLatency = 0.0;
        double maxLatency = 0.0;
        double minLatency = 0.0;
        uint64_t operationCount = 0;
        uint64_t errorCount = 0;
    };

    std::unordered_map<std::string, OperationMetrics> m_metrics;
    mutable std::mutex m_metricsMutex;

    static std::unique_ptr<Logger> s_instance;
    static std::mutex s_lifecycleMutex;
    static std::atomic<Level> s_currentLevel;
    static std::atomic<bool> s_consoleEnabled;
    static std::atomic<bool> s_fileEnabled;
    static std::atomic<bool> s_initialized;
};

#define LOG_LATENCY(op, ms) ::cadence::Logger::logLatency(op, ms)

} // namespace cadence
