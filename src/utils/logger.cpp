#include "logger.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>

namespace cadence {

std::unique_ptr<Logger> Logger::s_instance;
std::mutex Logger::s_lifecycleMutex;
std::atomic<Logger::Level> Logger::s_currentLevel{Logger::Level::Info};
std::atomic<bool> Logger::s_consoleEnabled{true};
std::atomic<bool> Logger::s_fileEnabled{false};
std::atomic<bool> Logger::s_initialized{false};

Logger::Logger() = default;

Logger::~Logger() {
    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool Logger::initialize(const std::string& logFile, Level minLevel, bool enableConsole) {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (s_initialized.load()) {
        return true;
    }

    auto instance = std::make_unique<Logger>();
    if (!logFile.empty()) {
        instance->m_logFile.open(logFile, std::ios::out | std::ios::app);
        if (!instance->m_logFile.is_open()) {
            std::cerr << "Logger: cannot open log file " << logFile << std::endl;
            return false;
        }
        instance->m_logFilePath = logFile;
        instance->m_currentFileSize = static_cast<size_t>(instance->m_logFile.tellp());
    }

    s_instance = std::move(instance);
    s_currentLevel.store(minLevel);
    s_consoleEnabled.store(enableConsole);
    s_fileEnabled.store(!logFile.empty());
    s_initialized.store(true);
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_initialized.load()) {
        return;
    }
    s_initialized.store(false);
    {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        if (s_instance->m_logFile.is_open()) {
            s_instance->m_logFile.flush();
        }
    }
    s_instance.reset();
}

bool Logger::isInitialized() {
    return s_initialized.load();
}

void Logger::setLevel(Level level) {
    s_currentLevel.store(level);
}

Logger::Level Logger::getLevel() {
    return s_currentLevel.load();
}

void Logger::setConsoleOutput(bool enable) {
    s_consoleEnabled.store(enable);
}

void Logger::setFileOutput(bool enable) {
    s_fileEnabled.store(enable);
}

void Logger::setMaxFileSize(size_t maxSize) {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        s_instance->m_maxFileSize = maxSize;
    }
}

void Logger::setMaxBackupFiles(size_t maxBackups) {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (s_instance) {
        std::lock_guard<std::mutex> lock(s_instance->m_mutex);
        s_instance->m_maxBackupFiles = maxBackups;
    }
}

void Logger::write(Level level, const std::string& body) {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_instance) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&time_t, &localTime);

    std::ostringstream ss;
    ss << "[" << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    ss << "[" << levelToString(level) << "] " << body;

    std::lock_guard<std::mutex> lock(s_instance->m_mutex);
    const std::string message = ss.str();

    if (s_consoleEnabled.load()) {
        writeToConsole(level, message);
    }
    if (s_fileEnabled.load() && s_instance->m_logFile.is_open()) {
        writeToFile(message);
    }
}

std::string Logger::levelToString(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

void Logger::writeToConsole(Level level, const std::string& message) {
    if (level >= Level::Warning) {
        std::cerr << message << '\n';
    } else {
        std::cout << message << '\n';
    }
}

void Logger::writeToFile(const std::string& message) {
    s_instance->m_logFile << message << '\n';
    s_instance->m_currentFileSize += message.size() + 1;
    if (s_instance->m_currentFileSize >= s_instance->m_maxFileSize) {
        rotateLogFile();
    }
}

// Caller holds the instance mutex.
void Logger::rotateLogFile() {
    Logger& self = *s_instance;
    self.m_logFile.close();

    for (size_t i = self.m_maxBackupFiles; i > 0; --i) {
        std::string from = i == 1 ? self.m_logFilePath
                                  : self.m_logFilePath + "." + std::to_string(i - 1);
        std::string to = self.m_logFilePath + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }

    self.m_logFile.open(self.m_logFilePath, std::ios::out | std::ios::trunc);
    self.m_currentFileSize = 0;
}

void Logger::logLatency(const std::string& operation, double latencyMs) {
    debug("{} latency: {:.2f} ms", operation, latencyMs);
}

void Logger::updatePerformanceMetrics(const std::string& operation, double latencyMs, bool success) {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_instance) {
        return;
    }

    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    auto& metrics = s_instance->m_metrics[operation];
    if (metrics.operationCount == 0 || latencyMs < metrics.minLatency) {
        metrics.minLatency = latencyMs;
    }
    metrics.maxLatency = std::max(metrics.maxLatency, latencyMs);
    metrics.totalLatency += latencyMs;
    metrics.operationCount++;
    if (!success) {
        metrics.errorCount++;
    }
}

Logger::PerformanceMetrics Logger::getPerformanceMetrics(const std::string& operation) {
    PerformanceMetrics result;
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_instance) {
        return result;
    }

    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    auto it = s_instance->m_metrics.find(operation);
    if (it == s_instance->m_metrics.end() || it->second.operationCount == 0) {
        return result;
    }

    const auto& metrics = it->second;
    result.totalOperations = metrics.operationCount;
    result.avgLatency = metrics.totalLatency / static_cast<double>(metrics.operationCount);
    result.maxLatency = metrics.maxLatency;
    result.minLatency = metrics.minLatency;
    result.errorRate = static_cast<double>(metrics.errorCount) /
                       static_cast<double>(metrics.operationCount);
    return result;
}

void Logger::resetPerformanceMetrics() {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_metricsMutex);
    s_instance->m_metrics.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lifecycle(s_lifecycleMutex);
    if (!s_instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_instance->m_mutex);
    std::cout.flush();
    if (s_instance->m_logFile.is_open()) {
        s_instance->m_logFile.flush();
    }
}

} // namespace cadence
