#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "utils/logger.hpp"

using namespace cadence;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "cadence_logger_test.log";
        removeFiles();
    }

    void TearDown() override {
        Logger::shutdown();
        removeFiles();
    }

    void removeFiles() {
        std::remove(path_.c_str());
        for (int i = 1; i <= 3; ++i) {
            std::remove((path_ + "." + std::to_string(i)).c_str());
        }
    }

    std::string contents(const std::string& path) {
        Logger::flush();
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool exists(const std::string& path) {
        std::ifstream file(path);
        return file.good();
    }

    std::string path_;
};

TEST_F(LoggerTest, InertUntilInitialized) {
    EXPECT_FALSE(Logger::isInitialized());
    EXPECT_NO_THROW(Logger::info("nobody listens {}", 1));
    Logger::updatePerformanceMetrics("op", 1.0, true);
    EXPECT_EQ(Logger::getPerformanceMetrics("op").totalOperations, 0u);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    ASSERT_TRUE(Logger::initialize(path_, Logger::Level::Warning, false));
    EXPECT_TRUE(Logger::isInitialized());

    Logger::info("hidden message");
    Logger::warn("lease {} expired", "uuid:1");
    Logger::error("code {}", 412);

    const std::string log = contents(path_);
    EXPECT_EQ(log.find("hidden message"), std::string::npos);
    EXPECT_NE(log.find("[WARN] lease uuid:1 expired"), std::string::npos);
    EXPECT_NE(log.find("[ERROR] code 412"), std::string::npos);

    Logger::setLevel(Logger::Level::Debug);
    EXPECT_EQ(Logger::getLevel(), Logger::Level::Debug);
    Logger::debug("now visible");
    EXPECT_NE(contents(path_).find("now visible"), std::string::npos);
}

TEST_F(LoggerTest, BadFormatIsReportedNotThrown) {
    ASSERT_TRUE(Logger::initialize(path_, Logger::Level::Info, false));
    EXPECT_NO_THROW(Logger::info("{} and {}", "only one"));
    EXPECT_EQ(contents(path_).find("only one"), std::string::npos);
}

TEST_F(LoggerTest, FileOutputCanBeToggled) {
    ASSERT_TRUE(Logger::initialize(path_, Logger::Level::Info, false));
    Logger::setConsoleOutput(false);
    Logger::setFileOutput(false);
    Logger::info("dropped line");
    Logger::setFileOutput(true);
    Logger::info("kept line");

    const std::string log = contents(path_);
    EXPECT_EQ(log.find("dropped line"), std::string::npos);
    EXPECT_NE(log.find("kept line"), std::string::npos);
}

TEST_F(LoggerTest, RotatesWhenFileGrows) {
    ASSERT_TRUE(Logger::initialize(path_, Logger::Level::Info, false));
    Logger::setMaxFileSize(128);
    Logger::setMaxBackupFiles(2);

    for (int i = 0; i < 20; ++i) {
        Logger::info("notification {} processed for RINCON_A", i);
    }
    Logger::flush();

    EXPECT_TRUE(exists(path_ + ".1"));
    EXPECT_TRUE(exists(path_ + ".2"));
    EXPECT_FALSE(exists(path_ + ".3"));
}

TEST_F(LoggerTest, UnwritableFileFailsInitialization) {
    EXPECT_FALSE(Logger::initialize("/nonexistent/dir/cadence.log", Logger::Level::Info, false));
    EXPECT_FALSE(Logger::isInitialized());
}

TEST_F(LoggerTest, LatencyMacroLogsAtDebug) {
    ASSERT_TRUE(Logger::initialize(path_, Logger::Level::Debug, false));
    LOG_LATENCY("SUBSCRIBE", 1.5);
    EXPECT_NE(contents(path_).find("SUBSCRIBE latency: 1.50 ms"), std::string::npos);
}

TEST_F(LoggerTest, PerformanceMetricsAggregate) {
    ASSERT_TRUE(Logger::initialize("", Logger::Level::Info, false));
    Logger::updatePerformanceMetrics("gena.renew", 10.0, true);
    Logger::updatePerformanceMetrics("gena.renew", 30.0, false);
    Logger::updatePerformanceMetrics("gena.renew", 20.0, true);

    auto metrics = Logger::getPerformanceMetrics("gena.renew");
    EXPECT_EQ(metrics.totalOperations, 3u);
    EXPECT_DOUBLE_EQ(metrics.avgLatency, 20.0);
    EXPECT_DOUBLE_EQ(metrics.minLatency, 10.0);
    EXPECT_DOUBLE_EQ(metrics.maxLatency, 30.0);
    EXPECT_NEAR(metrics.errorRate, 1.0 / 3.0, 1e-9);
    EXPECT_EQ(Logger::getPerformanceMetrics("gena.subscribe").totalOperations, 0u);

    Logger::resetPerformanceMetrics();
    EXPECT_EQ(Logger::getPerformanceMetrics("gena.renew").totalOperations, 0u);
}
