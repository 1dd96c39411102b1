#include <gtest/gtest.h>
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include <filesystem>

using namespace fedtrust::core;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove(log_file_);
    }
    
    std::string read_log() {
        Logger::get()->flush();
        auto content = utils::FileUtils::read_file(log_file_);
        EXPECT_TRUE(content.has_value());
        return content.value_or("");
    }
    
    std::string log_file_ = (std::filesystem::temp_directory_path() / "fedtrust_test.log").string();
};

TEST_F(LoggerTest, FileKeepsDebugDetail) {
    Logger::initialize(log_file_, LogLevel::Warn);
    
    LOG_TRACE("resolver trace {}", 1);
    LOG_DEBUG("fetched keys for {}", "example.org");
    LOG_WARN("backing off {}", "evil.org");
    
    auto content = read_log();
    EXPECT_EQ(content.find("resolver trace"), std::string::npos);
    EXPECT_NE(content.find("fetched keys for example.org"), std::string::npos);
    EXPECT_NE(content.find("[warning] "), std::string::npos);
    EXPECT_NE(content.find("backing off evil.org"), std::string::npos);
}

TEST_F(LoggerTest, TraceReachesFileWhenRequested) {
    Logger::initialize(log_file_, LogLevel::Trace);
    
    LOG_TRACE("canonical form {}", "{}");
    
    EXPECT_NE(read_log().find("canonical form {}"), std::string::npos);
}

TEST_F(LoggerTest, ConsoleOnlyWithoutFile) {
    LogOptions options;
    options.level = LogLevel::Error;
    Logger::initialize(options);
    
    LOG_ERROR("no file sink");
    EXPECT_FALSE(std::filesystem::exists(log_file_));
    EXPECT_EQ(Logger::get()->level(), spdlog::level::err);
}

TEST_F(LoggerTest, OptionsFromConfig) {
    Config config;
    config.set("log.level", "DEBUG");
    config.set("log.file", "/var/log/fedtrust.log");
    config.set("log.max_size_kb", "64");
    config.set("log.max_files", "0");
    
    auto options = LogOptions::from_config(config);
    EXPECT_EQ(options.level, LogLevel::Debug);
    EXPECT_EQ(options.file, "/var/log/fedtrust.log");
    EXPECT_EQ(options.max_file_size, 64u * 1024);
    EXPECT_EQ(options.max_files, 3u);
    
    EXPECT_TRUE(LogOptions::from_config(Config()).file.empty());
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("Error"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("chatty"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("chatty", LogLevel::Trace), LogLevel::Trace);
    
    EXPECT_EQ(Logger::level_name(LogLevel::Info), "info");
}

TEST_F(LoggerTest, UsableBeforeInitialize) {
    EXPECT_NE(Logger::get(), nullptr);
    LOG_INFO("Logged before initialize");
}
