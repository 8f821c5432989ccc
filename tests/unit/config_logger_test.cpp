#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include <logger.hpp>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {
std::filesystem::path TempPath(const std::string& suffix) {
    auto base = std::filesystem::temp_directory_path();
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("meetcoord_test_" + suffix + "_" + std::to_string(now));
}
} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_file_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_file_, ec);
        }
    }

    std::filesystem::path WriteTempConfig(const std::string& content) {
        temp_file_ = TempPath("config.json");
        std::ofstream ofs(temp_file_);
        ofs << content;
        ofs.flush();
        return temp_file_;
    }

private:
    std::filesystem::path temp_file_;
};

TEST_F(ConfigLoaderTest, LoadsLoggingConfig) {
    const std::string config_json = R"({
        "logging": {
            "level": "debug",
            "pattern": "[%H:%M:%S] %v",
            "console": false,
            "file": "temp/logs/server.log",
            "integrate_thread_pool_logger": true
        },
        "thread_pool": {
            "config_path": "custom/thread_pool.json"
        }
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = meetcoord::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "[%H:%M:%S] %v");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "temp/logs/server.log");
    EXPECT_TRUE(cfg.logging.integrate_thread_pool_logger);
    EXPECT_EQ(cfg.thread_pool.config_path, "custom/thread_pool.json");
}

TEST_F(ConfigLoaderTest, LoadsMeetingSections) {
    const std::string config_json = R"({
        "server": { "port": 6000, "request_timeout_ms": 1500 },
        "meeting": { "id_length": 10, "default_max_participants": 4, "max_participants_limit": 8 },
        "lifecycle": { "end_when_empty": true, "idle_grace_seconds": 60 },
        "presence": { "outbox_capacity": 32 },
        "chat": { "max_body_length": 500, "max_history_limit": 100 },
        "cache": { "redis": { "enabled": true, "meeting_ttl_seconds": 120 } }
    })";
    auto config_path = WriteTempConfig(config_json);

    auto cfg = meetcoord::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.server.port, 6000);
    EXPECT_EQ(cfg.server.request_timeout_ms, 1500);
    EXPECT_EQ(cfg.meeting.id_length, 10);
    EXPECT_EQ(cfg.meeting.default_max_participants, 4);
    EXPECT_EQ(cfg.meeting.max_participants_limit, 8);
    EXPECT_TRUE(cfg.lifecycle.end_when_empty);
    EXPECT_EQ(cfg.lifecycle.idle_grace_seconds, 60);
    EXPECT_EQ(cfg.presence.outbox_capacity, 32);
    EXPECT_EQ(cfg.chat.max_body_length, 500);
    EXPECT_EQ(cfg.chat.max_history_limit, 100);
    EXPECT_TRUE(cfg.cache.redis.enabled);
    EXPECT_EQ(cfg.cache.redis.meeting_ttl_seconds, 120);
}

// 缺省的段落保留默认值
TEST_F(ConfigLoaderTest, MissingSectionsKeepDefaults) {
    auto config_path = WriteTempConfig("{}");

    auto cfg = meetcoord::common::ConfigLoader::Load(config_path.string());
    EXPECT_EQ(cfg.server.port, 50051);
    EXPECT_EQ(cfg.meeting.default_max_participants, 6);
    EXPECT_EQ(cfg.meeting.id_max_attempts, 5);
    EXPECT_FALSE(cfg.lifecycle.end_when_empty);
    EXPECT_FALSE(cfg.storage.mysql.enabled);
    EXPECT_EQ(cfg.chat.default_history_limit, 50);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(meetcoord::common::ConfigLoader::Load("/nonexistent/meetcoord.json"), std::runtime_error);
}

class LoggerInitTest : public ::testing::Test {
protected:
    void TearDown() override {
        meetcoord::common::ShutdownLogger();
        if (!temp_dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(temp_dir_, ec);
        }
    }

    std::filesystem::path PrepareLogPath(const std::string& filename) {
        temp_dir_ = TempPath("logs");
        return temp_dir_ / "logs" / filename;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(LoggerInitTest, CreatesDirectories) {
    auto log_file = PrepareLogPath("meetcoord.log");

    meetcoord::common::LoggingConfig config;
    config.console = false;
    config.level = "warn";
    config.pattern = "[test] %v";
    config.file = log_file.string();
    config.integrate_thread_pool_logger = true;

    meetcoord::common::InitLogger(config);

    auto logger = meetcoord::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_TRUE(std::filesystem::exists(log_file.parent_path()));

    // 触发一次日志写入，确保文件被创建
    MEETCOORD_LOG_WARN("logger integration test");

    EXPECT_TRUE(std::filesystem::exists(log_file));
    EXPECT_EQ(logger, thread_pool::log::LoadLogger());
}

TEST_F(LoggerInitTest, InvalidLevelFallsBackToInfo) {
    meetcoord::common::LoggingConfig config;
    config.console = false;
    config.level = "not-a-level";

    meetcoord::common::InitLogger(config);

    auto logger = meetcoord::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::info);
}
