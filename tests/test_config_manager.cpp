#include "gtest/gtest.h"
#include "utils/config_manager.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = ::testing::TempDir() + "settings_" + info->name() + ".json";
    }

    void TearDown() override {
        std::remove(path.c_str());
        for (const char* name : {"TELEGRAM_BOT_TOKEN", "TELEGRAM_CHAT_ID", "SMS_GATEWAY_URL",
                                 "SMS_API_KEY", "SMS_TO_NUMBER", "ATTN_DB_PATH"}) {
            unsetenv(name);
        }
    }

    void write(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::string path;
    attn::config::ConfigManager config;
};

TEST_F(ConfigManagerTest, MissingFileFailsAndKeepsDefaults) {
    EXPECT_FALSE(config.load(path + ".absent"));
    EXPECT_EQ(config.get_database_config().path, "data/attn_router.db");
    EXPECT_EQ(config.get_router_config().batch_times.size(), 3u);
}

TEST_F(ConfigManagerTest, MalformedJsonFails) {
    write("{ \"router\": [1, 2");
    EXPECT_FALSE(config.load(path));
}

TEST_F(ConfigManagerTest, LoadsAllSections) {
    write(R"({
        "app": {"name": "attn-test", "log_level": "DEBUG"},
        "logging": {"file_path": "logs/test.log", "max_backup_files": 5, "console_output": false},
        "database": {"path": "/tmp/attn_test.db"},
        "audit": {"file_path": "logs/audit_test.log", "message_max_length": 120},
        "router": {
            "cooldown_hours": {"immediate": 2, "batched": 0.5},
            "event_cooldown_hours": {"package_arrival": 24},
            "channels": {"immediate": ["primary_chat"], "batched": ["log_only"]},
            "batch_times": ["08:30", "18:00"],
            "weekly_day": "Friday",
            "weekly_time": "16:00",
            "utc_offset_minutes": -300,
            "immediate_prefix": "!! "
        },
        "telegram": {"enabled": true, "bot_token": "123:abc", "chat_id": "42"},
        "sms": {"enabled": true, "gateway_url": "https://sms.example.com/send", "to_number": "+15550100", "max_length": 140}
    })");

    ASSERT_TRUE(config.load(path));
    EXPECT_TRUE(config.get_validation_errors().empty());
    EXPECT_TRUE(config.validate_config());

    EXPECT_EQ(config.get_app_config().name, "attn-test");
    EXPECT_EQ(config.get_app_config().log_level, "DEBUG");
    EXPECT_EQ(config.get_logging_config().file_path, "logs/test.log");
    EXPECT_EQ(config.get_logging_config().max_backup_files, 5);
    EXPECT_FALSE(config.get_logging_config().console_output);
    EXPECT_EQ(config.get_logging_config().max_file_size_mb, 10);
    EXPECT_EQ(config.get_database_config().path, "/tmp/attn_test.db");
    EXPECT_EQ(config.get_audit_config().message_max_length, 120u);

    const auto& router = config.get_router_config();
    EXPECT_EQ(router.cooldowns.window(attn::Priority::IMMEDIATE), std::chrono::hours(2));
    EXPECT_EQ(router.cooldowns.window(attn::Priority::BATCHED), std::chrono::minutes(30));
    EXPECT_EQ(router.cooldowns.window(attn::Priority::WEEKLY), std::chrono::hours(168));
    EXPECT_EQ(router.cooldowns.window(attn::Priority::IMMEDIATE, "package_arrival"), std::chrono::hours(24));
    EXPECT_EQ(router.channels_for(attn::Priority::IMMEDIATE), std::vector<attn::Channel>{attn::Channel::PRIMARY_CHAT});
    EXPECT_EQ(router.primary_channel_for(attn::Priority::BATCHED), attn::Channel::LOG_ONLY);
    EXPECT_EQ(router.batch_times, (std::vector<std::string>{"08:30", "18:00"}));
    EXPECT_EQ(router.weekly_day, 5);
    EXPECT_EQ(router.weekly_time, "16:00");
    EXPECT_EQ(router.utc_offset, std::chrono::minutes(-300));
    EXPECT_EQ(router.immediate_prefix, "!! ");

    EXPECT_EQ(config.get_telegram_config().bot_token, "123:abc");
    EXPECT_EQ(config.get_telegram_config().api_base, "https://api.telegram.org/bot");
    EXPECT_EQ(config.get_sms_config().max_length, 140u);
}

TEST_F(ConfigManagerTest, InvalidRouterEntriesAreReported) {
    write(R"({
        "router": {
            "cooldown_hours": {"urgent": 1, "batched": -2},
            "channels": {"immediate": ["carrier_pigeon", "primary_chat"]},
            "batch_times": ["09:00", "25:00"],
            "weekly_day": "someday"
        }
    })");

    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get_validation_errors().size(), 4u);
    EXPECT_FALSE(config.validate_config());

    const auto& router = config.get_router_config();
    EXPECT_EQ(router.cooldowns.window(attn::Priority::BATCHED), std::chrono::hours(8));
    EXPECT_EQ(router.channels_for(attn::Priority::IMMEDIATE), std::vector<attn::Channel>{attn::Channel::PRIMARY_CHAT});
    EXPECT_EQ(router.weekly_day, -1);
}

TEST_F(ConfigManagerTest, EnabledChannelWithoutCredentialsFailsValidation) {
    write(R"({"telegram": {"enabled": true}})");
    ASSERT_TRUE(config.load(path));
    EXPECT_FALSE(config.validate_config());
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    write(R"({"telegram": {"enabled": true, "bot_token": "file-token", "chat_id": "1"}})");
    ASSERT_TRUE(config.load(path));

    setenv("TELEGRAM_BOT_TOKEN", "env-token", 1);
    setenv("SMS_TO_NUMBER", "+15550199", 1);
    setenv("ATTN_DB_PATH", "/var/lib/attn/router.db", 1);
    config.apply_env_overrides();

    EXPECT_EQ(config.get_telegram_config().bot_token, "env-token");
    EXPECT_EQ(config.get_telegram_config().chat_id, "1");
    EXPECT_EQ(config.get_sms_config().to_number, "+15550199");
    EXPECT_EQ(config.get_database_config().path, "/var/lib/attn/router.db");
}
