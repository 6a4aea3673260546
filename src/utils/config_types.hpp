#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "../core/router_config.hpp"

namespace attn {
namespace config {

std::string get_env_var(const std::string& key, const std::string& default_value = "");

struct AppConfig {
    std::string name = "attn-router";
    std::string log_level = "INFO";
};

struct LoggingConfig {
    std::string file_path = "logs/attn_router.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = true;
};

struct DatabaseConfig {
    std::string path = "data/attn_router.db";
};

struct AuditConfig {
    std::string file_path = "logs/notification_audit.log";
    size_t message_max_length = 200;
};

struct TelegramConfig {
    bool enabled = false;
    std::string bot_token;
    std::string chat_id;
    std::string api_base = "https://api.telegram.org/bot";
    int timeout_seconds = 30;
};

struct SmsConfig {
    bool enabled = false;
    std::string gateway_url;
    std::string api_key;
    std::string to_number;
    size_t max_length = 160;
    int timeout_seconds = 30;
};

void from_json(const nlohmann::json& j, AppConfig& config);
void from_json(const nlohmann::json& j, LoggingConfig& config);
void from_json(const nlohmann::json& j, DatabaseConfig& config);
void from_json(const nlohmann::json& j, AuditConfig& config);
void from_json(const nlohmann::json& j, TelegramConfig& config);
void from_json(const nlohmann::json& j, SmsConfig& config);

// Unknown priorities, channels and malformed durations are reported through
// errors and skipped; the defaults stay in place for them.
void parse_router_config(const nlohmann::json& j, RouterConfig& config, std::vector<std::string>& errors);

} // namespace config
} // namespace attn
