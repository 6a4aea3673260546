#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace attn {
namespace config {

class ConfigManager {
public:
    // Missing sections keep their defaults. Returns false when the file
    // cannot be read or is not valid JSON.
    bool load(const std::string& file_path);

    // TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_ID, SMS_GATEWAY_URL, SMS_API_KEY,
    // SMS_TO_NUMBER, ATTN_DB_PATH
    void apply_env_overrides();

    bool validate_config() const;
    const std::vector<std::string>& get_validation_errors() const { return validation_errors_; }

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    DatabaseConfig& get_database_config();
    AuditConfig& get_audit_config();
    RouterConfig& get_router_config();
    TelegramConfig& get_telegram_config();
    SmsConfig& get_sms_config();

private:
    nlohmann::json config_data_;
    AppConfig app_config_;
    LoggingConfig logging_config_;
    DatabaseConfig database_config_;
    AuditConfig audit_config_;
    RouterConfig router_config_;
    TelegramConfig telegram_config_;
    SmsConfig sms_config_;
    std::vector<std::string> validation_errors_;
};

} // namespace config
} // namespace attn
