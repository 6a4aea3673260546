#include "config_manager.hpp"
#include <fstream>
#include "logger.hpp"
#include "../core/schedule_calculator.hpp"

namespace attn {
namespace config {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        ATTN_LOG_ERROR("Failed to open config file: {}", file_path);
        return false;
    }

    validation_errors_.clear();
    try {
        file >> config_data_;

        if (config_data_.contains("app")) {
            config_data_["app"].get_to(app_config_);
        }
        if (config_data_.contains("logging")) {
            config_data_["logging"].get_to(logging_config_);
        }
        if (config_data_.contains("database")) {
            config_data_["database"].get_to(database_config_);
        }
        if (config_data_.contains("audit")) {
            config_data_["audit"].get_to(audit_config_);
        }
        if (config_data_.contains("router")) {
            parse_router_config(config_data_["router"], router_config_, validation_errors_);
        }
        if (config_data_.contains("telegram")) {
            config_data_["telegram"].get_to(telegram_config_);
        }
        if (config_data_.contains("sms")) {
            config_data_["sms"].get_to(sms_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        ATTN_LOG_ERROR("Error parsing config file {}: {}", file_path, e.what());
        return false;
    }

    for (const auto& error : validation_errors_) {
        ATTN_LOG_WARN("Config: {}", error);
    }
    return true;
}

void ConfigManager::apply_env_overrides() {
    telegram_config_.bot_token = get_env_var("TELEGRAM_BOT_TOKEN", telegram_config_.bot_token);
    telegram_config_.chat_id = get_env_var("TELEGRAM_CHAT_ID", telegram_config_.chat_id);
    sms_config_.gateway_url = get_env_var("SMS_GATEWAY_URL", sms_config_.gateway_url);
    sms_config_.api_key = get_env_var("SMS_API_KEY", sms_config_.api_key);
    sms_config_.to_number = get_env_var("SMS_TO_NUMBER", sms_config_.to_number);
    database_config_.path = get_env_var("ATTN_DB_PATH", database_config_.path);
}

bool ConfigManager::validate_config() const {
    bool valid = validation_errors_.empty();

    if (database_config_.path.empty()) {
        ATTN_LOG_ERROR("Config: database.path is empty");
        valid = false;
    }

    for (const auto& time_str : router_config_.batch_times) {
        auto parsed = schedule_utils::parse_time_of_day(time_str);
        if (parsed.is_error()) {
            ATTN_LOG_WARN("Config: router.batch_times: {}", parsed.error());
            valid = false;
        }
    }

    if (telegram_config_.enabled && (telegram_config_.bot_token.empty() || telegram_config_.chat_id.empty())) {
        ATTN_LOG_WARN("Config: telegram is enabled but bot_token or chat_id is missing");
        valid = false;
    }

    if (sms_config_.enabled && (sms_config_.gateway_url.empty() || sms_config_.to_number.empty())) {
        ATTN_LOG_WARN("Config: sms is enabled but gateway_url or to_number is missing");
        valid = false;
    }

    return valid;
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

DatabaseConfig& ConfigManager::get_database_config() {
    return database_config_;
}

AuditConfig& ConfigManager::get_audit_config() {
    return audit_config_;
}

RouterConfig& ConfigManager::get_router_config() {
    return router_config_;
}

TelegramConfig& ConfigManager::get_telegram_config() {
    return telegram_config_;
}

SmsConfig& ConfigManager::get_sms_config() {
    return sms_config_;
}

} // namespace config
} // namespace attn
