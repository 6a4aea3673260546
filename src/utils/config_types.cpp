#include "config_types.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace attn {
namespace config {

std::string get_env_var(const std::string& key, const std::string& default_value) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? default_value : std::string(val);
}

void from_json(const nlohmann::json& j, AppConfig& config) {
    config.name = j.value("name", config.name);
    config.log_level = j.value("log_level", config.log_level);
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
    config.file_path = j.value("file_path", config.file_path);
    config.max_file_size_mb = j.value("max_file_size_mb", config.max_file_size_mb);
    config.max_backup_files = j.value("max_backup_files", config.max_backup_files);
    config.console_output = j.value("console_output", config.console_output);
    config.file_output = j.value("file_output", config.file_output);
}

void from_json(const nlohmann::json& j, DatabaseConfig& config) {
    config.path = j.value("path", config.path);
}

void from_json(const nlohmann::json& j, AuditConfig& config) {
    config.file_path = j.value("file_path", config.file_path);
    config.message_max_length = j.value("message_max_length", config.message_max_length);
}

void from_json(const nlohmann::json& j, TelegramConfig& config) {
    config.enabled = j.value("enabled", config.enabled);
    config.bot_token = j.value("bot_token", config.bot_token);
    config.chat_id = j.value("chat_id", config.chat_id);
    config.api_base = j.value("api_base", config.api_base);
    config.timeout_seconds = j.value("timeout_seconds", config.timeout_seconds);
}

void from_json(const nlohmann::json& j, SmsConfig& config) {
    config.enabled = j.value("enabled", config.enabled);
    config.gateway_url = j.value("gateway_url", config.gateway_url);
    config.api_key = j.value("api_key", config.api_key);
    config.to_number = j.value("to_number", config.to_number);
    config.max_length = j.value("max_length", config.max_length);
    config.timeout_seconds = j.value("timeout_seconds", config.timeout_seconds);
}

namespace {

bool hours_to_minutes(const nlohmann::json& value, std::chrono::minutes& out) {
    if (!value.is_number() || value.get<double>() < 0) {
        return false;
    }
    out = std::chrono::minutes(std::llround(value.get<double>() * 60.0));
    return true;
}

int parse_weekday_name(std::string name) {
    static const std::array<const char*, 7> names{
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};

    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (size_t i = 0; i < names.size(); ++i) {
        if (name == names[i]) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace

void parse_router_config(const nlohmann::json& j, RouterConfig& config, std::vector<std::string>& errors) {
    if (j.contains("cooldown_hours") && j["cooldown_hours"].is_object()) {
        for (auto& [name, value] : j["cooldown_hours"].items()) {
            auto priority = parse_priority(name);
            std::chrono::minutes window{0};
            if (priority.is_error()) {
                errors.push_back("router.cooldown_hours: " + priority.error());
            } else if (!hours_to_minutes(value, window)) {
                errors.push_back("router.cooldown_hours." + name + " must be a non-negative number");
            } else {
                config.cooldowns.set_window(priority.value(), window);
            }
        }
    }

    if (j.contains("event_cooldown_hours") && j["event_cooldown_hours"].is_object()) {
        for (auto& [event_kind, value] : j["event_cooldown_hours"].items()) {
            std::chrono::minutes window{0};
            if (!hours_to_minutes(value, window)) {
                errors.push_back("router.event_cooldown_hours." + event_kind + " must be a non-negative number");
                continue;
            }
            config.cooldowns.set_event_window(event_kind, window);
        }
    }

    if (j.contains("channels") && j["channels"].is_object()) {
        for (auto& [name, list] : j["channels"].items()) {
            auto priority = parse_priority(name);
            if (priority.is_error() || !list.is_array()) {
                errors.push_back("router.channels." + name + " is not a priority with a channel list");
                continue;
            }
            std::vector<Channel> channels;
            for (const auto& entry : list) {
                auto channel = entry.is_string() ? parse_channel(entry.get<std::string>())
                                                 : Result<Channel>::error("channel names must be strings");
                if (channel.is_error()) {
                    errors.push_back("router.channels." + name + ": " + channel.error());
                    continue;
                }
                channels.push_back(channel.value());
            }
            config.channels[priority.value()] = channels;
        }
    }

    if (j.contains("batch_times")) {
        if (j["batch_times"].is_array()) {
            config.batch_times.clear();
            for (const auto& entry : j["batch_times"]) {
                if (entry.is_string()) {
                    config.batch_times.push_back(entry.get<std::string>());
                } else {
                    errors.push_back("router.batch_times entries must be \"HH:MM\" strings");
                }
            }
        } else {
            errors.push_back("router.batch_times must be an array");
        }
    }

    if (j.contains("weekly_day")) {
        const auto& day = j["weekly_day"];
        if (day.is_number_integer()) {
            config.weekly_day = day.get<int>();
        } else if (day.is_string()) {
            config.weekly_day = parse_weekday_name(day.get<std::string>());
        } else {
            config.weekly_day = -1;
        }
        if (config.weekly_day < 0 || config.weekly_day > 6) {
            errors.push_back("router.weekly_day must be 0-6 (0 = Sunday) or a weekday name");
        }
    }

    if (j.contains("weekly_time") && j["weekly_time"].is_string()) {
        config.weekly_time = j["weekly_time"].get<std::string>();
    }

    if (j.contains("utc_offset_minutes") && j["utc_offset_minutes"].is_number_integer()) {
        config.utc_offset = std::chrono::minutes(j["utc_offset_minutes"].get<int>());
    }

    if (j.contains("immediate_prefix") && j["immediate_prefix"].is_string()) {
        config.immediate_prefix = j["immediate_prefix"].get<std::string>();
    }

    if (j.contains("processor_lease_minutes")) {
        if (j["processor_lease_minutes"].is_number_integer() && j["processor_lease_minutes"].get<int>() > 0) {
            config.processor_lease = std::chrono::minutes(j["processor_lease_minutes"].get<int>());
        } else {
            errors.push_back("router.processor_lease_minutes must be a positive integer");
        }
    }
}

} // namespace config
} // namespace attn
