#include "sms_channel.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>

namespace attn {
namespace notification {

SmsChannel::SmsChannel(const config::SmsConfig& config)
    : config_(config) {
    if (!is_configured()) {
        ATTN_LOG_WARN("SMS channel created without gateway_url or to_number; sends will fail");
    }
}

bool SmsChannel::is_configured() const {
    return !config_.gateway_url.empty() && !config_.to_number.empty();
}

std::string SmsChannel::truncate(const std::string& text, size_t max_length) {
    if (max_length == 0 || text.size() <= max_length) {
        return text;
    }
    if (max_length <= 3) {
        return text.substr(0, max_length);
    }
    return text.substr(0, max_length - 3) + "...";
}

bool SmsChannel::send(const std::string& text) {
    if (!is_configured()) {
        ATTN_LOG_ERROR("SMS send skipped: gateway_url or to_number not configured");
        failed_count_++;
        return false;
    }

    nlohmann::json payload;
    payload["to"] = config_.to_number;
    payload["body"] = truncate(text, config_.max_length);

    std::vector<std::string> headers;
    if (!config_.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + config_.api_key);
    }

    auto response = post_json(config_.gateway_url,
                              payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                              headers, config_.timeout_seconds);

    if (!response.error_message.empty()) {
        failed_count_++;
        throw ChannelError("sms request failed: " + response.error_message);
    }

    if (!response.ok()) {
        ATTN_LOG_ERROR("SMS gateway rejected message. HTTP {}: {}", response.status_code, response.body);
        failed_count_++;
        return false;
    }

    sent_count_++;
    ATTN_LOG_DEBUG("SMS delivered to {}", config_.to_number);
    return true;
}

} // namespace notification
} // namespace attn
