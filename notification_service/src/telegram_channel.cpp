#include "telegram_channel.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>

namespace attn {
namespace notification {

TelegramChannel::TelegramChannel(const config::TelegramConfig& config)
    : config_(config) {
    if (!is_configured()) {
        ATTN_LOG_WARN("Telegram channel created without bot_token or chat_id; sends will fail");
    }
}

bool TelegramChannel::is_configured() const {
    return !config_.bot_token.empty() && !config_.chat_id.empty();
}

std::string TelegramChannel::build_payload(const std::string& chat_id, const std::string& text) {
    nlohmann::json payload;
    payload["chat_id"] = chat_id;
    payload["text"] = text;
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool TelegramChannel::is_success_response(long status_code, const std::string& body) {
    if (status_code != 200) {
        return false;
    }
    auto response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return false;
    }
    return response.value("ok", false);
}

bool TelegramChannel::send(const std::string& text) {
    if (!is_configured()) {
        ATTN_LOG_ERROR("Telegram send skipped: bot_token or chat_id not configured");
        failed_count_++;
        return false;
    }

    std::string url = config_.api_base + config_.bot_token + "/sendMessage";
    auto response = post_json(url, build_payload(config_.chat_id, text), {}, config_.timeout_seconds);

    if (!response.error_message.empty()) {
        failed_count_++;
        throw ChannelError("telegram request failed: " + response.error_message);
    }

    if (!is_success_response(response.status_code, response.body)) {
        ATTN_LOG_ERROR("Telegram API rejected message. HTTP {}: {}", response.status_code, response.body);
        failed_count_++;
        return false;
    }

    sent_count_++;
    ATTN_LOG_DEBUG("Telegram message delivered ({} chars)", text.size());
    return true;
}

} // namespace notification
} // namespace attn
