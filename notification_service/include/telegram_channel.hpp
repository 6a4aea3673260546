#pragma once

#include "channel_adapter.hpp"
#include "http_post.hpp"
#include "utils/config_types.hpp"
#include <atomic>

namespace attn {
namespace notification {

// Primary chat channel backed by the Telegram Bot API sendMessage call
class TelegramChannel : public ChannelAdapter {
public:
    explicit TelegramChannel(const config::TelegramConfig& config);

    Channel channel() const override { return Channel::PRIMARY_CHAT; }
    std::string name() const override { return "telegram"; }
    bool send(const std::string& text) override;

    bool is_configured() const;

    size_t sent_count() const { return sent_count_.load(); }
    size_t failed_count() const { return failed_count_.load(); }

    // {"chat_id": ..., "text": ...}
    static std::string build_payload(const std::string& chat_id, const std::string& text);

    // Telegram answers HTTP 200 with {"ok": true, ...} on success
    static bool is_success_response(long status_code, const std::string& body);

private:
    CurlGlobal curl_global_;
    config::TelegramConfig config_;
    std::atomic<size_t> sent_count_{0};
    std::atomic<size_t> failed_count_{0};
};

} // namespace notification
} // namespace attn
