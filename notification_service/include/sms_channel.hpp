#pragma once

#include "channel_adapter.hpp"
#include "http_post.hpp"
#include "utils/config_types.hpp"
#include <atomic>

namespace attn {
namespace notification {

// Short-message channel posting to an HTTP SMS gateway. Text longer than
// max_length is cut before sending.
class SmsChannel : public ChannelAdapter {
public:
    explicit SmsChannel(const config::SmsConfig& config);

    Channel channel() const override { return Channel::SHORT_MESSAGE; }
    std::string name() const override { return "sms"; }
    bool send(const std::string& text) override;

    bool is_configured() const;

    size_t sent_count() const { return sent_count_.load(); }
    size_t failed_count() const { return failed_count_.load(); }

    static std::string truncate(const std::string& text, size_t max_length);

private:
    CurlGlobal curl_global_;
    config::SmsConfig config_;
    std::atomic<size_t> sent_count_{0};
    std::atomic<size_t> failed_count_{0};
};

} // namespace notification
} // namespace attn
