#pragma once

#include "channel_adapter.hpp"

namespace attn {
namespace notification {

// Writes the text to the application log. Never fails.
class LogChannel : public ChannelAdapter {
public:
    Channel channel() const override { return Channel::LOG_ONLY; }
    std::string name() const override { return "log"; }
    bool send(const std::string& text) override;
};

} // namespace notification
} // namespace attn
