#pragma once

#include "channel_adapter.hpp"
#include <gmock/gmock.h>

namespace attn {
namespace testing {

class MockChannelAdapter : public attn::notification::ChannelAdapter {
public:
    explicit MockChannelAdapter(attn::Channel channel) : channel_(channel) {
        ON_CALL(*this, send(::testing::_)).WillByDefault(::testing::Return(true));
    }

    attn::Channel channel() const override { return channel_; }
    std::string name() const override { return "mock_" + attn::channel_to_string(channel_); }
    MOCK_METHOD(bool, send, (const std::string&), (override));

private:
    attn::Channel channel_;
};

} // namespace testing
} // namespace attn
