#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "channel_adapter.hpp"
#include "core/exceptions.hpp"
#include "log_channel.hpp"
#include "sms_channel.hpp"
#include "telegram_channel.hpp"
#include "mocks/mock_channel_adapter.hpp"
#include <nlohmann/json.hpp>

using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

TEST(ChannelRegistryTest, DeliversThroughRegisteredAdapter) {
    auto adapter = std::make_shared<NiceMock<attn::testing::MockChannelAdapter>>(attn::Channel::PRIMARY_CHAT);
    attn::notification::ChannelRegistry registry;
    registry.register_adapter(adapter);

    EXPECT_CALL(*adapter, send("hello")).WillOnce(Return(true));
    EXPECT_TRUE(registry.has(attn::Channel::PRIMARY_CHAT));
    EXPECT_TRUE(registry.deliver(attn::Channel::PRIMARY_CHAT, "hello"));
}

TEST(ChannelRegistryTest, MissingAdapterFails) {
    attn::notification::ChannelRegistry registry;
    EXPECT_FALSE(registry.has(attn::Channel::SHORT_MESSAGE));
    EXPECT_FALSE(registry.deliver(attn::Channel::SHORT_MESSAGE, "hello"));
}

TEST(ChannelRegistryTest, FalseOrThrowCountsAsFailure) {
    auto adapter = std::make_shared<NiceMock<attn::testing::MockChannelAdapter>>(attn::Channel::SHORT_MESSAGE);
    attn::notification::ChannelRegistry registry;
    registry.register_adapter(adapter);

    EXPECT_CALL(*adapter, send(_))
        .WillOnce(Return(false))
        .WillOnce(Throw(std::runtime_error("gateway timeout")));
    EXPECT_FALSE(registry.deliver(attn::Channel::SHORT_MESSAGE, "a"));
    EXPECT_FALSE(registry.deliver(attn::Channel::SHORT_MESSAGE, "b"));
}

TEST(ChannelRegistryTest, UnreachableServiceCountsAsFailure) {
    auto adapter = std::make_shared<NiceMock<attn::testing::MockChannelAdapter>>(attn::Channel::PRIMARY_CHAT);
    attn::notification::ChannelRegistry registry;
    registry.register_adapter(adapter);

    EXPECT_CALL(*adapter, send(_)).WillOnce(Throw(attn::ChannelError("connection refused")));
    EXPECT_FALSE(registry.deliver(attn::Channel::PRIMARY_CHAT, "a"));
}

TEST(ChannelRegistryTest, RegisteringAgainReplacesAdapter) {
    auto first = std::make_shared<NiceMock<attn::testing::MockChannelAdapter>>(attn::Channel::PRIMARY_CHAT);
    auto second = std::make_shared<NiceMock<attn::testing::MockChannelAdapter>>(attn::Channel::PRIMARY_CHAT);
    attn::notification::ChannelRegistry registry;
    registry.register_adapter(first);
    registry.register_adapter(second);

    EXPECT_CALL(*first, send(_)).Times(0);
    EXPECT_CALL(*second, send("x")).WillOnce(Return(true));
    EXPECT_TRUE(registry.deliver(attn::Channel::PRIMARY_CHAT, "x"));
    EXPECT_EQ(registry.registered_channels().size(), 1u);
}

TEST(LogChannelTest, AlwaysSucceeds) {
    attn::notification::LogChannel channel;
    EXPECT_EQ(channel.channel(), attn::Channel::LOG_ONLY);
    EXPECT_TRUE(channel.send("nightly scan finished"));
}

TEST(TelegramChannelTest, PayloadCarriesChatAndText) {
    auto payload = nlohmann::json::parse(
        attn::notification::TelegramChannel::build_payload("42", "[URGENT] \"quoted\" text"));
    EXPECT_EQ(payload["chat_id"], "42");
    EXPECT_EQ(payload["text"], "[URGENT] \"quoted\" text");
}

TEST(TelegramChannelTest, SuccessNeedsHttp200AndOkTrue) {
    using attn::notification::TelegramChannel;
    EXPECT_TRUE(TelegramChannel::is_success_response(200, R"({"ok":true,"result":{}})"));
    EXPECT_FALSE(TelegramChannel::is_success_response(200, R"({"ok":false})"));
    EXPECT_FALSE(TelegramChannel::is_success_response(200, "not json"));
    EXPECT_FALSE(TelegramChannel::is_success_response(401, R"({"ok":true})"));
}

TEST(TelegramChannelTest, UnconfiguredChannelFailsWithoutSending) {
    attn::config::TelegramConfig config;
    attn::notification::TelegramChannel channel(config);
    EXPECT_FALSE(channel.is_configured());
    EXPECT_FALSE(channel.send("hello"));
    EXPECT_EQ(channel.failed_count(), 1u);
}

TEST(SmsChannelTest, TruncatesToMaxLength) {
    using attn::notification::SmsChannel;
    std::string long_text(200, 'x');

    auto cut = SmsChannel::truncate(long_text, 160);
    EXPECT_EQ(cut.size(), 160u);
    EXPECT_EQ(cut.substr(157), "...");
    EXPECT_EQ(SmsChannel::truncate("short", 160), "short");
    EXPECT_EQ(SmsChannel::truncate(long_text, 0), long_text);
}

TEST(SmsChannelTest, UnconfiguredChannelFailsWithoutSending) {
    attn::config::SmsConfig config;
    attn::notification::SmsChannel channel(config);
    EXPECT_EQ(channel.channel(), attn::Channel::SHORT_MESSAGE);
    EXPECT_FALSE(channel.send("hello"));
    EXPECT_EQ(channel.failed_count(), 1u);
}

TEST(SmsChannelTest, UnreachableGatewayThrowsChannelError) {
    attn::config::SmsConfig config;
    config.gateway_url = "http://127.0.0.1:1/messages";
    config.to_number = "+15550100";
    config.timeout_seconds = 2;
    auto channel = std::make_shared<attn::notification::SmsChannel>(config);

    EXPECT_THROW(channel->send("hello"), attn::ChannelError);
    EXPECT_EQ(channel->failed_count(), 1u);

    attn::notification::ChannelRegistry registry;
    registry.register_adapter(channel);
    EXPECT_FALSE(registry.deliver(attn::Channel::SHORT_MESSAGE, "hello"));
    EXPECT_EQ(channel->failed_count(), 2u);
}

TEST(TelegramChannelTest, UnreachableApiThrowsChannelError) {
    attn::config::TelegramConfig config;
    config.bot_token = "123:abc";
    config.chat_id = "42";
    config.api_base = "http://127.0.0.1:1/bot";
    config.timeout_seconds = 2;
    attn::notification::TelegramChannel channel(config);

    EXPECT_THROW(channel.send("hello"), attn::ChannelError);
    EXPECT_EQ(channel.sent_count(), 0u);
}
