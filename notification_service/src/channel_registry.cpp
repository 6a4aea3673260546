#include "channel_adapter.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <mutex>

namespace attn {
namespace notification {

namespace {

constexpr size_t kLoggedPayloadLength = 200;

} // namespace

void ChannelRegistry::register_adapter(std::shared_ptr<ChannelAdapter> adapter) {
    if (!adapter) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Channel channel = adapter->channel();
    ATTN_LOG_DEBUG("Registered {} adapter for channel {}", adapter->name(), channel_to_string(channel));
    adapters_[channel] = std::move(adapter);
}

void ChannelRegistry::unregister_adapter(Channel channel) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    adapters_.erase(channel);
}

std::shared_ptr<ChannelAdapter> ChannelRegistry::get(Channel channel) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = adapters_.find(channel);
    return it != adapters_.end() ? it->second : nullptr;
}

bool ChannelRegistry::has(Channel channel) const {
    return get(channel) != nullptr;
}

std::vector<Channel> ChannelRegistry::registered_channels() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Channel> channels;
    channels.reserve(adapters_.size());
    for (const auto& entry : adapters_) {
        channels.push_back(entry.first);
    }
    return channels;
}

bool ChannelRegistry::deliver(Channel channel, const std::string& text) const {
    auto adapter = get(channel);
    if (!adapter) {
        ATTN_LOG_WARN("No adapter registered for channel {}; dropping: {}",
                      channel_to_string(channel), text.substr(0, kLoggedPayloadLength));
        return false;
    }

    bool delivered = false;
    try {
        delivered = adapter->send(text);
    } catch (const ChannelError& e) {
        ATTN_LOG_ERROR("{} could not reach its service: {}", adapter->name(), e.what());
        delivered = false;
    } catch (const std::exception& e) {
        ATTN_LOG_ERROR("{} adapter threw during send: {}", adapter->name(), e.what());
        delivered = false;
    }

    if (!delivered) {
        ATTN_LOG_ERROR("Delivery via {} ({}) failed: {}", adapter->name(),
                       channel_to_string(channel), text.substr(0, kLoggedPayloadLength));
    }
    return delivered;
}

} // namespace notification
} // namespace attn
