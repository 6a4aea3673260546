#pragma once

#include "core/types.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace attn {
namespace notification {

// Transmits rendered text on one delivery channel. Implementations return
// false when the service rejects a message and throw ChannelError when the
// service cannot be reached; callers treat both as failure.
class ChannelAdapter {
public:
    virtual ~ChannelAdapter() = default;

    virtual Channel channel() const = 0;
    virtual std::string name() const = 0;
    virtual bool send(const std::string& text) = 0;
};

class ChannelRegistry {
public:
    // Replaces any adapter already registered for the same channel
    void register_adapter(std::shared_ptr<ChannelAdapter> adapter);
    void unregister_adapter(Channel channel);

    std::shared_ptr<ChannelAdapter> get(Channel channel) const;
    bool has(Channel channel) const;
    std::vector<Channel> registered_channels() const;

    // Sends through the channel's adapter. A missing adapter, a false return
    // and an exception all count as failure and are logged with the payload.
    bool deliver(Channel channel, const std::string& text) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Channel, std::shared_ptr<ChannelAdapter>> adapters_;
};

} // namespace notification
} // namespace attn
