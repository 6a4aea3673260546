#pragma once

#include "types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace attn {

// Cooldown windows per priority tier, with optional per-event-kind
// overrides. Unknown kinds fall back to the tier's window.
class CooldownTable {
public:
    CooldownTable() {
        tier_windows_[Priority::IMMEDIATE] = std::chrono::hours(4);
        tier_windows_[Priority::BATCHED] = std::chrono::hours(8);
        tier_windows_[Priority::WEEKLY] = std::chrono::hours(24 * 7);
        tier_windows_[Priority::SILENT] = std::chrono::hours(1);
    }

    void set_window(Priority priority, std::chrono::minutes window) {
        tier_windows_[priority] = window;
    }

    void set_event_window(const std::string& event_kind, std::chrono::minutes window) {
        event_windows_[event_kind] = window;
    }

    std::chrono::minutes window(Priority priority, const std::string& event_kind = "") const {
        auto event_it = event_windows_.find(event_kind);
        if (event_it != event_windows_.end()) {
            return event_it->second;
        }
        auto tier_it = tier_windows_.find(priority);
        return tier_it != tier_windows_.end() ? tier_it->second : std::chrono::minutes(0);
    }

private:
    std::map<Priority, std::chrono::minutes> tier_windows_;
    std::unordered_map<std::string, std::chrono::minutes> event_windows_;
};

struct RouterConfig {
    CooldownTable cooldowns;
    std::map<Priority, std::vector<Channel>> channels;

    // Local wall-clock slots, "HH:MM"
    std::vector<std::string> batch_times{"09:00", "13:00", "17:00"};
    int weekly_day = 0; // 0 = Sunday .. 6 = Saturday
    std::string weekly_time = "20:00";

    // Offset of the recipient's wall clock from UTC
    std::chrono::minutes utc_offset{0};

    // Longest a batch or weekly run may hold its tier before another run
    // can take over
    std::chrono::minutes processor_lease{10};

    // Prepended to the primary-chat rendering of immediate items
    std::string immediate_prefix = "[URGENT] ";

    RouterConfig() {
        channels[Priority::IMMEDIATE] = {Channel::PRIMARY_CHAT, Channel::SHORT_MESSAGE};
        channels[Priority::BATCHED] = {Channel::PRIMARY_CHAT};
        channels[Priority::WEEKLY] = {Channel::PRIMARY_CHAT};
        channels[Priority::SILENT] = {Channel::LOG_ONLY};
    }

    std::vector<Channel> channels_for(Priority priority) const {
        auto it = channels.find(priority);
        return it != channels.end() ? it->second : std::vector<Channel>{};
    }

    // Channel recorded on stored notifications and used for digests
    Channel primary_channel_for(Priority priority) const {
        auto list = channels_for(priority);
        if (!list.empty()) {
            return list.front();
        }
        return priority == Priority::SILENT ? Channel::LOG_ONLY : Channel::PRIMARY_CHAT;
    }
};

} // namespace attn
