#pragma once

#include "result.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace attn {

using TimePoint = std::chrono::system_clock::time_point;
using Metadata = std::unordered_map<std::string, std::string>;

enum class Priority {
    IMMEDIATE,
    BATCHED,
    WEEKLY,
    SILENT
};

enum class Channel {
    PRIMARY_CHAT,
    SHORT_MESSAGE,
    LOG_ONLY
};

enum class IntakeOutcome {
    CREATED,
    SUPPRESSED,
    LOGGED
};

// Identifies "the same situation". A missing source id makes the key
// type-wide; it only matches other type-wide keys of the same kind.
struct DedupKey {
    std::string event_kind;
    std::optional<std::string> source_entity_id;

    bool operator==(const DedupKey& other) const {
        return event_kind == other.event_kind && source_entity_id == other.source_entity_id;
    }

    std::string to_string() const;
};

// Opaque payload carried with a notification. Used for dedup and digest
// grouping only.
struct NotificationContext {
    std::string event_kind;
    std::optional<std::string> source_entity_id;
    Metadata metadata;

    DedupKey dedup_key() const {
        return DedupKey{event_kind, source_entity_id};
    }

    std::string to_json() const;
    static NotificationContext from_json(const std::string& json_str);
};

struct Notification {
    std::string id;
    Priority priority = Priority::BATCHED;
    Channel channel = Channel::PRIMARY_CHAT;
    std::string message;
    NotificationContext context;
    std::optional<TimePoint> scheduled_for;
    std::optional<TimePoint> sent_at;
    TimePoint created_at;

    bool is_pending() const { return !sent_at.has_value(); }
};

struct IntakeResult {
    IntakeOutcome outcome = IntakeOutcome::SUPPRESSED;
    std::optional<Notification> notification;

    static IntakeResult created(Notification notification) {
        IntakeResult result;
        result.outcome = IntakeOutcome::CREATED;
        result.notification = std::move(notification);
        return result;
    }

    static IntakeResult suppressed() {
        IntakeResult result;
        result.outcome = IntakeOutcome::SUPPRESSED;
        return result;
    }

    static IntakeResult logged() {
        IntakeResult result;
        result.outcome = IntakeOutcome::LOGGED;
        return result;
    }

    bool is_created() const { return outcome == IntakeOutcome::CREATED; }
    bool is_suppressed() const { return outcome == IntakeOutcome::SUPPRESSED; }
    bool is_logged() const { return outcome == IntakeOutcome::LOGGED; }
};

std::string priority_to_string(Priority priority);
Result<Priority> parse_priority(const std::string& priority_str);

std::string channel_to_string(Channel channel);
Result<Channel> parse_channel(const std::string& channel_str);

std::string outcome_to_string(IntakeOutcome outcome);

// Storage representation: milliseconds since the Unix epoch
int64_t to_epoch_millis(TimePoint time_point);
TimePoint from_epoch_millis(int64_t millis);

// ISO-8601 in UTC, e.g. 2026-10-19T13:00:00.000Z
std::string format_iso8601(TimePoint time_point);

} // namespace attn
