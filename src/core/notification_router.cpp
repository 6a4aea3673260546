#include "notification_router.hpp"
#include "exceptions.hpp"
#include "../utils/logger.hpp"

namespace attn {

NotificationRouter::NotificationRouter(DatabaseManager* db,
                                       NotificationStore* store,
                                       DedupLedger* ledger,
                                       std::shared_ptr<notification::ChannelRegistry> channels,
                                       std::shared_ptr<AuditLog> audit,
                                       RouterConfig config,
                                       std::shared_ptr<Clock> clock)
    : db_(db),
      store_(store),
      ledger_(ledger),
      channels_(std::move(channels)),
      audit_(std::move(audit)),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      schedule_(config_) {}

IntakeResult NotificationRouter::intake(Priority priority,
                                        const std::string& message,
                                        const std::string& event_kind,
                                        const std::optional<std::string>& source_entity_id,
                                        const Metadata& metadata) {
    if (event_kind.empty()) {
        throw ValidationError("event_kind must not be empty");
    }

    TimePoint now = clock_->now();
    DedupKey key{event_kind, source_entity_id};

    Notification notification;
    notification.priority = priority;
    notification.channel = config_.primary_channel_for(priority);
    notification.message = message;
    notification.context.event_kind = event_kind;
    notification.context.source_entity_id = source_entity_id;
    notification.context.metadata = metadata;
    notification.created_at = now;

    if (priority == Priority::BATCHED) {
        notification.scheduled_for = schedule_.next_batch_time(now);
    } else if (priority == Priority::WEEKLY) {
        notification.scheduled_for = schedule_.next_weekly_time(now);
    }

    try {
        DatabaseManager::Transaction tx(*db_);

        if (!ledger_->try_claim(priority, key, now)) {
            stats_.suppressed++;
            ATTN_LOG_INFO("{} notification suppressed: {}", priority_to_string(priority), key.to_string());
            audit(now, priority, event_kind, message, "suppressed");
            return IntakeResult::suppressed();
        }

        if (priority == Priority::SILENT) {
            tx.commit();
            stats_.logged++;
            ATTN_LOG_INFO("[silent] {}: {}", key.to_string(), message);
            audit(now, priority, event_kind, message, "logged");
            return IntakeResult::logged();
        }

        notification.id = NotificationStore::generate_id();
        store_->insert(notification);
        tx.commit();
    } catch (const std::exception& e) {
        ATTN_LOG_ERROR("Intake failed for {} {}: {}", priority_to_string(priority), key.to_string(), e.what());
        throw;
    }

    stats_.created++;

    std::string status;
    if (priority == Priority::IMMEDIATE) {
        auto failed = deliver_immediate(notification);

        status = "sent";
        for (Channel channel : failed) {
            status += "," + channel_to_string(channel) + "_failed";
        }

        // Best-effort fan-out: marked sent whatever the channels reported
        TimePoint sent_at = clock_->now();
        try {
            store_->mark_sent({notification.id}, sent_at);
        } catch (const std::exception& e) {
            ATTN_LOG_ERROR("Immediate notification {} delivered but could not be marked sent: {}",
                           notification.id, e.what());
            audit(now, priority, event_kind, message, status + ",mark_failed");
            throw;
        }
        notification.sent_at = sent_at;
        stats_.immediate_sent++;
    } else {
        bool with_date = priority == Priority::WEEKLY;
        status = "queued for " + schedule_.format_local(*notification.scheduled_for, with_date);
    }

    ATTN_LOG_INFO("{} notification {} ({}): {}", priority_to_string(priority), notification.id,
                  key.to_string(), status);
    audit(now, priority, event_kind, message, status);

    return IntakeResult::created(std::move(notification));
}

IntakeResult NotificationRouter::queue_immediate(const std::string& message,
                                                 const std::string& event_kind,
                                                 const std::optional<std::string>& source_entity_id,
                                                 const Metadata& metadata) {
    return intake(Priority::IMMEDIATE, message, event_kind, source_entity_id, metadata);
}

IntakeResult NotificationRouter::queue_batched(const std::string& message,
                                               const std::string& event_kind,
                                               const std::optional<std::string>& source_entity_id,
                                               const Metadata& metadata) {
    return intake(Priority::BATCHED, message, event_kind, source_entity_id, metadata);
}

IntakeResult NotificationRouter::queue_weekly(const std::string& message,
                                              const std::string& event_kind,
                                              const std::optional<std::string>& source_entity_id,
                                              const Metadata& metadata) {
    return intake(Priority::WEEKLY, message, event_kind, source_entity_id, metadata);
}

IntakeResult NotificationRouter::log_silent(const std::string& message,
                                            const std::string& event_kind,
                                            const std::optional<std::string>& source_entity_id,
                                            const Metadata& metadata) {
    return intake(Priority::SILENT, message, event_kind, source_entity_id, metadata);
}

void NotificationRouter::reset_stats() {
    stats_.created = 0;
    stats_.suppressed = 0;
    stats_.logged = 0;
    stats_.immediate_sent = 0;
    stats_.channel_failures = 0;
}

std::vector<Channel> NotificationRouter::deliver_immediate(const Notification& notification) {
    std::vector<Channel> failed;
    for (Channel channel : config_.channels_for(notification.priority)) {
        std::string text = render_for(channel, notification.priority, notification.message);
        if (!channels_ || !channels_->deliver(channel, text)) {
            stats_.channel_failures++;
            failed.push_back(channel);
        }
    }
    return failed;
}

std::string NotificationRouter::render_for(Channel channel, Priority priority, const std::string& message) const {
    if (priority == Priority::IMMEDIATE && channel == Channel::PRIMARY_CHAT) {
        return config_.immediate_prefix + message;
    }
    return message;
}

void NotificationRouter::audit(TimePoint at, Priority priority, const std::string& event_kind,
                               const std::string& message, const std::string& status) {
    if (audit_) {
        audit_->record(at, priority_to_string(priority), event_kind, message, status);
    }
}

} // namespace attn
