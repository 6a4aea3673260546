#include "weekly_digest_processor.hpp"
#include "../data/processor_lease.hpp"
#include "../utils/logger.hpp"

namespace attn {

WeeklyDigestProcessor::WeeklyDigestProcessor(NotificationStore* store,
                                             std::shared_ptr<notification::ChannelRegistry> channels,
                                             std::shared_ptr<AuditLog> audit,
                                             const RouterConfig& config)
    : store_(store),
      channels_(std::move(channels)),
      audit_(std::move(audit)),
      channel_(config.primary_channel_for(Priority::WEEKLY)),
      lease_duration_(config.processor_lease) {}

bool WeeklyDigestProcessor::run_weekly(TimePoint now) {
    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        ATTN_LOG_WARN("Weekly run skipped: another weekly run is in progress");
        return false;
    }

    ProcessorLease lease(store_->database(), Priority::WEEKLY, lease_duration_);
    if (!lease.acquire(now)) {
        ATTN_LOG_WARN("Weekly run skipped: another process holds the weekly run lease");
        return false;
    }

    auto pending = store_->pending(Priority::WEEKLY, now);
    if (pending.empty()) {
        ATTN_LOG_INFO("No weekly report due at {}", format_iso8601(now));
        return false;
    }

    if (pending.size() > 1) {
        ATTN_LOG_WARN("{} weekly reports pending; sending only the latest", pending.size());
    }

    // Creation order, so the latest is last
    const Notification& report = pending.back();

    if (!channels_ || !channels_->deliver(channel_, report.message)) {
        ATTN_LOG_ERROR("Weekly report {} delivery failed; it stays pending", report.id);
        if (audit_) {
            audit_->record(now, priority_to_string(Priority::WEEKLY), "weekly_report", report.message, "failed");
        }
        return false;
    }

    std::vector<std::string> ids;
    ids.reserve(pending.size());
    for (const auto& notification : pending) {
        ids.push_back(notification.id);
    }
    try {
        store_->mark_sent(ids, now);
    } catch (const std::exception& e) {
        ATTN_LOG_ERROR("Weekly report {} delivered but marking {} notifications failed: {}",
                       report.id, ids.size(), e.what());
        throw;
    }

    ATTN_LOG_INFO("Sent weekly report {} ({} superseded)", report.id, pending.size() - 1);
    if (audit_) {
        audit_->record(now, priority_to_string(Priority::WEEKLY), "weekly_report", report.message, "sent");
    }
    return true;
}

} // namespace attn
