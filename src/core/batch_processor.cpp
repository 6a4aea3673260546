#include "batch_processor.hpp"
#include "digest_formatter.hpp"
#include "../data/processor_lease.hpp"
#include "../utils/logger.hpp"

namespace attn {

BatchProcessor::BatchProcessor(NotificationStore* store,
                               std::shared_ptr<notification::ChannelRegistry> channels,
                               std::shared_ptr<AuditLog> audit,
                               const RouterConfig& config)
    : store_(store),
      channels_(std::move(channels)),
      audit_(std::move(audit)),
      channel_(config.primary_channel_for(Priority::BATCHED)),
      lease_duration_(config.processor_lease) {}

size_t BatchProcessor::run_batch(TimePoint now) {
    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        ATTN_LOG_WARN("Batch run skipped: another batch run is in progress");
        return 0;
    }

    ProcessorLease lease(store_->database(), Priority::BATCHED, lease_duration_);
    if (!lease.acquire(now)) {
        ATTN_LOG_WARN("Batch run skipped: another process holds the batched run lease");
        return 0;
    }

    ATTN_SCOPED_TIMER("run_batch");

    auto ready = store_->pending(Priority::BATCHED, now);
    if (ready.empty()) {
        ATTN_LOG_INFO("No batched notifications ready at {}", format_iso8601(now));
        return 0;
    }

    std::string digest_text = digest::format_digest(ready);

    if (!channels_ || !channels_->deliver(channel_, digest_text)) {
        ATTN_LOG_ERROR("Batch digest delivery failed; {} notifications stay pending", ready.size());
        if (audit_) {
            audit_->record(now, priority_to_string(Priority::BATCHED), "batch_digest",
                           "Batch failed: " + std::to_string(ready.size()) + " items", "failed");
        }
        return 0;
    }

    std::vector<std::string> ids;
    ids.reserve(ready.size());
    for (const auto& notification : ready) {
        ids.push_back(notification.id);
    }

    size_t marked = 0;
    try {
        marked = store_->mark_sent(ids, now);
    } catch (const std::exception& e) {
        // Delivered but still pending; the next run sends these again
        ATTN_LOG_ERROR("Batch digest delivered but marking {} notifications failed: {}", ids.size(), e.what());
        throw;
    }

    if (marked != ids.size()) {
        ATTN_LOG_WARN("Batch digest covered {} notifications but {} were still pending", ids.size(), marked);
    }

    ATTN_LOG_INFO("Sent batch digest with {} notifications", ready.size());
    if (audit_) {
        audit_->record(now, priority_to_string(Priority::BATCHED), "batch_digest",
                       "Batch sent: " + std::to_string(ready.size()) + " items", "sent");
    }
    return ready.size();
}

} // namespace attn
