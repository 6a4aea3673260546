#pragma once

#include "audit_log.hpp"
#include "clock.hpp"
#include "router_config.hpp"
#include "schedule_calculator.hpp"
#include "types.hpp"
#include "../data/database_manager.hpp"
#include "../data/dedup_ledger.hpp"
#include "../data/notification_store.hpp"
#include "channel_adapter.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace attn {

struct RouterStats {
    std::atomic<long long> created{0};
    std::atomic<long long> suppressed{0};
    std::atomic<long long> logged{0};
    std::atomic<long long> immediate_sent{0};
    std::atomic<long long> channel_failures{0};

    RouterStats() = default;

    RouterStats(const RouterStats& other)
        : created(other.created.load()),
          suppressed(other.suppressed.load()),
          logged(other.logged.load()),
          immediate_sent(other.immediate_sent.load()),
          channel_failures(other.channel_failures.load()) {}
};

// Single entry point for every producer. Decides whether an event reaches the
// recipient (dedup), when (tier schedule), and for the immediate tier delivers
// it before returning.
class NotificationRouter {
public:
    NotificationRouter(DatabaseManager* db,
                       NotificationStore* store,
                       DedupLedger* ledger,
                       std::shared_ptr<notification::ChannelRegistry> channels,
                       std::shared_ptr<AuditLog> audit,
                       RouterConfig config = RouterConfig(),
                       std::shared_ptr<Clock> clock = nullptr);

    // Throws ValidationError for an empty event_kind and DatabaseError when
    // storage fails; in the latter case nothing was committed.
    IntakeResult intake(Priority priority,
                        const std::string& message,
                        const std::string& event_kind,
                        const std::optional<std::string>& source_entity_id = std::nullopt,
                        const Metadata& metadata = {});

    // Per-tier entry points
    IntakeResult queue_immediate(const std::string& message,
                                 const std::string& event_kind,
                                 const std::optional<std::string>& source_entity_id = std::nullopt,
                                 const Metadata& metadata = {});
    IntakeResult queue_batched(const std::string& message,
                               const std::string& event_kind,
                               const std::optional<std::string>& source_entity_id = std::nullopt,
                               const Metadata& metadata = {});
    IntakeResult queue_weekly(const std::string& message,
                              const std::string& event_kind = "weekly_report",
                              const std::optional<std::string>& source_entity_id = std::nullopt,
                              const Metadata& metadata = {});
    IntakeResult log_silent(const std::string& message,
                            const std::string& event_kind,
                            const std::optional<std::string>& source_entity_id = std::nullopt,
                            const Metadata& metadata = {});

    const ScheduleCalculator& schedule() const { return schedule_; }
    const RouterConfig& config() const { return config_; }

    RouterStats get_stats() const { return stats_; }
    void reset_stats();

private:
    // Returns the failed channels
    std::vector<Channel> deliver_immediate(const Notification& notification);
    std::string render_for(Channel channel, Priority priority, const std::string& message) const;

    void audit(TimePoint at, Priority priority, const std::string& event_kind,
               const std::string& message, const std::string& status);

    DatabaseManager* db_;
    NotificationStore* store_;
    DedupLedger* ledger_;
    std::shared_ptr<notification::ChannelRegistry> channels_;
    std::shared_ptr<AuditLog> audit_;
    RouterConfig config_;
    std::shared_ptr<Clock> clock_;
    ScheduleCalculator schedule_;

    RouterStats stats_;
};

} // namespace attn
