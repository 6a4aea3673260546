#pragma once

#include "audit_log.hpp"
#include "router_config.hpp"
#include "types.hpp"
#include "../data/notification_store.hpp"
#include "channel_adapter.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace attn {

class WeeklyDigestProcessor {
public:
    WeeklyDigestProcessor(NotificationStore* store,
                          std::shared_ptr<notification::ChannelRegistry> channels,
                          std::shared_ptr<AuditLog> audit,
                          const RouterConfig& config = RouterConfig());

    // Sends the most recently created weekly item due at now verbatim and,
    // once the adapter acknowledges it, marks every selected weekly item sent
    // so a stale report is never delivered later. False when nothing is due,
    // the send failed, or another weekly run is in flight.
    bool run_weekly(TimePoint now);

private:
    NotificationStore* store_;
    std::shared_ptr<notification::ChannelRegistry> channels_;
    std::shared_ptr<AuditLog> audit_;
    Channel channel_;
    std::chrono::minutes lease_duration_;
    std::mutex run_mutex_;
};

} // namespace attn
