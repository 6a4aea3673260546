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

// Drains due batched-tier notifications into a single digest. Invoked by the
// external scheduler at each batch boundary.
class BatchProcessor {
public:
    BatchProcessor(NotificationStore* store,
                   std::shared_ptr<notification::ChannelRegistry> channels,
                   std::shared_ptr<AuditLog> audit,
                   const RouterConfig& config = RouterConfig());

    // Sends every pending batched item with scheduled_for <= now as one digest
    // and returns how many were sent. Nothing is marked sent unless the
    // adapter acknowledged the digest. Returns 0 without selecting anything
    // while another run is in flight.
    size_t run_batch(TimePoint now);

private:
    NotificationStore* store_;
    std::shared_ptr<notification::ChannelRegistry> channels_;
    std::shared_ptr<AuditLog> audit_;
    Channel channel_;
    std::chrono::minutes lease_duration_;
    std::mutex run_mutex_;
};

} // namespace attn
