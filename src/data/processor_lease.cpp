#include "processor_lease.hpp"
#include "notification_store.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"

namespace attn {

ProcessorLease::ProcessorLease(DatabaseManager* db, Priority tier, std::chrono::minutes duration)
    : db_(db),
      tier_(priority_to_string(tier)),
      duration_(duration),
      owner_(NotificationStore::generate_id()) {}

ProcessorLease::~ProcessorLease() {
    try {
        release();
    } catch (const DatabaseError& e) {
        ATTN_LOG_ERROR("Failed to release {} run lease {}: {}", tier_, owner_, e.what());
    }
}

bool ProcessorLease::acquire(TimePoint now) {
    if (held_) {
        return true;
    }

    DatabaseManager::Transaction tx(*db_);
    DatabaseManager::Statement stmt(*db_,
        "INSERT INTO processor_runs (tier,owner,lease_until) VALUES (?,?,?) "
        "ON CONFLICT(tier) DO UPDATE SET owner = excluded.owner, lease_until = excluded.lease_until "
        "WHERE processor_runs.lease_until <= ?;");
    stmt.bind(1, tier_)
        .bind(2, owner_)
        .bind(3, to_epoch_millis(now + duration_))
        .bind(4, to_epoch_millis(now));
    stmt.step();
    held_ = db_->changes() > 0;
    tx.commit();

    if (!held_) {
        ATTN_LOG_DEBUG("{} run lease is held by another run", tier_);
    }
    return held_;
}

void ProcessorLease::release() {
    if (!held_) {
        return;
    }

    DatabaseManager::Statement stmt(*db_,
        "DELETE FROM processor_runs WHERE tier = ? AND owner = ?;");
    stmt.bind(1, tier_).bind(2, owner_);
    stmt.step();
    held_ = false;
}

} // namespace attn
