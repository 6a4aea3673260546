#include "dedup_ledger.hpp"

namespace attn {

namespace {

// NULL never equals NULL in a SQLite key, so a missing source id is stored
// as has_source = 0 with an empty id.
void bind_key(DatabaseManager::Statement& stmt, const DedupKey& key) {
    stmt.bind(1, key.event_kind)
        .bind(2, static_cast<int64_t>(key.source_entity_id ? 1 : 0))
        .bind(3, key.source_entity_id.value_or(""));
}

} // namespace

DedupLedger::DedupLedger(DatabaseManager* db, CooldownTable cooldowns)
    : db_(db), cooldowns_(std::move(cooldowns)) {}

bool DedupLedger::is_duplicate(Priority priority, const DedupKey& key, TimePoint now) const {
    auto last = last_sent(key);
    if (!last) {
        return false;
    }
    return *last > now - cooldown(priority, key.event_kind);
}

void DedupLedger::record(const DedupKey& key, TimePoint now) {
    DatabaseManager::Statement stmt(*db_,
        "INSERT INTO dedup_ledger (event_kind,has_source,source_entity_id,last_sent_at) VALUES (?,?,?,?) "
        "ON CONFLICT(event_kind,has_source,source_entity_id) "
        "DO UPDATE SET last_sent_at = excluded.last_sent_at;");
    bind_key(stmt, key);
    stmt.bind(4, to_epoch_millis(now));
    stmt.step();
}

bool DedupLedger::try_claim(Priority priority, const DedupKey& key, TimePoint now) {
    auto cutoff = now - cooldown(priority, key.event_kind);

    DatabaseManager::Statement stmt(*db_,
        "INSERT INTO dedup_ledger (event_kind,has_source,source_entity_id,last_sent_at) VALUES (?,?,?,?) "
        "ON CONFLICT(event_kind,has_source,source_entity_id) "
        "DO UPDATE SET last_sent_at = excluded.last_sent_at "
        "WHERE dedup_ledger.last_sent_at <= ?;");
    bind_key(stmt, key);
    stmt.bind(4, to_epoch_millis(now));
    stmt.bind(5, to_epoch_millis(cutoff));
    stmt.step();

    return db_->changes() > 0;
}

std::optional<TimePoint> DedupLedger::last_sent(const DedupKey& key) const {
    DatabaseManager::Statement stmt(*db_,
        "SELECT last_sent_at FROM dedup_ledger "
        "WHERE event_kind = ? AND has_source = ? AND source_entity_id = ?;");
    bind_key(stmt, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return from_epoch_millis(stmt.column_int64(0));
}

} // namespace attn
