#pragma once

#include "database_manager.hpp"
#include "../core/router_config.hpp"
#include "../core/types.hpp"
#include <optional>

namespace attn {

// Last-notified time per dedup key. Entries are superseded, never deleted.
class DedupLedger {
public:
    DedupLedger(DatabaseManager* db, CooldownTable cooldowns = CooldownTable());

    // True iff the key was recorded strictly after now - cooldown(priority)
    bool is_duplicate(Priority priority, const DedupKey& key, TimePoint now) const;

    // Upserts the key's last_sent_at to now
    void record(const DedupKey& key, TimePoint now);

    // Check and record as one conditional upsert: writes now and returns true
    // unless the key is a duplicate, in which case nothing changes.
    bool try_claim(Priority priority, const DedupKey& key, TimePoint now);

    std::optional<TimePoint> last_sent(const DedupKey& key) const;

    std::chrono::minutes cooldown(Priority priority, const std::string& event_kind) const {
        return cooldowns_.window(priority, event_kind);
    }

private:
    DatabaseManager* db_;
    CooldownTable cooldowns_;
};

} // namespace attn
