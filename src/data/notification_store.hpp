#pragma once

#include "database_manager.hpp"
#include "../core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace attn {

// Durable, append-mostly record of every notification created by the router.
// Rows are never deleted; sent_at is written once and never cleared.
class NotificationStore {
public:
    explicit NotificationStore(DatabaseManager* db);

    DatabaseManager* database() const { return db_; }

    // Silent-tier notifications are rejected with ValidationError
    void insert(const Notification& notification);

    std::optional<Notification> find(const std::string& id) const;

    // Unsent notifications of one tier in creation order. When due_at_or_before
    // is given, only rows with scheduled_for <= that time are returned.
    std::vector<Notification> pending(Priority priority,
                                      std::optional<TimePoint> due_at_or_before = std::nullopt) const;

    size_t count_pending(Priority priority) const;

    // Marks every listed row that is still pending, in one transaction.
    // Returns the number of rows that changed.
    size_t mark_sent(const std::vector<std::string>& ids, TimePoint sent_at);

    // Most recently created first
    std::vector<Notification> recent(int limit = 50) const;

    static std::string generate_id();

private:
    static Notification read_row(const DatabaseManager::Statement& stmt);

    DatabaseManager* db_;
};

} // namespace attn
