#include "notification_store.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace attn {

namespace {

const char* kSelectColumns =
    "SELECT id, priority, channel, message, context, scheduled_for, sent_at, created_at "
    "FROM notifications ";

} // namespace

NotificationStore::NotificationStore(DatabaseManager* db) : db_(db) {}

void NotificationStore::insert(const Notification& notification) {
    if (notification.priority == Priority::SILENT) {
        throw ValidationError("silent notifications are never stored");
    }

    DatabaseManager::Statement stmt(*db_,
        "INSERT INTO notifications (id,priority,channel,message,context,event_kind,scheduled_for,sent_at,created_at) "
        "VALUES (?,?,?,?,?,?,?,?,?);");

    stmt.bind(1, notification.id)
        .bind(2, priority_to_string(notification.priority))
        .bind(3, channel_to_string(notification.channel))
        .bind(4, notification.message)
        .bind(5, notification.context.to_json())
        .bind(6, notification.context.event_kind);

    if (notification.scheduled_for) {
        stmt.bind(7, to_epoch_millis(*notification.scheduled_for));
    } else {
        stmt.bind_null(7);
    }
    if (notification.sent_at) {
        stmt.bind(8, to_epoch_millis(*notification.sent_at));
    } else {
        stmt.bind_null(8);
    }
    stmt.bind(9, to_epoch_millis(notification.created_at));

    stmt.step();
}

std::optional<Notification> NotificationStore::find(const std::string& id) const {
    DatabaseManager::Statement stmt(*db_, std::string(kSelectColumns) + "WHERE id = ?;");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_row(stmt);
}

std::vector<Notification> NotificationStore::pending(Priority priority,
                                                     std::optional<TimePoint> due_at_or_before) const {
    std::string sql = std::string(kSelectColumns) + "WHERE sent_at IS NULL AND priority = ?";
    if (due_at_or_before) {
        sql += " AND scheduled_for IS NOT NULL AND scheduled_for <= ?";
    }
    sql += " ORDER BY created_at ASC, rowid ASC;";

    DatabaseManager::Statement stmt(*db_, sql);
    stmt.bind(1, priority_to_string(priority));
    if (due_at_or_before) {
        stmt.bind(2, to_epoch_millis(*due_at_or_before));
    }

    std::vector<Notification> notifications;
    while (stmt.step()) {
        notifications.push_back(read_row(stmt));
    }
    return notifications;
}

size_t NotificationStore::count_pending(Priority priority) const {
    DatabaseManager::Statement stmt(*db_,
        "SELECT COUNT(*) FROM notifications WHERE sent_at IS NULL AND priority = ?;");
    stmt.bind(1, priority_to_string(priority));
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.column_int64(0));
}

size_t NotificationStore::mark_sent(const std::vector<std::string>& ids, TimePoint sent_at) {
    if (ids.empty()) {
        return 0;
    }

    DatabaseManager::Transaction tx(*db_);
    DatabaseManager::Statement stmt(*db_,
        "UPDATE notifications SET sent_at = ? WHERE id = ? AND sent_at IS NULL;");

    size_t marked = 0;
    for (const auto& id : ids) {
        stmt.reset();
        stmt.bind(1, to_epoch_millis(sent_at)).bind(2, id);
        stmt.step();
        marked += static_cast<size_t>(db_->changes());
    }

    tx.commit();
    return marked;
}

std::vector<Notification> NotificationStore::recent(int limit) const {
    DatabaseManager::Statement stmt(*db_,
        std::string(kSelectColumns) + "ORDER BY created_at DESC, rowid DESC LIMIT ?;");
    stmt.bind(1, static_cast<int64_t>(limit));

    std::vector<Notification> notifications;
    while (stmt.step()) {
        notifications.push_back(read_row(stmt));
    }
    return notifications;
}

std::string NotificationStore::generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static const char* hex_chars = "0123456789abcdef";

    std::uniform_int_distribution<> dis(0, 15);
    std::string id;
    id.reserve(16);
    for (int i = 0; i < 16; ++i) {
        id += hex_chars[dis(gen)];
    }
    return id;
}

Notification NotificationStore::read_row(const DatabaseManager::Statement& stmt) {
    Notification notification;
    notification.id = stmt.column_text(0);

    auto priority = parse_priority(stmt.column_text(1));
    if (priority.is_error()) {
        throw DatabaseError("corrupt notification row " + notification.id + ": " + priority.error());
    }
    notification.priority = priority.value();

    // A row written with a channel this build does not know still loads
    notification.channel = parse_channel(stmt.column_text(2)).value_or(Channel::PRIMARY_CHAT);
    notification.message = stmt.column_text(3);

    try {
        notification.context = NotificationContext::from_json(stmt.column_text(4));
    } catch (const nlohmann::json::exception& e) {
        ATTN_LOG_WARN("Unreadable context on notification {}: {}", notification.id, e.what());
    }

    if (!stmt.column_is_null(5)) {
        notification.scheduled_for = from_epoch_millis(stmt.column_int64(5));
    }
    if (!stmt.column_is_null(6)) {
        notification.sent_at = from_epoch_millis(stmt.column_int64(6));
    }
    notification.created_at = from_epoch_millis(stmt.column_int64(7));
    return notification;
}

} // namespace attn
