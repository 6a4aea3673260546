#include "database_manager.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"
#include "sqlite3.h"
#include <filesystem>

namespace attn {

namespace {

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS notifications("
    "id TEXT PRIMARY KEY NOT NULL,"
    "priority TEXT NOT NULL CHECK (priority IN ('immediate','batched','weekly')),"
    "channel TEXT NOT NULL,"
    "message TEXT NOT NULL,"
    "context TEXT NOT NULL,"
    "event_kind TEXT NOT NULL,"
    "scheduled_for INTEGER,"
    "sent_at INTEGER,"
    "created_at INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS idx_notifications_priority ON notifications(priority, scheduled_for);"
    "CREATE INDEX IF NOT EXISTS idx_notifications_pending ON notifications(sent_at);"
    "CREATE TABLE IF NOT EXISTS dedup_ledger("
    "event_kind TEXT NOT NULL,"
    "has_source INTEGER NOT NULL,"
    "source_entity_id TEXT NOT NULL,"
    "last_sent_at INTEGER NOT NULL,"
    "PRIMARY KEY (event_kind, has_source, source_entity_id));"
    "CREATE TABLE IF NOT EXISTS processor_runs("
    "tier TEXT PRIMARY KEY NOT NULL,"
    "owner TEXT NOT NULL,"
    "lease_until INTEGER NOT NULL);";

} // namespace

DatabaseManager::DatabaseManager(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    if (db_path_ != ":memory:") {
        std::filesystem::path path(db_path_);
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        if (ec) {
            ATTN_LOG_ERROR("Can't create database directory for {}: {}", db_path_, ec.message());
            return false;
        }
    }

    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        ATTN_LOG_ERROR("Can't open database {}: {}", db_path_, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Another process holding the write lock is waited for, not failed on
    sqlite3_busy_timeout(db_, 5000);

    try {
        create_schema();
    } catch (const DatabaseError& e) {
        ATTN_LOG_ERROR("Failed to create schema: {}", e.what());
        close();
        return false;
    }

    ATTN_LOG_INFO("Opened database {}", db_path_);
    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::is_open() const {
    return db_ != nullptr;
}

void DatabaseManager::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    char* error_msg = nullptr;
    if (sqlite3_exec(handle(), sql.c_str(), nullptr, nullptr, &error_msg) != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        throw DatabaseError(message);
    }
}

int DatabaseManager::changes() const {
    return sqlite3_changes(handle());
}

void DatabaseManager::create_schema() {
    execute(kSchema);
}

sqlite3* DatabaseManager::handle() const {
    if (!db_) {
        throw DatabaseError("database is not open: " + db_path_);
    }
    return db_;
}

std::string DatabaseManager::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database is not open";
}

// Transaction

DatabaseManager::Transaction::Transaction(DatabaseManager& db)
    : db_(db), lock_(db.mutex_) {
    if (db_.transaction_depth_ == 0) {
        db_.execute("BEGIN IMMEDIATE;");
        db_.rollback_only_ = false;
        outermost_ = true;
    }
    ++db_.transaction_depth_;
}

DatabaseManager::Transaction::~Transaction() {
    --db_.transaction_depth_;

    if (committed_) {
        return;
    }

    if (!outermost_) {
        // The enclosing transaction must not commit partial work
        db_.rollback_only_ = true;
        return;
    }

    try {
        db_.execute("ROLLBACK;");
    } catch (const DatabaseError& e) {
        ATTN_LOG_ERROR("Rollback failed: {}", e.what());
    }
}

void DatabaseManager::Transaction::commit() {
    if (committed_) {
        return;
    }
    if (outermost_) {
        if (db_.rollback_only_) {
            throw DatabaseError("nested transaction failed; refusing to commit");
        }
        db_.execute("COMMIT;");
    }
    committed_ = true;
}

// Statement

DatabaseManager::Statement::Statement(DatabaseManager& db, const std::string& sql)
    : db_(db), lock_(db.mutex_) {
    if (sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string message = db_.last_error();
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw DatabaseError("failed to prepare statement: " + message);
    }
}

DatabaseManager::Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

DatabaseManager::Statement& DatabaseManager::Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw DatabaseError("failed to bind parameter " + std::to_string(index) + ": " + db_.last_error());
    }
    return *this;
}

DatabaseManager::Statement& DatabaseManager::Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        throw DatabaseError("failed to bind parameter " + std::to_string(index) + ": " + db_.last_error());
    }
    return *this;
}

DatabaseManager::Statement& DatabaseManager::Statement::bind_null(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw DatabaseError("failed to bind parameter " + std::to_string(index) + ": " + db_.last_error());
    }
    return *this;
}

bool DatabaseManager::Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError("failed to execute statement: " + db_.last_error());
}

void DatabaseManager::Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string DatabaseManager::Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

int64_t DatabaseManager::Statement::column_int64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

bool DatabaseManager::Statement::column_is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

} // namespace attn
