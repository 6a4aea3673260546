#pragma once

#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace attn {

// Owns the SQLite connection shared by the Notification Store and the Dedup
// Ledger. All access goes through the recursive mutex, which makes this
// process the single writer for its connection.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool open();
    void close();
    bool is_open() const;

    const std::string& path() const { return db_path_; }

    // Throws DatabaseError
    void execute(const std::string& sql);

    // Rows touched by the most recent INSERT/UPDATE/DELETE on this connection
    int changes() const;

    std::recursive_mutex& mutex() { return mutex_; }

    // BEGIN IMMEDIATE on the outermost level; nested transactions join the
    // outer one. Rolls back on destruction unless committed.
    class Transaction {
    public:
        explicit Transaction(DatabaseManager& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        DatabaseManager& db_;
        std::unique_lock<std::recursive_mutex> lock_;
        bool outermost_ = false;
        bool committed_ = false;
    };

    // Prepared statement. Columns are 0-based, parameters 1-based.
    class Statement {
    public:
        Statement(DatabaseManager& db, const std::string& sql);
        ~Statement();

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        Statement& bind(int index, const std::string& value);
        Statement& bind(int index, int64_t value);
        Statement& bind_null(int index);

        // true while a row is available, false once done. Throws on error.
        bool step();
        void reset();

        std::string column_text(int column) const;
        int64_t column_int64(int column) const;
        bool column_is_null(int column) const;

    private:
        DatabaseManager& db_;
        std::lock_guard<std::recursive_mutex> lock_;
        sqlite3_stmt* stmt_ = nullptr;
    };

private:
    void create_schema();
    sqlite3* handle() const;
    std::string last_error() const;

    std::string db_path_;
    sqlite3* db_;
    std::recursive_mutex mutex_;
    int transaction_depth_ = 0;
    bool rollback_only_ = false;
};

} // namespace attn
