#include "sqlconnection.hpp"
#include <sqlite3.h>
#include "errors.hpp"
#include "lib.hpp"

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3_stmt* stmt, std::string sql)
        : stmt_(stmt), sql_(std::move(sql)) { }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void bind(int idx, const jval& value, ScalarType type) override {
        if (value.IsInt64() && (type == ScalarType::Int || type == ScalarType::BigInt)) {
            sqlite3_bind_int64(stmt_, idx, value.GetInt64());
            return;
        }
        SQLStatement::bind(idx, value, type);
    }

    int exec() override {
        int rc = sqlite3_step(stmt_);
        while (rc == SQLITE_ROW) rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE) fail_();
        return sqlite3_changes(sqlite3_db_handle(stmt_));
    }

    jdoc query() override {
        jdoc rows(json::kArrayType);
        auto& a = rows.GetAllocator();
        int cols = sqlite3_column_count(stmt_);
        int rc;
        while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
            jval row(json::kObjectType);
            for (int i = 0; i < cols; ++i) {
                jval key = jhlp::str_val(sqlite3_column_name(stmt_, i), a);
                if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) {
                    row.AddMember(key, jval(json::kNullType), a);
                    continue;
                }
                const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                int len = sqlite3_column_bytes(stmt_, i);
                row.AddMember(key, jval(text, static_cast<json::SizeType>(len), a), a);
            }
            rows.PushBack(row, a);
        }
        if (rc != SQLITE_DONE) fail_();
        return rows;
    }

protected:
    void set_text(int idx, std::string value) override {
        //handle unicode string UTF-8
        sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void set_null(int idx) override {
        sqlite3_bind_null(stmt_, idx);
    }

private:
    [[noreturn]] void fail_() {
        std::string err = sqlite3_errmsg(sqlite3_db_handle(stmt_));
        throw SqlError("SQLite error: " + err, sql_);
    }

    sqlite3_stmt* stmt_;
    std::string sql_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        if (sqlite3_open_v2(dsn.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect();
            THROW_AS(ConnectivityError, "failed to open SQLite database '{}': {}", dsn, err);
        }
        LOG_DEBUG("opened SQLite database {}", dsn);
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    // transaction control
    bool begin() override {
        if (tr_started_) return true;
        execute("BEGIN");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        execute("COMMIT");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        // an error may already have rolled back; nothing else to undo then
        if (sqlite3_get_autocommit(db_)) return;
        execute("ROLLBACK");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) THROW_AS(ConnectivityError, "prepare: not connected");
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK) {
            throw SqlError("SQLite prepare failed: " + std::string(sqlite3_errmsg(db_)), sql);
        }
        return std::make_unique<SQLiteStatement>(stmt, sql);
    }

    void execute(const std::string& sql) override {
        if (!db_) THROW_AS(ConnectivityError, "execute: not connected");
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string err = errmsg ? errmsg : "unknown";
            sqlite3_free(errmsg);
            throw SqlError("SQLite error: " + err, sql);
        }
    }

private:
    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}
