// connection_mysql.cpp
#if HAVE_MYSQL
#include <mysql/mysql.h>
#include <string>
#include <vector>
#include "errors.hpp"
#include "lib.hpp"
#include "sqlconnection.hpp"

/*=============================  MySqlStatement  =============================*/
// Parameters are escaped client-side and spliced into the `?` placeholders.
class MySqlStatement final : public SQLStatement {
public:
    MySqlStatement(MYSQL* mysql, std::string sql)
        : mysql_(mysql), sql_(std::move(sql)) { }

    int exec() override {
        run_();
        MYSQL_RES* res = mysql_store_result(mysql_);
        if (res) mysql_free_result(res);
        return static_cast<int>(mysql_affected_rows(mysql_));
    }

    jdoc query() override {
        run_();
        jdoc rows(json::kArrayType);
        auto& a = rows.GetAllocator();
        MYSQL_RES* res = mysql_store_result(mysql_);
        if (!res) {
            if (mysql_field_count(mysql_) == 0) return rows;
            fail_(sql_);
        }
        unsigned int cols = mysql_num_fields(res);
        MYSQL_FIELD* fields = mysql_fetch_fields(res);
        while (MYSQL_ROW r = mysql_fetch_row(res)) {
            unsigned long* lengths = mysql_fetch_lengths(res);
            jval row(json::kObjectType);
            for (unsigned int c = 0; c < cols; ++c) {
                jval key = jhlp::str_val(fields[c].name, a);
                if (!r[c]) {
                    row.AddMember(key, jval(json::kNullType), a);
                    continue;
                }
                jval val(r[c], static_cast<json::SizeType>(lengths[c]), a);
                row.AddMember(key, val, a);
            }
            rows.PushBack(row, a);
        }
        mysql_free_result(res);
        return rows;
    }

protected:
    void set_null(int idx) override {
        ensure_slot_(idx);
        values_[idx-1] = "NULL";
    }

    void set_text(int idx, std::string value) override {
        ensure_slot_(idx);
        std::string buf(value.size() * 2 + 1, '\0');
        unsigned long n = mysql_real_escape_string(mysql_, buf.data(), value.c_str(), value.size());
        buf.resize(n);
        values_[idx-1] = "'" + buf + "'";
    }

private:
    void ensure_slot_(int idx) {
        if (idx < 1) THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > values_.size()) values_.resize(idx, "NULL");
    }

    std::string render_() const {
        std::string out;
        size_t next = 0;
        char quote = 0;
        for (char c : sql_) {
            if (quote) {
                if (c == quote) quote = 0;
                out += c;
                continue;
            }
            if (c == '\'' || c == '"' || c == '`') { quote = c; out += c; continue; }
            if (c == '?') {
                if (next >= values_.size()) THROW("bind: statement needs more than {} parameters", values_.size());
                out += values_[next++];
                continue;
            }
            out += c;
        }
        return out;
    }

    void run_() {
        std::string sql = render_();
        if (mysql_real_query(mysql_, sql.c_str(), sql.size()) != 0) fail_(sql);
    }

    [[noreturn]] void fail_(const std::string& sql) {
        throw SqlError(fmt::format("MySQL error {}: {}", mysql_errno(mysql_), mysql_error(mysql_)), sql);
    }

    MYSQL* mysql_;
    std::string sql_;
    std::vector<std::string> values_;
};

/*=============================  MySqlConnection  =============================*/
class MySqlConnection final : public SQLConnection {
public:
    ~MySqlConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        ConnectionInfo info = ConnectionInfo::parse(dsn);
        mysql_ = mysql_init(nullptr);
        if (!mysql_) THROW_AS(ConnectivityError, "mysql_init failed");
        mysql_options(mysql_, MYSQL_SET_CHARSET_NAME, "utf8mb4");
        const char* host = info.host.empty() ? "localhost" : info.host.c_str();
        const char* user = info.user.empty() ? "root" : info.user.c_str();
        unsigned int port = info.port ? static_cast<unsigned int>(info.port) : 3306;
        if (!mysql_real_connect(mysql_, host, user, info.password.c_str(), info.database.c_str(),
                                port, nullptr, CLIENT_MULTI_STATEMENTS)) {
            std::string err = fmt::format("ERROR {}: {}", mysql_errno(mysql_), mysql_error(mysql_));
            disconnect();
            THROW_AS(ConnectivityError, "cannot reach MySQL server {}:{}: {}", host, port, err);
        }
        LOG_DEBUG("connected to MySQL server {}:{}", host, port);
    }

    void disconnect() override {
        if (mysql_) {
            mysql_close(mysql_);
            mysql_ = nullptr;
        }
        tr_started_ = false;
    }

    bool begin() override {
        if (tr_started_) return true;
        execute("START TRANSACTION");
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
        execute("ROLLBACK");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!mysql_) THROW_AS(ConnectivityError, "prepare: not connected");
        return std::make_unique<MySqlStatement>(mysql_, sql);
    }

    void execute(const std::string& sql) override {
        if (!mysql_) THROW_AS(ConnectivityError, "execute: not connected");
        if (mysql_real_query(mysql_, sql.c_str(), sql.size()) != 0)
            throw SqlError(fmt::format("MySQL error {}: {}", mysql_errno(mysql_), mysql_error(mysql_)), sql);
        // drain every result of a multi-statement batch
        do {
            MYSQL_RES* res = mysql_store_result(mysql_);
            if (res) mysql_free_result(res);
        } while (mysql_next_result(mysql_) == 0);
        if (mysql_errno(mysql_) != 0)
            throw SqlError(fmt::format("MySQL error {}: {}", mysql_errno(mysql_), mysql_error(mysql_)), sql);
    }

private:
    MYSQL* mysql_ = nullptr;
};

PSQLConnection make_mysql_connection() {
    return std::make_unique<MySqlConnection>();
}
#endif
