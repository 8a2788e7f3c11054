// connection_postgres.cpp
#if HAVE_POSTGRESQL
#include <libpq-fe.h>
#include <string>
#include <vector>
#include <cstdlib>
#include "errors.hpp"
#include "lib.hpp"
#include "sqlconnection.hpp"

namespace {
    std::string pq_error(PGconn* conn) {
        std::string err = conn ? PQerrorMessage(conn) : "no connection";
        return trim(err);
    }
}

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql)
        : conn_(conn), sql_(std::move(sql)) { }

    ~PgStatement() override = default;

    // Execute and return rows affected (INSERT/UPDATE/DELETE)
    int exec() override {
        PGresult* res = run_();
        int rows = 0;
        if (PQresultStatus(res) == PGRES_COMMAND_OK) {
            const char* t = PQcmdTuples(res);
            rows = (t && *t) ? std::atoi(t) : 0;
        }
        PQclear(res);
        return rows;
    }

    jdoc query() override {
        PGresult* res = run_();
        jdoc rows(json::kArrayType);
        auto& a = rows.GetAllocator();
        const int n = PQntuples(res);
        const int cols = PQnfields(res);
        for (int r = 0; r < n; ++r) {
            jval row(json::kObjectType);
            for (int c = 0; c < cols; ++c) {
                jval key = jhlp::str_val(PQfname(res, c), a);
                if (PQgetisnull(res, r, c)) {
                    row.AddMember(key, jval(json::kNullType), a);
                    continue;
                }
                jval val(PQgetvalue(res, r, c), static_cast<json::SizeType>(PQgetlength(res, r, c)), a);
                row.AddMember(key, val, a);
            }
            rows.PushBack(row, a);
        }
        PQclear(res);
        return rows;
    }

protected:
    void set_null(int idx) override {
        ensure_slot_(idx);
        is_null_[idx-1] = true;
    }

    void set_text(int idx, std::string value) override {
        ensure_slot_(idx);
        values_[idx-1]  = std::move(value);        // own storage
        is_null_[idx-1] = false;
    }

private:
    void ensure_slot_(int idx) {
        if (idx < 1) THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > values_.size()) {
            values_.resize(idx);
            is_null_.resize(idx, true);
        }
    }

    PGresult* run_() {
        const int nParams = static_cast<int>(values_.size());
        std::vector<const char*> params(nParams);
        std::vector<int> lengths(nParams), formats(nParams, 0);
        for (int i = 0; i < nParams; ++i) {
            params[i]  = is_null_[i] ? nullptr : values_[i].c_str();
            lengths[i] = static_cast<int>(values_[i].size());
        }
        PGresult* res = PQexecParams(
            conn_,
            sql_.c_str(),
            nParams,
            nullptr,                                   // let server infer types
            (nParams ? params.data()  : nullptr),
            (nParams ? lengths.data() : nullptr),
            (nParams ? formats.data() : nullptr),      // all text format
            0                                          // text results
        );
        if (!res) throw SqlError("Postgres exec failed: " + pq_error(conn_), sql_);

        auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            std::string err = PQresultErrorMessage(res);
            PQclear(res);
            throw SqlError("Postgres error: " + trim(err), sql_);
        }
        return res;
    }

    PGconn* conn_;
    std::string sql_;
    std::vector<std::string> values_;
    std::vector<bool> is_null_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = pq_error(conn_);
            disconnect();
            THROW_AS(ConnectivityError, "cannot reach PostgreSQL server: {}", err);
        }
        // keep NOTICE chatter (IF EXISTS, implicit sequences) off stdout/stderr
        PQsetNoticeProcessor(conn_, [](void*, const char* msg) { LOG_DEBUG("postgres: {}", trim(msg)); }, nullptr);
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

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
        execute("ROLLBACK");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) THROW_AS(ConnectivityError, "prepare: not connected");
        return std::make_unique<PgStatement>(conn_, sql);
    }

    // PQexec accepts several statements in one string.
    void execute(const std::string& sql) override {
        if (!conn_) THROW_AS(ConnectivityError, "execute: not connected");
        PGresult* res = PQexec(conn_, sql.c_str());
        if (!res) throw SqlError("Postgres error: " + pq_error(conn_), sql);
        auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK && st != PGRES_EMPTY_QUERY) {
            std::string err = PQresultErrorMessage(res);
            PQclear(res);
            throw SqlError("Postgres error: " + trim(err), sql);
        }
        PQclear(res);
    }

private:
    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}
#endif
