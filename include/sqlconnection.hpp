#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "decl.hpp"
#include "jsonhlp.hpp"

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // Positional parameter, 1-based. Values travel as text unless the driver
    // has a better native binding.
    virtual void bind(int idx, const jval& value, ScalarType type);
    virtual int exec() = 0;    // rows affected
    virtual jdoc query() = 0;  // array of row objects; values are strings or null

protected:
    virtual void set_null(int idx) = 0;
    virtual void set_text(int idx, std::string value) = 0;

    void set_bool(int idx, bool value) {
        set_text(idx, value ? "true" : "false");
    }
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN (SQLite: filename; Postgres: conninfo; MySQL: url).
    // ConnectivityError when the database cannot be reached.
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // Runs parameterless SQL; SqlError on failure.
    virtual void execute(const std::string& sql) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;
    bool in_transaction() const { return tr_started_; }

    // prepare + bind text parameters + fetch rows
    jdoc select(const std::string& sql, const std::vector<std::string>& params = {});
    // prepare + bind (nullopt is NULL) + exec
    int exec(const std::string& sql, const std::vector<std::optional<std::string>>& params);

protected:
    bool tr_started_ = false;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif
#if HAVE_MYSQL
PSQLConnection make_mysql_connection();
#endif

// Picks the driver for the URL's provider and connects.
PSQLConnection open_connection(const ConnectionInfo& info);
