#include "sqlconnection.hpp"
#include "errors.hpp"
#include "lib.hpp"

void SQLStatement::bind(int idx, const jval& value, ScalarType type) {
    // Null maps to NULL for every type
    if (value.IsNull()) { set_null(idx); return; }

    switch (type) {
        case ScalarType::String:
        case ScalarType::DateTime:
        case ScalarType::Bytes:
            if (value.IsString()) { set_text(idx, value.GetString()); return; }
            THROW("bind: expected string for parameter {}", idx);
        case ScalarType::Int:
        case ScalarType::BigInt:
        case ScalarType::Float:
        case ScalarType::Decimal:
            if (value.IsNumber() || value.IsString()) { set_text(idx, jhlp::val2str(value)); return; }
            THROW("bind: expected number for parameter {}", idx);
        case ScalarType::Boolean:
            if (value.IsBool()) { set_bool(idx, value.GetBool()); return; }
            if (value.IsInt()) { set_bool(idx, value.GetInt() != 0); return; }
            THROW("bind: expected boolean for parameter {}", idx);
        case ScalarType::Json:
            set_text(idx, value.IsString() ? std::string(value.GetString()) : jhlp::dump(value));
            return;
    }
}

jdoc SQLConnection::select(const std::string& sql, const std::vector<std::string>& params) {
    auto stmt = prepare(sql);
    jdoc holder;
    for (size_t i = 0; i < params.size(); ++i) {
        jval v = jhlp::str_val(params[i], holder.GetAllocator());
        stmt->bind(static_cast<int>(i) + 1, v, ScalarType::String);
    }
    return stmt->query();
}

int SQLConnection::exec(const std::string& sql, const std::vector<std::optional<std::string>>& params) {
    auto stmt = prepare(sql);
    jdoc holder;
    for (size_t i = 0; i < params.size(); ++i) {
        jval v;
        if (params[i]) v = jhlp::str_val(*params[i], holder.GetAllocator());
        stmt->bind(static_cast<int>(i) + 1, v, ScalarType::String);
    }
    return stmt->exec();
}

PSQLConnection open_connection(const ConnectionInfo& info) {
    PSQLConnection conn;
    switch (info.provider) {
        case ProviderKind::SQLite:
            conn = make_sqlite_connection();
            break;
        case ProviderKind::PostgreSQL:
#if HAVE_POSTGRESQL
            conn = make_postgres_connection();
            break;
#else
            THROW_AS(ConnectivityError, "PostgreSQL support is not built in");
#endif
        case ProviderKind::MySQL:
#if HAVE_MYSQL
            conn = make_mysql_connection();
            break;
#else
            THROW_AS(ConnectivityError, "MySQL support is not built in");
#endif
    }
    LOG_DEBUG("connecting to {} database", provider_name(info.provider));
    conn->connect(info.dsn());
    return conn;
}
