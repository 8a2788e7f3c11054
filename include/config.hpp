#pragma once
#include <map>
#include <optional>
#include <string>
#include <spdlog/common.h>

enum class ProviderKind { PostgreSQL, MySQL, SQLite };

std::string provider_name(ProviderKind kind);
// "postgresql" / "postgres" / "mysql" / "sqlite". ValidationError otherwise.
ProviderKind provider_from_name(const std::string& name);
// Scheme inspection; anything unrecognized is treated as PostgreSQL.
ProviderKind provider_from_url(const std::string& url);

// A provider-prefixed connection URL split into its parts.
struct ConnectionInfo {
    ProviderKind provider = ProviderKind::PostgreSQL;
    std::string url;
    std::string host;
    int port = 0;
    std::string user;
    std::string password;
    std::string database;   // database name, or file path for SQLite
    std::string schema;     // PostgreSQL search_path from ?schema=
    std::map<std::string, std::string> params;

    static ConnectionInfo parse(const std::string& url);

    // Driver connect string: libpq conninfo, SQLite path, or the URL for MySQL.
    std::string dsn() const;
};

// Everything an engine run needs; passed explicitly, never read from globals.
struct EngineConfig {
    std::string database_url;
    std::optional<ProviderKind> provider;           // overrides the declaration and the URL scheme
    std::string migrations_dir = "migrations";
    std::optional<std::string> shadow_database_url; // drift detection replays migrations here
    bool accept_data_loss = false;
    std::optional<bool> index_order_significant;    // per-run override of the provider policy
    spdlog::level::level_enum log_level = spdlog::level::warn;
};
