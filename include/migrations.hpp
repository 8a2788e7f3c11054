#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "ledger.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

// <dir>/<14 digits>_<name>/migration.sql
struct Migration {
    std::string name;
    std::string path; // directory
    std::string sql;

    std::string checksum() const;
};

enum class MigrationState { LocalOnly, Applied, Failed, RolledBack, MissingLocally };

struct MigrationStatus {
    std::string name;
    MigrationState state = MigrationState::LocalOnly;
    bool modified = false; // applied checksum differs from the local file
};

enum class ResolveAction { Applied, RolledBack };

std::string migration_state_name(MigrationState state);

// lowercased, spaces and '-' to '_', only [a-z0-9_], repeats collapsed,
// '_' trimmed; "migration" when nothing is left
std::string normalize_migration_name(const std::string& description);
// YYYYMMDDHHMMSS in UTC
std::string migration_timestamp(std::chrono::system_clock::time_point at);
// YYYY-MM-DD HH:MM:SS.mmm in UTC, as stored in the ledger
std::string ledger_timestamp(std::chrono::system_clock::time_point at);
bool is_migration_dir_name(const std::string& name);

class MigrationManager {
public:
    static constexpr const char* LOCK_FILE = "migration_lock.toml";

    MigrationManager(SQLConnection& conn, const Provider& provider, std::string migrations_dir);

    // Sorted by name; a missing directory yields none.
    std::vector<Migration> local_migrations() const;
    std::vector<std::string> applied_migrations();
    std::vector<Migration> pending_migrations();
    std::vector<std::string> missing_migrations();
    std::vector<std::string> modified_migrations();
    std::vector<std::string> failed_migrations();
    std::vector<MigrationStatus> status();

    // ApplyError naming the migration and the failing statement.
    void apply(const Migration& migration);
    Migration create(const std::string& description, const std::string& sql,
                     std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    void resolve(const std::string& name, ResolveAction action);

    // DriftError when the lock file names another provider.
    void check_lock_file() const;
    void write_lock_file() const;

    MigrationLedger& ledger() { return ledger_; }
    const std::string& directory() const { return dir_; }

private:
    const Migration* find_local(const std::vector<Migration>& local, const std::string& name) const;

    SQLConnection& conn_;
    const Provider& provider_;
    std::string dir_;
    MigrationLedger ledger_;
};
