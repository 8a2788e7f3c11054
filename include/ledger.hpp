#pragma once
#include <optional>
#include <string>
#include <vector>
#include "provider.hpp"
#include "sqlconnection.hpp"

// One row of the applied-migrations table.
struct LedgerEntry {
    std::string id;
    std::string checksum;
    std::string migration_name;
    std::optional<std::string> logs;
    std::optional<std::string> started_at;
    std::optional<std::string> finished_at;
    std::optional<std::string> rolled_back_at;
    int applied_steps_count = 0;

    bool applied() const { return finished_at && !rolled_back_at; }
    bool failed() const { return !finished_at && !rolled_back_at; }
};

// Checksum recorded for rows created by resolve without a local file.
inline constexpr const char* MANUAL_CHECKSUM = "manual";

// The applied-migrations table. Created on first use; every read goes back
// to the database.
class MigrationLedger {
public:
    static constexpr const char* TABLE = "_schema_migrations";

    MigrationLedger(SQLConnection& conn, const Provider& provider) : conn_(conn), provider_(provider) {}

    void ensure_table();
    std::vector<LedgerEntry> entries();

    void record_applied(const std::string& name, const std::string& checksum, int steps,
                        const std::string& started_at, const std::string& finished_at);
    void record_failed(const std::string& name, const std::string& checksum, const std::string& logs, int steps,
                       const std::string& started_at);
    // Marks the newest row for `name` applied, or inserts one.
    void mark_applied(const std::string& name, const std::string& checksum);
    // MigrateError when the ledger has no row for `name`.
    void mark_rolled_back(const std::string& name);

private:
    std::string table() const { return provider_.quote_identifier(TABLE); }
    std::string p(int n) const { return provider_.placeholder(n); }

    SQLConnection& conn_;
    const Provider& provider_;
    bool ensured_ = false;
};
