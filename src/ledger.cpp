#include "ledger.hpp"
#include "errors.hpp"
#include "lib.hpp"
#include "migrations.hpp"
#include "ulid.hpp"

void MigrationLedger::ensure_table() {
    if (ensured_) return;
    conn_.execute(provider_.ledger_table_ddl(TABLE));
    ensured_ = true;
}

std::vector<LedgerEntry> MigrationLedger::entries() {
    ensure_table();
    jdoc rows = conn_.select("SELECT id, checksum, migration_name, logs, started_at, finished_at, rolled_back_at, "
                             "applied_steps_count FROM " + table() + " ORDER BY started_at, migration_name");
    std::vector<LedgerEntry> out;
    for (const auto& row : rows.GetArray()) {
        LedgerEntry e;
        e.id = jhlp::get<std::string>(row, "id");
        e.checksum = jhlp::get<std::string>(row, "checksum");
        e.migration_name = jhlp::get<std::string>(row, "migration_name");
        e.logs = jhlp::get_opt(row, "logs");
        e.started_at = jhlp::get_opt(row, "started_at");
        e.finished_at = jhlp::get_opt(row, "finished_at");
        e.rolled_back_at = jhlp::get_opt(row, "rolled_back_at");
        e.applied_steps_count = jhlp::get<int>(row, "applied_steps_count");
        out.push_back(e);
    }
    return out;
}

void MigrationLedger::record_applied(const std::string& name, const std::string& checksum, int steps,
                                     const std::string& started_at, const std::string& finished_at) {
    ensure_table();
    conn_.exec("INSERT INTO " + table() + " (id, checksum, migration_name, started_at, finished_at, applied_steps_count) "
               "VALUES (" + p(1) + ", " + p(2) + ", " + p(3) + ", " + p(4) + ", " + p(5) + ", " + p(6) + ")",
               {ULID::get_id(), checksum, name, started_at, finished_at, std::to_string(steps)});
    LOG_DEBUG("ledger: {} applied ({} steps)", name, steps);
}

void MigrationLedger::record_failed(const std::string& name, const std::string& checksum, const std::string& logs,
                                    int steps, const std::string& started_at) {
    ensure_table();
    conn_.exec("INSERT INTO " + table() + " (id, checksum, migration_name, logs, started_at, applied_steps_count) "
               "VALUES (" + p(1) + ", " + p(2) + ", " + p(3) + ", " + p(4) + ", " + p(5) + ", " + p(6) + ")",
               {ULID::get_id(), checksum, name, logs, started_at, std::to_string(steps)});
    LOG_DEBUG("ledger: {} failed after {} steps", name, steps);
}

void MigrationLedger::mark_applied(const std::string& name, const std::string& checksum) {
    ensure_table();
    std::string now = ledger_timestamp(std::chrono::system_clock::now());
    int updated = conn_.exec("UPDATE " + table() + " SET finished_at = COALESCE(finished_at, " + p(1) + "), "
                             "rolled_back_at = NULL WHERE migration_name = " + p(2),
                             {now, name});
    if (updated > 0) return;
    conn_.exec("INSERT INTO " + table() + " (id, checksum, migration_name, started_at, finished_at, applied_steps_count) "
               "VALUES (" + p(1) + ", " + p(2) + ", " + p(3) + ", " + p(4) + ", " + p(5) + ", 0)",
               {ULID::get_id(), checksum, name, now, now});
}

void MigrationLedger::mark_rolled_back(const std::string& name) {
    ensure_table();
    std::string now = ledger_timestamp(std::chrono::system_clock::now());
    int updated = conn_.exec("UPDATE " + table() + " SET rolled_back_at = " + p(1) + ", finished_at = NULL "
                             "WHERE migration_name = " + p(2),
                             {now, name});
    if (updated == 0) THROW_AS(MigrateError, "migration '{}' not found in the ledger", name);
}
