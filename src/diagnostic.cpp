#include "diagnostic.hpp"
#include <set>
#include "errors.hpp"
#include "introspector.hpp"
#include "lib.hpp"
#include "schemaupdate.hpp"

std::string dev_action_name(DevActionKind kind) {
    switch (kind) {
        case DevActionKind::Apply:  return "apply";
        case DevActionKind::Create: return "create";
        case DevActionKind::Reset:  return "reset";
    }
    return "unknown";
}

namespace {
    PSQLConnection open_shadow(const Provider& provider, const std::optional<std::string>& url) {
        if (provider.kind() == ProviderKind::SQLite && !url) {
            PSQLConnection shadow = make_sqlite_connection();
            shadow->connect(":memory:");
            return shadow;
        }
        if (!url) return nullptr;
        ConnectionInfo info = ConnectionInfo::parse(*url);
        PSQLConnection shadow = open_connection(info);
        for (const auto& stmt : provider.reset_statements(*shadow)) shadow->execute(stmt);
        return shadow;
    }

    DevAction reset(std::string reason) {
        DevAction action;
        action.kind = DevActionKind::Reset;
        action.reason = std::move(reason);
        return action;
    }
}

std::optional<ChangeSet> detect_drift(MigrationManager& manager, SQLConnection& conn, const Provider& provider,
                                      const std::optional<std::string>& shadow_database_url) {
    PSQLConnection shadow = open_shadow(provider, shadow_database_url);
    if (!shadow) {
        LOG_WARN("no shadow database configured for {}; drift detection skipped", provider.name());
        return std::nullopt;
    }

    std::vector<std::string> applied = manager.applied_migrations();
    std::set<std::string> done(applied.begin(), applied.end());
    MigrationManager replay(*shadow, provider, manager.directory());
    for (const auto& m : manager.local_migrations()) {
        if (!done.count(m.name)) continue;
        try {
            replay.apply(m);
        } catch (const ApplyError& e) {
            THROW_AS(DriftError, "migration {} failed to apply cleanly to the shadow database: {}", m.name, e.what());
        }
    }

    DbSchema expected = Introspector(*shadow, provider, MigrationLedger::TABLE).introspect();
    DbSchema actual = Introspector(conn, provider, MigrationLedger::TABLE).introspect();
    shadow->disconnect();
    return SchemaUpdate(actual, expected, provider).compare();
}

DevAction dev_diagnostic(MigrationManager& manager, SQLConnection& conn, const Provider& provider,
                         const DbSchema& desired, const std::optional<std::string>& shadow_database_url) {
    std::vector<std::string> modified = manager.modified_migrations();
    if (!modified.empty())
        return reset("The following migration(s) have been modified since they were applied:\n  " + join(modified, ", ") +
                     "\n\nMigrations that have been applied to the database should not be modified.");

    std::vector<std::string> missing = manager.missing_migrations();
    if (!missing.empty())
        return reset("The following migration(s) are applied to the database but missing from the local "
                     "migrations directory:\n  " + join(missing, ", "));

    std::vector<std::string> failed = manager.failed_migrations();
    if (!failed.empty())
        return reset("The following migration(s) failed to apply:\n  " + join(failed, ", ") +
                     "\n\nResolve or reset before continuing.");

    if (auto drift = detect_drift(manager, conn, provider, shadow_database_url); drift && !drift->empty())
        return reset("Drift detected: Your database schema is not in sync with your migration history.\n\n"
                     "The following is a summary of the differences between the expected database schema given "
                     "your migrations files, and the actual schema of the database.\n\n" + drift_summary(*drift));

    DevAction action;
    action.pending = manager.pending_migrations();
    if (!action.pending.empty()) {
        action.kind = DevActionKind::Apply;
        action.reason = fmt::format("{} migration(s) pending", action.pending.size());
        return action;
    }

    DbSchema actual = Introspector(conn, provider, MigrationLedger::TABLE).introspect();
    action.kind = DevActionKind::Create;
    action.changes = SchemaUpdate(desired, actual, provider).compare();
    action.reason = action.changes.empty() ? "Already in sync, no schema change or pending migration was found."
                                           : "The declaration differs from the database.";
    return action;
}
