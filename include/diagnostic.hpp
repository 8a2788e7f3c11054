#pragma once
#include <optional>
#include <string>
#include <vector>
#include "changeset.hpp"
#include "migrations.hpp"
#include "model.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

enum class DevActionKind { Apply, Create, Reset };

struct DevAction {
    DevActionKind kind = DevActionKind::Create;
    std::string reason;
    std::vector<Migration> pending; // Apply
    ChangeSet changes;              // Create; empty means in sync
};

std::string dev_action_name(DevActionKind kind);

// Replays the applied local migrations into a shadow database and compares
// the result with the live schema. nullopt when no shadow database is
// available (only SQLite gets one implicitly).
std::optional<ChangeSet> detect_drift(MigrationManager& manager, SQLConnection& conn, const Provider& provider,
                                      const std::optional<std::string>& shadow_database_url);

// Decides what a development run should do next. Checks, in order:
// modified applied migrations, applied migrations missing locally, failed
// migrations, drift (Reset); pending migrations (Apply); otherwise the
// desired-vs-actual difference (Create).
DevAction dev_diagnostic(MigrationManager& manager, SQLConnection& conn, const Provider& provider,
                         const DbSchema& desired, const std::optional<std::string>& shadow_database_url);
