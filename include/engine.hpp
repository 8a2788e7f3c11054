#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "changeset.hpp"
#include "config.hpp"
#include "decl.hpp"
#include "diagnostic.hpp"
#include "migrations.hpp"
#include "model.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

struct DevResult {
    std::vector<std::string> applied;  // migration names, in order
    std::optional<Migration> created;
};

// Engine: the public face of the migration engine. One instance per run.
class Engine {
public:
    // When `conn` is given it is used as-is; otherwise the database_url is
    // opened on first use.
    explicit Engine(EngineConfig config, PSQLConnection conn = nullptr);
    ~Engine();

    const EngineConfig& config() const { return config_; }
    const Provider& provider() const { return *provider_; }
    SQLConnection& connection();

    /**
     * @brief Parses and validates a declaration.
     *
     * This method performs the following steps:
     * 1. Runs the parser; any syntax error throws SchemaSyntaxError with all of them
     * 2. Runs the semantic checks; any issue throws ValidationError with all of them
     * 3. Adopts the datasource provider unless the configuration names one
     *
     * @param text The declaration source.
     * @return The parsed declaration.
     */
    DeclSchema load_schema(const std::string& text);

    DbSchema desired_model(const DeclSchema& schema) const;
    DbSchema introspect();
    ChangeSet diff(const DbSchema& desired, const DbSchema& actual) const;
    std::string generate(const ChangeSet& cs) const;

    /**
     * @brief SQL that takes the `from` declaration to the `to` declaration.
     *
     * No database is touched. An empty `from` means an empty database.
     *
     * @return The migration script; empty when both sides agree.
     */
    std::string migrate_diff(const std::string& from, const std::string& to);

    /**
     * @brief Makes the database match the declaration without a migration.
     *
     * This method performs the following steps:
     * 1. Introspects the database
     * 2. Diffs the declaration against it
     * 3. Refuses destructive changes unless accept_data_loss is set
     * 4. Runs the statements in one transaction where the provider allows it
     *
     * The ledger is neither read nor written.
     *
     * @return The executed script.
     */
    std::string db_push(const std::string& schema_text);

    /**
     * @brief Development loop.
     *
     * This method performs the following steps:
     * 1. Runs the dev diagnostic
     * 2. Reset: throws DriftError carrying the reason
     * 3. Apply: applies the pending migrations and diagnoses again
     * 4. Create: writes a new migration from the declaration difference and
     *    applies it unless @p create_only
     *
     * @return Applied and created migrations. Nothing when already in sync.
     */
    DevResult migrate_dev(const std::string& schema_text, const std::string& name, bool create_only = false);

    // Applies pending migrations. A failed ledger entry blocks the run.
    std::vector<std::string> migrate_deploy();
    std::vector<MigrationStatus> migrate_status();

    // Drops everything, then applies every local migration. Not atomic: a
    // failure leaves the database partially rebuilt.
    std::vector<std::string> migrate_reset();
    void migrate_resolve(const std::string& name, ResolveAction action);

    void check_lock_file();

private:
    void use_provider(ProviderKind kind);
    MigrationManager manager();
    void check_destructive(const ChangeSet& cs) const;
    void run_script(const std::string& label, const std::vector<std::string>& statements);

    EngineConfig config_;
    PProvider provider_;
    PSQLConnection conn_;
};
