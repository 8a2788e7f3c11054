#include "engine.hpp"
#include "ddl_visitor.hpp"
#include "errors.hpp"
#include "introspector.hpp"
#include "lib.hpp"
#include "model_builder.hpp"
#include "parser.hpp"
#include "schemaupdate.hpp"
#include "validator.hpp"

Engine::Engine(EngineConfig config, PSQLConnection conn) : config_(std::move(config)), conn_(std::move(conn)) {
    mlog()->set_level(config_.log_level);
    ProviderKind kind = ProviderKind::SQLite;
    if (config_.provider)
        kind = *config_.provider;
    else if (!config_.database_url.empty())
        kind = provider_from_url(config_.database_url);
    use_provider(kind);
}

Engine::~Engine() {
    if (conn_) conn_->disconnect();
}

void Engine::use_provider(ProviderKind kind) {
    if (provider_ && provider_->kind() == kind) return;
    provider_ = make_provider(kind);
    if (config_.index_order_significant) provider_->set_index_order_significant(*config_.index_order_significant);
    LOG_DEBUG("provider: {}", provider_->name());
}

SQLConnection& Engine::connection() {
    if (!conn_) {
        if (config_.database_url.empty()) THROW_AS(ConnectivityError, "no database url configured");
        conn_ = open_connection(ConnectionInfo::parse(config_.database_url));
    }
    return *conn_;
}

MigrationManager Engine::manager() {
    return MigrationManager(connection(), *provider_, config_.migrations_dir);
}

DeclSchema Engine::load_schema(const std::string& text) {
    ParseResult parsed = parse_schema(text);
    if (!parsed.ok()) throw SchemaSyntaxError(std::move(parsed.errors));

    std::vector<std::string> issues = validate_schema(parsed.schema);
    if (!issues.empty()) throw ValidationError(std::move(issues));

    if (!config_.provider) {
        if (auto name = parsed.schema.provider()) use_provider(provider_from_name(*name));
    }
    return std::move(parsed.schema);
}

DbSchema Engine::desired_model(const DeclSchema& schema) const {
    ModelBuilder builder(schema, *provider_);
    DbSchema model = builder.build();
    for (const auto& w : builder.warnings()) LOG_WARN("{}", w);
    return model;
}

DbSchema Engine::introspect() {
    return Introspector(connection(), *provider_, MigrationLedger::TABLE).introspect();
}

ChangeSet Engine::diff(const DbSchema& desired, const DbSchema& actual) const {
    return SchemaUpdate(desired, actual, *provider_).compare();
}

std::string Engine::generate(const ChangeSet& cs) const {
    DDLVisitor visitor(*provider_);
    return visitor.visit(cs);
}

std::string Engine::migrate_diff(const std::string& from, const std::string& to) {
    DbSchema target = desired_model(load_schema(to));
    DbSchema source;
    if (!trim(from).empty()) source = desired_model(load_schema(from));
    return generate(diff(target, source));
}

void Engine::check_destructive(const ChangeSet& cs) const {
    for (const auto& w : unexecutable_warnings(cs)) LOG_WARN("{}", w);
    std::vector<std::string> warnings = destructive_warnings(cs, *provider_);
    if (warnings.empty()) return;
    if (!config_.accept_data_loss) throw DestructiveChangeError(std::move(warnings));
    for (const auto& w : warnings) LOG_WARN("data loss accepted: {}", w);
}

void Engine::run_script(const std::string& label, const std::vector<std::string>& statements) {
    SQLConnection& conn = connection();
    if (!provider_->supports_transactional_ddl()) {
        for (const auto& stmt : statements) {
            try {
                conn.execute(stmt);
            } catch (const SqlError& e) {
                throw ApplyError(label, stmt, e.what());
            }
        }
        return;
    }

    std::string current;
    try {
        if (!conn.begin()) THROW_AS(MigrateError, "could not start a transaction for {}", label);
        for (const auto& stmt : statements) {
            current = stmt;
            conn.execute(stmt);
        }
        current.clear();
        if (!conn.commit()) THROW_AS(MigrateError, "could not commit {}", label);
    } catch (const SqlError& e) {
        conn.rollback();
        throw ApplyError(label, current, e.what());
    }
}

std::string Engine::db_push(const std::string& schema_text) {
    DbSchema desired = desired_model(load_schema(schema_text));
    ChangeSet cs = diff(desired, introspect());
    if (cs.empty()) {
        LOG_INFO("database already in sync");
        return "";
    }
    check_destructive(cs);

    DDLVisitor visitor(*provider_);
    std::string script = visitor.visit(cs);
    run_script("db push", visitor.statements());
    LOG_INFO("db push: {} statement(s) executed", visitor.statements().size());
    return script;
}

DevResult Engine::migrate_dev(const std::string& schema_text, const std::string& name, bool create_only) {
    DbSchema desired = desired_model(load_schema(schema_text));
    MigrationManager mgr = manager();
    mgr.check_lock_file();

    DevResult result;
    for (;;) {
        DevAction action = dev_diagnostic(mgr, connection(), *provider_, desired, config_.shadow_database_url);
        LOG_DEBUG("dev diagnostic: {} ({})", dev_action_name(action.kind), action.reason);

        if (action.kind == DevActionKind::Reset) throw DriftError(action.reason);

        if (action.kind == DevActionKind::Apply) {
            for (const auto& m : action.pending) {
                mgr.apply(m);
                result.applied.push_back(m.name);
            }
            continue;
        }

        if (action.changes.empty()) {
            LOG_INFO("{}", action.reason);
            return result;
        }
        check_destructive(action.changes);
        Migration created = mgr.create(name, generate(action.changes));
        LOG_INFO("created migration {}", created.name);
        if (!create_only) {
            mgr.apply(created);
            result.applied.push_back(created.name);
        }
        result.created = std::move(created);
        return result;
    }
}

std::vector<std::string> Engine::migrate_deploy() {
    MigrationManager mgr = manager();
    mgr.check_lock_file();

    std::vector<std::string> failed = mgr.failed_migrations();
    if (!failed.empty())
        THROW_AS(DriftError, "found failed migration(s) in the target database: {}; resolve them before deploying",
                 join(failed, ", "));
    for (const auto& name : mgr.missing_migrations())
        LOG_WARN("migration {} is applied to the database but missing locally", name);

    std::vector<std::string> applied;
    for (const auto& m : mgr.pending_migrations()) {
        mgr.apply(m);
        applied.push_back(m.name);
    }
    LOG_INFO("{} migration(s) applied", applied.size());
    return applied;
}

std::vector<MigrationStatus> Engine::migrate_status() {
    return manager().status();
}

std::vector<std::string> Engine::migrate_reset() {
    SQLConnection& conn = connection();
    for (const auto& stmt : provider_->reset_statements(conn)) conn.execute(stmt);

    // the ledger went with everything else; a fresh manager recreates it
    MigrationManager mgr = manager();
    std::vector<std::string> applied;
    for (const auto& m : mgr.local_migrations()) {
        mgr.apply(m);
        applied.push_back(m.name);
    }
    return applied;
}

void Engine::migrate_resolve(const std::string& name, ResolveAction action) {
    manager().resolve(name, action);
}

void Engine::check_lock_file() {
    manager().check_lock_file();
}
