#include "migrations.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include "checksum.hpp"
#include "errors.hpp"
#include "lib.hpp"
#include "sqlsplit.hpp"

namespace fs = std::filesystem;

namespace {
    std::tm utc(std::chrono::system_clock::time_point at) {
        std::time_t t = std::chrono::system_clock::to_time_t(at);
        std::tm out{};
        gmtime_r(&t, &out);
        return out;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) throw FilesystemError("cannot read file", path.string());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) throw FilesystemError("cannot write file", path.string());
        out << content;
        if (!out) throw FilesystemError("cannot write file", path.string());
    }
}

std::string Migration::checksum() const { return migration_checksum(sql); }

std::string migration_state_name(MigrationState state) {
    switch (state) {
        case MigrationState::LocalOnly:      return "local-only";
        case MigrationState::Applied:        return "applied";
        case MigrationState::Failed:         return "failed";
        case MigrationState::RolledBack:     return "rolled-back";
        case MigrationState::MissingLocally: return "missing-locally";
    }
    return "unknown";
}

std::string normalize_migration_name(const std::string& description) {
    std::string out;
    for (char ch : to_lower(description)) {
        char c = (ch == ' ' || ch == '-') ? '_' : ch;
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!keep) continue;
        if (c == '_' && !out.empty() && out.back() == '_') continue;
        out += c;
    }
    size_t b = out.find_first_not_of('_');
    if (b == std::string::npos) return "migration";
    size_t e = out.find_last_not_of('_');
    return out.substr(b, e - b + 1);
}

std::string migration_timestamp(std::chrono::system_clock::time_point at) {
    std::tm tm = utc(at);
    return fmt::format("{:04}{:02}{:02}{:02}{:02}{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string ledger_timestamp(std::chrono::system_clock::time_point at) {
    std::tm tm = utc(at);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count() % 1000;
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
}

bool is_migration_dir_name(const std::string& name) {
    if (name.size() < 16 || name[14] != '_') return false;
    return std::all_of(name.begin(), name.begin() + 14, [](char c) { return c >= '0' && c <= '9'; });
}

MigrationManager::MigrationManager(SQLConnection& conn, const Provider& provider, std::string migrations_dir)
    : conn_(conn), provider_(provider), dir_(std::move(migrations_dir)), ledger_(conn, provider) {}

std::vector<Migration> MigrationManager::local_migrations() const {
    std::vector<Migration> out;
    std::error_code ec;
    fs::file_status st = fs::status(dir_, ec);
    if (st.type() == fs::file_type::not_found) return out;
    if (ec) throw FilesystemError("cannot read migrations directory: " + ec.message(), dir_);
    if (!fs::is_directory(st)) throw FilesystemError("migrations path is not a directory", dir_);

    fs::directory_iterator it(dir_, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;
        std::string name = it->path().filename().string();
        if (!is_migration_dir_name(name)) continue;
        fs::path sql = it->path() / "migration.sql";
        if (!fs::exists(sql)) {
            LOG_WARN("migration directory {} has no migration.sql, skipped", name);
            continue;
        }
        out.push_back(Migration{name, it->path().string(), read_file(sql)});
    }
    if (ec) throw FilesystemError("cannot list migrations: " + ec.message(), dir_);
    std::sort(out.begin(), out.end(), [](const Migration& a, const Migration& b) { return a.name < b.name; });
    return out;
}

const Migration* MigrationManager::find_local(const std::vector<Migration>& local, const std::string& name) const {
    for (const auto& m : local)
        if (m.name == name) return &m;
    return nullptr;
}

std::vector<std::string> MigrationManager::applied_migrations() {
    std::vector<std::string> out;
    for (const auto& e : ledger_.entries())
        if (e.applied()) out.push_back(e.migration_name);
    return out;
}

std::vector<Migration> MigrationManager::pending_migrations() {
    std::vector<std::string> applied = applied_migrations();
    std::set<std::string> done(applied.begin(), applied.end());
    std::vector<Migration> out;
    for (auto& m : local_migrations())
        if (!done.count(m.name)) out.push_back(std::move(m));
    return out;
}

std::vector<std::string> MigrationManager::missing_migrations() {
    std::vector<Migration> local = local_migrations();
    std::vector<std::string> out;
    for (const auto& name : applied_migrations())
        if (!find_local(local, name)) out.push_back(name);
    return out;
}

std::vector<std::string> MigrationManager::modified_migrations() {
    std::vector<Migration> local = local_migrations();
    std::vector<std::string> out;
    for (const auto& e : ledger_.entries()) {
        if (!e.applied() || e.checksum == MANUAL_CHECKSUM) continue;
        const Migration* m = find_local(local, e.migration_name);
        if (m && m->checksum() != e.checksum) out.push_back(e.migration_name);
    }
    return out;
}

std::vector<std::string> MigrationManager::failed_migrations() {
    std::vector<std::string> out;
    for (const auto& e : ledger_.entries())
        if (e.failed()) out.push_back(e.migration_name);
    return out;
}

std::vector<MigrationStatus> MigrationManager::status() {
    std::vector<Migration> local = local_migrations();
    // latest ledger row per name wins
    std::map<std::string, LedgerEntry> rows;
    for (const auto& e : ledger_.entries()) rows[e.migration_name] = e;

    std::map<std::string, MigrationStatus> by_name;
    for (const auto& m : local) by_name[m.name] = MigrationStatus{m.name, MigrationState::LocalOnly, false};
    for (const auto& [name, e] : rows) {
        MigrationStatus& st = by_name[name];
        st.name = name;
        const Migration* m = find_local(local, name);
        if (!m) st.state = MigrationState::MissingLocally;
        else if (e.applied()) st.state = MigrationState::Applied;
        else if (e.failed()) st.state = MigrationState::Failed;
        else st.state = MigrationState::RolledBack;
        st.modified = m && e.applied() && e.checksum != MANUAL_CHECKSUM && m->checksum() != e.checksum;
    }
    std::vector<MigrationStatus> out;
    for (auto& [_, st] : by_name) out.push_back(st);
    return out;
}

void MigrationManager::apply(const Migration& migration) {
    ledger_.ensure_table();
    std::vector<std::string> statements = sqlsplit::split(migration.sql);
    std::string checksum = migration.checksum();
    std::string started = ledger_timestamp(std::chrono::system_clock::now());
    LOG_INFO("applying migration {} ({} statements)", migration.name, statements.size());

    size_t step = 0;
    if (provider_.supports_transactional_ddl()) {
        try {
            if (!conn_.begin()) THROW_AS(MigrateError, "cannot open a transaction for {}", migration.name);
            for (; step < statements.size(); ++step) conn_.execute(statements[step]);
            ledger_.record_applied(migration.name, checksum, static_cast<int>(step), started,
                                   ledger_timestamp(std::chrono::system_clock::now()));
            if (!conn_.commit()) THROW_AS(MigrateError, "commit of {} was not applied", migration.name);
        } catch (const SqlError& e) {
            conn_.rollback();
            std::string failed = step < statements.size() ? statements[step] : e.sql();
            LOG_ERROR("migration {} failed: {}", migration.name, e.what());
            throw ApplyError(migration.name, failed, e.what());
        }
        return;
    }

    // no transactional DDL: statements run one by one and a failure is recorded
    for (; step < statements.size(); ++step) {
        try {
            conn_.execute(statements[step]);
        } catch (const SqlError& e) {
            LOG_ERROR("migration {} failed at step {}: {}", migration.name, step + 1, e.what());
            ledger_.record_failed(migration.name, checksum, std::string(e.what()) + "\n" + statements[step],
                                  static_cast<int>(step), started);
            throw ApplyError(migration.name, statements[step], e.what());
        }
    }
    ledger_.record_applied(migration.name, checksum, static_cast<int>(step), started,
                           ledger_timestamp(std::chrono::system_clock::now()));
}

Migration MigrationManager::create(const std::string& description, const std::string& sql,
                                   std::chrono::system_clock::time_point now) {
    Migration m;
    m.name = migration_timestamp(now) + "_" + normalize_migration_name(description);
    fs::path dir = fs::path(dir_) / m.name;
    m.path = dir.string();
    m.sql = sql;

    std::error_code ec;
    if (fs::exists(dir, ec)) throw FilesystemError("migration already exists", m.path);
    fs::create_directories(dir, ec);
    if (ec) throw FilesystemError("cannot create migration directory: " + ec.message(), m.path);
    write_file(dir / "migration.sql", sql);
    write_lock_file();
    LOG_INFO("created migration {}", m.name);
    return m;
}

void MigrationManager::resolve(const std::string& name, ResolveAction action) {
    if (action == ResolveAction::RolledBack) {
        ledger_.mark_rolled_back(name);
        return;
    }
    std::vector<Migration> local = local_migrations();
    const Migration* m = find_local(local, name);
    if (!m) THROW_AS(MigrateError, "migration '{}' not found in {}", name, dir_);
    ledger_.mark_applied(name, m->checksum());
}

void MigrationManager::check_lock_file() const {
    fs::path path = fs::path(dir_) / LOCK_FILE;
    std::error_code ec;
    if (!fs::exists(path, ec)) return;
    std::istringstream in(read_file(path));
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.rfind("provider", 0) != 0) continue;
        size_t q1 = line.find('"');
        size_t q2 = line.find('"', q1 + 1);
        if (q1 == std::string::npos || q2 == std::string::npos) continue;
        std::string locked = line.substr(q1 + 1, q2 - q1 - 1);
        if (provider_from_name(locked) != provider_.kind())
            THROW_AS(DriftError, "{} is locked to provider '{}' but the configured provider is '{}'",
                     path.string(), locked, provider_.name());
        return;
    }
}

void MigrationManager::write_lock_file() const {
    fs::path path = fs::path(dir_) / LOCK_FILE;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        check_lock_file();
        return;
    }
    fs::create_directories(dir_, ec);
    write_file(path, "# Please do not edit this file manually\n"
                     "# It should be added in your version-control system (e.g., Git)\n"
                     "provider = \"" + provider_.name() + "\"\n");
}
