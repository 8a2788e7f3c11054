#include <catch2/catch.hpp>
#include "engine.hpp"
#include "errors.hpp"
#include "helpers.hpp"

namespace fs = std::filesystem;

namespace {
    const char* v1 = R"(
model Author {
  id    Int     @id @default(autoincrement())
  email String  @unique
  bio   String?
  books Book[]
}

model Book {
  id       Int    @id @default(autoincrement())
  title    String
  authorId Int
  author   Author @relation(fields: [authorId], references: [id])
}
)";

    // bio dropped
    const char* v2 = R"(
model Author {
  id    Int    @id @default(autoincrement())
  email String @unique
  books Book[]
}

model Book {
  id       Int    @id @default(autoincrement())
  title    String
  authorId Int
  author   Author @relation(fields: [authorId], references: [id])
}
)";

    // v1 plus an optional column
    std::string v3() {
        std::string s = v1;
        s.replace(s.find("  title    String\n"), 18, "  title    String\n  isbn     String?\n");
        return s;
    }

    EngineConfig sqlite_config(const TempDir& tmp, bool accept_data_loss = false) {
        EngineConfig cfg;
        cfg.provider = ProviderKind::SQLite;
        cfg.migrations_dir = tmp.str("migrations");
        cfg.accept_data_loss = accept_data_loss;
        return cfg;
    }

    PSQLConnection memory_db() {
        PSQLConnection conn = make_sqlite_connection();
        conn->connect(":memory:");
        return conn;
    }

    bool has_table(SQLConnection& conn, const std::string& name) {
        return !conn.select("SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?", {name}).Empty();
    }
}

TEST_CASE("Diffing two declarations offline", "[engine]") {
    EngineConfig cfg;
    cfg.provider = ProviderKind::PostgreSQL;
    Engine engine(cfg);

    std::string script = engine.migrate_diff("", v1);
    REQUIRE(contains(script, "-- CreateTable\nCREATE TABLE \"Author\""));
    REQUIRE(contains(script, "\"id\" SERIAL NOT NULL"));
    REQUIRE(contains(script, "REFERENCES \"Author\"(\"id\")"));
    REQUIRE(script.find("\"Author\" (") < script.find("\"Book\" ("));

    REQUIRE(engine.migrate_diff(v1, v1).empty());
    REQUIRE(engine.migrate_diff(v1, v2) == "-- AlterTable\nALTER TABLE \"Author\" DROP COLUMN \"bio\";\n\n");
}

TEST_CASE("Declarations are checked before use", "[engine]") {
    Engine engine(EngineConfig{});
    REQUIRE_THROWS_AS(engine.load_schema("model A {\n  id Int @id\n"), SchemaSyntaxError);
    REQUIRE_THROWS_AS(engine.load_schema("datasource db {\n  url = \"x\\"), SchemaSyntaxError);
    REQUIRE_THROWS_AS(engine.load_schema("model A {\n  id Foo @id\n}\n"), ValidationError);
    REQUIRE_THROWS_AS(engine.migrate_diff("", "model B {\n  name String\n}\n"), ValidationError);
}

TEST_CASE("The datasource picks the provider unless configured", "[engine]") {
    const std::string decl = "datasource db {\n  provider = \"mysql\"\n  url = \"mysql://localhost/app\"\n}\n\n"
                             "model A {\n  id Int @id\n}\n";

    Engine open(EngineConfig{});
    REQUIRE(open.provider().kind() == ProviderKind::SQLite);
    open.load_schema(decl);
    REQUIRE(open.provider().kind() == ProviderKind::MySQL);

    EngineConfig pinned;
    pinned.provider = ProviderKind::PostgreSQL;
    Engine fixed(pinned);
    fixed.load_schema(decl);
    REQUIRE(fixed.provider().kind() == ProviderKind::PostgreSQL);

    EngineConfig by_url;
    by_url.database_url = "mysql://root@localhost/app";
    REQUIRE(Engine(by_url).provider().kind() == ProviderKind::MySQL);
}

TEST_CASE("A database is required for online commands", "[engine]") {
    Engine engine(EngineConfig{});
    REQUIRE_THROWS_AS(engine.introspect(), ConnectivityError);
}

TEST_CASE("db push converges without a ledger", "[engine]") {
    TempDir tmp;
    Engine engine(sqlite_config(tmp), memory_db());

    std::string script = engine.db_push(v1);
    REQUIRE(contains(script, "CREATE TABLE \"Author\""));
    REQUIRE(has_table(engine.connection(), "Book"));
    REQUIRE_FALSE(has_table(engine.connection(), MigrationLedger::TABLE));
    REQUIRE(engine.db_push(v1).empty());

    try {
        engine.db_push(v2);
        FAIL("expected DestructiveChangeError");
    } catch (const DestructiveChangeError& e) {
        REQUIRE(e.warnings().size() == 1);
        REQUIRE(contains(e.warnings()[0], "`bio`"));
    }
    REQUIRE(engine.introspect().table("Author")->column("bio"));
}

TEST_CASE("db push drops data when allowed", "[engine]") {
    TempDir tmp;
    Engine engine(sqlite_config(tmp, true), memory_db());
    engine.db_push(v1);
    engine.connection().execute("INSERT INTO \"Author\" (\"email\", \"bio\") VALUES ('a@b.c', 'hi')");

    engine.db_push(v2);
    DbSchema after = engine.introspect();
    REQUIRE_FALSE(after.table("Author")->column("bio"));
    REQUIRE(engine.connection().select("SELECT email FROM \"Author\"").Size() == 1);
}

TEST_CASE("Development loop", "[engine]") {
    TempDir tmp;
    Engine engine(sqlite_config(tmp), memory_db());

    DevResult first = engine.migrate_dev(v1, "init");
    REQUIRE(first.created);
    REQUIRE(first.applied == std::vector<std::string>{first.created->name});
    REQUIRE(fs::exists(fs::path(first.created->path) / "migration.sql"));
    REQUIRE(fs::exists(tmp.path / "migrations" / MigrationManager::LOCK_FILE));
    REQUIRE(has_table(engine.connection(), "Author"));

    DevResult again = engine.migrate_dev(v1, "noop");
    REQUIRE_FALSE(again.created);
    REQUIRE(again.applied.empty());

    SECTION("a changed declaration becomes the next migration") {
        DevResult next = engine.migrate_dev(v3(), "isbn");
        REQUIRE(next.created);
        REQUIRE(contains(next.created->sql, "\"isbn\""));
        REQUIRE(engine.introspect().table("Book")->column("isbn"));
        auto status = engine.migrate_status();
        REQUIRE(status.size() == 2);
        REQUIRE(status[1].state == MigrationState::Applied);
    }
    SECTION("create-only leaves the migration pending") {
        DevResult next = engine.migrate_dev(v3(), "isbn", true);
        REQUIRE(next.created);
        REQUIRE(next.applied.empty());
        REQUIRE_FALSE(engine.introspect().table("Book")->column("isbn"));
        REQUIRE(engine.migrate_status()[1].state == MigrationState::LocalOnly);

        DevResult applied = engine.migrate_dev(v3(), "unused");
        REQUIRE(applied.applied == std::vector<std::string>{next.created->name});
        REQUIRE_FALSE(applied.created);
    }
    SECTION("drift stops the loop") {
        engine.connection().execute("CREATE TABLE \"Stray\" (\"id\" TEXT NOT NULL PRIMARY KEY)");
        REQUIRE_THROWS_AS(engine.migrate_dev(v1, "noop"), DriftError);
    }
}

TEST_CASE("Deploying, resetting and resolving", "[engine]") {
    TempDir tmp;
    write_text(tmp.path / "migrations" / "20240101000000_authors" / "migration.sql",
               "CREATE TABLE \"Author\" (\"id\" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT, \"email\" TEXT NOT NULL);\n");
    write_text(tmp.path / "migrations" / "20240102000000_books" / "migration.sql",
               "CREATE TABLE \"Book\" (\"id\" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT, \"title\" TEXT NOT NULL);\n");
    Engine engine(sqlite_config(tmp), memory_db());

    REQUIRE(engine.migrate_deploy() == std::vector<std::string>{"20240101000000_authors", "20240102000000_books"});
    REQUIRE(engine.migrate_deploy().empty());
    for (const auto& st : engine.migrate_status()) REQUIRE(st.state == MigrationState::Applied);

    SECTION("reset rebuilds from the migrations") {
        engine.connection().execute("CREATE TABLE \"Stray\" (\"id\" TEXT)");
        engine.connection().execute("INSERT INTO \"Book\" (\"title\") VALUES ('x')");
        auto applied = engine.migrate_reset();
        REQUIRE(applied.size() == 2);
        REQUIRE_FALSE(has_table(engine.connection(), "Stray"));
        REQUIRE(engine.connection().select("SELECT id FROM \"Book\"").Empty());
        REQUIRE(engine.migrate_status().size() == 2);
    }
    SECTION("a failed migration blocks deploy until resolved") {
        write_text(tmp.path / "migrations" / "20240103000000_bad" / "migration.sql", "CREATE TABLE \"Book\" (x);\n");
        REQUIRE_THROWS_AS(engine.migrate_deploy(), ApplyError);
        REQUIRE(engine.migrate_status()[2].state == MigrationState::LocalOnly);

        MigrationManager mgr(engine.connection(), engine.provider(), engine.config().migrations_dir);
        mgr.ledger().record_failed("20240103000000_bad", "x", "boom", 0, "2024-01-03 00:00:00.000");
        REQUIRE_THROWS_AS(engine.migrate_deploy(), DriftError);

        engine.migrate_resolve("20240103000000_bad", ResolveAction::RolledBack);
        REQUIRE_THROWS_AS(engine.migrate_deploy(), ApplyError);
        REQUIRE_THROWS_AS(engine.migrate_resolve("20990101000000_none", ResolveAction::RolledBack), MigrateError);
    }
    SECTION("the lock file must match") {
        write_text(tmp.path / "migrations" / MigrationManager::LOCK_FILE, "provider = \"mysql\"\n");
        REQUIRE_THROWS_AS(engine.migrate_deploy(), DriftError);
        REQUIRE_THROWS_AS(engine.check_lock_file(), DriftError);
    }
}
