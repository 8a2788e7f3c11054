#include <catch2/catch.hpp>
#include <algorithm>
#include "ddl_visitor.hpp"
#include "schemaupdate.hpp"
#include "helpers.hpp"

namespace {
    TableInfo user_table() {
        return table("User", {with_default(col("id", "INTEGER"), "autoincrement()"), col("email", "TEXT")});
    }

    TableInfo post_table() {
        TableInfo t = table("Post", {col("id", "TEXT"), col("authorId", "INTEGER")});
        t.foreign_keys.push_back(fk("Post_authorId_fkey", "authorId", "User"));
        return t;
    }

    // A.bId -> B and B.aId -> A
    std::vector<TableInfo> cycle() {
        TableInfo a = table("A", {col("id", "TEXT"), col("bId", "TEXT", true)});
        a.foreign_keys.push_back(fk("A_bId_fkey", "bId", "B"));
        TableInfo b = table("B", {col("id", "TEXT"), col("aId", "TEXT", true)});
        b.foreign_keys.push_back(fk("B_aId_fkey", "aId", "A"));
        return {a, b};
    }
}

TEST_CASE("Empty change set renders nothing", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DDLVisitor v(*pg);
    REQUIRE(v.visit(ChangeSet{}).empty());
    REQUIRE(v.statements().empty());
}

TEST_CASE("Script sections are commented and terminated", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    ChangeSet cs;
    cs.index_changes.push_back(IndexChange{"User", {make_index("User_email_idx", {"email"})}, {}});
    DDLVisitor v(*pg);
    REQUIRE(v.visit(cs) == "-- CreateIndex\nCREATE INDEX \"User_email_idx\" ON \"User\"(\"email\");\n\n");
    REQUIRE(v.statements() == std::vector<std::string>{"CREATE INDEX \"User_email_idx\" ON \"User\"(\"email\")"});
}

TEST_CASE("Referenced tables are created first", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    ChangeSet cs;
    cs.tables_to_create = {post_table(), user_table()};
    DDLVisitor v(*pg);
    v.visit(cs);
    const auto& stmts = v.statements();
    REQUIRE(stmts.size() == 2);
    REQUIRE(contains(stmts[0], "CREATE TABLE \"User\""));
    REQUIRE(contains(stmts[1], "CREATE TABLE \"Post\""));
    REQUIRE(contains(stmts[1], "REFERENCES \"User\"(\"id\")"));
}

TEST_CASE("Foreign key cycles", "[ddl]") {
    ChangeSet cs;
    cs.tables_to_create = cycle();

    SECTION("PostgreSQL adds the closing constraint afterwards") {
        auto pg = make_provider(ProviderKind::PostgreSQL);
        DDLVisitor v(*pg);
        std::string script = v.visit(cs);
        const auto& stmts = v.statements();
        REQUIRE(stmts.size() == 3);
        REQUIRE(contains(stmts[0], "CREATE TABLE \"A\""));
        REQUIRE_FALSE(contains(stmts[0], "FOREIGN KEY"));
        REQUIRE(contains(stmts[1], "CONSTRAINT \"B_aId_fkey\" FOREIGN KEY"));
        REQUIRE(stmts[2] == "ALTER TABLE \"A\" ADD CONSTRAINT \"A_bId_fkey\" FOREIGN KEY (\"bId\") "
                            "REFERENCES \"B\"(\"id\") ON DELETE RESTRICT ON UPDATE CASCADE");
        REQUIRE(contains(script, "-- AddForeignKey\n"));
    }
    SECTION("SQLite keeps every constraint inline") {
        auto sqlite = make_provider(ProviderKind::SQLite);
        DDLVisitor v(*sqlite);
        v.visit(cs);
        const auto& stmts = v.statements();
        REQUIRE(stmts.size() == 2);
        REQUIRE(contains(stmts[0], "CONSTRAINT \"A_bId_fkey\" FOREIGN KEY"));
        REQUIRE(contains(stmts[1], "CONSTRAINT \"B_aId_fkey\" FOREIGN KEY"));
    }
}

TEST_CASE("Dependent tables are dropped first", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    ChangeSet cs;
    cs.tables_to_drop = {user_table(), post_table()};
    DDLVisitor v(*pg);
    v.visit(cs);
    REQUIRE(v.statements() == std::vector<std::string>{"DROP TABLE \"Post\"", "DROP TABLE \"User\""});
}

TEST_CASE("Enums come before the tables using them and go after", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    ChangeSet cs;
    cs.enums_to_create.push_back(EnumInfo{"Role", {"USER", "ADMIN"}});
    cs.tables_to_create.push_back(table("Member", {col("id", "TEXT"), with_default(col("role", "\"Role\""), "USER")}));
    cs.enums_to_drop.push_back(EnumInfo{"Mood", {"HAPPY"}});
    DDLVisitor v(*pg);
    v.visit(cs);
    const auto& stmts = v.statements();
    REQUIRE(stmts.size() == 3);
    REQUIRE(stmts[0] == "CREATE TYPE \"Role\" AS ENUM ('USER', 'ADMIN')");
    REQUIRE(contains(stmts[1], "\"role\" \"Role\" NOT NULL DEFAULT 'USER'"));
    REQUIRE(stmts[2] == "DROP TYPE \"Mood\"");
}

TEST_CASE("Removing an enum value converts the live columns only", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DbSchema actual = schema_of({table("User", {col("id", "TEXT"), col("role", "\"Role\"")})});
    actual.enums["Role"] = EnumInfo{"Role", {"A", "B"}};
    DbSchema desired = schema_of({table("User", {col("id", "TEXT"), col("role", "\"Role\""), col("tier", "\"Role\"")})});
    desired.enums["Role"] = EnumInfo{"Role", {"A"}};

    DDLVisitor v(*pg);
    v.visit(SchemaUpdate(desired, actual, *pg).compare());
    REQUIRE(v.statements() == std::vector<std::string>{
        "ALTER TYPE \"Role\" RENAME TO \"Role_old\"",
        "CREATE TYPE \"Role\" AS ENUM ('A')",
        "ALTER TABLE \"User\" ALTER COLUMN \"role\" TYPE \"Role\" USING (\"role\"::text::\"Role\")",
        "DROP TYPE \"Role_old\"",
        "ALTER TABLE \"User\" ADD COLUMN \"tier\" \"Role\" NOT NULL",
    });
}

TEST_CASE("Removing an enum value converts lists and columns about to go", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DbSchema actual = schema_of({
        table("User", {col("id", "TEXT"), with_default(col("role", "\"Role\""), "B"), col("tags", "\"Role\"[]", true)}),
        table("Legacy", {col("id", "TEXT"), col("role", "\"Role\"")}),
    });
    actual.enums["Role"] = EnumInfo{"Role", {"A", "B"}};
    DbSchema desired = schema_of({table("User", {col("id", "TEXT"), with_default(col("role", "\"Role\""), "A")})});
    desired.enums["Role"] = EnumInfo{"Role", {"A"}};

    ChangeSet cs = SchemaUpdate(desired, actual, *pg).compare();
    REQUIRE(cs.enums_to_alter.size() == 1);
    REQUIRE(cs.enums_to_alter[0].usages.size() == 3);

    DDLVisitor v(*pg);
    v.visit(cs);
    const auto& stmts = v.statements();
    REQUIRE(stmts.size() > 7);
    REQUIRE(std::vector<std::string>(stmts.begin(), stmts.begin() + 7) == std::vector<std::string>{
        "ALTER TYPE \"Role\" RENAME TO \"Role_old\"",
        "CREATE TYPE \"Role\" AS ENUM ('A')",
        "ALTER TABLE \"Legacy\" ALTER COLUMN \"role\" TYPE \"Role\" USING (\"role\"::text::\"Role\")",
        "ALTER TABLE \"User\" ALTER COLUMN \"role\" DROP DEFAULT",
        "ALTER TABLE \"User\" ALTER COLUMN \"role\" TYPE \"Role\" USING (\"role\"::text::\"Role\")",
        "ALTER TABLE \"User\" ALTER COLUMN \"tags\" TYPE \"Role\"[] USING (\"tags\"::text[]::\"Role\"[])",
        "DROP TYPE \"Role_old\"",
    });
    REQUIRE(std::find(stmts.begin(), stmts.end(), "ALTER TABLE \"User\" ALTER COLUMN \"role\" SET DEFAULT 'A'") !=
            stmts.end());
}

TEST_CASE("UUID defaults pull in pgcrypto", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    ChangeSet cs;
    cs.tables_to_create.push_back(
        table("Token", {with_default(col("id", "UUID"), "dbgenerated(\"gen_random_uuid()\")")}));
    DDLVisitor v(*pg);
    v.visit(cs);
    REQUIRE(v.statements().front() == "CREATE EXTENSION IF NOT EXISTS \"pgcrypto\"");
    REQUIRE(contains(v.statements().back(), "DEFAULT gen_random_uuid()"));
}

TEST_CASE("Alterations drop before they add", "[ddl]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    TableAlteration alt;
    alt.table = "Post";
    alt.actual = post_table();
    alt.desired = post_table();
    alt.desired.add_column(col("title", "TEXT", true));
    alt.added.push_back(*alt.desired.column("title"));
    alt.indexes_dropped.push_back(make_index("Post_old_idx", {"authorId"}));
    alt.indexes_added.push_back(make_index("Post_title_idx", {"title"}));
    alt.foreign_keys_dropped.push_back(alt.actual.foreign_keys[0]);
    ForeignKeyInfo cascading = alt.actual.foreign_keys[0];
    cascading.on_delete = "CASCADE";
    alt.foreign_keys_added.push_back(cascading);

    ChangeSet cs;
    cs.tables_to_alter.push_back(alt);
    DDLVisitor v(*pg);
    v.visit(cs);
    REQUIRE(v.statements() == std::vector<std::string>{
        "ALTER TABLE \"Post\" DROP CONSTRAINT \"Post_authorId_fkey\"",
        "DROP INDEX \"Post_old_idx\"",
        "ALTER TABLE \"Post\" ADD COLUMN \"title\" TEXT",
        "CREATE INDEX \"Post_title_idx\" ON \"Post\"(\"title\")",
        "ALTER TABLE \"Post\" ADD CONSTRAINT \"Post_authorId_fkey\" FOREIGN KEY (\"authorId\") "
        "REFERENCES \"User\"(\"id\") ON DELETE CASCADE ON UPDATE CASCADE",
    });
}

TEST_CASE("SQLite redefinitions absorb index and key changes", "[ddl]") {
    auto sqlite = make_provider(ProviderKind::SQLite);
    TableAlteration alt;
    alt.table = "Post";
    alt.actual = post_table();
    alt.desired = table("Post", {col("id", "TEXT")});
    alt.desired.indexes.push_back(make_index("Post_id_idx", {"id"}));
    alt.dropped.push_back(*alt.actual.column("authorId"));
    alt.foreign_keys_dropped.push_back(alt.actual.foreign_keys[0]);
    alt.indexes_added.push_back(alt.desired.indexes[0]);

    ChangeSet cs;
    cs.tables_to_alter.push_back(alt);
    DDLVisitor v(*sqlite);
    std::string script = v.visit(cs);
    REQUIRE(contains(script, "-- RedefineTables\n"));
    REQUIRE_FALSE(contains(script, "-- CreateIndex"));
    REQUIRE_FALSE(contains(script, "-- DropForeignKey"));
    REQUIRE(std::count(v.statements().begin(), v.statements().end(),
                       "CREATE INDEX \"Post_id_idx\" ON \"Post\"(\"id\")") == 1);
}
