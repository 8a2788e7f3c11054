#include <catch2/catch.hpp>
#include "provider.hpp"
#include "helpers.hpp"

namespace {
    TableInfo users_table(const std::string& email_type) {
        return table("User", {with_default(col("id", "INTEGER"), "autoincrement()"),
                              unique(col("email", email_type))});
    }

    ColumnChange change(const std::string& from, const std::string& to) {
        ColumnChange ch;
        ch.from = col("c", from);
        ch.to = col("c", to);
        ch.type_changed = true;
        return ch;
    }
}

TEST_CASE("CREATE TABLE per provider", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    REQUIRE(pg->create_table(users_table("TEXT"), {}) ==
            "CREATE TABLE \"User\" (\n"
            "    \"id\" SERIAL NOT NULL,\n"
            "    \"email\" TEXT NOT NULL UNIQUE,\n"
            "    CONSTRAINT \"User_pkey\" PRIMARY KEY (\"id\")\n"
            ")");

    auto sqlite = make_provider(ProviderKind::SQLite);
    REQUIRE(sqlite->create_table(users_table("TEXT"), {}) ==
            "CREATE TABLE \"User\" (\n"
            "    \"id\" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,\n"
            "    \"email\" TEXT NOT NULL UNIQUE\n"
            ")");

    auto mysql = make_provider(ProviderKind::MySQL);
    TableInfo t = users_table("VARCHAR(191)");
    t.columns["id"].type = "INT";
    REQUIRE(mysql->create_table(t, {}) ==
            "CREATE TABLE `User` (\n"
            "    `id` INT NOT NULL AUTO_INCREMENT,\n"
            "    `email` VARCHAR(191) NOT NULL,\n"
            "    PRIMARY KEY (`id`),\n"
            "    UNIQUE INDEX `User_email_key`(`email`)\n"
            ")");
}

TEST_CASE("Inline foreign keys and indexes", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    TableInfo post = table("Post", {col("id", "TEXT"), col("authorId", "INTEGER")});
    std::string sql = pg->create_table(post, {fk("Post_authorId_fkey", "authorId", "User")});
    REQUIRE(contains(sql, "CONSTRAINT \"Post_authorId_fkey\" FOREIGN KEY (\"authorId\") REFERENCES \"User\"(\"id\") "
                          "ON DELETE RESTRICT ON UPDATE CASCADE"));

    IndexInfo idx = make_index("Post_title_idx", {"title", "authorId"});
    idx.columns[0].sort = "DESC";
    REQUIRE(pg->create_index("Post", idx) == "CREATE INDEX \"Post_title_idx\" ON \"Post\"(\"title\" DESC, \"authorId\")");
    REQUIRE(pg->drop_index("Post", idx) == "DROP INDEX \"Post_title_idx\"");

    auto mysql = make_provider(ProviderKind::MySQL);
    REQUIRE(mysql->drop_index("Post", idx) == "DROP INDEX `Post_title_idx` ON `Post`");
    REQUIRE(mysql->drop_foreign_key("Post", fk("Post_authorId_fkey", "authorId", "User")) ==
            "ALTER TABLE `Post` DROP FOREIGN KEY `Post_authorId_fkey`");
}

TEST_CASE("Default rendering", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    REQUIRE(pg->render_default(with_default(col("a", "TEXT"), "\"it's\"")) == "'it''s'");
    REQUIRE(pg->render_default(with_default(col("a", "TEXT"), "dbgenerated(\"gen_random_uuid()\")")) == "gen_random_uuid()");
    REQUIRE(pg->render_default(with_default(col("a", "TIMESTAMP(3)"), "now()")) == "CURRENT_TIMESTAMP");
    REQUIRE(pg->render_default(with_default(col("a", "\"Role\""), "USER")) == "'USER'");
    REQUIRE(pg->render_default(with_default(col("a", "INTEGER"), "42")) == "42");
    REQUIRE(pg->render_default(col("a", "INTEGER")).empty());

    auto sqlite = make_provider(ProviderKind::SQLite);
    REQUIRE(sqlite->render_default(with_default(col("a", "TEXT"), "dbgenerated(\"lower('X')\")")) == "(lower('X'))");

    auto mysql = make_provider(ProviderKind::MySQL);
    REQUIRE(mysql->render_default(with_default(col("a", "DATETIME(3)"), "now()")) == "CURRENT_TIMESTAMP(3)");
    REQUIRE(mysql->render_default(with_default(col("a", "VARCHAR(191)"), "\"a\\\\b\"")) == "'a\\\\b'");
}

TEST_CASE("PostgreSQL catalog types normalize to canonical spellings", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    const std::set<std::string> enums = {"Role"};
    REQUIRE(pg->normalize_type("character varying(255)", enums) == "VARCHAR(255)");
    REQUIRE(pg->normalize_type("timestamp(3) without time zone", enums) == "TIMESTAMP(3)");
    REQUIRE(pg->normalize_type("timestamp with time zone", enums) == "TIMESTAMPTZ");
    REQUIRE(pg->normalize_type("numeric(65,30)", enums) == "DECIMAL(65,30)");
    REQUIRE(pg->normalize_type("double precision", enums) == "DOUBLE PRECISION");
    REQUIRE(pg->normalize_type("integer[]", enums) == "INTEGER[]");
    REQUIRE(pg->normalize_type("\"Role\"", enums) == "\"Role\"");
    REQUIRE(pg->normalize_type("Role", enums) == "\"Role\"");
}

TEST_CASE("MySQL column types normalize to canonical spellings", "[provider]") {
    auto mysql = make_provider(ProviderKind::MySQL);
    REQUIRE(mysql->normalize_type("int(11)", {}) == "INT");
    REQUIRE(mysql->normalize_type("tinyint(1)", {}) == "BOOLEAN");
    REQUIRE(mysql->normalize_type("bigint(20) unsigned", {}) == "BIGINT UNSIGNED");
    REQUIRE(mysql->normalize_type("enum('a','B')", {}) == "ENUM('a','B')");
    REQUIRE(mysql->normalize_type("varchar(191)", {}) == "VARCHAR(191)");
}

TEST_CASE("Catalog defaults read back in declaration form", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    ColumnInfo i = col("i", "INTEGER"), t = col("t", "TEXT"), b = col("b", "BOOLEAN"), e = col("e", "\"Role\"");
    REQUIRE(pg->default_from_db("nextval('\"User_id_seq\"'::regclass)", i) == std::optional<std::string>("autoincrement()"));
    REQUIRE(pg->default_from_db("CURRENT_TIMESTAMP", t) == std::optional<std::string>("now()"));
    REQUIRE(pg->default_from_db("'it''s'::text", t) == std::optional<std::string>("\"it's\""));
    REQUIRE(pg->default_from_db("(-1)", i) == std::optional<std::string>("-1"));
    REQUIRE(pg->default_from_db("true", b) == std::optional<std::string>("true"));
    REQUIRE(pg->default_from_db("'USER'::\"Role\"", e) == std::optional<std::string>("USER"));
    REQUIRE(pg->default_from_db("gen_random_uuid()", t) ==
            std::optional<std::string>("dbgenerated(\"gen_random_uuid()\")"));
    REQUIRE_FALSE(pg->default_from_db("NULL::text", t));

    auto sqlite = make_provider(ProviderKind::SQLite);
    REQUIRE(sqlite->default_from_db("'abc'", t) == std::optional<std::string>("\"abc\""));
    REQUIRE(sqlite->default_from_db("1", b) == std::optional<std::string>("true"));
    REQUIRE(sqlite->default_from_db("(lower('X'))", t) == std::optional<std::string>("dbgenerated(\"lower('X')\")"));

    auto mysql = make_provider(ProviderKind::MySQL);
    REQUIRE(mysql->default_from_db("CURRENT_TIMESTAMP(3)", col("d", "DATETIME(3)")) == std::optional<std::string>("now()"));
    REQUIRE(mysql->default_from_db("0", col("b", "BOOLEAN")) == std::optional<std::string>("false"));
    REQUIRE(mysql->default_from_db("abc", col("s", "VARCHAR(191)")) == std::optional<std::string>("\"abc\""));
}

TEST_CASE("Type families drive the modify policy", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    REQUIRE(pg->type_family("VARCHAR(191)") == TypeFamily::Text);
    REQUIRE(pg->type_family("INT UNSIGNED") == TypeFamily::Integer);
    REQUIRE(pg->type_family("TINYINT(1)") == TypeFamily::Boolean);
    REQUIRE(pg->type_family("\"Role\"") == TypeFamily::Enum);
    REQUIRE(pg->type_family("TEXT[]") == TypeFamily::Other);

    REQUIRE(pg->column_change_strategy(change("INTEGER", "TEXT")) == ColumnChangeStrategy::InPlace);
    REQUIRE(pg->column_change_strategy(change("INTEGER", "BIGINT")) == ColumnChangeStrategy::InPlace);
    REQUIRE(pg->column_change_strategy(change("TEXT", "INTEGER")) == ColumnChangeStrategy::DropAndAdd);

    auto mysql = make_provider(ProviderKind::MySQL);
    REQUIRE(mysql->column_change_strategy(change("BOOLEAN", "INT")) == ColumnChangeStrategy::InPlace);
    REQUIRE(mysql->column_change_strategy(change("DATETIME(3)", "INT")) == ColumnChangeStrategy::DropAndAdd);

    auto sqlite = make_provider(ProviderKind::SQLite);
    REQUIRE(sqlite->column_change_strategy(change("TEXT", "INTEGER")) == ColumnChangeStrategy::RedefineTable);
}

TEST_CASE("PostgreSQL alters columns in place", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    TableAlteration alt;
    alt.table = "User";
    alt.actual = table("User", {col("id", "INTEGER"), col("name", "TEXT", true)});
    alt.desired = table("User", {col("id", "INTEGER"), with_default(col("name", "TEXT"), "\"anon\"")});
    ColumnChange ch;
    ch.from = *alt.actual.column("name");
    ch.to = *alt.desired.column("name");
    ch.nullability_changed = true;
    ch.default_changed = true;
    alt.modified.push_back(ch);

    auto stmts = pg->alter_table(alt);
    REQUIRE(stmts == std::vector<std::string>{
        "ALTER TABLE \"User\" ALTER COLUMN \"name\" SET NOT NULL",
        "ALTER TABLE \"User\" ALTER COLUMN \"name\" SET DEFAULT 'anon'",
    });
}

TEST_CASE("Identifier folding and list support", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    auto mysql = make_provider(ProviderKind::MySQL);
    auto sqlite = make_provider(ProviderKind::SQLite);
    REQUIRE(pg->normalize_identifier("User") == "User");
    REQUIRE(pg->normalize_identifier(std::string(80, 'a')).size() == 63);
    REQUIRE(mysql->normalize_identifier(std::string(80, 'a')).size() == 64);
    REQUIRE(sqlite->normalize_identifier("UserRole") == "userrole");
    REQUIRE(pg->supports_scalar_lists());
    REQUIRE_FALSE(mysql->supports_scalar_lists());
    REQUIRE_FALSE(sqlite->supports_scalar_lists());
}

TEST_CASE("PostgreSQL expression index keys", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    REQUIRE(pg->index_expression("lower(email)") == IndexColumn{"email", "", "lower"});
    REQUIRE(pg->index_expression("lower((email)::text)") == IndexColumn{"email", "", "lower"});
    REQUIRE(pg->index_expression("upper(\"Email\")") == IndexColumn{"Email", "", "upper"});
    REQUIRE(pg->index_expression("email") == IndexColumn{"email", "", ""});
}

TEST_CASE("PostgreSQL enum changes", "[provider]") {
    auto pg = make_provider(ProviderKind::PostgreSQL);
    EnumAlteration add;
    add.name = "Role";
    add.added = {"GUEST"};
    add.desired = EnumInfo{"Role", {"USER", "ADMIN", "GUEST"}};
    REQUIRE(pg->alter_enum(add) == std::vector<std::string>{"ALTER TYPE \"Role\" ADD VALUE 'GUEST'"});

    EnumAlteration drop;
    drop.name = "Role";
    drop.removed = {"GUEST"};
    drop.desired = EnumInfo{"Role", {"USER", "ADMIN"}};
    drop.usages.emplace_back("User", with_default(col("role", "\"Role\""), "USER"));
    REQUIRE(pg->alter_enum(drop) == std::vector<std::string>{
        "ALTER TYPE \"Role\" RENAME TO \"Role_old\"",
        "CREATE TYPE \"Role\" AS ENUM ('USER', 'ADMIN')",
        "ALTER TABLE \"User\" ALTER COLUMN \"role\" DROP DEFAULT",
        "ALTER TABLE \"User\" ALTER COLUMN \"role\" TYPE \"Role\" USING (\"role\"::text::\"Role\")",
        "ALTER TABLE \"User\" ALTER COLUMN \"role\" SET DEFAULT 'USER'",
        "DROP TYPE \"Role_old\"",
    });
}

TEST_CASE("SQLite redefines tables it cannot alter", "[provider]") {
    auto sqlite = make_provider(ProviderKind::SQLite);
    TableAlteration add;
    add.table = "User";
    add.actual = table("User", {col("id", "INTEGER"), col("name", "TEXT")});
    add.desired = table("User", {col("id", "INTEGER"), col("name", "TEXT"), col("bio", "TEXT", true)});
    add.added.push_back(*add.desired.column("bio"));
    REQUIRE_FALSE(sqlite->redefines(add));
    REQUIRE(sqlite->alter_table(add) == std::vector<std::string>{"ALTER TABLE \"User\" ADD COLUMN \"bio\" TEXT"});

    TableAlteration drop;
    drop.table = "User";
    drop.actual = table("User", {col("id", "INTEGER"), col("name", "TEXT"), col("age", "INTEGER", true)});
    drop.desired = table("User", {col("id", "INTEGER"), col("name", "TEXT")});
    drop.dropped.push_back(*drop.actual.column("age"));
    REQUIRE(sqlite->redefines(drop));
    auto stmts = sqlite->alter_table(drop);
    REQUIRE(stmts.front() == "PRAGMA defer_foreign_keys=ON");
    REQUIRE(stmts.back() == "PRAGMA defer_foreign_keys=OFF");
    REQUIRE(any_contains(stmts, "CREATE TABLE \"new_User\""));
    REQUIRE(any_contains(stmts, "INSERT INTO \"new_User\" (\"id\", \"name\") SELECT \"id\", \"name\" FROM \"User\""));
    REQUIRE(any_contains(stmts, "ALTER TABLE \"new_User\" RENAME TO \"User\""));
}
