#include <catch2/catch.hpp>
#include "model_builder.hpp"
#include "parser.hpp"
#include "helpers.hpp"

namespace {
    DeclSchema parse_ok(const std::string& text) {
        ParseResult r = parse_schema(text);
        REQUIRE(r.ok());
        return std::move(r.schema);
    }

    const char* shop = R"(
enum Role {
  USER
  ADMIN @map("admin")
}

model User {
  id        Int      @id @default(autoincrement())
  email     String   @unique @db.VarChar(255)
  role      Role     @default(USER)
  nickname  String?  @map("nick_name")
  createdAt DateTime @default(now())
  updatedAt DateTime @updatedAt
  token     String   @default(uuid())
  orders    Order[]

  @@map("users")
}

model Order {
  id      Int     @id @default(autoincrement())
  total   Decimal @default(0)
  note    String  @default("n/a")
  userId  Int
  user    User    @relation(fields: [userId], references: [id])
  coupon  String?
  buyerId Int?
  buyer   User?   @relation("buyer", fields: [buyerId], references: [id], onDelete: Cascade)

  @@unique([userId, coupon])
  @@unique([note])
  @@index([total(sort: Desc)])
}
)";
}

TEST_CASE("PostgreSQL model from a declaration", "[model]") {
    DeclSchema decl = parse_ok(shop);
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DbSchema s = build_model(decl, *pg);

    REQUIRE(s.tables.size() == 2);
    REQUIRE(s.enums.count("Role"));
    REQUIRE(s.enums["Role"].values == std::vector<std::string>{"USER", "admin"});

    const TableInfo* users = s.table("users");
    REQUIRE(users != nullptr);
    REQUIRE(users->primary_key == std::vector<std::string>{"id"});
    REQUIRE(users->column("id")->type == "INTEGER");
    REQUIRE(users->column("id")->auto_increment());
    REQUIRE(users->column("email")->type == "VARCHAR(255)");
    REQUIRE(users->column("email")->unique);
    REQUIRE_FALSE(users->column("email")->nullable);
    REQUIRE(users->column("role")->type == "\"Role\"");
    REQUIRE(users->column("role")->default_value == std::optional<std::string>("USER"));
    REQUIRE(users->column("nick_name") != nullptr);
    REQUIRE(users->column("nick_name")->nullable);
    REQUIRE(users->column("createdAt")->type == "TIMESTAMP(3)");
    REQUIRE(users->column("createdAt")->default_value == std::optional<std::string>("now()"));
    // client-side values have no database default
    REQUIRE_FALSE(users->column("updatedAt")->default_value);
    REQUIRE_FALSE(users->column("token")->default_value);
    // relation fields are not columns
    REQUIRE(users->column("orders") == nullptr);
}

TEST_CASE("Foreign keys, unique constraints and indexes", "[model]") {
    DeclSchema decl = parse_ok(shop);
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DbSchema s = build_model(decl, *pg);
    const TableInfo* order = s.table("Order");
    REQUIRE(order != nullptr);

    REQUIRE(order->column("total")->type == "DECIMAL(65,30)");
    REQUIRE(order->column("total")->default_value == std::optional<std::string>("0"));
    REQUIRE(order->column("note")->default_value == std::optional<std::string>("\"n/a\""));
    // a single-column @@unique folds into the column
    REQUIRE(order->column("note")->unique);

    REQUIRE(order->foreign_keys.size() == 2);
    const ForeignKeyInfo& user = order->foreign_keys[0];
    REQUIRE(user.name == "Order_userId_fkey");
    REQUIRE(user.referenced_table == "users");
    REQUIRE(user.referenced_columns == std::vector<std::string>{"id"});
    REQUIRE(user.on_delete == "RESTRICT");
    REQUIRE(user.on_update == "CASCADE");
    const ForeignKeyInfo& buyer = order->foreign_keys[1];
    REQUIRE(buyer.name == "Order_buyerId_fkey");
    REQUIRE(buyer.on_delete == "CASCADE");

    REQUIRE(order->indexes.size() == 2);
    REQUIRE(order->indexes[0].name == "Order_userId_coupon_key");
    REQUIRE(order->indexes[0].unique);
    REQUIRE(order->indexes[1].name == "Order_total_idx");
    REQUIRE(order->indexes[1].columns[0].sort == "DESC");
    REQUIRE_FALSE(order->indexes[1].unique);
}

TEST_CASE("Optional relations default to SET NULL", "[model]") {
    DeclSchema decl = parse_ok(R"(
model A {
  id  Int  @id
  bId Int?
  b   B?   @relation(fields: [bId], references: [id])
}
model B {
  id Int @id
  as A[]
}
)");
    auto sqlite = make_provider(ProviderKind::SQLite);
    DbSchema s = build_model(decl, *sqlite);
    REQUIRE(s.table("A")->foreign_keys[0].on_delete == "SET NULL");
}

TEST_CASE("Enums without a native type become text with quoted defaults", "[model]") {
    DeclSchema decl = parse_ok(shop);
    auto sqlite = make_provider(ProviderKind::SQLite);
    ModelBuilder builder(decl, *sqlite);
    DbSchema s = builder.build();

    REQUIRE(s.enums.empty());
    const TableInfo* users = s.table("users");
    REQUIRE(users->column("role")->type == "TEXT");
    REQUIRE(users->column("role")->default_value == std::optional<std::string>("\"USER\""));
    // @db.VarChar has no SQLite counterpart
    REQUIRE(users->column("email")->type == "TEXT");
    REQUIRE(builder.warnings().size() == 1);
    REQUIRE(contains(builder.warnings()[0], "@db.VarChar"));
}

TEST_CASE("MySQL inlines enum values in the column type", "[model]") {
    DeclSchema decl = parse_ok(shop);
    auto mysql = make_provider(ProviderKind::MySQL);
    DbSchema s = build_model(decl, *mysql);
    REQUIRE(s.enums.empty());
    const TableInfo* users = s.table("users");
    REQUIRE(users->column("role")->type == "ENUM('USER','admin')");
    REQUIRE(users->column("role")->default_value == std::optional<std::string>("USER"));
    REQUIRE(users->column("nick_name")->type == "VARCHAR(191)");
    REQUIRE(users->column("createdAt")->type == "DATETIME(3)");
}

TEST_CASE("Implicit many-to-many relations get a join table", "[model]") {
    DeclSchema decl = parse_ok(R"(
model Post {
  id   Int   @id
  tags Tag[]
}
model Tag {
  id    String @id
  posts Post[]
}
)");
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DbSchema s = build_model(decl, *pg);
    REQUIRE(s.tables.size() == 3);

    const TableInfo* join = s.table("_PostToTag");
    REQUIRE(join != nullptr);
    REQUIRE(join->column("A")->type == "INTEGER");
    REQUIRE(join->column("B")->type == "TEXT");
    REQUIRE(join->primary_key.empty());
    REQUIRE(join->indexes.size() == 2);
    REQUIRE(join->indexes[0].name == "_PostToTag_AB_unique");
    REQUIRE(join->indexes[0].unique);
    REQUIRE(join->indexes[1].name == "_PostToTag_B_index");
    REQUIRE(join->foreign_keys.size() == 2);
    REQUIRE(join->foreign_keys[0].referenced_table == "Post");
    REQUIRE(join->foreign_keys[1].referenced_table == "Tag");
    REQUIRE(join->foreign_keys[1].on_delete == "CASCADE");
}

TEST_CASE("Composite primary keys come from @@id", "[model]") {
    DeclSchema decl = parse_ok(R"(
model Membership {
  userId  Int
  groupId Int
  since   DateTime? @default(dbgenerated("CURRENT_DATE"))

  @@id([userId, groupId])
}
)");
    auto pg = make_provider(ProviderKind::PostgreSQL);
    DbSchema s = build_model(decl, *pg);
    const TableInfo* m = s.table("Membership");
    REQUIRE(m->primary_key == std::vector<std::string>{"userId", "groupId"});
    REQUIRE(m->column("userId")->primary_key);
    REQUIRE(m->column("since")->default_value == std::optional<std::string>("dbgenerated(\"CURRENT_DATE\")"));
}
