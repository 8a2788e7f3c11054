#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "changeset.hpp"
#include "config.hpp"
#include "decl.hpp"
#include "model.hpp"

class SQLConnection;

// Catalog queries, all aliased to one row shape so the introspector stays
// provider-neutral. The per-table queries take the table name as their only
// parameter.
struct IntrospectionQueries {
    std::string tables;       // table_name
    std::string columns;      // column_name, data_type, is_nullable, column_default, pk_position, extra
    std::string indexes;      // index_name, column_name, is_unique, seq, sort_desc, origin[, expression]
    std::string foreign_keys; // constraint_name, column_name, ref_table, ref_column, on_delete, on_update, seq
    std::string enums;        // enum_name, enum_value; empty when the provider has no enum types
};

// Coarse type classes used by the modify policy and default rendering.
enum class TypeFamily { Integer, Numeric, Text, Enum, Temporal, Boolean, Json, Binary, Other };

// Everything dialect-specific lives behind this interface; one implementation
// per database.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ProviderKind kind() const = 0;
    std::string name() const { return provider_name(kind()); }

    /* ---------- types ---------- */
    virtual std::string map_type(ScalarType type) const = 0;
    // @db.<name>(args); nullopt when the provider has no such native type
    virtual std::optional<std::string> native_type(const std::string& name,
                                                   const std::vector<std::string>& args) const = 0;
    virtual std::string enum_column_type(const EnumInfo& e) const = 0;
    virtual bool supports_enum_types() const { return false; }
    virtual bool supports_scalar_lists() const { return false; }
    // catalog spelling -> canonical spelling used by map_type
    virtual std::string normalize_type(const std::string& db_type, const std::set<std::string>& enum_names) const = 0;
    virtual TypeFamily type_family(const std::string& canonical_type) const;

    /* ---------- identifiers and literals ---------- */
    virtual std::string quote_identifier(const std::string& name) const = 0;
    virtual std::string quote_string(const std::string& value) const;
    std::string quote_list(const std::vector<std::string>& names) const;
    virtual std::string normalize_identifier(const std::string& name) const { return name; }

    /* ---------- defaults ---------- */
    // SQL for the column's default expression; empty when none is rendered
    virtual std::string render_default(const ColumnInfo& column) const;
    // catalog default text -> declaration form, nullopt when it means "no default"
    virtual std::optional<std::string> default_from_db(const std::string& raw, const ColumnInfo& column) const = 0;

    /* ---------- DDL ---------- */
    virtual std::string column_definition(const ColumnInfo& column, const TableInfo& table) const;
    // type as written in DDL; PostgreSQL swaps in SERIAL for autoincrement
    virtual std::string column_type_sql(const ColumnInfo& column) const { return column.type; }
    std::string create_table(const TableInfo& table, const std::vector<ForeignKeyInfo>& inline_fks,
                             const std::string& name_override = "") const;
    virtual std::string create_index(const std::string& table, const IndexInfo& index) const;
    virtual std::string drop_index(const std::string& table, const IndexInfo& index) const;
    std::string foreign_key_clause(const ForeignKeyInfo& fk) const;
    virtual std::string add_foreign_key(const std::string& table, const ForeignKeyInfo& fk) const;
    virtual std::string drop_foreign_key(const std::string& table, const ForeignKeyInfo& fk) const = 0;
    virtual std::string drop_table(const std::string& table) const;
    virtual bool supports_add_constraint() const { return true; }
    // column, key and constraint changes of one table, in execution order
    virtual std::vector<std::string> alter_table(const TableAlteration& alt) const = 0;
    // true when alter_table rebuilds the whole table (indexes and FKs included)
    virtual bool redefines(const TableAlteration&) const { return false; }
    virtual std::vector<std::string> create_enum(const EnumInfo&) const { return {}; }
    virtual std::vector<std::string> alter_enum(const EnumAlteration&) const { return {}; }
    virtual std::vector<std::string> drop_enum(const EnumInfo&) const { return {}; }
    // statements that must precede everything else (extensions)
    virtual std::vector<std::string> prelude(const ChangeSet&) const { return {}; }

    /* ---------- policy ---------- */
    virtual ColumnChangeStrategy column_change_strategy(const ColumnChange& change) const = 0;
    bool index_order_significant() const { return index_order_significant_; }
    void set_index_order_significant(bool value) { index_order_significant_ = value; }
    virtual bool supports_transactional_ddl() const { return true; }

    /* ---------- introspection ---------- */
    virtual const IntrospectionQueries& introspection_queries() const = 0;
    // provider-only catalog facts not covered by the shared queries
    virtual void complete_table(SQLConnection&, TableInfo&) const {}
    // MySQL creates a backing index for each foreign key
    virtual bool implicit_fk_indexes() const { return false; }
    // expression key of an index, split into the wrapping function and its column
    virtual IndexColumn index_expression(const std::string& expr) const { return IndexColumn{expr, "", ""}; }
    virtual std::string placeholder(int) const { return "?"; }

    /* ---------- migration support ---------- */
    virtual std::string ledger_table_ddl(const std::string& table) const = 0;
    // drops every object in the target database or schema, ledger included
    virtual std::vector<std::string> reset_statements(SQLConnection& conn) const = 0;

protected:
    // rendered inside CREATE TABLE after the columns
    virtual std::vector<std::string> table_constraints(const TableInfo& table) const;
    virtual bool inline_unique() const { return true; }
    // SQL for a dbgenerated(...) expression inside DEFAULT
    virtual std::string default_expression(const std::string& expr) const { return expr; }
    std::string primary_key_name(const TableInfo& table) const { return table.name + "_pkey"; }
    static bool same_family_or_text(TypeFamily from, TypeFamily to);

    bool index_order_significant_ = false;
};

using PProvider = std::unique_ptr<Provider>;

PProvider make_provider(ProviderKind kind);
PProvider make_postgres_provider();
PProvider make_mysql_provider();
PProvider make_sqlite_provider();

// Conventional unique-constraint name for a column flagged unique.
std::string unique_key_name(const std::string& table, const std::string& column);

// Declaration-form string literal helpers: abc <-> "abc"
std::string decl_quote(const std::string& value);
std::string decl_unquote(const std::string& literal);
bool is_number_literal(const std::string& s);

// Numeric-literal aware comparison of two declaration-form defaults.
bool same_default(const std::optional<std::string>& a, const std::optional<std::string>& b);
