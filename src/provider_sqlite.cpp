#include "lib.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

/* ---------- SQLite ---------- */

class SqliteProvider : public Provider {
public:
    ProviderKind kind() const override { return ProviderKind::SQLite; }

    std::string map_type(ScalarType type) const override {
        if (type == ScalarType::String  ) return "TEXT"    ;
        if (type == ScalarType::Int     ) return "INTEGER" ;
        if (type == ScalarType::BigInt  ) return "BIGINT"  ;
        if (type == ScalarType::Float   ) return "REAL"    ;
        if (type == ScalarType::Decimal ) return "DECIMAL" ;
        if (type == ScalarType::Boolean ) return "BOOLEAN" ;
        if (type == ScalarType::DateTime) return "DATETIME";
        if (type == ScalarType::Json    ) return "TEXT"    ;
        if (type == ScalarType::Bytes   ) return "BLOB"    ;
        return "TEXT";
    }

    // SQLite has no native type attributes
    std::optional<std::string> native_type(const std::string&, const std::vector<std::string>&) const override {
        return std::nullopt;
    }

    std::string enum_column_type(const EnumInfo&) const override { return "TEXT"; }

    std::string normalize_type(const std::string& db_type, const std::set<std::string>&) const override {
        return to_upper(trim(db_type));
    }

    std::string quote_identifier(const std::string& name) const override {
        std::string out = "\"";
        for (char c : name) out += (c == '"') ? "\"\"" : std::string(1, c);
        return out + "\"";
    }

    // identifiers are case-insensitive
    std::string normalize_identifier(const std::string& name) const override { return to_lower(name); }

    std::optional<std::string> default_from_db(const std::string& raw, const ColumnInfo& column) const override {
        std::string value = trim(raw);
        if (value.empty() || to_upper(value) == "NULL") return std::nullopt;
        std::string upper = to_upper(value);
        if (upper == "CURRENT_TIMESTAMP" || upper == "NOW()") return std::string("now()");
        if (value.front() == '(' && value.back() == ')')
            return "dbgenerated(" + decl_quote(value.substr(1, value.size() - 2)) + ")";
        if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
            std::string text;
            for (size_t i = 1; i + 1 < value.size(); ++i) {
                if (value[i] == '\'' && value[i + 1] == '\'') ++i;
                text += value[i];
            }
            switch (type_family(column.type)) {
                case TypeFamily::Integer:
                case TypeFamily::Numeric:
                    return text;
                case TypeFamily::Boolean:
                    return std::string(text == "1" || to_lower(text) == "true" ? "true" : "false");
                default:
                    return decl_quote(text);
            }
        }
        if (type_family(column.type) == TypeFamily::Boolean) {
            if (value == "1" || to_lower(value) == "true") return std::string("true");
            if (value == "0" || to_lower(value) == "false") return std::string("false");
        }
        if (value == "true" || value == "false" || is_number_literal(value)) return value;
        return "dbgenerated(" + decl_quote(value) + ")";
    }

    // A single-column key is declared inline; AUTOINCREMENT requires it.
    std::string column_definition(const ColumnInfo& column, const TableInfo& table) const override {
        bool sole_pk = column.primary_key && table.primary_key.size() == 1;
        if (!sole_pk) return Provider::column_definition(column, table);
        std::string sql = quote_identifier(column.name) + " " + (column.auto_increment() ? "INTEGER" : column.type) +
                          " NOT NULL PRIMARY KEY";
        if (column.auto_increment()) return sql + " AUTOINCREMENT";
        std::string d = render_default(column);
        if (!d.empty()) sql += " DEFAULT " + d;
        return sql;
    }

    std::string drop_foreign_key(const std::string&, const ForeignKeyInfo&) const override {
        // constraints only change through a table redefinition
        return "";
    }

    bool supports_add_constraint() const override { return false; }

    bool redefines(const TableAlteration& alt) const override {
        if (!alt.modified.empty() || !alt.dropped.empty() || alt.primary_key_changed) return true;
        if (!alt.foreign_keys_added.empty() || !alt.foreign_keys_dropped.empty()) return true;
        for (const auto& c : alt.added) {
            if (c.unique || c.primary_key || c.auto_increment()) return true;
            bool constant_default = c.default_value && c.default_value->rfind("now()", 0) != 0 &&
                                    c.default_value->rfind("dbgenerated(", 0) != 0;
            if (!c.nullable && !constant_default) return true;
            if (c.nullable && c.default_value && !constant_default) return true;
        }
        return false;
    }

    std::vector<std::string> alter_table(const TableAlteration& alt) const override {
        std::vector<std::string> out;
        if (!redefines(alt)) {
            for (const auto& c : alt.added)
                out.push_back("ALTER TABLE " + quote_identifier(alt.table) + " ADD COLUMN " +
                              column_definition(c, alt.desired));
            return out;
        }

        const std::string temp = "new_" + alt.table;
        std::vector<std::string> copied;
        for (const ColumnInfo* c : alt.desired.ordered_columns())
            if (alt.actual.column(c->name)) copied.push_back(c->name);

        out.push_back("PRAGMA defer_foreign_keys=ON");
        out.push_back("PRAGMA foreign_keys=OFF");
        out.push_back(create_table(alt.desired, alt.desired.foreign_keys, temp));
        if (!copied.empty())
            out.push_back("INSERT INTO " + quote_identifier(temp) + " (" + quote_list(copied) + ") SELECT " +
                          quote_list(copied) + " FROM " + quote_identifier(alt.table));
        out.push_back("DROP TABLE " + quote_identifier(alt.table));
        out.push_back("ALTER TABLE " + quote_identifier(temp) + " RENAME TO " + quote_identifier(alt.table));
        for (const auto& idx : alt.desired.indexes) out.push_back(create_index(alt.table, idx));
        out.push_back("PRAGMA foreign_keys=ON");
        out.push_back("PRAGMA defer_foreign_keys=OFF");
        return out;
    }

    ColumnChangeStrategy column_change_strategy(const ColumnChange&) const override {
        return ColumnChangeStrategy::RedefineTable;
    }

    const IntrospectionQueries& introspection_queries() const override {
        static const IntrospectionQueries queries = {
            // tables
            "SELECT name AS table_name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
            "ORDER BY name",
            // columns
            "SELECT name AS column_name, type AS data_type, "
            "CASE WHEN \"notnull\" = 1 THEN 'NO' ELSE 'YES' END AS is_nullable, "
            "dflt_value AS column_default, CASE WHEN pk > 0 THEN pk ELSE NULL END AS pk_position, "
            "'' AS extra FROM pragma_table_info(?) ORDER BY cid",
            // indexes
            "SELECT il.name AS index_name, ii.name AS column_name, "
            "CASE WHEN il.\"unique\" = 1 THEN 'YES' ELSE 'NO' END AS is_unique, ii.seqno AS seq, "
            "CASE WHEN ii.\"desc\" = 1 THEN 'YES' ELSE 'NO' END AS sort_desc, il.origin AS origin "
            "FROM pragma_index_list(?) il JOIN pragma_index_xinfo(il.name) ii "
            "WHERE ii.\"key\" = 1 AND ii.name IS NOT NULL ORDER BY il.name, ii.seqno",
            // foreign keys; SQLite keeps no constraint names
            "SELECT CAST(id AS TEXT) AS constraint_name, \"from\" AS column_name, \"table\" AS ref_table, "
            "\"to\" AS ref_column, on_delete, on_update, seq FROM pragma_foreign_key_list(?) ORDER BY id, seq",
            // no enum types
            "",
        };
        return queries;
    }

    void complete_table(SQLConnection& conn, TableInfo& table) const override {
        for (auto& fk : table.foreign_keys) fk.name = table.name + "_" + join(fk.columns, "_") + "_fkey";

        if (table.primary_key.size() != 1) return;
        jdoc rows = conn.select("SELECT sql FROM sqlite_master WHERE type = 'table' AND name = ?", {table.name});
        if (!rows.IsArray() || rows.Empty()) return;
        std::string ddl = to_upper(jhlp::get<std::string>(rows[0], "sql"));
        if (ddl.find("AUTOINCREMENT") == std::string::npos) return;
        auto it = table.columns.find(table.primary_key.front());
        if (it != table.columns.end()) it->second.default_value = "autoincrement()";
    }

    std::string ledger_table_ddl(const std::string& table) const override {
        return "CREATE TABLE IF NOT EXISTS " + quote_identifier(table) + " (\n"
               "    \"id\" TEXT NOT NULL PRIMARY KEY,\n"
               "    \"checksum\" TEXT NOT NULL,\n"
               "    \"finished_at\" DATETIME,\n"
               "    \"migration_name\" TEXT NOT NULL,\n"
               "    \"logs\" TEXT,\n"
               "    \"rolled_back_at\" DATETIME,\n"
               "    \"started_at\" DATETIME NOT NULL DEFAULT current_timestamp,\n"
               "    \"applied_steps_count\" INTEGER UNSIGNED NOT NULL DEFAULT 0\n"
               ")";
    }

    std::vector<std::string> reset_statements(SQLConnection& conn) const override {
        jdoc rows = conn.select(introspection_queries().tables);
        std::vector<std::string> out = {"PRAGMA foreign_keys=OFF"};
        for (const auto& row : rows.GetArray())
            out.push_back("DROP TABLE IF EXISTS " + quote_identifier(jhlp::get<std::string>(row, "table_name")));
        out.push_back("PRAGMA foreign_keys=ON");
        return out;
    }

protected:
    std::vector<std::string> table_constraints(const TableInfo& table) const override {
        if (table.primary_key.size() < 2) return {};
        return {"PRIMARY KEY (" + quote_list(table.primary_key) + ")"};
    }

    std::string default_expression(const std::string& expr) const override { return "(" + expr + ")"; }
};

PProvider make_sqlite_provider() { return std::make_unique<SqliteProvider>(); }
