#include <algorithm>
#include <regex>
#include "lib.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

/* ---------- PostgreSQL ---------- */

namespace {

// Cuts top-level "::type" casts off a catalog default expression.
std::string strip_casts(std::string expr) {
    for (;;) {
        int depth = 0;
        bool quoted = false;
        size_t cut = std::string::npos;
        for (size_t i = 0; i + 1 < expr.size(); ++i) {
            char c = expr[i];
            if (c == '\'') quoted = !quoted;
            if (quoted) continue;
            if (c == '(') ++depth;
            else if (c == ')') --depth;
            else if (depth == 0 && c == ':' && expr[i + 1] == ':') { cut = i; break; }
        }
        if (cut == std::string::npos) return expr;
        expr = trim(expr.substr(0, cut));
    }
}

std::string strip_parens(std::string expr) {
    while (expr.size() >= 2 && expr.front() == '(' && expr.back() == ')') {
        int depth = 0;
        bool wraps = true;
        for (size_t i = 0; i < expr.size(); ++i) {
            if (expr[i] == '(') ++depth;
            else if (expr[i] == ')' && --depth == 0 && i + 1 < expr.size()) { wraps = false; break; }
        }
        if (!wraps) break;
        expr = trim(expr.substr(1, expr.size() - 2));
    }
    return expr;
}

std::string sql_unquote(const std::string& literal) {
    std::string out;
    for (size_t i = 1; i + 1 < literal.size(); ++i) {
        if (literal[i] == '\'' && literal[i + 1] == '\'') ++i;
        out += literal[i];
    }
    return out;
}

} // namespace

class PostgresProvider : public Provider {
public:
    ProviderKind kind() const override { return ProviderKind::PostgreSQL; }

    std::string map_type(ScalarType type) const override {
        if (type == ScalarType::String  ) return "TEXT"            ;
        if (type == ScalarType::Int     ) return "INTEGER"         ;
        if (type == ScalarType::BigInt  ) return "BIGINT"          ;
        if (type == ScalarType::Float   ) return "DOUBLE PRECISION";
        if (type == ScalarType::Decimal ) return "DECIMAL(65,30)"  ;
        if (type == ScalarType::Boolean ) return "BOOLEAN"         ;
        if (type == ScalarType::DateTime) return "TIMESTAMP(3)"    ;
        if (type == ScalarType::Json    ) return "JSONB"           ;
        if (type == ScalarType::Bytes   ) return "BYTEA"           ;
        return "TEXT";
    }

    std::optional<std::string> native_type(const std::string& name, const std::vector<std::string>& args) const override {
        auto with_args = [&](const std::string& base) {
            return args.empty() ? base : base + "(" + join(args, ",") + ")";
        };
        if (name == "VarChar"        ) return with_args("VARCHAR");
        if (name == "Char"           ) return args.empty() ? std::string("CHAR(1)") : with_args("CHAR");
        if (name == "Text"           ) return "TEXT";
        if (name == "Uuid"           ) return "UUID";
        if (name == "SmallInt"       ) return "SMALLINT";
        if (name == "Integer"        ) return "INTEGER";
        if (name == "BigInt"         ) return "BIGINT";
        if (name == "Real"           ) return "REAL";
        if (name == "DoublePrecision") return "DOUBLE PRECISION";
        if (name == "Decimal"        ) return with_args("DECIMAL");
        if (name == "Boolean"        ) return "BOOLEAN";
        if (name == "Date"           ) return "DATE";
        if (name == "Time"           ) return with_args("TIME");
        if (name == "Timetz"         ) return with_args("TIMETZ");
        if (name == "Timestamp"      ) return with_args("TIMESTAMP");
        if (name == "Timestamptz"    ) return with_args("TIMESTAMPTZ");
        if (name == "Json"           ) return "JSON";
        if (name == "JsonB"          ) return "JSONB";
        if (name == "ByteA"          ) return "BYTEA";
        if (name == "Inet"           ) return "INET";
        if (name == "Citext"         ) return "CITEXT";
        if (name == "Xml"            ) return "XML";
        if (name == "Money"          ) return "MONEY";
        if (name == "Oid"            ) return "OID";
        if (name == "Bit"            ) return args.empty() ? std::string("BIT(1)") : with_args("BIT");
        if (name == "VarBit"         ) return with_args("VARBIT");
        return std::nullopt;
    }

    std::string enum_column_type(const EnumInfo& e) const override { return quote_identifier(e.name); }
    bool supports_enum_types() const override { return true; }
    bool supports_scalar_lists() const override { return true; }

    // format_type() spelling -> canonical
    std::string normalize_type(const std::string& db_type, const std::set<std::string>& enum_names) const override {
        std::string t = trim(db_type);
        if (t.empty()) return t;
        if (t.size() > 2 && t.compare(t.size() - 2, 2, "[]") == 0)
            return normalize_type(t.substr(0, t.size() - 2), enum_names) + "[]";

        std::string bare = t;
        if (bare.size() >= 2 && bare.front() == '"' && bare.back() == '"') bare = bare.substr(1, bare.size() - 2);
        if (enum_names.count(bare) || t.front() == '"') return quote_identifier(bare);

        static const std::regex with_tz(R"(^(timestamp|time)(\(\d+\))? with time zone$)");
        static const std::regex without_tz(R"(^(timestamp|time)(\(\d+\))? without time zone$)");
        static const std::regex sized(R"(^(character varying|character|numeric|bit varying|bit)(\(.*\))?$)");
        std::string lower = to_lower(t);
        std::smatch m;
        if (std::regex_match(lower, m, with_tz))
            return (m[1] == "timestamp" ? "TIMESTAMPTZ" : "TIMETZ") + std::string(m[2]);
        if (std::regex_match(lower, m, without_tz))
            return (m[1] == "timestamp" ? "TIMESTAMP" : "TIME") + std::string(m[2]);
        if (std::regex_match(lower, m, sized)) {
            std::string head = m[1];
            std::string args = m[2];
            args.erase(std::remove(args.begin(), args.end(), ' '), args.end());
            if (head == "character varying") return "VARCHAR" + args;
            if (head == "character"        ) return "CHAR" + args;
            if (head == "numeric"          ) return "DECIMAL" + args;
            if (head == "bit varying"      ) return "VARBIT" + args;
            return "BIT" + args;
        }
        return to_upper(t);
    }

    std::string quote_identifier(const std::string& name) const override {
        std::string out = "\"";
        for (char c : name) out += (c == '"') ? "\"\"" : std::string(1, c);
        return out + "\"";
    }

    // NAMEDATALEN - 1
    std::string normalize_identifier(const std::string& name) const override { return name.substr(0, 63); }

    std::optional<std::string> default_from_db(const std::string& raw, const ColumnInfo& column) const override {
        std::string expr = trim(raw);
        if (expr.empty() || to_upper(expr) == "NULL") return std::nullopt;
        if (starts_with_ci(expr, "nextval(")) return std::string("autoincrement()");
        std::string upper = to_upper(expr);
        if (upper == "CURRENT_TIMESTAMP" || upper == "NOW()" || upper.rfind("CURRENT_TIMESTAMP(", 0) == 0)
            return std::string("now()");

        std::string value = strip_parens(strip_casts(expr));
        if (to_upper(value) == "NULL") return std::nullopt;
        if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
            std::string text = sql_unquote(value);
            switch (type_family(column.type)) {
                case TypeFamily::Enum:
                case TypeFamily::Integer:
                case TypeFamily::Numeric:
                    return text;
                case TypeFamily::Boolean:
                    return std::string(text == "t" || to_lower(text) == "true" ? "true" : "false");
                default:
                    return decl_quote(text);
            }
        }
        if (value == "true" || value == "false" || is_number_literal(value)) return value;
        return "dbgenerated(" + decl_quote(expr) + ")";
    }

    std::string column_type_sql(const ColumnInfo& column) const override {
        if (column.auto_increment()) {
            std::string t = to_upper(column.type);
            if (t == "BIGINT")   return "BIGSERIAL";
            if (t == "SMALLINT") return "SMALLSERIAL";
            return "SERIAL";
        }
        return column.type;
    }

    std::string drop_foreign_key(const std::string& table, const ForeignKeyInfo& fk) const override {
        return "ALTER TABLE " + quote_identifier(table) + " DROP CONSTRAINT " + quote_identifier(fk.name);
    }

    std::vector<std::string> alter_table(const TableAlteration& alt) const override {
        std::vector<std::string> out;
        const std::string table = "ALTER TABLE " + quote_identifier(alt.table) + " ";

        if (alt.primary_key_changed && !alt.actual.primary_key.empty())
            out.push_back(table + "DROP CONSTRAINT " + quote_identifier(primary_key_name(alt.actual)));

        for (const auto& c : alt.dropped)
            out.push_back(table + "DROP COLUMN " + quote_identifier(c.name));

        for (const auto& ch : alt.modified) {
            if (column_change_strategy(ch) == ColumnChangeStrategy::DropAndAdd) {
                out.push_back(table + "DROP COLUMN " + quote_identifier(ch.from.name));
                out.push_back(table + "ADD COLUMN " + column_definition(ch.to, alt.desired));
                continue;
            }
            for (auto& s : alter_column(alt, ch)) out.push_back(s);
        }

        for (const auto& c : alt.added)
            out.push_back(table + "ADD COLUMN " + column_definition(c, alt.desired));

        if (alt.primary_key_changed && !alt.desired.primary_key.empty())
            out.push_back(table + "ADD CONSTRAINT " + quote_identifier(primary_key_name(alt.desired)) +
                          " PRIMARY KEY (" + quote_list(alt.desired.primary_key) + ")");
        return out;
    }

    std::vector<std::string> create_enum(const EnumInfo& e) const override {
        std::vector<std::string> values;
        for (const auto& v : e.values) values.push_back(quote_string(v));
        return {"CREATE TYPE " + quote_identifier(e.name) + " AS ENUM (" + join(values, ", ") + ")"};
    }

    std::vector<std::string> alter_enum(const EnumAlteration& alt) const override {
        std::vector<std::string> out;
        if (alt.removed.empty()) {
            for (const auto& v : alt.added)
                out.push_back("ALTER TYPE " + quote_identifier(alt.name) + " ADD VALUE " + quote_string(v));
            return out;
        }
        // values cannot be removed in place: swap in a fresh type
        const std::string old_name = alt.name + "_old";
        out.push_back("ALTER TYPE " + quote_identifier(alt.name) + " RENAME TO " + quote_identifier(old_name));
        for (auto& s : create_enum(alt.desired)) out.push_back(s);
        for (const auto& [table, column] : alt.usages) {
            const std::string prefix = "ALTER TABLE " + quote_identifier(table) + " ALTER COLUMN " +
                                       quote_identifier(column.name) + " ";
            const bool list = column.type.size() > 2 && column.type.compare(column.type.size() - 2, 2, "[]") == 0;
            const std::string type = quote_identifier(alt.name) + (list ? "[]" : "");
            if (column.default_value) out.push_back(prefix + "DROP DEFAULT");
            out.push_back(prefix + "TYPE " + type + " USING (" + quote_identifier(column.name) +
                          (list ? "::text[]::" : "::text::") + type + ")");
            // a default naming a removed value is replaced later by the column change
            bool kept = !list && column.default_value &&
                        std::find(alt.removed.begin(), alt.removed.end(), *column.default_value) == alt.removed.end();
            if (kept) out.push_back(prefix + "SET DEFAULT " + render_default(column));
        }
        out.push_back("DROP TYPE " + quote_identifier(old_name));
        return out;
    }

    std::vector<std::string> drop_enum(const EnumInfo& e) const override {
        return {"DROP TYPE " + quote_identifier(e.name)};
    }

    std::vector<std::string> prelude(const ChangeSet& cs) const override {
        auto uses_uuid = [](const ColumnInfo& c) {
            return c.default_value && c.default_value->find("gen_random_uuid()") != std::string::npos;
        };
        bool needed = false;
        for (const auto& t : cs.tables_to_create)
            for (const auto& [_, c] : t.columns) needed = needed || uses_uuid(c);
        for (const auto& alt : cs.tables_to_alter) {
            for (const auto& c : alt.added) needed = needed || uses_uuid(c);
            for (const auto& ch : alt.modified) needed = needed || uses_uuid(ch.to);
        }
        if (!needed) return {};
        return {"CREATE EXTENSION IF NOT EXISTS \"pgcrypto\""};
    }

    ColumnChangeStrategy column_change_strategy(const ColumnChange& change) const override {
        if (!change.type_changed) return ColumnChangeStrategy::InPlace;
        if (same_family_or_text(type_family(change.from.type), type_family(change.to.type)))
            return ColumnChangeStrategy::InPlace;
        return ColumnChangeStrategy::DropAndAdd;
    }

    const IntrospectionQueries& introspection_queries() const override {
        static const IntrospectionQueries queries = {
            // tables
            "SELECT c.relname AS table_name FROM pg_catalog.pg_class c "
            "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
            "WHERE n.nspname = current_schema() AND c.relkind IN ('r', 'p') ORDER BY c.relname",
            // columns
            "SELECT a.attname AS column_name, format_type(a.atttypid, a.atttypmod) AS data_type, "
            "CASE WHEN a.attnotnull THEN 'NO' ELSE 'YES' END AS is_nullable, "
            "pg_get_expr(d.adbin, d.adrelid) AS column_default, "
            "array_position(pk.conkey, a.attnum) AS pk_position, '' AS extra "
            "FROM pg_catalog.pg_attribute a "
            "JOIN pg_catalog.pg_class c ON c.oid = a.attrelid "
            "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
            "LEFT JOIN pg_catalog.pg_attrdef d ON d.adrelid = a.attrelid AND d.adnum = a.attnum "
            "LEFT JOIN pg_catalog.pg_constraint pk ON pk.conrelid = c.oid AND pk.contype = 'p' "
            "WHERE c.relname = $1 AND n.nspname = current_schema() AND a.attnum > 0 AND NOT a.attisdropped "
            "ORDER BY a.attnum",
            // indexes
            "SELECT i.relname AS index_name, a.attname AS column_name, "
            "CASE WHEN k.attnum = 0 THEN pg_get_indexdef(ix.indexrelid, k.ord::int, true) END AS expression, "
            "CASE WHEN ix.indisunique THEN 'YES' ELSE 'NO' END AS is_unique, k.ord AS seq, "
            "CASE WHEN (ix.indoption[(k.ord - 1)::int] & 1) = 1 THEN 'YES' ELSE 'NO' END AS sort_desc, "
            "CASE WHEN ix.indisprimary THEN 'pk' WHEN con.oid IS NOT NULL THEN 'u' ELSE 'c' END AS origin "
            "FROM pg_catalog.pg_index ix "
            "JOIN pg_catalog.pg_class t ON t.oid = ix.indrelid "
            "JOIN pg_catalog.pg_class i ON i.oid = ix.indexrelid "
            "JOIN pg_catalog.pg_namespace n ON n.oid = t.relnamespace "
            "CROSS JOIN LATERAL unnest(ix.indkey) WITH ORDINALITY AS k(attnum, ord) "
            "LEFT JOIN pg_catalog.pg_attribute a ON a.attrelid = t.oid AND a.attnum = k.attnum "
            "LEFT JOIN pg_catalog.pg_constraint con ON con.conindid = ix.indexrelid AND con.contype = 'u' "
            "WHERE t.relname = $1 AND n.nspname = current_schema() ORDER BY i.relname, k.ord",
            // foreign keys
            "SELECT con.conname AS constraint_name, a.attname AS column_name, rt.relname AS ref_table, "
            "ra.attname AS ref_column, "
            "CASE con.confdeltype WHEN 'r' THEN 'RESTRICT' WHEN 'c' THEN 'CASCADE' WHEN 'n' THEN 'SET NULL' "
            "WHEN 'd' THEN 'SET DEFAULT' ELSE 'NO ACTION' END AS on_delete, "
            "CASE con.confupdtype WHEN 'r' THEN 'RESTRICT' WHEN 'c' THEN 'CASCADE' WHEN 'n' THEN 'SET NULL' "
            "WHEN 'd' THEN 'SET DEFAULT' ELSE 'NO ACTION' END AS on_update, k.ord AS seq "
            "FROM pg_catalog.pg_constraint con "
            "JOIN pg_catalog.pg_class t ON t.oid = con.conrelid "
            "JOIN pg_catalog.pg_namespace n ON n.oid = t.relnamespace "
            "JOIN pg_catalog.pg_class rt ON rt.oid = con.confrelid "
            "CROSS JOIN LATERAL unnest(con.conkey, con.confkey) WITH ORDINALITY AS k(attnum, ref_attnum, ord) "
            "JOIN pg_catalog.pg_attribute a ON a.attrelid = con.conrelid AND a.attnum = k.attnum "
            "JOIN pg_catalog.pg_attribute ra ON ra.attrelid = con.confrelid AND ra.attnum = k.ref_attnum "
            "WHERE con.contype = 'f' AND t.relname = $1 AND n.nspname = current_schema() "
            "ORDER BY con.conname, k.ord",
            // enums
            "SELECT t.typname AS enum_name, e.enumlabel AS enum_value FROM pg_catalog.pg_type t "
            "JOIN pg_catalog.pg_enum e ON e.enumtypid = t.oid "
            "JOIN pg_catalog.pg_namespace n ON n.oid = t.typnamespace "
            "WHERE n.nspname = current_schema() ORDER BY t.typname, e.enumsortorder",
        };
        return queries;
    }

    // lower(email), lower((email)::text), lower("Email")
    IndexColumn index_expression(const std::string& expr) const override {
        static const std::regex call(R"(^\s*([A-Za-z_][A-Za-z0-9_]*)\((.*)\)\s*$)");
        IndexColumn col;
        std::smatch m;
        if (!std::regex_match(expr, m, call)) {
            col.name = trim(expr);
            return col;
        }
        col.wrapper = to_lower(m[1].str());
        std::string inner = strip_parens(strip_casts(trim(m[2].str())));
        if (inner.size() >= 2 && inner.front() == '"' && inner.back() == '"') {
            std::string bare;
            for (size_t i = 1; i + 1 < inner.size(); ++i) {
                if (inner[i] == '"' && inner[i + 1] == '"') ++i;
                bare += inner[i];
            }
            inner = bare;
        }
        col.name = inner;
        return col;
    }

    std::string placeholder(int n) const override { return "$" + std::to_string(n); }

    std::string ledger_table_ddl(const std::string& table) const override {
        return "CREATE TABLE IF NOT EXISTS " + quote_identifier(table) + " (\n"
               "    \"id\" VARCHAR(36) NOT NULL PRIMARY KEY,\n"
               "    \"checksum\" VARCHAR(64) NOT NULL,\n"
               "    \"finished_at\" TIMESTAMPTZ,\n"
               "    \"migration_name\" VARCHAR(255) NOT NULL,\n"
               "    \"logs\" TEXT,\n"
               "    \"rolled_back_at\" TIMESTAMPTZ,\n"
               "    \"started_at\" TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
               "    \"applied_steps_count\" INTEGER NOT NULL DEFAULT 0\n"
               ")";
    }

    std::vector<std::string> reset_statements(SQLConnection& conn) const override {
        jdoc rows = conn.select("SELECT current_schema() AS name");
        std::string schema = "public";
        if (rows.IsArray() && !rows.Empty()) schema = jhlp::get<std::string>(rows[0], "name", schema);
        return {"DROP SCHEMA IF EXISTS " + quote_identifier(schema) + " CASCADE",
                "CREATE SCHEMA " + quote_identifier(schema)};
    }

private:
    std::vector<std::string> alter_column(const TableAlteration& alt, const ColumnChange& ch) const {
        std::vector<std::string> out;
        const std::string table = "ALTER TABLE " + quote_identifier(alt.table) + " ";
        const std::string column = table + "ALTER COLUMN " + quote_identifier(ch.to.name) + " ";
        std::string new_default = render_default(ch.to);

        if (ch.default_changed && ch.from.default_value && !ch.from.auto_increment())
            out.push_back(column + "DROP DEFAULT");

        if (ch.type_changed) {
            bool via_text = type_family(ch.from.type) == TypeFamily::Enum || type_family(ch.to.type) == TypeFamily::Enum;
            out.push_back(column + "SET DATA TYPE " + ch.to.type + " USING (" + quote_identifier(ch.to.name) +
                          (via_text ? "::text::" : "::") + ch.to.type + ")");
        }

        if (ch.nullability_changed)
            out.push_back(column + (ch.to.nullable ? "DROP NOT NULL" : "SET NOT NULL"));

        if (ch.default_changed) {
            if (ch.to.auto_increment() && !ch.from.auto_increment()) {
                std::string seq = quote_identifier(alt.table + "_" + ch.to.name + "_seq");
                out.push_back("CREATE SEQUENCE " + seq);
                out.push_back(column + "SET DEFAULT nextval('" + seq + "')");
                out.push_back("ALTER SEQUENCE " + seq + " OWNED BY " + quote_identifier(alt.table) + "." +
                              quote_identifier(ch.to.name));
            } else if (ch.from.auto_increment()) {
                out.push_back(column + "DROP DEFAULT");
                if (!new_default.empty()) out.push_back(column + "SET DEFAULT " + new_default);
            } else if (!new_default.empty()) {
                out.push_back(column + "SET DEFAULT " + new_default);
            }
        }

        if (ch.unique_changed) {
            std::string key = quote_identifier(unique_key_name(alt.table, ch.to.name));
            if (ch.to.unique) {
                out.push_back("CREATE UNIQUE INDEX " + key + " ON " + quote_identifier(alt.table) + "(" +
                              quote_identifier(ch.to.name) + ")");
            } else {
                out.push_back(table + "DROP CONSTRAINT IF EXISTS " + key);
                out.push_back("DROP INDEX IF EXISTS " + key);
            }
        }
        return out;
    }
};

PProvider make_postgres_provider() { return std::make_unique<PostgresProvider>(); }
