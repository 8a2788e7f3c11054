#include "provider.hpp"
#include <cstdlib>
#include <map>
#include "errors.hpp"
#include "lib.hpp"

std::string decl_quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::string decl_unquote(const std::string& literal) {
    if (literal.size() < 2 || literal.front() != '"' || literal.back() != '"') return literal;
    std::string out;
    for (size_t i = 1; i + 1 < literal.size(); ++i) {
        if (literal[i] == '\\' && i + 2 < literal.size()) ++i;
        out += literal[i];
    }
    return out;
}

bool is_number_literal(const std::string& s) {
    if (s.empty()) return false;
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end && *end == '\0' && s.find_first_of("xXeEnN") == std::string::npos;
}

bool same_default(const std::optional<std::string>& a, const std::optional<std::string>& b) {
    if (!a || !b) return !a && !b;
    if (*a == *b) return true;
    if (is_number_literal(*a) && is_number_literal(*b))
        return std::strtod(a->c_str(), nullptr) == std::strtod(b->c_str(), nullptr);
    return false;
}

std::string unique_key_name(const std::string& table, const std::string& column) {
    return table + "_" + column + "_key";
}

PProvider make_provider(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::PostgreSQL: return make_postgres_provider();
        case ProviderKind::MySQL:      return make_mysql_provider();
        case ProviderKind::SQLite:     return make_sqlite_provider();
    }
    return make_postgres_provider();
}

/* ---------- types ---------- */

TypeFamily Provider::type_family(const std::string& canonical_type) const {
    std::string t = to_upper(trim(canonical_type));
    if (t.empty()) return TypeFamily::Other;
    if (t.front() == '"' || t.front() == '`' || t.rfind("ENUM(", 0) == 0) return TypeFamily::Enum;
    if (t.size() > 2 && t.compare(t.size() - 2, 2, "[]") == 0) return TypeFamily::Other;
    std::string head = trim(t.substr(0, t.find('(')));
    if (head.rfind("TINYINT", 0) == 0 && t.find("(1)") != std::string::npos) return TypeFamily::Boolean;
    static const std::map<std::string, TypeFamily> families = {
        {"SMALLINT", TypeFamily::Integer}, {"INT", TypeFamily::Integer}, {"INTEGER", TypeFamily::Integer},
        {"BIGINT", TypeFamily::Integer}, {"TINYINT", TypeFamily::Integer}, {"MEDIUMINT", TypeFamily::Integer},
        {"SERIAL", TypeFamily::Integer}, {"BIGSERIAL", TypeFamily::Integer}, {"SMALLSERIAL", TypeFamily::Integer},
        {"DECIMAL", TypeFamily::Numeric}, {"NUMERIC", TypeFamily::Numeric}, {"REAL", TypeFamily::Numeric},
        {"DOUBLE", TypeFamily::Numeric}, {"DOUBLE PRECISION", TypeFamily::Numeric}, {"FLOAT", TypeFamily::Numeric},
        {"MONEY", TypeFamily::Numeric},
        {"TEXT", TypeFamily::Text}, {"VARCHAR", TypeFamily::Text}, {"CHAR", TypeFamily::Text},
        {"UUID", TypeFamily::Text}, {"CITEXT", TypeFamily::Text}, {"TINYTEXT", TypeFamily::Text},
        {"MEDIUMTEXT", TypeFamily::Text}, {"LONGTEXT", TypeFamily::Text}, {"XML", TypeFamily::Text},
        {"INET", TypeFamily::Text},
        {"DATE", TypeFamily::Temporal}, {"TIME", TypeFamily::Temporal}, {"TIMETZ", TypeFamily::Temporal},
        {"TIMESTAMP", TypeFamily::Temporal}, {"TIMESTAMPTZ", TypeFamily::Temporal}, {"DATETIME", TypeFamily::Temporal},
        {"BOOLEAN", TypeFamily::Boolean}, {"BOOL", TypeFamily::Boolean},
        {"JSON", TypeFamily::Json}, {"JSONB", TypeFamily::Json},
        {"BYTEA", TypeFamily::Binary}, {"BLOB", TypeFamily::Binary}, {"LONGBLOB", TypeFamily::Binary},
        {"MEDIUMBLOB", TypeFamily::Binary}, {"TINYBLOB", TypeFamily::Binary}, {"BINARY", TypeFamily::Binary},
        {"VARBINARY", TypeFamily::Binary},
    };
    auto it = families.find(head);
    if (it != families.end()) return it->second;
    // "INT UNSIGNED", "BIGINT UNSIGNED"
    size_t sp = head.find(' ');
    if (sp != std::string::npos) {
        it = families.find(head.substr(0, sp));
        if (it != families.end()) return it->second;
    }
    return TypeFamily::Other;
}

bool Provider::same_family_or_text(TypeFamily from, TypeFamily to) {
    auto textual = [](TypeFamily f) { return f == TypeFamily::Text || f == TypeFamily::Enum; };
    auto numeric = [](TypeFamily f) { return f == TypeFamily::Integer || f == TypeFamily::Numeric; };
    if (from == to) return true;
    if (to == TypeFamily::Text) return true;
    if (textual(from) && textual(to)) return true;
    if (numeric(from) && numeric(to)) return true;
    return false;
}

/* ---------- identifiers and literals ---------- */

std::string Provider::quote_string(const std::string& value) const {
    std::string out = "'";
    for (char c : value) out += (c == '\'') ? "''" : std::string(1, c);
    return out + "'";
}

std::string Provider::quote_list(const std::vector<std::string>& names) const {
    std::vector<std::string> quoted;
    for (const auto& n : names) quoted.push_back(quote_identifier(n));
    return join(quoted, ", ");
}

/* ---------- defaults ---------- */

std::string Provider::render_default(const ColumnInfo& column) const {
    if (!column.default_value) return "";
    const std::string& d = *column.default_value;
    if (d == "autoincrement()") return "";
    if (d == "now()") return "CURRENT_TIMESTAMP";
    if (d.rfind("dbgenerated(", 0) == 0 && d.back() == ')') {
        std::string inner = trim(d.substr(12, d.size() - 13));
        return default_expression(decl_unquote(inner));
    }
    if (!d.empty() && d.front() == '"') return quote_string(decl_unquote(d));
    if (d == "true" || d == "false" || is_number_literal(d)) return d;
    // enum value identifier
    return quote_string(d);
}

/* ---------- DDL ---------- */

std::string Provider::column_definition(const ColumnInfo& column, const TableInfo& table) const {
    std::string sql = quote_identifier(column.name) + " " + column_type_sql(column);
    if (!column.nullable) sql += " NOT NULL";
    std::string d = render_default(column);
    if (!d.empty()) sql += " DEFAULT " + d;
    bool sole_pk = column.primary_key && table.primary_key.size() == 1;
    if (column.unique && inline_unique() && !sole_pk) sql += " UNIQUE";
    return sql;
}

std::vector<std::string> Provider::table_constraints(const TableInfo& table) const {
    std::vector<std::string> out;
    if (!table.primary_key.empty())
        out.push_back("CONSTRAINT " + quote_identifier(primary_key_name(table)) +
                      " PRIMARY KEY (" + quote_list(table.primary_key) + ")");
    return out;
}

std::string Provider::create_table(const TableInfo& table, const std::vector<ForeignKeyInfo>& inline_fks,
                                   const std::string& name_override) const {
    std::vector<std::string> body;
    for (const ColumnInfo* c : table.ordered_columns()) body.push_back(column_definition(*c, table));
    for (auto& c : table_constraints(table)) body.push_back(c);
    for (const auto& fk : inline_fks) body.push_back(foreign_key_clause(fk));

    std::string name = name_override.empty() ? table.name : name_override;
    std::string sql = "CREATE TABLE " + quote_identifier(name) + " (\n";
    for (size_t i = 0; i < body.size(); ++i) {
        sql += "    " + body[i];
        sql += (i + 1 < body.size()) ? ",\n" : "\n";
    }
    return sql + ")";
}

std::string Provider::create_index(const std::string& table, const IndexInfo& index) const {
    std::vector<std::string> cols;
    for (const auto& c : index.columns) {
        std::string col = quote_identifier(c.name);
        if (!c.wrapper.empty()) col = c.wrapper + "(" + col + ")";
        if (c.sort == "DESC") col += " DESC";
        cols.push_back(col);
    }
    return std::string("CREATE ") + (index.unique ? "UNIQUE " : "") + "INDEX " + quote_identifier(index.name) +
           " ON " + quote_identifier(table) + "(" + join(cols, ", ") + ")";
}

std::string Provider::drop_index(const std::string&, const IndexInfo& index) const {
    return "DROP INDEX " + quote_identifier(index.name);
}

std::string Provider::foreign_key_clause(const ForeignKeyInfo& fk) const {
    return "CONSTRAINT " + quote_identifier(fk.name) + " FOREIGN KEY (" + quote_list(fk.columns) +
           ") REFERENCES " + quote_identifier(fk.referenced_table) + "(" + quote_list(fk.referenced_columns) +
           ") ON DELETE " + fk.on_delete + " ON UPDATE " + fk.on_update;
}

std::string Provider::add_foreign_key(const std::string& table, const ForeignKeyInfo& fk) const {
    return "ALTER TABLE " + quote_identifier(table) + " ADD " + foreign_key_clause(fk);
}

std::string Provider::drop_table(const std::string& table) const {
    return "DROP TABLE " + quote_identifier(table);
}
