#include <regex>
#include "lib.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

/* ---------- MySQL ---------- */

class MySqlProvider : public Provider {
public:
    ProviderKind kind() const override { return ProviderKind::MySQL; }

    std::string map_type(ScalarType type) const override {
        if (type == ScalarType::String  ) return "VARCHAR(191)"  ;
        if (type == ScalarType::Int     ) return "INT"           ;
        if (type == ScalarType::BigInt  ) return "BIGINT"        ;
        if (type == ScalarType::Float   ) return "DOUBLE"        ;
        if (type == ScalarType::Decimal ) return "DECIMAL(65,30)";
        if (type == ScalarType::Boolean ) return "BOOLEAN"       ;
        if (type == ScalarType::DateTime) return "DATETIME(3)"   ;
        if (type == ScalarType::Json    ) return "JSON"          ;
        if (type == ScalarType::Bytes   ) return "LONGBLOB"      ;
        return "VARCHAR(191)";
    }

    std::optional<std::string> native_type(const std::string& name, const std::vector<std::string>& args) const override {
        auto with_args = [&](const std::string& base) {
            return args.empty() ? base : base + "(" + join(args, ",") + ")";
        };
        if (name == "VarChar"       ) return with_args("VARCHAR");
        if (name == "Char"          ) return with_args("CHAR");
        if (name == "Text"          ) return "TEXT";
        if (name == "TinyText"      ) return "TINYTEXT";
        if (name == "MediumText"    ) return "MEDIUMTEXT";
        if (name == "LongText"      ) return "LONGTEXT";
        if (name == "TinyInt"       ) return "TINYINT";
        if (name == "SmallInt"      ) return "SMALLINT";
        if (name == "MediumInt"     ) return "MEDIUMINT";
        if (name == "Int"           ) return "INT";
        if (name == "BigInt"        ) return "BIGINT";
        if (name == "UnsignedInt"   ) return "INT UNSIGNED";
        if (name == "UnsignedBigInt") return "BIGINT UNSIGNED";
        if (name == "Decimal"       ) return with_args("DECIMAL");
        if (name == "Float"         ) return "FLOAT";
        if (name == "Double"        ) return "DOUBLE";
        if (name == "Bit"           ) return with_args("BIT");
        if (name == "Date"          ) return "DATE";
        if (name == "Time"          ) return with_args("TIME");
        if (name == "DateTime"      ) return with_args("DATETIME");
        if (name == "Timestamp"     ) return with_args("TIMESTAMP");
        if (name == "Year"          ) return "YEAR";
        if (name == "Json"          ) return "JSON";
        if (name == "Binary"        ) return with_args("BINARY");
        if (name == "VarBinary"     ) return with_args("VARBINARY");
        if (name == "TinyBlob"      ) return "TINYBLOB";
        if (name == "Blob"          ) return "BLOB";
        if (name == "MediumBlob"    ) return "MEDIUMBLOB";
        if (name == "LongBlob"      ) return "LONGBLOB";
        return std::nullopt;
    }

    std::string enum_column_type(const EnumInfo& e) const override {
        std::vector<std::string> values;
        for (const auto& v : e.values) values.push_back(quote_string(v));
        return "ENUM(" + join(values, ",") + ")";
    }

    // COLUMN_TYPE spelling -> canonical
    std::string normalize_type(const std::string& db_type, const std::set<std::string>&) const override {
        std::string t = trim(db_type);
        std::string lower = to_lower(t);
        if (lower.rfind("enum(", 0) == 0) return "ENUM" + t.substr(4);
        if (lower == "tinyint(1)") return "BOOLEAN";
        static const std::regex display_width(R"(^(tinyint|smallint|mediumint|int|bigint)\(\d+\)(.*)$)");
        std::smatch m;
        if (std::regex_match(lower, m, display_width)) return to_upper(std::string(m[1]) + std::string(m[2]));
        return to_upper(t);
    }

    std::string quote_identifier(const std::string& name) const override {
        std::string out = "`";
        for (char c : name) out += (c == '`') ? "``" : std::string(1, c);
        return out + "`";
    }

    std::string normalize_identifier(const std::string& name) const override { return name.substr(0, 64); }

    std::string quote_string(const std::string& value) const override {
        std::string out = "'";
        for (char c : value) {
            if (c == '\'') out += "''";
            else if (c == '\\') out += "\\\\";
            else out += c;
        }
        return out + "'";
    }

    std::string render_default(const ColumnInfo& column) const override {
        if (column.default_value && *column.default_value == "now()") {
            static const std::regex precision(R"(\((\d+)\))");
            std::smatch m;
            if (std::regex_search(column.type, m, precision)) return "CURRENT_TIMESTAMP(" + std::string(m[1]) + ")";
            return "CURRENT_TIMESTAMP";
        }
        return Provider::render_default(column);
    }

    // Expression defaults arrive wrapped in parentheses (see the columns query).
    std::optional<std::string> default_from_db(const std::string& raw, const ColumnInfo& column) const override {
        if (raw == "NULL") return std::nullopt;
        std::string upper = to_upper(trim(raw));
        if (upper.rfind("CURRENT_TIMESTAMP", 0) == 0 || upper == "NOW()") return std::string("now()");
        if (raw.size() >= 2 && raw.front() == '(' && raw.back() == ')')
            return "dbgenerated(" + decl_quote(raw.substr(1, raw.size() - 2)) + ")";

        std::string value = raw;
        if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
            std::string unquoted;
            for (size_t i = 1; i + 1 < value.size(); ++i) {
                if (value[i] == '\'' && value[i + 1] == '\'') ++i;
                unquoted += value[i];
            }
            value = unquoted;
        }
        switch (type_family(column.type)) {
            case TypeFamily::Boolean:
                if (value == "1" || to_lower(value) == "true") return std::string("true");
                if (value == "0" || to_lower(value) == "false") return std::string("false");
                return value;
            case TypeFamily::Integer:
            case TypeFamily::Numeric:
            case TypeFamily::Enum:
                return value;
            default:
                return decl_quote(value);
        }
    }

    std::string column_definition(const ColumnInfo& column, const TableInfo& table) const override {
        std::string sql = Provider::column_definition(column, table);
        if (column.auto_increment()) sql += " AUTO_INCREMENT";
        return sql;
    }

    std::string drop_index(const std::string& table, const IndexInfo& index) const override {
        return "DROP INDEX " + quote_identifier(index.name) + " ON " + quote_identifier(table);
    }

    std::string drop_foreign_key(const std::string& table, const ForeignKeyInfo& fk) const override {
        return "ALTER TABLE " + quote_identifier(table) + " DROP FOREIGN KEY " + quote_identifier(fk.name);
    }

    std::vector<std::string> alter_table(const TableAlteration& alt) const override {
        std::vector<std::string> out;
        const std::string table = "ALTER TABLE " + quote_identifier(alt.table) + " ";

        if (alt.primary_key_changed && !alt.actual.primary_key.empty())
            out.push_back(table + "DROP PRIMARY KEY");

        for (const auto& c : alt.dropped)
            out.push_back(table + "DROP COLUMN " + quote_identifier(c.name));

        for (const auto& ch : alt.modified) {
            if (column_change_strategy(ch) == ColumnChangeStrategy::DropAndAdd) {
                out.push_back(table + "DROP COLUMN " + quote_identifier(ch.from.name));
                out.push_back(table + "ADD COLUMN " + column_definition(ch.to, alt.desired));
                if (ch.to.unique) out.push_back(add_unique(alt.table, ch.to.name));
                continue;
            }
            if (ch.type_changed || ch.nullability_changed || ch.default_changed)
                out.push_back(table + "MODIFY " + column_definition(ch.to, alt.desired));
            if (ch.unique_changed)
                out.push_back(ch.to.unique ? add_unique(alt.table, ch.to.name)
                                           : "DROP INDEX " + quote_identifier(unique_key_name(alt.table, ch.to.name)) +
                                                 " ON " + quote_identifier(alt.table));
        }

        for (const auto& c : alt.added) {
            out.push_back(table + "ADD COLUMN " + column_definition(c, alt.desired));
            if (c.unique && !(c.primary_key && alt.desired.primary_key.size() == 1))
                out.push_back(add_unique(alt.table, c.name));
        }

        if (alt.primary_key_changed && !alt.desired.primary_key.empty())
            out.push_back(table + "ADD PRIMARY KEY (" + quote_list(alt.desired.primary_key) + ")");
        return out;
    }

    ColumnChangeStrategy column_change_strategy(const ColumnChange& change) const override {
        if (!change.type_changed) return ColumnChangeStrategy::InPlace;
        TypeFamily from = type_family(change.from.type);
        TypeFamily to = type_family(change.to.type);
        auto numeric = [](TypeFamily f) {
            return f == TypeFamily::Integer || f == TypeFamily::Numeric || f == TypeFamily::Boolean;
        };
        if (same_family_or_text(from, to) || (numeric(from) && numeric(to))) return ColumnChangeStrategy::InPlace;
        return ColumnChangeStrategy::DropAndAdd;
    }

    bool supports_transactional_ddl() const override { return false; }
    bool implicit_fk_indexes() const override { return true; }

    const IntrospectionQueries& introspection_queries() const override {
        static const IntrospectionQueries queries = {
            // tables
            "SELECT TABLE_NAME AS table_name FROM information_schema.TABLES "
            "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'BASE TABLE' ORDER BY TABLE_NAME",
            // columns
            "SELECT c.COLUMN_NAME AS column_name, c.COLUMN_TYPE AS data_type, c.IS_NULLABLE AS is_nullable, "
            "CASE WHEN c.EXTRA LIKE '%DEFAULT_GENERATED%' AND c.COLUMN_DEFAULT NOT LIKE 'CURRENT_TIMESTAMP%' "
            "THEN CONCAT('(', c.COLUMN_DEFAULT, ')') ELSE c.COLUMN_DEFAULT END AS column_default, "
            "(SELECT k.ORDINAL_POSITION FROM information_schema.KEY_COLUMN_USAGE k "
            "WHERE k.TABLE_SCHEMA = c.TABLE_SCHEMA AND k.TABLE_NAME = c.TABLE_NAME "
            "AND k.COLUMN_NAME = c.COLUMN_NAME AND k.CONSTRAINT_NAME = 'PRIMARY') AS pk_position, "
            "c.EXTRA AS extra "
            "FROM information_schema.COLUMNS c WHERE c.TABLE_SCHEMA = DATABASE() AND c.TABLE_NAME = ? "
            "ORDER BY c.ORDINAL_POSITION",
            // indexes
            "SELECT INDEX_NAME AS index_name, COLUMN_NAME AS column_name, "
            "CASE WHEN NON_UNIQUE = 0 THEN 'YES' ELSE 'NO' END AS is_unique, SEQ_IN_INDEX AS seq, "
            "CASE WHEN COLLATION = 'D' THEN 'YES' ELSE 'NO' END AS sort_desc, "
            "CASE WHEN INDEX_NAME = 'PRIMARY' THEN 'pk' ELSE 'c' END AS origin "
            "FROM information_schema.STATISTICS WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ? "
            "AND COLUMN_NAME IS NOT NULL ORDER BY INDEX_NAME, SEQ_IN_INDEX",
            // foreign keys
            "SELECT k.CONSTRAINT_NAME AS constraint_name, k.COLUMN_NAME AS column_name, "
            "k.REFERENCED_TABLE_NAME AS ref_table, k.REFERENCED_COLUMN_NAME AS ref_column, "
            "r.DELETE_RULE AS on_delete, r.UPDATE_RULE AS on_update, k.ORDINAL_POSITION AS seq "
            "FROM information_schema.KEY_COLUMN_USAGE k "
            "JOIN information_schema.REFERENTIAL_CONSTRAINTS r ON r.CONSTRAINT_SCHEMA = k.CONSTRAINT_SCHEMA "
            "AND r.CONSTRAINT_NAME = k.CONSTRAINT_NAME AND r.TABLE_NAME = k.TABLE_NAME "
            "WHERE k.TABLE_SCHEMA = DATABASE() AND k.TABLE_NAME = ? AND k.REFERENCED_TABLE_NAME IS NOT NULL "
            "ORDER BY k.CONSTRAINT_NAME, k.ORDINAL_POSITION",
            // enums are inline column types
            "",
        };
        return queries;
    }

    std::string ledger_table_ddl(const std::string& table) const override {
        return "CREATE TABLE IF NOT EXISTS " + quote_identifier(table) + " (\n"
               "    `id` VARCHAR(36) NOT NULL,\n"
               "    `checksum` VARCHAR(64) NOT NULL,\n"
               "    `finished_at` DATETIME(3) NULL,\n"
               "    `migration_name` VARCHAR(255) NOT NULL,\n"
               "    `logs` TEXT NULL,\n"
               "    `rolled_back_at` DATETIME(3) NULL,\n"
               "    `started_at` DATETIME(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3),\n"
               "    `applied_steps_count` INT UNSIGNED NOT NULL DEFAULT 0,\n"
               "    PRIMARY KEY (`id`)\n"
               ") DEFAULT CHARACTER SET utf8mb4 COLLATE utf8mb4_unicode_ci";
    }

    std::vector<std::string> reset_statements(SQLConnection& conn) const override {
        jdoc rows = conn.select(introspection_queries().tables);
        std::vector<std::string> out = {"SET FOREIGN_KEY_CHECKS = 0"};
        for (const auto& row : rows.GetArray())
            out.push_back("DROP TABLE IF EXISTS " + quote_identifier(jhlp::get<std::string>(row, "table_name")));
        out.push_back("SET FOREIGN_KEY_CHECKS = 1");
        return out;
    }

protected:
    std::vector<std::string> table_constraints(const TableInfo& table) const override {
        std::vector<std::string> out;
        if (!table.primary_key.empty()) out.push_back("PRIMARY KEY (" + quote_list(table.primary_key) + ")");
        for (const ColumnInfo* c : table.ordered_columns()) {
            if (!c->unique || (c->primary_key && table.primary_key.size() == 1)) continue;
            out.push_back("UNIQUE INDEX " + quote_identifier(unique_key_name(table.name, c->name)) + "(" +
                          quote_identifier(c->name) + ")");
        }
        return out;
    }

    bool inline_unique() const override { return false; }

    std::string default_expression(const std::string& expr) const override { return "(" + expr + ")"; }

private:
    std::string add_unique(const std::string& table, const std::string& column) const {
        return "CREATE UNIQUE INDEX " + quote_identifier(unique_key_name(table, column)) + " ON " +
               quote_identifier(table) + "(" + quote_identifier(column) + ")";
    }
};

PProvider make_mysql_provider() { return std::make_unique<MySqlProvider>(); }
