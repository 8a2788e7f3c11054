#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

/* Canonical schema model: the provider-normalized snapshot produced both from
   a declaration (desired state) and from introspection (actual state). */

struct ColumnInfo {
    std::string name;
    std::string type;          // canonical SQL type for the provider, e.g. TEXT, VARCHAR(191)
    bool nullable = true;
    bool primary_key = false;
    bool unique = false;
    // declaration-form expression: "text", 42, true, now(), autoincrement(), dbgenerated("..."), ENUMVALUE
    std::optional<std::string> default_value;
    int position = 0;          // declaration / ordinal order

    bool auto_increment() const { return default_value && *default_value == "autoincrement()"; }
};

struct IndexColumn {
    std::string name;
    std::string sort;    // "", "ASC" or "DESC"
    std::string wrapper; // function applied to the column, e.g. lower

    bool operator==(const IndexColumn& o) const {
        return name == o.name && sort == o.sort && wrapper == o.wrapper;
    }
};

struct IndexInfo {
    std::string name;
    std::vector<IndexColumn> columns;
    bool unique = false;

    // Content identity: names are ignored since generated names differ
    // between a declaration and the database.
    std::string key(bool order_significant) const;
    std::vector<std::string> column_names() const;
};

struct ForeignKeyInfo {
    std::string name;
    std::vector<std::string> columns;
    std::string referenced_table;
    std::vector<std::string> referenced_columns;
    std::string on_delete = "NO ACTION";
    std::string on_update = "NO ACTION";

    std::string key() const;
};

struct EnumInfo {
    std::string name;
    std::vector<std::string> values;
};

struct TableInfo {
    std::string name;
    std::map<std::string, ColumnInfo> columns;
    std::vector<IndexInfo> indexes;
    std::vector<ForeignKeyInfo> foreign_keys;
    std::vector<std::string> primary_key;

    // Appends with the next position.
    ColumnInfo& add_column(ColumnInfo column);
    const ColumnInfo* column(const std::string& name) const;
    std::vector<const ColumnInfo*> ordered_columns() const;
    // Tables this one references, excluding itself.
    std::vector<std::string> dependencies() const;
};

struct DbSchema {
    std::map<std::string, TableInfo> tables;
    std::map<std::string, EnumInfo> enums;

    const TableInfo* table(const std::string& name) const;
    bool empty() const { return tables.empty() && enums.empty(); }
};

std::string to_json(const DbSchema& schema, bool pretty = false);
