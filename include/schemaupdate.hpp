#pragma once
#include <optional>
#include <string>
#include <vector>
#include "changeset.hpp"
#include "model.hpp"
#include "provider.hpp"

// Structural comparison of two schema snapshots. `desired` is usually built
// from a declaration, `actual` introspected from the database.
class SchemaUpdate {
public:
    SchemaUpdate(const DbSchema& desired, const DbSchema& actual, const Provider& provider);

    ChangeSet compare();

private:
    void compare_enums(ChangeSet& cs) const;
    void compare_tables(ChangeSet& cs) const;
    // false when both tables are equivalent
    bool compare_table(const TableInfo& desired, const TableInfo& actual, ChangeSet& cs) const;
    std::optional<ColumnChange> compare_column(const ColumnInfo& to, const ColumnInfo& from,
                                               const TableInfo& desired, const TableInfo& actual) const;

    // name lookups and keys compare identifiers as the database does
    std::vector<std::string> names(const std::vector<std::string>& raw) const;
    const TableInfo* match_table(const DbSchema& schema, const std::string& name) const;
    const ColumnInfo* match_column(const TableInfo& table, const std::string& name) const;
    const EnumInfo* match_enum(const DbSchema& schema, const std::string& name) const;
    std::string index_key(IndexInfo index) const;
    std::string foreign_key_key(ForeignKeyInfo fk) const;

    const DbSchema& desired_;
    const DbSchema& actual_;
    const Provider& provider_;
};

// Case-insensitive type comparison with whitespace squeezed.
bool same_type(const std::string& a, const std::string& b);
