#pragma once
#include <string>
#include <utility>
#include <vector>
#include "model.hpp"

class Provider;

// How a modified column is carried out; chosen per provider.
enum class ColumnChangeStrategy { InPlace, DropAndAdd, RedefineTable };

// A column present on both sides with a differing definition. Always one
// entry, never split into drop + add at this level.
struct ColumnChange {
    ColumnInfo from;
    ColumnInfo to;
    bool type_changed = false;
    bool nullability_changed = false;
    bool default_changed = false;
    bool unique_changed = false;
};

struct TableAlteration {
    std::string table;
    std::vector<ColumnInfo> added;
    std::vector<ColumnInfo> dropped;
    std::vector<ColumnChange> modified;
    std::vector<IndexInfo> indexes_added;
    std::vector<IndexInfo> indexes_dropped;
    std::vector<ForeignKeyInfo> foreign_keys_added;
    std::vector<ForeignKeyInfo> foreign_keys_dropped;
    bool primary_key_changed = false;
    TableInfo desired;  // full snapshots, needed for table redefinition
    TableInfo actual;
};

// Index additions/removals on a table whose columns and constraints are untouched.
struct IndexChange {
    std::string table;
    std::vector<IndexInfo> added;
    std::vector<IndexInfo> dropped;
};

struct EnumAlteration {
    std::string name;
    std::vector<std::string> added;
    std::vector<std::string> removed;
    EnumInfo desired;
    // live columns typed with the enum or a list of it, keyed by table
    std::vector<std::pair<std::string, ColumnInfo>> usages;
};

struct ChangeSet {
    std::vector<TableInfo> tables_to_create;
    std::vector<TableAlteration> tables_to_alter;
    std::vector<TableInfo> tables_to_drop;
    std::vector<IndexChange> index_changes;
    std::vector<EnumInfo> enums_to_create;
    std::vector<EnumAlteration> enums_to_alter;
    std::vector<EnumInfo> enums_to_drop;

    bool empty() const {
        return tables_to_create.empty() && tables_to_alter.empty() && tables_to_drop.empty() &&
               index_changes.empty() && enums_to_create.empty() && enums_to_alter.empty() &&
               enums_to_drop.empty();
    }
};

// Changes that discard stored data: dropped tables and columns, columns
// rebuilt by drop+add, removed enum values.
std::vector<std::string> destructive_warnings(const ChangeSet& cs, const Provider& provider);

// Changes that fail on a non-empty table, e.g. a required column without a default.
std::vector<std::string> unexecutable_warnings(const ChangeSet& cs);

// Human-readable listing of the differences, used for drift reports.
std::string drift_summary(const ChangeSet& cs);

std::string to_json(const ChangeSet& cs, bool pretty = false);
