#include "schemaupdate.hpp"
#include <algorithm>
#include <map>
#include <set>
#include "lib.hpp"

namespace {
    std::string squeeze(const std::string& s) {
        std::string out;
        for (char c : s)
            if (c != ' ') out += c;
        return to_upper(out);
    }

    // A sole primary-key column is unique by definition.
    bool effective_unique(const ColumnInfo& c, const TableInfo& t) {
        return c.unique && !(c.primary_key && t.primary_key.size() == 1);
    }
}

bool same_type(const std::string& a, const std::string& b) {
    return squeeze(a) == squeeze(b);
}

SchemaUpdate::SchemaUpdate(const DbSchema& desired, const DbSchema& actual, const Provider& provider)
    : desired_(desired), actual_(actual), provider_(provider) {}

std::vector<std::string> SchemaUpdate::names(const std::vector<std::string>& raw) const {
    std::vector<std::string> out;
    for (const auto& n : raw) out.push_back(provider_.normalize_identifier(n));
    return out;
}

const TableInfo* SchemaUpdate::match_table(const DbSchema& schema, const std::string& name) const {
    if (const TableInfo* t = schema.table(name)) return t;
    const std::string key = provider_.normalize_identifier(name);
    for (const auto& [n, t] : schema.tables)
        if (provider_.normalize_identifier(n) == key) return &t;
    return nullptr;
}

const ColumnInfo* SchemaUpdate::match_column(const TableInfo& table, const std::string& name) const {
    if (const ColumnInfo* c = table.column(name)) return c;
    const std::string key = provider_.normalize_identifier(name);
    for (const auto& [n, c] : table.columns)
        if (provider_.normalize_identifier(n) == key) return &c;
    return nullptr;
}

const EnumInfo* SchemaUpdate::match_enum(const DbSchema& schema, const std::string& name) const {
    if (auto it = schema.enums.find(name); it != schema.enums.end()) return &it->second;
    const std::string key = provider_.normalize_identifier(name);
    for (const auto& [n, e] : schema.enums)
        if (provider_.normalize_identifier(n) == key) return &e;
    return nullptr;
}

std::string SchemaUpdate::index_key(IndexInfo index) const {
    for (auto& c : index.columns) c.name = provider_.normalize_identifier(c.name);
    return index.key(provider_.index_order_significant());
}

std::string SchemaUpdate::foreign_key_key(ForeignKeyInfo fk) const {
    fk.columns = names(fk.columns);
    fk.referenced_table = provider_.normalize_identifier(fk.referenced_table);
    fk.referenced_columns = names(fk.referenced_columns);
    return fk.key();
}

ChangeSet SchemaUpdate::compare() {
    ChangeSet cs;
    compare_enums(cs);
    compare_tables(cs);
    LOG_DEBUG("diff: {} create, {} alter, {} drop, {} index-only, {}/{}/{} enums",
              cs.tables_to_create.size(), cs.tables_to_alter.size(), cs.tables_to_drop.size(),
              cs.index_changes.size(), cs.enums_to_create.size(), cs.enums_to_alter.size(), cs.enums_to_drop.size());
    return cs;
}

void SchemaUpdate::compare_enums(ChangeSet& cs) const {
    for (const auto& [name, e] : desired_.enums) {
        const EnumInfo* found = match_enum(actual_, name);
        if (!found) {
            cs.enums_to_create.push_back(e);
            continue;
        }
        const EnumInfo& current = *found;
        EnumAlteration alt;
        alt.name = name;
        alt.desired = e;
        for (const auto& v : e.values)
            if (std::find(current.values.begin(), current.values.end(), v) == current.values.end()) alt.added.push_back(v);
        for (const auto& v : current.values)
            if (std::find(e.values.begin(), e.values.end(), v) == e.values.end()) alt.removed.push_back(v);
        if (alt.added.empty() && alt.removed.empty()) continue;

        // every live column still typed with the old enum, dropped ones included
        const std::string enum_type = provider_.enum_column_type(current);
        for (const auto& [tname, t] : actual_.tables)
            for (const ColumnInfo* c : t.ordered_columns())
                if (same_type(c->type, enum_type) || same_type(c->type, enum_type + "[]"))
                    alt.usages.emplace_back(tname, *c);
        cs.enums_to_alter.push_back(alt);
    }
    for (const auto& [name, e] : actual_.enums)
        if (!match_enum(desired_, name)) cs.enums_to_drop.push_back(e);
}

void SchemaUpdate::compare_tables(ChangeSet& cs) const {
    for (const auto& [name, t] : desired_.tables) {
        const TableInfo* current = match_table(actual_, name);
        if (!current) cs.tables_to_create.push_back(t);
        else compare_table(t, *current, cs);
    }
    for (const auto& [name, t] : actual_.tables)
        if (!match_table(desired_, name)) cs.tables_to_drop.push_back(t);
}

bool SchemaUpdate::compare_table(const TableInfo& desired, const TableInfo& actual, ChangeSet& cs) const {
    TableAlteration alt;
    alt.table = desired.name;
    alt.desired = desired;
    alt.actual = actual;

    for (const ColumnInfo* c : desired.ordered_columns()) {
        const ColumnInfo* current = match_column(actual, c->name);
        if (!current) {
            alt.added.push_back(*c);
        } else if (auto change = compare_column(*c, *current, desired, actual)) {
            alt.modified.push_back(*change);
        }
    }
    for (const ColumnInfo* c : actual.ordered_columns())
        if (!match_column(desired, c->name)) alt.dropped.push_back(*c);

    alt.primary_key_changed = names(desired.primary_key) != names(actual.primary_key);

    // indexes by content
    std::map<std::string, const IndexInfo*> want, have;
    for (const auto& i : desired.indexes) want[index_key(i)] = &i;
    for (const auto& i : actual.indexes) have[index_key(i)] = &i;
    for (const auto& [k, i] : want)
        if (!have.count(k)) alt.indexes_added.push_back(*i);
    for (const auto& [k, i] : have)
        if (!want.count(k)) alt.indexes_dropped.push_back(*i);

    // a changed foreign key is dropped and re-added
    std::map<std::string, const ForeignKeyInfo*> want_fk, have_fk;
    for (const auto& fk : desired.foreign_keys) want_fk[foreign_key_key(fk)] = &fk;
    for (const auto& fk : actual.foreign_keys) have_fk[foreign_key_key(fk)] = &fk;
    for (const auto& [k, fk] : want_fk)
        if (!have_fk.count(k)) alt.foreign_keys_added.push_back(*fk);
    for (const auto& [k, fk] : have_fk)
        if (!want_fk.count(k)) alt.foreign_keys_dropped.push_back(*fk);

    bool structural = !alt.added.empty() || !alt.dropped.empty() || !alt.modified.empty() ||
                      !alt.foreign_keys_added.empty() || !alt.foreign_keys_dropped.empty() ||
                      alt.primary_key_changed;
    bool indexes = !alt.indexes_added.empty() || !alt.indexes_dropped.empty();

    if (structural) {
        cs.tables_to_alter.push_back(std::move(alt));
        return true;
    }
    if (indexes) {
        cs.index_changes.push_back(IndexChange{desired.name, alt.indexes_added, alt.indexes_dropped});
        return true;
    }
    return false;
}

std::optional<ColumnChange> SchemaUpdate::compare_column(const ColumnInfo& to, const ColumnInfo& from,
                                                         const TableInfo& desired, const TableInfo& actual) const {
    ColumnChange ch;
    ch.from = from;
    ch.to = to;
    ch.type_changed = !same_type(to.type, from.type);
    ch.nullability_changed = to.nullable != from.nullable;
    ch.default_changed = !same_default(to.default_value, from.default_value);
    ch.unique_changed = effective_unique(to, desired) != effective_unique(from, actual);
    if (!ch.type_changed && !ch.nullability_changed && !ch.default_changed && !ch.unique_changed) return std::nullopt;
    LOG_TRACE("column {}.{} differs: type {} null {} default {} unique {}", desired.name, to.name,
              ch.type_changed, ch.nullability_changed, ch.default_changed, ch.unique_changed);
    return ch;
}
