#include "introspector.hpp"
#include <algorithm>
#include <utility>
#include "errors.hpp"
#include "lib.hpp"

Introspector::Introspector(SQLConnection& conn, const Provider& provider, std::string ledger_table)
    : conn_(conn), provider_(provider), ledger_table_(std::move(ledger_table)) {}

DbSchema Introspector::introspect() {
    DbSchema schema;
    schema.enums = read_enums();
    std::set<std::string> enum_names;
    for (const auto& [name, _] : schema.enums) enum_names.insert(name);

    std::vector<std::string> failed;
    for (const auto& name : list_tables()) {
        try {
            schema.tables[name] = read_table(name, enum_names);
        } catch (const SqlError& e) {
            LOG_ERROR("cannot read table {}: {}", name, e.what());
            failed.push_back(name);
        }
    }
    if (!failed.empty())
        throw IntrospectionError(fmt::format("could not read the catalog of {} table(s): {}", failed.size(),
                                             join(failed, ", ")), failed);

    LOG_DEBUG("introspected {} tables, {} enums", schema.tables.size(), schema.enums.size());
    return schema;
}

std::vector<std::string> Introspector::list_tables() {
    std::vector<std::string> out;
    jdoc rows;
    try {
        rows = conn_.select(provider_.introspection_queries().tables);
    } catch (const SqlError& e) {
        THROW_AS(IntrospectionError, "cannot list tables: {}", e.what());
    }
    for (const auto& row : rows.GetArray()) {
        std::string name = jhlp::get<std::string>(row, "table_name");
        if (name.empty() || name == ledger_table_ || name.rfind("sqlite_", 0) == 0) continue;
        out.push_back(name);
    }
    return out;
}

std::map<std::string, EnumInfo> Introspector::read_enums() {
    std::map<std::string, EnumInfo> out;
    const std::string& sql = provider_.introspection_queries().enums;
    if (sql.empty()) return out;
    jdoc rows;
    try {
        rows = conn_.select(sql);
    } catch (const SqlError& e) {
        THROW_AS(IntrospectionError, "cannot read enum types: {}", e.what());
    }
    for (const auto& row : rows.GetArray()) {
        std::string name = jhlp::get<std::string>(row, "enum_name");
        EnumInfo& e = out[name];
        e.name = name;
        e.values.push_back(jhlp::get<std::string>(row, "enum_value"));
    }
    return out;
}

TableInfo Introspector::read_table(const std::string& name, const std::set<std::string>& enum_names) {
    TableInfo table;
    table.name = name;
    read_columns(table, enum_names);
    read_foreign_keys(table);
    read_indexes(table);
    provider_.complete_table(conn_, table);
    return table;
}

void Introspector::read_columns(TableInfo& table, const std::set<std::string>& enum_names) {
    jdoc rows = conn_.select(provider_.introspection_queries().columns, {table.name});
    std::vector<std::pair<int, std::string>> pk;
    for (const auto& row : rows.GetArray()) {
        ColumnInfo c;
        c.name = jhlp::get<std::string>(row, "column_name");
        c.type = provider_.normalize_type(jhlp::get<std::string>(row, "data_type"), enum_names);
        c.nullable = jhlp::get<std::string>(row, "is_nullable") == "YES";
        std::string extra = to_lower(jhlp::get<std::string>(row, "extra"));
        if (extra.find("auto_increment") != std::string::npos) {
            c.default_value = "autoincrement()";
        } else if (auto raw = jhlp::get_opt(row, "column_default")) {
            c.default_value = provider_.default_from_db(*raw, c);
        }
        if (auto pos = jhlp::get_opt(row, "pk_position")) {
            c.primary_key = true;
            pk.emplace_back(std::atoi(pos->c_str()), c.name);
        }
        table.add_column(c);
    }
    std::sort(pk.begin(), pk.end());
    for (const auto& [_, column] : pk) table.primary_key.push_back(column);
}

void Introspector::read_foreign_keys(TableInfo& table) {
    jdoc rows = conn_.select(provider_.introspection_queries().foreign_keys, {table.name});
    for (const auto& row : rows.GetArray()) {
        std::string name = jhlp::get<std::string>(row, "constraint_name");
        auto it = std::find_if(table.foreign_keys.begin(), table.foreign_keys.end(),
                               [&](const ForeignKeyInfo& fk) { return fk.name == name; });
        if (it == table.foreign_keys.end()) {
            ForeignKeyInfo fk;
            fk.name = name;
            fk.referenced_table = jhlp::get<std::string>(row, "ref_table");
            fk.on_delete = to_upper(jhlp::get<std::string>(row, "on_delete", "NO ACTION"));
            fk.on_update = to_upper(jhlp::get<std::string>(row, "on_update", "NO ACTION"));
            table.foreign_keys.push_back(fk);
            it = std::prev(table.foreign_keys.end());
        }
        it->columns.push_back(jhlp::get<std::string>(row, "column_name"));
        if (auto ref = jhlp::get_opt(row, "ref_column")) it->referenced_columns.push_back(*ref);
    }
}

void Introspector::read_indexes(TableInfo& table) {
    jdoc rows = conn_.select(provider_.introspection_queries().indexes, {table.name});
    std::vector<IndexInfo> found;
    std::vector<std::string> origins;
    for (const auto& row : rows.GetArray()) {
        std::string name = jhlp::get<std::string>(row, "index_name");
        if (found.empty() || found.back().name != name) {
            IndexInfo idx;
            idx.name = name;
            idx.unique = jhlp::get<std::string>(row, "is_unique") == "YES";
            found.push_back(idx);
            origins.push_back(jhlp::get<std::string>(row, "origin"));
        }
        IndexColumn col;
        if (auto column = jhlp::get_opt(row, "column_name")) col.name = *column;
        else if (auto expr = jhlp::get_opt(row, "expression")) col = provider_.index_expression(*expr);
        else throw SqlError(fmt::format("index {} has a key part without a column", name),
                            provider_.introspection_queries().indexes);
        if (jhlp::get<std::string>(row, "sort_desc") == "YES") col.sort = "DESC";
        found.back().columns.push_back(col);
    }

    for (size_t i = 0; i < found.size(); ++i) {
        IndexInfo& idx = found[i];
        if (origins[i] == "pk") continue;
        if (provider_.implicit_fk_indexes() && !idx.unique) {
            bool backing = std::any_of(table.foreign_keys.begin(), table.foreign_keys.end(),
                                       [&](const ForeignKeyInfo& fk) { return fk.name == idx.name; });
            if (backing) continue;
        }
        if (idx.unique && idx.columns.size() == 1 && idx.columns[0].sort.empty() && idx.columns[0].wrapper.empty()) {
            auto it = table.columns.find(idx.columns[0].name);
            if (it != table.columns.end()) {
                // a sole primary key is already unique
                if (!(it->second.primary_key && table.primary_key.size() == 1)) it->second.unique = true;
                continue;
            }
        }
        table.indexes.push_back(idx);
    }
}
