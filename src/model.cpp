#include "model.hpp"
#include <algorithm>
#include <set>
#include "jsonhlp.hpp"

std::string IndexInfo::key(bool order_significant) const {
    std::vector<std::string> parts;
    for (const auto& c : columns) {
        std::string p = c.wrapper.empty() ? c.name : c.wrapper + "(" + c.name + ")";
        if (c.sort == "DESC") p += " DESC";
        parts.push_back(p);
    }
    if (!order_significant) std::sort(parts.begin(), parts.end());
    return join(parts, ",") + (unique ? "|U" : "|I");
}

std::vector<std::string> IndexInfo::column_names() const {
    std::vector<std::string> out;
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

std::string ForeignKeyInfo::key() const {
    return join(columns, ",") + "->" + referenced_table + "(" + join(referenced_columns, ",") + ")" +
           "|" + on_delete + "|" + on_update;
}

ColumnInfo& TableInfo::add_column(ColumnInfo column) {
    column.position = static_cast<int>(columns.size()) + 1;
    std::string name = column.name;
    auto [it, inserted] = columns.insert_or_assign(name, std::move(column));
    return it->second;
}

const ColumnInfo* TableInfo::column(const std::string& name) const {
    auto it = columns.find(name);
    return it == columns.end() ? nullptr : &it->second;
}

std::vector<const ColumnInfo*> TableInfo::ordered_columns() const {
    std::vector<const ColumnInfo*> out;
    for (const auto& [_, c] : columns) out.push_back(&c);
    std::stable_sort(out.begin(), out.end(), [](const ColumnInfo* a, const ColumnInfo* b) {
        return a->position < b->position;
    });
    return out;
}

std::vector<std::string> TableInfo::dependencies() const {
    std::set<std::string> deps;
    for (const auto& fk : foreign_keys)
        if (fk.referenced_table != name) deps.insert(fk.referenced_table);
    return {deps.begin(), deps.end()};
}

const TableInfo* DbSchema::table(const std::string& name) const {
    auto it = tables.find(name);
    return it == tables.end() ? nullptr : &it->second;
}

namespace {
    jval table_json(const TableInfo& t, jdaloc& a) {
        jval obj(json::kObjectType);
        jhlp::set(obj, "name", t.name, a);
        jval cols(json::kArrayType);
        for (const ColumnInfo* c : t.ordered_columns()) {
            jval col(json::kObjectType);
            jhlp::set(col, "name", c->name, a);
            jhlp::set(col, "type", c->type, a);
            jhlp::set(col, "nullable", c->nullable, a);
            jhlp::set(col, "primaryKey", c->primary_key, a);
            jhlp::set(col, "unique", c->unique, a);
            if (c->default_value) jhlp::set(col, "default", *c->default_value, a);
            cols.PushBack(col, a);
        }
        obj.AddMember("columns", cols, a);
        obj.AddMember("primaryKey", jhlp::str_array(t.primary_key, a), a);
        jval idx(json::kArrayType);
        for (const auto& i : t.indexes) {
            jval o(json::kObjectType);
            jhlp::set(o, "name", i.name, a);
            jhlp::set(o, "unique", i.unique, a);
            o.AddMember("columns", jhlp::str_array(i.column_names(), a), a);
            idx.PushBack(o, a);
        }
        obj.AddMember("indexes", idx, a);
        jval fks(json::kArrayType);
        for (const auto& fk : t.foreign_keys) {
            jval o(json::kObjectType);
            jhlp::set(o, "name", fk.name, a);
            o.AddMember("columns", jhlp::str_array(fk.columns, a), a);
            jhlp::set(o, "references", fk.referenced_table, a);
            o.AddMember("referencedColumns", jhlp::str_array(fk.referenced_columns, a), a);
            jhlp::set(o, "onDelete", fk.on_delete, a);
            jhlp::set(o, "onUpdate", fk.on_update, a);
            fks.PushBack(o, a);
        }
        obj.AddMember("foreignKeys", fks, a);
        return obj;
    }
}

std::string to_json(const DbSchema& schema, bool pretty) {
    jdoc doc(json::kObjectType);
    auto& a = doc.GetAllocator();
    jval tables(json::kArrayType);
    for (const auto& [_, t] : schema.tables) tables.PushBack(table_json(t, a), a);
    doc.AddMember("tables", tables, a);
    jval enums(json::kArrayType);
    for (const auto& [_, e] : schema.enums) {
        jval o(json::kObjectType);
        jhlp::set(o, "name", e.name, a);
        o.AddMember("values", jhlp::str_array(e.values, a), a);
        enums.PushBack(o, a);
    }
    doc.AddMember("enums", enums, a);
    return jhlp::dump(doc, pretty);
}
