#include "model_builder.hpp"
#include <algorithm>
#include <set>
#include <tuple>
#include <utility>
#include "lib.hpp"
#include "validator.hpp"

namespace {
    bool ignored(const DeclModel& m) { return m.attribute("ignore") != nullptr; }

    std::optional<std::string> mapped_name(const DeclAttribute* map) {
        if (!map) return std::nullopt;
        const DeclValue* v = map->arg("name", 0);
        if (!v || !v->is_scalar()) return std::nullopt;
        return v->scalar().text;
    }

    std::string index_name(const DeclAttribute& a, const std::string& fallback) {
        for (const char* key : {"map", "name"}) {
            const DeclValue* v = a.arg(key);
            if (v && v->is_string()) return v->scalar().text;
        }
        return fallback;
    }

    const DeclValue* fields_arg(const DeclAttribute& a) { return a.arg("fields", 0); }
}

ModelBuilder::ModelBuilder(const DeclSchema& decl, const Provider& provider)
    : decl_(decl), provider_(provider) {}

DbSchema build_model(const DeclSchema& decl, const Provider& provider) {
    return ModelBuilder(decl, provider).build();
}

void ModelBuilder::warn(const std::string& message) {
    LOG_WARN("{}", message);
    warnings_.push_back(message);
}

DbSchema ModelBuilder::build() {
    DbSchema schema;
    for (const auto& e : decl_.enums) add_enum(e, schema);
    for (const auto& m : decl_.models)
        if (!ignored(m)) add_model(m, schema);
    // relations need every table's columns in place
    for (const auto& m : decl_.models)
        if (!ignored(m)) add_relations(m, schema);
    LOG_DEBUG("built model: {} tables, {} enums", schema.tables.size(), schema.enums.size());
    return schema;
}

std::string ModelBuilder::table_name(const DeclModel& m) const {
    return mapped_name(m.attribute("map")).value_or(m.name);
}

std::string ModelBuilder::column_name(const DeclModel& m, const std::string& field) const {
    const DeclField* f = m.field(field);
    if (!f) return field;
    return mapped_name(f->attribute("map")).value_or(field);
}

std::string ModelBuilder::enum_value_name(const DeclEnum& e, const std::string& value) const {
    for (const auto& v : e.values) {
        if (v.name != value) continue;
        for (const auto& a : v.attributes)
            if (a.name == "map") return mapped_name(&a).value_or(value);
    }
    return value;
}

const DeclModel* ModelBuilder::related_model(const DeclField& f) const {
    if (f.type.is_unsupported) return nullptr;
    return decl_.model(f.type.name);
}

/* ---------- enums ---------- */

void ModelBuilder::add_enum(const DeclEnum& e, DbSchema& schema) {
    EnumInfo info;
    info.name = e.name;
    for (const auto& a : e.attributes)
        if (a.name == "map") info.name = mapped_name(&a).value_or(e.name);
    for (const auto& v : e.values) info.values.push_back(enum_value_name(e, v.name));
    enums_[e.name] = info;
    if (provider_.supports_enum_types()) schema.enums[info.name] = info;
}

/* ---------- tables ---------- */

void ModelBuilder::add_model(const DeclModel& m, DbSchema& schema) {
    TableInfo table;
    table.name = table_name(m);

    for (const auto& f : m.fields) {
        if (f.has("ignore") || related_model(f)) continue;
        ColumnInfo& c = table.add_column(make_column(m, f));
        if (c.primary_key) table.primary_key.push_back(c.name);
    }

    for (const auto& a : m.attributes) {
        const DeclValue* fields = fields_arg(a);
        if (!fields) continue;
        std::vector<IndexColumn> cols = index_columns(m, *fields);
        if (cols.empty()) continue;
        std::vector<std::string> names;
        for (const auto& c : cols) names.push_back(c.name);

        if (a.name == "id") {
            table.primary_key = names;
            for (const auto& n : names) {
                auto it = table.columns.find(n);
                if (it == table.columns.end()) continue;
                it->second.primary_key = true;
                it->second.nullable = false;
            }
        } else if (a.name == "unique") {
            if (cols.size() == 1 && cols[0].wrapper.empty() && cols[0].sort.empty() && table.columns.count(names[0])) {
                table.columns[names[0]].unique = true;
                continue;
            }
            IndexInfo idx;
            idx.name = index_name(a, table.name + "_" + join(names, "_") + "_key");
            idx.columns = cols;
            idx.unique = true;
            table.indexes.push_back(idx);
        } else if (a.name == "index") {
            IndexInfo idx;
            idx.name = index_name(a, table.name + "_" + join(names, "_") + "_idx");
            idx.columns = cols;
            table.indexes.push_back(idx);
        }
    }

    std::string name = table.name;
    schema.tables[name] = std::move(table);
}

ColumnInfo ModelBuilder::make_column(const DeclModel& m, const DeclField& f) {
    ColumnInfo c;
    c.name = column_name(m, f.name);
    c.nullable = f.type.is_optional || f.type.is_array;

    if (f.type.is_unsupported) {
        c.type = f.type.unsupported;
    } else if (auto scalar = scalar_type(f.type.name)) {
        c.type = provider_.map_type(*scalar);
    } else if (auto it = enums_.find(f.type.name); it != enums_.end()) {
        c.type = provider_.enum_column_type(it->second);
    } else {
        c.type = f.type.name;
    }

    for (const auto& a : f.attributes) {
        if (a.name.rfind("db.", 0) != 0) continue;
        std::vector<std::string> args;
        for (const auto& arg : a.args) args.push_back(arg.value.is_string() ? arg.value.scalar().text : arg.value.render());
        std::string native = a.name.substr(3);
        if (auto t = provider_.native_type(native, args)) c.type = *t;
        else warn(fmt::format("{}.{}: native type @{} is not available on {}, keeping {}",
                              m.name, f.name, a.name, provider_.name(), c.type));
    }
    if (f.type.is_array) c.type += "[]";

    if (f.has("id")) {
        c.primary_key = true;
        c.nullable = false;
    }
    if (f.has("unique")) c.unique = true;
    c.default_value = make_default(f, c);
    return c;
}

// Defaults stay in declaration form; client-side generators have no SQL counterpart.
std::optional<std::string> ModelBuilder::make_default(const DeclField& f, const ColumnInfo& column) {
    const DeclAttribute* a = f.attribute("default");
    if (!a || f.has("updatedAt")) return std::nullopt;
    const DeclValue* v = a->arg("value", 0);
    if (!v) return std::nullopt;

    if (v->is_call()) {
        const DeclCall& call = v->call();
        if (call.name == "uuid" || call.name == "cuid" || call.name == "nanoid") return std::nullopt;
        if (call.name == "autoincrement") return std::string("autoincrement()");
        if (call.name == "now") return std::string("now()");
        if (call.name == "dbgenerated") {
            if (call.args.empty() || !call.args[0].value.is_scalar()) return std::nullopt;
            return "dbgenerated(" + decl_quote(call.args[0].value.scalar().text) + ")";
        }
        return v->render();
    }
    if (v->is_list()) return v->render();

    const DeclScalar& s = v->scalar();
    switch (s.kind) {
        case DeclScalar::Kind::String:
            return decl_quote(s.text);
        case DeclScalar::Kind::Identifier: {
            std::string value = s.text;
            if (const DeclEnum* e = decl_.enumeration(f.type.name)) value = enum_value_name(*e, s.text);
            // enums stored as plain text keep a string literal default
            if (provider_.type_family(column.type) != TypeFamily::Enum) return decl_quote(value);
            return value;
        }
        default:
            return s.text;
    }
}

std::vector<IndexColumn> ModelBuilder::index_columns(const DeclModel& m, const DeclValue& fields) {
    std::vector<IndexColumn> out;
    if (!fields.is_list()) return out;
    for (const auto& item : fields.list().items) {
        IndexColumn col;
        if (item.is_scalar()) {
            col.name = column_name(m, item.scalar().text);
        } else if (item.is_call()) {
            const DeclCall& call = item.call();
            if (m.field(call.name)) {
                col.name = column_name(m, call.name);
            } else {
                // lower(email)
                col.wrapper = to_lower(call.name);
                for (const auto& arg : call.args)
                    if (arg.name.empty() && arg.value.is_scalar()) col.name = column_name(m, arg.value.scalar().text);
            }
            for (const auto& arg : call.args)
                if (arg.name == "sort" && arg.value.is_scalar()) col.sort = to_upper(arg.value.scalar().text);
            if (col.sort == "ASC") col.sort.clear();
        } else {
            continue;
        }
        out.push_back(col);
    }
    return out;
}

/* ---------- relations ---------- */

void ModelBuilder::add_relations(const DeclModel& m, DbSchema& schema) {
    TableInfo& table = schema.tables[table_name(m)];
    for (const auto& f : m.fields) {
        const DeclModel* target = related_model(f);
        if (!target || f.has("ignore") || ignored(*target)) continue;

        const DeclAttribute* rel = f.attribute("relation");
        const DeclValue* fields = rel ? rel->arg("fields") : nullptr;
        const DeclValue* references = rel ? rel->arg("references") : nullptr;
        if (!fields || !references) {
            if (f.type.is_array) add_join_table(m, f, schema);
            continue;
        }

        ForeignKeyInfo fk;
        bool required = false;
        for (const auto& n : fields->names()) {
            fk.columns.push_back(column_name(m, n));
            const ColumnInfo* c = table.column(fk.columns.back());
            required = required || (c && !c->nullable);
        }
        fk.referenced_table = table_name(*target);
        for (const auto& n : references->names()) fk.referenced_columns.push_back(column_name(*target, n));
        fk.name = table.name + "_" + join(fk.columns, "_") + "_fkey";
        if (const DeclValue* map = rel->arg("map"); map && map->is_string()) fk.name = map->scalar().text;

        fk.on_delete = required ? "RESTRICT" : "SET NULL";
        fk.on_update = "CASCADE";
        if (const DeclValue* act = rel->arg("onDelete"); act && act->is_scalar()) {
            std::string sql = referential_action_sql(act->scalar().text);
            if (!sql.empty()) fk.on_delete = sql;
        }
        if (const DeclValue* act = rel->arg("onUpdate"); act && act->is_scalar()) {
            std::string sql = referential_action_sql(act->scalar().text);
            if (!sql.empty()) fk.on_update = sql;
        }
        table.foreign_keys.push_back(fk);
    }
}

// Implicit many-to-many: list fields on both sides and no foreign key fields.
void ModelBuilder::add_join_table(const DeclModel& m, const DeclField& f, DbSchema& schema) {
    const DeclModel* other = related_model(f);
    const DeclField* back = nullptr;
    for (const auto& of : other->fields)
        if (of.type.name == m.name && of.type.is_array && (other != &m || of.name != f.name)) back = &of;
    if (!back) return;

    std::string relation;
    if (const DeclAttribute* rel = f.attribute("relation"))
        if (const DeclValue* n = rel->arg("name", 0); n && n->is_string()) relation = n->scalar().text;

    const DeclModel* a = &m;
    const DeclModel* b = other;
    if (b->name < a->name) std::swap(a, b);
    std::string name = "_" + (relation.empty() ? a->name + "To" + b->name : relation);
    if (schema.tables.count(name)) return;

    auto pk_column = [&](const DeclModel& model) -> const ColumnInfo* {
        const TableInfo* t = schema.table(table_name(model));
        if (!t || t->primary_key.size() != 1) return nullptr;
        return t->column(t->primary_key.front());
    };
    const ColumnInfo* a_pk = pk_column(*a);
    const ColumnInfo* b_pk = pk_column(*b);
    if (!a_pk || !b_pk) {
        warn(fmt::format("many-to-many relation {}: both models need a single-column id", name));
        return;
    }

    TableInfo join_table;
    join_table.name = name;
    for (const auto& [col, pk] : {std::pair{std::string("A"), a_pk}, std::pair{std::string("B"), b_pk}}) {
        ColumnInfo c;
        c.name = col;
        c.type = pk->type;
        c.nullable = false;
        join_table.add_column(c);
    }

    IndexInfo unique;
    unique.name = name + "_AB_unique";
    unique.unique = true;
    unique.columns = {IndexColumn{"A", "", ""}, IndexColumn{"B", "", ""}};
    join_table.indexes.push_back(unique);

    IndexInfo lookup;
    lookup.name = name + "_B_index";
    lookup.columns = {IndexColumn{"B", "", ""}};
    join_table.indexes.push_back(lookup);

    for (const auto& [col, model, pk] : {std::tuple{std::string("A"), a, a_pk}, std::tuple{std::string("B"), b, b_pk}}) {
        ForeignKeyInfo fk;
        fk.name = name + "_" + col + "_fkey";
        fk.columns = {col};
        fk.referenced_table = table_name(*model);
        fk.referenced_columns = {pk->name};
        fk.on_delete = "CASCADE";
        fk.on_update = "CASCADE";
        join_table.foreign_keys.push_back(fk);
    }
    schema.tables[name] = std::move(join_table);
}
