#include "validator.hpp"
#include <map>
#include <set>
#include <fmt/format.h>
#include "provider.hpp"

namespace {
    const std::set<std::string> providers = {"postgresql", "postgres", "mysql", "sqlite"};

    struct Checker {
        const DeclSchema& schema;
        std::vector<std::string> issues;

        template <class... Args>
        void issue(int line, fmt::format_string<Args...> msg, Args&&... args) {
            issues.push_back(fmt::format("line {}: {}", line, fmt::format(msg, std::forward<Args>(args)...)));
        }

        bool supports_lists() const {
            auto p = schema.provider();
            if (!p) return true;
            if (!providers.count(*p)) return false;
            return make_provider(provider_from_name(*p))->supports_scalar_lists();
        }

        void check_blocks() {
            if (schema.datasources.size() > 1)
                issue(schema.datasources[1].line, "only one datasource block is allowed");
            for (const auto& ds : schema.datasources) {
                auto provider = ds.get_string("provider");
                if (!provider)
                    issue(ds.line, "datasource '{}' is missing the provider", ds.name);
                else if (!providers.count(*provider))
                    issue(ds.line, "datasource '{}' has unknown provider '{}' (expected postgresql, mysql or sqlite)",
                          ds.name, *provider);
                if (!ds.get("url"))
                    issue(ds.line, "datasource '{}' is missing the url", ds.name);
            }
            for (const auto& g : schema.generators)
                if (!g.get("provider")) issue(g.line, "generator '{}' is missing the provider", g.name);
        }

        void check_names() {
            std::map<std::string, int> seen;
            for (const auto& m : schema.models) {
                if (seen.count(m.name)) issue(m.line, "duplicate name '{}' (first declared on line {})", m.name, seen[m.name]);
                else seen[m.name] = m.line;
            }
            for (const auto& e : schema.enums) {
                if (seen.count(e.name)) issue(e.line, "duplicate name '{}' (first declared on line {})", e.name, seen[e.name]);
                else seen[e.name] = e.line;
                if (e.values.empty()) issue(e.line, "enum '{}' has no values", e.name);
                std::set<std::string> values;
                for (const auto& v : e.values)
                    if (!values.insert(v.name).second) issue(v.line, "duplicate value '{}' in enum '{}'", v.name, e.name);
            }
        }

        void check_model(const DeclModel& m) {
            std::set<std::string> names;
            int ids = 0;
            bool has_unique = m.attribute("id") || m.attribute("unique");
            for (const auto& f : m.fields) {
                if (!names.insert(f.name).second) issue(f.line, "duplicate field '{}' in model '{}'", f.name, m.name);
                check_field(m, f);
                if (f.has("id")) {
                    ++ids;
                    if (f.type.is_optional || f.type.is_array)
                        issue(f.line, "field '{}.{}' cannot be an optional or list id", m.name, f.name);
                }
                if (f.has("id") || f.has("unique")) has_unique = true;
            }
            if (ids > 1) issue(m.line, "model '{}' has more than one @id field; use @@id for composite keys", m.name);
            if (ids > 0 && m.attribute("id")) issue(m.line, "model '{}' declares both @id and @@id", m.name);
            if (!has_unique && !m.attribute("ignore"))
                issue(m.line, "model '{}' needs an @id, @@id, @unique or @@unique criterion", m.name);
            for (const auto& a : m.attributes) {
                if (a.name != "id" && a.name != "unique" && a.name != "index") continue;
                const DeclValue* fields = a.arg("fields", 0);
                if (!fields || !fields->is_list()) {
                    issue(a.line, "@@{} on model '{}' needs a field list", a.name, m.name);
                    continue;
                }
                for (const auto& n : fields->names())
                    if (!m.field(n)) issue(a.line, "@@{} on model '{}' references unknown field '{}'", a.name, m.name, n);
            }
        }

        void check_field(const DeclModel& m, const DeclField& f) {
            const std::string& tn = f.type.name;
            bool is_scalar = scalar_type(tn).has_value();
            bool is_model = schema.model(tn) != nullptr;
            if (!f.type.is_unsupported && !is_scalar && !is_model && !schema.enumeration(tn))
                issue(f.line, "field '{}.{}' has unknown type '{}'", m.name, f.name, tn);
            if (f.type.is_array && !is_model && !supports_lists())
                issue(f.line, "field '{}.{}': scalar lists are not supported by provider '{}'", m.name, f.name,
                      schema.provider().value_or(""));
            if (const DeclAttribute* d = f.attribute("default"); d && d->args.empty())
                issue(d->line, "@default on '{}.{}' needs a value", m.name, f.name);
            if (const DeclAttribute* r = f.attribute("relation")) check_relation(m, f, *r);
        }

        void check_relation(const DeclModel& m, const DeclField& f, const DeclAttribute& r) {
            const DeclValue* fields = r.arg("fields");
            const DeclValue* refs = r.arg("references");
            if (!!fields != !!refs) {
                issue(r.line, "@relation on '{}.{}' needs both fields and references, or neither", m.name, f.name);
                return;
            }
            const DeclModel* target = schema.model(f.type.name);
            if (!target) {
                issue(r.line, "@relation on '{}.{}' references unknown model '{}'", m.name, f.name, f.type.name);
                return;
            }
            for (const char* key : {"onDelete", "onUpdate"}) {
                const DeclValue* act = r.arg(key);
                if (act && (!act->is_identifier() || referential_action_sql(act->scalar().text).empty()))
                    issue(r.line, "@relation on '{}.{}' has unknown {} action '{}'", m.name, f.name, key, act->render());
            }
            if (!fields) return;
            auto fnames = fields->names();
            auto rnames = refs->names();
            if (!fields->is_list() || !refs->is_list() || fnames.empty()) {
                issue(r.line, "@relation on '{}.{}': fields and references must be non-empty lists", m.name, f.name);
                return;
            }
            if (fnames.size() != rnames.size()) {
                issue(r.line, "@relation on '{}.{}': fields has {} entries but references has {}",
                      m.name, f.name, fnames.size(), rnames.size());
                return;
            }
            for (const auto& n : fnames)
                if (!m.field(n)) issue(r.line, "@relation on '{}.{}' names unknown field '{}'", m.name, f.name, n);
            for (const auto& n : rnames)
                if (!target->field(n)) issue(r.line, "@relation on '{}.{}' references unknown field '{}.{}'",
                                             m.name, f.name, target->name, n);
        }
    };
}

std::string referential_action_sql(const std::string& action) {
    static const std::map<std::string, std::string> actions = {
        {"Cascade", "CASCADE"}, {"Restrict", "RESTRICT"}, {"NoAction", "NO ACTION"},
        {"SetNull", "SET NULL"}, {"SetDefault", "SET DEFAULT"},
    };
    auto it = actions.find(action);
    return it == actions.end() ? "" : it->second;
}

std::vector<std::string> validate_schema(const DeclSchema& schema) {
    Checker c{schema, {}};
    c.check_blocks();
    c.check_names();
    for (const auto& m : schema.models) c.check_model(m);
    return std::move(c.issues);
}
