#include "decl.hpp"
#include <map>

namespace {
    std::string escape(const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out;
    }
}

std::string DeclValue::render() const {
    if (is_scalar()) {
        const auto& s = scalar();
        if (s.kind == DeclScalar::Kind::String) return "\"" + escape(s.text) + "\"";
        return s.text;
    }
    if (is_list()) {
        std::string out = "[";
        const auto& items = list().items;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += items[i].render();
        }
        return out + "]";
    }
    const auto& c = call();
    std::string out = c.name + "(";
    for (size_t i = 0; i < c.args.size(); ++i) {
        if (i) out += ", ";
        if (!c.args[i].name.empty()) out += c.args[i].name + ": ";
        out += c.args[i].value.render();
    }
    return out + ")";
}

std::vector<std::string> DeclValue::names() const {
    std::vector<std::string> out;
    if (!is_list()) return out;
    for (const auto& item : list().items) {
        if (item.is_scalar()) out.push_back(item.scalar().text);
        else if (item.is_call()) out.push_back(item.call().name);
    }
    return out;
}

const DeclValue* DeclAttribute::arg(const std::string& name, int pos) const {
    for (const auto& a : args)
        if (a.name == name) return &a.value;
    if (pos < 0) return nullptr;
    int i = 0;
    for (const auto& a : args) {
        if (!a.name.empty()) continue;
        if (i++ == pos) return &a.value;
    }
    return nullptr;
}

const DeclAttribute* DeclField::attribute(const std::string& name) const {
    for (const auto& a : attributes)
        if (a.name == name) return &a;
    return nullptr;
}

const DeclField* DeclModel::field(const std::string& name) const {
    for (const auto& f : fields)
        if (f.name == name) return &f;
    return nullptr;
}

const DeclAttribute* DeclModel::attribute(const std::string& name) const {
    for (const auto& a : attributes)
        if (a.name == name) return &a;
    return nullptr;
}

const DeclValue* DeclConfigBlock::get(const std::string& key) const {
    for (const auto& e : entries)
        if (e.name == key) return &e.value;
    return nullptr;
}

std::optional<std::string> DeclConfigBlock::get_string(const std::string& key) const {
    const DeclValue* v = get(key);
    if (!v) return std::nullopt;
    if (v->is_scalar()) return v->scalar().text;
    if (v->is_call() && !v->call().args.empty() && v->call().args[0].value.is_scalar())
        return v->call().args[0].value.scalar().text;
    return std::nullopt;
}

const DeclModel* DeclSchema::model(const std::string& name) const {
    for (const auto& m : models)
        if (m.name == name) return &m;
    return nullptr;
}

const DeclEnum* DeclSchema::enumeration(const std::string& name) const {
    for (const auto& e : enums)
        if (e.name == name) return &e;
    return nullptr;
}

std::optional<std::string> DeclSchema::provider() const {
    if (datasources.empty()) return std::nullopt;
    return datasources.front().get_string("provider");
}

std::optional<ScalarType> scalar_type(const std::string& name) {
    static const std::map<std::string, ScalarType> types = {
        {"String",   ScalarType::String  },
        {"Int",      ScalarType::Int     },
        {"BigInt",   ScalarType::BigInt  },
        {"Float",    ScalarType::Float   },
        {"Decimal",  ScalarType::Decimal },
        {"Boolean",  ScalarType::Boolean },
        {"DateTime", ScalarType::DateTime},
        {"Json",     ScalarType::Json    },
        {"Bytes",    ScalarType::Bytes   },
    };
    auto it = types.find(name);
    if (it == types.end()) return std::nullopt;
    return it->second;
}

std::string scalar_name(ScalarType t) {
    switch (t) {
        case ScalarType::String:   return "String";
        case ScalarType::Int:      return "Int";
        case ScalarType::BigInt:   return "BigInt";
        case ScalarType::Float:    return "Float";
        case ScalarType::Decimal:  return "Decimal";
        case ScalarType::Boolean:  return "Boolean";
        case ScalarType::DateTime: return "DateTime";
        case ScalarType::Json:     return "Json";
        case ScalarType::Bytes:    return "Bytes";
    }
    return "String";
}
