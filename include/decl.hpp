#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

// ---- argument values: a closed variant of scalar | list | call ----

struct DeclValue;
struct DeclArgument;

struct DeclScalar {
    enum class Kind { String, Number, Boolean, Identifier };
    Kind kind = Kind::Identifier;
    std::string text; // unescaped for strings, literal spelling otherwise
};

struct DeclList {
    std::vector<DeclValue> items;
};

struct DeclCall {
    std::string name;
    std::vector<DeclArgument> args;
};

struct DeclValue {
    std::variant<DeclScalar, DeclList, DeclCall> node;

    bool is_scalar() const { return std::holds_alternative<DeclScalar>(node); }
    bool is_list() const { return std::holds_alternative<DeclList>(node); }
    bool is_call() const { return std::holds_alternative<DeclCall>(node); }
    const DeclScalar& scalar() const { return std::get<DeclScalar>(node); }
    const DeclList& list() const { return std::get<DeclList>(node); }
    const DeclCall& call() const { return std::get<DeclCall>(node); }

    bool is_string() const { return is_scalar() && scalar().kind == DeclScalar::Kind::String; }
    bool is_identifier() const { return is_scalar() && scalar().kind == DeclScalar::Kind::Identifier; }

    // Declaration-form spelling: "text" with quotes, 42, true, Ident, [a, b], fn(x).
    std::string render() const;
    // Identifiers / strings of a list value, e.g. fields: [a, b]. Empty for non-lists.
    std::vector<std::string> names() const;
};

// Positional when name is empty.
struct DeclArgument {
    std::string name;
    DeclValue value;
};

struct DeclAttribute {
    std::string name; // without the @ / @@, dotted for native types ("db.VarChar")
    std::vector<DeclArgument> args;
    int line = 0;

    // Named argument, or the positional one at index `pos` when no name matches.
    const DeclValue* arg(const std::string& name, int pos = -1) const;
};

struct DeclFieldType {
    std::string name;
    bool is_array = false;
    bool is_optional = false;
    bool is_unsupported = false;
    std::string unsupported; // native type text of Unsupported("...")
};

struct DeclField {
    std::string name;
    DeclFieldType type;
    std::vector<DeclAttribute> attributes;
    int line = 0;

    const DeclAttribute* attribute(const std::string& name) const;
    bool has(const std::string& name) const { return attribute(name) != nullptr; }
};

struct DeclModel {
    std::string name;
    std::vector<DeclField> fields;
    std::vector<DeclAttribute> attributes; // @@ block attributes
    int line = 0;

    const DeclField* field(const std::string& name) const;
    const DeclAttribute* attribute(const std::string& name) const;
};

struct DeclEnumValue {
    std::string name;
    std::vector<DeclAttribute> attributes;
    int line = 0;
};

struct DeclEnum {
    std::string name;
    std::vector<DeclEnumValue> values;
    std::vector<DeclAttribute> attributes;
    int line = 0;
};

// Shared by datasource and generator blocks: NAME { key = value }
struct DeclConfigEntry {
    std::string name;
    DeclValue value;
    int line = 0;
};

struct DeclConfigBlock {
    std::string name;
    std::vector<DeclConfigEntry> entries;
    int line = 0;

    const DeclValue* get(const std::string& key) const;
    // String value of `key`, or env("VAR") spelled as the variable name.
    std::optional<std::string> get_string(const std::string& key) const;
};

using DeclDatasource = DeclConfigBlock;
using DeclGenerator = DeclConfigBlock;

struct DeclSchema {
    std::vector<DeclDatasource> datasources;
    std::vector<DeclGenerator> generators;
    std::vector<DeclModel> models;
    std::vector<DeclEnum> enums;

    const DeclModel* model(const std::string& name) const;
    const DeclEnum* enumeration(const std::string& name) const;
    // provider of the first datasource, if any
    std::optional<std::string> provider() const;
};

enum class ScalarType { String, Int, BigInt, Float, Decimal, Boolean, DateTime, Json, Bytes };

// Built-in scalar by declaration name; nullopt for model/enum references.
std::optional<ScalarType> scalar_type(const std::string& name);
std::string scalar_name(ScalarType t);
