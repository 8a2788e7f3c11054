#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "decl.hpp"
#include "model.hpp"
#include "provider.hpp"

// Lowers a parsed declaration into the provider-normalized schema model.
// The declaration is expected to have passed validate_schema().
class ModelBuilder {
public:
    ModelBuilder(const DeclSchema& decl, const Provider& provider);

    DbSchema build();

    // Non-fatal notes, e.g. a native type the provider cannot express.
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    void add_enum(const DeclEnum& e, DbSchema& schema);
    void add_model(const DeclModel& m, DbSchema& schema);
    ColumnInfo make_column(const DeclModel& m, const DeclField& f);
    std::optional<std::string> make_default(const DeclField& f, const ColumnInfo& column);
    std::vector<IndexColumn> index_columns(const DeclModel& m, const DeclValue& fields);
    void add_relations(const DeclModel& m, DbSchema& schema);
    void add_join_table(const DeclModel& m, const DeclField& f, DbSchema& schema);

    std::string table_name(const DeclModel& m) const;
    std::string column_name(const DeclModel& m, const std::string& field) const;
    std::string enum_value_name(const DeclEnum& e, const std::string& value) const;
    const DeclModel* related_model(const DeclField& f) const;
    void warn(const std::string& message);

    const DeclSchema& decl_;
    const Provider& provider_;
    std::map<std::string, EnumInfo> enums_; // by declaration name
    std::vector<std::string> warnings_;
};

// Convenience wrapper around ModelBuilder::build().
DbSchema build_model(const DeclSchema& decl, const Provider& provider);
