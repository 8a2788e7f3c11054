#pragma once
#include <map>
#include <set>
#include <string>
#include "model.hpp"
#include "provider.hpp"
#include "sqlconnection.hpp"

// Reads the live catalog into the canonical model through the provider's
// queries. Never returns a partial model: any table that cannot be read
// fails the whole call with IntrospectionError naming the tables.
class Introspector {
public:
    Introspector(SQLConnection& conn, const Provider& provider, std::string ledger_table = "_schema_migrations");

    DbSchema introspect();

private:
    std::vector<std::string> list_tables();
    std::map<std::string, EnumInfo> read_enums();
    TableInfo read_table(const std::string& name, const std::set<std::string>& enum_names);
    void read_columns(TableInfo& table, const std::set<std::string>& enum_names);
    void read_foreign_keys(TableInfo& table);
    void read_indexes(TableInfo& table);

    SQLConnection& conn_;
    const Provider& provider_;
    std::string ledger_table_;
};
