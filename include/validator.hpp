#pragma once
#include <string>
#include <vector>
#include "decl.hpp"

// Semantic checks over a parsed declaration: name clashes, unknown type
// references, malformed relations, datasource/generator settings.
// Returns one human-readable issue per problem; empty means valid.
std::vector<std::string> validate_schema(const DeclSchema& schema);

// Referential action keyword (Cascade, SetNull, ...) to SQL; empty if unknown.
std::string referential_action_sql(const std::string& action);
