#pragma once
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "changeset.hpp"
#include "provider.hpp"

// Renders a ChangeSet as a migration script in dependency-safe order. Every
// dialect decision is delegated to the Provider.
class DDLVisitor {
public:
    explicit DDLVisitor(const Provider& provider) : provider_(provider) {}

    // Commented script, statements terminated by ';'. Empty for an empty ChangeSet.
    std::string visit(const ChangeSet& cs);

    // Statements of the last visit(), in execution order, without terminators.
    const std::vector<std::string>& statements() const { return statements_; }

private:
    using Deferred = std::vector<std::pair<std::string, ForeignKeyInfo>>;

    void emit(const std::string& section, const std::vector<std::string>& stmts);
    void emit(const std::string& section, const std::string& stmt) { emit(section, std::vector<std::string>{stmt}); }

    // Dependency order among `tables`; FKs that close a cycle land in `deferred`.
    std::vector<const TableInfo*> creation_order(const std::vector<TableInfo>& tables, Deferred& deferred) const;

    const Provider& provider_;
    std::ostringstream buffer_;
    std::vector<std::string> statements_;
};
