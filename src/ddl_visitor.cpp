#include "ddl_visitor.hpp"
#include <algorithm>
#include <map>
#include <set>
#include "lib.hpp"

void DDLVisitor::emit(const std::string& section, const std::vector<std::string>& stmts) {
    std::vector<std::string> live;
    for (const auto& s : stmts)
        if (!s.empty()) live.push_back(s);
    if (live.empty()) return;
    buffer_ << "-- " << section << "\n";
    for (const auto& s : live) {
        buffer_ << s << ";\n";
        statements_.push_back(s);
    }
    buffer_ << "\n";
}

std::vector<const TableInfo*> DDLVisitor::creation_order(const std::vector<TableInfo>& tables, Deferred& deferred) const {
    std::map<std::string, const TableInfo*> pending;
    for (const auto& t : tables) pending[t.name] = &t;

    std::vector<const TableInfo*> order;
    std::set<std::string> placed;
    while (!pending.empty()) {
        const TableInfo* next = nullptr;
        for (const auto& [name, t] : pending) {
            bool ready = true;
            for (const auto& dep : t->dependencies())
                if (pending.count(dep) && !placed.count(dep)) { ready = false; break; }
            if (ready) { next = t; break; }
        }
        bool cyclic = next == nullptr;
        if (cyclic) next = pending.begin()->second; // ties broken by name

        for (const auto& fk : next->foreign_keys) {
            bool forward = fk.referenced_table != next->name && pending.count(fk.referenced_table) &&
                           !placed.count(fk.referenced_table);
            if (forward) deferred.emplace_back(next->name, fk);
        }
        if (cyclic) LOG_DEBUG("dependency cycle broken at table {}", next->name);
        placed.insert(next->name);
        order.push_back(next);
        pending.erase(next->name);
    }
    return order;
}

std::string DDLVisitor::visit(const ChangeSet& cs) {
    buffer_.str("");
    buffer_.clear();
    statements_.clear();
    if (cs.empty()) return "";

    std::map<std::string, bool> redefined;
    for (const auto& alt : cs.tables_to_alter) redefined[alt.table] = provider_.redefines(alt);

    // 1. extensions
    emit("CreateExtension", provider_.prelude(cs));

    // 2. enums
    for (const auto& e : cs.enums_to_create) emit("CreateEnum", provider_.create_enum(e));
    for (const auto& e : cs.enums_to_alter) emit("AlterEnum", provider_.alter_enum(e));

    // 3. foreign keys going away, including those closing a cycle among dropped tables
    Deferred drop_cycle;
    std::vector<const TableInfo*> drop_order = creation_order(cs.tables_to_drop, drop_cycle);
    std::reverse(drop_order.begin(), drop_order.end());
    if (provider_.supports_add_constraint())
        for (const auto& [table, fk] : drop_cycle) emit("DropForeignKey", provider_.drop_foreign_key(table, fk));
    for (const auto& alt : cs.tables_to_alter) {
        if (redefined[alt.table]) continue;
        for (const auto& fk : alt.foreign_keys_dropped) emit("DropForeignKey", provider_.drop_foreign_key(alt.table, fk));
    }

    // 4. indexes going away
    for (const auto& alt : cs.tables_to_alter) {
        if (redefined[alt.table]) continue;
        for (const auto& idx : alt.indexes_dropped) emit("DropIndex", provider_.drop_index(alt.table, idx));
    }
    for (const auto& ic : cs.index_changes)
        for (const auto& idx : ic.dropped) emit("DropIndex", provider_.drop_index(ic.table, idx));

    // 5. column, key and constraint changes
    for (const auto& alt : cs.tables_to_alter)
        emit(redefined[alt.table] ? "RedefineTables" : "AlterTable", provider_.alter_table(alt));

    // 6. dependents first
    for (const TableInfo* t : drop_order) emit("DropTable", provider_.drop_table(t->name));

    // 7. new tables; forward references wait for step 9 where the dialect allows it
    Deferred deferred;
    std::vector<const TableInfo*> create_order = creation_order(cs.tables_to_create, deferred);
    if (!provider_.supports_add_constraint()) deferred.clear();
    for (const TableInfo* t : create_order) {
        std::vector<ForeignKeyInfo> inline_fks;
        for (const auto& fk : t->foreign_keys) {
            bool later = std::any_of(deferred.begin(), deferred.end(), [&](const auto& d) {
                return d.first == t->name && d.second.name == fk.name;
            });
            if (!later) inline_fks.push_back(fk);
        }
        emit("CreateTable", provider_.create_table(*t, inline_fks));
    }

    // 8. indexes
    for (const TableInfo* t : create_order)
        for (const auto& idx : t->indexes) emit("CreateIndex", provider_.create_index(t->name, idx));
    for (const auto& alt : cs.tables_to_alter) {
        if (redefined[alt.table]) continue;
        for (const auto& idx : alt.indexes_added) emit("CreateIndex", provider_.create_index(alt.table, idx));
    }
    for (const auto& ic : cs.index_changes)
        for (const auto& idx : ic.added) emit("CreateIndex", provider_.create_index(ic.table, idx));

    // 9. foreign keys
    for (const auto& [table, fk] : deferred) emit("AddForeignKey", provider_.add_foreign_key(table, fk));
    for (const auto& alt : cs.tables_to_alter) {
        if (redefined[alt.table]) continue;
        for (const auto& fk : alt.foreign_keys_added) emit("AddForeignKey", provider_.add_foreign_key(alt.table, fk));
    }

    // 10. enums no longer referenced
    for (const auto& e : cs.enums_to_drop) emit("DropEnum", provider_.drop_enum(e));

    LOG_DEBUG("generated {} statements for {}", statements_.size(), provider_.name());
    return buffer_.str();
}
