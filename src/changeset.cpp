#include "changeset.hpp"
#include <sstream>
#include "jsonhlp.hpp"
#include "provider.hpp"

std::vector<std::string> destructive_warnings(const ChangeSet& cs, const Provider& provider) {
    std::vector<std::string> out;
    for (const auto& t : cs.tables_to_drop)
        out.push_back(fmt::format("You are about to drop the `{}` table. All the data in the table will be lost.", t.name));
    for (const auto& alt : cs.tables_to_alter) {
        for (const auto& c : alt.dropped)
            out.push_back(fmt::format("You are about to drop the column `{}` on the `{}` table. "
                                      "All the data in the column will be lost.", c.name, alt.table));
        for (const auto& ch : alt.modified) {
            if (provider.column_change_strategy(ch) != ColumnChangeStrategy::DropAndAdd) continue;
            out.push_back(fmt::format("The column `{}` on the `{}` table would be dropped and recreated "
                                      "({} to {}). This will lead to data loss.",
                                      ch.to.name, alt.table, ch.from.type, ch.to.type));
        }
    }
    for (const auto& e : cs.enums_to_alter) {
        if (e.removed.empty()) continue;
        out.push_back(fmt::format("The values [{}] on the enum `{}` will be removed. "
                                  "If these variants are still used in the database, this will fail.",
                                  join(e.removed, ","), e.name));
    }
    return out;
}

std::vector<std::string> unexecutable_warnings(const ChangeSet& cs) {
    std::vector<std::string> out;
    for (const auto& alt : cs.tables_to_alter) {
        for (const auto& c : alt.added) {
            if (c.nullable || c.default_value) continue;
            out.push_back(fmt::format("Added the required column `{}` to the `{}` table without a default value. "
                                      "This is not possible if the table is not empty.", c.name, alt.table));
        }
        for (const auto& ch : alt.modified) {
            if (ch.nullability_changed && !ch.to.nullable && !ch.to.default_value)
                out.push_back(fmt::format("Made the column `{}` on table `{}` required. "
                                          "This fails if existing rows hold NULL.", ch.to.name, alt.table));
            if (ch.unique_changed && ch.to.unique)
                out.push_back(fmt::format("A unique constraint covering the column `{}` on the `{}` table will be added. "
                                          "If there are existing duplicate values, this will fail.", ch.to.name, alt.table));
        }
    }
    return out;
}

namespace {
    std::string describe(const ColumnChange& ch) {
        std::vector<std::string> parts;
        if (ch.type_changed) parts.push_back("changed the type from " + ch.from.type + " to " + ch.to.type);
        if (ch.nullability_changed) parts.push_back(ch.to.nullable ? "made optional" : "made required");
        if (ch.default_changed) parts.push_back("changed the default");
        if (ch.unique_changed) parts.push_back(ch.to.unique ? "added unique" : "removed unique");
        return join(parts, ", ");
    }

    void list_indexes(std::ostringstream& out, const char* mark, const char* verb, const std::vector<IndexInfo>& idx) {
        for (const auto& i : idx)
            out << "  " << mark << " " << verb << (i.unique ? " unique index" : " index") << " on columns ("
                << join(i.column_names(), ", ") << ")\n";
    }
}

std::string drift_summary(const ChangeSet& cs) {
    std::ostringstream out;
    if (!cs.enums_to_create.empty()) {
        out << "[+] Added enums\n";
        for (const auto& e : cs.enums_to_create) out << "  - " << e.name << "\n";
        out << "\n";
    }
    if (!cs.enums_to_drop.empty()) {
        out << "[-] Removed enums\n";
        for (const auto& e : cs.enums_to_drop) out << "  - " << e.name << "\n";
        out << "\n";
    }
    for (const auto& e : cs.enums_to_alter) {
        out << "[*] Changed the `" << e.name << "` enum\n";
        for (const auto& v : e.added) out << "  [+] Added variant `" << v << "`\n";
        for (const auto& v : e.removed) out << "  [-] Removed variant `" << v << "`\n";
        out << "\n";
    }
    if (!cs.tables_to_create.empty()) {
        out << "[+] Added tables\n";
        for (const auto& t : cs.tables_to_create) out << "  - " << t.name << "\n";
        out << "\n";
    }
    if (!cs.tables_to_drop.empty()) {
        out << "[-] Removed tables\n";
        for (const auto& t : cs.tables_to_drop) out << "  - " << t.name << "\n";
        out << "\n";
    }
    for (const auto& alt : cs.tables_to_alter) {
        out << "[*] Changed the `" << alt.table << "` table\n";
        for (const auto& c : alt.added) out << "  [+] Added column `" << c.name << "`\n";
        for (const auto& c : alt.dropped) out << "  [-] Removed column `" << c.name << "`\n";
        for (const auto& ch : alt.modified) out << "  [*] Altered column `" << ch.to.name << "` (" << describe(ch) << ")\n";
        if (alt.primary_key_changed) out << "  [*] Changed the primary key\n";
        list_indexes(out, "[+]", "Added", alt.indexes_added);
        list_indexes(out, "[-]", "Removed", alt.indexes_dropped);
        for (const auto& fk : alt.foreign_keys_added)
            out << "  [+] Added foreign key on columns (" << join(fk.columns, ", ") << ")\n";
        for (const auto& fk : alt.foreign_keys_dropped)
            out << "  [-] Removed foreign key on columns (" << join(fk.columns, ", ") << ")\n";
        out << "\n";
    }
    for (const auto& ic : cs.index_changes) {
        out << "[*] Changed the `" << ic.table << "` table\n";
        list_indexes(out, "[+]", "Added", ic.added);
        list_indexes(out, "[-]", "Removed", ic.dropped);
        out << "\n";
    }
    return out.str();
}

namespace {
    jval names_of(const std::vector<TableInfo>& tables, jdaloc& a) {
        std::vector<std::string> names;
        for (const auto& t : tables) names.push_back(t.name);
        return jhlp::str_array(names, a);
    }

    jval index_names(const std::vector<IndexInfo>& idx, jdaloc& a) {
        std::vector<std::string> names;
        for (const auto& i : idx) names.push_back(i.name);
        return jhlp::str_array(names, a);
    }
}

std::string to_json(const ChangeSet& cs, bool pretty) {
    jdoc doc(json::kObjectType);
    auto& a = doc.GetAllocator();

    doc.AddMember("createTables", names_of(cs.tables_to_create, a), a);
    doc.AddMember("dropTables", names_of(cs.tables_to_drop, a), a);

    jval alters(json::kArrayType);
    for (const auto& alt : cs.tables_to_alter) {
        jval o(json::kObjectType);
        jhlp::set(o, "table", alt.table, a);
        std::vector<std::string> added, dropped, modified, fk_added, fk_dropped;
        for (const auto& c : alt.added) added.push_back(c.name);
        for (const auto& c : alt.dropped) dropped.push_back(c.name);
        for (const auto& ch : alt.modified) modified.push_back(ch.to.name);
        for (const auto& fk : alt.foreign_keys_added) fk_added.push_back(fk.name);
        for (const auto& fk : alt.foreign_keys_dropped) fk_dropped.push_back(fk.name);
        o.AddMember("addedColumns", jhlp::str_array(added, a), a);
        o.AddMember("droppedColumns", jhlp::str_array(dropped, a), a);
        o.AddMember("modifiedColumns", jhlp::str_array(modified, a), a);
        o.AddMember("addedIndexes", index_names(alt.indexes_added, a), a);
        o.AddMember("droppedIndexes", index_names(alt.indexes_dropped, a), a);
        o.AddMember("addedForeignKeys", jhlp::str_array(fk_added, a), a);
        o.AddMember("droppedForeignKeys", jhlp::str_array(fk_dropped, a), a);
        jhlp::set(o, "primaryKeyChanged", alt.primary_key_changed, a);
        alters.PushBack(o, a);
    }
    doc.AddMember("alterTables", alters, a);

    jval index_changes(json::kArrayType);
    for (const auto& ic : cs.index_changes) {
        jval o(json::kObjectType);
        jhlp::set(o, "table", ic.table, a);
        o.AddMember("added", index_names(ic.added, a), a);
        o.AddMember("dropped", index_names(ic.dropped, a), a);
        index_changes.PushBack(o, a);
    }
    doc.AddMember("indexChanges", index_changes, a);

    std::vector<std::string> created, dropped;
    for (const auto& e : cs.enums_to_create) created.push_back(e.name);
    for (const auto& e : cs.enums_to_drop) dropped.push_back(e.name);
    doc.AddMember("createEnums", jhlp::str_array(created, a), a);
    jval enum_alters(json::kArrayType);
    for (const auto& e : cs.enums_to_alter) {
        jval o(json::kObjectType);
        jhlp::set(o, "name", e.name, a);
        o.AddMember("added", jhlp::str_array(e.added, a), a);
        o.AddMember("removed", jhlp::str_array(e.removed, a), a);
        enum_alters.PushBack(o, a);
    }
    doc.AddMember("alterEnums", enum_alters, a);
    doc.AddMember("dropEnums", jhlp::str_array(dropped, a), a);
    return jhlp::dump(doc, pretty);
}
