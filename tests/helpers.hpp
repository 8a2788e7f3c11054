#pragma once
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>
#include "model.hpp"

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

inline bool any_contains(const std::vector<std::string>& items, const std::string& needle) {
    return std::any_of(items.begin(), items.end(), [&](const std::string& s) { return contains(s, needle); });
}

// ---- hand-built schema snapshots ----

inline ColumnInfo col(const std::string& name, const std::string& type, bool nullable = false) {
    ColumnInfo c;
    c.name = name;
    c.type = type;
    c.nullable = nullable;
    return c;
}

inline ColumnInfo with_default(ColumnInfo c, const std::string& value) {
    c.default_value = value;
    return c;
}

inline ColumnInfo unique(ColumnInfo c) {
    c.unique = true;
    return c;
}

inline TableInfo table(const std::string& name, const std::vector<ColumnInfo>& columns,
                       const std::vector<std::string>& pk = {"id"}) {
    TableInfo t;
    t.name = name;
    for (const auto& c : columns) t.add_column(c);
    for (const auto& k : pk) {
        t.primary_key.push_back(k);
        t.columns[k].primary_key = true;
    }
    return t;
}

inline ForeignKeyInfo fk(const std::string& name, const std::string& column, const std::string& ref_table,
                         const std::string& ref_column = "id") {
    ForeignKeyInfo f;
    f.name = name;
    f.columns = {column};
    f.referenced_table = ref_table;
    f.referenced_columns = {ref_column};
    f.on_delete = "RESTRICT";
    f.on_update = "CASCADE";
    return f;
}

inline IndexInfo make_index(const std::string& name, const std::vector<std::string>& columns, bool is_unique = false) {
    IndexInfo i;
    i.name = name;
    i.unique = is_unique;
    for (const auto& c : columns) i.columns.push_back(IndexColumn{c, "", ""});
    return i;
}

inline DbSchema schema_of(const std::vector<TableInfo>& tables) {
    DbSchema s;
    for (const auto& t : tables) s.tables[t.name] = t;
    return s;
}

// ---- scratch directories ----

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static int counter = 0;
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("migrator_test_" + std::to_string(rd()) + "_" + std::to_string(++counter));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str(const std::string& sub = "") const { return (sub.empty() ? path : path / sub).string(); }
};

inline void write_text(const std::filesystem::path& file, const std::string& content) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
}
