#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Base for every error the engine reports upward.
class MigrateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One parser diagnostic. Collected, never thrown on its own.
struct SyntaxError {
    int line = 0;
    int column = 0;
    std::string message;
    std::string context; // text of the offending line

    std::string to_string() const;
};

// Thrown when a caller insists on a usable schema but the parse had errors.
class SchemaSyntaxError : public MigrateError {
public:
    explicit SchemaSyntaxError(std::vector<SyntaxError> errors);
    const std::vector<SyntaxError>& errors() const { return errors_; }
private:
    std::vector<SyntaxError> errors_;
};

class ValidationError : public MigrateError {
public:
    explicit ValidationError(const std::string& msg) : MigrateError(msg), issues_{msg} {}
    explicit ValidationError(std::vector<std::string> issues);
    const std::vector<std::string>& issues() const { return issues_; }
private:
    std::vector<std::string> issues_;
};

class ConnectivityError : public MigrateError {
public:
    using MigrateError::MigrateError;
};

class IntrospectionError : public MigrateError {
public:
    explicit IntrospectionError(const std::string& msg) : MigrateError(msg) {}
    IntrospectionError(const std::string& msg, std::vector<std::string> failed_tables)
        : MigrateError(msg), failed_tables_(std::move(failed_tables)) {}
    bool partial() const { return !failed_tables_.empty(); }
    const std::vector<std::string>& failed_tables() const { return failed_tables_; }
private:
    std::vector<std::string> failed_tables_;
};

class DestructiveChangeError : public MigrateError {
public:
    explicit DestructiveChangeError(std::vector<std::string> warnings);
    const std::vector<std::string>& warnings() const { return warnings_; }
private:
    std::vector<std::string> warnings_;
};

class ApplyError : public MigrateError {
public:
    ApplyError(std::string migration, std::string statement, const std::string& cause);
    const std::string& migration() const { return migration_; }
    const std::string& statement() const { return statement_; }
private:
    std::string migration_;
    std::string statement_;
};

class DriftError : public MigrateError {
public:
    using MigrateError::MigrateError;
};

class FilesystemError : public MigrateError {
public:
    FilesystemError(const std::string& msg, std::string path)
        : MigrateError(msg + ": " + path), path_(std::move(path)) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

// Raised by the connection classes when the driver rejects a statement.
class SqlError : public std::runtime_error {
public:
    SqlError(const std::string& msg, std::string sql)
        : std::runtime_error(msg), sql_(std::move(sql)) {}
    const std::string& sql() const { return sql_; }
private:
    std::string sql_;
};
