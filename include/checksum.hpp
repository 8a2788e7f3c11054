#pragma once
#include <string>

// CRLF -> LF and trailing whitespace trimmed per line, so a migration
// re-saved by another editor keeps its checksum.
std::string normalize_sql(const std::string& sql);

// Lowercase hex SHA-256 digest.
std::string sha256_hex(const std::string& data);

inline std::string migration_checksum(const std::string& sql) { return sha256_hex(normalize_sql(sql)); }
