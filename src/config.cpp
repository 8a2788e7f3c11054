#include "config.hpp"
#include <cctype>
#include "errors.hpp"
#include "lib.hpp"

namespace {
    std::string percent_decode(const std::string& s) {
        std::string out;
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size() &&
                std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
                out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                out += s[i];
            }
        }
        return out;
    }

    void parse_query(const std::string& q, std::map<std::string, std::string>& params) {
        size_t start = 0;
        while (start <= q.size()) {
            size_t amp = q.find('&', start);
            std::string pair = q.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            if (!pair.empty()) {
                size_t eq = pair.find('=');
                if (eq == std::string::npos) params[percent_decode(pair)] = "";
                else params[percent_decode(pair.substr(0, eq))] = percent_decode(pair.substr(eq + 1));
            }
            if (amp == std::string::npos) break;
            start = amp + 1;
        }
    }

    // libpq conninfo values are single-quoted with \ and ' escaped.
    std::string pq_value(const std::string& v) {
        std::string out = "'";
        for (char c : v) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        return out + "'";
    }
}

std::string provider_name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::PostgreSQL: return "postgresql";
        case ProviderKind::MySQL:      return "mysql";
        case ProviderKind::SQLite:     return "sqlite";
    }
    return "postgresql";
}

ProviderKind provider_from_name(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "postgresql" || n == "postgres") return ProviderKind::PostgreSQL;
    if (n == "mysql") return ProviderKind::MySQL;
    if (n == "sqlite") return ProviderKind::SQLite;
    THROW_AS(ValidationError, "unknown provider '{}' (expected postgresql, mysql or sqlite)", name);
}

ProviderKind provider_from_url(const std::string& url) {
    if (starts_with_ci(url, "postgresql://") || starts_with_ci(url, "postgres://")) return ProviderKind::PostgreSQL;
    if (starts_with_ci(url, "mysql://")) return ProviderKind::MySQL;
    if (starts_with_ci(url, "sqlite://") || starts_with_ci(url, "file:")) return ProviderKind::SQLite;
    return ProviderKind::PostgreSQL;
}

ConnectionInfo ConnectionInfo::parse(const std::string& url) {
    ConnectionInfo info;
    info.url = url;
    info.provider = provider_from_url(url);

    std::string rest = url;
    size_t q = rest.find('?');
    if (q != std::string::npos) {
        parse_query(rest.substr(q + 1), info.params);
        rest = rest.substr(0, q);
    }

    if (info.provider == ProviderKind::SQLite) {
        if (starts_with_ci(rest, "sqlite://")) rest = rest.substr(9);
        else if (starts_with_ci(rest, "file:")) rest = rest.substr(5);
        if (rest.rfind("//", 0) == 0) rest = rest.substr(2);
        if (rest.empty()) THROW_AS(ValidationError, "connection url '{}' has no database file", url);
        info.database = rest;
        return info;
    }

    size_t scheme = rest.find("://");
    if (scheme == std::string::npos) THROW_AS(ValidationError, "connection url '{}' has no scheme", url);
    rest = rest.substr(scheme + 3);

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) info.database = percent_decode(rest.substr(slash + 1));

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        size_t colon = userinfo.find(':');
        info.user = percent_decode(userinfo.substr(0, colon));
        if (colon != std::string::npos) info.password = percent_decode(userinfo.substr(colon + 1));
    }
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        std::string port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (!port.empty()) {
            for (char c : port)
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    THROW_AS(ValidationError, "connection url '{}' has an invalid port", url);
            info.port = std::stoi(port);
        }
    }
    info.host = authority;

    auto schema = info.params.find("schema");
    if (schema != info.params.end()) info.schema = schema->second;
    else if (info.provider == ProviderKind::PostgreSQL) info.schema = "public";
    return info;
}

std::string ConnectionInfo::dsn() const {
    switch (provider) {
        case ProviderKind::SQLite:
            return database;
        case ProviderKind::MySQL:
            return url;
        case ProviderKind::PostgreSQL: {
            std::string out;
            auto add = [&out](const std::string& k, const std::string& v) {
                if (v.empty()) return;
                if (!out.empty()) out += ' ';
                out += k + "=" + pq_value(v);
            };
            add("host", host);
            if (port) add("port", std::to_string(port));
            add("dbname", database);
            add("user", user);
            add("password", password);
            for (const char* k : {"sslmode", "connect_timeout", "application_name", "sslrootcert", "sslcert", "sslkey"}) {
                auto it = params.find(k);
                if (it != params.end()) add(k, it->second);
            }
            if (!schema.empty()) add("options", "-c search_path=" + schema);
            return out;
        }
    }
    return url;
}
