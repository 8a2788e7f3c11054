#include "lib.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> mlog() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto existing = spdlog::get("migrator");
        if (existing) return existing;
        auto l = spdlog::stderr_color_mt("migrator");
        l->set_level(spdlog::level::warn);
        return l;
    }();
    return logger;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return to_lower(s.substr(0, prefix.size())) == to_lower(prefix);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}
