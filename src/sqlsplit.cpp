#include "sqlsplit.hpp"
#include <cctype>
#include "lib.hpp"

namespace sqlsplit {

    namespace {
        // "$tag$" starting at i, or empty
        std::string dollar_tag(const std::string& s, size_t i) {
            if (s[i] != '$') return "";
            size_t j = i + 1;
            if (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) return "";
            while (j < s.size() && (std::isalnum(static_cast<unsigned char>(s[j])) || s[j] == '_')) ++j;
            if (j >= s.size() || s[j] != '$') return "";
            return s.substr(i, j - i + 1);
        }
    }

    std::vector<std::string> split(const std::string& script) {
        std::vector<std::string> out;
        std::string current;
        auto flush = [&]() {
            std::string stmt = trim(current);
            if (!stmt.empty()) out.push_back(stmt);
            current.clear();
        };

        size_t i = 0;
        const size_t n = script.size();
        while (i < n) {
            char c = script[i];
            if (c == '-' && i + 1 < n && script[i + 1] == '-') {
                size_t end = script.find('\n', i);
                i = end == std::string::npos ? n : end;
                continue;
            }
            if (c == '/' && i + 1 < n && script[i + 1] == '*') {
                size_t end = script.find("*/", i + 2);
                i = end == std::string::npos ? n : end + 2;
                current += ' ';
                continue;
            }
            if (c == '\'' || c == '"' || c == '`') {
                size_t j = i + 1;
                while (j < n) {
                    if (script[j] == c) {
                        if (j + 1 < n && script[j + 1] == c) { j += 2; continue; }
                        break;
                    }
                    ++j;
                }
                size_t end = j < n ? j + 1 : n;
                current += script.substr(i, end - i);
                i = end;
                continue;
            }
            if (c == '$') {
                std::string tag = dollar_tag(script, i);
                if (!tag.empty()) {
                    size_t close = script.find(tag, i + tag.size());
                    size_t end = close == std::string::npos ? n : close + tag.size();
                    current += script.substr(i, end - i);
                    i = end;
                    continue;
                }
            }
            if (c == ';') {
                flush();
                ++i;
                continue;
            }
            current += c;
            ++i;
        }
        flush();
        return out;
    }

} // namespace sqlsplit
