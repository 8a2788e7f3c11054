// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

#include <cstdint>
#include <cstdlib>
#include <type_traits>
#include <optional>
#include <string>
#include <vector>
#include "lib.hpp"

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;
using jit = rapidjson::Value::ConstMemberIterator;
using jdaloc = rapidjson::Document::AllocatorType;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parses a JSON string; logs and returns false on a parse error.
    inline bool parse_str(const std::string& json_string, jdoc& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            LOG_WARN("JSON parse error: {} at offset {}",
                     rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Utility to convert any Value to string
    inline std::string val2str(const jval& value) {
        if (value.IsString()) return value.GetString();
        if (value.IsBool()) return value.GetBool() ? "true" : "false";
        if (value.IsNull()) return "null";
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
        return buffer.GetString();
    }

    // Checks for existence and type; returns `default_value` otherwise.
    template<typename T>
    inline T get(const jval& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
            if (val.IsNumber() || val.IsBool()) return val2str(val);
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
            if (val.IsString()) return std::atoi(val.GetString());
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (val.IsInt64()) return val.GetInt64();
            if (val.IsString()) return std::atoll(val.GetString());
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
            if (val.IsString()) {
                std::string s = val.GetString();
                return s == "t" || s == "true" || s == "1" || s == "YES" || s == "TRUE";
            }
            if (val.IsInt()) return val.GetInt() != 0;
        }
        return default_value;
    }

    // Column value that may be SQL NULL.
    inline std::optional<std::string> get_opt(const jval& parent, const std::string& key) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return std::nullopt;
        const jval& val = parent.FindMember(key.c_str())->value;
        if (val.IsNull()) return std::nullopt;
        return val2str(val);
    }

    inline jval str_val(const std::string& s, jdaloc& allocator) {
        return jval(s.c_str(), static_cast<json::SizeType>(s.size()), allocator);
    }

    template<typename T>
    inline void set(jval& parent, const std::string& key, const T& value, jdaloc& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(str_val(key, allocator).Move(), str_val(value, allocator).Move(), allocator);
        } else {
            parent.AddMember(str_val(key, allocator).Move(), value, allocator);
        }
    }

    inline jval str_array(const std::vector<std::string>& items, jdaloc& allocator) {
        jval arr(json::kArrayType);
        for (const auto& i : items) arr.PushBack(str_val(i, allocator).Move(), allocator);
        return arr;
    }

    inline std::string dump(const jval& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

} // namespace jhlp
