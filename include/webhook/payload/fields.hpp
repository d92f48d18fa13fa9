#pragma once

#include "webhook/ParseFailure.hpp"

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace gp::webhook::payload {

using json = nlohmann::json;

// Absent keys and explicit nulls are treated the same.
inline const json* field(const json& obj, const char* key) {
    if (obj.is_null()) return nullptr;
    if (!obj.is_object()) throw ParseFailure(std::string("expected an object around '") + key + "'");
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

inline std::optional<std::string> optionalString(const json& obj, const char* key) {
    const auto* v = field(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) throw ParseFailure(std::string("'") + key + "' must be a string");
    return v->get<std::string>();
}

// Renders ids that may arrive as numbers or strings (pull request ids are numeric).
inline std::optional<std::string> optionalScalarString(const json& obj, const char* key) {
    const auto* v = field(obj, key);
    if (!v) return std::nullopt;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number_unsigned()) return std::to_string(v->get<uint64_t>());
    if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
    if (v->is_number_float() || v->is_boolean()) return v->dump();
    throw ParseFailure(std::string("'") + key + "' must be a scalar");
}

inline bool optionalBool(const json& obj, const char* key, const bool def) {
    const auto* v = field(obj, key);
    if (!v) return def;
    if (!v->is_boolean()) throw ParseFailure(std::string("'") + key + "' must be a boolean");
    return v->get<bool>();
}

template <typename T>
std::optional<T> optionalObject(const json& obj, const char* key) {
    const auto* v = field(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_object()) throw ParseFailure(std::string("'") + key + "' must be an object");
    return v->get<T>();
}

}
