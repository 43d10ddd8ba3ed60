#pragma once

#include <string>
#include <optional>
#include <map>
#include <stdexcept>
#include <climits>
#include <cstdint>
#include <core/types.hpp>
#include <fmt/format.h>
#include "json.hpp"

// Typed access to tools/call arguments. Wrong types are reported, never thrown.

inline Result<std::string> require_string(const json& args, const char* key) {
    if (!args.contains(key) || args[key].is_null()) {
        return Result<std::string>::Err(fmt::format("Missing required argument '{}'", key));
    }
    if (!args[key].is_string()) {
        return Result<std::string>::Err(fmt::format("Argument '{}' must be a string", key));
    }
    return Result<std::string>::Ok(args[key].get<std::string>());
}

inline Result<std::optional<std::string>> optional_string(const json& args, const char* key) {
    using R = Result<std::optional<std::string>>;
    if (!args.contains(key) || args[key].is_null()) return R::Ok(std::nullopt);
    if (!args[key].is_string()) {
        return R::Err(fmt::format("Argument '{}' must be a string", key));
    }
    return R::Ok(args[key].get<std::string>());
}

inline Result<std::optional<bool>> optional_bool(const json& args, const char* key) {
    using R = Result<std::optional<bool>>;
    if (!args.contains(key) || args[key].is_null()) return R::Ok(std::nullopt);
    if (!args[key].is_boolean()) {
        return R::Err(fmt::format("Argument '{}' must be a boolean", key));
    }
    return R::Ok(args[key].get<bool>());
}

// Accepts a JSON number or a numeric string ("200").
inline Result<std::optional<int>> optional_int(const json& args, const char* key) {
    using R = Result<std::optional<int>>;
    if (!args.contains(key) || args[key].is_null()) return R::Ok(std::nullopt);
    const json& v = args[key];
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n <= static_cast<uint64_t>(INT_MAX)) return R::Ok(static_cast<int>(n));
    } else if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n >= INT_MIN && n <= INT_MAX) return R::Ok(static_cast<int>(n));
    } else if (v.is_number()) {
        double d = v.get<double>();
        if (d >= INT_MIN && d <= INT_MAX) return R::Ok(static_cast<int>(d));
    }
    if (v.is_string()) {
        try {
            size_t used = 0;
            int n = std::stoi(v.get<std::string>(), &used);
            if (used == v.get<std::string>().size()) return R::Ok(n);
        } catch (const std::exception&) {
            return R::Err(fmt::format("Argument '{}' must be a number", key));
        }
    }
    return R::Err(fmt::format("Argument '{}' must be a number", key));
}

inline Result<std::map<std::string, std::string>> optional_string_map(const json& args,
                                                                      const char* key) {
    using R = Result<std::map<std::string, std::string>>;
    std::map<std::string, std::string> out;
    if (!args.contains(key) || args[key].is_null()) return R::Ok(out);
    if (!args[key].is_object()) {
        return R::Err(fmt::format("Argument '{}' must be an object of strings", key));
    }
    for (auto it = args[key].begin(); it != args[key].end(); ++it) {
        if (!it.value().is_string()) {
            return R::Err(fmt::format("Argument '{}.{}' must be a string", key, it.key()));
        }
        out[it.key()] = it.value().get<std::string>();
    }
    return R::Ok(out);
}

// {"type": "object", "properties": ..., "required": [...]}
inline json object_schema(json properties, std::initializer_list<const char*> required = {}) {
    json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (required.size() > 0) {
        json req = json::array();
        for (const char* r : required) req.push_back(r);
        schema["required"] = req;
    }
    return schema;
}

inline json prop(const char* type, const char* description) {
    return {{"type", type}, {"description", description}};
}
