// LoadJson.hpp - JSON loading and typed access helpers for SC
#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

namespace sc::json {

inline nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

// ============ VALIDATION ============

/**
 * Ensure the JSON value is an object.
 * @param context Description for error messages (e.g., file path)
 * @throws std::runtime_error if it is not
 */
inline void require_object(const nlohmann::json& json, const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " must be a JSON object");
    }
}

// ============ TYPED ACCESS ============
// Missing keys yield def, present keys of the wrong type throw.

inline double number_or(const nlohmann::json& m, const char* key, double def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_number()) {
        throw std::runtime_error(context + " field '" + std::string(key) + "' must be a number");
    }
    return it->get<double>();
}

inline int64_t integer_or(const nlohmann::json& m, const char* key, int64_t def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    const std::string field = context + " field '" + std::string(key) + "'";
    if (it->is_number_unsigned()) {
        const uint64_t v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::runtime_error(field + " is out of range");
        }
        return static_cast<int64_t>(v);
    }
    if (it->is_number_integer()) return it->get<int64_t>();
    // accept 16.0 but not 16.5
    if (it->is_number_float()) {
        const double v = it->get<double>();
        if (std::isfinite(v) && v == std::floor(v)) {
            // [-2^63, 2^63) is exactly the range that converts without overflow
            if (v < -9223372036854775808.0 || v >= 9223372036854775808.0) {
                throw std::runtime_error(field + " is out of range");
            }
            return static_cast<int64_t>(v);
        }
    }
    throw std::runtime_error(field + " must be an integer");
}

inline int int_or(const nlohmann::json& m, const char* key, int def, const std::string& context)
{
    const int64_t v = integer_or(m, key, def, context);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw std::runtime_error(context + " field '" + std::string(key) + "' is out of range");
    }
    return static_cast<int>(v);
}

inline bool bool_or(const nlohmann::json& m, const char* key, bool def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_boolean()) {
        throw std::runtime_error(context + " field '" + std::string(key) + "' must be a boolean");
    }
    return it->get<bool>();
}

} // namespace sc::json
