/**
 * @file Value.hpp
 * @brief JSON value type shared by the wire codecs and the config tree
 *
 * Uses nlohmann::json as the underlying value model for:
 * - REST request and response bodies
 * - Edge-stack payloads
 * - The layered configuration tree
 */

#ifndef STACKPORT_VALUE_HPP
#define STACKPORT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace stackport {

/**
 * @brief JSON-like value type
 *
 * This is an alias for nlohmann::json. See nlohmann::json documentation
 * for the complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace stackport

#endif // STACKPORT_VALUE_HPP
