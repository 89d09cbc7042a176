#ifndef STACKPORT_UTIL_HPP
#define STACKPORT_UTIL_HPP

#include "stackport/Value.hpp"
#include <string>
#include <map>
#include <vector>
#include <utility>

namespace stackport {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(Value& a, const Value& b);

// Set a nested value by dot-notation, creating intermediate objects
void set_by_dot(Value& obj, const std::string& path, const Value& value);

// Get a nested value by dot-notation. Throws std::out_of_range if missing.
const Value& get_by_dot(const Value& obj, const std::string& path);

// Check existence of a nested key by dot-notation.
bool exists_by_dot(const Value& obj, const std::string& path);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);

// "1, 2,3" -> {1, 2, 3}. Throws std::invalid_argument on a non-integer item.
std::vector<int> parse_int_list(const std::string& s);

// Parse an --overrides string: "k1:json, k2:json, ..."
std::map<std::string, Value> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Env name (prefix removed) to dot-path: lower-case, "_" -> ".", "__" -> "_"
std::string transform_env_name(const std::string& name);

// Try parsing string as JSON, otherwise return it as a string.
Value parse_json_or_string(const std::string& raw);

} // namespace stackport

#endif // STACKPORT_UTIL_HPP
