/**
 * @file EnvCodec.cpp
 * @brief Two-variant env decoding and override validation
 */

#include "stackport/EnvCodec.hpp"
#include "stackport/Errors.hpp"

namespace stackport {

namespace {

/**
 * @brief Read a string member; missing or null -> "", other types -> nullopt
 */
std::optional<std::string> string_member(const Value& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::optional<std::vector<StackEnvVar>> decode_env_shape(const Value& raw, EnvShape shape) {
    if (!raw.is_array()) {
        return std::nullopt;
    }

    const bool lower = shape == EnvShape::LowerCase;
    const char* name_key = lower ? "name" : "Name";
    const char* value_key = lower ? "value" : "Value";
    // Keys of the other shape mean this entry was not written in this shape
    const char* foreign_name_key = lower ? "Name" : "name";
    const char* foreign_value_key = lower ? "Value" : "value";

    std::vector<StackEnvVar> env;
    env.reserve(raw.size());
    for (const auto& entry : raw) {
        if (!entry.is_object()) {
            return std::nullopt;
        }
        if (entry.contains(foreign_name_key) || entry.contains(foreign_value_key)) {
            return std::nullopt;
        }
        auto name = string_member(entry, name_key);
        auto value = string_member(entry, value_key);
        if (!name || !value) {
            return std::nullopt;
        }
        env.push_back(StackEnvVar{std::move(*name), std::move(*value)});
    }
    return env;
}

bool has_env_values(const std::vector<StackEnvVar>& env) {
    for (const auto& entry : env) {
        if (!entry.name.empty() || !entry.value.empty()) {
            return true;
        }
    }
    return false;
}

std::vector<StackEnvVar> parse_stack_env(const Value& raw) {
    if (raw.is_null()) {
        return {};
    }

    auto primary = decode_env_shape(raw, EnvShape::LowerCase);
    if (primary && (primary->empty() || has_env_values(*primary))) {
        return *primary;
    }

    auto alternate = decode_env_shape(raw, EnvShape::Capitalized);
    if (!alternate) {
        if (!raw.is_array()) {
            throw ParseError("failed to parse stack env: expected an array, got " + type_name(raw));
        }
        throw ParseError("failed to parse stack env: entries must be objects with string "
                         "name/value or Name/Value fields, not both shapes");
    }
    // Empty entries are only trusted when the primary shape read them too
    if (!primary && !has_env_values(*alternate)) {
        throw ParseError("failed to parse stack env: no entry carries a name or value");
    }
    return *alternate;
}

std::vector<StackEnvVar> parse_stack_env(const std::string& raw) {
    if (raw.empty()) {
        return {};
    }

    Value parsed;
    try {
        parsed = Value::parse(raw);
    } catch (const Value::parse_error& e) {
        throw ParseError(std::string("failed to parse stack env: ") + e.what());
    }
    return parse_stack_env(parsed);
}

std::vector<StackEnvVar> parse_env_overrides(const Value& raw) {
    std::vector<StackEnvVar> result;
    if (raw.is_null()) {
        return result;
    }
    if (!raw.is_array()) {
        throw ParseError("invalid env overrides: expected array, got " + type_name(raw));
    }

    result.reserve(raw.size());
    for (const auto& entry : raw) {
        if (!entry.is_object()) {
            throw ParseError("invalid env override: " + entry.dump());
        }
        auto name = entry.find("name");
        if (name == entry.end() || !name->is_string() || name->get<std::string>().empty()) {
            throw ParseError("invalid env name: " +
                             (name == entry.end() ? std::string("<missing>") : name->dump()));
        }
        auto value = entry.find("value");
        if (value == entry.end() || !value->is_string()) {
            throw ParseError("invalid env value: " +
                             (value == entry.end() ? std::string("<missing>") : value->dump()));
        }
        result.push_back(StackEnvVar{name->get<std::string>(), value->get<std::string>()});
    }
    return result;
}

StackEnvVar parse_env_assignment(const std::string& assignment) {
    auto eq_pos = assignment.find('=');
    if (eq_pos == std::string::npos) {
        throw ParseError("invalid env assignment (expected NAME=VALUE): " + assignment);
    }
    if (eq_pos == 0) {
        throw ParseError("invalid env name in assignment: " + assignment);
    }
    return StackEnvVar{assignment.substr(0, eq_pos), assignment.substr(eq_pos + 1)};
}

Value env_to_json(const std::vector<StackEnvVar>& env) {
    Value out = Value::array();
    for (const auto& entry : env) {
        out.push_back(Value(entry));
    }
    return out;
}

} // namespace stackport
