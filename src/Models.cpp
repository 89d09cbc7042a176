/**
 * @file Models.cpp
 * @brief Stack conversions and JSON mapping
 */

#include "stackport/Models.hpp"
#include "stackport/Errors.hpp"

#include <ctime>
#include <limits>

namespace stackport {

namespace {

/**
 * @brief Read an optional field; missing or null yields the fallback
 */
template <typename T>
T field(const Value& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

void require_object(const Value& j, const char* what) {
    if (!j.is_object()) {
        throw ParseError(std::string("failed to parse response json: expected ") + what +
                         " object, got " + type_name(j));
    }
}

/**
 * @brief Read an optional integer field that must fit in int
 */
int int_field(const Value& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    return checked_int(*it, key);
}

} // anonymous namespace

int checked_int(int64_t value, const char* what) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ParseError(std::string(what) + " out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

int checked_int(const Value& value, const char* what) {
    if (!value.is_number_integer()) {
        throw ParseError(std::string("failed to parse response json: ") + what + " is " +
                         type_name(value));
    }
    if (value.is_number_unsigned()) {
        const auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ParseError(std::string(what) + " out of range: " + std::to_string(raw));
        }
        return static_cast<int>(raw);
    }
    return checked_int(value.get<int64_t>(), what);
}

std::string format_rfc3339(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
#ifdef _WIN32
    const bool converted = gmtime_s(&tm, &t) == 0;
#else
    const bool converted = gmtime_r(&t, &tm) != nullptr;
#endif
    char buf[64];
    if (!converted || std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        throw ParseError("creation date out of range: " + std::to_string(epoch_seconds));
    }
    return buf;
}

Stack to_stack(const RegularStack& regular) {
    Stack stack;
    stack.id = regular.id;
    stack.name = regular.name;
    stack.created_at = format_rfc3339(regular.creation_date);
    // Regular stacks have no group concept in this view
    stack.environment_group_ids = {};
    return stack;
}

Stack to_stack(const EdgeStack& edge) {
    Stack stack;
    stack.id = checked_int(edge.id, "edge stack id");
    stack.name = edge.name;
    stack.created_at = format_rfc3339(edge.creation_date);
    stack.environment_group_ids.reserve(edge.edge_groups.size());
    for (int64_t group : edge.edge_groups) {
        stack.environment_group_ids.push_back(checked_int(group, "edge group id"));
    }
    return stack;
}

void to_json(Value& j, const Stack& stack) {
    j = Value{
        {"id", stack.id},
        {"name", stack.name},
        {"createdAt", stack.created_at},
        {"environmentGroupIds", Value::array()}
    };
    for (int group : stack.environment_group_ids) {
        j["environmentGroupIds"].push_back(group);
    }
}

void from_json(const Value& j, Stack& stack) {
    require_object(j, "stack");
    stack.id = field<int>(j, "id", 0);
    stack.name = field<std::string>(j, "name", "");
    stack.created_at = field<std::string>(j, "createdAt", "");
    stack.environment_group_ids = field<std::vector<int>>(j, "environmentGroupIds", {});
}

void to_json(Value& j, const RegularStack& stack) {
    j = Value{
        {"Id", stack.id},
        {"Name", stack.name},
        {"Type", stack.type},
        {"EndpointId", stack.endpoint_id},
        {"CreationDate", stack.creation_date},
        {"Status", stack.status}
    };
}

void from_json(const Value& j, RegularStack& stack) {
    require_object(j, "stack");
    stack.id = int_field(j, "Id");
    stack.name = field<std::string>(j, "Name", "");
    stack.type = field<int>(j, "Type", 0);
    stack.endpoint_id = int_field(j, "EndpointId");
    stack.creation_date = field<int64_t>(j, "CreationDate", 0);
    stack.status = field<int>(j, "Status", 0);
}

void to_json(Value& j, const EdgeStack& stack) {
    j = Value{
        {"Id", stack.id},
        {"Name", stack.name},
        {"CreationDate", stack.creation_date},
        {"EdgeGroups", stack.edge_groups}
    };
}

void from_json(const Value& j, EdgeStack& stack) {
    require_object(j, "edge stack");
    stack.id = field<int64_t>(j, "Id", 0);
    stack.name = field<std::string>(j, "Name", "");
    stack.creation_date = field<int64_t>(j, "CreationDate", 0);
    stack.edge_groups = field<std::vector<int64_t>>(j, "EdgeGroups", {});
}

void to_json(Value& j, const StackEnvVar& var) {
    j = Value{{"name", var.name}, {"value", var.value}};
}

} // namespace stackport
