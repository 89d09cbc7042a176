/**
 * @file Models.hpp
 * @brief Stack records as seen by callers and as returned by each backend
 *
 * A Stack is the unified view returned to every caller. RegularStack and
 * EdgeStack are the server-specific records decoded from the REST and the
 * edge-stack surfaces; both convert to Stack.
 *
 * JSON field names:
 * - Stack:        id, name, createdAt, environmentGroupIds
 * - RegularStack: Id, Name, Type, EndpointId, CreationDate, Status
 * - EdgeStack:    Id, Name, CreationDate, EdgeGroups
 * - StackEnvVar:  name, value
 */

#ifndef STACKPORT_MODELS_HPP
#define STACKPORT_MODELS_HPP

#include "stackport/Value.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace stackport {

/**
 * @brief Unified stack view
 *
 * environment_group_ids is always present; an empty vector serializes as [].
 */
struct Stack {
    int id = 0;
    std::string name;
    std::string created_at;
    std::vector<int> environment_group_ids;

    bool operator==(const Stack& other) const {
        return id == other.id && name == other.name &&
               created_at == other.created_at &&
               environment_group_ids == other.environment_group_ids;
    }
    bool operator!=(const Stack& other) const { return !(*this == other); }
};

/**
 * @brief Stack record from GET /api/stacks
 */
struct RegularStack {
    int id = 0;
    std::string name;
    int type = 0;
    int endpoint_id = 0;
    int64_t creation_date = 0;
    int status = 0;
};

/**
 * @brief Stack record from the edge-stack surface
 */
struct EdgeStack {
    int64_t id = 0;
    std::string name;
    int64_t creation_date = 0;
    std::vector<int64_t> edge_groups;
};

/**
 * @brief One environment variable of a regular stack
 */
struct StackEnvVar {
    std::string name;
    std::string value;

    bool operator==(const StackEnvVar& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const StackEnvVar& other) const { return !(*this == other); }
};

/**
 * @brief Current state of a regular stack needed for an update
 */
struct RegularStackDetails {
    int endpoint_id = 0;
    std::vector<StackEnvVar> env;
};

/**
 * @brief Format epoch seconds as an RFC3339 UTC timestamp
 *
 * Example: 1700000000 -> "2023-11-14T22:13:20Z"
 * @throws ParseError if the time cannot be represented
 */
std::string format_rfc3339(int64_t epoch_seconds);

/**
 * @brief Narrow a server ID to int
 * @throws ParseError if the value is not an integer or does not fit
 */
int checked_int(int64_t value, const char* what);
int checked_int(const Value& value, const char* what);

Stack to_stack(const RegularStack& regular);
Stack to_stack(const EdgeStack& edge);

void to_json(Value& j, const Stack& stack);
void from_json(const Value& j, Stack& stack);
void to_json(Value& j, const RegularStack& stack);
void from_json(const Value& j, RegularStack& stack);
void to_json(Value& j, const EdgeStack& stack);
void from_json(const Value& j, EdgeStack& stack);
void to_json(Value& j, const StackEnvVar& var);

} // namespace stackport

#endif // STACKPORT_MODELS_HPP
