/**
 * @file RegularStackApi.cpp
 * @brief Regular stack REST calls
 */

#include "stackport/RegularStackApi.hpp"
#include "stackport/EnvCodec.hpp"
#include "stackport/Errors.hpp"

namespace stackport {

namespace {

Value parse_body(const std::string& body) {
    try {
        return Value::parse(body);
    } catch (const Value::parse_error& e) {
        throw ParseError(std::string("failed to parse response json: ") + e.what());
    }
}

std::string stack_path(int id) {
    return "/api/stacks/" + std::to_string(id);
}

} // anonymous namespace

std::vector<RegularStack> RegularStackApi::list() {
    Value body = parse_body(rest_.get("/api/stacks"));
    if (body.is_null()) {
        return {};
    }
    try {
        return body.get<std::vector<RegularStack>>();
    } catch (const Value::exception& e) {
        throw ParseError(std::string("failed to parse response json: ") + e.what());
    }
}

std::string RegularStackApi::file(int id) {
    Value body = parse_body(rest_.get(stack_path(id) + "/file"));
    if (!body.is_object()) {
        throw ParseError("failed to parse response json: expected object, got " + type_name(body));
    }
    auto content = body.find("StackFileContent");
    if (content == body.end() || content->is_null()) {
        return "";
    }
    if (!content->is_string()) {
        throw ParseError("failed to parse response json: StackFileContent is " + type_name(*content));
    }
    return content->get<std::string>();
}

RegularStackDetails RegularStackApi::details(int id) {
    Value body = parse_body(rest_.get(stack_path(id)));
    if (!body.is_object()) {
        throw ParseError("failed to parse response json: expected object, got " + type_name(body));
    }

    RegularStackDetails details;
    auto endpoint = body.find("EndpointId");
    if (endpoint != body.end() && !endpoint->is_null()) {
        details.endpoint_id = checked_int(*endpoint, "EndpointId");
    }

    auto env = body.find("Env");
    if (env != body.end()) {
        details.env = parse_stack_env(*env);
    }
    return details;
}

void RegularStackApi::update(int id, int endpoint_id, const std::string& file,
                             const std::vector<StackEnvVar>& env) {
    Value payload = {
        {"StackFileContent", file},
        {"Prune", false},
        {"PullImage", false},
        {"Env", env_to_json(env)}
    };
    rest_.put(stack_path(id) + "?endpointId=" + std::to_string(endpoint_id), payload.dump());
}

} // namespace stackport
