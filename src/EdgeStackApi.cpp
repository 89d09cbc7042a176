/**
 * @file EdgeStackApi.cpp
 * @brief Edge-stack primitives over REST
 */

#include "stackport/EdgeStackApi.hpp"
#include "stackport/Errors.hpp"

namespace stackport {

namespace {

constexpr int kComposeDeployment = 0;

Value parse_body(const std::string& body) {
    try {
        return Value::parse(body);
    } catch (const Value::parse_error& e) {
        throw ParseError(std::string("failed to parse edge stack response: ") + e.what());
    }
}

std::string edge_stack_path(int64_t id) {
    return "/api/edge_stacks/" + std::to_string(id);
}

} // anonymous namespace

std::vector<EdgeStack> HttpEdgeStackApi::list_edge_stacks() {
    Value body = parse_body(rest_.get("/api/edge_stacks"));
    if (body.is_null()) {
        return {};
    }
    try {
        return body.get<std::vector<EdgeStack>>();
    } catch (const Value::exception& e) {
        throw ParseError(std::string("failed to parse edge stack response: ") + e.what());
    }
}

std::string HttpEdgeStackApi::get_edge_stack_file(int64_t id) {
    Value body = parse_body(rest_.get(edge_stack_path(id) + "/file"));
    auto content = body.is_object() ? body.find("StackFileContent") : body.end();
    if (!body.is_object() || content == body.end() || !content->is_string()) {
        throw ParseError("edge stack file response has no StackFileContent");
    }
    return content->get<std::string>();
}

int64_t HttpEdgeStackApi::create_edge_stack(const std::string& name, const std::string& file,
                                            const std::vector<int64_t>& group_ids) {
    Value payload = {
        {"Name", name},
        {"StackFileContent", file},
        {"EdgeGroups", group_ids},
        {"DeploymentType", kComposeDeployment}
    };
    Value body = parse_body(rest_.post("/api/edge_stacks/create/string", payload.dump()));

    auto id = body.is_object() ? body.find("Id") : body.end();
    if (!body.is_object() || id == body.end() || !id->is_number_integer()) {
        throw ParseError("edge stack create response has no Id");
    }
    return id->get<int64_t>();
}

void HttpEdgeStackApi::update_edge_stack(int64_t id, const std::string& file,
                                         const std::vector<int64_t>& group_ids) {
    Value payload = {
        {"StackFileContent", file},
        {"EdgeGroups", group_ids},
        {"DeploymentType", kComposeDeployment},
        {"UpdateVersion", true}
    };
    rest_.put(edge_stack_path(id), payload.dump());
}

} // namespace stackport
