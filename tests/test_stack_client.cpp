/**
 * @file test_stack_client.cpp
 * @brief Tests for the dual-path StackClient using Google Test
 *
 * The regular path runs against FakeTransport; the edge path against
 * FakeEdgeApi.
 */

#include <gtest/gtest.h>
#include "fakes.hpp"
#include "stackport/StackClient.hpp"

#include <memory>

using namespace stackport;
using stackport_test::FakeEdgeApi;
using stackport_test::FakeTransport;

namespace {

struct Harness {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeEdgeApi> edge = std::make_shared<FakeEdgeApi>();

    StackClient client(StackClientOptions options = {}) {
        return StackClient(std::make_unique<RegularStackApi>(transport), edge, options);
    }

    StackClient edge_only(StackClientOptions options = {}) {
        return StackClient(nullptr, edge, options);
    }
};

const char* kDetailsWithEnv = R"({
    "Id": 7,
    "EndpointId": 3,
    "Env": [
        {"name": "A", "value": "1"},
        {"name": "B", "value": "2"}
    ]
})";

} // anonymous namespace

// ============================================================================
// Decision tables
// ============================================================================

TEST(DecisionTable, ListAndFileTryEdgeOnAnythingButSuccess) {
    static_assert(decide(rules::kList, ProbeOutcome::Success) == Action::Return, "list success");
    static_assert(decide(rules::kList, ProbeOutcome::Empty) == Action::TryEdge, "list empty");
    static_assert(decide(rules::kList, ProbeOutcome::FallbackWorthy) == Action::TryEdge, "list fallback");
    static_assert(decide(rules::kList, ProbeOutcome::Terminal) == Action::TryEdge, "list terminal");

    EXPECT_EQ(decide(rules::kGetFile, ProbeOutcome::Success), Action::Return);
    EXPECT_EQ(decide(rules::kGetFile, ProbeOutcome::Empty), Action::TryEdge);
    EXPECT_EQ(decide(rules::kGetFile, ProbeOutcome::Terminal), Action::TryEdge);
}

TEST(DecisionTable, EnvNamesNeverTryEdge) {
    for (auto outcome : {ProbeOutcome::Success, ProbeOutcome::Empty,
                         ProbeOutcome::FallbackWorthy, ProbeOutcome::Terminal}) {
        EXPECT_NE(decide(rules::kGetEnvNames, outcome), Action::TryEdge);
    }
    EXPECT_EQ(decide(rules::kGetEnvNames, ProbeOutcome::FallbackWorthy), Action::Reject);
    EXPECT_EQ(decide(rules::kGetEnvNames, ProbeOutcome::Terminal), Action::Fail);
}

TEST(DecisionTable, UpdateOnlyFallsBackOnFallbackWorthy) {
    EXPECT_EQ(decide(rules::kUpdate, ProbeOutcome::Success), Action::Return);
    EXPECT_EQ(decide(rules::kUpdate, ProbeOutcome::FallbackWorthy), Action::TryEdge);
    EXPECT_EQ(decide(rules::kUpdate, ProbeOutcome::Terminal), Action::Fail);
}

TEST(StackClientCtor, RequiresEdgeApi) {
    EXPECT_THROW(StackClient(nullptr, nullptr), std::invalid_argument);
}

// ============================================================================
// get_stacks
// ============================================================================

TEST(GetStacks, ReturnsRegularStacksWithoutTouchingEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 200,
                    R"([{"Id": 1, "Name": "web", "Type": 2, "EndpointId": 3, "CreationDate": 1700000000}])");

    auto stacks = h.client().get_stacks();

    ASSERT_EQ(stacks.size(), 1u);
    EXPECT_EQ(stacks[0].id, 1);
    EXPECT_EQ(stacks[0].name, "web");
    EXPECT_EQ(stacks[0].created_at, "2023-11-14T22:13:20Z");
    EXPECT_TRUE(stacks[0].environment_group_ids.empty());
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(GetStacks, EmptyRegularListFallsBackToEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 200, "[]");
    h.edge->stacks = {EdgeStack{5, "edge-web", 1700000000, {2, 4}}};

    auto stacks = h.client().get_stacks();

    ASSERT_EQ(stacks.size(), 1u);
    EXPECT_EQ(stacks[0].id, 5);
    EXPECT_EQ(stacks[0].name, "edge-web");
    EXPECT_EQ(stacks[0].environment_group_ids, (std::vector<int>{2, 4}));
    EXPECT_EQ(h.edge->list_calls, 1);
}

TEST(GetStacks, NullRegularListFallsBackToEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 200, "null");

    EXPECT_TRUE(h.client().get_stacks().empty());
    EXPECT_EQ(h.edge->list_calls, 1);
}

TEST(GetStacks, RegularFailureFallsBackToEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 500, "boom");
    h.edge->stacks = {EdgeStack{9, "only-edge", 0, {}}};

    auto stacks = h.client().get_stacks();
    ASSERT_EQ(stacks.size(), 1u);
    EXPECT_EQ(stacks[0].id, 9);
    EXPECT_EQ(stacks[0].created_at, "1970-01-01T00:00:00Z");
}

TEST(GetStacks, NonObjectRegularItemsFallBackToEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 200, R"([1, "x", null])");
    h.edge->stacks = {EdgeStack{9, "only-edge", 0, {}}};

    auto stacks = h.client().get_stacks();
    ASSERT_EQ(stacks.size(), 1u);
    EXPECT_EQ(stacks[0].id, 9);
    EXPECT_EQ(stacks[0].name, "only-edge");
    EXPECT_EQ(h.edge->list_calls, 1);
}

TEST(GetStacks, EdgeIdBeyondIntIsParseError) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 200, "[]");
    h.edge->stacks = {EdgeStack{int64_t(1) << 32, "huge", 0, {}}};

    EXPECT_THROW(h.client().get_stacks(), ParseError);
}

TEST(GetStacks, BothPathsFailingNamesBothCauses) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 500, "regular boom");
    h.edge->list_error = "edge boom";

    try {
        h.client().get_stacks();
        FAIL() << "expected CompositeError";
    } catch (const CompositeError& e) {
        EXPECT_NE(e.regular_cause().find("regular boom"), std::string::npos);
        EXPECT_EQ(e.edge_cause(), "edge boom");
        std::string msg = e.what();
        EXPECT_NE(msg.find("failed to list regular stacks"), std::string::npos);
        EXPECT_NE(msg.find("edge boom"), std::string::npos);
    }
}

TEST(GetStacks, EdgeFailureAfterEmptyRegularIsEdgeError) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks", 200, "[]");
    h.edge->list_error = "edge boom";

    try {
        h.client().get_stacks();
        FAIL() << "expected EdgeError";
    } catch (const CompositeError&) {
        FAIL() << "no regular error to report";
    } catch (const EdgeError& e) {
        EXPECT_EQ(std::string(e.what()), "failed to list edge stacks: edge boom");
    }
}

TEST(GetStacks, WithoutRegularApiUsesEdge) {
    Harness h;
    h.edge->stacks = {EdgeStack{3, "e", 0, {1}}};

    auto stacks = h.edge_only().get_stacks();
    ASSERT_EQ(stacks.size(), 1u);
    EXPECT_EQ(stacks[0].id, 3);
    EXPECT_TRUE(h.transport->requests.empty());
}

// ============================================================================
// get_stack_file
// ============================================================================

TEST(GetStackFile, ReturnsRegularFile) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/4/file", 200,
                    R"({"StackFileContent": "services: {}"})");

    EXPECT_EQ(h.client().get_stack_file(4), "services: {}");
    EXPECT_EQ(h.edge->file_calls, 0);
}

TEST(GetStackFile, EmptyRegularFileFallsBackToEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/4/file", 200, R"({"StackFileContent": ""})");
    h.edge->file = "edge: true";

    EXPECT_EQ(h.client().get_stack_file(4), "edge: true");
    EXPECT_EQ(h.edge->last_id, 4);
}

TEST(GetStackFile, NotFoundFallsBackToEdge) {
    Harness h;
    h.edge->file = "edge: true";

    EXPECT_EQ(h.client().get_stack_file(12), "edge: true");
    EXPECT_EQ(h.transport->count(HttpMethod::GET, "/api/stacks/12/file"), 1u);
}

TEST(GetStackFile, BothFailingIsComposite) {
    Harness h;
    h.transport->fail(HttpMethod::GET, "/api/stacks/4/file", "connection refused");
    h.edge->file_error = "no such edge stack";

    try {
        h.client().get_stack_file(4);
        FAIL() << "expected CompositeError";
    } catch (const CompositeError& e) {
        EXPECT_NE(e.regular_cause().find("connection refused"), std::string::npos);
        EXPECT_EQ(e.edge_cause(), "no such edge stack");
    }
}

// ============================================================================
// get_stack_env_names
// ============================================================================

TEST(GetStackEnvNames, ReturnsDistinctNamesInOrder) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({
        "EndpointId": 3,
        "Env": [
            {"Name": "B", "Value": "1"},
            {"Name": "", "Value": "x"},
            {"Name": "A", "Value": "2"},
            {"Name": "B", "Value": "3"}
        ]
    })");

    auto names = h.client().get_stack_env_names(7);
    EXPECT_EQ(names, (std::vector<std::string>{"B", "A"}));
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(GetStackEnvNames, StackWithoutEnvIsEmptyList) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({"EndpointId": 3, "Env": null})");

    EXPECT_TRUE(h.client().get_stack_env_names(7).empty());
}

TEST(GetStackEnvNames, EdgeStackIsUnsupported) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 404, "stack not found");

    EXPECT_THROW(h.client().get_stack_env_names(7), UnsupportedError);
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(GetStackEnvNames, TerminalFailureKeepsKindWithContext) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 403, "forbidden");

    try {
        h.client().get_stack_env_names(7);
        FAIL() << "expected StatusError";
    } catch (const StatusError& e) {
        EXPECT_EQ(e.status_code(), 403);
        std::string msg = e.what();
        EXPECT_EQ(msg.rfind("failed to get stack details: ", 0), 0u);
        EXPECT_NE(msg.find("forbidden"), std::string::npos);
    }
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(GetStackEnvNames, UndecodableEnvIsParseError) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({"EndpointId": 3, "Env": {"A": "1"}})");

    EXPECT_THROW(h.client().get_stack_env_names(7), ParseError);
}

TEST(GetStackEnvNames, WithoutRegularApiIsConfigError) {
    Harness h;
    EXPECT_THROW(h.edge_only().get_stack_env_names(7), ConfigError);
    EXPECT_EQ(h.edge->total_calls(), 0);
}

// ============================================================================
// create_stack
// ============================================================================

TEST(CreateStack, DelegatesToEdge) {
    Harness h;
    h.edge->created_id = 42;

    int id = h.client().create_stack("web", "services: {}", {1, 2});

    EXPECT_EQ(id, 42);
    EXPECT_EQ(h.edge->last_name, "web");
    EXPECT_EQ(h.edge->last_file, "services: {}");
    EXPECT_EQ(h.edge->last_groups, (std::vector<int64_t>{1, 2}));
    EXPECT_TRUE(h.transport->requests.empty());
}

TEST(CreateStack, EdgeFailureIsEdgeError) {
    Harness h;
    h.edge->create_error = "name taken";

    try {
        h.client().create_stack("web", "x", {1});
        FAIL() << "expected EdgeError";
    } catch (const EdgeError& e) {
        EXPECT_EQ(std::string(e.what()), "failed to create edge stack: name taken");
    }
}

TEST(CreateStack, CreatedIdBeyondIntIsEdgeError) {
    Harness h;
    h.edge->created_id = int64_t(1) << 32;

    try {
        h.client().create_stack("web", "x", {1});
        FAIL() << "expected EdgeError";
    } catch (const EdgeError& e) {
        EXPECT_NE(std::string(e.what()).find("edge stack id out of range"), std::string::npos);
    }
}

TEST(CreateStack, ReadOnlyRejects) {
    Harness h;
    StackClientOptions options;
    options.read_only = true;

    EXPECT_THROW(h.client(options).create_stack("web", "x", {1}), UnsupportedError);
    EXPECT_EQ(h.edge->create_calls, 0);
}

// ============================================================================
// update_stack: regular path
// ============================================================================

TEST(UpdateStack, RegularStackMergesOverridesIntoStoredEnv) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, kDetailsWithEnv);
    h.transport->on(HttpMethod::PUT, "/api/stacks/7?endpointId=3", 200, "{}");

    h.client().update_stack(7, "services: {}", {1}, {{"B", "9"}, {"C", "3"}});

    ASSERT_EQ(h.transport->count(HttpMethod::PUT, "/api/stacks/7?endpointId=3"), 1u);
    const auto& put = h.transport->requests.back();
    ASSERT_TRUE(put.body.has_value());
    Value body = Value::parse(*put.body);
    EXPECT_EQ(body["StackFileContent"], "services: {}");
    EXPECT_EQ(body["Prune"], false);
    EXPECT_EQ(body["PullImage"], false);
    EXPECT_EQ(body["Env"], Value::parse(R"([
        {"name": "A", "value": "1"},
        {"name": "B", "value": "9"},
        {"name": "C", "value": "3"}
    ])"));
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, RegularStackWithoutOverridesKeepsEnv) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, kDetailsWithEnv);
    h.transport->on(HttpMethod::PUT, "/api/stacks/7?endpointId=3", 204, "");

    h.client().update_stack(7, "new", {1});

    Value body = Value::parse(*h.transport->requests.back().body);
    EXPECT_EQ(body["Env"], Value::parse(R"([{"name":"A","value":"1"},{"name":"B","value":"2"}])"));
}

TEST(UpdateStack, EmptyStoredEnvStillWrites) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({"EndpointId": 1})");
    h.transport->on(HttpMethod::PUT, "/api/stacks/7?endpointId=1", 200, "{}");

    h.client().update_stack(7, "new", {}, {{"X", "y"}});

    Value body = Value::parse(*h.transport->requests.back().body);
    EXPECT_EQ(body["Env"], Value::parse(R"([{"name":"X","value":"y"}])"));
}

TEST(UpdateStack, TerminalDetailsFailureDoesNotTouchEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 403, "forbidden");

    try {
        h.client().update_stack(7, "new", {1});
        FAIL() << "expected StatusError";
    } catch (const StatusError& e) {
        EXPECT_EQ(e.status_code(), 403);
        EXPECT_EQ(std::string(e.what()).rfind("failed to get regular stack details: ", 0), 0u);
    }
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, TerminalWriteFailureDoesNotTouchEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, kDetailsWithEnv);
    h.transport->on(HttpMethod::PUT, "/api/stacks/7?endpointId=3", 500, "disk full");

    try {
        h.client().update_stack(7, "new", {1});
        FAIL() << "expected StatusError";
    } catch (const StatusError& e) {
        EXPECT_EQ(e.status_code(), 500);
        EXPECT_EQ(std::string(e.what()).rfind("failed to update regular stack: ", 0), 0u);
    }
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, UndecodableEnvIsParseErrorWithoutWrite) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({"EndpointId": 3, "Env": "A=1"})");

    EXPECT_THROW(h.client().update_stack(7, "new", {1}, {{"A", "2"}}), ParseError);
    EXPECT_EQ(h.transport->count(HttpMethod::PUT, "/api/stacks/7?endpointId=3"), 0u);
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, MistypedEnvEntryKeepsStoredEnvUntouched) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({
        "EndpointId": 3,
        "Env": [{"name": "A", "value": "1"}, {"name": "B", "value": 2}]
    })");
    h.transport->on(HttpMethod::PUT, "/api/stacks/7?endpointId=3", 200, "{}");

    EXPECT_THROW(h.client().update_stack(7, "new", {1}, {{"C", "3"}}), ParseError);
    EXPECT_EQ(h.transport->count(HttpMethod::PUT, "/api/stacks/7?endpointId=3"), 0u);
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, MixedEnvShapesKeepStoredEnvUntouched) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/7", 200, R"({
        "EndpointId": 3,
        "Env": [{"name": "A", "value": "1"}, {"Name": "B", "Value": "2"}]
    })");
    h.transport->on(HttpMethod::PUT, "/api/stacks/7?endpointId=3", 200, "{}");

    EXPECT_THROW(h.client().update_stack(7, "new", {1}), ParseError);
    EXPECT_EQ(h.transport->count(HttpMethod::PUT, "/api/stacks/7?endpointId=3"), 0u);
}

// ============================================================================
// update_stack: edge path
// ============================================================================

TEST(UpdateStack, NotFoundWithoutOverridesUpdatesEdge) {
    Harness h;

    h.client().update_stack(8, "edge-file", {4, 5});

    EXPECT_EQ(h.edge->update_calls, 1);
    EXPECT_EQ(h.edge->last_id, 8);
    EXPECT_EQ(h.edge->last_file, "edge-file");
    EXPECT_EQ(h.edge->last_groups, (std::vector<int64_t>{4, 5}));
}

TEST(UpdateStack, EdgeMarkerOnWriteUpdatesEdge) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/8", 200, R"({"EndpointId": 0})");
    h.transport->on(HttpMethod::PUT, "/api/stacks/8?endpointId=0", 400,
                    R"({"message":"Use the EdgeStackUpdate endpoint for Edge Stacks"})");

    h.client().update_stack(8, "edge-file", {4});

    EXPECT_EQ(h.edge->update_calls, 1);
    EXPECT_EQ(h.edge->last_id, 8);
}

TEST(UpdateStack, OverridesOnEdgeStackAreRejectedBeforeAnyEdgeCall) {
    Harness h;

    try {
        h.client().update_stack(8, "edge-file", {4}, {{"A", "1"}});
        FAIL() << "expected UnsupportedError";
    } catch (const UnsupportedError& e) {
        EXPECT_EQ(std::string(e.what()), "stack env overrides are not supported for edge stacks");
    }
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, OverridesRejectedWhenWriteNamesEdgeStack) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/8", 200, R"({"EndpointId": 0})");
    h.transport->on(HttpMethod::PUT, "/api/stacks/8?endpointId=0", 400, "this is an edge stack");

    EXPECT_THROW(h.client().update_stack(8, "f", {4}, {{"A", "1"}}), UnsupportedError);
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, EdgeFailureAfterFallbackIsComposite) {
    Harness h;
    h.edge->update_error = "edge rejected";

    try {
        h.client().update_stack(8, "f", {4});
        FAIL() << "expected CompositeError";
    } catch (const CompositeError& e) {
        EXPECT_NE(e.regular_cause().find("404"), std::string::npos);
        EXPECT_EQ(e.edge_cause(), "edge rejected");
    }
}

TEST(UpdateStack, WithoutRegularApiUpdatesEdgeDirectly) {
    Harness h;

    h.edge_only().update_stack(8, "f", {1});

    EXPECT_EQ(h.edge->update_calls, 1);
    EXPECT_TRUE(h.transport->requests.empty());
}

TEST(UpdateStack, WithoutRegularApiOverridesAreConfigError) {
    Harness h;

    EXPECT_THROW(h.edge_only().update_stack(8, "f", {1}, {{"A", "1"}}), ConfigError);
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, WithoutRegularApiEdgeFailureIsEdgeError) {
    Harness h;
    h.edge->update_error = "nope";

    try {
        h.edge_only().update_stack(8, "f", {1});
        FAIL() << "expected EdgeError";
    } catch (const EdgeError& e) {
        EXPECT_EQ(std::string(e.what()), "failed to update edge stack: nope");
    }
}

TEST(UpdateStack, ReadOnlyRejectsBeforeAnyCall) {
    Harness h;
    StackClientOptions options;
    options.read_only = true;

    EXPECT_THROW(h.client(options).update_stack(7, "f", {1}), UnsupportedError);
    EXPECT_TRUE(h.transport->requests.empty());
    EXPECT_EQ(h.edge->total_calls(), 0);
}

TEST(UpdateStack, CustomMarkersDriveFallback) {
    Harness h;
    h.transport->on(HttpMethod::GET, "/api/stacks/8", 200, R"({"EndpointId": 0})");
    h.transport->on(HttpMethod::PUT, "/api/stacks/8?endpointId=0", 400, "managed remotely");

    StackClientOptions options;
    options.fallback.markers = {"managed remotely"};

    h.client(options).update_stack(8, "f", {4});
    EXPECT_EQ(h.edge->update_calls, 1);
}
