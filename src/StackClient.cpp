/**
 * @file StackClient.cpp
 * @brief Dual-path stack operations
 */

#include "stackport/StackClient.hpp"
#include "stackport/EnvMerge.hpp"
#include "stackport/Errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace stackport {

namespace {

/**
 * @brief Result of one regular-path attempt
 */
template <typename T>
struct Probe {
    ProbeOutcome outcome = ProbeOutcome::Terminal;
    T value{};
    std::exception_ptr error;
    std::string message;
};

template <typename T, typename Call, typename IsEmpty>
Probe<T> probe(Call&& call, IsEmpty&& is_empty, const FallbackPolicy& policy) {
    Probe<T> result;
    try {
        result.value = call();
        result.outcome = is_empty(result.value) ? ProbeOutcome::Empty : ProbeOutcome::Success;
    } catch (const Error& e) {
        result.error = std::current_exception();
        result.message = e.what();
        result.outcome = should_fallback(e, policy) ? ProbeOutcome::FallbackWorthy
                                                    : ProbeOutcome::Terminal;
    }
    return result;
}

[[noreturn]] void fail_with_context(const std::exception_ptr& error, const std::string& context) {
    if (!error) {
        throw std::logic_error(context + ": regular path failed without an error");
    }
    try {
        std::rethrow_exception(error);
    } catch (const Error& e) {
        rethrow_with_context(e, context);
    }
}

// Edge failure after a regular failure names both; otherwise only the edge cause
template <typename T>
[[noreturn]] void fail_edge(const Probe<T>& regular, const std::string& regular_context,
                            const std::string& edge_context, const std::exception& edge_error) {
    if (regular.error) {
        throw CompositeError(regular_context, regular.message, edge_error.what());
    }
    throw EdgeError(edge_context + ": " + edge_error.what());
}

std::vector<int64_t> to_int64(const std::vector<int>& ids) {
    return std::vector<int64_t>(ids.begin(), ids.end());
}

const char* const kEnvOverridesUnsupported = "stack env overrides are not supported for edge stacks";

} // anonymous namespace

StackClient::StackClient(std::unique_ptr<RegularStackApi> regular,
                         std::shared_ptr<EdgeStackApi> edge,
                         StackClientOptions options)
    : regular_(std::move(regular))
    , edge_(std::move(edge))
    , options_(std::move(options)) {
    if (!edge_) {
        throw std::invalid_argument("StackClient requires an edge stack api");
    }
}

RegularStackApi& StackClient::require_regular() {
    if (!regular_) {
        throw ConfigError("regular stack api requires a server url and token");
    }
    return *regular_;
}

void StackClient::ensure_writable(const char* operation) const {
    if (options_.read_only) {
        throw UnsupportedError(std::string(operation) + " is not available in read-only mode");
    }
}

// ============================================================================
// List
// ============================================================================

std::vector<Stack> StackClient::get_stacks() {
    auto regular = probe<std::vector<RegularStack>>(
        [&] { return require_regular().list(); },
        [](const std::vector<RegularStack>& v) { return v.empty(); },
        options_.fallback);

    switch (decide(rules::kList, regular.outcome)) {
        case Action::Return: {
            std::vector<Stack> stacks;
            stacks.reserve(regular.value.size());
            for (const auto& stack : regular.value) {
                stacks.push_back(to_stack(stack));
            }
            return stacks;
        }
        case Action::TryEdge:
            break;
        case Action::Reject:
        case Action::Fail:
            fail_with_context(regular.error, "failed to list regular stacks");
    }

    if (regular.error) {
        spdlog::debug("regular stack list failed, trying edge stacks: {}", regular.message);
    }

    std::vector<EdgeStack> edge;
    try {
        edge = edge_->list_edge_stacks();
    } catch (const std::exception& e) {
        fail_edge(regular, "failed to list regular stacks", "failed to list edge stacks", e);
    }

    std::vector<Stack> stacks;
    stacks.reserve(edge.size());
    for (const auto& stack : edge) {
        stacks.push_back(to_stack(stack));
    }
    return stacks;
}

// ============================================================================
// Get file
// ============================================================================

std::string StackClient::get_stack_file(int id) {
    auto regular = probe<std::string>(
        [&] { return require_regular().file(id); },
        [](const std::string& file) { return file.empty(); },
        options_.fallback);

    switch (decide(rules::kGetFile, regular.outcome)) {
        case Action::Return:
            return regular.value;
        case Action::TryEdge:
            break;
        case Action::Reject:
        case Action::Fail:
            fail_with_context(regular.error, "failed to get regular stack file");
    }

    if (regular.error) {
        spdlog::debug("regular stack file {} unavailable, trying edge stack: {}", id, regular.message);
    }

    try {
        return edge_->get_edge_stack_file(id);
    } catch (const std::exception& e) {
        fail_edge(regular, "failed to get regular stack file", "failed to get edge stack file", e);
    }
}

// ============================================================================
// Env names
// ============================================================================

std::vector<std::string> StackClient::get_stack_env_names(int id) {
    if (!regular_) {
        throw ConfigError("stack env names require a server url and token");
    }

    auto details = probe<RegularStackDetails>(
        [&] { return regular_->details(id); },
        [](const RegularStackDetails&) { return false; },
        options_.fallback);

    switch (decide(rules::kGetEnvNames, details.outcome)) {
        case Action::Return:
            break;
        case Action::Reject:
            throw UnsupportedError("stack env names are not available for edge stacks");
        case Action::TryEdge:
        case Action::Fail:
            fail_with_context(details.error, "failed to get stack details");
    }

    return unique_env_names(details.value.env);
}

// ============================================================================
// Create
// ============================================================================

int StackClient::create_stack(const std::string& name, const std::string& file,
                              const std::vector<int>& environment_group_ids) {
    ensure_writable("stack creation");

    try {
        return checked_int(edge_->create_edge_stack(name, file, to_int64(environment_group_ids)),
                           "edge stack id");
    } catch (const std::exception& e) {
        throw EdgeError(std::string("failed to create edge stack: ") + e.what());
    }
}

// ============================================================================
// Update
// ============================================================================

void StackClient::update_stack(int id, const std::string& file,
                               const std::vector<int>& environment_group_ids,
                               const std::vector<StackEnvVar>& env_overrides) {
    ensure_writable("stack update");

    const auto group_ids = to_int64(environment_group_ids);

    if (!regular_) {
        if (!env_overrides.empty()) {
            throw ConfigError("stack env overrides require a server url and token");
        }
        try {
            edge_->update_edge_stack(id, file, group_ids);
        } catch (const std::exception& e) {
            throw EdgeError(std::string("failed to update edge stack: ") + e.what());
        }
        return;
    }

    // Overrides have no edge equivalent, so they turn TryEdge into Reject
    auto resolve = [&](ProbeOutcome outcome) {
        Action action = decide(rules::kUpdate, outcome);
        if (action == Action::TryEdge && !env_overrides.empty()) {
            return Action::Reject;
        }
        return action;
    };

    auto edge_update = [&](const auto& failed, const std::string& context) {
        spdlog::info("stack {} is not a regular stack, updating it as an edge stack: {}",
                     id, failed.message);
        try {
            edge_->update_edge_stack(id, file, group_ids);
        } catch (const std::exception& e) {
            fail_edge(failed, context, "failed to update edge stack", e);
        }
    };

    auto details = probe<RegularStackDetails>(
        [&] { return regular_->details(id); },
        [](const RegularStackDetails&) { return false; },
        options_.fallback);

    switch (resolve(details.outcome)) {
        case Action::Return:
            break;
        case Action::TryEdge:
            edge_update(details, "failed to get regular stack details");
            return;
        case Action::Reject:
            throw UnsupportedError(kEnvOverridesUnsupported);
        case Action::Fail:
            fail_with_context(details.error, "failed to get regular stack details");
    }

    const auto merged = merge_env_overrides(details.value.env, env_overrides);

    auto write = probe<bool>(
        [&] {
            regular_->update(id, details.value.endpoint_id, file, merged);
            return true;
        },
        [](bool) { return false; },
        options_.fallback);

    switch (resolve(write.outcome)) {
        case Action::Return:
            return;
        case Action::TryEdge:
            edge_update(write, "failed to update regular stack");
            return;
        case Action::Reject:
            throw UnsupportedError(kEnvOverridesUnsupported);
        case Action::Fail:
            fail_with_context(write.error, "failed to update regular stack");
    }
}

} // namespace stackport
