/**
 * @file StackClient.hpp
 * @brief One logical "stack" over regular (REST) and edge stacks
 *
 * Every operation probes the regular REST path first (where one exists),
 * classifies the outcome, and looks up what to do next in a per-operation
 * decision table:
 *
 *   Probe outcome            List/GetFile   GetEnvNames   Update
 *   ----------------------   ------------   -----------   ----------------
 *   Success                  Return         Return        Return / write
 *   Empty                    TryEdge        Return        Return / write
 *   FallbackWorthy failure   TryEdge        Reject        TryEdge (*)
 *   Terminal failure         TryEdge        Fail          Fail
 *
 *   (*) Reject instead when env overrides were supplied: edge stacks have
 *       no environment to apply them to.
 *
 * When both paths are attempted and both fail, a CompositeError names the
 * two causes.
 */

#ifndef STACKPORT_STACKCLIENT_HPP
#define STACKPORT_STACKCLIENT_HPP

#include "stackport/EdgeStackApi.hpp"
#include "stackport/Fallback.hpp"
#include "stackport/Models.hpp"
#include "stackport/RegularStackApi.hpp"
#include <memory>
#include <string>
#include <vector>

namespace stackport {

enum class ProbeOutcome {
    Success,
    Empty,
    FallbackWorthy,
    Terminal
};

enum class Action {
    Return,
    TryEdge,
    Reject,
    Fail
};

struct DecisionRule {
    Action on_success;
    Action on_empty;
    Action on_fallback;
    Action on_terminal;
};

constexpr Action decide(const DecisionRule& rule, ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Success: return rule.on_success;
        case ProbeOutcome::Empty: return rule.on_empty;
        case ProbeOutcome::FallbackWorthy: return rule.on_fallback;
        case ProbeOutcome::Terminal: return rule.on_terminal;
    }
    return rule.on_terminal;
}

namespace rules {

constexpr DecisionRule kList{Action::Return, Action::TryEdge, Action::TryEdge, Action::TryEdge};
constexpr DecisionRule kGetFile{Action::Return, Action::TryEdge, Action::TryEdge, Action::TryEdge};
constexpr DecisionRule kGetEnvNames{Action::Return, Action::Return, Action::Reject, Action::Fail};
constexpr DecisionRule kUpdate{Action::Return, Action::Return, Action::TryEdge, Action::Fail};

} // namespace rules

struct StackClientOptions {
    FallbackPolicy fallback;
    bool read_only = false;
};

class StackClient {
public:
    /**
     * @param regular REST path; nullptr when no server URL and token are configured
     * @param edge Edge-stack primitives (required)
     * @param options Classifier markers and read-only mode
     */
    StackClient(std::unique_ptr<RegularStackApi> regular,
                std::shared_ptr<EdgeStackApi> edge,
                StackClientOptions options = {});

    /**
     * @brief All stacks: regular ones if any exist, edge ones otherwise
     * @throws CompositeError when both paths fail, EdgeError when only edge failed
     */
    std::vector<Stack> get_stacks();

    /**
     * @brief Compose file of a stack
     * @throws CompositeError when both paths fail, EdgeError when only edge failed
     */
    std::string get_stack_file(int id);

    /**
     * @brief Distinct environment variable names of a regular stack
     *
     * Never calls an edge primitive.
     *
     * @throws ConfigError without server URL and token
     * @throws UnsupportedError when the id belongs to an edge stack
     */
    std::vector<std::string> get_stack_env_names(int id);

    /**
     * @brief Create an edge stack
     * @return ID of the created stack
     * @throws UnsupportedError in read-only mode, EdgeError on failure
     */
    int create_stack(const std::string& name, const std::string& file,
                     const std::vector<int>& environment_group_ids);

    /**
     * @brief Update a stack's file, groups and (regular stacks only) env
     *
     * For regular stacks the stored env is read, merged with env_overrides
     * and written back together with the new file.
     *
     * @throws UnsupportedError when overrides target an edge stack or in read-only mode
     * @throws ConfigError when overrides are given without server URL and token
     */
    void update_stack(int id, const std::string& file,
                      const std::vector<int>& environment_group_ids,
                      const std::vector<StackEnvVar>& env_overrides = {});

    bool has_regular_api() const noexcept { return regular_ != nullptr; }

private:
    std::unique_ptr<RegularStackApi> regular_;
    std::shared_ptr<EdgeStackApi> edge_;
    StackClientOptions options_;

    RegularStackApi& require_regular();
    void ensure_writable(const char* operation) const;
};

} // namespace stackport

#endif // STACKPORT_STACKCLIENT_HPP
