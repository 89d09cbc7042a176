/**
 * @file EnvMerge.hpp
 * @brief Merging caller env overrides into a stack's stored env list
 *
 * Merging rules:
 * - Empty overrides: existing list is returned unchanged
 * - Override entries with an empty name are ignored
 * - A name repeated in the overrides keeps its last value
 * - Existing entries keep their position; overridden ones take the new value
 * - Names introduced only by the overrides are appended once, in the
 *   order they were first seen in the override list
 */

#ifndef STACKPORT_ENVMERGE_HPP
#define STACKPORT_ENVMERGE_HPP

#include "stackport/Models.hpp"
#include <string>
#include <vector>

namespace stackport {

/**
 * @brief Merge overrides into an existing env list
 *
 * Pure and total: never throws for well-formed input.
 *
 * @param existing Server-stored env list (order preserved)
 * @param overrides Caller-supplied (name, value) pairs
 * @return existing.size() + number of genuinely new override names entries
 *
 * Example:
 * ```cpp
 * merge_env_overrides({{"A","1"},{"B","2"}}, {{"B","9"},{"C","3"}});
 * // Result: {{"A","1"},{"B","9"},{"C","3"}}
 * ```
 */
std::vector<StackEnvVar> merge_env_overrides(const std::vector<StackEnvVar>& existing,
                                             const std::vector<StackEnvVar>& overrides);

/**
 * @brief Distinct non-empty names in first-occurrence order
 */
std::vector<std::string> unique_env_names(const std::vector<StackEnvVar>& env);

} // namespace stackport

#endif // STACKPORT_ENVMERGE_HPP
