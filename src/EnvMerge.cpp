/**
 * @file EnvMerge.cpp
 * @brief Implementation of env override merging
 */

#include "stackport/EnvMerge.hpp"

#include <set>
#include <unordered_map>

namespace stackport {

std::vector<StackEnvVar> merge_env_overrides(const std::vector<StackEnvVar>& existing,
                                             const std::vector<StackEnvVar>& overrides) {
    if (overrides.empty()) {
        return existing;
    }

    // Last value wins; order records first sighting
    std::unordered_map<std::string, std::string> override_values;
    std::vector<std::string> override_order;
    for (const auto& entry : overrides) {
        if (entry.name.empty()) {
            continue;
        }
        auto inserted = override_values.insert_or_assign(entry.name, entry.value);
        if (inserted.second) {
            override_order.push_back(entry.name);
        }
    }

    std::vector<StackEnvVar> merged;
    merged.reserve(existing.size() + override_order.size());
    std::set<std::string> seen;

    for (const auto& current : existing) {
        auto it = override_values.find(current.name);
        if (it != override_values.end()) {
            merged.push_back(StackEnvVar{current.name, it->second});
        } else {
            merged.push_back(current);
        }
        seen.insert(current.name);
    }

    for (const auto& name : override_order) {
        if (seen.count(name) > 0) {
            continue;
        }
        merged.push_back(StackEnvVar{name, override_values[name]});
        seen.insert(name);
    }

    return merged;
}

std::vector<std::string> unique_env_names(const std::vector<StackEnvVar>& env) {
    std::vector<std::string> names;
    names.reserve(env.size());
    std::set<std::string> seen;
    for (const auto& entry : env) {
        if (entry.name.empty() || !seen.insert(entry.name).second) {
            continue;
        }
        names.push_back(entry.name);
    }
    return names;
}

} // namespace stackport
