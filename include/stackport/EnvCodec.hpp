/**
 * @file EnvCodec.hpp
 * @brief Decoding and encoding of stack environment-variable lists
 *
 * The server may emit a stack's Env list in either of two shapes that carry
 * the same information:
 * - Variant A (primary):   [{"name": "X", "value": "y"}, ...]
 * - Variant B (alternate): [{"Name": "X", "Value": "y"}, ...]
 *
 * Decoding B as if it were A succeeds syntactically but yields entries
 * whose name and value are all empty. The decoder therefore validates the
 * primary result semantically before accepting it.
 */

#ifndef STACKPORT_ENVCODEC_HPP
#define STACKPORT_ENVCODEC_HPP

#include "stackport/Models.hpp"
#include "stackport/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stackport {

enum class EnvShape {
    LowerCase,  ///< variant A: name / value
    Capitalized ///< variant B: Name / Value
};

/**
 * @brief Decode an env array assuming one specific shape
 *
 * Missing or null fields decode as empty strings.
 *
 * @return Decoded list, or nullopt when raw is not an array of objects
 *         with string (or null) fields, or when an entry carries the
 *         other shape's keys
 */
std::optional<std::vector<StackEnvVar>> decode_env_shape(const Value& raw, EnvShape shape);

/**
 * @brief True when at least one entry has a non-empty name or value
 */
bool has_env_values(const std::vector<StackEnvVar>& env);

/**
 * @brief Parse a stack Env field
 *
 * Algorithm:
 * 1. null -> empty list
 * 2. Decode variant A; zero entries -> empty list
 * 3. Variant A with real content -> accept
 * 4. Otherwise decode variant B; when A did not decode at all, B must
 *    carry real content too
 *
 * @param raw The Env value from a stack detail response
 * @return Normalized ordered list
 * @throws ParseError if neither shape decodes
 */
std::vector<StackEnvVar> parse_stack_env(const Value& raw);

/**
 * @brief Parse raw JSON text holding a stack Env field
 *
 * Empty text is treated as null.
 *
 * @throws ParseError on malformed JSON or undecodable shape
 */
std::vector<StackEnvVar> parse_stack_env(const std::string& raw);

/**
 * @brief Validate caller-supplied env overrides
 *
 * Accepts null or an array of {"name": string, "value": string} objects.
 * An empty or missing name is invalid input.
 *
 * @throws ParseError describing the first invalid entry
 */
std::vector<StackEnvVar> parse_env_overrides(const Value& raw);

/**
 * @brief Parse a NAME=VALUE assignment
 *
 * Splits at the first '='; the value may itself contain '='.
 *
 * @throws ParseError if there is no '=' or the name is empty
 */
StackEnvVar parse_env_assignment(const std::string& assignment);

/**
 * @brief Encode an env list in the shape the update endpoint expects (variant A)
 */
Value env_to_json(const std::vector<StackEnvVar>& env);

} // namespace stackport

#endif // STACKPORT_ENVCODEC_HPP
