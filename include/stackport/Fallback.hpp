/**
 * @file Fallback.hpp
 * @brief Decides whether a regular-path failure means "this is an edge stack"
 *
 * The server offers no structured "wrong resource kind" error, only
 * free-text hints. All substring matching is confined to
 * contains_edge_marker() so it can be replaced by a structured contract.
 *
 * Classification by ErrorKind:
 * - Status:    404, or a marker in the body or message
 * - Transport: a marker in the message
 * - anything else: never
 */

#ifndef STACKPORT_FALLBACK_HPP
#define STACKPORT_FALLBACK_HPP

#include "stackport/Errors.hpp"
#include <string>
#include <vector>

namespace stackport {

/// Version of the built-in marker set
constexpr int kEdgeMarkerSetVersion = 1;

/**
 * @brief Marker substrings that identify edge-managed resources
 *
 * Matching is case-insensitive. The defaults are what the server is known
 * to emit; configuration may replace them.
 */
struct FallbackPolicy {
    std::vector<std::string> markers = default_markers();

    static std::vector<std::string> default_markers() {
        return {"edgestackupdate", "edge stack"};
    }
};

/**
 * @brief Case-insensitive marker search
 *
 * Whitespace runs in the text are collapsed to single spaces before
 * matching. Empty markers never match.
 */
bool contains_edge_marker(const std::string& text, const FallbackPolicy& policy = {});

/**
 * @brief True if the failure should be retried against the edge path
 */
bool should_fallback(const Error& err, const FallbackPolicy& policy = {});

} // namespace stackport

#endif // STACKPORT_FALLBACK_HPP
