/**
 * @file Fallback.cpp
 * @brief Fallback classification
 */

#include "stackport/Fallback.hpp"

#include <cctype>

namespace stackport {

namespace {

constexpr long kStatusNotFound = 404;

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!in_space) out += ' ';
            in_space = true;
            continue;
        }
        out += static_cast<char>(std::tolower(c));
        in_space = false;
    }
    return out;
}

} // anonymous namespace

bool contains_edge_marker(const std::string& text, const FallbackPolicy& policy) {
    const std::string haystack = normalize_text(text);
    for (const auto& marker : policy.markers) {
        if (marker.empty()) continue;
        if (haystack.find(normalize_text(marker)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool should_fallback(const Error& err, const FallbackPolicy& policy) {
    switch (err.kind()) {
        case ErrorKind::Status: {
            const auto* status = dynamic_cast<const StatusError*>(&err);
            if (status && status->status_code() == kStatusNotFound) {
                return true;
            }
            if (status && contains_edge_marker(status->body(), policy)) {
                return true;
            }
            return contains_edge_marker(err.what(), policy);
        }
        case ErrorKind::Transport:
            return contains_edge_marker(err.what(), policy);
        case ErrorKind::Parse:
        case ErrorKind::Unsupported:
        case ErrorKind::Config:
        case ErrorKind::Edge:
            return false;
    }
    return false;
}

} // namespace stackport
