/**
 * @file Errors.cpp
 * @brief ErrorKind naming and context wrapping
 */

#include "stackport/Errors.hpp"

namespace stackport {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Status: return "status";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::Config: return "config";
        case ErrorKind::Edge: return "edge";
    }
    return "unknown";
}

void rethrow_with_context(const Error& err, const std::string& context) {
    const std::string message = context + ": " + err.what();
    switch (err.kind()) {
        case ErrorKind::Status:
            if (auto status = dynamic_cast<const StatusError*>(&err)) {
                throw StatusError(context, *status);
            }
            break;
        case ErrorKind::Transport: throw TransportError(message);
        case ErrorKind::Parse: throw ParseError(message);
        case ErrorKind::Unsupported: throw UnsupportedError(message);
        case ErrorKind::Config: throw ConfigError(message);
        case ErrorKind::Edge: throw EdgeError(message);
    }
    throw Error(err.kind(), message);
}

} // namespace stackport
