/**
 * @file Errors.hpp
 * @brief Exception types for stackport operations
 *
 * Every error carries a closed ErrorKind, populated where the error is
 * raised, so callers and the fallback classifier never have to inspect
 * exception types by name:
 * - TransportError: connection, DNS or TLS failure
 * - StatusError: non-2xx response (status code + body)
 * - ParseError: malformed JSON or undecodable env shape
 * - UnsupportedError: feature has no equivalent on the resolved stack kind
 * - ConfigError: operation needs configuration that is absent
 * - EdgeError: an edge-stack primitive failed
 */

#ifndef STACKPORT_ERRORS_HPP
#define STACKPORT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace stackport {

enum class ErrorKind {
    Transport,
    Status,
    Parse,
    Unsupported,
    Config,
    Edge
};

/**
 * @brief Human-readable name of an ErrorKind
 */
const char* error_kind_name(ErrorKind kind) noexcept;

/**
 * @brief Base class for all stackport exceptions
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Connection-level failure (no HTTP status was received)
 */
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error(ErrorKind::Transport, message)
    {}
};

/**
 * @brief Server answered with a status outside the accepted range
 */
class StatusError : public Error {
public:
    /**
     * @brief Construct with status code and raw response body
     * @param status_code Numeric HTTP status
     * @param body Response body text (may be empty)
     */
    StatusError(long status_code, std::string body)
        : Error(ErrorKind::Status, format_message(status_code, body))
        , status_code_(status_code)
        , body_(std::move(body))
    {}

    /**
     * @brief Same status and body, message prefixed with context
     */
    StatusError(const std::string& context, const StatusError& cause)
        : Error(ErrorKind::Status, context + ": " + cause.what())
        , status_code_(cause.status_code_)
        , body_(cause.body_)
    {}

    long status_code() const noexcept {
        return status_code_;
    }

    const std::string& body() const noexcept {
        return body_;
    }

private:
    long status_code_;
    std::string body_;

    static std::string format_message(long status_code, const std::string& body) {
        std::ostringstream oss;
        oss << "api returned status " << status_code;
        if (!body.empty()) oss << ": " << body;
        return oss.str();
    }
};

/**
 * @brief Response or input could not be decoded
 */
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message)
        : Error(ErrorKind::Parse, message)
    {}
};

/**
 * @brief Requested feature does not exist for the resolved stack kind
 */
class UnsupportedError : public Error {
public:
    explicit UnsupportedError(const std::string& message)
        : Error(ErrorKind::Unsupported, message)
    {}
};

/**
 * @brief Operation requires configuration that is missing or invalid
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::Config, message)
    {}
};

/**
 * @brief Mandatory configuration keys are missing after merge
 *
 * Contains the list of all missing mandatory keys.
 */
class MissingMandatoryConfig : public ConfigError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief An edge-stack primitive failed
 */
class EdgeError : public Error {
public:
    explicit EdgeError(const std::string& message)
        : Error(ErrorKind::Edge, message)
    {}
};

/**
 * @brief Both the regular and the edge path failed
 *
 * The message names both causes; each is also available separately.
 */
class CompositeError : public EdgeError {
public:
    /**
     * @param context What the regular path was doing, e.g. "failed to list regular stacks"
     * @param regular_cause Message of the regular-path failure
     * @param edge_cause Message of the edge-path failure
     */
    CompositeError(const std::string& context, std::string regular_cause, std::string edge_cause)
        : EdgeError(context + ": " + regular_cause + " (edge stack also failed: " + edge_cause + ")")
        , regular_cause_(std::move(regular_cause))
        , edge_cause_(std::move(edge_cause))
    {}

    const std::string& regular_cause() const noexcept {
        return regular_cause_;
    }

    const std::string& edge_cause() const noexcept {
        return edge_cause_;
    }

private:
    std::string regular_cause_;
    std::string edge_cause_;
};

/**
 * @brief Rethrow an error as the same kind with a context prefix
 *
 * StatusError keeps its status code and body so a wrapped error can still
 * be classified.
 */
[[noreturn]] void rethrow_with_context(const Error& err, const std::string& context);

} // namespace stackport

#endif // STACKPORT_ERRORS_HPP
