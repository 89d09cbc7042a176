/**
 * @file Transport.hpp
 * @brief HTTP transport seam and REST status policy
 *
 * HttpTransport performs exactly one request and reports what the server
 * said; it never judges status codes. RestClient layers the status policy
 * on top:
 * - GET succeeds only on 200
 * - PUT and POST succeed on any 2xx
 * - anything else raises StatusError(code, body)
 *
 * CurlTransport is the production implementation (libcurl). Tests supply
 * their own HttpTransport.
 */

#ifndef STACKPORT_TRANSPORT_HPP
#define STACKPORT_TRANSPORT_HPP

#include <memory>
#include <optional>
#include <string>

namespace stackport {

enum class HttpMethod {
    GET,
    PUT,
    POST
};

const char* http_method_to_string(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;                ///< absolute path plus query, e.g. "/api/stacks/3?endpointId=1"
    std::optional<std::string> body; ///< JSON body, sent with Content-Type: application/json
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Connection settings, fixed at construction
 */
struct TransportOptions {
    std::string base_url;
    std::string api_key;
    bool skip_tls_verify = false;
    long timeout_seconds = 30;
    std::string user_agent = "stackport/1.0";
};

/**
 * @brief Normalize a server URL
 *
 * Prefixes "https://" when no http(s) scheme is present and trims a
 * trailing slash.
 *
 * Examples:
 * - "portainer.local:9443"   -> "https://portainer.local:9443"
 * - "http://10.0.0.5:9000/"  -> "http://10.0.0.5:9000"
 */
std::string normalize_base_url(const std::string& url);

/**
 * @brief One request, one response
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @throws TransportError when no response was received
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed transport
 *
 * Each call owns its own easy handle, released on every exit path, so no
 * connection is reused between the calls of one operation.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(TransportOptions options);

    HttpResponse send(const HttpRequest& request) override;

    const TransportOptions& options() const noexcept { return options_; }

private:
    TransportOptions options_;
};

/**
 * @brief Applies the status policy over an HttpTransport
 */
class RestClient {
public:
    explicit RestClient(std::shared_ptr<HttpTransport> transport)
        : transport_(std::move(transport)) {}

    // Body of a 200 response
    std::string get(const std::string& path);

    // Body of any 2xx response
    std::string put(const std::string& path, const std::string& json_body);
    std::string post(const std::string& path, const std::string& json_body);

private:
    std::shared_ptr<HttpTransport> transport_;

    std::string send_expecting(HttpMethod method, const std::string& path,
                               std::optional<std::string> body, bool exact_ok);
};

} // namespace stackport

#endif // STACKPORT_TRANSPORT_HPP
