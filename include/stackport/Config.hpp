#ifndef STACKPORT_CONFIG_HPP
#define STACKPORT_CONFIG_HPP

#include "stackport/Value.hpp"
#include "stackport/Fallback.hpp"
#include "stackport/Errors.hpp"
#include <toml++/toml.hpp>
#include <string>
#include <map>
#include <vector>
#include <optional>

namespace stackport {

/**
 * @brief Built-in defaults for every recognized key.
 *
 * server.url, server.token, edge.url, edge.token, tls.insecure,
 * http.timeout, client.readonly, fallback.markers, log.level
 */
Value default_config();

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix = std::string("STACKPORT"); // STACKPORT_SERVER_URL -> server.url
    std::map<std::string, Value> overrides; // final precedence
    Value defaults = default_config();
    std::vector<std::string> mandatory;
};

/**
 * @brief Layered client configuration with dot-notation helpers.
 *
 * Internally uses nlohmann::json to represent a hierarchical tree.
 * Files may be JSON or TOML.
 */
class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }

    // Dot helpers
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const Value::type_error&) {
            return fallback;
        }
    }

    // Enforcement
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // Serialization
    std::string to_json_string(int indent = 2) const;
    std::string to_toml_string() const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    // File IO
    static Value read_file_any(const std::string& file);

private:
    Value data_ = Value::object();

    static Value toml_to_json(const toml::node& n);
    static toml::table json_to_toml(const Value& j);
    static std::string ext_of(const std::string& path);
};

/**
 * @brief Typed view of the keys the client uses.
 */
struct ClientSettings {
    std::string server_url;
    std::string token;
    std::string edge_url;   // defaults to server_url
    std::string edge_token; // defaults to token
    bool skip_tls_verify = false;
    long timeout_seconds = 30;
    bool read_only = false;
    std::string log_level = "info";
    FallbackPolicy fallback;

    // REST path usable only with both URL and token
    bool has_regular_api() const { return !server_url.empty() && !token.empty(); }
};

/**
 * @brief Extract ClientSettings from a loaded Config
 * @throws ConfigError if a key has an unusable type
 */
ClientSettings settings_from_config(const Config& cfg);

/**
 * @brief Copy of the tree with server.token and edge.token masked
 */
Value redact_secrets(const Value& data);

} // namespace stackport

#endif // STACKPORT_CONFIG_HPP
