#include "stackport/Config.hpp"
#include "stackport/Util.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <cctype>

namespace stackport {

Value default_config() {
    Value fallback_markers = Value::array();
    for (const auto& marker : FallbackPolicy::default_markers()) {
        fallback_markers.push_back(marker);
    }
    return Value{
        {"server", {{"url", ""}, {"token", ""}}},
        {"edge", {{"url", ""}, {"token", ""}}},
        {"tls", {{"insecure", false}}},
        {"http", {{"timeout", 30}}},
        {"client", {{"readonly", false}}},
        {"fallback", {{"markers", fallback_markers}}},
        {"log", {{"level", "info"}}}
    };
}

Config Config::load(const LoadOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        Value filej = read_file_any(*opts.file_path);
        deep_merge(merged, filej);
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    // 5) mandatory
    cfg.enforce_mandatory(opts.mandatory);

    return cfg;
}

// ---- JSON -> TOML (value-based construction) --------------------------------
namespace {

    void insert_scalar(toml::table& tbl, const std::string& key, const Value& v) {
        if (v.is_string()) {
            tbl.insert(key, v.get<std::string>());
        } else if (v.is_boolean()) {
            tbl.insert(key, v.get<bool>());
        } else if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                tbl.insert(key, static_cast<std::int64_t>(u));
            } else {
                tbl.insert(key, static_cast<double>(u));
            }
        } else if (v.is_number_integer()) {
            tbl.insert(key, v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            tbl.insert(key, v.get<double>());
        } else if (v.is_null()) {
            // No TOML null
            tbl.insert(key, std::string{""});
        } else {
            tbl.insert(key, v.dump());
        }
    }

    toml::table make_table_from_json(const Value& o);

    toml::array make_array_from_json(const Value& a) {
        toml::array out;
        for (const auto& elem : a) {
            if (elem.is_object()) {
                out.push_back(make_table_from_json(elem));
            } else if (elem.is_array()) {
                out.push_back(make_array_from_json(elem));
            } else if (elem.is_string()) {
                out.push_back(elem.get<std::string>());
            } else if (elem.is_boolean()) {
                out.push_back(elem.get<bool>());
            } else if (elem.is_number_integer()) {
                out.push_back(elem.get<std::int64_t>());
            } else if (elem.is_number_float()) {
                out.push_back(elem.get<double>());
            } else {
                out.push_back(std::string{""});
            }
        }
        return out;
    }

    toml::table make_table_from_json(const Value& o) {
        toml::table tbl;
        for (auto it = o.begin(); it != o.end(); ++it) {
            const auto& k = it.key();
            const auto& v = it.value();
            if (v.is_object()) {
                tbl.insert(k, make_table_from_json(v));
            } else if (v.is_array()) {
                tbl.insert(k, make_array_from_json(v));
            } else {
                insert_scalar(tbl, k, v);
            }
        }
        return tbl;
    }

    std::string scalar_to_string(const Value& v, const std::string& key) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number() || v.is_boolean()) return v.dump();
        if (v.is_null()) return "";
        throw ConfigError("Config key '" + key + "' must be a string, got " + type_name(v));
    }

} // namespace

toml::table Config::json_to_toml(const Value& j) {
    if (j.is_object()) return make_table_from_json(j);
    toml::table root;
    if (j.is_array()) root.insert("value", make_array_from_json(j));
    else insert_scalar(root, "value", j);
    return root;
}

Value Config::toml_to_json(const toml::node& n) {
    if (auto v = n.as_string()) {
        return Value(v->get());
    } else if (auto v = n.as_integer()) {
        return Value(v->get());
    } else if (auto v = n.as_floating_point()) {
        return Value(v->get());
    } else if (auto v = n.as_boolean()) {
        return Value(v->get());
    } else if (auto v = n.as_array()) {
        Value arr = Value::array();
        for (const auto& elem : *v) arr.push_back(toml_to_json(elem));
        return arr;
    } else if (auto v = n.as_table()) {
        Value obj = Value::object();
        for (const auto& [k, val] : *v) {
            obj[std::string(k.str())] = toml_to_json(val);
        }
        return obj;
    } else if (auto v = n.as_date()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = n.as_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = n.as_date_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    }
    return Value();
}

const Value& Config::at(const std::string& path) const {
    return get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return exists_by_dot(data_, path);
}

void Config::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        // Empty strings count as missing: every default is present
        if (!contains(k) || at(k).is_null() || (at(k).is_string() && at(k).get<std::string>().empty())) {
            missing.push_back(k);
        }
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

std::string Config::to_json_string(int indent) const {
    return data_.dump(indent);
}

std::string Config::to_toml_string() const {
    auto root = json_to_toml(data_);
    std::ostringstream oss;
    oss << root;
    return oss.str();
}

std::string Config::ext_of(const std::string& path) {
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos) return "";
    return to_lower(path.substr(pos));
}

Value Config::read_file_any(const std::string& file) {
    std::string ext = ext_of(file);
    if (ext == ".json") {
        std::ifstream ifs(file);
        if (!ifs) throw ConfigError("Configuration file not found: " + file);
        try {
            return Value::parse(ifs);
        } catch (const Value::parse_error& e) {
            throw ConfigError("Parse error in '" + file + "': " + e.what());
        }
    } else if (ext == ".toml") {
        std::ifstream probe(file);
        if (!probe) throw ConfigError("Configuration file not found: " + file);
        try {
            toml::table tbl = toml::parse_file(file);
            return toml_to_json(tbl);
        } catch (const toml::parse_error& e) {
            throw ConfigError("Parse error in '" + file + "': " + std::string(e.description()));
        }
    } else {
        throw ConfigError("Unsupported config file type: " + ext + " (expected .json or .toml)");
    }
}

void Config::apply_env_prefix(const std::string& prefix) {
    // prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) continue;
        std::string key = transform_env_name(name.substr(normalized.size()));
        if (key.empty()) continue;
        set_by_dot(data_, key, parse_json_or_string(value));
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

ClientSettings settings_from_config(const Config& cfg) {
    ClientSettings s;
    auto str = [&](const std::string& key) {
        return cfg.contains(key) ? scalar_to_string(cfg.at(key), key) : std::string();
    };

    s.server_url = str("server.url");
    s.token = str("server.token");
    s.edge_url = str("edge.url");
    s.edge_token = str("edge.token");
    if (s.edge_url.empty()) s.edge_url = s.server_url;
    if (s.edge_token.empty()) s.edge_token = s.token;

    s.skip_tls_verify = cfg.get<bool>("tls.insecure", false);
    s.timeout_seconds = cfg.get<long>("http.timeout", 30);
    if (s.timeout_seconds <= 0) {
        throw ConfigError("Config key 'http.timeout' must be a positive number of seconds");
    }
    s.read_only = cfg.get<bool>("client.readonly", false);
    s.log_level = str("log.level");
    if (s.log_level.empty()) s.log_level = "info";

    if (cfg.contains("fallback.markers")) {
        const Value& markers = cfg.at("fallback.markers");
        if (markers.is_string()) {
            s.fallback.markers.clear();
            for (const auto& m : split(markers.get<std::string>(), ',')) {
                if (!trim(m).empty()) s.fallback.markers.push_back(trim(m));
            }
        } else if (markers.is_array()) {
            s.fallback.markers.clear();
            for (const auto& m : markers) {
                s.fallback.markers.push_back(scalar_to_string(m, "fallback.markers"));
            }
        } else {
            throw ConfigError("Config key 'fallback.markers' must be a list of strings");
        }
    }
    return s;
}

Value redact_secrets(const Value& data) {
    Value out = data;
    for (const char* key : {"server.token", "edge.token"}) {
        if (exists_by_dot(out, key) && !get_by_dot(out, key).is_null() &&
            get_by_dot(out, key) != Value("")) {
            set_by_dot(out, key, "********");
        }
    }
    return out;
}

} // namespace stackport
