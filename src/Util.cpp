#include "stackport/Util.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#if defined(_WIN32)
  #include <windows.h>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace stackport {

void deep_merge(Value& a, const Value& b) {
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        const auto& key = it.key();
        const auto& bv  = it.value();
        if (a.contains(key) && a[key].is_object() && bv.is_object()) {
            deep_merge(a[key], bv);
        } else {
            a[key] = bv;
        }
    }
}

namespace {

// nullptr when a segment is missing or a parent is not an object
const Value* find_by_dot(const Value& obj, const std::string& path) {
    const Value* cur = &obj;
    for (const auto& key : split(path, '.')) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(key);
        if (it == cur->end()) return nullptr;
        cur = &*it;
    }
    return cur;
}

} // anonymous namespace

const Value& get_by_dot(const Value& obj, const std::string& path) {
    const Value* found = find_by_dot(obj, path);
    if (!found) throw std::out_of_range("Missing config key: " + path);
    return *found;
}

bool exists_by_dot(const Value& obj, const std::string& path) {
    return find_by_dot(obj, path) != nullptr;
}

void set_by_dot(Value& obj, const std::string& path, const Value& value) {
    Value* cur = &obj;
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) return;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& p = parts[i];
        if (!(*cur).contains(p) || !(*cur)[p].is_object()) {
            (*cur)[p] = Value::object();
        }
        cur = &(*cur)[p];
    }
    (*cur)[parts.back()] = value;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::vector<int> parse_int_list(const std::string& s) {
    std::vector<int> out;
    for (const auto& raw : split(s, ',')) {
        std::string item = trim(raw);
        if (item.empty()) continue;
        size_t pos = 0;
        int v = 0;
        try {
            v = std::stoi(item, &pos);
        } catch (const std::exception&) {
            throw std::invalid_argument("not an integer: " + item);
        }
        if (pos != item.size()) throw std::invalid_argument("not an integer: " + item);
        out.push_back(v);
    }
    return out;
}

std::map<std::string, Value> parse_overrides(const std::string& s) {
    std::map<std::string, Value> out;
    if (s.empty()) return out;
    // split on commas that are not inside braces/brackets/quotes
    int depth = 0;
    bool in_str = false;
    char str_ch = '\0';
    std::string buf;
    auto flush = [&](){
        std::string pair = buf;
        buf.clear();
        auto pos = pair.find(':');
        if (pos == std::string::npos) return;
        std::string k = trim(pair.substr(0, pos));
        std::string v = trim(pair.substr(pos+1));
        if (k.empty()) return;
        out[k] = parse_json_or_string(v);
    };
    for (size_t i=0;i<s.size();++i){
        char c = s[i];
        if (in_str) {
            buf += c;
            if (c == str_ch && (i==0 || s[i-1] != '\\')) in_str = false;
            continue;
        }
        if (c=='"' || c=='\'') { in_str = true; str_ch = c; buf += c; continue; }
        if (c=='{' || c=='[') { depth++; buf += c; continue; }
        if (c=='}' || c==']') { depth--; buf += c; continue; }
        if (c==',' && depth==0) { flush(); continue; }
        buf += c;
    }
    if (!buf.empty()) flush();
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

std::string transform_env_name(const std::string& name) {
    std::string lower = to_lower(name);
    std::string result;
    result.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] == '_' && i + 1 < lower.size() && lower[i + 1] == '_') {
            result += '_';
            ++i;
        } else if (lower[i] == '_') {
            result += '.';
        } else {
            result += lower[i];
        }
    }
    return result;
}

Value parse_json_or_string(const std::string& raw) {
    try {
        return Value::parse(raw);
    } catch (const Value::parse_error&) {
        return Value(raw);
    }
}

} // namespace stackport
