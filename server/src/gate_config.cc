#include "gate_config.h"
#include "ipgate_util.h"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ipgate {

/*
Configuration layering
======================

1) compiled-in defaults (GateConfig member initializers)
2) JSON settings file (config/gate.json, or IPGATE_CONFIG_PATH)
3) IPGATE_* environment variables

Later layers win. Validation runs once at the end, so a bad value from any
layer stops startup instead of silently falling back.
*/

static bool parse_int_strict(const std::string& s, int& out) {
    const std::string t = trim_ascii_ws(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = (int)v;
    return true;
}

static bool json_take_string(const json& j, const char* key, std::string& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = std::string("\"") + key + "\" must be a string";
        return false;
    }
    dst = it->get<std::string>();
    return true;
}

static bool json_take_int(const json& j, const char* key, int& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_number_integer()) {
        err = std::string("\"") + key + "\" must be an integer";
        return false;
    }
    // get<int>() would truncate silently; check the full value first
    bool in_range = false;
    if (it->is_number_unsigned()) {
        in_range = it->get<std::uint64_t>() <= (std::uint64_t)INT_MAX;
    } else {
        const std::int64_t v = it->get<std::int64_t>();
        in_range = v >= INT_MIN && v <= INT_MAX;
    }
    if (!in_range) {
        err = std::string("\"") + key + "\" is out of range: " + it->dump();
        return false;
    }
    dst = it->get<int>();
    return true;
}

// Allowed-host entries compare against host_without_port() of the inbound Host,
// so they get the same normalization.
static bool normalize_host_entry(const std::string& raw, std::string& out) {
    out = host_without_port(trim_ascii_ws(raw));
    return !out.empty();
}

static bool json_take_host_list(const json& j, const char* key,
                                std::vector<std::string>& dst, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_array()) {
        err = std::string("\"") + key + "\" must be an array of hostnames";
        return false;
    }
    std::vector<std::string> hosts;
    for (const auto& e : *it) {
        std::string h;
        if (!e.is_string() || !normalize_host_entry(e.get<std::string>(), h)) {
            err = std::string("\"") + key + "\" entries must be non-empty hostnames";
            return false;
        }
        hosts.push_back(h);
    }
    dst = hosts;
    return true;
}

static bool parse_host_list(const std::string& csv, std::vector<std::string>& out) {
    std::vector<std::string> hosts;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string h;
        if (!normalize_host_entry(item, h)) return false;
        hosts.push_back(h);
    }
    out = hosts;
    return true;
}

bool gate_config_load_json(const std::string& path, GateConfig& cfg,
                           bool* out_found, std::string& out_err) {
    if (out_found) *out_found = false;

    std::ifstream f(path);
    if (!f.good()) return true;
    if (out_found) *out_found = true;

    json j;
    try {
        // ignore_comments=true: operators annotate config files
        j = json::parse(f, nullptr, true, true);
    } catch (const std::exception& e) {
        out_err = std::string("parse error: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        out_err = "expected a json object";
        return false;
    }

    GateConfig tmp = cfg;
    if (!json_take_string(j, "listen_host", tmp.listen_host, out_err)) return false;
    if (!json_take_int(j, "listen_port", tmp.listen_port, out_err)) return false;
    if (!json_take_string(j, "origin_url", tmp.origin_url, out_err)) return false;
    if (!json_take_int(j, "origin_timeout_ms", tmp.origin_timeout_ms, out_err)) return false;
    if (!json_take_host_list(j, "allowed_hosts", tmp.allowed_hosts, out_err)) return false;
    if (!json_take_string(j, "identity_scheme", tmp.identity_scheme, out_err)) return false;
    if (!json_take_int(j, "identity_port", tmp.identity_port, out_err)) return false;
    if (!json_take_int(j, "identity_timeout_ms", tmp.identity_timeout_ms, out_err)) return false;
    if (!json_take_string(j, "identity_ca_file", tmp.identity_ca_file, out_err)) return false;
    if (!json_take_string(j, "client_ip_header", tmp.client_ip_header, out_err)) return false;
    if (!json_take_string(j, "audit_dir", tmp.audit_dir, out_err)) return false;
    if (!json_take_string(j, "audit_min_level", tmp.audit_min_level, out_err)) return false;

    cfg = tmp;
    return true;
}

bool gate_config_apply_env(GateConfig& cfg, std::string& out_err) {
    auto env_int = [&](const char* name, int& dst) -> bool {
        const char* v = std::getenv(name);
        if (!v) return true;
        if (!parse_int_strict(v, dst)) {
            out_err = std::string(name) + " is not an integer: " + v;
            return false;
        }
        return true;
    };

    if (const char* v = std::getenv("IPGATE_LISTEN_HOST")) cfg.listen_host = v;
    if (!env_int("IPGATE_LISTEN_PORT", cfg.listen_port)) return false;
    if (const char* v = std::getenv("IPGATE_ORIGIN_URL")) cfg.origin_url = v;
    if (!env_int("IPGATE_ORIGIN_TIMEOUT_MS", cfg.origin_timeout_ms)) return false;
    if (const char* v = std::getenv("IPGATE_ALLOWED_HOSTS")) {
        if (!parse_host_list(v, cfg.allowed_hosts)) {
            out_err = std::string("IPGATE_ALLOWED_HOSTS has an empty entry: ") + v;
            return false;
        }
    }
    if (const char* v = std::getenv("IPGATE_IDENTITY_SCHEME")) cfg.identity_scheme = v;
    if (!env_int("IPGATE_IDENTITY_PORT", cfg.identity_port)) return false;
    if (!env_int("IPGATE_IDENTITY_TIMEOUT_MS", cfg.identity_timeout_ms)) return false;
    if (const char* v = std::getenv("IPGATE_IDENTITY_CA_FILE")) cfg.identity_ca_file = v;
    if (const char* v = std::getenv("IPGATE_CLIENT_IP_HEADER")) cfg.client_ip_header = v;
    if (const char* v = std::getenv("IPGATE_AUDIT_DIR")) cfg.audit_dir = v;
    if (const char* v = std::getenv("IPGATE_AUDIT_MIN_LEVEL")) cfg.audit_min_level = v;

    return true;
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool gate_config_validate(const GateConfig& cfg, std::string& out_err) {
    if (cfg.listen_host.empty()) {
        out_err = "listen_host must not be empty";
        return false;
    }
    if (cfg.listen_port < 1 || cfg.listen_port > 65535) {
        out_err = "listen_port out of range: " + std::to_string(cfg.listen_port);
        return false;
    }
    if (cfg.origin_url.empty()) {
        out_err = "origin_url is required";
        return false;
    }
    if (!starts_with(cfg.origin_url, "http://") && !starts_with(cfg.origin_url, "https://")) {
        out_err = "origin_url must start with http:// or https://";
        return false;
    }
    if (cfg.origin_timeout_ms <= 0) {
        out_err = "origin_timeout_ms must be > 0";
        return false;
    }
    if (cfg.allowed_hosts.empty()) {
        out_err = "allowed_hosts is required";
        return false;
    }
    if (cfg.identity_scheme != "https" && cfg.identity_scheme != "http") {
        out_err = "identity_scheme must be http or https";
        return false;
    }
    if (cfg.identity_port < 0 || cfg.identity_port > 65535) {
        out_err = "identity_port out of range: " + std::to_string(cfg.identity_port);
        return false;
    }
    if (cfg.identity_timeout_ms <= 0) {
        out_err = "identity_timeout_ms must be > 0";
        return false;
    }
    if (cfg.client_ip_header.empty()) {
        out_err = "client_ip_header must not be empty";
        return false;
    }

    const std::string lvl = lower_ascii(trim_ascii_ws(cfg.audit_min_level));
    if (lvl != "debug" && lvl != "info" && lvl != "admin" && lvl != "security") {
        out_err = "audit_min_level must be DEBUG, INFO, ADMIN or SECURITY";
        return false;
    }

    return true;
}

} // namespace ipgate
