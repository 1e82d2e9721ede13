#pragma once
#include <string>
#include <vector>

namespace ipgate {

struct GateConfig {
    std::string listen_host = "0.0.0.0";
    int listen_port = 8787;

    // Where admitted requests go, e.g. "http://127.0.0.1:8080".
    std::string origin_url;
    int origin_timeout_ms = 30000;

    // Hostnames this gate serves (lowercase, no port). The identity lookup goes
    // to the inbound Host, so any other Host is refused before the lookup.
    // Required: an empty list fails validation.
    std::vector<std::string> allowed_hosts;

    // Identity lookup endpoint shape; the host always comes from the inbound request.
    std::string identity_scheme = "https";
    int identity_port = 0;
    int identity_timeout_ms = 5000;
    std::string identity_ca_file;

    // Header carrying the address the edge observed for the request.
    std::string client_ip_header = "CF-Connecting-IP";

    // Empty = <exe_dir>/audit (resolved by main).
    std::string audit_dir;
    std::string audit_min_level = "ADMIN";
};

// Overlay keys from a JSON settings file onto cfg.
// Missing file: returns true, cfg untouched, *out_found=false.
// Unreadable/malformed file or wrongly typed key: returns false with out_err.
bool gate_config_load_json(const std::string& path, GateConfig& cfg,
                           bool* out_found, std::string& out_err);

// Overlay IPGATE_* environment variables onto cfg.
// IPGATE_ALLOWED_HOSTS is a comma-separated list and replaces the file's list.
// Returns false with out_err on a non-numeric value for a numeric setting.
bool gate_config_apply_env(GateConfig& cfg, std::string& out_err);

// Range/shape checks run once after all layers are applied.
bool gate_config_validate(const GateConfig& cfg, std::string& out_err);

} // namespace ipgate
