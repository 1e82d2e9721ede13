/*
IP-bound Access gate
====================

A reverse proxy that sits between the Cloudflare edge and an origin service.

Cloudflare Access authenticates users and hands the browser a CF_Authorization
cookie. The cookie is a bearer credential: anyone who copies it can present
it. This server narrows that down. For each request it asks the Access
identity endpoint on the same host who the token belongs to and which address
it was issued to, and only lets the request through when that address equals
the CF-Connecting-IP the edge observed for the request.

Responsibilities
----------------
- Gate: cookie extraction, identity lookup, address comparison (gate.cc).
- Proxy: verbatim forwarding of admitted requests (origin_proxy.cc).
- Audit: hash-chained JSONL record of denies and lookup failures (audit_log.cc).

Non-goals
---------
- TLS termination (the edge or a local terminator does that).
- Issuing tokens, login flows, caching lookups, rate limiting.

Every path ends in exactly one response. Lookup failures fail closed.
*/

#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <limits.h>
#include <unistd.h>

#include <sodium.h>

#include "httplib.h"

#include "audit_fields.h"
#include "audit_log.h"
#include "gate.h"
#include "gate_config.h"
#include "identity_lookup.h"
#include "ipgate_util.h"
#include "origin_proxy.h"

static std::string exe_dir() {
    char buf[PATH_MAX] = {0};
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string p(buf, (size_t)n);
    return std::filesystem::path(p).parent_path().string();
}

// build/bin/ipgate_server -> repo root is two levels up
static std::string repo_root() {
    return std::filesystem::weakly_canonical(
        std::filesystem::path(exe_dir()) / ".." / ".."
    ).string();
}

// -----------------------------------------------------------------------------
// main
// -----------------------------------------------------------------------------
int main()
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    // ---- Config: defaults -> config/gate.json -> IPGATE_* env ----
    std::string config_path =
        (std::filesystem::path(repo_root()) / "config" / "gate.json").string();
    if (const char* p = std::getenv("IPGATE_CONFIG_PATH")) {
        config_path = p;
    }

    ipgate::GateConfig cfg;
    std::string err;
    bool found = false;
    if (!ipgate::gate_config_load_json(config_path, cfg, &found, err)) {
        std::cerr << "[config] FATAL: " << config_path << ": " << err << std::endl;
        return 2;
    }
    if (!found) {
        std::cerr << "[config] no " << config_path << ", using defaults + environment" << std::endl;
    }
    if (!ipgate::gate_config_apply_env(cfg, err) || !ipgate::gate_config_validate(cfg, err)) {
        std::cerr << "[config] FATAL: " << err << std::endl;
        return 2;
    }

    // ---- Audit log (hash-chained JSONL) ----
    const std::string audit_dir = cfg.audit_dir.empty() ? exe_dir() + "/audit" : cfg.audit_dir;
    try {
        std::filesystem::create_directories(audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    ipgate::AuditLog audit(audit_dir + "/ipgate_audit.jsonl", audit_dir + "/ipgate_audit.state");
    if (!audit.set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[config] FATAL: invalid audit_min_level " << cfg.audit_min_level << std::endl;
        return 2;
    }
    std::cerr << "[audit] " << audit.jsonl_path() << " min_level=" << audit.min_level_str() << std::endl;

    // ---- Gate ----
    ipgate::IdentityEndpointOptions idopt;
    idopt.scheme = cfg.identity_scheme;
    idopt.port = cfg.identity_port;
    idopt.timeout_ms = cfg.identity_timeout_ms;
    idopt.ca_file = cfg.identity_ca_file;

    const ipgate::OriginProxy proxy(cfg.origin_url, cfg.origin_timeout_ms);

    ipgate::GateOptions gopt;
    gopt.client_ip_header = cfg.client_ip_header;
    gopt.allowed_hosts = cfg.allowed_hosts;

    const ipgate::IpBindingGate gate(
        gopt,
        ipgate::make_httplib_identity_transport(idopt),
        [&proxy](const httplib::Request& req, httplib::Response& res, std::string& e) {
            return proxy.forward(req, res, e);
        },
        &audit);

    // ---- HTTP server ----
    httplib::Server srv;

    ipgate::install_gate_routes(srv, gate);

    {
        ipgate::AuditEvent ev;
        ev.event = "gate.started";
        ev.outcome = "ok";
        ev.f["listen"] = cfg.listen_host + ":" + std::to_string(cfg.listen_port);
        ev.f["origin"] = cfg.origin_url;
        ev.f["identity_scheme"] = cfg.identity_scheme;
        ev.f["client_ip_header"] = cfg.client_ip_header;
        std::string hosts;
        for (const auto& h : cfg.allowed_hosts) hosts += (hosts.empty() ? "" : ",") + h;
        ev.f["allowed_hosts"] = ipgate::shorten(hosts, 160);
        if (audit.enabled(ipgate::AuditLog::Level::ADMIN) &&
            !audit.append(ev, ipgate::AuditLog::Level::ADMIN)) {
            std::cerr << "[audit] WARNING: append failed: " << audit.jsonl_path() << std::endl;
        }
    }

    std::cerr << "ipgate listening on " << cfg.listen_host << ":" << cfg.listen_port
              << " -> " << cfg.origin_url << std::endl;
    if (!srv.listen(cfg.listen_host, cfg.listen_port)) {
        std::cerr << "[gate] FATAL: cannot listen on " << cfg.listen_host << ":" << cfg.listen_port << std::endl;
        return 3;
    }
    return 0;
}
