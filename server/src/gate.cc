#include "gate.h"

#include "audit_fields.h"
#include "audit_log.h"
#include "cookie_jar.h"
#include "ipgate_util.h"
#include "origin_proxy.h"

#include <algorithm>
#include <exception>
#include <iostream>

namespace ipgate {

/*
Request gate
============

Access has already authenticated the caller by the time a request reaches us;
the CF_Authorization cookie proves it. What Access does not check on every
request is *where* the token is being presented from. A token lifted from one
machine replays fine from another.

The identity record behind the token remembers the address the login came
from ("ip"). We compare that against the address the edge observed for this
request and refuse anything that does not match exactly.

Every failure is terminal for the request. Nothing is retried, nothing is
cached, nothing is shared between requests except immutable config.

Status mapping:
- credential/address problems, rejected or malformed lookups -> 403
- lookup could not be completed at all                       -> 500
- origin unreachable after admit                             -> 502
*/

const char* const kBodyForbidden     = "Forbidden";
const char* const kBodyMismatch      = "Forbidden)";
const char* const kBodyInternalError = "Internal Server Error";
const char* const kBodyBadGateway    = "Bad Gateway";

const char* gate_failure_code(GateFailure f) {
    switch (f) {
        case GateFailure::None:                   return "none";
        case GateFailure::MissingCredential:      return "missing_credential";
        case GateFailure::MissingClientAddress:   return "missing_client_address";
        case GateFailure::MissingHost:            return "missing_host";
        case GateFailure::HostNotAllowed:         return "host_not_allowed";
        case GateFailure::IdentityLookupRejected: return "identity_lookup_rejected";
        case GateFailure::IdentityMalformed:      return "identity_malformed";
        case GateFailure::AddressMismatch:        return "address_mismatch";
        case GateFailure::TransportFailure:       return "transport_failure";
    }
    return "unknown";
}

void reply_text(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, "text/plain");
}

static GateDecision deny(GateDecision d, GateFailure f, const std::string& reason,
                         const char* body = kBodyForbidden) {
    d.verdict = Verdict::Deny;
    d.failure = f;
    d.status = 403;
    d.body = body;
    d.reason = reason;
    return d;
}

IpBindingGate::IpBindingGate(GateOptions opt,
                             IdentityTransport identity,
                             OriginForwarder origin,
                             AuditLog* audit)
    : opt_(std::move(opt)),
      identity_(std::move(identity)),
      origin_(std::move(origin)),
      audit_(audit) {}

GateDecision IpBindingGate::evaluate(const httplib::Request& req) const {
    GateDecision d;

    // ---------------------------------------------------------------------
    // 1) Credential: Cookie header -> CF_Authorization
    // ---------------------------------------------------------------------
    std::string token;
    const CredentialStatus cs = extract_auth_token(req, token);
    if (cs != CredentialStatus::Ok) {
        return deny(d, GateFailure::MissingCredential, credential_status_code(cs));
    }
    d.token_ref = token_ref(token);

    // ---------------------------------------------------------------------
    // 2) Observed client address
    // ---------------------------------------------------------------------
    d.client_ip = req.get_header_value(opt_.client_ip_header.c_str());
    if (d.client_ip.empty()) {
        return deny(d, GateFailure::MissingClientAddress, "no_client_ip_header");
    }

    // ---------------------------------------------------------------------
    // 3) Same-host identity lookup
    //    Host is client-controlled; only configured hosts are looked up.
    // ---------------------------------------------------------------------
    d.hostname = host_without_port(req.get_header_value("Host"));
    if (d.hostname.empty()) {
        return deny(d, GateFailure::MissingHost, "no_host");
    }
    if (!host_allowed_(d.hostname)) {
        return deny(d, GateFailure::HostNotAllowed, "host_not_allowed");
    }

    const IdentityLookupResult id = resolve_identity(identity_, d.hostname, token);
    d.lookup_status = id.http_status;
    d.detail = id.detail;

    switch (id.status) {
        case IdentityStatus::Ok:
            break;
        case IdentityStatus::Rejected:
            return deny(d, GateFailure::IdentityLookupRejected, identity_status_code(id.status));
        case IdentityStatus::Malformed:
            return deny(d, GateFailure::IdentityMalformed, identity_status_code(id.status));
        case IdentityStatus::TransportFailure:
            d.verdict = Verdict::Deny;
            d.failure = GateFailure::TransportFailure;
            d.status = 500;
            d.body = kBodyInternalError;
            d.reason = identity_status_code(id.status);
            return d;
    }

    d.identity_ip = id.record.ip;
    d.email = id.record.email;

    // ---------------------------------------------------------------------
    // 4) Compare
    // ---------------------------------------------------------------------
    if (compare_bound_address(d.client_ip, d.identity_ip) != Verdict::Admit) {
        return deny(d, GateFailure::AddressMismatch, "ip_mismatch", kBodyMismatch);
    }

    d.verdict = Verdict::Admit;
    d.failure = GateFailure::None;
    d.status = 0;
    d.reason = "ip_match";
    return d;
}

bool IpBindingGate::host_allowed_(const std::string& hostname) const {
    return std::find(opt_.allowed_hosts.begin(), opt_.allowed_hosts.end(), hostname) !=
           opt_.allowed_hosts.end();
}

void IpBindingGate::handle(const httplib::Request& req, httplib::Response& res) const {
    GateDecision d;
    try {
        d = evaluate(req);
    } catch (const std::exception& e) {
        std::cerr << "[gate] ERROR: evaluation failed: " << e.what() << std::endl;
        reply_text(res, 500, kBodyInternalError);
        return;
    }

    record_(req, d);

    if (d.verdict != Verdict::Admit) {
        reply_text(res, d.status, d.body);
        return;
    }

    std::string err;
    bool ok = false;
    if (origin_) {
        try {
            ok = origin_(req, res, err);
        } catch (const std::exception& e) {
            err = e.what();
        }
    } else {
        err = "no origin configured";
    }

    if (!ok) {
        std::cerr << "[origin] ERROR: " << err << std::endl;

        if (audit_ && audit_->enabled(AuditLog::Level::SECURITY)) {
            AuditEvent ev;
            ev.event = "gate.origin_error";
            ev.outcome = "fail";
            ev.f["host"] = d.hostname;
            ev.f["method"] = req.method;
            ev.f["path"] = shorten(req.path);
            ev.f["error"] = shorten(err, 160);
            if (!audit_->append(ev, AuditLog::Level::SECURITY))
                std::cerr << "[audit] WARNING: append failed: " << audit_->jsonl_path() << std::endl;
        }

        // Drop anything a partial forward may have left behind
        res.headers.clear();
        reply_text(res, 502, kBodyBadGateway);
    }
}

void IpBindingGate::record_(const httplib::Request& req, const GateDecision& d) const {
    switch (d.failure) {
        case GateFailure::None:
            break;
        case GateFailure::IdentityLookupRejected:
            std::cerr << "[gate] identity lookup failed status=" << d.lookup_status
                      << " host=" << d.hostname << std::endl;
            break;
        case GateFailure::IdentityMalformed:
            std::cerr << "[gate] " << d.detail << " host=" << d.hostname << std::endl;
            break;
        case GateFailure::HostNotAllowed:
            std::cerr << "[gate] deny reason=host_not_allowed host=" << d.hostname << std::endl;
            break;
        case GateFailure::AddressMismatch:
            std::cerr << "[gate] ip mismatch: client=" << d.client_ip
                      << " identity=" << d.identity_ip << std::endl;
            break;
        case GateFailure::TransportFailure:
            std::cerr << "[gate] ERROR: identity check failed: " << d.detail << std::endl;
            break;
        default:
            std::cerr << "[gate] deny reason=" << d.reason << std::endl;
            break;
    }

    if (!audit_) return;

    AuditEvent ev;
    AuditLog::Level level = AuditLog::Level::SECURITY;
    if (d.verdict == Verdict::Admit) {
        ev.event = "gate.admit";
        ev.outcome = "ok";
        level = AuditLog::Level::INFO;
    } else if (d.failure == GateFailure::TransportFailure) {
        ev.event = "gate.lookup_error";
        ev.outcome = "fail";
    } else {
        ev.event = "gate.deny";
        ev.outcome = "deny";
    }
    if (!audit_->enabled(level)) return;

    ev.f["reason"] = d.reason;
    ev.f["method"] = req.method;
    ev.f["path"] = shorten(req.path);
    if (!d.hostname.empty()) ev.f["host"] = d.hostname;
    if (!d.client_ip.empty()) ev.f["client_ip"] = d.client_ip;
    if (!d.identity_ip.empty()) ev.f["identity_ip"] = d.identity_ip;
    if (!d.email.empty()) ev.f["email"] = d.email;
    if (!d.token_ref.empty()) ev.f["token_sha256"] = d.token_ref;
    if (d.lookup_status != 0) ev.f["lookup_status"] = std::to_string(d.lookup_status);
    if (d.failure == GateFailure::TransportFailure) ev.f["error"] = shorten(d.detail, 160);

    if (!audit_->append(ev, level))
        std::cerr << "[audit] WARNING: append failed: " << audit_->jsonl_path() << std::endl;
}

void install_gate_routes(httplib::Server& srv, const IpBindingGate& gate) {
    srv.set_pre_routing_handler(keep_raw_multipart_body);

    auto handler = [&gate](const httplib::Request& req, httplib::Response& res) {
        gate.handle(req, res);
    };

    // Every path, every method. HEAD is served by the Get route.
    const char* kAnyPath = R"(.*)";
    srv.Get(kAnyPath, handler);
    srv.Post(kAnyPath, handler);
    srv.Put(kAnyPath, handler);
    srv.Patch(kAnyPath, handler);
    srv.Delete(kAnyPath, handler);
    srv.Options(kAnyPath, handler);

    srv.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
            std::cerr << "[gate] ERROR: unknown failure on " << req.method << " " << req.path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[gate] ERROR: " << req.method << " " << req.path << ": " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[gate] ERROR: non-standard exception on " << req.method << " " << req.path << std::endl;
        }
        res.headers.clear();
        reply_text(res, 500, kBodyInternalError);
    });
}

} // namespace ipgate
