#pragma once
#include <functional>
#include <string>
#include <vector>

#include "httplib.h"

#include "identity_lookup.h"
#include "ip_binding.h"

namespace ipgate {

class AuditLog;

// Fixed response bodies. kBodyMismatch keeps its stray ')' on purpose:
// clients in the field match on it.
extern const char* const kBodyForbidden;
extern const char* const kBodyMismatch;
extern const char* const kBodyInternalError;
extern const char* const kBodyBadGateway;

enum class GateFailure {
    None,
    MissingCredential,
    MissingClientAddress,
    MissingHost,
    HostNotAllowed,
    IdentityLookupRejected,
    IdentityMalformed,
    AddressMismatch,
    TransportFailure,
};

const char* gate_failure_code(GateFailure f);

/*
Result of evaluating one request. Pure data: evaluate() performs the identity
lookup but never writes a response and never contacts the origin.
*/
struct GateDecision {
    Verdict verdict = Verdict::Deny;
    GateFailure failure = GateFailure::None;

    // Rejection response (unused on Admit)
    int status = 403;
    std::string body;

    // Context for logs/audit
    std::string reason;        // finer-grained than failure, e.g. "no_cookie_header"
    std::string hostname;
    std::string client_ip;
    std::string identity_ip;
    std::string email;
    std::string token_ref;     // digest, never the token
    int lookup_status = 0;
    std::string detail;
};

// Forwards an admitted request. false = origin unreachable (out_err set).
using OriginForwarder =
    std::function<bool(const httplib::Request& req, httplib::Response& res, std::string& out_err)>;

struct GateOptions {
    std::string client_ip_header = "CF-Connecting-IP";

    // Normalized hostnames (see host_without_port). Empty admits nothing.
    std::vector<std::string> allowed_hosts;
};

/*
IpBindingGate
=============

The per-request decision:

  Cookie header -> CF_Authorization token
               -> observed client address (CF-Connecting-IP)
               -> Host on the allow-list
               -> identity lookup on that host
               -> exact address comparison
               -> Admit (forward to origin) | Deny (403) | lookup failure (500)

Holds only immutable collaborators, so one instance serves all worker threads.
The audit log is optional (nullptr in tests) and serializes its own appends.
*/
class IpBindingGate {
public:
    IpBindingGate(GateOptions opt,
                  IdentityTransport identity,
                  OriginForwarder origin,
                  AuditLog* audit);

    GateDecision evaluate(const httplib::Request& req) const;

    // evaluate(), then exactly one response: the origin's, or a fixed rejection.
    void handle(const httplib::Request& req, httplib::Response& res) const;

private:
    GateOptions opt_;
    IdentityTransport identity_;
    OriginForwarder origin_;
    AuditLog* audit_;

    bool host_allowed_(const std::string& hostname) const;
    void record_(const httplib::Request& req, const GateDecision& d) const;
};

// Writes a text/plain rejection.
void reply_text(httplib::Response& res, int status, const std::string& body);

// Wires the gate into a server: every method on every path, raw request bodies
// (multipart included), and a 500 for anything a handler throws.
void install_gate_routes(httplib::Server& srv, const IpBindingGate& gate);

} // namespace ipgate
