#pragma once
#include <functional>
#include <string>

namespace ipgate {

// Path of the Access identity endpoint, always queried on the inbound request's host.
extern const char* const kIdentityPath;

// What the transport saw. transport_ok=false means no HTTP response at all
// (DNS, connect, TLS, timeout); status/body are meaningless then.
struct IdentityHttpReply {
    bool transport_ok = false;
    int status = 0;
    std::string body;
    std::string error;
};

// Performs GET {scheme}://{hostname}[:port]/cdn-cgi/access/get-identity with the
// given Cookie header. Injected so the resolver can be exercised without a network.
using IdentityTransport =
    std::function<IdentityHttpReply(const std::string& hostname, const std::string& cookie_header)>;

struct IdentityRecord {
    std::string ip;         // required, non-empty
    std::string email;      // optional, audit context only
    std::string user_uuid;  // optional, audit context only
};

enum class IdentityStatus {
    Ok,
    Rejected,          // lookup answered non-2xx
    Malformed,         // 2xx but no usable "ip" claim
    TransportFailure,  // lookup could not be completed
};

const char* identity_status_code(IdentityStatus s);

struct IdentityLookupResult {
    IdentityStatus status = IdentityStatus::TransportFailure;
    int http_status = 0;
    IdentityRecord record;   // valid only when status == Ok
    std::string detail;      // human-readable reason for logs
};

// Typed decode of a lookup reply. Never throws.
IdentityLookupResult classify_identity_reply(const IdentityHttpReply& reply);

// One lookup for one token against the same host. No retries.
IdentityLookupResult resolve_identity(const IdentityTransport& transport,
                                      const std::string& hostname,
                                      const std::string& token);

struct IdentityEndpointOptions {
    std::string scheme = "https";   // "https" in production; "http" for loopback tests
    int port = 0;                   // 0 = scheme default
    int timeout_ms = 5000;          // connect, read and write each
    std::string ca_file;            // empty = system trust store
};

// Production transport backed by httplib::Client.
IdentityTransport make_httplib_identity_transport(const IdentityEndpointOptions& opt);

} // namespace ipgate
