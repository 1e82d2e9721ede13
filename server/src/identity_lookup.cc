#include "identity_lookup.h"
#include "cookie_jar.h"

#include <chrono>
#include <string>

#include "httplib.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ipgate {

/*
Identity resolver
=================

The Access edge exposes /cdn-cgi/access/get-identity on every protected host.
Given the CF_Authorization cookie it answers with the identity record the
token was issued for, including the "ip" the login happened from.

Classification is fail-closed:
- no HTTP response at all             -> TransportFailure (infrastructure problem, 500)
- any non-2xx                         -> Rejected (expired/invalid token, 403)
- 2xx but body is not a JSON object
  with a non-empty string "ip"        -> Malformed (403)

The lookup is never retried and never cached.
*/

const char* const kIdentityPath = "/cdn-cgi/access/get-identity";

const char* identity_status_code(IdentityStatus s) {
    switch (s) {
        case IdentityStatus::Ok:               return "ok";
        case IdentityStatus::Rejected:         return "lookup_rejected";
        case IdentityStatus::Malformed:        return "identity_malformed";
        case IdentityStatus::TransportFailure: return "transport_failure";
    }
    return "unknown";
}

static std::string optional_string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

IdentityLookupResult classify_identity_reply(const IdentityHttpReply& reply) {
    IdentityLookupResult r;
    r.http_status = reply.status;

    if (!reply.transport_ok) {
        r.status = IdentityStatus::TransportFailure;
        r.detail = reply.error.empty() ? "identity lookup failed" : reply.error;
        return r;
    }

    if (reply.status < 200 || reply.status > 299) {
        r.status = IdentityStatus::Rejected;
        r.detail = "identity lookup failed with status: " + std::to_string(reply.status);
        return r;
    }

    // allow_exceptions=false: invalid JSON yields a discarded value instead of throwing
    const json j = json::parse(reply.body, nullptr, false);
    if (j.is_discarded()) {
        r.status = IdentityStatus::Malformed;
        r.detail = "identity response is not valid json";
        return r;
    }
    if (!j.is_object()) {
        r.status = IdentityStatus::Malformed;
        r.detail = "identity response is not a json object";
        return r;
    }

    auto it = j.find("ip");
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        r.status = IdentityStatus::Malformed;
        r.detail = "identity response missing ip claim";
        return r;
    }

    r.status = IdentityStatus::Ok;
    r.record.ip = it->get<std::string>();
    r.record.email = optional_string_field(j, "email");
    r.record.user_uuid = optional_string_field(j, "user_uuid");
    return r;
}

IdentityLookupResult resolve_identity(const IdentityTransport& transport,
                                      const std::string& hostname,
                                      const std::string& token) {
    if (!transport) {
        IdentityLookupResult r;
        r.status = IdentityStatus::TransportFailure;
        r.detail = "no identity transport configured";
        return r;
    }

    const std::string cookie = std::string(kAuthCookieName) + "=" + token;

    IdentityHttpReply reply;
    try {
        reply = transport(hostname, cookie);
    } catch (const std::exception& e) {
        reply = IdentityHttpReply{};
        reply.error = std::string("identity transport threw: ") + e.what();
    }

    return classify_identity_reply(reply);
}

IdentityTransport make_httplib_identity_transport(const IdentityEndpointOptions& opt) {
    return [opt](const std::string& hostname, const std::string& cookie_header) -> IdentityHttpReply {
        IdentityHttpReply out;

        std::string base = opt.scheme + "://" + hostname;
        if (opt.port > 0) base += ":" + std::to_string(opt.port);

        // One client per lookup: no connection state is shared between requests.
        httplib::Client cli(base);
        if (!cli.is_valid()) {
            out.error = "invalid identity endpoint: " + base;
            return out;
        }

        const auto timeout = std::chrono::milliseconds(opt.timeout_ms);
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);
        // The read timeout restarts on every recv; this bounds the whole lookup,
        // redirects included.
        cli.set_max_timeout(timeout);
        cli.set_follow_location(true);
        if (!opt.ca_file.empty()) cli.set_ca_cert_path(opt.ca_file.c_str());
        cli.enable_server_certificate_verification(true);

        httplib::Headers headers = {
            {"Cookie", cookie_header},
            {"Accept", "application/json"},
        };

        auto res = cli.Get(kIdentityPath, headers);
        if (!res) {
            out.error = "identity lookup transport error: " + httplib::to_string(res.error());
            return out;
        }

        out.transport_ok = true;
        out.status = res->status;
        out.body = res->body;
        return out;
    };
}

} // namespace ipgate
