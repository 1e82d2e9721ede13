#pragma once
#include <string>

#include "httplib.h"

namespace ipgate {

// True for headers that describe one hop's framing (or were injected by the
// httplib server runtime) and therefore are regenerated instead of copied.
bool is_hop_header(const std::string& name);

// Carries a masked multipart Content-Type from keep_raw_multipart_body() to
// OriginProxy::forward(). Stripped from inbound requests, never forwarded.
extern const char* const kRawBodyContentTypeHeader;

/*
Server pre-routing handler.

httplib::Server parses a multipart/form-data body into req.files and leaves
req.body empty, which would forward an upload with no content. Before the body
is read, this swaps such a Content-Type for application/octet-stream and keeps
the original in kRawBodyContentTypeHeader. The body then arrives in req.body
byte for byte, and forward() puts the original Content-Type back.

Always returns Unhandled.
*/
httplib::Server::HandlerResponse keep_raw_multipart_body(const httplib::Request& req,
                                                         httplib::Response& res);

/*
OriginProxy
===========

Forwards an admitted request to the configured origin and copies the origin's
answer back verbatim: status, headers and body. The gate does not rewrite the
method, target, headers or body in either direction.

- Bodies are forwarded as read, multipart included (see keep_raw_multipart_body).
- Content is not decompressed.
- Origin redirects are returned to the caller, not followed.
- One httplib::Client per forwarded request.
*/
class OriginProxy {
public:
    OriginProxy(std::string origin_url, int timeout_ms);

    // false = origin unreachable (out_err set); `out` is untouched in that case.
    bool forward(const httplib::Request& in, httplib::Response& out, std::string& out_err) const;

private:
    std::string origin_url_;
    int timeout_ms_;
};

} // namespace ipgate
