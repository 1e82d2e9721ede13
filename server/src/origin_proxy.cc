#include "origin_proxy.h"
#include "ipgate_util.h"

#include <chrono>

namespace ipgate {

const char* const kRawBodyContentTypeHeader = "X-Ipgate-Raw-Content-Type";

bool is_hop_header(const std::string& name) {
    const std::string n = lower_ascii(name);
    return n == "content-length" ||
           n == "transfer-encoding" ||
           n == "connection" ||
           n == "keep-alive" ||
           // added to req.headers by httplib::Server
           n == "remote_addr" ||
           n == "remote_port" ||
           n == "local_addr" ||
           n == "local_port" ||
           n == lower_ascii(kRawBodyContentTypeHeader);
}

httplib::Server::HandlerResponse keep_raw_multipart_body(const httplib::Request& req,
                                                         httplib::Response& /*res*/) {
    // The server passes its own non-const Request; the handler signature is const only.
    auto& headers = const_cast<httplib::Request&>(req).headers;

    // A client must not be able to choose the forwarded Content-Type this way.
    headers.erase(kRawBodyContentTypeHeader);

    if (req.is_multipart_form_data()) {
        auto it = headers.find("Content-Type");
        if (it != headers.end()) {
            std::string original = it->second;
            it->second = "application/octet-stream";
            headers.emplace(kRawBodyContentTypeHeader, std::move(original));
        }
    }
    return httplib::Server::HandlerResponse::Unhandled;
}

OriginProxy::OriginProxy(std::string origin_url, int timeout_ms)
    : origin_url_(std::move(origin_url)), timeout_ms_(timeout_ms) {}

bool OriginProxy::forward(const httplib::Request& in, httplib::Response& out, std::string& out_err) const {
    httplib::Client cli(origin_url_);
    if (!cli.is_valid()) {
        out_err = "invalid origin url: " + origin_url_;
        return false;
    }

    const auto timeout = std::chrono::milliseconds(timeout_ms_);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
    cli.set_follow_location(false);
    cli.set_decompress(false);
    cli.set_url_encode(false);   // target is forwarded exactly as received
    cli.set_keep_alive(false);

    httplib::Request up;
    up.method = in.method;
    up.path = in.target.empty() ? in.path : in.target;
    up.body = in.body;

    const std::string raw_content_type = in.get_header_value(kRawBodyContentTypeHeader);
    for (const auto& kv : in.headers) {
        if (is_hop_header(kv.first)) continue;
        if (!raw_content_type.empty() && lower_ascii(kv.first) == "content-type") continue;
        up.headers.emplace(kv.first, kv.second);
    }
    if (!raw_content_type.empty()) up.headers.emplace("Content-Type", raw_content_type);

    auto res = cli.send(up);
    if (!res) {
        out_err = "origin transport error: " + httplib::to_string(res.error());
        return false;
    }

    out.status = res->status;
    out.reason = res->reason;
    for (const auto& kv : res->headers) {
        if (is_hop_header(kv.first)) continue;
        out.headers.emplace(kv.first, kv.second);
    }
    out.body = std::move(res->body);
    return true;
}

} // namespace ipgate
