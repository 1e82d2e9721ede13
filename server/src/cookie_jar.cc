#include "cookie_jar.h"
#include "ipgate_util.h"

namespace ipgate {

/*
Cookie extraction
=================

The gate treats the Access token as an opaque bearer credential. Nothing here
decodes, validates or verifies it; the identity lookup service is the only
authority on whether a token is good.

httplib has no structured cookie API, so the header is parsed here.
We do not handle quoted values or attributes: request Cookie headers carry
plain name=value pairs.
*/

const char* const kAuthCookieName = "CF_Authorization";

CookieJar parse_cookie_header(const std::string& header) {
    CookieJar jar;

    size_t pos = 0;
    while (pos <= header.size()) {
        size_t end = header.find(';', pos);
        if (end == std::string::npos) end = header.size();

        const std::string entry = trim_ascii_ws(header.substr(pos, end - pos));
        pos = end + 1;

        const auto eq = entry.find('=');
        std::string name  = (eq == std::string::npos) ? entry : entry.substr(0, eq);
        std::string value = (eq == std::string::npos) ? std::string() : entry.substr(eq + 1);

        if (name.empty()) continue;
        jar[std::move(name)] = std::move(value);
    }

    return jar;
}

const char* credential_status_code(CredentialStatus s) {
    switch (s) {
        case CredentialStatus::Ok:             return "ok";
        case CredentialStatus::NoCookieHeader: return "no_cookie_header";
        case CredentialStatus::NoAuthCookie:   return "no_auth_cookie";
    }
    return "unknown";
}

CredentialStatus extract_auth_token(const std::string* cookie_header, std::string& out_token) {
    if (!cookie_header || cookie_header->empty()) return CredentialStatus::NoCookieHeader;

    const CookieJar jar = parse_cookie_header(*cookie_header);
    auto it = jar.find(kAuthCookieName);
    if (it == jar.end() || it->second.empty()) return CredentialStatus::NoAuthCookie;

    out_token = it->second;
    return CredentialStatus::Ok;
}

CredentialStatus extract_auth_token(const httplib::Request& req, std::string& out_token) {
    // Multiple Cookie header lines are not merged; the first one is used.
    auto it = req.headers.find("Cookie");
    if (it == req.headers.end()) return extract_auth_token(nullptr, out_token);
    return extract_auth_token(&it->second, out_token);
}

} // namespace ipgate
