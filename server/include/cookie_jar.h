#pragma once
#include <string>
#include <unordered_map>

#include "httplib.h"

namespace ipgate {

// Name of the cookie carrying the Access authorization token.
extern const char* const kAuthCookieName;

// name -> value, case-sensitive names, last duplicate wins.
using CookieJar = std::unordered_map<std::string, std::string>;

/*
Parse a raw Cookie request header.

Rules:
- split on ';'
- trim ASCII whitespace around each entry
- split on the FIRST '=' only ("b=x=y" -> name "b", value "x=y")
- an entry without '=' is a name with an empty value
- entries with an empty name are dropped
*/
CookieJar parse_cookie_header(const std::string& header);

enum class CredentialStatus {
    Ok,
    NoCookieHeader,   // Cookie header absent or empty
    NoAuthCookie,     // header present, CF_Authorization absent or empty
};

// Short reason code for logs/audit ("ok", "no_cookie_header", "no_auth_cookie").
const char* credential_status_code(CredentialStatus s);

// Pull the authorization token out of the request's Cookie header.
// out_token is only written on Ok.
CredentialStatus extract_auth_token(const httplib::Request& req, std::string& out_token);

// Same, from an already-fetched header value (nullptr = header absent).
CredentialStatus extract_auth_token(const std::string* cookie_header, std::string& out_token);

} // namespace ipgate
