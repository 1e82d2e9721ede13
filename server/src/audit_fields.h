#pragma once
#include <string>

#include "ipgate_util.h"

namespace ipgate {

    // Only non-secret metadata goes into audit fields.
    //
    // OK to log:
    /// - client ip / identity ip (the values being compared)
    /// - host, method, shortened path
    /// - lookup HTTP status, reason codes
    /// - email / user_uuid from the identity record
    /// - token_ref() digest
    ///
    /// NOT OK:
    /// - the CF_Authorization value
    /// - the Cookie header
    ///

    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

    // Stable short reference to a bearer token: first 16 hex chars of SHA-256.
    inline std::string token_ref(const std::string& token) {
        if (token.empty()) return "";
        return sha256_hex_sodium(token).substr(0, 16);
    }

} // namespace ipgate
