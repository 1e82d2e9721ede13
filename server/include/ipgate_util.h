#pragma once
#include <string>

namespace ipgate {

    std::string now_iso_utc();

    std::string lower_ascii(std::string s);

    // Trims ASCII whitespace (space, tab, CR, LF, VT, FF) on both ends.
    std::string trim_ascii_ws(const std::string& s);

    // SHA-256 of s as lowercase hex (libsodium). Used to refer to tokens in logs.
    std::string sha256_hex_sodium(const std::string& s);

    // Hostname part of a Host header: port removed, lowercased.
    // "[::1]:8080" -> "[::1]", "Example.COM:443" -> "example.com".
    std::string host_without_port(const std::string& host_header);

} // namespace ipgate
