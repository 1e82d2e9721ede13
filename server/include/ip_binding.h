#pragma once
#include <string>

namespace ipgate {

enum class Verdict { Admit, Deny };

/*
Compare the address the edge observed for this request with the address the
identity was bound to at login.

Exact byte-for-byte equality: no case folding, no IPv4/IPv6 canonicalization.
"2001:db8::1" and "2001:0db8:0:0:0:0:0:1" are different addresses here.
Both sources are formatted by the same edge, so they share one representation.

Empty inputs always deny.
*/
Verdict compare_bound_address(const std::string& observed_ip, const std::string& bound_ip);

} // namespace ipgate
