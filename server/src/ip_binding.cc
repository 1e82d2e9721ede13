#include "ip_binding.h"

#include <sodium.h>

namespace ipgate {

Verdict compare_bound_address(const std::string& observed_ip, const std::string& bound_ip) {
    if (observed_ip.empty() || bound_ip.empty()) return Verdict::Deny;
    if (observed_ip.size() != bound_ip.size()) return Verdict::Deny;

    // Constant-time over the common length
    if (sodium_memcmp(observed_ip.data(), bound_ip.data(), observed_ip.size()) != 0)
        return Verdict::Deny;

    return Verdict::Admit;
}

} // namespace ipgate
