#include "ipgate_util.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>
#include <sodium.h>

namespace ipgate {

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim_ascii_ws(const std::string& s) {
    auto is_ws = [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    };
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_ws((unsigned char)s[b])) b++;
    while (e > b && is_ws((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

// Requires sodium_init() to have run (main and every test binary call it first).
std::string sha256_hex_sodium(const std::string& s) {
    unsigned char h[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(h, reinterpret_cast<const unsigned char*>(s.data()), s.size());

    std::vector<char> hex(sizeof(h) * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), h, sizeof(h));
    return std::string(hex.data());
}

std::string host_without_port(const std::string& host_header) {
    std::string h = trim_ascii_ws(host_header);
    if (h.empty()) return h;

    // IPv6 literal: keep the brackets, drop anything after ']'
    if (h.front() == '[') {
        auto close = h.find(']');
        if (close == std::string::npos) return {};
        return lower_ascii(h.substr(0, close + 1));
    }

    auto colon = h.find(':');
    if (colon != std::string::npos) h.erase(colon);
    return lower_ascii(h);
}

} // namespace ipgate
