#include "audit_log.h"
#include "ipgate_util.h"

#include <fstream>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace ipgate {

/*
Audit log (hash-chained JSONL)
=============================

The gate records every deny, every lookup failure and (at INFO) every admit.
Lines are self-describing so the file can be tailed, shipped, and verified
with verify_file() without any other context.

Chain:
  H_i = SHA256( H_{i-1} || JSON_i_without_line_hash )

The state file holds H_last so appends do not rescan the log. If the state
file is lost the next line starts from the zero hash and verify_file()
reports the break at that line.
*/

static const char* kLineHashKey = ",\"line_hash\":\"";
static const char* kPrevHashKey = "\"prev_hash\":\"";

static std::string to_hex(const unsigned char* p, size_t n) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.resize(n * 2);
  for (size_t i = 0; i < n; i++) {
    out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
    out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
  }
  return out;
}

static bool is_hex64(const std::string& s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!ok) return false;
  }
  return true;
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
  : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

std::string AuditLog::sha256_hex(const std::string& s) {
  unsigned char h[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
  return to_hex(h, sizeof(h));
}

bool AuditLog::set_min_level_str(const std::string& s) {
  const std::string u = lower_ascii(trim_ascii_ws(s));
  Level lvl;
  if (u == "debug") lvl = Level::DEBUG;
  else if (u == "info") lvl = Level::INFO;
  else if (u == "admin") lvl = Level::ADMIN;
  else if (u == "security") lvl = Level::SECURITY;
  else return false;

  min_level_.store(static_cast<int>(lvl));
  return true;
}

std::string AuditLog::min_level_str() const {
  switch (static_cast<Level>(min_level_.load())) {
    case Level::DEBUG:    return "DEBUG";
    case Level::INFO:     return "INFO";
    case Level::ADMIN:    return "ADMIN";
    case Level::SECURITY: return "SECURITY";
  }
  return "ADMIN";
}

bool AuditLog::enabled(Level level) const {
  return static_cast<int>(level) >= min_level_.load();
}

std::string AuditLog::load_prev_hash_() {
  std::ifstream f(state_path_);
  if (!f.good()) return std::string(64, '0');
  std::string line;
  std::getline(f, line);
  if (!is_hex64(line)) return std::string(64, '0');
  return line;
}

bool AuditLog::store_prev_hash_(const std::string& h) {
  std::ofstream f(state_path_, std::ios::trunc);
  f << h << "\n";
  f.flush();
  return f.good();
}

// Minimal escaping: we only ever emit flat objects of string values.
std::string AuditLog::json_escape_(const std::string& s) {
  std::ostringstream o;
  for (char c : s) {
    switch (c) {
      case '\"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\b': o << "\\b"; break;
      case '\f': o << "\\f"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << (int)(unsigned char)c << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

std::string AuditLog::serialize_(const AuditEvent& e,
                                 const std::string& prev_hash,
                                 const std::string* line_hash) {
  std::ostringstream js;
  js << "{"
     << "\"ts\":\"" << json_escape_(e.ts_utc) << "\""
     << ",\"event\":\"" << json_escape_(e.event) << "\""
     << ",\"outcome\":\"" << json_escape_(e.outcome) << "\""
     << "," << kPrevHashKey << prev_hash << "\"";

  if (line_hash) js << kLineHashKey << *line_hash << "\"";

  if (!e.f.empty()) {
    js << ",\"f\":{";
    bool first = true;
    for (const auto& kv : e.f) {
      if (!first) js << ",";
      first = false;
      js << "\"" << json_escape_(kv.first) << "\":"
         << "\"" << json_escape_(kv.second) << "\"";
    }
    js << "}";
  }

  js << "}";
  return js.str();
}

bool AuditLog::append(const AuditEvent& e_in, Level level) {
  if (!enabled(level)) return false;

  std::lock_guard<std::mutex> lk(mu_);

  AuditEvent e = e_in;
  if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

  const std::string prev = load_prev_hash_();

  // The preimage must not contain line_hash itself.
  const std::string without_hash = serialize_(e, prev, nullptr);
  const std::string line_hash = sha256_hex(prev + without_hash);
  const std::string line = serialize_(e, prev, &line_hash);

  std::ofstream out(jsonl_path_, std::ios::app);
  out << line << "\n";
  out.flush();
  if (!out.good()) return false;

  return store_prev_hash_(line_hash);
}

long AuditLog::verify_file(const std::string& jsonl_path, std::string* out_error) {
  auto fail = [&](long lineno, const std::string& why) -> long {
    if (out_error) *out_error = "line " + std::to_string(lineno) + ": " + why;
    return -1;
  };

  std::ifstream f(jsonl_path);
  if (!f.good()) return fail(0, "cannot open " + jsonl_path);

  std::string expected_prev(64, '0');
  std::string line;
  long n = 0;

  while (std::getline(f, line)) {
    if (line.empty()) continue;
    n++;

    const std::string prev_key(kPrevHashKey);
    auto p = line.find(prev_key);
    if (p == std::string::npos) return fail(n, "missing prev_hash");
    const std::string prev = line.substr(p + prev_key.size(), 64);
    if (prev != expected_prev) return fail(n, "prev_hash does not match previous line");

    const std::string lh_key(kLineHashKey);
    auto q = line.find(lh_key);
    if (q == std::string::npos) return fail(n, "missing line_hash");
    const std::string line_hash = line.substr(q + lh_key.size(), 64);
    if (!is_hex64(line_hash)) return fail(n, "malformed line_hash");

    // Strip `,"line_hash":"<64 hex>"` to recover the preimage.
    std::string without_hash = line;
    without_hash.erase(q, lh_key.size() + 64 + 1);

    if (sha256_hex(prev + without_hash) != line_hash) return fail(n, "line_hash mismatch");

    expected_prev = line_hash;
  }

  return n;
}

} // namespace ipgate
