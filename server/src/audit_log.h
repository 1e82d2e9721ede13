#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace ipgate {

/*
AuditEvent
==========

One gate decision (or lifecycle event) recorded in the audit log.

All fields are strings so every JSONL line has the same flat shape.

IMPORTANT:
- Never store the raw CF_Authorization token or the Cookie header here.
- Refer to a token by its digest (see audit_fields.h).
*/
struct AuditEvent {
    // ISO-8601 UTC with milliseconds, e.g. 2026-01-19T12:34:56.123Z.
    // Stamped by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>", e.g. "gate.admit", "gate.deny", "gate.lookup_error"
    std::string event;

    // "ok" | "deny" | "fail"
    std::string outcome;

    // Flat context: reason, client_ip, identity_ip, host, method, path, token_sha256...
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL log.

Each line carries:
- prev_hash : line_hash of the previous line (64 zeros for the first line)
- line_hash : SHA-256(prev_hash + json_without_line_hash)

Editing, inserting, deleting or reordering lines breaks the chain from that
point on. This is tamper evidence only: whoever can rewrite both the JSONL
file and the state file can rewrite history.
*/
class AuditLog {
public:
    // Ordering: DEBUG < INFO < ADMIN < SECURITY.
    // An event is written when its level >= min level.
    enum class Level : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    AuditLog(std::string jsonl_path, std::string state_path);

    // Thread-safe; appends are serialized to keep the chain linear.
    // Returns false when the event was filtered out or could not be written.
    bool append(const AuditEvent& e, Level level);

    // Accepts SECURITY/ADMIN/INFO/DEBUG (case-insensitive). Returns false if invalid.
    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;
    bool enabled(Level level) const;

    const std::string& jsonl_path() const { return jsonl_path_; }

    // SHA-256 as lowercase hex (OpenSSL). Integrity only.
    static std::string sha256_hex(const std::string& s);

    // Recompute the chain over a JSONL file. Returns the number of verified
    // lines, or -1 with out_error set on the first broken line.
    static long verify_file(const std::string& jsonl_path, std::string* out_error);

private:
    std::atomic<int> min_level_{static_cast<int>(Level::ADMIN)};

    std::string jsonl_path_;
    std::string state_path_;

    std::mutex mu_;

    // Last committed line_hash, or 64 zeros when the state file is missing/invalid.
    std::string load_prev_hash_();
    bool store_prev_hash_(const std::string& h);

    static std::string json_escape_(const std::string& s);

    // Serializes e with the given prev_hash. When line_hash is non-null it is
    // inserted after prev_hash; the hash preimage is always built without it.
    static std::string serialize_(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  const std::string* line_hash);
};

} // namespace ipgate
