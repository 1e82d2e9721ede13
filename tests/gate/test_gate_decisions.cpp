// tests/gate/test_gate_decisions.cpp
//
// Gate decisions with a stubbed identity service and a stubbed origin.
//
// What it tests:
// 1) each short-circuit (no Cookie, no CF_Authorization, no CF-Connecting-IP, no Host,
//    Host not on the allow-list) answers 403 "Forbidden" without calling the identity service
// 2) lookup 401 / 200 {} -> 403 "Forbidden"; transport failure -> 500
// 3) address mismatch -> 403 "Forbidden)"; exact match -> origin response unmodified
// 4) origin unreachable after admit -> 502
// 5) identical inputs give identical results
// 6) audit events are chained and tamper-evident, and never contain the token

#include <sodium.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "httplib.h"

#include "audit_log.h"
#include "gate.h"
#include "ip_binding.h"

static int g_failures = 0;

static void expect(bool ok, const std::string& what) {
    if (!ok) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

// Identity stub: token -> canned reply. Counts calls.
struct StubIdentity {
    int calls = 0;
    std::string last_host;
    std::string last_cookie;

    ipgate::IdentityHttpReply answer(const std::string& host, const std::string& cookie) {
        calls++;
        last_host = host;
        last_cookie = cookie;

        ipgate::IdentityHttpReply r;
        r.transport_ok = true;
        if (cookie == "CF_Authorization=good") {
            r.status = 200;
            r.body = R"({"ip":"203.0.113.7","email":"alice@example.com"})";
        } else if (cookie == "CF_Authorization=expired") {
            r.status = 401;
            r.body = R"({"ip":"203.0.113.7"})";
        } else if (cookie == "CF_Authorization=noip") {
            r.status = 200;
            r.body = "{}";
        } else if (cookie == "CF_Authorization=down") {
            r.transport_ok = false;
            r.error = "Connection";
        } else {
            r.status = 403;
        }
        return r;
    }
};

// Origin stub: fixed response with headers the gate must not touch.
struct StubOrigin {
    int calls = 0;
    bool reachable = true;

    bool forward(const httplib::Request& req, httplib::Response& res, std::string& err) {
        calls++;
        if (!reachable) {
            err = "Connection";
            return false;
        }
        res.status = 207;
        res.set_header("X-Origin", "yes");
        res.set_header("Set-Cookie", "origin=1");
        res.body = "origin saw " + req.method + " " + req.path;
        return true;
    }
};

static httplib::Request make_req(const std::string& cookie, const std::string& client_ip,
                                 const std::string& host = "app.example.com") {
    httplib::Request req;
    req.method = "GET";
    req.path = "/dashboard";
    if (!cookie.empty()) req.headers.emplace("Cookie", cookie);
    if (!client_ip.empty()) req.headers.emplace("CF-Connecting-IP", client_ip);
    if (!host.empty()) req.headers.emplace("Host", host);
    return req;
}

static ipgate::GateOptions app_options() {
    ipgate::GateOptions opt;
    opt.allowed_hosts = {"app.example.com"};
    return opt;
}

static std::string slurp(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    using ipgate::GateFailure;
    using ipgate::Verdict;

    StubIdentity ids;
    StubOrigin origin;

    ipgate::IpBindingGate gate(
        app_options(),
        [&ids](const std::string& h, const std::string& c) { return ids.answer(h, c); },
        [&origin](const httplib::Request& q, httplib::Response& s, std::string& e) { return origin.forward(q, s, e); },
        nullptr);

    auto run = [&](const httplib::Request& req) {
        httplib::Response res;
        gate.handle(req, res);
        return res;
    };

    // ---- short-circuits: never reach the identity service ----
    {
        ids.calls = 0;

        auto d = gate.evaluate(make_req("", "203.0.113.7"));
        expect(d.failure == GateFailure::MissingCredential, "no Cookie header -> MissingCredential");
        expect(d.reason == "no_cookie_header", "no Cookie header reason");

        d = gate.evaluate(make_req("a=1; b=2", "203.0.113.7"));
        expect(d.failure == GateFailure::MissingCredential, "no CF_Authorization -> MissingCredential");
        expect(d.reason == "no_auth_cookie", "no CF_Authorization reason");

        d = gate.evaluate(make_req("CF_Authorization=good", ""));
        expect(d.failure == GateFailure::MissingClientAddress, "no CF-Connecting-IP -> MissingClientAddress");

        d = gate.evaluate(make_req("CF_Authorization=good", "203.0.113.7", ""));
        expect(d.failure == GateFailure::MissingHost, "no Host -> MissingHost");

        // Host is chosen by the client: a foreign Host must never steer the lookup
        d = gate.evaluate(make_req("CF_Authorization=good", "203.0.113.7", "evil.example.net"));
        expect(d.failure == GateFailure::HostNotAllowed, "foreign Host -> HostNotAllowed");
        expect(d.reason == "host_not_allowed", "foreign Host reason");
        expect(d.status == 403 && d.body == "Forbidden", "foreign Host -> 403 Forbidden");

        d = gate.evaluate(make_req("CF_Authorization=good", "203.0.113.7", "app.example.com.evil.net"));
        expect(d.failure == GateFailure::HostNotAllowed, "suffixed Host not allowed");

        d = gate.evaluate(make_req("CF_Authorization=good", "203.0.113.7", "example.com"));
        expect(d.failure == GateFailure::HostNotAllowed, "parent domain not allowed");

        expect(ids.calls == 0, "short-circuits made no lookup");

        for (const auto& req : {make_req("", "203.0.113.7"),
                                make_req("a=1", "203.0.113.7"),
                                make_req("CF_Authorization=good", ""),
                                make_req("CF_Authorization=good", "203.0.113.7", "evil.example.net")}) {
            auto res = run(req);
            expect(res.status == 403, "short-circuit status 403");
            expect(res.body == "Forbidden", "short-circuit body Forbidden");
        }
        expect(origin.calls == 0, "short-circuits never reach origin");
    }

    // ---- lookup outcomes ----
    {
        ids.calls = 0;
        auto res = run(make_req("CF_Authorization=expired", "203.0.113.7"));
        expect(res.status == 403 && res.body == "Forbidden", "lookup 401 -> 403 Forbidden");
        expect(ids.calls == 1, "one lookup per request");
        expect(ids.last_host == "app.example.com", "lookup on same host");

        res = run(make_req("CF_Authorization=noip", "203.0.113.7"));
        expect(res.status == 403 && res.body == "Forbidden", "lookup {} -> 403 Forbidden");

        res = run(make_req("CF_Authorization=down", "203.0.113.7"));
        expect(res.status == 500, "transport failure -> 500");
        expect(res.body == "Internal Server Error", "transport failure body");

        auto d = gate.evaluate(make_req("CF_Authorization=down", "203.0.113.7"));
        expect(d.failure == GateFailure::TransportFailure, "transport failure classified");

        expect(origin.calls == 0, "failed lookups never reach origin");
    }

    // ---- comparison ----
    {
        auto res = run(make_req("CF_Authorization=good", "198.51.100.9"));
        expect(res.status == 403, "mismatch -> 403");
        expect(res.body == "Forbidden)", "mismatch body keeps trailing paren");
        expect(origin.calls == 0, "mismatch never reaches origin");

        auto d = gate.evaluate(make_req("CF_Authorization=good", "198.51.100.9"));
        expect(d.failure == GateFailure::AddressMismatch, "mismatch classified");
        expect(d.client_ip == "198.51.100.9" && d.identity_ip == "203.0.113.7", "mismatch context kept");

        res = run(make_req("a=1; CF_Authorization=good; b=x=y", "203.0.113.7", "App.Example.com:443"));
        expect(origin.calls == 1, "match forwards exactly once");
        expect(ids.last_host == "app.example.com", "host normalized for lookup");
        expect(res.status == 207, "origin status passed through");
        expect(res.get_header_value("X-Origin") == "yes", "origin header passed through");
        expect(res.get_header_value("Set-Cookie") == "origin=1", "origin Set-Cookie passed through");
        expect(res.body == "origin saw GET /dashboard", "origin body passed through");
    }

    // Exact string comparison only
    expect(ipgate::compare_bound_address("203.0.113.7", "203.0.113.7") == Verdict::Admit, "equal -> admit");
    expect(ipgate::compare_bound_address("2001:db8::1", "2001:0db8::1") == Verdict::Deny,
           "no ipv6 canonicalization");
    expect(ipgate::compare_bound_address("2001:DB8::1", "2001:db8::1") == Verdict::Deny, "case-sensitive");
    expect(ipgate::compare_bound_address("203.0.113.7 ", "203.0.113.7") == Verdict::Deny, "no trimming");
    expect(ipgate::compare_bound_address("", "") == Verdict::Deny, "empty never admits");

    // ---- origin down after admit ----
    {
        origin.reachable = false;
        auto res = run(make_req("CF_Authorization=good", "203.0.113.7"));
        expect(res.status == 502, "origin down -> 502");
        expect(res.body == "Bad Gateway", "origin down body");
        origin.reachable = true;
    }

    // ---- idempotence ----
    {
        const auto req = make_req("CF_Authorization=good", "198.51.100.9");
        auto d1 = gate.evaluate(req);
        auto d2 = gate.evaluate(req);
        expect(d1.verdict == d2.verdict && d1.failure == d2.failure && d1.status == d2.status &&
               d1.body == d2.body, "same inputs, same decision");

        auto r1 = run(make_req("CF_Authorization=good", "203.0.113.7"));
        auto r2 = run(make_req("CF_Authorization=good", "203.0.113.7"));
        expect(r1.status == r2.status && r1.body == r2.body, "same inputs, same response");
    }

    // ---- empty allow-list admits nothing ----
    {
        ids.calls = 0;
        ipgate::IpBindingGate closed(
            ipgate::GateOptions{},
            [&ids](const std::string& h, const std::string& c) { return ids.answer(h, c); },
            [&origin](const httplib::Request& q, httplib::Response& s, std::string& e) { return origin.forward(q, s, e); },
            nullptr);
        auto d = closed.evaluate(make_req("CF_Authorization=good", "203.0.113.7"));
        expect(d.failure == GateFailure::HostNotAllowed, "empty allow-list denies");
        expect(ids.calls == 0, "empty allow-list made no lookup");
    }

    // ---- custom client address header ----
    {
        ipgate::GateOptions opt = app_options();
        opt.client_ip_header = "X-Real-IP";
        ipgate::IpBindingGate g2(
            opt,
            [&ids](const std::string& h, const std::string& c) { return ids.answer(h, c); },
            [&origin](const httplib::Request& q, httplib::Response& s, std::string& e) { return origin.forward(q, s, e); },
            nullptr);

        auto req = make_req("CF_Authorization=good", "203.0.113.7");
        expect(g2.evaluate(req).failure == GateFailure::MissingClientAddress,
               "configured header replaces CF-Connecting-IP");
        req.headers.emplace("X-Real-IP", "203.0.113.7");
        expect(g2.evaluate(req).verdict == Verdict::Admit, "configured header admits");
    }

    // ---- audit ----
    {
        const auto dir = std::filesystem::temp_directory_path() /
                         ("ipgate_test_audit_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        const std::string jsonl = (dir / "a.jsonl").string();
        ipgate::AuditLog audit(jsonl, (dir / "a.state").string());
        expect(audit.set_min_level_str("info"), "min level info accepted");
        expect(!audit.set_min_level_str("verbose"), "unknown level rejected");
        expect(audit.min_level_str() == "INFO", "min level stays INFO");

        ipgate::IpBindingGate audited(
            app_options(),
            [&ids](const std::string& h, const std::string& c) { return ids.answer(h, c); },
            [&origin](const httplib::Request& q, httplib::Response& s, std::string& e) { return origin.forward(q, s, e); },
            &audit);

        httplib::Response res;
        audited.handle(make_req("CF_Authorization=good", "198.51.100.9"), res);   // deny
        res = httplib::Response{};
        audited.handle(make_req("CF_Authorization=good", "203.0.113.7"), res);    // admit
        res = httplib::Response{};
        audited.handle(make_req("CF_Authorization=down", "203.0.113.7"), res);    // lookup error

        std::string err;
        expect(ipgate::AuditLog::verify_file(jsonl, &err) == 3, "three chained lines verify: " + err);

        const std::string text = slurp(jsonl);
        expect(text.find("\"gate.deny\"") != std::string::npos, "deny recorded");
        expect(text.find("\"gate.admit\"") != std::string::npos, "admit recorded at INFO");
        expect(text.find("\"gate.lookup_error\"") != std::string::npos, "lookup error recorded");
        expect(text.find("\"ip_mismatch\"") != std::string::npos, "mismatch reason recorded");
        expect(text.find("CF_Authorization=good") == std::string::npos, "cookie never logged");
        expect(text.find("\"good\"") == std::string::npos, "raw token never logged");

        // Default min level (ADMIN) drops admits
        expect(audit.set_min_level_str("ADMIN"), "back to ADMIN");
        res = httplib::Response{};
        audited.handle(make_req("CF_Authorization=good", "203.0.113.7"), res);
        expect(ipgate::AuditLog::verify_file(jsonl, &err) == 3, "admit filtered at ADMIN");

        // Tamper: flip one character in the first line
        std::string tampered = text;
        auto p = tampered.find("198.51.100.9");
        if (p != std::string::npos) tampered[p] = '2';
        {
            std::ofstream o(jsonl, std::ios::trunc);
            o << tampered;
        }
        expect(ipgate::AuditLog::verify_file(jsonl, &err) == -1, "tampered log fails verification");
        expect(err.find("line 1") == 0, "tamper located at line 1");

        std::filesystem::remove_all(dir);
    }

    if (g_failures) {
        std::cerr << g_failures << " failure(s)\n";
        return 1;
    }
    std::cout << "OK: gate decision tests passed\n";
    return 0;
}
