#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"
#include "service_setup.h"

#include "caproute/catalog_import.h"
#include "caproute/errors.h"
#include "caproute/json_mini.h"
#include "caproute/serialization.h"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

#ifndef _WIN32

using namespace caproute;

namespace {

struct Response {
    int code{200};
    std::string body;
    std::string headers;
};

std::string error_body(const std::string& kind, const std::string& reason) {
    json_mini::Doc d(json_object_new_object());
    json_object_object_add(d.root, "ok", json_object_new_boolean(0));
    json_object_object_add(d.root, "error", json_object_new_string(kind.c_str()));
    if (!reason.empty()) json_object_object_add(d.root, "reason", json_object_new_string(reason.c_str()));
    return json_mini::to_string(d.root);
}

Response unavailable(const std::string& reason, int retry_after) {
    json_mini::Doc d(json_object_new_object());
    json_object_object_add(d.root, "ok", json_object_new_boolean(0));
    json_object_object_add(d.root, "error", json_object_new_string(error_kind_str(ErrorKind::SERVICE_UNAVAILABLE)));
    json_object_object_add(d.root, "reason", json_object_new_string(reason.c_str()));
    json_object_object_add(d.root, "retryAfterSeconds", json_object_new_int(retry_after));
    return Response{503, json_mini::to_string(d.root), "Retry-After: " + std::to_string(retry_after) + "\r\n"};
}

Response handle_select(Service& svc, const std::string& body) {
    SelectionRequest req;
    std::string err;
    if (!request_from_string(body, &req, &err)) {
        json_object* ap = json_object_new_object();
        json_object_object_add(ap, "reason", json_object_new_string(err.c_str()));
        audit_event(svc, "select_rejected", ap);
        return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), err)};
    }

    SelectionOutcome out = svc.gateway->select(req);

    json_object* ap = json_object_new_object();
    json_object_object_add(ap, "capability", json_object_new_string(req.capability.c_str()));
    json_object_object_add(ap, "fingerprint", json_object_new_string(out.fingerprint.c_str()));
    json_object_object_add(ap, "status", json_object_new_string(selection_status_str(out.status)));

    switch (out.status) {
        case SelectionStatus::OK: {
            json_object_object_add(ap, "tool", json_object_new_string(out.result->tool->name.c_str()));
            json_object_object_add(ap, "pattern", json_object_new_string(out.result->pattern_name.c_str()));
            json_object_object_add(ap, "fromCache", json_object_new_boolean(out.from_cache));
            json_object_object_add(ap, "stale", json_object_new_boolean(out.stale));
            if (out.result->tie_break && !out.from_cache) {
                json_object_object_add(ap, "tieBreakResolution",
                                       json_object_new_string(out.result->tie_break->resolution.c_str()));
                json_object_object_add(ap, "tieBreakElapsedMs", json_object_new_int64(out.result->tie_break->elapsed_ms));
            }
            audit_event(svc, out.stale ? "select_degraded" : "select", ap);
            return Response{200, out.result_json};
        }
        case SelectionStatus::NO_ELIGIBLE_CANDIDATE: {
            json_object_object_add(ap, "violations", json_object_new_int((int)out.violations.size()));
            audit_event(svc, "select_rejected", ap);
            json_mini::Doc d(json_object_new_object());
            json_object_object_add(d.root, "ok", json_object_new_boolean(0));
            json_object_object_add(d.root, "error",
                                   json_object_new_string(error_kind_str(ErrorKind::NO_ELIGIBLE_CANDIDATE)));
            json_object_object_add(d.root, "reason", json_object_new_string(out.reason.c_str()));
            json_object_object_add(d.root, "violations", violations_to_json(out.violations));
            return Response{422, json_mini::to_string(d.root)};
        }
        case SelectionStatus::SERVICE_UNAVAILABLE:
            json_object_object_add(ap, "retryAfterSeconds", json_object_new_int(out.retry_after_seconds));
            audit_event(svc, "select_rejected", ap);
            return unavailable(out.reason, out.retry_after_seconds);
        case SelectionStatus::INVALID_REQUEST:
            break;
    }
    json_object_object_add(ap, "reason", json_object_new_string(out.reason.c_str()));
    audit_event(svc, "select_rejected", ap);
    return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), out.reason)};
}

json_object* plan_audit_payload(const PlanResult& r) {
    json_object* ap = json_object_new_object();
    json_object_object_add(ap, "planId", json_object_new_string(r.plan_id.c_str()));
    json_object_object_add(ap, "status", json_object_new_string(plan_status_str(r.status)));
    json_object_object_add(ap, "failurePolicy", json_object_new_string(failure_policy_str(r.policy)));
    json_object_object_add(ap, "steps", json_object_new_int((int)r.steps.size()));
    json_object_object_add(ap, "durationMs", json_object_new_int64(r.duration_ms));
    return ap;
}

Response handle_execute(Service& svc, json_object* root) {
    ExecutionPlan plan;
    std::string err;
    if (!plan_from_json(root, &plan, &err))
        return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), err)};
    err = validate_plan(plan);
    if (!err.empty()) return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), err)};

    PlanResult r = svc.dispatcher->dispatch(plan);
    audit_event(svc, "execute", plan_audit_payload(r));
    json_mini::Doc d(plan_result_to_json(r));
    return Response{200, json_mini::to_string(d.root)};
}

Response handle_plan(Service& svc, json_object* root, bool execute) {
    PlanBuild b = plan_from_requests(svc, root);
    json_mini::Doc d(plan_build_to_json(b));

    if (!b.ok) {
        if (b.steps.empty()) return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), b.error)};
        int retry = 0;
        bool invalid = false;
        for (const auto& ps : b.steps) {
            if (ps.selection.status == SelectionStatus::SERVICE_UNAVAILABLE)
                retry = std::max(retry, ps.selection.retry_after_seconds);
            if (ps.selection.status == SelectionStatus::INVALID_REQUEST) invalid = true;
        }
        if (retry > 0) {
            json_object_object_add(d.root, "retryAfterSeconds", json_object_new_int(retry));
            return Response{503, json_mini::to_string(d.root), "Retry-After: " + std::to_string(retry) + "\r\n"};
        }
        return Response{invalid ? 400 : 422, json_mini::to_string(d.root)};
    }

    if (execute) {
        PlanResult r = svc.dispatcher->dispatch(b.plan);
        audit_event(svc, "execute", plan_audit_payload(r));
        json_object_object_add(d.root, "result", plan_result_to_json(r));
    } else {
        json_object* ap = json_object_new_object();
        json_object_object_add(ap, "steps", json_object_new_int((int)b.plan.steps.size()));
        audit_event(svc, "plan", ap);
    }
    return Response{200, json_mini::to_string(d.root)};
}

Response handle_telemetry(Service& svc, const std::string& body) {
    auto doc = json_mini::parse(body);
    if (!doc) return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), "body is not JSON")};

    std::vector<std::string> items;
    if (json_object_is_type(doc.root, json_type_array)) {
        size_t n = json_object_array_length(doc.root);
        for (size_t i = 0; i < n; ++i) items.push_back(json_mini::to_string(json_object_array_get_idx(doc.root, i)));
    } else {
        items.push_back(body);
    }

    size_t accepted = 0;
    size_t dropped = 0;
    json_object* errors = json_object_new_array();
    for (size_t i = 0; i < items.size(); ++i) {
        TelemetryRecord rec;
        std::string err = telemetry_from_json(items[i], &rec);
        if (!err.empty()) {
            json_object_array_add(errors, json_object_new_string(("record " + std::to_string(i) + ": " + err).c_str()));
            continue;
        }
        if (svc.telemetry->record(std::move(rec))) accepted++;
        else dropped++;
    }

    json_mini::Doc d(json_object_new_object());
    json_object_object_add(d.root, "ok", json_object_new_boolean(accepted > 0 && json_object_array_length(errors) == 0));
    json_object_object_add(d.root, "accepted", json_object_new_int64((int64_t)accepted));
    json_object_object_add(d.root, "dropped", json_object_new_int64((int64_t)dropped));
    json_object_object_add(d.root, "errors", errors);
    int code = accepted == 0 && dropped == 0 ? 400 : (accepted == 0 ? 503 : 200);
    return Response{code, json_mini::to_string(d.root)};
}

Response handle_import(Service& svc, const std::string& body, bool dry_run) {
    ImportReport r;
    try {
        r = import_tool_definition(svc.catalog->store(), body, dry_run);
    } catch (const CatalogUnavailable& e) {
        return unavailable(e.what(), svc.cfg.retry_after_base_sec);
    }

    json_object* ap = json_object_new_object();
    json_object_object_add(ap, "tool", json_object_new_string(r.tool.c_str()));
    json_object_object_add(ap, "version", json_object_new_string(r.version.c_str()));
    json_object_object_add(ap, "ok", json_object_new_boolean(r.ok));
    json_object_object_add(ap, "dryRun", json_object_new_boolean(r.dry_run));
    json_object_object_add(ap, "written", json_object_new_boolean(r.written));
    audit_event(svc, "catalog_import", ap);

    if (r.written) {
        std::string err = svc.catalog->reload();
        if (err.empty()) svc.gateway->cache().clear();
        else std::cerr << "[catalog] reload after import failed: " << err << std::endl;
    }
    if (r.ok) return Response{200, import_report_to_json(r)};
    for (const auto& i : r.issues) {
        if (i.path == "version") return Response{409, import_report_to_json(r)};
    }
    return Response{400, import_report_to_json(r)};
}

Response handle_reload(Service& svc) {
    uint64_t before = svc.catalog->generation();
    std::string err = svc.catalog->reload();
    json_object* ap = json_object_new_object();
    json_object_object_add(ap, "ok", json_object_new_boolean(err.empty()));
    if (!err.empty()) json_object_object_add(ap, "error", json_object_new_string(err.c_str()));
    audit_event(svc, "catalog_reload", ap);
    if (!err.empty()) return unavailable(err, svc.cfg.retry_after_base_sec);

    svc.gateway->cache().clear();
    std::ostringstream j;
    j << "{\"ok\":true,\"previousGeneration\":" << before << ",\"generation\":" << svc.catalog->generation() << "}";
    return Response{200, j.str()};
}

Response handle_approvals(Service& svc, const std::string& body) {
    auto doc = json_mini::parse(body);
    if (!doc || !json_object_is_type(doc.root, json_type_object))
        return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), "body must be a JSON object")};

    std::string scope = json_mini::field_string(doc.root, "scope").value_or("");
    if (scope.empty()) {
        std::string tool = json_mini::field_string(doc.root, "tool").value_or("");
        std::string pattern = json_mini::field_string(doc.root, "pattern").value_or("");
        if (tool.empty())
            return Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), "tool or scope is required")};
        scope = pattern.empty() ? tool : tool + "/" + pattern;
    }
    int64_t ttl = json_mini::field_int(doc.root, "ttlMs").value_or(60000);
    std::string host = json_mini::field_string(doc.root, "host").value_or("");
    std::string issuer = json_mini::field_string(doc.root, "issuer").value_or("operator");

    ApprovalLease l = svc.approvals.issue(scope, ttl, issuer, host);

    json_object* ap = json_object_new_object();
    json_object_object_add(ap, "scope", json_object_new_string(l.scope.c_str()));
    json_object_object_add(ap, "host", json_object_new_string(l.host.c_str()));
    json_object_object_add(ap, "issuer", json_object_new_string(l.issuer.c_str()));
    json_object_object_add(ap, "tokenHash", json_object_new_string(sha256_hex(l.token).substr(0, 16).c_str()));
    json_object_object_add(ap, "expiresMs", json_object_new_int64(l.expires_ms));
    audit_event(svc, "approval_issued", ap);

    json_mini::Doc d(approval_lease_to_json(l));
    return Response{200, json_mini::to_string(d.root)};
}

std::string stats_json(Service& svc, int active_conns) {
    GatewayStats g = svc.gateway->stats();
    CatalogAdapterStats c = svc.catalog->stats();

    std::ostringstream j;
    j << "{";
    j << "\"profile\":\"" << profile_name(svc.cfg.profile) << "\",";
    j << "\"instanceId\":\"" << json_mini::json_escape(svc.instance_id) << "\",";
    j << "\"selection\":{"
      << "\"requests\":" << g.requests << ",\"hits\":" << g.hits << ",\"misses\":" << g.misses
      << ",\"degradedServed\":" << g.degraded_served << ",\"unavailable\":" << g.unavailable
      << ",\"noEligible\":" << g.no_eligible << ",\"invalid\":" << g.invalid
      << ",\"staleResults\":" << g.stale_results << ",\"consecutiveUnavailable\":" << g.consecutive_unavailable
      << ",\"cacheEntries\":" << g.cache_entries << ",\"cacheEvictions\":" << g.cache_evictions << "},";
    j << "\"catalog\":{"
      << "\"generation\":" << c.generation << ",\"hits\":" << c.hits << ",\"misses\":" << c.misses
      << ",\"staleServed\":" << c.stale_served << ",\"storeErrors\":" << c.store_errors
      << ",\"reloads\":" << c.reloads << ",\"reloadFailures\":" << c.reload_failures
      << ",\"cachedEntries\":" << c.cached_entries << "},";
    j << "\"scoring\":{\"invocations\":" << svc.scoring.invocations() << "},";
    j << "\"tieBreak\":{\"judge\":\"" << svc.judge->name() << "\",\"escalations\":" << svc.tiebreak->escalations()
      << ",\"fallbacks\":" << svc.tiebreak->fallbacks() << ",\"judgeMsTotal\":" << svc.tiebreak->judge_ms_total()
      << "},";
    j << "\"dispatch\":{\"plans\":" << svc.dispatcher->plans_dispatched() << ",\"stepsRun\":"
      << svc.dispatcher->steps_run() << ",\"stepsFailed\":" << svc.dispatcher->steps_failed()
      << ",\"fallbackRouted\":" << svc.dispatcher->fallback_routed() << "},";
    j << "\"approvals\":{\"active\":" << svc.approvals.active_count() << ",\"issued\":"
      << svc.approvals.total_issued() << ",\"consumed\":" << svc.approvals.total_consumed()
      << ",\"rejected\":" << svc.approvals.total_rejected() << "},";
    j << "\"telemetry\":{\"recorded\":" << svc.telemetry->recorded() << ",\"dropped\":"
      << svc.telemetry->dropped() << ",\"writeErrors\":" << svc.telemetry->write_errors()
      << ",\"queued\":" << svc.telemetry->queued() << "},";
    j << "\"http\":{\"activeConnections\":" << active_conns << "}";
    j << "}";
    return j.str();
}

std::string metrics_text(Service& svc) {
    GatewayStats g = svc.gateway->stats();
    CatalogAdapterStats c = svc.catalog->stats();

    std::ostringstream m;
    auto metric = [&](const char* name, const char* type, const char* help, auto value) {
        m << "# HELP " << name << " " << help << "\n";
        m << "# TYPE " << name << " " << type << "\n";
        m << name << " " << value << "\n";
    };
    metric("caproute_selection_requests_total", "counter", "Selection requests", g.requests);
    metric("caproute_selection_cache_hits_total", "counter", "Selections answered from cache", g.hits);
    metric("caproute_selection_cache_misses_total", "counter", "Selections resolved against the catalog", g.misses);
    metric("caproute_selection_degraded_total", "counter", "Stale selections served during an outage", g.degraded_served);
    metric("caproute_selection_unavailable_total", "counter", "Selections failed with service unavailable", g.unavailable);
    metric("caproute_selection_no_eligible_total", "counter", "Selections with no eligible candidate", g.no_eligible);
    metric("caproute_selection_cache_entries", "gauge", "Selection cache size", g.cache_entries);
    metric("caproute_catalog_generation", "gauge", "Published catalog generation", c.generation);
    metric("caproute_catalog_store_errors_total", "counter", "Catalog store read failures", c.store_errors);
    metric("caproute_catalog_stale_served_total", "counter", "Catalog reads answered from last-known-good data", c.stale_served);
    metric("caproute_scoring_invocations_total", "counter", "Scoring engine invocations", svc.scoring.invocations());
    metric("caproute_tiebreak_escalations_total", "counter", "Near-ties escalated to the judge", svc.tiebreak->escalations());
    metric("caproute_tiebreak_fallbacks_total", "counter", "Tie-breaks that fell back to the ranked winner", svc.tiebreak->fallbacks());
    metric("caproute_plans_dispatched_total", "counter", "Plans dispatched", svc.dispatcher->plans_dispatched());
    metric("caproute_steps_run_total", "counter", "Plan steps executed", svc.dispatcher->steps_run());
    metric("caproute_steps_failed_total", "counter", "Plan steps that did not succeed", svc.dispatcher->steps_failed());
    metric("caproute_steps_fallback_routed_total", "counter", "Steps routed to the default backend", svc.dispatcher->fallback_routed());
    metric("caproute_approvals_active", "gauge", "Unconsumed approval leases", svc.approvals.active_count());
    metric("caproute_telemetry_recorded_total", "counter", "Telemetry records written", svc.telemetry->recorded());
    metric("caproute_telemetry_dropped_total", "counter", "Telemetry records dropped", svc.telemetry->dropped());
    return m.str();
}

} // namespace

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);

    const auto root = resolve_root(argv[0]);
    CliArgs args = parse_cli_args(argc, argv, 2, {"--host", "--port", "--catalog", "--data"});

    Service svc;
    svc.cfg = configure_from_args(root, args);
    const ServiceConfig& cfg = svc.cfg;

    // Create the server socket before any component starts a thread.
    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)cfg.port);
    if (::inet_pton(AF_INET, cfg.host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host: " << cfg.host << "\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed: " << cfg.host << ":" << cfg.port << "\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }

    std::string err = build_service(svc);
    if (!err.empty()) {
        std::cerr << "[serve] startup failed: " << err << "\n";
        shutdown_service(svc);
        ::close(sfd);
        return 2;
    }

    const bool auth_configured = !cfg.api_token.empty() || !cfg.hmac_secret.empty();
    if (!auth_configured) {
        std::cerr << "[WARN] CAPROUTE_API_TOKEN and CAPROUTE_API_HMAC_SECRET are both unset.\n";
        std::cerr << "[WARN] /execute, /catalog/*, /approvals, /shutdown will reject all requests (fail-closed).\n";
    }

    TokenBucket tb_execute;
    tb_execute.init(cfg.execute_rpm, now_ms_wall());
    NonceCache nonces;
    std::mutex http_mu; // protects nonces, tb_execute

    std::atomic<int> active_conns{0};
    std::mutex conns_mu;
    std::condition_variable conns_cv;
    std::atomic<bool> running{true};

    {
        json_object* ap = json_object_new_object();
        json_object_object_add(ap, "host", json_object_new_string(cfg.host.c_str()));
        json_object_object_add(ap, "port", json_object_new_int(cfg.port));
        json_object_object_add(ap, "profile", json_object_new_string(profile_name(cfg.profile)));
        audit_event(svc, "serve_start", ap);
    }
    std::cerr << "[serve] http://" << cfg.host << ":" << cfg.port << " catalog=" << cfg.catalog_dir
              << " data=" << cfg.data_dir << "\n";

    // 0 = ok, otherwise the HTTP status to reject with.
    auto check_auth = [&](const HttpRequest& req, bool mutating, bool rate_limited, std::string* msg) -> int {
        if (mutating && !auth_configured) {
            *msg = "disabled: no auth configured";
            return 403;
        }
        std::lock_guard<std::mutex> lk(http_mu);
        if (!api_token_ok(req, cfg.api_token)) {
            *msg = "unauthorized";
            return 401;
        }
        if (!api_hmac_ok(req, cfg.hmac_secret, cfg.hmac_ttl_sec, nonces)) {
            *msg = "bad_signature";
            return 401;
        }
        if (rate_limited && !tb_execute.allow(now_ms_wall())) {
            *msg = "rate_limited";
            return 429;
        }
        return 0;
    };

    while (running.load()) {
        sockaddr_in caddr{}; socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;
        if (!running.load()) { ::close(cfd); break; }
        if (active_conns.load() >= cfg.max_connections) {
            send_json(cfd, 503, error_body("too_many_connections", ""), "Retry-After: 1\r\n");
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10);

        std::thread t([&, cfd]() {
        struct ConnGuard {
            std::atomic<int>& c; std::mutex& mu; std::condition_variable& cv;
            ~ConnGuard() { std::lock_guard<std::mutex> lk(mu); c.fetch_sub(1); cv.notify_all(); }
        } cg{active_conns, conns_mu, conns_cv};

        HttpRequest req;
        const int rc = read_http_request(cfd, cfg.max_body_bytes, &req);
        if (rc != 0) {
            if (rc > 0) send_json(cfd, rc, error_body("bad_request", rc == 413 ? "body too large" : "malformed request"));
            ::close(cfd);
            return;
        }
        const std::string& method = req.method;
        const std::string& path = req.path;
        const std::string& body = req.body;

        auto reply = [&](const Response& r) {
            send_json(cfd, r.code, r.body, r.headers);
            ::close(cfd);
        };
        auto guard = [&](bool mutating, bool rate_limited) -> bool {
            std::string msg;
            int code = check_auth(req, mutating, rate_limited, &msg);
            if (code == 0) return true;
            reply(Response{code, error_body(msg, "")});
            return false;
        };

        if (method == "GET" && path == "/health") {
            reply(Response{200, "{\"ok\":true,\"generation\":" + std::to_string(svc.catalog->generation()) + "}"});
            return;
        }
        if (method == "GET" && path == "/stats") {
            reply(Response{200, stats_json(svc, active_conns.load())});
            return;
        }
        if (method == "GET" && path == "/metrics") {
            send_text(cfd, 200, metrics_text(svc));
            ::close(cfd);
            return;
        }

        if (method == "POST" && path == "/select") {
            if (!guard(false, false)) return;
            reply(handle_select(svc, body));
            return;
        }

        if (method == "POST" && (path == "/plan" || path == "/execute")) {
            auto doc = json_mini::parse(body);
            if (!doc || !json_object_is_type(doc.root, json_type_object)) {
                reply(Response{400, error_body(error_kind_str(ErrorKind::INVALID_REQUEST), "body must be a JSON object")});
                return;
            }
            const bool execute = path == "/execute" || json_mini::field_bool(doc.root, "execute").value_or(false);
            if (!guard(execute, execute)) return;
            reply(path == "/execute" ? handle_execute(svc, doc.root) : handle_plan(svc, doc.root, execute));
            return;
        }

        if (method == "POST" && path == "/telemetry") {
            if (!guard(false, false)) return;
            reply(handle_telemetry(svc, body));
            return;
        }

        if (method == "POST" && path == "/catalog/import") {
            if (!guard(true, false)) return;
            reply(handle_import(svc, body, req.query_flag("dry_run")));
            return;
        }

        if (method == "POST" && path == "/catalog/reload") {
            if (!guard(true, false)) return;
            reply(handle_reload(svc));
            return;
        }

        if (method == "POST" && path == "/approvals") {
            if (!guard(true, false)) return;
            reply(handle_approvals(svc, body));
            return;
        }

        if (method == "POST" && path == "/shutdown") {
            if (!guard(true, false)) return;
            audit_event(svc, "shutdown", nullptr);
            reply(Response{200, "{\"ok\":true,\"message\":\"shutting_down\"}"});
            running.store(false);
            ::shutdown(sfd, SHUT_RDWR); // unblocks accept()
            return;
        }

        reply(Response{404, error_body("not_found", path)});
        }); // end per-connection thread lambda
        t.detach();
    }

    // graceful shutdown: wait for in-flight connections before tearing down shared state
    {
        std::unique_lock<std::mutex> lk(conns_mu);
        conns_cv.wait(lk, [&] { return active_conns.load() == 0; });
    }
    ::close(sfd);
    shutdown_service(svc);
    std::cerr << "[serve] stopped\n";
    return 0;
}

#else
int cmd_serve(int, char**) {
    std::cerr << "serve not supported on Windows build\n";
    return 2;
}
#endif
