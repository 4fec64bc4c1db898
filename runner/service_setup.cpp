#include "service_setup.h"

#include "caproute/crypto.h"
#include "caproute/errors.h"
#include "caproute/json_mini.h"
#include "caproute/serialization.h"

#include <iostream>
#include <set>

namespace caproute {

namespace fs = std::filesystem;

void register_backends(Service& svc) {
    const ServiceConfig& cfg = svc.cfg;

    ProcLimits lim;
    lim.timeout_ms = cfg.step_timeout_ms;

    svc.adapters.register_adapter("local", std::make_shared<LocalProcessAdapter>(lim));
    svc.adapters.register_adapter("ssh", std::make_shared<SshAdapter>(svc.credentials, lim, cfg.ssh_bin));
    svc.adapters.register_adapter("http", std::make_shared<HttpAdapter>(
        svc.credentials, cfg.http_allowed_hosts, cfg.http_default_deny, lim, cfg.curl_bin));
    if (!cfg.winrm_client.empty()) {
        svc.adapters.register_adapter("winrm", std::make_shared<StdinClientAdapter>(
            "winrm", cfg.winrm_client, svc.credentials, lim));
    }
    if (!cfg.database_client.empty()) {
        svc.adapters.register_adapter("database", std::make_shared<StdinClientAdapter>(
            "database", cfg.database_client, svc.credentials, lim));
    }
    svc.adapters.set_default(cfg.default_backend);
}

std::string build_service(Service& svc) {
    const ServiceConfig& cfg = svc.cfg;
    if (svc.instance_id.empty()) svc.instance_id = "inst_" + random_hex(6);

    std::error_code ec;
    fs::create_directories(cfg.catalog_dir, ec);
    if (ec) return "cannot create catalog dir " + cfg.catalog_dir + ": " + ec.message();
    fs::create_directories(cfg.data_dir, ec);
    if (ec) return "cannot create data dir " + cfg.data_dir + ": " + ec.message();

    // catalog
    svc.store = std::make_shared<FileCatalogStore>(cfg.catalog_dir);
    CatalogAdapterOptions copt;
    copt.max_entries = cfg.catalog_cache_entries;
    copt.ttl_ms = cfg.catalog_cache_ttl_ms;
    copt.pool_size = cfg.catalog_pool_size;
    copt.slot_timeout_ms = cfg.catalog_slot_timeout_ms;
    svc.catalog = std::make_unique<CatalogAdapter>(svc.store, copt);
    std::string err = svc.catalog->reload();
    if (!err.empty()) {
        // Selection keeps working off the store on demand; a failed warm-up is not fatal.
        std::cerr << "[catalog] initial load failed: " << err << std::endl;
    }
    if (cfg.catalog_refresh_interval_ms > 0)
        svc.catalog->start_background_refresh(cfg.catalog_refresh_interval_ms);

    // selection
    if (!cfg.judge_cmd.empty()) {
        svc.judge = std::make_shared<ExternalProcessJudge>(cfg.judge_cmd, fs::path(cfg.data_dir) / "judge");
    } else {
        svc.judge = std::make_shared<FirstChoiceJudge>();
    }
    TieBreakOptions topt;
    topt.epsilon = cfg.tiebreak_epsilon;
    topt.timeout_ms = cfg.tiebreak_timeout_ms;
    topt.max_candidates = cfg.tiebreak_max_candidates;
    topt.max_prompt_chars = cfg.tiebreak_max_prompt_chars;
    svc.tiebreak = std::make_unique<TieBreakEscalator>(svc.judge, topt);
    svc.resolver = std::make_unique<Resolver>(*svc.catalog, svc.scoring, *svc.tiebreak);

    GatewayOptions gopt;
    gopt.ttl_ms = cfg.selection_ttl_ms;
    gopt.grace_ms = cfg.selection_grace_ms;
    gopt.retry_after_base_sec = cfg.retry_after_base_sec;
    gopt.retry_after_max_sec = cfg.retry_after_max_sec;
    gopt.max_entries = cfg.selection_cache_entries;
    svc.gateway = std::make_unique<SelectionGateway>(*svc.resolver, gopt);

    // execution
    if (!cfg.credentials_file.empty())
        svc.credentials = std::make_shared<FileCredentialResolver>(cfg.credentials_file);
    register_backends(svc);

    WalPolicy wp;
    wp.max_segment_bytes = cfg.telemetry_segment_bytes;
    wp.max_segments = cfg.telemetry_max_segments;
    svc.telemetry = std::make_unique<TelemetryRecorder>(fs::path(cfg.data_dir) / "telemetry.jsonl", wp);
    svc.telemetry->set_fsync(cfg.telemetry_fsync);
    err = svc.telemetry->start();
    if (!err.empty()) return "telemetry: " + err;

    svc.audit = std::make_unique<AuditLog>((fs::path(cfg.data_dir) / "audit.jsonl").string(), svc.instance_id);

    DispatcherOptions dopt;
    dopt.default_step_timeout_ms = cfg.step_timeout_ms;
    dopt.plan_timeout_ms = cfg.plan_timeout_ms;
    dopt.max_concurrency = cfg.max_plan_concurrency;
    svc.dispatcher = std::make_unique<Dispatcher>(svc.adapters, &svc.approvals, svc.telemetry.get(), dopt);

    std::cerr << "[caproute] profile=" << profile_name(cfg.profile)
              << " catalog=" << cfg.catalog_dir
              << " generation=" << svc.catalog->generation()
              << " judge=" << svc.judge->name()
              << " default_backend=" << (cfg.default_backend.empty() ? "(none)" : cfg.default_backend)
              << std::endl;
    return "";
}

void shutdown_service(Service& svc) {
    if (svc.catalog) svc.catalog->stop();
    if (svc.telemetry) svc.telemetry->stop();
}

void audit_event(Service& svc, const std::string& event, json_object* payload) {
    if (!svc.audit) {
        if (payload) json_object_put(payload);
        return;
    }
    json_mini::Doc d(payload ? payload : json_object_new_object());
    svc.audit->event(event, json_mini::to_string(d.root));
}

PlanBuild plan_from_requests(Service& svc, json_object* body) {
    PlanBuild b;
    if (!body || !json_object_is_type(body, json_type_object)) {
        b.error = "plan body must be a JSON object";
        return b;
    }
    json_object* steps = json_mini::field(body, "steps");
    if (!steps || !json_object_is_type(steps, json_type_array) || json_object_array_length(steps) == 0) {
        b.error = "steps must be a non-empty array";
        return b;
    }

    if (auto pid = json_mini::field_string(body, "planId")) b.plan.plan_id = *pid;
    if (auto fp = json_mini::field_string(body, "failurePolicy")) {
        auto p = failure_policy_from_str(*fp);
        if (!p) {
            b.error = "unknown failurePolicy: " + *fp;
            return b;
        }
        b.plan.policy = *p;
    }
    if (auto t = json_mini::field_int(body, "timeoutMs")) {
        if (*t <= 0) {
            b.error = "timeoutMs must be positive";
            return b;
        }
        b.plan.timeout_ms = *t;
    }
    if (auto mc = json_mini::field_int(body, "maxConcurrency")) {
        if (*mc <= 0) {
            b.error = "maxConcurrency must be positive";
            return b;
        }
        b.plan.max_concurrency = static_cast<int>(*mc);
    }

    std::set<std::string> seen;
    bool all_ok = true;
    size_t n = json_object_array_length(steps);
    for (size_t i = 0; i < n; ++i) {
        json_object* s = json_object_array_get_idx(steps, i);
        PlannedStep ps;

        ExecutionStep step;
        std::string err;
        if (!execution_step_from_json(s, &step, &err)) {
            b.error = "step " + std::to_string(i) + ": " + err;
            return b;
        }
        if (step.id.empty()) step.id = "step" + std::to_string(i + 1);
        if (!seen.insert(step.id).second) {
            b.error = "duplicate step id: " + step.id;
            return b;
        }
        ps.id = step.id;

        json_object* rq = json_mini::field(s, "request");
        SelectionRequest req;
        if (!rq || !request_from_json(rq, &req, &err)) {
            b.error = "step " + step.id + ": " + (rq ? err : std::string("missing request"));
            return b;
        }

        ps.selection = svc.gateway->select(req);
        if (ps.selection.status != SelectionStatus::OK) {
            ps.error = std::string(selection_status_str(ps.selection.status)) + ": " + ps.selection.reason;
            all_ok = false;
            b.steps.push_back(std::move(ps));
            continue;
        }
        try {
            ps.step = svc.enricher.enrich(step, *ps.selection.result);
            b.plan.steps.push_back(*ps.step);
        } catch (const EnrichmentError& e) {
            ps.error = e.what();
            all_ok = false;
        }
        b.steps.push_back(std::move(ps));
    }

    if (!all_ok) {
        b.error = "one or more steps could not be planned";
        return b;
    }
    b.ok = true;
    return b;
}

json_object* plan_build_to_json(const PlanBuild& b) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(b.ok));
    if (!b.plan.plan_id.empty())
        json_object_object_add(o, "planId", json_object_new_string(b.plan.plan_id.c_str()));
    json_object_object_add(o, "failurePolicy", json_object_new_string(failure_policy_str(b.plan.policy)));
    if (!b.error.empty()) json_object_object_add(o, "error", json_object_new_string(b.error.c_str()));

    json_object* arr = json_object_new_array();
    for (const auto& ps : b.steps) {
        json_object* so = json_object_new_object();
        json_object_object_add(so, "id", json_object_new_string(ps.id.c_str()));
        json_object_object_add(so, "selectionStatus",
                               json_object_new_string(selection_status_str(ps.selection.status)));
        if (ps.selection.result) {
            json_object* sel = json_tokener_parse(ps.selection.result_json.c_str());
            json_object_object_add(so, "selection", sel ? sel : selection_result_to_json(*ps.selection.result));
        }
        if (!ps.selection.violations.empty())
            json_object_object_add(so, "violations", violations_to_json(ps.selection.violations));
        if (ps.step) json_object_object_add(so, "step", enriched_step_to_json(*ps.step));
        if (!ps.error.empty()) json_object_object_add(so, "error", json_object_new_string(ps.error.c_str()));
        json_object_array_add(arr, so);
    }
    json_object_object_add(o, "steps", arr);
    return o;
}

} // namespace caproute
