#include "caproute/serialization.h"
#include "caproute/json_mini.h"
#include "caproute/util.h"

#include <algorithm>
#include <cmath>

namespace caproute {

namespace jm = json_mini;

namespace {

// First present key among the spellings.
json_object* pick(json_object* o, const char* camel, const char* snake = nullptr) {
    json_object* v = jm::field(o, camel);
    if (!v && snake) v = jm::field(o, snake);
    if (v && json_object_is_type(v, json_type_null)) return nullptr;
    return v;
}

bool read_string(json_object* o, const char* camel, const char* snake, std::string* out, std::string* err) {
    json_object* v = pick(o, camel, snake);
    if (!v) return true;
    if (!json_object_is_type(v, json_type_string)) {
        *err = std::string(camel) + " must be a string";
        return false;
    }
    *out = json_object_get_string(v);
    return true;
}

bool read_bool(json_object* o, const char* camel, const char* snake, bool* out, std::string* err) {
    json_object* v = pick(o, camel, snake);
    if (!v) return true;
    if (!json_object_is_type(v, json_type_boolean)) {
        *err = std::string(camel) + " must be a boolean";
        return false;
    }
    *out = json_object_get_boolean(v) != 0;
    return true;
}

bool read_number(json_object* o, const char* camel, const char* snake, std::optional<double>* out, std::string* err) {
    json_object* v = pick(o, camel, snake);
    if (!v) return true;
    if (!jm::is_number(v)) {
        *err = std::string(camel) + " must be a number";
        return false;
    }
    *out = json_object_get_double(v);
    return true;
}

bool read_i64(json_object* o, const char* camel, const char* snake, std::optional<int64_t>* out, std::string* err) {
    json_object* v = pick(o, camel, snake);
    if (!v) return true;
    if (!jm::is_number(v)) {
        *err = std::string(camel) + " must be an integer";
        return false;
    }
    const double d = json_object_get_double(v);
    if (!std::isfinite(d) || std::floor(d) != d) {
        *err = std::string(camel) + " must be an integer";
        return false;
    }
    *out = static_cast<int64_t>(d);
    return true;
}

bool read_strings(json_object* o, const char* camel, const char* snake, std::vector<std::string>* out,
                  std::string* err) {
    json_object* v = pick(o, camel, snake);
    if (!v) return true;
    if (!json_object_is_type(v, json_type_array)) {
        *err = std::string(camel) + " must be an array of strings";
        return false;
    }
    out->clear();
    const size_t n = json_object_array_length(v);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(v, i);
        if (!el || !json_object_is_type(el, json_type_string)) {
            *err = std::string(camel) + " must be an array of strings";
            return false;
        }
        out->emplace_back(json_object_get_string(el));
    }
    return true;
}

json_object* new_str(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

json_object* strings_to_json(const std::vector<std::string>& v) {
    json_object* a = json_object_new_array();
    for (const auto& s : v) json_object_array_add(a, new_str(s));
    return a;
}

json_object* string_map_to_json(const std::map<std::string, std::string>& m) {
    json_object* o = json_object_new_object();
    for (const auto& kv : m) json_object_object_add(o, kv.first.c_str(), new_str(kv.second));
    return o;
}

json_object* weights_to_json(const PreferenceWeights& w) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "speed", json_object_new_double(w.speed));
    json_object_object_add(o, "accuracy", json_object_new_double(w.accuracy));
    json_object_object_add(o, "cost", json_object_new_double(w.cost));
    json_object_object_add(o, "complexity", json_object_new_double(w.complexity));
    json_object_object_add(o, "completeness", json_object_new_double(w.completeness));
    return o;
}

// Embeds raw JSON text as a document; text that does not parse stays a string.
json_object* raw_json(const std::string& text) {
    jm::Doc d = jm::parse(text);
    if (d) return d.release();
    return new_str(text);
}

} // namespace

// ---------- selection request ----------

bool request_from_json(json_object* o, SelectionRequest* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        *err = "request body must be a JSON object";
        return false;
    }
    SelectionRequest r;
    if (!read_string(o, "capability", nullptr, &r.capability, err)) return false;
    if (!read_string(o, "platform", nullptr, &r.platform, err)) return false;

    std::optional<double> n;
    if (!read_number(o, "N", "n", &n, err)) return false;
    if (n) r.n = *n;

    json_object* w = pick(o, "preferenceWeights", "preference_weights");
    if (w) {
        if (!json_object_is_type(w, json_type_object)) {
            *err = "preferenceWeights must be an object";
            return false;
        }
        // Unnamed axes weigh 0 once any weight is given.
        PreferenceWeights pw{0.0, 0.0, 0.0, 0.0, 0.0};
        const std::pair<const char*, double*> axes[] = {
            {"speed", &pw.speed}, {"accuracy", &pw.accuracy}, {"cost", &pw.cost},
            {"complexity", &pw.complexity}, {"completeness", &pw.completeness}};
        json_object_object_foreach(w, k, v) {
            bool known = false;
            for (const auto& ax : axes) {
                if (std::string(k) != ax.first) continue;
                if (!jm::is_number(v)) {
                    *err = std::string("preferenceWeights.") + k + " must be a number";
                    return false;
                }
                *ax.second = json_object_get_double(v);
                known = true;
            }
            if (!known) {
                *err = std::string("unknown preference axis: ") + k;
                return false;
            }
        }
        r.weights = pw;
    }

    if (!read_string(o, "mode", nullptr, &r.mode, err)) return false;
    r.mode = lower_ascii(r.mode);

    json_object* b = pick(o, "budget");
    if (b) {
        if (!json_object_is_type(b, json_type_object)) {
            *err = "budget must be an object";
            return false;
        }
        if (!read_number(b, "maxTimeMs", "max_time_ms", &r.budget.max_time_ms, err)) return false;
        if (!read_number(b, "maxCost", "max_cost", &r.budget.max_cost, err)) return false;
    }

    if (!read_bool(o, "productionSafeOnly", "production_safe_only", &r.production_safe_only, err)) return false;
    if (!read_bool(o, "allowApprovalRequired", "allow_approval_required", &r.allow_approval_required, err))
        return false;
    if (!read_string(o, "environment", nullptr, &r.environment, err)) return false;
    if (!read_strings(o, "permissions", nullptr, &r.permissions, err)) return false;

    *out = std::move(r);
    return true;
}

bool request_from_string(const std::string& body, SelectionRequest* out, std::string* err) {
    jm::Doc d = jm::parse(body);
    if (!d) {
        *err = "request body is not valid JSON";
        return false;
    }
    return request_from_json(d.root, out, err);
}

std::string canonical_request(const SelectionRequest& req) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "capability", new_str(req.capability));
    json_object_object_add(o, "platform", new_str(req.platform));
    json_object_object_add(o, "n", json_object_new_double(req.n));
    json_object_object_add(o, "weights", weights_to_json(effective_weights(req)));
    json_object* b = json_object_new_object();
    if (req.budget.max_time_ms) json_object_object_add(b, "maxTimeMs", json_object_new_double(*req.budget.max_time_ms));
    if (req.budget.max_cost) json_object_object_add(b, "maxCost", json_object_new_double(*req.budget.max_cost));
    json_object_object_add(o, "budget", b);
    json_object_object_add(o, "productionSafeOnly", json_object_new_boolean(req.production_safe_only));
    json_object_object_add(o, "allowApprovalRequired", json_object_new_boolean(req.allow_approval_required));
    json_object_object_add(o, "environment", new_str(req.environment));
    std::vector<std::string> perms = req.permissions;
    std::sort(perms.begin(), perms.end());
    perms.erase(std::unique(perms.begin(), perms.end()), perms.end());
    json_object_object_add(o, "permissions", strings_to_json(perms));
    std::string s = jm::canonical(o);
    json_object_put(o);
    return s;
}

// ---------- selection result ----------

json_object* criterion_to_json(const CriterionScore& c) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "criterion", new_str(c.criterion));
    json_object_object_add(o, "axisScore", json_object_new_double(c.axis_score));
    json_object_object_add(o, "weight", json_object_new_double(c.weight));
    json_object_object_add(o, "contribution", json_object_new_double(c.contribution));
    return o;
}

json_object* tiebreak_to_json(const TieBreakTranscript& t) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "judge", new_str(t.judge));
    json_object_object_add(o, "prompt", new_str(t.prompt));
    json_object_object_add(o, "choices", strings_to_json(t.choices));
    json_object_object_add(o, "rawResponse", new_str(t.raw_response));
    json_object_object_add(o, "resolution", new_str(t.resolution));
    json_object_object_add(o, "winner", new_str(t.winner));
    if (!t.reason.empty()) json_object_object_add(o, "reason", new_str(t.reason));
    if (!t.error.empty()) json_object_object_add(o, "error", new_str(t.error));
    return o;
}

json_object* selection_result_to_json(const SelectionResult& r) {
    json_object* o = json_object_new_object();
    const Pattern* p = r.pattern();
    json_object_object_add(o, "tool", new_str(r.tool ? r.tool->name : std::string()));
    json_object_object_add(o, "toolVersion", new_str(r.tool ? r.tool->version : std::string()));
    json_object_object_add(o, "platform", new_str(r.tool ? r.tool->platform : std::string()));
    json_object_object_add(o, "capability", new_str(r.capability));
    json_object_object_add(o, "pattern", new_str(r.pattern_name));
    json_object_object_add(o, "score", json_object_new_double(r.score));

    json_object* bd = json_object_new_array();
    for (const auto& c : r.breakdown) json_object_array_add(bd, criterion_to_json(c));
    json_object_object_add(o, "scoreBreakdown", bd);

    json_object_object_add(o, "estimatedTimeMs", json_object_new_double(r.estimated_time_ms));
    json_object_object_add(o, "estimatedCost", json_object_new_double(r.estimated_cost));

    json_object* alts = json_object_new_array();
    for (const auto& a : r.alternatives) {
        json_object* ao = json_object_new_object();
        json_object_object_add(ao, "tool", new_str(a.tool));
        json_object_object_add(ao, "pattern", new_str(a.pattern));
        json_object_object_add(ao, "score", json_object_new_double(a.score));
        json_object_array_add(alts, ao);
    }
    json_object_object_add(o, "alternatives", alts);

    json_object_object_add(o, "executionModeHint", new_str(r.execution_mode_hint));
    json_object_object_add(o, "slaClass", new_str(r.sla_class));
    json_object_object_add(o, "requiresApproval", json_object_new_boolean(p && p->policy.requires_approval));
    json_object_object_add(o, "numCandidates", json_object_new_int64(static_cast<int64_t>(r.num_candidates)));
    json_object_object_add(o, "numPolicyViolations",
                           json_object_new_int64(static_cast<int64_t>(r.num_policy_violations)));
    json_object_object_add(o, "selectionMethod", new_str(r.selection_method));
    json_object_object_add(o, "justification", new_str(r.justification));
    if (r.tie_break) json_object_object_add(o, "tieBreak", tiebreak_to_json(*r.tie_break));

    const RoutingInfo& rt = r.routing;
    json_object* ro = json_object_new_object();
    json_object_object_add(ro, "executionLocation", new_str(rt.execution_location));
    json_object_object_add(ro, "requiresCredentials", json_object_new_boolean(rt.requires_credentials));
    json_object_object_add(ro, "protocol", new_str(protocol_str(rt.protocol)));
    json_object_object_add(ro, "protocolMetadata", string_map_to_json(rt.protocol_metadata));
    json_object_object_add(o, "routing", ro);

    if (r.tool) json_object_object_add(o, "toolDefinition", raw_json(tool_to_json(*r.tool)));
    json_object_object_add(o, "stale", json_object_new_boolean(r.stale));
    json_object_object_add(o, "catalogGeneration", json_object_new_int64(static_cast<int64_t>(r.catalog_generation)));
    return o;
}

std::string selection_result_to_string(const SelectionResult& r) {
    json_object* o = selection_result_to_json(r);
    std::string s = jm::canonical(o);
    json_object_put(o);
    return s;
}

json_object* violations_to_json(const std::vector<PolicyViolation>& v) {
    json_object* a = json_object_new_array();
    for (const auto& x : v) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "tool", new_str(x.tool));
        json_object_object_add(o, "pattern", new_str(x.pattern));
        json_object_object_add(o, "kind", new_str(violation_kind_str(x.kind)));
        json_object_object_add(o, "detail", new_str(x.detail));
        json_object_array_add(a, o);
    }
    return a;
}

// ---------- steps and plans ----------

bool execution_step_from_json(json_object* o, ExecutionStep* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        *err = "step must be a JSON object";
        return false;
    }
    ExecutionStep s;
    if (!read_string(o, "id", nullptr, &s.id, err)) return false;
    if (!read_string(o, "tool", nullptr, &s.tool, err)) return false;
    if (!read_string(o, "pattern", nullptr, &s.pattern, err)) return false;
    if (!read_string(o, "capability", nullptr, &s.capability, err)) return false;
    if (!read_string(o, "targetHost", "target_host", &s.target_host, err)) return false;

    json_object* in = pick(o, "inputs");
    if (in) {
        if (!json_object_is_type(in, json_type_object)) {
            *err = "step inputs must be an object";
            return false;
        }
        s.inputs_json = jm::to_string(in);
    }
    if (!read_strings(o, "dependsOn", "depends_on", &s.depends_on, err)) return false;
    if (!read_string(o, "credentialRef", "credential_ref", &s.credential_ref, err)) return false;
    if (!read_string(o, "approvalToken", "approval_token", &s.approval_token, err)) return false;
    *out = std::move(s);
    return true;
}

json_object* enriched_step_to_json(const EnrichedExecutionStep& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "id", new_str(s.id));
    json_object_object_add(o, "tool", new_str(s.tool));
    json_object_object_add(o, "toolVersion", new_str(s.tool_version));
    json_object_object_add(o, "pattern", new_str(s.pattern));
    json_object_object_add(o, "capability", new_str(s.capability));
    json_object_object_add(o, "targetHost", new_str(s.target_host));
    json_object_object_add(o, "inputs", raw_json(s.inputs_json.empty() ? std::string("{}") : s.inputs_json));
    json_object_object_add(o, "dependsOn", strings_to_json(s.depends_on));
    if (!s.credential_ref.empty()) json_object_object_add(o, "credentialRef", new_str(s.credential_ref));
    if (!s.approval_token.empty()) json_object_object_add(o, "approvalToken", new_str(s.approval_token));
    json_object_object_add(o, "requiresCredentials", json_object_new_boolean(s.requires_credentials));
    json_object_object_add(o, "executionLocation", new_str(s.execution_location));
    json_object_object_add(o, "protocol", new_str(protocol_str(s.protocol)));
    json_object_object_add(o, "protocolMetadata", string_map_to_json(s.protocol_metadata));
    json_object_object_add(o, "requiresApproval", json_object_new_boolean(s.requires_approval));
    if (s.max_execution_time_ms)
        json_object_object_add(o, "maxExecutionTimeMs", json_object_new_int64(*s.max_execution_time_ms));
    json_object_object_add(o, "estimatedCost", json_object_new_double(s.estimated_cost));
    json_object_object_add(o, "estimatedTimeMs", json_object_new_double(s.estimated_time_ms));
    return o;
}

bool enriched_step_from_json(json_object* o, EnrichedExecutionStep* out, std::string* err) {
    EnrichedExecutionStep s;
    if (!execution_step_from_json(o, &s, err)) return false;

    if (!read_string(o, "toolVersion", "tool_version", &s.tool_version, err)) return false;
    if (!read_bool(o, "requiresCredentials", "requires_credentials", &s.requires_credentials, err)) return false;
    if (!read_string(o, "executionLocation", "execution_location", &s.execution_location, err)) return false;
    if (s.execution_location.empty()) {
        *err = "step '" + s.id + "' has an empty executionLocation";
        return false;
    }
    std::string proto;
    if (!read_string(o, "protocol", nullptr, &proto, err)) return false;
    if (!proto.empty()) {
        auto p = protocol_from_str(lower_ascii(proto));
        if (!p) {
            *err = "step '" + s.id + "' has unknown protocol '" + proto + "'";
            return false;
        }
        s.protocol = *p;
    }
    json_object* md = pick(o, "protocolMetadata", "protocol_metadata");
    if (md && !json_object_is_type(md, json_type_object)) {
        *err = "protocolMetadata must be an object";
        return false;
    }
    if (md) s.protocol_metadata = jm::field_string_map(o, jm::field(o, "protocolMetadata") ? "protocolMetadata" : "protocol_metadata");
    if (!read_bool(o, "requiresApproval", "requires_approval", &s.requires_approval, err)) return false;
    if (!read_i64(o, "maxExecutionTimeMs", "max_execution_time_ms", &s.max_execution_time_ms, err)) return false;
    std::optional<double> ec, et;
    if (!read_number(o, "estimatedCost", "estimated_cost", &ec, err)) return false;
    if (!read_number(o, "estimatedTimeMs", "estimated_time_ms", &et, err)) return false;
    if (ec) s.estimated_cost = *ec;
    if (et) s.estimated_time_ms = *et;
    if (s.tool.empty() || s.pattern.empty()) {
        *err = "step '" + s.id + "' must name tool and pattern";
        return false;
    }
    *out = std::move(s);
    return true;
}

bool plan_from_json(json_object* o, ExecutionPlan* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        *err = "plan must be a JSON object";
        return false;
    }
    ExecutionPlan p;
    if (!read_string(o, "planId", "plan_id", &p.plan_id, err)) return false;

    std::string policy;
    if (!read_string(o, "failurePolicy", "failure_policy", &policy, err)) return false;
    if (!policy.empty()) {
        auto fp = failure_policy_from_str(policy);
        if (!fp) {
            *err = "unknown failurePolicy '" + policy + "'";
            return false;
        }
        p.policy = *fp;
    }

    std::optional<int64_t> timeout, conc;
    if (!read_i64(o, "timeoutMs", "timeout_ms", &timeout, err)) return false;
    if (!read_i64(o, "maxConcurrency", "max_concurrency", &conc, err)) return false;
    p.timeout_ms = timeout;
    if (conc) p.max_concurrency = static_cast<int>(std::clamp<int64_t>(*conc, 0, 1000));

    json_object* steps = pick(o, "steps");
    if (!steps || !json_object_is_type(steps, json_type_array)) {
        *err = "steps must be an array";
        return false;
    }
    const size_t n = json_object_array_length(steps);
    for (size_t i = 0; i < n; i++) {
        EnrichedExecutionStep s;
        if (!enriched_step_from_json(json_object_array_get_idx(steps, i), &s, err)) {
            *err = "steps[" + std::to_string(i) + "]: " + *err;
            return false;
        }
        p.steps.push_back(std::move(s));
    }
    *out = std::move(p);
    return true;
}

json_object* step_result_to_json(const StepResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "stepId", new_str(r.step_id));
    json_object_object_add(o, "tool", new_str(r.tool));
    json_object_object_add(o, "pattern", new_str(r.pattern));
    json_object_object_add(o, "status", new_str(step_status_str(r.status)));
    json_object_object_add(o, "output", new_str(r.output));
    if (!r.error.empty()) json_object_object_add(o, "error", new_str(r.error));
    json_object_object_add(o, "exitCode", json_object_new_int(r.exit_code));
    json_object_object_add(o, "durationMs", json_object_new_int64(r.duration_ms));
    if (!r.backend.empty()) json_object_object_add(o, "backend", new_str(r.backend));
    json_object_object_add(o, "fallbackRouted", json_object_new_boolean(r.fallback_routed));
    return o;
}

json_object* plan_result_to_json(const PlanResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "planId", new_str(r.plan_id));
    json_object* steps = json_object_new_array();
    for (const auto& s : r.steps) json_object_array_add(steps, step_result_to_json(s));
    json_object_object_add(o, "stepResults", steps);
    json_object_object_add(o, "overallStatus", new_str(plan_status_str(r.status)));
    json_object_object_add(o, "failurePolicy", new_str(failure_policy_str(r.policy)));
    json_object_object_add(o, "durationMs", json_object_new_int64(r.duration_ms));
    json_object_object_add(o, "concurrency", json_object_new_int(r.concurrency));
    return o;
}

json_object* approval_lease_to_json(const ApprovalLease& l) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "token", new_str(l.token));
    json_object_object_add(o, "scope", new_str(l.scope));
    if (!l.host.empty()) json_object_object_add(o, "host", new_str(l.host));
    json_object_object_add(o, "issuer", new_str(l.issuer));
    json_object_object_add(o, "issuedAt", new_str(iso_from_ms(l.issued_ms)));
    json_object_object_add(o, "expiresAt", new_str(iso_from_ms(l.expires_ms)));
    json_object_object_add(o, "expiresMs", json_object_new_int64(l.expires_ms));
    return o;
}

} // namespace caproute
