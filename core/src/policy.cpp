#include "caproute/policy.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace caproute {

const char* violation_kind_str(ViolationKind k) {
    switch (k) {
        case ViolationKind::COST_EXCEEDS_BUDGET: return "cost_exceeds_budget";
        case ViolationKind::COST_EXCEEDS_POLICY: return "cost_exceeds_policy";
        case ViolationKind::TIME_EXCEEDS_POLICY: return "time_exceeds_policy";
        case ViolationKind::NOT_PRODUCTION_SAFE: return "not_production_safe";
        case ViolationKind::ENVIRONMENT_MISMATCH: return "environment_mismatch";
        case ViolationKind::MISSING_PERMISSION: return "missing_permission";
        case ViolationKind::APPROVAL_REQUIRED: return "approval_required";
        case ViolationKind::COST_MODEL_UNDEFINED: return "cost_model_undefined";
    }
    return "unknown";
}

static std::string fmt_cmp(double got, const char* op, double limit) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%g %s %g", got, op, limit);
    return buf;
}

std::vector<PolicyViolation> check_candidate(const Candidate& c, const SelectionRequest& req) {
    std::vector<PolicyViolation> out;
    const Pattern& p = *c.pattern;
    const PolicyBlock& pol = p.policy;
    auto add = [&](ViolationKind k, std::string detail) {
        out.push_back(PolicyViolation{c.tool->name, p.name, k, std::move(detail)});
    };

    const double cost = p.cost_estimate.eval(req.n);
    const double time_ms = p.time_estimate_ms.eval(req.n);
    if (!std::isfinite(cost) || !std::isfinite(time_ms)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "cost model not finite at N=%g", req.n);
        add(ViolationKind::COST_MODEL_UNDEFINED, buf);
        return out;
    }

    if (req.budget.max_cost && cost > *req.budget.max_cost)
        add(ViolationKind::COST_EXCEEDS_BUDGET, "cost " + fmt_cmp(cost, ">", *req.budget.max_cost) + " (budget)");
    if (pol.max_cost && cost > *pol.max_cost)
        add(ViolationKind::COST_EXCEEDS_POLICY, "cost " + fmt_cmp(cost, ">", *pol.max_cost) + " (policy)");
    if (pol.max_execution_time_ms && time_ms > static_cast<double>(*pol.max_execution_time_ms))
        add(ViolationKind::TIME_EXCEEDS_POLICY,
            "time_ms " + fmt_cmp(time_ms, ">", static_cast<double>(*pol.max_execution_time_ms)));

    if (!pol.production_safe && (req.production_safe_only || req.environment == "production"))
        add(ViolationKind::NOT_PRODUCTION_SAFE, "pattern is not production safe (environment=" + req.environment + ")");

    if (!pol.allowed_environments.empty() &&
        std::find(pol.allowed_environments.begin(), pol.allowed_environments.end(), req.environment) ==
            pol.allowed_environments.end())
        add(ViolationKind::ENVIRONMENT_MISMATCH, "environment '" + req.environment + "' not allowed");

    for (const auto& perm : pol.required_permissions) {
        if (std::find(req.permissions.begin(), req.permissions.end(), perm) == req.permissions.end())
            add(ViolationKind::MISSING_PERMISSION, "missing permission '" + perm + "'");
    }

    if (pol.requires_approval && !req.allow_approval_required)
        add(ViolationKind::APPROVAL_REQUIRED, "pattern requires approval");

    return out;
}

FilterOutcome filter_candidates(const std::vector<Candidate>& candidates, const SelectionRequest& req) {
    FilterOutcome out;
    for (const auto& c : candidates) {
        auto v = check_candidate(c, req);
        if (v.empty()) {
            out.eligible.push_back(c);
        } else {
            out.violations.insert(out.violations.end(), v.begin(), v.end());
        }
    }
    return out;
}

} // namespace caproute
