#include "caproute/selection.h"
#include "caproute/enricher.h"

namespace caproute {

const char* selection_status_str(SelectionStatus s) {
    switch (s) {
        case SelectionStatus::OK: return "ok";
        case SelectionStatus::NO_ELIGIBLE_CANDIDATE: return "no_eligible_candidate";
        case SelectionStatus::INVALID_REQUEST: return "invalid_request";
        case SelectionStatus::SERVICE_UNAVAILABLE: return "service_unavailable";
    }
    return "invalid_request";
}

std::string execution_mode_hint_for(const Pattern& p, double estimated_time_ms) {
    if (p.policy.requires_approval) return "approval_required";
    if (estimated_time_ms > 5000.0) return "background";
    return "immediate";
}

std::string sla_class_for(double estimated_time_ms) {
    if (estimated_time_ms < 1000.0) return "interactive";
    if (estimated_time_ms < 10000.0) return "batch";
    return "background";
}

std::string deterministic_justification(const std::string& dominant) {
    if (dominant == "speed") return "Selected for fast response time. Optimized for speed preference.";
    if (dominant == "accuracy") return "Selected for high accuracy. Provides reliable data.";
    if (dominant == "cost") return "Selected for low cost. Most economical option.";
    if (dominant == "complexity") return "Selected for simplicity. Easy to use and understand.";
    if (dominant == "completeness") return "Selected for comprehensive results. Provides complete coverage.";
    return "Selected based on balanced optimization across all dimensions.";
}

SelectionOutcome Resolver::resolve(const SelectionRequest& req) {
    SelectionOutcome out;
    std::string invalid = validate_request(req);
    if (!invalid.empty()) {
        out.status = SelectionStatus::INVALID_REQUEST;
        out.reason = invalid;
        return out;
    }

    CandidateSet cs = catalog_.getCandidates(req.capability, req.platform);
    out.stale = cs.stale;
    if (cs.candidates.empty()) {
        out.status = SelectionStatus::NO_ELIGIBLE_CANDIDATE;
        out.reason = "no selectable tool provides capability '" + req.capability + "'" +
                     (req.platform.empty() ? std::string() : " on platform '" + req.platform + "'");
        return out;
    }

    FilterOutcome fo = filter_candidates(cs.candidates, req);
    if (fo.no_eligible()) {
        out.status = SelectionStatus::NO_ELIGIBLE_CANDIDATE;
        out.reason = "all " + std::to_string(cs.candidates.size()) + " candidates violate policy";
        out.violations = std::move(fo.violations);
        return out;
    }

    std::vector<ScoredCandidate> ranked = scoring_.score(fo.eligible, req);
    TieBreakOutcome tb = tiebreak_.resolve(ranked, req);
    const ScoredCandidate& win = ranked[tb.winner_index];

    auto r = std::make_shared<SelectionResult>();
    r->tool = win.candidate.tool;
    r->capability = win.candidate.capability;
    r->pattern_name = win.candidate.pattern->name;
    r->score = win.score;
    r->breakdown = win.breakdown;
    r->estimated_time_ms = win.estimated_time_ms;
    r->estimated_cost = win.estimated_cost;
    for (size_t i = 0; i < ranked.size() && r->alternatives.size() < 3; i++) {
        if (i == tb.winner_index) continue;
        r->alternatives.push_back(Alternative{ranked[i].candidate.tool->name, ranked[i].candidate.pattern->name,
                                              ranked[i].score});
    }
    r->execution_mode_hint = execution_mode_hint_for(*win.candidate.pattern, win.estimated_time_ms);
    r->sla_class = sla_class_for(win.estimated_time_ms);
    r->num_candidates = cs.candidates.size();
    r->num_policy_violations = fo.violations.size();
    r->justification = deterministic_justification(dominant_axis(effective_weights(req)));
    if (tb.transcript) {
        r->selection_method = tb.transcript->resolution == "judge" ? "tie_break" : "deterministic";
        if (r->selection_method == "tie_break" && !tb.transcript->reason.empty())
            r->justification = "Selected by tie-break judge: " + tb.transcript->reason;
        r->tie_break = std::move(tb.transcript);
    }
    r->stale = cs.stale;
    r->catalog_generation = cs.generation;
    stamp_routing(*r);

    out.status = SelectionStatus::OK;
    out.result = r;
    return out;
}

} // namespace caproute
