#pragma once

#include "caproute/catalog.h"
#include "caproute/request.h"

#include <string>
#include <vector>

namespace caproute {

enum class ViolationKind {
    COST_EXCEEDS_BUDGET,
    COST_EXCEEDS_POLICY,
    TIME_EXCEEDS_POLICY,
    NOT_PRODUCTION_SAFE,
    ENVIRONMENT_MISMATCH,
    MISSING_PERMISSION,
    APPROVAL_REQUIRED,
    COST_MODEL_UNDEFINED,
};

const char* violation_kind_str(ViolationKind k);

struct PolicyViolation {
    std::string tool;
    std::string pattern;
    ViolationKind kind{ViolationKind::COST_EXCEEDS_BUDGET};
    std::string detail;
};

struct FilterOutcome {
    std::vector<Candidate> eligible;           // input order preserved
    std::vector<PolicyViolation> violations;   // every violated constraint, per excluded candidate
    bool no_eligible() const { return eligible.empty(); }
};

// Hard-constraint filter. Pure; never re-ranks, only removes.
// A requires_approval pattern stays eligible (flagged downstream) unless the
// request sets allow_approval_required = false.
FilterOutcome filter_candidates(const std::vector<Candidate>& candidates, const SelectionRequest& req);

// Violations of one candidate (empty: eligible).
std::vector<PolicyViolation> check_candidate(const Candidate& c, const SelectionRequest& req);

} // namespace caproute
