#pragma once

#include "caproute/catalog.h"
#include "caproute/request.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace caproute {

struct CriterionScore {
    std::string criterion;     // speed accuracy cost complexity completeness
    double axis_score{0.0};    // after budget penalty
    double weight{0.0};        // normalized
    double contribution{0.0};  // axis_score * weight
};

struct ScoredCandidate {
    Candidate candidate;
    double score{0.0};
    std::vector<CriterionScore> breakdown;
    double estimated_time_ms{0.0};
    double estimated_cost{0.0};
};

// Weighted sum of the five preference-match axes. Speed and cost axes are
// scaled by budget/modeled when the cost model at N exceeds the budget.
// Output is sorted by score descending, then tool, pattern, capability, and is
// bit-reproducible for identical inputs.
class ScoringEngine {
public:
    std::vector<ScoredCandidate> score(const std::vector<Candidate>& candidates,
                                       const SelectionRequest& req) const;

    uint64_t invocations() const { return invocations_.load(); }

private:
    mutable std::atomic<uint64_t> invocations_{0};
};

} // namespace caproute
