#include "caproute/scoring.h"

#include <algorithm>

namespace caproute {

static double budget_factor(double modeled, const std::optional<double>& budget) {
    if (!budget || modeled <= *budget) return 1.0;
    if (*budget <= 0.0) return 0.0;
    return *budget / modeled;
}

std::vector<ScoredCandidate> ScoringEngine::score(const std::vector<Candidate>& candidates,
                                                  const SelectionRequest& req) const {
    invocations_++;
    const PreferenceWeights w = effective_weights(req);

    std::vector<ScoredCandidate> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates) {
        const Pattern& p = *c.pattern;
        ScoredCandidate sc;
        sc.candidate = c;
        sc.estimated_time_ms = p.time_estimate_ms.eval(req.n);
        sc.estimated_cost = p.cost_estimate.eval(req.n);

        const double speed = p.preference_match.speed * budget_factor(sc.estimated_time_ms, req.budget.max_time_ms);
        const double cost = p.preference_match.cost * budget_factor(sc.estimated_cost, req.budget.max_cost);

        sc.breakdown = {
            {"speed", speed, w.speed, speed * w.speed},
            {"accuracy", p.preference_match.accuracy, w.accuracy, p.preference_match.accuracy * w.accuracy},
            {"cost", cost, w.cost, cost * w.cost},
            {"complexity", p.preference_match.complexity, w.complexity, p.preference_match.complexity * w.complexity},
            {"completeness", p.preference_match.completeness, w.completeness,
             p.preference_match.completeness * w.completeness},
        };
        double total = 0.0;
        for (const auto& b : sc.breakdown) total += b.contribution;
        sc.score = total;
        out.push_back(std::move(sc));
    }

    std::sort(out.begin(), out.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.candidate.tool->name != b.candidate.tool->name) return a.candidate.tool->name < b.candidate.tool->name;
        if (a.candidate.pattern->name != b.candidate.pattern->name)
            return a.candidate.pattern->name < b.candidate.pattern->name;
        return a.candidate.capability < b.candidate.capability;
    });
    return out;
}

} // namespace caproute
