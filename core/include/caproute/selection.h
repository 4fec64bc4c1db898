#pragma once

#include "caproute/catalog.h"
#include "caproute/catalog_adapter.h"
#include "caproute/policy.h"
#include "caproute/request.h"
#include "caproute/scoring.h"
#include "caproute/tiebreak.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace caproute {

struct Alternative {
    std::string tool;
    std::string pattern;
    double score{0.0};
};

struct SelectionResult {
    ToolDefPtr tool;                     // the exact record that was scored
    std::string capability;
    std::string pattern_name;
    double score{0.0};
    std::vector<CriterionScore> breakdown;
    double estimated_time_ms{0.0};
    double estimated_cost{0.0};

    std::vector<Alternative> alternatives;   // next best, at most 3
    std::string execution_mode_hint;         // approval_required background immediate
    std::string sla_class;                   // interactive batch background
    size_t num_candidates{0};
    size_t num_policy_violations{0};
    std::string selection_method{"deterministic"};   // or tie_break
    std::string justification;
    std::optional<TieBreakTranscript> tie_break;

    // Stamped once at selection time (see enricher.h).
    RoutingInfo routing;
    bool routing_stamped{false};

    bool stale{false};
    uint64_t catalog_generation{0};

    const Pattern* pattern() const {
        return tool ? tool->find_pattern(capability, pattern_name) : nullptr;
    }
};

enum class SelectionStatus {
    OK,
    NO_ELIGIBLE_CANDIDATE,
    INVALID_REQUEST,
    SERVICE_UNAVAILABLE,
};

const char* selection_status_str(SelectionStatus s);

struct SelectionOutcome {
    SelectionStatus status{SelectionStatus::INVALID_REQUEST};
    std::shared_ptr<const SelectionResult> result;
    std::string result_json;           // serialized result; identical bytes for a cache hit
    std::string reason;
    std::vector<PolicyViolation> violations;
    int retry_after_seconds{0};
    bool from_cache{false};
    bool stale{false};
    std::string fingerprint;
};

std::string execution_mode_hint_for(const Pattern& p, double estimated_time_ms);
std::string sla_class_for(double estimated_time_ms);
// Human-readable reason for a deterministic pick, keyed by dominant_axis().
std::string deterministic_justification(const std::string& dominant);

// Uncached selection path:
// candidates -> policy filter -> scoring -> tie-break -> routing stamp.
// Throws CatalogUnavailable when the adapter has nothing to answer with.
class Resolver {
public:
    Resolver(CatalogAdapter& catalog, const ScoringEngine& scoring, TieBreakEscalator& tiebreak)
        : catalog_(catalog), scoring_(scoring), tiebreak_(tiebreak) {}

    SelectionOutcome resolve(const SelectionRequest& req);

private:
    CatalogAdapter& catalog_;
    const ScoringEngine& scoring_;
    TieBreakEscalator& tiebreak_;
};

} // namespace caproute
