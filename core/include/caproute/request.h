#pragma once

#include <optional>
#include <string>
#include <vector>

namespace caproute {

// Weight per preference-match axis. Normalized to sum 1 before scoring.
struct PreferenceWeights {
    double speed{0.2};
    double accuracy{0.2};
    double cost{0.2};
    double complexity{0.2};
    double completeness{0.2};
};

// Presets: balanced, fast, accurate, thorough, cheap, simple.
std::optional<PreferenceWeights> weights_for_mode(const std::string& mode);

// Scales w to sum 1. Returns "" on success; rejects negative, non-finite, zero sum.
std::string normalize_weights(PreferenceWeights& w);

struct Budget {
    std::optional<double> max_time_ms;
    std::optional<double> max_cost;
};

struct SelectionRequest {
    std::string capability;
    std::string platform;                       // empty: any
    double n{1.0};
    std::optional<PreferenceWeights> weights;   // explicit weights win over mode
    std::string mode;                           // empty: balanced
    Budget budget;
    bool production_safe_only{false};
    bool allow_approval_required{true};
    std::string environment{"production"};
    std::vector<std::string> permissions;
};

// "" when the request is well-formed, else the reason (reported as InvalidRequest).
std::string validate_request(const SelectionRequest& req);

// Normalized weights the scoring engine will use. Call after validate_request().
PreferenceWeights effective_weights(const SelectionRequest& req);

// Axis carrying strictly the largest weight ("speed", "accuracy", "cost",
// "complexity", "completeness"), or "balanced" when the top is shared.
std::string dominant_axis(const PreferenceWeights& w);

} // namespace caproute
