#include "caproute/request.h"
#include "caproute/catalog.h"

#include <cmath>
#include <utility>

namespace caproute {

std::optional<PreferenceWeights> weights_for_mode(const std::string& mode) {
    const double hi = 0.4, lo = 0.15;
    if (mode.empty() || mode == "balanced") return PreferenceWeights{};
    if (mode == "fast") return PreferenceWeights{hi, lo, lo, lo, lo};
    if (mode == "accurate") return PreferenceWeights{lo, hi, lo, lo, lo};
    if (mode == "cheap") return PreferenceWeights{lo, lo, hi, lo, lo};
    if (mode == "simple") return PreferenceWeights{lo, lo, lo, hi, lo};
    if (mode == "thorough") return PreferenceWeights{lo, lo, lo, lo, hi};
    return std::nullopt;
}

std::string normalize_weights(PreferenceWeights& w) {
    double* axes[] = {&w.speed, &w.accuracy, &w.cost, &w.complexity, &w.completeness};
    double sum = 0.0;
    for (double* a : axes) {
        if (!std::isfinite(*a)) return "preference weights must be finite";
        if (*a < 0.0) return "preference weights must be non-negative";
        sum += *a;
    }
    if (!(sum > 0.0)) return "preference weights must not all be zero";
    for (double* a : axes) *a /= sum;
    return "";
}

static bool valid_capability(const std::string& c) {
    if (c.empty() || c.size() > 128) return false;
    for (char ch : c) {
        const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                        ch == '_' || ch == '.' || ch == ':' || ch == '-';
        if (!ok) return false;
    }
    return true;
}

std::string validate_request(const SelectionRequest& req) {
    if (req.capability.empty()) return "capability is required";
    if (!valid_capability(req.capability)) return "capability must match [A-Za-z0-9_.:-]+ (max 128 chars)";
    if (!req.platform.empty() && !is_known_platform(req.platform)) return "unknown platform: " + req.platform;
    if (!std::isfinite(req.n) || req.n < 0.0) return "N must be a finite non-negative number";
    if (!req.mode.empty() && !weights_for_mode(req.mode)) return "unknown preference mode: " + req.mode;
    if (req.weights) {
        PreferenceWeights w = *req.weights;
        std::string err = normalize_weights(w);
        if (!err.empty()) return err;
    }
    if (req.budget.max_cost && (!std::isfinite(*req.budget.max_cost) || *req.budget.max_cost < 0.0))
        return "budget.maxCost must be a finite non-negative number";
    if (req.budget.max_time_ms && (!std::isfinite(*req.budget.max_time_ms) || *req.budget.max_time_ms < 0.0))
        return "budget.maxTimeMs must be a finite non-negative number";
    if (req.environment.empty()) return "environment must not be empty";
    return "";
}

PreferenceWeights effective_weights(const SelectionRequest& req) {
    PreferenceWeights w = req.weights ? *req.weights : weights_for_mode(req.mode).value_or(PreferenceWeights{});
    if (!normalize_weights(w).empty()) w = PreferenceWeights{};
    return w;
}

std::string dominant_axis(const PreferenceWeights& w) {
    const std::pair<const char*, double> axes[] = {
        {"speed", w.speed}, {"accuracy", w.accuracy}, {"cost", w.cost},
        {"complexity", w.complexity}, {"completeness", w.completeness},
    };
    size_t best = 0;
    bool shared = false;
    for (size_t i = 1; i < 5; i++) {
        if (axes[i].second > axes[best].second + 1e-9) {
            best = i;
            shared = false;
        } else if (std::fabs(axes[i].second - axes[best].second) <= 1e-9) {
            shared = true;
        }
    }
    return shared ? "balanced" : axes[best].first;
}

} // namespace caproute
