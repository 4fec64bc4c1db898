#include "test_common.h"
#include "test_fixtures.h"

#include "caproute/scoring.h"

#include <cmath>
#include <cstring>

using namespace caproute;

static std::string prefs(double speed, double accuracy, double cost, double complexity, double completeness) {
    return "\"speed\":" + std::to_string(speed) + ",\"accuracy\":" + std::to_string(accuracy) +
           ",\"cost\":" + std::to_string(cost) + ",\"complexity\":" + std::to_string(complexity) +
           ",\"completeness\":" + std::to_string(completeness);
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    PatternSpec quick{"quick", "\"100 * N\"", "\"1 * N\"", prefs(0.9, 0.5, 0.3, 0.5, 0.5)};
    PatternSpec careful{"careful", "\"1000 * N\"", "\"0.1 * N\"", prefs(0.2, 0.9, 0.9, 0.5, 0.9)};
    auto t = make_tool(tool_json("t", "1.0.0", "cap", {quick, careful}));
    const std::vector<Candidate> cs = candidates_for({t}, "cap", "");
    ScoringEngine engine;

    // Test 1: weighted sum with balanced weights
    {
        SelectionRequest r;
        r.capability = "cap";
        auto out = engine.score(cs, r);
        expect_eq_ll((long long)out.size(), 2, "both scored");
        expect_true(out[0].candidate.pattern->name == "careful", "careful wins balanced");
        expect_true(near(out[0].score, (0.2 + 0.9 + 0.9 + 0.5 + 0.9) / 5.0), "balanced score");
        expect_true(near(out[1].score, (0.9 + 0.5 + 0.3 + 0.5 + 0.5) / 5.0), "quick score");
        expect_eq_ll((long long)out[0].breakdown.size(), 5, "five criteria");
        double sum = 0.0;
        for (const auto& b : out[0].breakdown) sum += b.contribution;
        expect_true(near(sum, out[0].score), "breakdown sums to score");
        expect_true(out[0].estimated_time_ms == 1000.0 && near(out[0].estimated_cost, 0.1), "estimates at N=1");
    }

    // Test 2: mode changes the ranking
    {
        SelectionRequest r;
        r.capability = "cap";
        r.mode = "fast";
        auto out = engine.score(cs, r);
        // quick: 0.4*0.9 + 0.15*(0.5+0.3+0.5+0.5) = 0.63; careful: 0.4*0.2 + 0.15*3.2 = 0.56
        expect_true(out[0].candidate.pattern->name == "quick", "fast mode prefers quick");
        expect_true(near(out[0].score, 0.63), "fast score");
    }

    // Test 3: budget overrun scales the speed and cost axes
    {
        SelectionRequest r;
        r.capability = "cap";
        r.n = 10;
        r.budget.max_time_ms = 5000;   // careful models 10000ms
        auto out = engine.score(cs, r);
        const ScoredCandidate* careful_sc = nullptr;
        for (const auto& s : out) if (s.candidate.pattern->name == "careful") careful_sc = &s;
        expect_true(careful_sc != nullptr, "careful scored");
        expect_true(near(careful_sc->breakdown[0].axis_score, 0.2 * 0.5), "speed axis halved");
        expect_true(near(careful_sc->breakdown[2].axis_score, 0.9), "cost axis untouched without cost budget");

        r.budget.max_time_ms = 0;
        out = engine.score(cs, r);
        for (const auto& s : out) expect_true(s.breakdown[0].axis_score == 0.0, "zero budget zeroes speed");
    }

    // Test 4: ties broken by tool then pattern name, bit-reproducible
    {
        PatternSpec a{"a"};
        PatternSpec b{"b"};
        auto t1 = make_tool(tool_json("zeta", "1.0.0", "cap", {b, a}));
        auto t2 = make_tool(tool_json("alpha", "1.0.0", "cap", {b}));
        auto all = candidates_for({t1, t2}, "cap", "");
        SelectionRequest r;
        r.capability = "cap";
        auto out1 = engine.score(all, r);
        expect_true(out1[0].candidate.label() == "alpha/b", "alpha first");
        expect_true(out1[1].candidate.label() == "zeta/a", "then zeta/a");
        expect_true(out1[2].candidate.label() == "zeta/b", "then zeta/b");

        std::vector<Candidate> reversed(all.rbegin(), all.rend());
        auto out2 = engine.score(reversed, r);
        for (size_t i = 0; i < out1.size(); i++) {
            expect_true(out1[i].candidate.label() == out2[i].candidate.label(), "order independent of input");
            expect_true(std::memcmp(&out1[i].score, &out2[i].score, sizeof(double)) == 0, "identical bits");
        }
        expect_true(engine.invocations() >= 6, "invocations counted");
    }

    std::cerr << "test_scoring: ALL PASSED" << std::endl;
    return 0;
}
