#include "test_common.h"
#include "test_fixtures.h"

#include "caproute/tiebreak.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace caproute;

class ScriptedJudge : public ITieBreakJudge {
public:
    explicit ScriptedJudge(JudgeReply r, int sleep_ms = 0) : reply_(std::move(r)), sleep_ms_(sleep_ms) {}
    const char* name() const override { return "scripted"; }
    JudgeReply resolve_tie(const TieBreakPrompt& prompt, int64_t) override {
        last_prompt = prompt;
        calls++;
        if (sleep_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_));
        return reply_;
    }
    TieBreakPrompt last_prompt;
    std::atomic<int> calls{0};

private:
    JudgeReply reply_;
    int sleep_ms_;
};

class ThrowingJudge : public ITieBreakJudge {
public:
    const char* name() const override { return "throwing"; }
    JudgeReply resolve_tie(const TieBreakPrompt&, int64_t) override {
        throw std::runtime_error("backend exploded");
    }
};

// Throws something that is not a std::exception.
class ThrowingIntJudge : public ITieBreakJudge {
public:
    const char* name() const override { return "throwing_int"; }
    JudgeReply resolve_tie(const TieBreakPrompt&, int64_t) override { throw 42; }
};

static JudgeReply ok_reply(const std::string& raw) {
    JudgeReply r;
    r.ok = true;
    r.raw = raw;
    return r;
}

static std::string prefs(const std::string& speed) {
    return "\"speed\":" + speed + ",\"accuracy\":0.5,\"cost\":0.5,\"complexity\":0.5,\"completeness\":0.5";
}

int main() {
    namespace fs = std::filesystem;
    // a: 0.5, b: 0.5 + 0.2*0.05 = 0.51, c: 0.5 - 0.2*0.2 = 0.46
    PatternSpec a{"a", "1000", "1", prefs("0.5")};
    PatternSpec b{"b", "1000", "1", prefs("0.55")};
    PatternSpec c{"c", "1000", "1", prefs("0.3")};
    a.extra = "\"description\":\"rolling restart\",\"typical_use_cases\":[\"fleet\"]";
    auto t = make_tool(tool_json("t", "1.0.0", "cap", {a, b, c}));
    SelectionRequest req;
    req.capability = "cap";
    ScoringEngine engine;
    const std::vector<ScoredCandidate> ranked = engine.score(candidates_for({t}, "cap", ""), req);

    // Test 1: tie detection and prompt contents
    {
        expect_true(ranked[0].candidate.label() == "t/b", "b ranked first");
        TieBreakEscalator esc(std::make_shared<FirstChoiceJudge>());
        expect_true(esc.is_tie(ranked), "0.01 apart is a tie");
        std::vector<ScoredCandidate> one(ranked.begin(), ranked.begin() + 1);
        expect_true(!esc.is_tie(one), "single candidate is never a tie");

        TieBreakPrompt p = esc.build_prompt(ranked, req);
        expect_eq_ll((long long)p.choices.size(), 2, "only near-tied candidates presented");
        expect_true(p.choices[0] == "t/b" && p.choices[1] == "t/a", "ranked order");
        expect_true(p.text.find("Capability: cap") != std::string::npos, "capability in prompt");
        expect_true(p.text.find("rolling restart") != std::string::npos, "details included within budget");

        TieBreakOptions small;
        small.max_prompt_chars = 300;
        TieBreakEscalator tight(std::make_shared<FirstChoiceJudge>(), small);
        TieBreakPrompt sp = tight.build_prompt(ranked, req);
        expect_true(sp.text.size() <= 300, "prompt bounded");
    }

    // Test 2: judge picks a presented candidate
    {
        auto judge = std::make_shared<ScriptedJudge>(ok_reply("{\"choice\":\"t/a\",\"reason\":\"safer\"}"));
        TieBreakEscalator esc(judge);
        TieBreakOutcome o = esc.resolve(ranked, req);
        expect_true(o.transcript.has_value(), "transcript recorded");
        expect_eq_ll((long long)o.winner_index, 1, "judge winner index");
        expect_true(o.transcript->resolution == "judge", "resolved by judge");
        expect_true(o.transcript->winner == "t/a" && o.transcript->reason == "safer", "winner and reason");
        expect_true(o.transcript->judge == "scripted", "judge name");
        expect_eq_ll((long long)esc.escalations(), 1, "escalation counted");
    }

    // Test 3: no tie means no judge call
    {
        auto judge = std::make_shared<ScriptedJudge>(ok_reply("{}"));
        TieBreakOptions opt;
        opt.epsilon = 0.005;
        TieBreakEscalator esc(judge, opt);
        TieBreakOutcome o = esc.resolve(ranked, req);
        expect_true(!o.transcript.has_value() && o.winner_index == 0, "deterministic winner");
        expect_eq_ll(judge->calls.load(), 0, "judge not consulted");
    }

    // Test 4: every judge failure falls back to the top score
    {
        struct Case { JudgeReply reply; const char* resolution; };
        JudgeReply err;
        err.error = "boom";
        JudgeReply open;
        open.circuit_open = true;
        open.error = "open";
        const Case cases[] = {
            {ok_reply("not json"), "fallback_malformed"},
            {ok_reply("{\"reason\":\"no choice\"}"), "fallback_malformed"},
            {ok_reply("{\"choice\":\"t/c\"}"), "fallback_unknown_choice"},
            {err, "fallback_error"},
            {open, "fallback_circuit_open"},
        };
        for (const auto& cs : cases) {
            TieBreakEscalator esc(std::make_shared<ScriptedJudge>(cs.reply));
            TieBreakOutcome o = esc.resolve(ranked, req);
            expect_eq_ll((long long)o.winner_index, 0, std::string("fallback winner for ") + cs.resolution);
            expect_true(o.transcript && o.transcript->resolution == cs.resolution, cs.resolution);
            expect_true(o.transcript->winner == "t/b", "fallback keeps top score");
            expect_eq_ll((long long)esc.fallbacks(), 1, "fallback counted");
        }

        TieBreakEscalator thr(std::make_shared<ThrowingJudge>());
        TieBreakOutcome o = thr.resolve(ranked, req);
        expect_true(o.transcript->resolution == "fallback_error", "throwing judge contained");
        expect_true(o.transcript->error.find("backend exploded") != std::string::npos, "exception text kept");

        TieBreakEscalator thr_int(std::make_shared<ThrowingIntJudge>());
        TieBreakOutcome oi = thr_int.resolve(ranked, req);
        expect_eq_ll((long long)oi.winner_index, 0, "non-exception throw falls back");
        expect_true(oi.transcript->resolution == "fallback_error", "non-exception throw contained");
        expect_true(oi.transcript->error == "judge threw", "generic error recorded");
    }

    // Test 5: slow judge is abandoned at the timeout
    {
        auto slow = std::make_shared<ScriptedJudge>(ok_reply("{\"choice\":\"t/a\"}"), 500);
        TieBreakOptions opt;
        opt.timeout_ms = 50;
        TieBreakEscalator esc(slow, opt);
        auto t0 = std::chrono::steady_clock::now();
        TieBreakOutcome o = esc.resolve(ranked, req);
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(o.transcript->resolution == "fallback_timeout", "timeout fallback");
        expect_eq_ll((long long)o.winner_index, 0, "timeout keeps top score");
        expect_true(waited < 450, "did not wait for the slow judge");
        // let the abandoned call finish before the judge goes out of scope here
        std::this_thread::sleep_for(std::chrono::milliseconds(550));
    }

    // Test 6: external process judge reads the payload file and answers on stdout
    {
        fs::path dir = fs::temp_directory_path() / "caproute_test_tiebreak";
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir, ec);
        {
            std::ofstream s(dir / "judge.sh");
            s << "grep -q '\"choices\"' \"$1\" || exit 3\n"
              << "echo '{\"choice\":\"t/a\",\"reason\":\"from script\"}'\n";
        }
        {
            std::ofstream s(dir / "fail.sh");
            s << "exit 1\n";
        }

        ExternalProcessJudge judge("sh " + (dir / "judge.sh").string(), dir);
        TieBreakPrompt p;
        p.text = "pick";
        p.choices = {"t/b", "t/a"};
        JudgeReply r = judge.resolve_tie(p, 3000);
        expect_true(r.ok, "script judge ok: " + r.error);
        expect_true(r.raw.find("from script") != std::string::npos, "stdout captured");

        ExternalProcessJudge blocked("/bin/echo hi", dir);
        r = blocked.resolve_tie(p, 3000);
        expect_true(!r.ok && r.error.find("not allowed") != std::string::npos, "allowlist enforced");

        setenv("CAPROUTE_JUDGE_FAIL_THRESHOLD", "2", 1);
        ExternalProcessJudge failing("sh " + (dir / "fail.sh").string(), dir);
        unsetenv("CAPROUTE_JUDGE_FAIL_THRESHOLD");
        expect_true(!failing.resolve_tie(p, 3000).ok, "first failure");
        expect_true(!failing.circuit_open(), "below threshold");
        expect_true(!failing.resolve_tie(p, 3000).ok, "second failure");
        expect_true(failing.circuit_open(), "circuit opens at threshold");
        r = failing.resolve_tie(p, 3000);
        expect_true(r.circuit_open, "open circuit short-circuits");

        fs::remove_all(dir, ec);
    }

    std::cerr << "test_tiebreak: ALL PASSED" << std::endl;
    return 0;
}
