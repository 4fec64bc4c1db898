#pragma once

#include "caproute/proc.h"
#include "caproute/request.h"
#include "caproute/scoring.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace caproute {

struct TieBreakPrompt {
    std::string text;
    std::vector<std::string> choices;   // "tool/pattern", in ranked order
};

struct JudgeReply {
    bool ok{false};
    bool circuit_open{false};
    std::string raw;      // judge output, expected {"choice": "...", "reason": "..."}
    std::string error;
};

// External decision collaborator. Implementations must return within
// timeout_ms or accept being abandoned by the escalator.
class ITieBreakJudge {
public:
    virtual ~ITieBreakJudge() = default;
    virtual const char* name() const = 0;
    virtual JudgeReply resolve_tie(const TieBreakPrompt& prompt, int64_t timeout_ms) = 0;
};

// Always picks the first presented candidate.
class FirstChoiceJudge final : public ITieBreakJudge {
public:
    const char* name() const override { return "first_choice"; }
    JudgeReply resolve_tie(const TieBreakPrompt& prompt, int64_t timeout_ms) override;
};

// Runs an operator command (no shell) with the payload file path appended.
// Executable basename must be allowlisted (CAPROUTE_JUDGE_ALLOWED_EXE), unless
// CAPROUTE_JUDGE_ALLOW_UNSAFE=1. Circuit breaker: after
// CAPROUTE_JUDGE_FAIL_THRESHOLD consecutive failures (default 5) the judge is
// bypassed for CAPROUTE_JUDGE_COOLDOWN_MS (default 30000).
class ExternalProcessJudge final : public ITieBreakJudge {
public:
    ExternalProcessJudge(std::string cmd, std::filesystem::path work_dir);

    const char* name() const override { return "external_process"; }
    JudgeReply resolve_tie(const TieBreakPrompt& prompt, int64_t timeout_ms) override;

    bool circuit_open() const;

private:
    JudgeReply mark_failure(const std::string& why, const std::string& raw);

    std::string cmd_;
    std::vector<std::string> argv_;
    std::filesystem::path work_dir_;
    ProcLimits lim_;
    std::vector<std::string> allowed_exec_basenames_;
    bool allow_unsafe_{false};
    int fail_threshold_{5};
    int64_t cooldown_ms_{30000};
    std::atomic<int> consecutive_fail_{0};
    std::atomic<int64_t> disabled_until_ms_{0};
};

struct TieBreakOptions {
    double epsilon{0.02};
    int64_t timeout_ms{3000};
    size_t max_candidates{3};
    size_t max_prompt_chars{2000};
};

struct TieBreakTranscript {
    std::string judge;
    std::string prompt;
    std::vector<std::string> choices;
    std::string raw_response;
    // judge | fallback_timeout | fallback_malformed | fallback_unknown_choice
    // | fallback_error | fallback_circuit_open
    std::string resolution;
    std::string winner;
    std::string reason;
    std::string error;
    int64_t elapsed_ms{0};   // audit and stats only; not part of the serialized result
};

struct TieBreakOutcome {
    size_t winner_index{0};                        // into the ranked list
    std::optional<TieBreakTranscript> transcript;  // set when escalation was attempted
};

// Escalates near-ties (top two scores closer than epsilon) to a judge under a
// hard timeout. Any judge failure falls back to ranked[0]; never throws for
// judge errors.
class TieBreakEscalator {
public:
    explicit TieBreakEscalator(std::shared_ptr<ITieBreakJudge> judge, TieBreakOptions opt = {});

    bool is_tie(const std::vector<ScoredCandidate>& ranked) const;
    TieBreakPrompt build_prompt(const std::vector<ScoredCandidate>& ranked, const SelectionRequest& req) const;
    TieBreakOutcome resolve(const std::vector<ScoredCandidate>& ranked, const SelectionRequest& req);

    const TieBreakOptions& options() const { return opt_; }
    uint64_t escalations() const { return escalations_.load(); }
    uint64_t fallbacks() const { return fallbacks_.load(); }
    uint64_t judge_ms_total() const { return judge_ms_total_.load(); }

private:
    std::shared_ptr<ITieBreakJudge> judge_;
    TieBreakOptions opt_;
    std::atomic<uint64_t> escalations_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> judge_ms_total_{0};
};

} // namespace caproute
