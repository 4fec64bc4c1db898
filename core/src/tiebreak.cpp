#include "caproute/tiebreak.h"
#include "caproute/crypto.h"
#include "caproute/json_mini.h"
#include "caproute/util.h"

#include <json-c/json.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace caproute {

// ---------- FirstChoiceJudge ----------

JudgeReply FirstChoiceJudge::resolve_tie(const TieBreakPrompt& prompt, int64_t timeout_ms) {
    (void)timeout_ms;
    JudgeReply r;
    if (prompt.choices.empty()) {
        r.error = "no choices presented";
        return r;
    }
    r.ok = true;
    r.raw = "{\"choice\":\"" + json_mini::json_escape(prompt.choices.front()) +
            "\",\"reason\":\"first presented candidate\"}";
    return r;
}

// ---------- ExternalProcessJudge ----------

ExternalProcessJudge::ExternalProcessJudge(std::string cmd, std::filesystem::path work_dir)
    : cmd_(std::move(cmd)), work_dir_(std::move(work_dir)) {
    argv_ = split_argv_quoted(cmd_);

    allowed_exec_basenames_ = {"python3", "python", "bash", "sh", "node"};
    if (const char* al = std::getenv("CAPROUTE_JUDGE_ALLOWED_EXE")) {
        allowed_exec_basenames_.clear();
        for (auto& t : split_csv(al)) allowed_exec_basenames_.push_back(lower_ascii(t));
    }
    allow_unsafe_ = getenv_bool("CAPROUTE_JUDGE_ALLOW_UNSAFE", false);

    lim_.timeout_ms = getenv_int("CAPROUTE_JUDGE_TIMEOUT_MS", 3000);
    lim_.output_max_bytes = (size_t)getenv_i64("CAPROUTE_JUDGE_STDOUT_MAX", 16 * 1024);
    lim_.rlimit_cpu_sec = getenv_int("CAPROUTE_JUDGE_RLIMIT_CPU_SEC", 5);
    lim_.rlimit_as_mb = (size_t)getenv_i64("CAPROUTE_JUDGE_RLIMIT_AS_MB", 768);
    lim_.rlimit_nofile = getenv_int("CAPROUTE_JUDGE_RLIMIT_NOFILE", 64);

    fail_threshold_ = getenv_int("CAPROUTE_JUDGE_FAIL_THRESHOLD", 5);
    if (fail_threshold_ < 1) fail_threshold_ = 1;
    cooldown_ms_ = getenv_i64("CAPROUTE_JUDGE_COOLDOWN_MS", 30000);
    if (cooldown_ms_ < 0) cooldown_ms_ = 0;
}

bool ExternalProcessJudge::circuit_open() const {
    return disabled_until_ms_.load() > now_ms();
}

JudgeReply ExternalProcessJudge::mark_failure(const std::string& why, const std::string& raw) {
    if (++consecutive_fail_ >= fail_threshold_) {
        disabled_until_ms_ = now_ms() + cooldown_ms_;
        std::cerr << "[tiebreak] judge disabled for " << cooldown_ms_ << "ms after "
                  << consecutive_fail_.load() << " consecutive failures\n";
    }
    JudgeReply r;
    r.raw = raw;
    r.error = why;
    return r;
}

JudgeReply ExternalProcessJudge::resolve_tie(const TieBreakPrompt& prompt, int64_t timeout_ms) {
    JudgeReply r;
    if (argv_.empty()) {
        r.error = "judge command is empty or unparseable";
        return r;
    }
    if (circuit_open()) {
        r.circuit_open = true;
        r.error = "judge circuit open";
        return r;
    }

    // Allowlist checks (no shell)
    if (!allow_unsafe_) {
        std::string exe_base = lower_ascii(std::filesystem::path(argv_[0]).filename().string());
        bool ok = false;
        for (const auto& a : allowed_exec_basenames_) {
            if (exe_base == a) { ok = true; break; }
        }
        if (!ok) {
            r.error = "judge exe not allowed: " + exe_base;
            return r;
        }
    }

    json_object* root = json_object_new_object();
    struct JsonGuard { json_object* o; ~JsonGuard() { if (o) json_object_put(o); } };
    JsonGuard root_guard{root};
    json_object_object_add(root, "prompt", json_object_new_string(prompt.text.c_str()));
    json_object* arr = json_object_new_array();
    for (const auto& c : prompt.choices) json_object_array_add(arr, json_object_new_string(c.c_str()));
    json_object_object_add(root, "choices", arr);
    json_object_object_add(root, "response_schema",
                           json_object_new_string("{\"choice\": <one of choices>, \"reason\": <string>}"));
    const std::string payload = json_mini::to_string(root);

    std::filesystem::path payload_path;
    {
        std::error_code ec;
        auto tmp_dir = std::filesystem::temp_directory_path(ec);
        if (ec) return mark_failure("no temp directory: " + ec.message(), "");
        payload_path = tmp_dir / ("caproute_tiebreak_" + random_hex(8) + ".json");
    }
    {
        std::ofstream f(payload_path, std::ios::binary);
        if (!f) return mark_failure("cannot write payload file", "");
        f.write(payload.data(), (std::streamsize)payload.size());
    }

    ProcSpec spec;
    spec.argv = argv_;
    spec.argv.push_back(payload_path.string());
    spec.cwd = work_dir_.string();
    ProcLimits lim = lim_;
    if (timeout_ms > 0 && (lim.timeout_ms <= 0 || timeout_ms < lim.timeout_ms)) lim.timeout_ms = timeout_ms;

    ProcResult pr;
    bool started = proc_run(spec, lim, &pr);
    std::error_code ec;
    std::filesystem::remove(payload_path, ec);

    if (!started) return mark_failure(pr.error.empty() ? "judge not started" : pr.error, "");
    if (pr.timed_out) return mark_failure("judge timed out", pr.output);
    if (pr.exit_code != 0) return mark_failure("judge exit_code=" + std::to_string(pr.exit_code), pr.output);

    std::string out = trim_ws(pr.output);
    if (out.empty()) return mark_failure("empty judge output", "");

    consecutive_fail_ = 0;
    disabled_until_ms_ = 0;
    r.ok = true;
    r.raw = out;
    return r;
}

// ---------- TieBreakEscalator ----------

TieBreakEscalator::TieBreakEscalator(std::shared_ptr<ITieBreakJudge> judge, TieBreakOptions opt)
    : judge_(std::move(judge)), opt_(opt) {
    if (opt_.max_candidates < 2) opt_.max_candidates = 2;
}

bool TieBreakEscalator::is_tie(const std::vector<ScoredCandidate>& ranked) const {
    if (ranked.size() < 2) return false;
    return (ranked[0].score - ranked[1].score) < opt_.epsilon;
}

static std::string join_list(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); i++) {
        if (i) out += "; ";
        out += v[i];
    }
    return out;
}

TieBreakPrompt TieBreakEscalator::build_prompt(const std::vector<ScoredCandidate>& ranked,
                                               const SelectionRequest& req) const {
    TieBreakPrompt p;
    if (ranked.empty()) return p;
    const double top = ranked[0].score;
    for (size_t i = 0; i < ranked.size() && p.choices.size() < opt_.max_candidates; i++) {
        if (top - ranked[i].score >= opt_.epsilon && i > 0) break;
        p.choices.push_back(ranked[i].candidate.label());
    }

    std::ostringstream head;
    char nbuf[64];
    std::snprintf(nbuf, sizeof(nbuf), "%g", req.n);
    head << "Capability: " << req.capability << " (N=" << nbuf << ", environment=" << req.environment << ")\n"
         << "These candidates scored within " << opt_.epsilon << " of each other. Choose exactly one.\n"
         << "Reply with a JSON object only: {\"choice\": \"<tool/pattern>\", \"reason\": \"<short>\"}\n";

    // Essential line per candidate first; details only while the budget allows.
    std::vector<std::string> essentials, details;
    for (size_t i = 0; i < p.choices.size(); i++) {
        const ScoredCandidate& sc = ranked[i];
        const Pattern& pat = *sc.candidate.pattern;
        char line[256];
        std::snprintf(line, sizeof(line), "%zu. %s score=%.4f time_ms=%g cost=%g completeness=%s%s\n",
                      i + 1, p.choices[i].c_str(), sc.score, sc.estimated_time_ms, sc.estimated_cost,
                      pat.completeness.c_str(), pat.policy.requires_approval ? " requires_approval" : "");
        essentials.emplace_back(line);

        std::string d;
        if (!pat.description.empty()) d += "   " + pat.description + "\n";
        if (!pat.typical_use_cases.empty()) d += "   use: " + join_list(pat.typical_use_cases) + "\n";
        if (!pat.limitations.empty()) d += "   limits: " + join_list(pat.limitations) + "\n";
        details.push_back(std::move(d));
    }

    std::string text = head.str();
    size_t budget_used = text.size();
    for (const auto& e : essentials) budget_used += e.size();
    for (size_t i = 0; i < essentials.size(); i++) {
        text += essentials[i];
        if (budget_used + details[i].size() <= opt_.max_prompt_chars) {
            text += details[i];
            budget_used += details[i].size();
        }
    }
    if (text.size() > opt_.max_prompt_chars) text.resize(opt_.max_prompt_chars);
    p.text = std::move(text);
    return p;
}

namespace {

// Shared between the escalator and a judge call it may abandon on timeout.
struct PendingCall {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
    JudgeReply reply;
};

} // namespace

TieBreakOutcome TieBreakEscalator::resolve(const std::vector<ScoredCandidate>& ranked,
                                           const SelectionRequest& req) {
    TieBreakOutcome out;
    if (!is_tie(ranked) || !judge_) return out;
    escalations_++;

    TieBreakTranscript tr;
    tr.judge = judge_->name();
    TieBreakPrompt prompt = build_prompt(ranked, req);
    tr.prompt = prompt.text;
    tr.choices = prompt.choices;
    tr.winner = ranked[0].candidate.label();

    const int64_t t0 = now_ms();
    auto call = std::make_shared<PendingCall>();
    std::shared_ptr<ITieBreakJudge> judge = judge_;
    const int64_t timeout_ms = opt_.timeout_ms;

    std::thread worker([call, judge, prompt, timeout_ms] {
        JudgeReply r;
        try {
            r = judge->resolve_tie(prompt, timeout_ms);
        } catch (const std::exception& e) {
            r.ok = false;
            r.error = std::string("judge threw: ") + e.what();
        } catch (...) {
            r.ok = false;
            r.error = "judge threw";
        }
        std::lock_guard<std::mutex> lk(call->mu);
        call->reply = std::move(r);
        call->done = true;
        call->cv.notify_all();
    });

    bool finished;
    {
        std::unique_lock<std::mutex> lk(call->mu);
        finished = call->cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return call->done; });
    }
    if (finished) {
        worker.join();
    } else {
        // Abandon the call; it owns copies of everything it touches.
        worker.detach();
    }
    tr.elapsed_ms = now_ms() - t0;
    judge_ms_total_ += static_cast<uint64_t>(tr.elapsed_ms);

    auto fallback = [&](const char* resolution, std::string err) {
        tr.resolution = resolution;
        tr.error = std::move(err);
        fallbacks_++;
        std::cerr << "[tiebreak] " << resolution << ": " << tr.error << " (keeping " << tr.winner << ")\n";
        out.winner_index = 0;
        out.transcript = std::move(tr);
        return out;
    };

    if (!finished) return fallback("fallback_timeout", "judge did not answer within " + std::to_string(timeout_ms) + "ms");

    JudgeReply reply;
    {
        std::lock_guard<std::mutex> lk(call->mu);
        reply = call->reply;
    }
    tr.raw_response = reply.raw;
    if (reply.circuit_open) return fallback("fallback_circuit_open", reply.error);
    if (!reply.ok) return fallback("fallback_error", reply.error);

    json_mini::Doc d = json_mini::parse(reply.raw);
    if (!d || !json_object_is_type(d.root, json_type_object)) return fallback("fallback_malformed", "reply is not a JSON object");
    auto choice = json_mini::field_string(d.root, "choice");
    if (!choice) return fallback("fallback_malformed", "reply has no string 'choice'");

    for (size_t i = 0; i < prompt.choices.size(); i++) {
        if (prompt.choices[i] == *choice) {
            tr.resolution = "judge";
            tr.winner = *choice;
            tr.reason = json_mini::field_string(d.root, "reason").value_or("");
            out.winner_index = i;
            out.transcript = std::move(tr);
            return out;
        }
    }
    return fallback("fallback_unknown_choice", "judge chose '" + *choice + "' which was not presented");
}

} // namespace caproute
