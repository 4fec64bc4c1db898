#include "caproute/dispatcher.h"
#include "caproute/crypto.h"
#include "caproute/json_mini.h"
#include "caproute/ready_queue.h"
#include "caproute/util.h"

#include <json-c/json.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

namespace caproute {

const char* failure_policy_str(FailurePolicy p) {
    switch (p) {
        case FailurePolicy::ABORT_ON_FIRST_FAILURE: return "abort-on-first-failure";
        case FailurePolicy::CONTINUE_AND_COLLECT: return "continue-and-collect";
    }
    return "abort-on-first-failure";
}

std::optional<FailurePolicy> failure_policy_from_str(const std::string& s) {
    std::string v = lower_ascii(s);
    std::replace(v.begin(), v.end(), '_', '-');
    if (v == "abort-on-first-failure" || v == "abort") return FailurePolicy::ABORT_ON_FIRST_FAILURE;
    if (v == "continue-and-collect" || v == "continue") return FailurePolicy::CONTINUE_AND_COLLECT;
    return std::nullopt;
}

const char* plan_status_str(PlanStatus s) {
    switch (s) {
        case PlanStatus::SUCCEEDED: return "succeeded";
        case PlanStatus::PARTIAL: return "partial";
        case PlanStatus::FAILED: return "failed";
        case PlanStatus::CANCELLED: return "cancelled";
    }
    return "failed";
}

std::string validate_plan(const ExecutionPlan& plan) {
    std::set<std::string> seen;
    for (size_t i = 0; i < plan.steps.size(); i++) {
        const auto& s = plan.steps[i];
        if (s.id.empty()) return "step " + std::to_string(i) + " has no id";
        if (seen.count(s.id)) return "duplicate step id '" + s.id + "'";
        for (const auto& d : s.depends_on) {
            if (d == s.id) return "step '" + s.id + "' depends on itself";
            if (!seen.count(d)) return "step '" + s.id + "' depends on '" + d + "', which is not an earlier step";
        }
        if (!json_mini::is_object(s.inputs_json.empty() ? std::string("{}") : s.inputs_json))
            return "step '" + s.id + "' inputs must be a JSON object";
        seen.insert(s.id);
    }
    if (plan.timeout_ms && *plan.timeout_ms <= 0) return "timeoutMs must be > 0";
    if (plan.max_concurrency && *plan.max_concurrency <= 0) return "maxConcurrency must be > 0";
    return "";
}

// ---------- output chaining ----------

namespace {

struct Substituter {
    const std::vector<std::string>& deps;
    const std::map<std::string, std::string>& outputs;
    std::string err;

    bool apply(const std::string& in, std::string* out) {
        out->clear();
        size_t i = 0;
        while (i < in.size()) {
            size_t open = in.find("${", i);
            if (open == std::string::npos) {
                out->append(in, i, std::string::npos);
                break;
            }
            size_t close = in.find('}', open + 2);
            const std::string ref = close == std::string::npos ? std::string() : in.substr(open + 2, close - open - 2);
            const std::string suffix = ".output";
            if (ref.size() <= suffix.size() || !ref.ends_with(suffix)) {
                out->append(in, i, open + 2 - i);
                i = open + 2;
                continue;
            }
            const std::string id = ref.substr(0, ref.size() - suffix.size());
            if (std::find(deps.begin(), deps.end(), id) == deps.end()) {
                err = "${" + ref + "} refers to '" + id + "', which is not a declared dependency";
                return false;
            }
            auto it = outputs.find(id);
            if (it == outputs.end()) {
                err = "no output recorded for step '" + id + "'";
                return false;
            }
            out->append(in, i, open - i);
            out->append(trim_ws(it->second));
            i = close + 1;
        }
        return true;
    }

    // Rewrites string leaves in place.
    bool walk(json_object* v) {
        if (json_object_is_type(v, json_type_object)) {
            std::vector<std::string> keys;
            json_object_object_foreach(v, k, child) {
                (void)child;
                keys.emplace_back(k);
            }
            for (const auto& k : keys) {
                json_object* child = json_mini::field(v, k.c_str());
                if (child && json_object_is_type(child, json_type_string)) {
                    std::string repl;
                    if (!apply(json_object_get_string(child), &repl)) return false;
                    json_object_object_add(v, k.c_str(), json_object_new_string(repl.c_str()));
                } else if (child && !walk(child)) {
                    return false;
                }
            }
        } else if (json_object_is_type(v, json_type_array)) {
            const size_t n = json_object_array_length(v);
            for (size_t i = 0; i < n; i++) {
                json_object* child = json_object_array_get_idx(v, i);
                if (child && json_object_is_type(child, json_type_string)) {
                    std::string repl;
                    if (!apply(json_object_get_string(child), &repl)) return false;
                    json_object_array_put_idx(v, i, json_object_new_string(repl.c_str()));
                } else if (child && !walk(child)) {
                    return false;
                }
            }
        }
        return true;
    }
};

} // namespace

std::string substitute_outputs(const std::string& inputs_json,
                               const std::vector<std::string>& deps,
                               const std::map<std::string, std::string>& outputs,
                               std::string* out) {
    json_mini::Doc d = json_mini::parse(inputs_json.empty() ? std::string("{}") : inputs_json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return "inputs must be a JSON object";
    if (inputs_json.find("${") == std::string::npos) {
        *out = inputs_json.empty() ? std::string("{}") : inputs_json;
        return "";
    }
    Substituter sub{deps, outputs, ""};
    if (!sub.walk(d.root)) return sub.err;
    *out = json_mini::to_string(d.root);
    return "";
}

// ---------- dispatcher ----------

struct Dispatcher::Run {
    std::string plan_id;
    CancelToken* cancel{nullptr};
    int64_t deadline_ms{0};     // monotonic
};

Dispatcher::Dispatcher(AdapterRegistry& adapters,
                       ApprovalLeaseManager* approvals,
                       TelemetryRecorder* telemetry,
                       DispatcherOptions opt)
    : adapters_(adapters), approvals_(approvals), telemetry_(telemetry), opt_(opt) {
    if (opt_.default_step_timeout_ms <= 0) opt_.default_step_timeout_ms = 60000;
    if (opt_.max_concurrency <= 0) opt_.max_concurrency = 1;
}

int64_t Dispatcher::step_timeout_for(const EnrichedExecutionStep& step) const {
    if (step.max_execution_time_ms && *step.max_execution_time_ms > 0) return *step.max_execution_time_ms;
    return opt_.default_step_timeout_ms;
}

int Dispatcher::concurrency_for(const ExecutionPlan& plan) const {
    int n = 0;
    if (plan.max_concurrency) {
        n = *plan.max_concurrency;
    } else {
        std::set<std::string> hosts;
        for (const auto& s : plan.steps) hosts.insert(s.target_host.empty() ? std::string("localhost") : s.target_host);
        n = static_cast<int>(hosts.size());
    }
    n = std::min(n, opt_.max_concurrency);
    n = std::min(n, static_cast<int>(plan.steps.size()));
    return std::max(n, 1);
}

static StepResult not_run(const EnrichedExecutionStep& step, StepStatus st, std::string why) {
    StepResult r;
    r.step_id = step.id;
    r.tool = step.tool;
    r.pattern = step.pattern;
    r.status = st;
    r.error = std::move(why);
    return r;
}

void Dispatcher::record_telemetry(const EnrichedExecutionStep& step, const StepResult& r, const std::string& plan_id) {
    if (!telemetry_) return;
    TelemetryRecord t;
    t.tool = step.tool;
    t.pattern = step.pattern;
    t.observed_time_ms = static_cast<double>(r.duration_ms);
    // Backends report no spend; the modeled cost is what the run is charged.
    t.observed_cost = step.estimated_cost;
    t.success = r.status == StepStatus::SUCCEEDED;
    if (!step.tool_version.empty()) t.tool_version = step.tool_version;
    if (!step.capability.empty()) t.capability = step.capability;
    t.estimated_time_ms = step.estimated_time_ms;
    t.estimated_cost = step.estimated_cost;
    if (!r.error.empty()) t.error = r.error;
    t.step_id = step.id;
    t.plan_id = plan_id;
    if (!telemetry_->record(std::move(t)))
        std::cerr << "[dispatch] telemetry dropped for step " << step.id << "\n";
}

StepResult Dispatcher::run_step(const EnrichedExecutionStep& step, Run& run,
                                const std::map<std::string, std::string>& outputs) {
    if (run.cancel->cancelled()) return not_run(step, StepStatus::CANCELLED, "plan cancelled");

    const int64_t remaining = run.deadline_ms - now_ms();
    if (remaining <= 0) return not_run(step, StepStatus::SKIPPED, "plan timeout exceeded");

    auto resolved = adapters_.resolve(step.execution_location);
    if (!resolved) {
        steps_failed_++;
        return not_run(step, StepStatus::FAILED,
                       "no backend registered for execution_location '" + step.execution_location + "'");
    }

    if (step.requires_approval) {
        std::string why;
        if (step.approval_token.empty()) {
            why = "approval required: no approval token presented";
        } else if (!approvals_) {
            why = "approval required: approvals are not configured";
        } else if (!approvals_->verify_and_consume(step.approval_token, step.tool, step.pattern,
                                                   step.target_host, &why)) {
            why = "approval rejected: " + why;
        }
        if (!why.empty()) {
            steps_failed_++;
            std::cerr << "[dispatch] step " << step.id << ": " << why << "\n";
            return not_run(step, StepStatus::FAILED, why);
        }
    }

    StepContext ctx;
    ctx.cancel = run.cancel;
    ctx.timeout_ms = std::min(step_timeout_for(step), remaining);

    if (step.requires_credentials) {
        if (step.credential_ref.empty()) {
            steps_failed_++;
            return not_run(step, StepStatus::FAILED, "step requires credentials but carries no credential_ref");
        }
        ctx.credential = CredentialHandle{step.credential_ref, step.target_host};
    }

    std::string err = substitute_outputs(step.inputs_json, step.depends_on, outputs, &ctx.inputs_json);
    if (!err.empty()) {
        steps_failed_++;
        return not_run(step, StepStatus::FAILED, err);
    }

    if (resolved->fell_back) {
        fallback_routed_++;
        std::cerr << "[dispatch] step " << step.id << ": execution_location '" << step.execution_location
                  << "' unknown, routed to default backend '" << resolved->location << "'\n";
    }

    steps_run_++;
    const int64_t t0 = now_ms();
    StepResult r;
    try {
        r = resolved->adapter->execute(step, ctx);
    } catch (const std::exception& e) {
        r = not_run(step, StepStatus::FAILED, std::string("backend error: ") + e.what());
        r.duration_ms = now_ms() - t0;
    }
    r.step_id = step.id;
    r.tool = step.tool;
    r.pattern = step.pattern;
    if (r.backend.empty()) r.backend = resolved->adapter->name();
    r.fallback_routed = resolved->fell_back;
    if (r.duration_ms <= 0) r.duration_ms = now_ms() - t0;

    if (r.status != StepStatus::SUCCEEDED) {
        steps_failed_++;
        std::cerr << "[dispatch] step " << step.id << " (" << step.tool << "/" << step.pattern << ") "
                  << step_status_str(r.status) << ": " << r.error << "\n";
    }
    record_telemetry(step, r, run.plan_id);
    return r;
}

void Dispatcher::run_sequential(const ExecutionPlan& plan, Run& run, PlanResult& out) {
    std::map<std::string, std::string> outputs;
    bool aborted = false;
    for (size_t i = 0; i < plan.steps.size(); i++) {
        const auto& step = plan.steps[i];
        if (aborted) {
            out.steps[i] = not_run(step, StepStatus::SKIPPED, "skipped after an earlier failure");
            continue;
        }
        out.steps[i] = run_step(step, run, outputs);
        if (out.steps[i].status == StepStatus::SUCCEEDED) {
            outputs[step.id] = out.steps[i].output;
        } else {
            aborted = true;
        }
    }
}

void Dispatcher::run_concurrent(const ExecutionPlan& plan, Run& run, PlanResult& out) {
    const size_t n = plan.steps.size();
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < n; i++) index[plan.steps[i].id] = i;

    std::vector<std::vector<size_t>> dependents(n);
    std::vector<size_t> waiting(n, 0);
    std::vector<bool> blocked(n, false);   // some dependency did not succeed
    for (size_t i = 0; i < n; i++) {
        for (const auto& d : plan.steps[i].depends_on) {
            dependents[index.at(d)].push_back(i);
            waiting[i]++;
        }
    }

    std::mutex mu;
    std::map<std::string, std::string> outputs;
    size_t finished = 0;
    ReadyQueue<size_t> ready;

    // Caller holds mu. Releases dependents of a finished step; skips cascade.
    auto settle = [&](size_t done) {
        std::vector<size_t> stack{done};
        while (!stack.empty()) {
            size_t cur = stack.back();
            stack.pop_back();
            finished++;
            const bool ok = out.steps[cur].status == StepStatus::SUCCEEDED;
            for (size_t dep : dependents[cur]) {
                if (!ok) blocked[dep] = true;
                if (--waiting[dep] > 0) continue;
                if (blocked[dep]) {
                    out.steps[dep] = not_run(plan.steps[dep], StepStatus::SKIPPED,
                                             "skipped: a dependency did not succeed");
                    stack.push_back(dep);
                } else {
                    ready.push(dep, dep);
                }
            }
        }
        if (finished == n) ready.close();
    };

    for (size_t i = 0; i < n; i++) {
        if (waiting[i] == 0) ready.push(i, i);
    }

    auto worker = [&] {
        while (auto idx = ready.pop()) {
            std::map<std::string, std::string> deps_out;
            {
                std::lock_guard<std::mutex> lk(mu);
                for (const auto& d : plan.steps[*idx].depends_on) {
                    auto it = outputs.find(d);
                    if (it != outputs.end()) deps_out[d] = it->second;
                }
            }
            StepResult r = run_step(plan.steps[*idx], run, deps_out);
            std::lock_guard<std::mutex> lk(mu);
            if (r.status == StepStatus::SUCCEEDED) outputs[plan.steps[*idx].id] = r.output;
            out.steps[*idx] = std::move(r);
            settle(*idx);
        }
    };

    std::vector<std::thread> pool;
    const int workers = out.concurrency;
    pool.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; w++) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
}

PlanResult Dispatcher::dispatch(const ExecutionPlan& plan, CancelToken* cancel) {
    plans_++;
    const int64_t t0 = now_ms();

    PlanResult out;
    out.plan_id = plan.plan_id.empty() ? "plan_" + random_hex(8) : plan.plan_id;
    out.policy = plan.policy;
    out.steps.resize(plan.steps.size());

    const std::string invalid = validate_plan(plan);
    if (!invalid.empty()) {
        std::cerr << "[dispatch] plan " << out.plan_id << " rejected: " << invalid << "\n";
        for (size_t i = 0; i < plan.steps.size(); i++)
            out.steps[i] = not_run(plan.steps[i], StepStatus::FAILED, "invalid plan: " + invalid);
        out.status = PlanStatus::FAILED;
        return out;
    }

    CancelToken local_cancel;
    Run run;
    run.plan_id = out.plan_id;
    run.cancel = cancel ? cancel : &local_cancel;

    int64_t ceiling = 0;
    if (plan.timeout_ms) {
        ceiling = *plan.timeout_ms;
    } else if (opt_.plan_timeout_ms > 0) {
        ceiling = opt_.plan_timeout_ms;
    } else {
        for (const auto& s : plan.steps) ceiling += step_timeout_for(s);
    }
    run.deadline_ms = t0 + std::max<int64_t>(ceiling, 1);

    if (plan.policy == FailurePolicy::CONTINUE_AND_COLLECT) {
        out.concurrency = concurrency_for(plan);
        if (!plan.steps.empty()) run_concurrent(plan, run, out);
    } else {
        out.concurrency = 1;
        run_sequential(plan, run, out);
    }

    size_t ok = 0;
    for (const auto& r : out.steps) {
        if (r.status == StepStatus::SUCCEEDED) ok++;
    }
    if (run.cancel->cancelled()) out.status = PlanStatus::CANCELLED;
    else if (ok == out.steps.size()) out.status = PlanStatus::SUCCEEDED;
    else if (ok == 0) out.status = PlanStatus::FAILED;
    else out.status = PlanStatus::PARTIAL;

    out.duration_ms = now_ms() - t0;
    return out;
}

} // namespace caproute
