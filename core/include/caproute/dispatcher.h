#pragma once

#include "caproute/adapters.h"
#include "caproute/approval.h"
#include "caproute/enricher.h"
#include "caproute/telemetry.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace caproute {

enum class FailurePolicy { ABORT_ON_FIRST_FAILURE, CONTINUE_AND_COLLECT };

const char* failure_policy_str(FailurePolicy p);
// Accepts "abort-on-first-failure" / "continue-and-collect" and the underscore forms.
std::optional<FailurePolicy> failure_policy_from_str(const std::string& s);

enum class PlanStatus { SUCCEEDED, PARTIAL, FAILED, CANCELLED };

const char* plan_status_str(PlanStatus s);

struct ExecutionPlan {
    std::string plan_id;                          // generated when empty
    std::vector<EnrichedExecutionStep> steps;     // declaration order
    FailurePolicy policy{FailurePolicy::ABORT_ON_FIRST_FAILURE};
    std::optional<int64_t> timeout_ms;            // plan ceiling
    std::optional<int> max_concurrency;           // continue-and-collect only
};

struct PlanResult {
    std::string plan_id;
    PlanStatus status{PlanStatus::FAILED};
    FailurePolicy policy{FailurePolicy::ABORT_ON_FIRST_FAILURE};
    std::vector<StepResult> steps;                // declaration order
    int64_t duration_ms{0};
    int concurrency{1};
};

struct DispatcherOptions {
    int64_t default_step_timeout_ms{60000};
    int64_t plan_timeout_ms{0};                   // 0: sum of step timeouts
    int max_concurrency{50};
};

// Structural checks: non-empty unique ids, dependencies naming earlier steps,
// inputs a JSON object. Returns "" when the plan can run.
std::string validate_plan(const ExecutionPlan& plan);

// Replaces "${<id>.output}" inside every string of inputs_json with the
// trimmed output of step <id>, which must be one of `deps`. Returns "" on success.
std::string substitute_outputs(const std::string& inputs_json,
                               const std::vector<std::string>& deps,
                               const std::map<std::string, std::string>& outputs,
                               std::string* out);

// Dispatcher
// - Routes each step to the adapter registered for its execution_location
// - abort-on-first-failure: declaration order, everything after a failure skipped
// - continue-and-collect: ready steps run on a bounded worker pool; a step
//   whose dependency did not succeed is skipped
// - Approval leases, credential handles, per-step and per-plan timeouts,
//   plan cancellation; one telemetry record per executed step
class Dispatcher {
public:
    Dispatcher(AdapterRegistry& adapters,
               ApprovalLeaseManager* approvals,
               TelemetryRecorder* telemetry,
               DispatcherOptions opt = {});

    // Never throws for step failures. An invalid plan fails every step.
    PlanResult dispatch(const ExecutionPlan& plan, CancelToken* cancel = nullptr);

    int64_t step_timeout_for(const EnrichedExecutionStep& step) const;
    int concurrency_for(const ExecutionPlan& plan) const;

    uint64_t plans_dispatched() const { return plans_.load(); }
    uint64_t steps_run() const { return steps_run_.load(); }
    uint64_t steps_failed() const { return steps_failed_.load(); }
    uint64_t fallback_routed() const { return fallback_routed_.load(); }

private:
    struct Run;

    StepResult run_step(const EnrichedExecutionStep& step, Run& run,
                        const std::map<std::string, std::string>& outputs);
    void record_telemetry(const EnrichedExecutionStep& step, const StepResult& r, const std::string& plan_id);

    void run_sequential(const ExecutionPlan& plan, Run& run, PlanResult& out);
    void run_concurrent(const ExecutionPlan& plan, Run& run, PlanResult& out);

    AdapterRegistry& adapters_;
    ApprovalLeaseManager* approvals_;
    TelemetryRecorder* telemetry_;
    DispatcherOptions opt_;

    std::atomic<uint64_t> plans_{0};
    std::atomic<uint64_t> steps_run_{0};
    std::atomic<uint64_t> steps_failed_{0};
    std::atomic<uint64_t> fallback_routed_{0};
};

} // namespace caproute
