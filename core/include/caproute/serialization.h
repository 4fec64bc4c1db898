#pragma once

#include "caproute/adapters.h"
#include "caproute/approval.h"
#include "caproute/dispatcher.h"
#include "caproute/enricher.h"
#include "caproute/policy.h"
#include "caproute/request.h"
#include "caproute/selection.h"
#include "caproute/tiebreak.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace caproute {

// Wire format is camelCase. *_to_json returns a new reference owned by the
// caller; *_from_json returns false and sets *err on a type error.

// --- selection request ---

bool request_from_json(json_object* o, SelectionRequest* out, std::string* err);
bool request_from_string(const std::string& body, SelectionRequest* out, std::string* err);

// Normalized form used for the cache fingerprint: mode folded into effective
// weights, permissions sorted, defaults spelled out.
std::string canonical_request(const SelectionRequest& req);

// --- selection result ---

json_object* criterion_to_json(const CriterionScore& c);
json_object* tiebreak_to_json(const TieBreakTranscript& t);
json_object* selection_result_to_json(const SelectionResult& r);
std::string selection_result_to_string(const SelectionResult& r);

json_object* violations_to_json(const std::vector<PolicyViolation>& v);

// --- execution steps and plans ---

bool execution_step_from_json(json_object* o, ExecutionStep* out, std::string* err);
json_object* enriched_step_to_json(const EnrichedExecutionStep& s);
bool enriched_step_from_json(json_object* o, EnrichedExecutionStep* out, std::string* err);

// {planId?, steps:[enriched], failurePolicy?, timeoutMs?, maxConcurrency?}
bool plan_from_json(json_object* o, ExecutionPlan* out, std::string* err);

json_object* step_result_to_json(const StepResult& r);
// {planId, stepResults, overallStatus, failurePolicy, durationMs, concurrency}
json_object* plan_result_to_json(const PlanResult& r);

json_object* approval_lease_to_json(const ApprovalLease& l);

} // namespace caproute
