#include "test_common.h"
#include "test_fixtures.h"

#include "caproute/json_mini.h"
#include "caproute/serialization.h"

#include <cmath>

using namespace caproute;
namespace jm = caproute::json_mini;

int main() {
    // Test 1: request parse accepts camelCase and snake_case, rejects bad types
    {
        SelectionRequest r;
        std::string err;
        const std::string body =
            "{\"capability\":\"service_restart\",\"platform\":\"linux\",\"N\":3,"
            "\"mode\":\"FAST\",\"budget\":{\"max_time_ms\":5000,\"maxCost\":2.5},"
            "\"productionSafeOnly\":true,\"allow_approval_required\":false,"
            "\"environment\":\"staging\",\"permissions\":[\"b\",\"a\"]}";
        expect_true(request_from_string(body, &r, &err), "parse: " + err);
        expect_true(r.capability == "service_restart" && r.platform == "linux", "strings");
        expect_true(r.n == 3.0, "N");
        expect_true(r.mode == "fast", "mode lowercased");
        expect_true(r.budget.max_time_ms && *r.budget.max_time_ms == 5000.0, "snake budget key");
        expect_true(r.budget.max_cost && *r.budget.max_cost == 2.5, "camel budget key");
        expect_true(r.production_safe_only && !r.allow_approval_required, "booleans");
        expect_true(r.environment == "staging" && r.permissions.size() == 2, "env and permissions");

        expect_true(!request_from_string("not json", &r, &err), "garbage rejected");
        expect_true(!request_from_string("[1]", &r, &err), "array rejected");
        expect_true(!request_from_string("{\"capability\":7}", &r, &err), "typed capability");
        expect_true(!request_from_string("{\"capability\":\"x\",\"permissions\":[1]}", &r, &err), "typed permissions");
        expect_true(!request_from_string("{\"capability\":\"x\",\"preferenceWeights\":{\"latency\":1}}", &r, &err),
                    "unknown axis rejected");
        expect_true(err.find("latency") != std::string::npos, "axis named in error");
    }

    // Test 2: explicit weights leave unnamed axes at zero
    {
        SelectionRequest r;
        std::string err;
        expect_true(request_from_string("{\"capability\":\"x\",\"preferenceWeights\":{\"speed\":2,\"cost\":2}}", &r, &err),
                    "parse: " + err);
        expect_true(r.weights.has_value(), "weights present");
        expect_true(r.weights->speed == 2.0 && r.weights->accuracy == 0.0 && r.weights->completeness == 0.0,
                    "unnamed axes zero");
    }

    // Test 3: canonical request folds equivalent spellings together
    {
        SelectionRequest a;
        a.capability = "cap";
        a.mode = "fast";
        a.permissions = {"deploy", "admin", "deploy"};

        SelectionRequest b;
        b.capability = "cap";
        b.weights = weights_for_mode("fast");
        b.permissions = {"admin", "deploy"};

        expect_true(canonical_request(a) == canonical_request(b), "mode and explicit preset weights agree");

        SelectionRequest c = a;
        c.environment = "staging";
        expect_true(canonical_request(a) != canonical_request(c), "environment participates");
        SelectionRequest d = a;
        d.budget.max_cost = 1.0;
        expect_true(canonical_request(a) != canonical_request(d), "budget participates");
    }

    // Test 4: selection result fields
    {
        auto tool = make_tool(tool_json("systemctl", "1.2.0", "service_restart", {PatternSpec{"restart"}}, "linux",
                                        "active",
                                        "{\"execution_location\":\"ssh\",\"protocol\":\"ssh\",\"requires_credentials\":true,"
                                        "\"protocol_metadata\":{\"port\":\"22\"}}"));
        SelectionResult r;
        r.tool = tool;
        r.capability = "service_restart";
        r.pattern_name = "restart";
        r.score = 0.5;
        r.breakdown.push_back(CriterionScore{"speed", 0.5, 0.2, 0.1});
        r.alternatives.push_back(Alternative{"other", "p", 0.4});
        r.execution_mode_hint = "immediate";
        r.sla_class = "batch";
        r.num_candidates = 2;
        stamp_routing(r);

        const std::string s = selection_result_to_string(r);
        jm::Doc d = jm::parse(s);
        expect_true((bool)d, "serialized result parses");
        expect_true(jm::field_string(d.root, "tool").value_or("") == "systemctl", "tool");
        expect_true(jm::field_string(d.root, "toolVersion").value_or("") == "1.2.0", "version");
        expect_true(jm::field_string(d.root, "selectionMethod").value_or("") == "deterministic", "method");
        expect_true(jm::field(d.root, "tieBreak") == nullptr, "no transcript without a tie");
        expect_true(jm::field_bool(d.root, "stale").value_or(true) == false, "fresh");
        json_object* ro = jm::field(d.root, "routing");
        expect_true(ro && jm::field_string(ro, "executionLocation").value_or("") == "ssh", "routing location");
        expect_true(jm::field_bool(ro, "requiresCredentials").value_or(false), "routing credentials");
        expect_true(jm::field_string_map(ro, "protocolMetadata")["port"] == "22", "routing metadata");
        json_object* def = jm::field(d.root, "toolDefinition");
        expect_true(def && json_object_is_type(def, json_type_object), "definition embedded as object");
        json_object* alts = jm::field(d.root, "alternatives");
        expect_eq_ll((long long)json_object_array_length(alts), 1, "alternatives");
        expect_true(s == selection_result_to_string(r), "stable bytes");
    }

    // Test 5: plans parse with both key spellings and report the failing step
    {
        const std::string plan =
            "{\"planId\":\"p1\",\"failurePolicy\":\"continue\",\"timeout_ms\":9000,\"maxConcurrency\":4,"
            "\"steps\":[{\"id\":\"a\",\"tool\":\"t\",\"pattern\":\"p\",\"inputs\":{\"x\":1},"
            "\"execution_location\":\"http\",\"protocol\":\"HTTPS\",\"protocolMetadata\":{\"url\":\"http://h/\"},"
            "\"max_execution_time_ms\":1500,\"estimatedCost\":2},"
            "{\"id\":\"b\",\"tool\":\"t\",\"pattern\":\"p\",\"dependsOn\":[\"a\"],\"approvalToken\":\"appr_x\"}]}";
        jm::Doc d = jm::parse(plan);
        ExecutionPlan p;
        std::string err;
        expect_true(plan_from_json(d.root, &p, &err), "plan parse: " + err);
        expect_true(p.plan_id == "p1", "plan id");
        expect_true(p.policy == FailurePolicy::CONTINUE_AND_COLLECT, "short policy alias");
        expect_true(p.timeout_ms && *p.timeout_ms == 9000, "timeout");
        expect_true(p.max_concurrency && *p.max_concurrency == 4, "concurrency");
        expect_eq_ll((long long)p.steps.size(), 2, "steps");
        const auto& a = p.steps[0];
        expect_true(a.execution_location == "http" && a.protocol == Protocol::HTTP, "protocol alias");
        expect_true(a.protocol_metadata.at("url") == "http://h/", "metadata");
        expect_true(a.max_execution_time_ms && *a.max_execution_time_ms == 1500, "step timeout");
        expect_true(a.estimated_cost == 2.0, "estimate");
        expect_true(jm::get_int(a.inputs_json, "x").value_or(0) == 1, "inputs kept");
        expect_true(p.steps[1].depends_on.size() == 1 && p.steps[1].approval_token == "appr_x", "deps and token");

        const char* bad[] = {
            "{\"steps\":{}}",
            "{\"failurePolicy\":\"retry\",\"steps\":[]}",
            "{\"steps\":[{\"id\":\"a\",\"tool\":\"t\"}]}",
            "{\"steps\":[{\"id\":\"a\",\"tool\":\"t\",\"pattern\":\"p\",\"protocol\":\"ftp\"}]}",
            "{\"steps\":[{\"id\":\"a\",\"tool\":\"t\",\"pattern\":\"p\",\"inputs\":[1]}]}",
            "{\"timeoutMs\":1.5,\"steps\":[]}",
        };
        for (const char* b : bad) {
            jm::Doc bd = jm::parse(b);
            ExecutionPlan bp;
            std::string berr;
            expect_true(!plan_from_json(bd.root, &bp, &berr), std::string("should reject: ") + b);
            expect_true(!berr.empty(), "error reported");
        }
        jm::Doc bd = jm::parse(bad[2]);
        ExecutionPlan bp;
        expect_true(!plan_from_json(bd.root, &bp, &err) && err.rfind("steps[0]: ", 0) == 0, "step index in error");
    }

    // Test 6: plan result shape
    {
        PlanResult r;
        r.plan_id = "p1";
        r.status = PlanStatus::PARTIAL;
        r.policy = FailurePolicy::CONTINUE_AND_COLLECT;
        StepResult ok;
        ok.step_id = "a";
        ok.status = StepStatus::SUCCEEDED;
        ok.exit_code = 0;
        ok.output = "done";
        StepResult skipped;
        skipped.step_id = "b";
        skipped.status = StepStatus::SKIPPED;
        skipped.error = "dependency failed";
        r.steps = {ok, skipped};
        r.concurrency = 2;

        json_object* o = plan_result_to_json(r);
        std::string s = jm::to_string(o);
        json_object_put(o);
        jm::Doc d = jm::parse(s);
        expect_true(jm::field_string(d.root, "overallStatus").value_or("") == "partial", "overall status");
        expect_true(jm::field_string(d.root, "failurePolicy").value_or("") == "continue-and-collect", "policy");
        json_object* steps = jm::field(d.root, "stepResults");
        expect_eq_ll((long long)json_object_array_length(steps), 2, "step results");
        json_object* s0 = json_object_array_get_idx(steps, 0);
        json_object* s1 = json_object_array_get_idx(steps, 1);
        expect_true(jm::field(s0, "error") == nullptr, "no error key on success");
        expect_true(jm::field_string(s1, "status").value_or("") == "skipped", "skipped status");
        expect_true(jm::field_string(s1, "error").value_or("") == "dependency failed", "skip reason");
    }

    std::cerr << "test_serialization: ALL PASSED" << std::endl;
    return 0;
}
