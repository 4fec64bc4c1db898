#include "test_common.h"
#include "test_fixtures.h"

#include "caproute/enricher.h"
#include "caproute/errors.h"

using namespace caproute;

static SelectionResult selection_of(const ToolDefPtr& t, const std::string& cap, const std::string& pattern) {
    SelectionResult r;
    r.tool = t;
    r.capability = cap;
    r.pattern_name = pattern;
    r.estimated_cost = 1.5;
    r.estimated_time_ms = 1300;
    stamp_routing(r);
    return r;
}

static bool contains(const std::vector<std::string>& v, const std::string& needle) {
    for (const auto& s : v) if (s.find(needle) != std::string::npos) return true;
    return false;
}

int main() {
    PatternSpec restart{"restart", "\"800 + 50 * N\"", "1"};
    restart.policy = "{\"requires_approval\":true,\"max_execution_time_ms\":60000}";
    restart.extra = "\"required_inputs\":[{\"name\":\"unit\",\"type\":\"string\",\"validation\":\"^[a-z0-9@._-]+$\"}],"
                    "\"optional_inputs\":[{\"name\":\"retries\",\"type\":\"integer\"},{\"name\":\"force\",\"type\":\"boolean\"}]";
    const std::string routing =
        "{\"execution_location\":\"ssh\",\"protocol\":\"ssh\",\"requires_credentials\":true,"
        "\"protocol_metadata\":{\"command\":\"sudo systemctl restart {unit}\",\"user\":\"ops\"}}";
    auto tool = make_tool(tool_json("systemctl", "1.2.0", "service_restart", {restart}, "linux", "active", routing));
    const Pattern* pat = tool->find_pattern("service_restart", "restart");

    // Test 1: input validation
    {
        expect_true(validate_inputs(*pat, "{\"unit\":\"nginx.service\"}").empty(), "valid inputs");
        expect_true(contains(validate_inputs(*pat, "{}"), "missing required input 'unit'"), "missing required");
        expect_true(contains(validate_inputs(*pat, "{\"unit\":42}"), "must be of type string"), "type mismatch");
        expect_true(contains(validate_inputs(*pat, "{\"unit\":\"nginx; rm -rf /\"}"), "does not match"), "regex");
        expect_true(validate_inputs(*pat, "{\"unit\":\"a\",\"retries\":3.0}").empty(), "integral double is integer");
        expect_true(contains(validate_inputs(*pat, "{\"unit\":\"a\",\"retries\":2.5}"), "retries"), "fractional not integer");
        expect_true(contains(validate_inputs(*pat, "{\"unit\":\"a\",\"force\":\"yes\"}"), "force"), "boolean type");
        expect_true(contains(validate_inputs(*pat, "[1]"), "JSON object"), "inputs must be an object");
        expect_true(validate_inputs(*pat, "{\"unit\":\"a\",\"extra\":1}").empty(), "undeclared inputs pass through");
    }

    // Test 2: enrichment copies routing and policy captured at selection
    {
        SelectionResult sel = selection_of(tool, "service_restart", "restart");
        ExecutionStep step;
        step.id = "restart-web";
        step.target_host = "web-01";
        step.inputs_json = "{\"unit\":\"nginx\"}";
        step.credential_ref = "vault:ops/web";
        PlanEnricher enricher;
        EnrichedExecutionStep e = enricher.enrich(step, sel);
        expect_true(e.id == "restart-web", "id kept");
        expect_true(e.tool == "systemctl" && e.pattern == "restart" && e.capability == "service_restart", "identity filled");
        expect_true(e.tool_version == "1.2.0", "version captured");
        expect_true(e.execution_location == "ssh" && e.protocol == Protocol::SSH, "routing copied");
        expect_true(e.requires_credentials, "credentials flag");
        expect_true(e.protocol_metadata.at("user") == "ops", "metadata copied");
        expect_true(e.requires_approval, "approval flag");
        expect_true(e.max_execution_time_ms && *e.max_execution_time_ms == 60000, "time limit");
        expect_true(e.estimated_cost == 1.5 && e.estimated_time_ms == 1300, "estimates from selection");
        expect_true(e.credential_ref == "vault:ops/web" && e.target_host == "web-01", "step fields kept");
    }

    // Test 3: stamped routing wins over the record
    {
        SelectionResult sel = selection_of(tool, "service_restart", "restart");
        sel.routing.execution_location = "winrm";
        ExecutionStep step;
        step.inputs_json = "{\"unit\":\"nginx\"}";
        EnrichedExecutionStep e = PlanEnricher().enrich(step, sel);
        expect_true(e.execution_location == "winrm", "selection-time routing used");
        expect_true(e.id == "restart", "id defaults to pattern name");

        sel.routing_stamped = false;
        e = PlanEnricher().enrich(step, sel);
        expect_true(e.execution_location == "ssh", "unstamped falls back to record");
    }

    // Test 4: mismatched or invalid steps are rejected
    {
        SelectionResult sel = selection_of(tool, "service_restart", "restart");
        PlanEnricher enricher;
        auto rejects = [&](ExecutionStep s, const std::string& needle) {
            try {
                enricher.enrich(s, sel);
            } catch (const EnrichmentError& e) {
                return std::string(e.what()).find(needle) != std::string::npos;
            }
            return false;
        };
        ExecutionStep s;
        s.id = "x";
        s.inputs_json = "{\"unit\":\"nginx\"}";
        s.tool = "ansible";
        expect_true(rejects(s, "names tool 'ansible'"), "tool mismatch");
        s.tool = "systemctl";
        s.pattern = "stop";
        expect_true(rejects(s, "names pattern 'stop'"), "pattern mismatch");
        s.pattern = "";
        s.inputs_json = "{}";
        expect_true(rejects(s, "inputs rejected"), "bad inputs");

        SelectionResult empty;
        bool threw = false;
        try {
            enricher.enrich(ExecutionStep{}, empty);
        } catch (const EnrichmentError&) {
            threw = true;
        }
        expect_true(threw, "selection without tool rejected");
    }

    std::cerr << "test_enricher: ALL PASSED" << std::endl;
    return 0;
}
