#include "test_common.h"

#include "caproute/adapters.h"
#include "caproute/catalog_adapter.h"
#include "caproute/catalog_store.h"
#include "caproute/credentials.h"
#include "caproute/dispatcher.h"
#include "caproute/enricher.h"
#include "caproute/errors.h"
#include "caproute/selection.h"
#include "caproute/selection_cache.h"
#include "caproute/telemetry.h"

#include <filesystem>
#include <mutex>

using namespace caproute;

namespace {

class OpsCredentials : public ICredentialResolver {
public:
    std::optional<Credential> resolve(const std::string& ref, const std::string& host) override {
        if (ref != "ops" || host.empty()) return std::nullopt;
        return Credential{"deploy", "", "/keys/" + host};
    }
};

// Stands in for the HTTP backend so the test never touches the network.
class RecordingBackend : public IBackendAdapter {
public:
    const char* name() const override { return "recording"; }
    StepResult execute(const EnrichedExecutionStep& step, const StepContext& ctx) override {
        std::lock_guard<std::mutex> lk(mu);
        last_inputs = ctx.inputs_json;
        last_url = step.protocol_metadata.count("url") ? step.protocol_metadata.at("url") : "";
        StepResult r;
        r.status = StepStatus::SUCCEEDED;
        r.exit_code = 0;
        r.output = "200 OK";
        return r;
    }

    std::mutex mu;
    std::string last_inputs;
    std::string last_url;
};

} // namespace

int main() {
    namespace fs = std::filesystem;
    const fs::path catalog_dir = fs::path(CAPROUTE_SOURCE_DIR) / "catalog";
    const fs::path data_dir = fs::temp_directory_path() / "caproute_test_e2e";
    std::error_code ec;
    fs::remove_all(data_dir, ec);

    auto store = std::make_shared<FileCatalogStore>(catalog_dir);
    CatalogAdapter catalog(store);
    ScoringEngine scoring;
    TieBreakEscalator tiebreak(std::make_shared<FirstChoiceJudge>());
    Resolver resolver(catalog, scoring, tiebreak);
    SelectionGateway gateway(resolver);

    // Test 1: shipped catalog loads cleanly
    {
        expect_eq_ll((long long)store->loadAll().size(), 4, "four shipped records");
    }

    // Test 2: permission-holding caller on linux gets the in-place restart
    std::shared_ptr<const SelectionResult> restart_sel;
    {
        SelectionRequest r;
        r.capability = "service_restart";
        r.platform = "linux";
        r.permissions = {"service:restart"};
        SelectionOutcome o = gateway.select(r);
        expect_true(o.status == SelectionStatus::OK, "selected: " + o.reason);
        expect_true(o.result->tool->name == "systemctl" && o.result->pattern_name == "systemd_restart",
                    "systemctl wins");
        expect_eq_ll((long long)o.result->num_candidates, 3, "multi-platform tools considered");
        expect_eq_ll((long long)o.result->alternatives.size(), 2, "two alternatives");
        expect_true(o.result->alternatives[0].tool == "ansible", "ansible runner-up");
        expect_true(o.result->sla_class == "interactive", "850 ms is interactive");
        expect_true(o.result->execution_mode_hint == "immediate", "immediate");
        expect_true(o.result->routing.execution_location == "ssh" && o.result->routing.requires_credentials,
                    "routing stamped");

        SelectionOutcome again = gateway.select(r);
        expect_true(again.from_cache && again.result_json == o.result_json, "second call served from cache");
        restart_sel = o.result;
    }

    // Test 3: without the permission the playbook runner is chosen
    {
        SelectionRequest r;
        r.capability = "service_restart";
        r.platform = "linux";
        SelectionOutcome o = gateway.select(r);
        expect_true(o.status == SelectionStatus::OK, "selected: " + o.reason);
        expect_true(o.result->tool->name == "ansible", "ansible wins");
        expect_eq_ll((long long)o.result->num_policy_violations, 1, "systemctl filtered");
        expect_true(o.result->estimated_time_ms == 6500.0, "base plus per item");
        expect_true(o.result->execution_mode_hint == "background", "slow pattern runs in background");
        expect_true(o.result->sla_class == "batch", "batch sla");

        r.allow_approval_required = false;
        r.production_safe_only = true;
        r.budget.max_cost = 0.5;
        r.mode = "cheap";
        o = gateway.select(r);
        expect_true(o.status == SelectionStatus::NO_ELIGIBLE_CANDIDATE, "budget excludes everything");
        expect_true(!o.violations.empty(), "violations reported");
    }

    // Test 4: network-only tool is not offered for a linux request
    {
        SelectionRequest r;
        r.capability = "health_check";
        r.platform = "linux";
        expect_true(gateway.select(r).status == SelectionStatus::NO_ELIGIBLE_CANDIDATE, "platform filter");
        r.platform = "";
        SelectionOutcome o = gateway.select(r);
        expect_true(o.status == SelectionStatus::OK && o.result->tool->name == "http_probe", "any platform");
    }

    // Test 5: enrich, dispatch over ssh and http, telemetry written
    {
        SelectionRequest hr;
        hr.capability = "health_check";
        SelectionOutcome probe_sel = gateway.select(hr);
        expect_true(probe_sel.status == SelectionStatus::OK, "probe selected");

        PlanEnricher enricher;
        ExecutionStep restart;
        restart.id = "restart";
        restart.tool = "systemctl";
        restart.pattern = "systemd_restart";
        restart.capability = "service_restart";
        restart.target_host = "web-01";
        restart.credential_ref = "ops";
        restart.inputs_json = "{\"unit\":\"nginx.service\"}";

        ExecutionStep bad = restart;
        bad.inputs_json = "{\"unit\":\"nginx; reboot\"}";
        bool threw = false;
        try {
            enricher.enrich(bad, *restart_sel);
        } catch (const EnrichmentError&) {
            threw = true;
        }
        expect_true(threw, "unit validation enforced");

        ExecutionStep probe;
        probe.id = "probe";
        probe.tool = "http_probe";
        probe.pattern = "get_status";
        probe.capability = "health_check";
        probe.inputs_json = "{\"url\":\"http://web-01/health\",\"note\":\"${restart.output}\"}";
        probe.depends_on = {"restart"};

        ExecutionPlan plan;
        plan.plan_id = "e2e";
        plan.steps.push_back(enricher.enrich(restart, *restart_sel));
        plan.steps.push_back(enricher.enrich(probe, *probe_sel.result));
        expect_true(plan.steps[0].execution_location == "ssh" && plan.steps[0].requires_credentials,
                    "routing copied onto step");
        expect_true(plan.steps[0].max_execution_time_ms && *plan.steps[0].max_execution_time_ms == 30000,
                    "policy ceiling copied");

        AdapterRegistry reg;
        reg.register_adapter("ssh", std::make_shared<SshAdapter>(std::make_shared<OpsCredentials>(), ProcLimits{}, "echo"));
        auto http = std::make_shared<RecordingBackend>();
        reg.register_adapter("http", http);

        TelemetryRecorder telemetry(data_dir / "telemetry.jsonl");
        expect_true(telemetry.start().empty(), "telemetry started");
        Dispatcher dispatcher(reg, nullptr, &telemetry);
        PlanResult res = dispatcher.dispatch(plan);
        telemetry.stop();

        expect_true(res.status == PlanStatus::SUCCEEDED, "plan succeeded");
        expect_true(res.steps[0].backend == "ssh", "ssh backend");
        expect_true(res.steps[0].output.find("'systemctl' 'restart' 'nginx.service'") != std::string::npos,
                    "remote command rendered: " + res.steps[0].output);
        expect_true(res.steps[0].output.find("-l deploy web-01") != std::string::npos, "credential user and host");
        expect_true(http->last_url == "{url}", "metadata passed through unrendered");
        expect_true(http->last_inputs.find("'systemctl' 'restart' 'nginx.service'") != std::string::npos,
                    "upstream output substituted");

        auto lines = telemetry.wal().read_lines();
        expect_eq_ll((long long)lines.size(), 2, "one telemetry line per step");
        size_t skipped = 0;
        auto rows = summarize_telemetry(lines, &skipped);
        expect_eq_ll((long long)rows.size(), 2, "two tool patterns");
        expect_eq_ll((long long)skipped, 0, "all lines valid");
    }

    // Test 6: cost ceiling excludes the redeploy; no judge involved
    {
        SelectionRequest r;
        r.capability = "service_restart";
        r.platform = "linux";
        r.n = 1;
        r.permissions = {"service:restart"};
        r.budget.max_cost = 5;
        SelectionOutcome o = gateway.select(r);
        expect_true(o.status == SelectionStatus::OK, "selected: " + o.reason);
        expect_true(o.result->pattern_name == "systemd_restart", "in-place restart chosen");
        expect_true(o.result->selection_method == "deterministic" && !o.result->tie_break, "no tie-break");
        for (const auto& a : o.result->alternatives) {
            expect_true(a.pattern != "full_redeploy", "redeploy over budget is never offered");
        }

        r.budget.max_cost = 0;
        o = gateway.select(r);
        expect_true(o.status == SelectionStatus::NO_ELIGIBLE_CANDIDATE, "zero budget excludes every costed pattern");

        SelectionRequest probe;
        probe.capability = "health_check";
        probe.budget.max_cost = 0;
        o = gateway.select(probe);
        expect_true(o.status == SelectionStatus::OK && o.result->estimated_cost == 0.0, "free probe still eligible");
    }

    fs::remove_all(data_dir, ec);
    std::cerr << "test_end_to_end: ALL PASSED" << std::endl;
    return 0;
}
