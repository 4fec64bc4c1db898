#include "test_common.h"
#include "test_fixtures.h"

#include "caproute/catalog.h"
#include "caproute/catalog_import.h"
#include "caproute/catalog_store.h"
#include "caproute/errors.h"

#include <filesystem>
#include <fstream>

using namespace caproute;

static bool has_issue(const std::vector<CatalogIssue>& issues, const std::string& path_part) {
    for (const auto& i : issues) {
        if (i.path.find(path_part) != std::string::npos) return true;
    }
    return false;
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "caproute_test_catalog";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    const std::string restart = tool_json("systemctl", "1.0.0", "service_restart",
        {PatternSpec{"restart", "\"800 + 50 * N\"", "{\"base\":1,\"per_item\":0.1}"}});

    // Test 1: parse a complete definition
    {
        ToolDefinition d = tool_from_json(restart);
        expect_true(d.name == "systemctl" && d.version == "1.0.0", "identity");
        expect_true(d.platform == "linux", "platform");
        expect_true(d.selectable(), "active is selectable");
        const Pattern* p = d.find_pattern("service_restart", "restart");
        expect_true(p != nullptr, "pattern found");
        expect_true(p->time_estimate_ms.eval(10) == 1300.0, "expression cost model");
        expect_true(p->cost_estimate.eval(10) == 2.0, "structured cost model");
        expect_true(d.find_pattern("service_restart", "nope") == nullptr, "unknown pattern");
        expect_true(d.find_pattern("other", "restart") == nullptr, "unknown capability");
    }

    // Test 2: schema problems are collected with paths
    {
        std::vector<CatalogIssue> issues;
        std::string bad = tool_json("x", "1.0", "cap", {PatternSpec{"p", "\"2 +\"", "1",
            "\"speed\":1.5,\"accuracy\":0.5,\"cost\":0.5,\"complexity\":0.5,\"completeness\":0.5"}},
            "solaris", "live");
        auto d = parse_tool_definition(bad, &issues);
        expect_true(!d.has_value(), "bad definition rejected");
        expect_true(has_issue(issues, "version"), "semver issue");
        expect_true(has_issue(issues, "platform"), "platform issue");
        expect_true(has_issue(issues, "status"), "status issue");
        expect_true(has_issue(issues, "time_estimate_ms"), "expression issue");
        expect_true(has_issue(issues, "preference_match.speed"), "unit interval issue");

        issues.clear();
        expect_true(!parse_tool_definition("[1,2]", &issues).has_value(), "non-object rejected");
        bool threw = false;
        try {
            tool_from_json("{}");
        } catch (const CatalogAuthoringError&) {
            threw = true;
        }
        expect_true(threw, "tool_from_json throws on problems");
    }

    // Test 3: input declarations and bad regex
    {
        PatternSpec p{"p"};
        p.extra = "\"required_inputs\":[\"host\",{\"name\":\"unit\",\"type\":\"string\",\"validation\":\"^[a-z]+$\"}],"
                  "\"optional_inputs\":[{\"name\":\"count\",\"type\":\"integer\"}]";
        ToolDefinition d = tool_from_json(tool_json("t", "1.0.0", "cap", {p}));
        const Pattern* pat = d.find_pattern("cap", "p");
        expect_eq_ll((long long)pat->required_inputs.size(), 2, "two required inputs");
        expect_true(pat->required_inputs[0].type == "string", "bare name defaults to string");
        expect_true(pat->optional_inputs[0].type == "integer", "optional typed");

        PatternSpec q{"q"};
        q.extra = "\"required_inputs\":[{\"name\":\"x\",\"validation\":\"([\"}]";
        std::vector<CatalogIssue> issues;
        expect_true(!parse_tool_definition(tool_json("t", "1.0.0", "cap", {q}), &issues).has_value(),
                    "bad regex rejected");
        expect_true(has_issue(issues, "validation"), "regex issue path");
    }

    // Test 4: version ordering and latest selectable
    {
        expect_true(compare_versions("1.2.0", "1.10.0") < 0, "numeric minor ordering");
        expect_true(compare_versions("2.0.0", "1.99.99") > 0, "major wins");
        expect_true(compare_versions("1.0.0", "1.0.0") == 0, "equal");
        expect_true(is_semver("1.0.0-rc1") && !is_semver("1.0") && !is_semver("v1.0.0"), "semver shape");

        auto v1 = make_tool(tool_json("t", "1.0.0", "cap", {PatternSpec{"a"}}));
        auto v2 = make_tool(tool_json("t", "1.2.0", "cap", {PatternSpec{"b"}}));
        auto v3 = make_tool(tool_json("t", "2.0.0", "cap", {PatternSpec{"c"}}, "linux", "draft"));
        auto other = make_tool(tool_json("u", "0.1.0", "cap", {PatternSpec{"z"}}, "multi-platform"));
        auto latest = latest_selectable({v1, v3, v2, other});
        expect_eq_ll((long long)latest.size(), 2, "one record per tool");
        expect_true(latest[0]->name == "t" && latest[0]->version == "1.2.0", "draft 2.0.0 skipped");

        auto c = candidates_for(latest, "cap", "windows");
        expect_eq_ll((long long)c.size(), 1, "multi-platform matches any filter");
        expect_true(c[0].label() == "u/z", "candidate label");
        c = candidates_for(latest, "cap", "");
        expect_eq_ll((long long)c.size(), 2, "no filter");
        expect_true(c[0].tool->name == "t" && c[1].tool->name == "u", "sorted by tool name");
    }

    // Test 5: serialization reparses to the same record
    {
        ToolDefinition d = tool_from_json(restart);
        std::string once = tool_to_json(d);
        std::string twice = tool_to_json(tool_from_json(once));
        expect_true(once == twice, "tool_to_json stable across reparse");
    }

    // Test 6: monotonicity and finiteness at import
    {
        FakeStore store;
        auto r = import_tool_definition(store, tool_json("m", "1.0.0", "cap",
            {PatternSpec{"p", "\"1000 - N\"", "1"}}), false);
        expect_true(!r.ok, "decreasing time model rejected");
        expect_true(has_issue(r.issues, "time_estimate_ms"), "monotonicity issue path");

        r = import_tool_definition(store, tool_json("m", "1.0.0", "cap",
            {PatternSpec{"p", "1", "\"10 / N\""}}), false);
        expect_true(!r.ok, "non-finite at N=0 rejected");

        r = import_tool_definition(store, tool_json("m", "1.0.0", "cap",
            {PatternSpec{"p", "\"N + 10 * max(0, 1 - abs(N - 7))\"", "1"}}), true);
        expect_true(!r.ok, "model dipping between sampled N rejected");
        expect_true(has_issue(r.issues, "time_estimate_ms"), "dip reported on the time model");

        r = import_tool_definition(store, tool_json("m", "1.0.0", "cap",
            {PatternSpec{"p", "\"ceil(N / 100) * 50\"", "\"log(N + 1)\""}}), true);
        expect_true(r.ok && r.dry_run && !r.written, "dry run validates only");
        expect_eq_ll(store.loads(), 0, "dry run never touches the store");
    }

    // Test 7: file store publish, idempotent re-import, conflict, retire
    {
        FileCatalogStore store(dir);
        auto r = import_tool_definition(store, restart, false);
        expect_true(r.ok && r.written, "first import writes");
        expect_true(fs::exists(store.record_path("systemctl", "1.0.0")), "record file exists");

        r = import_tool_definition(store, restart, false);
        expect_true(r.ok && !r.written, "identical re-import is a no-op");

        std::string changed = tool_json("systemctl", "1.0.0", "service_restart",
            {PatternSpec{"restart", "\"900 + 50 * N\"", "{\"base\":1,\"per_item\":0.1}"}});
        r = import_tool_definition(store, changed, false);
        expect_true(!r.ok, "changed content under same version rejected");
        expect_true(has_issue(r.issues, "version"), "conflict reported on version");

        std::string bumped = tool_json("systemctl", "1.1.0", "service_restart",
            {PatternSpec{"restart", "\"900 + 50 * N\"", "1"}});
        r = import_tool_definition(store, bumped, false);
        expect_true(r.ok && r.written, "new version publishes");

        auto all = store.loadAll();
        expect_eq_ll((long long)all.size(), 2, "both versions kept");
        expect_true(latest_selectable(all)[0]->version == "1.1.0", "latest is 1.1.0");

        expect_true(store.retire("systemctl", "1.1.0"), "retire existing");
        expect_true(!store.retire("systemctl", "9.9.9"), "retire missing");
        all = store.loadAll();
        expect_eq_ll((long long)all.size(), 2, "retired record not deleted");
        expect_true(latest_selectable(all)[0]->version == "1.0.0", "retired version no longer selectable");

        auto by_cap = store.loadByCapability("service_restart", "windows");
        expect_eq_ll((long long)by_cap.size(), 0, "platform filter on store");
        expect_eq_ll((long long)store.loadByName("systemctl").size(), 2, "load by name returns all versions");
    }

    // Test 8: corrupt record is skipped, missing directory is unavailable
    {
        std::ofstream(dir / "broken@1.0.0.json") << "{not json";
        FileCatalogStore store(dir);
        expect_eq_ll((long long)store.loadAll().size(), 2, "corrupt file skipped");

        FileCatalogStore missing(dir / "does_not_exist");
        bool threw = false;
        try {
            missing.loadAll();
        } catch (const CatalogUnavailable&) {
            threw = true;
        }
        expect_true(threw, "missing directory is CatalogUnavailable");

        ToolDefinition evil = tool_from_json(restart);
        evil.name = "../escape";
        threw = false;
        try {
            store.upsert(evil);
        } catch (const CatalogAuthoringError&) {
            threw = true;
        }
        expect_true(threw, "path traversal in name rejected");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_catalog: ALL PASSED" << std::endl;
    return 0;
}
