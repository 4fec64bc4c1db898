#include "caproute/catalog_import.h"
#include "caproute/errors.h"
#include "caproute/json_mini.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace caproute {

const std::vector<double>& monotonicity_grid() {
    static const std::vector<double> grid = {
        0, 1, 2, 3, 5, 10, 20, 50, 100, 200, 500, 1000, 5000, 10000, 100000, 1000000};
    return grid;
}

static void check_model(const CostExpr& e, const std::string& path, std::vector<CatalogIssue>* issues) {
    const auto& grid = monotonicity_grid();
    double prev = 0.0;
    for (size_t i = 0; i < grid.size(); i++) {
        const double n = grid[i];
        const double v = e.eval(n);
        char buf[160];
        if (!std::isfinite(v)) {
            std::snprintf(buf, sizeof(buf), "not finite at N=%.0f (\"%s\")", n, e.source().c_str());
            issues->push_back(CatalogIssue{path, buf});
            return;
        }
        if (v < 0.0) {
            std::snprintf(buf, sizeof(buf), "negative (%g) at N=%.0f", v, n);
            issues->push_back(CatalogIssue{path, buf});
            return;
        }
        if (i > 0 && v + 1e-9 * std::max(1.0, std::fabs(prev)) < prev) {
            std::snprintf(buf, sizeof(buf), "decreases in N: %g at N=%.0f < %g at N=%.0f",
                          v, n, prev, grid[i - 1]);
            issues->push_back(CatalogIssue{path, buf});
            return;
        }
        prev = v;
    }
    const std::string why = e.monotonicity_issue();
    if (!why.empty()) issues->push_back(CatalogIssue{path, "not monotone in N (\"" + e.source() + "\"): " + why});
}

void validate_tool_definition(const ToolDefinition& def, std::vector<CatalogIssue>* issues) {
    for (const auto& [cap_name, cb] : def.capabilities) {
        bool cap_ok = !cap_name.empty();
        for (char c : cap_name) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                            c == '_' || c == '.' || c == ':' || c == '-';
            if (!ok) cap_ok = false;
        }
        if (!cap_ok) issues->push_back(CatalogIssue{"capabilities." + cap_name, "capability name must match [A-Za-z0-9_.:-]+"});

        for (const auto& [pat_name, pt] : cb.patterns) {
            const std::string p = "capabilities." + cap_name + ".patterns." + pat_name + ".";
            check_model(pt.time_estimate_ms, p + "time_estimate_ms", issues);
            check_model(pt.cost_estimate, p + "cost_estimate", issues);
        }
    }
}

ImportReport import_tool_definition(ICatalogStore& store, const std::string& json, bool dry_run) {
    ImportReport r;
    r.dry_run = dry_run;

    auto def = parse_tool_definition(json, &r.issues);
    if (!def) return r;
    r.tool = def->name;
    r.version = def->version;

    validate_tool_definition(*def, &r.issues);
    if (!r.issues.empty()) return r;

    if (dry_run) {
        r.ok = true;
        return r;
    }
    try {
        r.written = store.upsert(*def);
        r.ok = true;
    } catch (const CatalogConflict& e) {
        r.issues.push_back(CatalogIssue{"version", e.what()});
    } catch (const CatalogAuthoringError& e) {
        r.issues.push_back(CatalogIssue{"name", e.what()});
    }
    return r;
}

std::string import_report_to_json(const ImportReport& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(r.ok));
    json_object_object_add(o, "dryRun", json_object_new_boolean(r.dry_run));
    json_object_object_add(o, "written", json_object_new_boolean(r.written));
    json_object_object_add(o, "tool", json_object_new_string(r.tool.c_str()));
    json_object_object_add(o, "version", json_object_new_string(r.version.c_str()));
    json_object* arr = json_object_new_array();
    for (const auto& i : r.issues) {
        json_object* io = json_object_new_object();
        json_object_object_add(io, "path", json_object_new_string(i.path.c_str()));
        json_object_object_add(io, "message", json_object_new_string(i.message.c_str()));
        json_object_array_add(arr, io);
    }
    json_object_object_add(o, "issues", arr);
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

} // namespace caproute
