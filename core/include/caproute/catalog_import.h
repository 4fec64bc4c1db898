#pragma once

#include "caproute/catalog.h"
#include "caproute/catalog_store.h"

#include <string>
#include <vector>

namespace caproute {

struct ImportReport {
    bool ok{false};
    bool dry_run{false};
    bool written{false};     // false on dry-run and on an identical re-import
    std::string tool;
    std::string version;
    std::vector<CatalogIssue> issues;
};

// Semantic checks beyond the schema: every cost model finite, non-negative and
// non-decreasing in N over a fixed sample grid. Appends to *issues.
void validate_tool_definition(const ToolDefinition& def, std::vector<CatalogIssue>* issues);

// Sample points used for the monotonicity check.
const std::vector<double>& monotonicity_grid();

// Parse + validate + (unless dry_run) upsert. Schema/monotonicity problems and
// a version conflict are reported in the returned issues; CatalogUnavailable
// from the store propagates.
ImportReport import_tool_definition(ICatalogStore& store, const std::string& json, bool dry_run);

std::string import_report_to_json(const ImportReport& r);

} // namespace caproute
