#pragma once

#include "caproute/cost_expr.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace caproute {

enum class ToolStatus { ACTIVE, DEPRECATED, DISABLED, TESTING, DRAFT };

const char* tool_status_str(ToolStatus s);
std::optional<ToolStatus> tool_status_from_str(const std::string& s);

enum class Protocol { LOCAL, SSH, WINRM, HTTP, DATABASE, CUSTOM };

const char* protocol_str(Protocol p);
std::optional<Protocol> protocol_from_str(const std::string& s);

// Known platform tags. "multi-platform" matches every platform filter.
bool is_known_platform(const std::string& p);

struct InputParam {
    std::string name;
    std::string type{"string"};   // string integer number boolean array object
    std::string validation;       // optional regex for string values
};

struct PolicyBlock {
    std::optional<double> max_cost;
    bool requires_approval{false};
    bool production_safe{true};
    std::optional<int64_t> max_execution_time_ms;
    std::vector<std::string> allowed_environments;  // empty: any
    std::vector<std::string> required_permissions;
};

// Normalized [0,1] per-axis suitability, independent of the raw cost model.
struct PreferenceMatch {
    double speed{0.5};
    double accuracy{0.5};
    double cost{0.5};
    double complexity{0.5};
    double completeness{0.5};
};

struct Pattern {
    std::string name;
    std::string description;

    CostExpr time_estimate_ms;
    CostExpr cost_estimate;

    double complexity_score{0.0};
    std::string completeness{"exact"};   // exact approximate partial
    std::string scope;
    std::vector<std::string> typical_use_cases;
    std::vector<std::string> limitations;

    PolicyBlock policy;
    PreferenceMatch preference_match;

    std::vector<InputParam> required_inputs;
    std::vector<InputParam> optional_inputs;
};

struct CapabilityBlock {
    std::string description;
    std::map<std::string, Pattern> patterns;
};

// Tagged routing data plus an escape-hatch map read only by the adapter
// registered for execution_location.
struct RoutingInfo {
    std::string execution_location{"local"};
    bool requires_credentials{false};
    Protocol protocol{Protocol::LOCAL};
    std::map<std::string, std::string> protocol_metadata;
};

struct ToolDefinition {
    std::string name;
    std::string version;       // MAJOR.MINOR.PATCH
    std::string platform;
    std::string category;
    std::string description;
    ToolStatus status{ToolStatus::ACTIVE};
    RoutingInfo routing;
    std::map<std::string, CapabilityBlock> capabilities;

    bool selectable() const { return status == ToolStatus::ACTIVE; }
    const Pattern* find_pattern(const std::string& capability, const std::string& pattern) const;
};

using ToolDefPtr = std::shared_ptr<const ToolDefinition>;

// One scoreable (tool, capability, pattern) triple. `pattern` points into *tool,
// which the shared pointer keeps alive.
struct Candidate {
    ToolDefPtr tool;
    std::string capability;
    const Pattern* pattern{nullptr};

    std::string label() const;  // "tool/pattern"
};

// Semantic version ordering. Returns <0, 0, >0. Unparseable parts compare as 0.
int compare_versions(const std::string& a, const std::string& b);
bool is_semver(const std::string& v);

// All (capability, pattern) candidates of the given tools for `capability`,
// restricted to `platform` when non-empty. Sorted by tool name then pattern name.
std::vector<Candidate> candidates_for(const std::vector<ToolDefPtr>& tools,
                                      const std::string& capability,
                                      const std::string& platform);

// Highest selectable version per tool name.
std::vector<ToolDefPtr> latest_selectable(const std::vector<ToolDefPtr>& records);

// ---------- JSON ----------

struct CatalogIssue {
    std::string path;     // e.g. capabilities.service_restart.patterns.stop.policy.max_cost
    std::string message;
};

// Parses a tool definition document, appending every schema problem to
// *issues. Returns nullopt when any problem was found. Does not check
// cost-model monotonicity (see catalog_import.h).
std::optional<ToolDefinition> parse_tool_definition(const std::string& json,
                                                    std::vector<CatalogIssue>* issues);

// Same, but throws CatalogAuthoringError listing the problems.
ToolDefinition tool_from_json(const std::string& json);
std::string tool_to_json(const ToolDefinition& def);

} // namespace caproute
