#pragma once

#include "caproute/catalog.h"
#include "caproute/selection.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace caproute {

struct ExecutionStep {
    std::string id;
    std::string tool;
    std::string pattern;
    std::string capability;
    std::string target_host;
    std::string inputs_json{"{}"};           // JSON object
    std::vector<std::string> depends_on;     // ids of earlier steps
    std::string credential_ref;              // resolution handle, never a secret
    std::string approval_token;
};

// Step plus everything the dispatcher needs, copied from the ToolDefinition
// captured at selection time. The dispatcher reads only these fields.
struct EnrichedExecutionStep : ExecutionStep {
    std::string tool_version;
    bool requires_credentials{false};
    std::string execution_location{"local"};
    Protocol protocol{Protocol::LOCAL};
    std::map<std::string, std::string> protocol_metadata;
    bool requires_approval{false};
    std::optional<int64_t> max_execution_time_ms;
    double estimated_cost{0.0};
    double estimated_time_ms{0.0};
};

// Copies the selected tool's routing block onto the result. Single writer of
// routing metadata on the selection path.
void stamp_routing(SelectionResult& r);

// Problems with `inputs_json` against the pattern's declared inputs
// (required present, declared type, validation regex). Empty: valid.
std::vector<std::string> validate_inputs(const Pattern& p, const std::string& inputs_json);

class PlanEnricher {
public:
    // Throws EnrichmentError when the step names a different tool/pattern than
    // the selection, or its inputs do not satisfy the pattern declarations.
    EnrichedExecutionStep enrich(const ExecutionStep& step, const SelectionResult& selection) const;
};

} // namespace caproute
