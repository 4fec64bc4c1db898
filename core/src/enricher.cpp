#include "caproute/enricher.h"
#include "caproute/errors.h"
#include "caproute/json_mini.h"

#include <cmath>
#include <regex>

namespace caproute {

void stamp_routing(SelectionResult& r) {
    if (!r.tool) return;
    r.routing = r.tool->routing;
    r.routing_stamped = true;
}

static bool type_matches(json_object* v, const std::string& type) {
    if (type == "string") return json_object_is_type(v, json_type_string);
    if (type == "integer") {
        if (json_object_is_type(v, json_type_int)) return true;
        if (!json_object_is_type(v, json_type_double)) return false;
        double d = json_object_get_double(v);
        return std::isfinite(d) && std::floor(d) == d;
    }
    if (type == "number") return json_mini::is_number(v);
    if (type == "boolean") return json_object_is_type(v, json_type_boolean);
    if (type == "array") return json_object_is_type(v, json_type_array);
    if (type == "object") return json_object_is_type(v, json_type_object);
    return false;
}

static void check_param(json_object* inputs, const InputParam& ip, bool required, std::vector<std::string>* out) {
    json_object* v = json_mini::field(inputs, ip.name.c_str());
    if (!v) {
        if (required) out->push_back("missing required input '" + ip.name + "'");
        return;
    }
    if (!type_matches(v, ip.type)) {
        out->push_back("input '" + ip.name + "' must be of type " + ip.type);
        return;
    }
    if (!ip.validation.empty() && json_object_is_type(v, json_type_string)) {
        try {
            std::regex re(ip.validation, std::regex::ECMAScript);
            if (!std::regex_match(std::string(json_object_get_string(v)), re))
                out->push_back("input '" + ip.name + "' does not match " + ip.validation);
        } catch (const std::regex_error& e) {
            out->push_back("input '" + ip.name + "' has an unusable validation rule: " + e.what());
        }
    }
}

std::vector<std::string> validate_inputs(const Pattern& p, const std::string& inputs_json) {
    std::vector<std::string> out;
    json_mini::Doc d = json_mini::parse(inputs_json.empty() ? std::string("{}") : inputs_json);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        out.push_back("inputs must be a JSON object");
        return out;
    }
    for (const auto& ip : p.required_inputs) check_param(d.root, ip, true, &out);
    for (const auto& ip : p.optional_inputs) check_param(d.root, ip, false, &out);
    return out;
}

EnrichedExecutionStep PlanEnricher::enrich(const ExecutionStep& step, const SelectionResult& sel) const {
    const Pattern* pat = sel.pattern();
    if (!sel.tool || !pat) throw EnrichmentError("selection carries no tool/pattern");
    if (!step.tool.empty() && step.tool != sel.tool->name)
        throw EnrichmentError("step '" + step.id + "' names tool '" + step.tool + "' but selection chose '" +
                              sel.tool->name + "'");
    if (!step.pattern.empty() && step.pattern != sel.pattern_name)
        throw EnrichmentError("step '" + step.id + "' names pattern '" + step.pattern + "' but selection chose '" +
                              sel.pattern_name + "'");

    auto problems = validate_inputs(*pat, step.inputs_json);
    if (!problems.empty()) {
        std::string msg = "step '" + step.id + "' inputs rejected:";
        for (const auto& p : problems) msg += " " + p + ";";
        throw EnrichmentError(msg);
    }

    // Prefer the routing stamped at selection; fall back to the captured record.
    const RoutingInfo& rt = sel.routing_stamped ? sel.routing : sel.tool->routing;

    EnrichedExecutionStep e;
    static_cast<ExecutionStep&>(e) = step;
    if (e.id.empty()) e.id = sel.pattern_name;
    e.tool = sel.tool->name;
    e.pattern = sel.pattern_name;
    e.capability = sel.capability;
    if (e.inputs_json.empty()) e.inputs_json = "{}";
    e.tool_version = sel.tool->version;
    e.requires_credentials = rt.requires_credentials;
    e.execution_location = rt.execution_location;
    e.protocol = rt.protocol;
    e.protocol_metadata = rt.protocol_metadata;
    e.requires_approval = pat->policy.requires_approval;
    e.max_execution_time_ms = pat->policy.max_execution_time_ms;
    e.estimated_cost = sel.estimated_cost;
    e.estimated_time_ms = sel.estimated_time_ms;
    return e;
}

} // namespace caproute
