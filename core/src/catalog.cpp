#include "caproute/catalog.h"
#include "caproute/errors.h"
#include "caproute/json_mini.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace caproute {

namespace jm = json_mini;

const char* tool_status_str(ToolStatus s) {
    switch (s) {
        case ToolStatus::ACTIVE: return "active";
        case ToolStatus::DEPRECATED: return "deprecated";
        case ToolStatus::DISABLED: return "disabled";
        case ToolStatus::TESTING: return "testing";
        case ToolStatus::DRAFT: return "draft";
    }
    return "active";
}

std::optional<ToolStatus> tool_status_from_str(const std::string& s) {
    if (s == "active") return ToolStatus::ACTIVE;
    if (s == "deprecated") return ToolStatus::DEPRECATED;
    if (s == "disabled") return ToolStatus::DISABLED;
    if (s == "testing") return ToolStatus::TESTING;
    if (s == "draft") return ToolStatus::DRAFT;
    return std::nullopt;
}

const char* protocol_str(Protocol p) {
    switch (p) {
        case Protocol::LOCAL: return "local";
        case Protocol::SSH: return "ssh";
        case Protocol::WINRM: return "winrm";
        case Protocol::HTTP: return "http";
        case Protocol::DATABASE: return "database";
        case Protocol::CUSTOM: return "custom";
    }
    return "local";
}

std::optional<Protocol> protocol_from_str(const std::string& s) {
    if (s == "local") return Protocol::LOCAL;
    if (s == "ssh") return Protocol::SSH;
    if (s == "winrm" || s == "powershell") return Protocol::WINRM;
    if (s == "http" || s == "https") return Protocol::HTTP;
    if (s == "database") return Protocol::DATABASE;
    if (s == "custom") return Protocol::CUSTOM;
    return std::nullopt;
}

bool is_known_platform(const std::string& p) {
    static const char* kPlatforms[] = {
        "linux", "windows", "network", "database", "scheduler", "custom", "multi-platform"};
    for (const char* k : kPlatforms) {
        if (p == k) return true;
    }
    return false;
}

const Pattern* ToolDefinition::find_pattern(const std::string& capability, const std::string& pattern) const {
    auto cit = capabilities.find(capability);
    if (cit == capabilities.end()) return nullptr;
    auto pit = cit->second.patterns.find(pattern);
    if (pit == cit->second.patterns.end()) return nullptr;
    return &pit->second;
}

std::string Candidate::label() const {
    return (tool ? tool->name : std::string()) + "/" + (pattern ? pattern->name : std::string());
}

// ---------- versions ----------

static bool parse_version(const std::string& v, long long out[3]) {
    out[0] = out[1] = out[2] = 0;
    int part = 0;
    size_t i = 0;
    if (v.empty()) return false;
    while (part < 3) {
        if (i >= v.size() || v[i] < '0' || v[i] > '9') return false;
        long long acc = 0;
        while (i < v.size() && v[i] >= '0' && v[i] <= '9') {
            acc = acc * 10 + (v[i] - '0');
            if (acc > 1000000000LL) return false;
            i++;
        }
        out[part++] = acc;
        if (part < 3) {
            if (i >= v.size() || v[i] != '.') return false;
            i++;
        }
    }
    // Optional pre-release / build suffix is tolerated but ignored for ordering.
    return i == v.size() || v[i] == '-' || v[i] == '+';
}

bool is_semver(const std::string& v) {
    long long p[3];
    return parse_version(v, p);
}

int compare_versions(const std::string& a, const std::string& b) {
    long long pa[3], pb[3];
    parse_version(a, pa);
    parse_version(b, pb);
    for (int i = 0; i < 3; i++) {
        if (pa[i] != pb[i]) return pa[i] < pb[i] ? -1 : 1;
    }
    return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}

std::vector<ToolDefPtr> latest_selectable(const std::vector<ToolDefPtr>& records) {
    std::map<std::string, ToolDefPtr> best;
    for (const auto& r : records) {
        if (!r || !r->selectable()) continue;
        auto it = best.find(r->name);
        if (it == best.end() || compare_versions(it->second->version, r->version) < 0) {
            best[r->name] = r;
        }
    }
    std::vector<ToolDefPtr> out;
    out.reserve(best.size());
    for (auto& kv : best) out.push_back(kv.second);
    return out;
}

std::vector<Candidate> candidates_for(const std::vector<ToolDefPtr>& tools,
                                      const std::string& capability,
                                      const std::string& platform) {
    std::vector<Candidate> out;
    for (const auto& t : tools) {
        if (!t) continue;
        if (!platform.empty() && t->platform != platform && t->platform != "multi-platform") continue;
        auto cit = t->capabilities.find(capability);
        if (cit == t->capabilities.end()) continue;
        for (const auto& kv : cit->second.patterns) {
            out.push_back(Candidate{t, capability, &kv.second});
        }
    }
    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        if (a.tool->name != b.tool->name) return a.tool->name < b.tool->name;
        return a.pattern->name < b.pattern->name;
    });
    return out;
}

// ---------- parsing ----------

namespace {

class DefReader {
public:
    explicit DefReader(std::vector<CatalogIssue>* issues) : issues_(issues) {}

    void issue(const std::string& path, const std::string& msg) {
        if (issues_) issues_->push_back(CatalogIssue{path, msg});
        failed_ = true;
    }
    bool failed() const { return failed_; }

    std::string req_string(json_object* o, const char* key, const std::string& path) {
        auto v = jm::field_string(o, key);
        if (!v || v->empty()) {
            issue(path + key, "required non-empty string");
            return "";
        }
        return *v;
    }

    double unit_interval(json_object* o, const char* key, const std::string& path, bool required, double defv) {
        json_object* v = jm::field(o, key);
        if (!v) {
            if (required) issue(path + key, "required number in [0,1]");
            return defv;
        }
        if (!jm::is_number(v)) {
            issue(path + key, "must be a number");
            return defv;
        }
        double d = json_object_get_double(v);
        if (!std::isfinite(d) || d < 0.0 || d > 1.0) {
            issue(path + key, "must be within [0,1]");
            return defv;
        }
        return d;
    }

    CostExpr cost_model(json_object* o, const char* key, const std::string& path) {
        json_object* v = jm::field(o, key);
        const std::string p = path + key;
        if (!v) {
            issue(p, "required cost model (expression string, number or {base, per_item})");
            return CostExpr{};
        }
        try {
            if (json_object_is_type(v, json_type_string)) {
                return CostExpr::compile(json_object_get_string(v));
            }
            if (jm::is_number(v)) {
                return CostExpr::constant(json_object_get_double(v));
            }
            if (json_object_is_type(v, json_type_object)) {
                auto base = jm::field_double(v, "base");
                auto per_item = jm::field_double(v, "per_item");
                if (!base) {
                    issue(p + ".base", "required number");
                    return CostExpr{};
                }
                return CostExpr::linear(*base, per_item.value_or(0.0));
            }
        } catch (const CatalogAuthoringError& e) {
            issue(p, e.what());
            return CostExpr{};
        }
        issue(p, "unsupported cost model form");
        return CostExpr{};
    }

    std::vector<InputParam> inputs(json_object* o, const char* key, const std::string& path) {
        std::vector<InputParam> out;
        json_object* arr = jm::field(o, key);
        if (!arr) return out;
        if (!json_object_is_type(arr, json_type_array)) {
            issue(path + key, "must be an array");
            return out;
        }
        const size_t n = json_object_array_length(arr);
        for (size_t i = 0; i < n; i++) {
            json_object* el = json_object_array_get_idx(arr, i);
            const std::string ep = path + key + "[" + std::to_string(i) + "]";
            InputParam ip;
            if (el && json_object_is_type(el, json_type_string)) {
                ip.name = json_object_get_string(el);
            } else if (el && json_object_is_type(el, json_type_object)) {
                ip.name = jm::field_string(el, "name").value_or("");
                ip.type = jm::field_string(el, "type").value_or("string");
                ip.validation = jm::field_string(el, "validation").value_or("");
            } else {
                issue(ep, "must be a name or {name, type, validation}");
                continue;
            }
            if (ip.name.empty()) issue(ep + ".name", "required non-empty string");
            static const char* kTypes[] = {"string", "integer", "number", "boolean", "array", "object"};
            if (std::find_if(std::begin(kTypes), std::end(kTypes),
                             [&](const char* t) { return ip.type == t; }) == std::end(kTypes)) {
                issue(ep + ".type", "unknown type '" + ip.type + "'");
            }
            if (!ip.validation.empty()) {
                try {
                    std::regex re(ip.validation, std::regex::ECMAScript);
                    (void)re;
                } catch (const std::regex_error& e) {
                    issue(ep + ".validation", std::string("invalid regex: ") + e.what());
                }
            }
            out.push_back(std::move(ip));
        }
        return out;
    }

    PolicyBlock policy(json_object* o, const std::string& path) {
        PolicyBlock pb;
        json_object* pol = jm::field(o, "policy");
        if (!pol) return pb;
        const std::string p = path + "policy.";
        if (!json_object_is_type(pol, json_type_object)) {
            issue(path + "policy", "must be an object");
            return pb;
        }
        if (json_object* v = jm::field(pol, "max_cost")) {
            if (!jm::is_number(v) || json_object_get_double(v) < 0.0) issue(p + "max_cost", "must be a non-negative number");
            else pb.max_cost = json_object_get_double(v);
        }
        if (json_object* v = jm::field(pol, "max_execution_time_ms")) {
            if (!jm::is_number(v) || json_object_get_double(v) <= 0.0) issue(p + "max_execution_time_ms", "must be a positive number");
            else pb.max_execution_time_ms = static_cast<int64_t>(json_object_get_double(v));
        }
        pb.requires_approval = jm::field_bool(pol, "requires_approval").value_or(false);
        pb.production_safe = jm::field_bool(pol, "production_safe").value_or(true);
        pb.allowed_environments = jm::field_strings(pol, "allowed_environments");
        pb.required_permissions = jm::field_strings(pol, "required_permissions");
        return pb;
    }

    Pattern pattern(const std::string& name, json_object* o, const std::string& path) {
        Pattern pt;
        pt.name = name;
        if (!json_object_is_type(o, json_type_object)) {
            issue(path, "pattern must be an object");
            return pt;
        }
        const std::string p = path + ".";
        pt.description = jm::field_string(o, "description").value_or("");
        pt.time_estimate_ms = cost_model(o, "time_estimate_ms", p);
        pt.cost_estimate = cost_model(o, "cost_estimate", p);
        pt.complexity_score = unit_interval(o, "complexity_score", p, false, 0.0);
        pt.completeness = jm::field_string(o, "completeness").value_or("exact");
        if (pt.completeness != "exact" && pt.completeness != "approximate" && pt.completeness != "partial") {
            issue(p + "completeness", "must be exact, approximate or partial");
        }
        pt.scope = jm::field_string(o, "scope").value_or("");
        pt.typical_use_cases = jm::field_strings(o, "typical_use_cases");
        pt.limitations = jm::field_strings(o, "limitations");
        pt.policy = policy(o, p);

        json_object* pm = jm::field(o, "preference_match");
        if (!pm || !json_object_is_type(pm, json_type_object)) {
            issue(p + "preference_match", "required object with speed, accuracy, cost, complexity, completeness");
        } else {
            const std::string pp = p + "preference_match.";
            pt.preference_match.speed = unit_interval(pm, "speed", pp, true, 0.5);
            pt.preference_match.accuracy = unit_interval(pm, "accuracy", pp, true, 0.5);
            pt.preference_match.cost = unit_interval(pm, "cost", pp, true, 0.5);
            pt.preference_match.complexity = unit_interval(pm, "complexity", pp, true, 0.5);
            pt.preference_match.completeness = unit_interval(pm, "completeness", pp, true, 0.5);
        }

        pt.required_inputs = inputs(o, "required_inputs", p);
        pt.optional_inputs = inputs(o, "optional_inputs", p);
        return pt;
    }

private:
    std::vector<CatalogIssue>* issues_;
    bool failed_{false};
};

} // namespace

std::optional<ToolDefinition> parse_tool_definition(const std::string& json,
                                                    std::vector<CatalogIssue>* issues) {
    DefReader r(issues);
    jm::Doc d = jm::parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        r.issue("$", "document is not a JSON object");
        return std::nullopt;
    }
    json_object* root = d.root;

    ToolDefinition def;
    def.name = r.req_string(root, "name", "");
    def.version = r.req_string(root, "version", "");
    if (!def.version.empty() && !is_semver(def.version)) r.issue("version", "must be MAJOR.MINOR.PATCH");
    def.platform = r.req_string(root, "platform", "");
    if (!def.platform.empty() && !is_known_platform(def.platform)) r.issue("platform", "unknown platform '" + def.platform + "'");
    def.category = jm::field_string(root, "category").value_or("");
    def.description = jm::field_string(root, "description").value_or("");

    const std::string status = jm::field_string(root, "status").value_or("active");
    if (auto st = tool_status_from_str(status)) def.status = *st;
    else r.issue("status", "unknown status '" + status + "'");

    if (json_object* rt = jm::field(root, "routing")) {
        if (!json_object_is_type(rt, json_type_object)) {
            r.issue("routing", "must be an object");
        } else {
            def.routing.execution_location = jm::field_string(rt, "execution_location").value_or("local");
            if (def.routing.execution_location.empty()) r.issue("routing.execution_location", "must not be empty");
            def.routing.requires_credentials = jm::field_bool(rt, "requires_credentials").value_or(false);
            const std::string proto = jm::field_string(rt, "protocol").value_or("local");
            if (auto p = protocol_from_str(proto)) def.routing.protocol = *p;
            else r.issue("routing.protocol", "unknown protocol '" + proto + "'");
            def.routing.protocol_metadata = jm::field_string_map(rt, "protocol_metadata");
        }
    }

    json_object* caps = jm::field(root, "capabilities");
    if (!caps || !json_object_is_type(caps, json_type_object) || json_object_object_length(caps) == 0) {
        r.issue("capabilities", "required non-empty object");
    } else {
        json_object_object_foreach(caps, cap_name, cap_obj) {
            const std::string cp = std::string("capabilities.") + cap_name;
            CapabilityBlock cb;
            if (!cap_obj || !json_object_is_type(cap_obj, json_type_object)) {
                r.issue(cp, "must be an object");
                continue;
            }
            cb.description = jm::field_string(cap_obj, "description").value_or("");
            json_object* pats = jm::field(cap_obj, "patterns");
            if (!pats || !json_object_is_type(pats, json_type_object) || json_object_object_length(pats) == 0) {
                r.issue(cp + ".patterns", "required non-empty object");
                continue;
            }
            json_object_object_foreach(pats, pat_name, pat_obj) {
                cb.patterns[pat_name] = r.pattern(pat_name, pat_obj, cp + ".patterns." + pat_name);
            }
            def.capabilities[cap_name] = std::move(cb);
        }
    }

    if (r.failed()) return std::nullopt;
    return def;
}

ToolDefinition tool_from_json(const std::string& json) {
    std::vector<CatalogIssue> issues;
    auto def = parse_tool_definition(json, &issues);
    if (!def) {
        std::ostringstream oss;
        oss << "invalid tool definition:";
        for (const auto& i : issues) oss << " [" << i.path << "] " << i.message << ";";
        throw CatalogAuthoringError(oss.str());
    }
    return std::move(*def);
}

// ---------- serialization ----------

static json_object* str_array(const std::vector<std::string>& v) {
    json_object* a = json_object_new_array();
    for (const auto& s : v) json_object_array_add(a, json_object_new_string(s.c_str()));
    return a;
}

static json_object* inputs_to_json(const std::vector<InputParam>& in) {
    json_object* a = json_object_new_array();
    for (const auto& ip : in) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "name", json_object_new_string(ip.name.c_str()));
        json_object_object_add(o, "type", json_object_new_string(ip.type.c_str()));
        if (!ip.validation.empty())
            json_object_object_add(o, "validation", json_object_new_string(ip.validation.c_str()));
        json_object_array_add(a, o);
    }
    return a;
}

std::string tool_to_json(const ToolDefinition& def) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "name", json_object_new_string(def.name.c_str()));
    json_object_object_add(root, "version", json_object_new_string(def.version.c_str()));
    json_object_object_add(root, "platform", json_object_new_string(def.platform.c_str()));
    json_object_object_add(root, "category", json_object_new_string(def.category.c_str()));
    json_object_object_add(root, "description", json_object_new_string(def.description.c_str()));
    json_object_object_add(root, "status", json_object_new_string(tool_status_str(def.status)));

    json_object* rt = json_object_new_object();
    json_object_object_add(rt, "execution_location", json_object_new_string(def.routing.execution_location.c_str()));
    json_object_object_add(rt, "requires_credentials", json_object_new_boolean(def.routing.requires_credentials));
    json_object_object_add(rt, "protocol", json_object_new_string(protocol_str(def.routing.protocol)));
    json_object* md = json_object_new_object();
    for (const auto& kv : def.routing.protocol_metadata)
        json_object_object_add(md, kv.first.c_str(), json_object_new_string(kv.second.c_str()));
    json_object_object_add(rt, "protocol_metadata", md);
    json_object_object_add(root, "routing", rt);

    json_object* caps = json_object_new_object();
    for (const auto& [cap_name, cb] : def.capabilities) {
        json_object* co = json_object_new_object();
        json_object_object_add(co, "description", json_object_new_string(cb.description.c_str()));
        json_object* pats = json_object_new_object();
        for (const auto& [pat_name, pt] : cb.patterns) {
            json_object* po = json_object_new_object();
            json_object_object_add(po, "description", json_object_new_string(pt.description.c_str()));
            json_object_object_add(po, "time_estimate_ms", json_object_new_string(pt.time_estimate_ms.source().c_str()));
            json_object_object_add(po, "cost_estimate", json_object_new_string(pt.cost_estimate.source().c_str()));
            json_object_object_add(po, "complexity_score", json_object_new_double(pt.complexity_score));
            json_object_object_add(po, "completeness", json_object_new_string(pt.completeness.c_str()));
            if (!pt.scope.empty()) json_object_object_add(po, "scope", json_object_new_string(pt.scope.c_str()));
            json_object_object_add(po, "typical_use_cases", str_array(pt.typical_use_cases));
            json_object_object_add(po, "limitations", str_array(pt.limitations));

            json_object* pol = json_object_new_object();
            if (pt.policy.max_cost) json_object_object_add(pol, "max_cost", json_object_new_double(*pt.policy.max_cost));
            json_object_object_add(pol, "requires_approval", json_object_new_boolean(pt.policy.requires_approval));
            json_object_object_add(pol, "production_safe", json_object_new_boolean(pt.policy.production_safe));
            if (pt.policy.max_execution_time_ms)
                json_object_object_add(pol, "max_execution_time_ms", json_object_new_int64(*pt.policy.max_execution_time_ms));
            if (!pt.policy.allowed_environments.empty())
                json_object_object_add(pol, "allowed_environments", str_array(pt.policy.allowed_environments));
            if (!pt.policy.required_permissions.empty())
                json_object_object_add(pol, "required_permissions", str_array(pt.policy.required_permissions));
            json_object_object_add(po, "policy", pol);

            json_object* pm = json_object_new_object();
            json_object_object_add(pm, "speed", json_object_new_double(pt.preference_match.speed));
            json_object_object_add(pm, "accuracy", json_object_new_double(pt.preference_match.accuracy));
            json_object_object_add(pm, "cost", json_object_new_double(pt.preference_match.cost));
            json_object_object_add(pm, "complexity", json_object_new_double(pt.preference_match.complexity));
            json_object_object_add(pm, "completeness", json_object_new_double(pt.preference_match.completeness));
            json_object_object_add(po, "preference_match", pm);

            json_object_object_add(po, "required_inputs", inputs_to_json(pt.required_inputs));
            json_object_object_add(po, "optional_inputs", inputs_to_json(pt.optional_inputs));
            json_object_object_add(pats, pat_name.c_str(), po);
        }
        json_object_object_add(co, "patterns", pats);
        json_object_object_add(caps, cap_name.c_str(), co);
    }
    json_object_object_add(root, "capabilities", caps);

    std::string out = jm::canonical(root);
    json_object_put(root);
    return out;
}

} // namespace caproute
