#include "caproute/adapters.h"
#include "caproute/json_mini.h"
#include "caproute/util.h"

#include <json-c/json.h>

#include <cctype>
#include <cstdio>

namespace caproute {

const char* step_status_str(StepStatus s) {
    switch (s) {
        case StepStatus::SUCCEEDED: return "succeeded";
        case StepStatus::FAILED: return "failed";
        case StepStatus::TIMED_OUT: return "timed_out";
        case StepStatus::SKIPPED: return "skipped";
        case StepStatus::CANCELLED: return "cancelled";
    }
    return "failed";
}

// ---------- registry ----------

void AdapterRegistry::register_adapter(const std::string& location, std::shared_ptr<IBackendAdapter> adapter) {
    std::lock_guard<std::mutex> lk(mu_);
    adapters_[location] = std::move(adapter);
}

void AdapterRegistry::set_default(const std::string& location) {
    std::lock_guard<std::mutex> lk(mu_);
    default_location_ = location;
}

std::optional<AdapterRegistry::Resolved> AdapterRegistry::resolve(const std::string& location) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = adapters_.find(location);
    if (it != adapters_.end()) return Resolved{it->second, location, false};
    if (default_location_.empty()) return std::nullopt;
    auto d = adapters_.find(default_location_);
    if (d == adapters_.end()) return std::nullopt;
    return Resolved{d->second, default_location_, true};
}

std::vector<std::string> AdapterRegistry::locations() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& kv : adapters_) out.push_back(kv.first);
    return out;
}

// ---------- helpers ----------

static std::optional<std::string> scalar_input(json_object* inputs, const std::string& name) {
    json_object* v = json_mini::field(inputs, name.c_str());
    if (!v) return std::nullopt;
    if (json_object_is_type(v, json_type_string)) return std::string(json_object_get_string(v));
    if (json_mini::is_number(v) || json_object_is_type(v, json_type_boolean)) return json_mini::to_string(v);
    return std::nullopt;
}

std::string render_command(const std::vector<std::string>& tmpl, const std::string& inputs_json,
                           std::vector<std::string>* out) {
    json_mini::Doc d = json_mini::parse(inputs_json.empty() ? std::string("{}") : inputs_json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return "inputs must be a JSON object";
    out->clear();
    for (const auto& tok : tmpl) {
        std::string r;
        for (size_t i = 0; i < tok.size(); i++) {
            if (tok[i] != '{') {
                r.push_back(tok[i]);
                continue;
            }
            size_t close = tok.find('}', i + 1);
            std::string name = close == std::string::npos ? std::string() : tok.substr(i + 1, close - i - 1);
            bool ident = !name.empty();
            for (char c : name) {
                if (!(std::isalnum((unsigned char)c) || c == '_')) ident = false;
            }
            if (!ident) {
                r.push_back(tok[i]);
                continue;
            }
            auto v = scalar_input(d.root, name);
            if (!v) return "command placeholder {" + name + "} has no scalar input";
            r += *v;
            i = close;
        }
        out->push_back(std::move(r));
    }
    return "";
}

static ProcLimits limits_for(const ProcLimits& base, const StepContext& ctx) {
    ProcLimits lim = base;
    if (ctx.timeout_ms > 0) lim.timeout_ms = ctx.timeout_ms;
    lim.cancel = ctx.cancel ? ctx.cancel->flag() : nullptr;
    return lim;
}

static StepResult begin_result(const EnrichedExecutionStep& step, const char* backend) {
    StepResult r;
    r.step_id = step.id;
    r.tool = step.tool;
    r.pattern = step.pattern;
    r.backend = backend;
    return r;
}

static StepResult fail(StepResult r, std::string why) {
    r.status = StepStatus::FAILED;
    r.error = std::move(why);
    return r;
}

static StepResult finish(StepResult r, bool started, const ProcResult& pr) {
    r.output = pr.output;
    r.exit_code = pr.exit_code;
    r.duration_ms = pr.duration_ms;
    if (!started) return fail(std::move(r), pr.error.empty() ? "process not started" : pr.error);
    if (pr.cancelled) {
        r.status = StepStatus::CANCELLED;
        r.error = "cancelled";
    } else if (pr.timed_out) {
        r.status = StepStatus::TIMED_OUT;
        r.error = "timed out";
    } else if (pr.exit_code == 0) {
        r.status = StepStatus::SUCCEEDED;
    } else {
        r.status = StepStatus::FAILED;
        r.error = "exit_code=" + std::to_string(pr.exit_code);
    }
    if (pr.output_truncated) r.error += r.error.empty() ? "output truncated" : " (output truncated)";
    return r;
}

static std::string metadata(const EnrichedExecutionStep& step, const char* key) {
    auto it = step.protocol_metadata.find(key);
    return it == step.protocol_metadata.end() ? std::string() : it->second;
}

// Resolves the step's credential handle, if any. Returns "" on success.
static std::string resolve_credential(ICredentialResolver* creds, const EnrichedExecutionStep& step,
                                      const StepContext& ctx, const std::string& host,
                                      std::optional<Credential>* out) {
    out->reset();
    if (!ctx.credential) {
        if (step.requires_credentials) return "step requires credentials but carries no credential_ref";
        return "";
    }
    if (!creds) return "no credential resolver configured";
    *out = creds->resolve(ctx.credential->ref, host);
    if (!*out) return "credential '" + ctx.credential->ref + "' not resolvable for host '" + host + "'";
    return "";
}

static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

static std::string step_host(const EnrichedExecutionStep& step) {
    return step.target_host.empty() ? metadata(step, "host") : step.target_host;
}

// ---------- local ----------

LocalProcessAdapter::LocalProcessAdapter(ProcLimits lim) : lim_(lim) {}

StepResult LocalProcessAdapter::execute(const EnrichedExecutionStep& step, const StepContext& ctx) {
    StepResult r = begin_result(step, name());

    ProcSpec spec;
    const std::string cmd = metadata(step, "command");
    if (!cmd.empty()) {
        auto tmpl = split_argv_quoted(cmd);
        if (tmpl.empty()) return fail(std::move(r), "protocol_metadata.command is not parseable");
        std::string err = render_command(tmpl, ctx.inputs_json, &spec.argv);
        if (!err.empty()) return fail(std::move(r), err);
    } else {
        json_mini::Doc d = json_mini::parse(ctx.inputs_json);
        spec.argv = json_mini::field_strings(d.root, "command");
        if (spec.argv.empty()) return fail(std::move(r), "no command: set protocol_metadata.command or a 'command' array input");
    }
    spec.cwd = metadata(step, "cwd");
    if (metadata(step, "stdin") == "inputs") spec.stdin_data = ctx.inputs_json;
    spec.env["CAPROUTE_STEP_ID"] = step.id;
    spec.env["CAPROUTE_TOOL"] = step.tool + "/" + step.pattern;

    ProcResult pr;
    bool started = proc_run(spec, limits_for(lim_, ctx), &pr);
    return finish(std::move(r), started, pr);
}

// ---------- ssh ----------

SshAdapter::SshAdapter(std::shared_ptr<ICredentialResolver> creds, ProcLimits lim, std::string ssh_bin)
    : creds_(std::move(creds)), lim_(lim), ssh_bin_(std::move(ssh_bin)) {}

StepResult SshAdapter::execute(const EnrichedExecutionStep& step, const StepContext& ctx) {
    StepResult r = begin_result(step, name());
    const std::string host = step_host(step);
    if (host.empty()) return fail(std::move(r), "ssh step has no target_host");
    if (host[0] == '-') return fail(std::move(r), "invalid target_host");

    std::optional<Credential> cred;
    std::string err = resolve_credential(creds_.get(), step, ctx, host, &cred);
    if (!err.empty()) return fail(std::move(r), err);

    auto tmpl = split_argv_quoted(metadata(step, "command"));
    if (tmpl.empty()) return fail(std::move(r), "ssh step has no protocol_metadata.command");
    std::vector<std::string> remote;
    err = render_command(tmpl, ctx.inputs_json, &remote);
    if (!err.empty()) return fail(std::move(r), err);

    ProcSpec spec;
    spec.argv = {ssh_bin_, "-o", "BatchMode=yes", "-o", "ConnectTimeout=10"};
    const std::string strict = metadata(step, "strict_host_key_checking");
    spec.argv.push_back("-o");
    spec.argv.push_back("StrictHostKeyChecking=" + (strict.empty() ? std::string("yes") : strict));
    const std::string port = metadata(step, "port");
    if (!port.empty()) {
        spec.argv.push_back("-p");
        spec.argv.push_back(port);
    }
    if (cred) {
        if (cred->key_path.empty() && !cred->secret.empty())
            return fail(std::move(r), "ssh adapter needs key_path credentials (password auth is not available in batch mode)");
        if (!cred->key_path.empty()) {
            spec.argv.push_back("-i");
            spec.argv.push_back(cred->key_path);
        }
        if (!cred->username.empty()) {
            spec.argv.push_back("-l");
            spec.argv.push_back(cred->username);
        }
    }
    spec.argv.push_back(host);
    spec.argv.push_back("--");
    std::string remote_cmd;
    for (size_t i = 0; i < remote.size(); i++) {
        if (i) remote_cmd.push_back(' ');
        remote_cmd += shell_quote(remote[i]);
    }
    spec.argv.push_back(remote_cmd);

    ProcResult pr;
    bool started = proc_run(spec, limits_for(lim_, ctx), &pr);
    r = finish(std::move(r), started, pr);
    if (r.status == StepStatus::FAILED && r.exit_code == 255) r.error = "ssh connection failed (exit_code=255)";
    return r;
}

// ---------- stdin client (winrm, database) ----------

StdinClientAdapter::StdinClientAdapter(std::string name, std::string client_cmd,
                                       std::shared_ptr<ICredentialResolver> creds, ProcLimits lim)
    : name_(std::move(name)), client_argv_(split_argv_quoted(client_cmd)), creds_(std::move(creds)), lim_(lim) {}

StepResult StdinClientAdapter::execute(const EnrichedExecutionStep& step, const StepContext& ctx) {
    StepResult r = begin_result(step, name());
    if (client_argv_.empty()) return fail(std::move(r), "no client command configured for backend '" + name_ + "'");
    const std::string host = step_host(step);

    std::optional<Credential> cred;
    std::string err = resolve_credential(creds_.get(), step, ctx, host, &cred);
    if (!err.empty()) return fail(std::move(r), err);

    json_object* req = json_object_new_object();
    struct JsonGuard { json_object* o; ~JsonGuard() { if (o) json_object_put(o); } };
    JsonGuard guard{req};
    json_object_object_add(req, "backend", json_object_new_string(name_.c_str()));
    json_object_object_add(req, "host", json_object_new_string(host.c_str()));
    json_object_object_add(req, "stepId", json_object_new_string(step.id.c_str()));
    json_object_object_add(req, "tool", json_object_new_string(step.tool.c_str()));
    json_object_object_add(req, "pattern", json_object_new_string(step.pattern.c_str()));

    const std::string cmd = metadata(step, "command");
    if (!cmd.empty()) {
        std::vector<std::string> rendered;
        err = render_command(split_argv_quoted(cmd), ctx.inputs_json, &rendered);
        if (!err.empty()) return fail(std::move(r), err);
        json_object* arr = json_object_new_array();
        for (const auto& t : rendered) json_object_array_add(arr, json_object_new_string(t.c_str()));
        json_object_object_add(req, "command", arr);
    }
    json_mini::Doc inputs = json_mini::parse(ctx.inputs_json);
    json_object_object_add(req, "inputs", inputs ? inputs.release() : json_object_new_object());
    json_object* md = json_object_new_object();
    for (const auto& [k, v] : step.protocol_metadata) json_object_object_add(md, k.c_str(), json_object_new_string(v.c_str()));
    json_object_object_add(req, "protocolMetadata", md);
    if (cred) {
        json_object* c = json_object_new_object();
        json_object_object_add(c, "username", json_object_new_string(cred->username.c_str()));
        json_object_object_add(c, "secret", json_object_new_string(cred->secret.c_str()));
        json_object_object_add(c, "keyPath", json_object_new_string(cred->key_path.c_str()));
        json_object_object_add(req, "credential", c);
    }

    ProcSpec spec;
    spec.argv = client_argv_;
    spec.stdin_data = json_mini::to_string(req) + "\n";
    ProcResult pr;
    bool started = proc_run(spec, limits_for(lim_, ctx), &pr);
    return finish(std::move(r), started, pr);
}

// ---------- http ----------

std::string url_host(const std::string& url) {
    size_t p = url.find("://");
    if (p == std::string::npos) return "";
    std::string scheme = lower_ascii(url.substr(0, p));
    if (scheme != "http" && scheme != "https") return "";
    std::string rest = url.substr(p + 3);
    size_t end = rest.find_first_of("/?#");
    std::string auth = rest.substr(0, end);
    size_t at = auth.rfind('@');
    if (at != std::string::npos) auth = auth.substr(at + 1);
    if (!auth.empty() && auth[0] == '[') {
        size_t rb = auth.find(']');
        if (rb == std::string::npos) return "";
        return lower_ascii(auth.substr(1, rb - 1));
    }
    size_t colon = auth.find(':');
    if (colon != std::string::npos) auth = auth.substr(0, colon);
    return lower_ascii(auth);
}

static bool host_allowed(const std::string& host, const std::vector<std::string>& allowed) {
    for (const auto& a : allowed) {
        const std::string al = lower_ascii(a);
        if (al == host) return true;
        if (!al.empty() && al[0] == '.' && host.size() > al.size() &&
            host.compare(host.size() - al.size(), al.size(), al) == 0)
            return true;
    }
    return false;
}

// Quoting for a value inside a curl config file.
static std::string curl_cfg_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    out += "\"";
    return out;
}

HttpAdapter::HttpAdapter(std::shared_ptr<ICredentialResolver> creds, std::vector<std::string> allowed_hosts,
                         bool deny_by_default, ProcLimits lim, std::string curl_bin)
    : creds_(std::move(creds)), allowed_hosts_(std::move(allowed_hosts)), deny_by_default_(deny_by_default),
      lim_(lim), curl_bin_(std::move(curl_bin)) {}

StepResult HttpAdapter::execute(const EnrichedExecutionStep& step, const StepContext& ctx) {
    StepResult r = begin_result(step, name());

    const std::string url_tmpl = metadata(step, "url");
    if (url_tmpl.empty()) return fail(std::move(r), "http step has no protocol_metadata.url");
    std::vector<std::string> rendered;
    std::string err = render_command({url_tmpl}, ctx.inputs_json, &rendered);
    if (!err.empty()) return fail(std::move(r), err);
    const std::string url = rendered.front();

    const std::string host = url_host(url);
    if (host.empty()) return fail(std::move(r), "url must be http(s)://host/...");
    if (!allowed_hosts_.empty()) {
        if (!host_allowed(host, allowed_hosts_)) return fail(std::move(r), "http host not allowed: " + host);
    } else if (deny_by_default_) {
        return fail(std::move(r), "http adapter denies all hosts until CAPROUTE_HTTP_ALLOWED_HOSTS is set");
    }

    std::string method = metadata(step, "method");
    method = method.empty() ? std::string("GET") : method;
    for (char& c : method) c = (char)std::toupper((unsigned char)c);
    for (char c : method) {
        if (c < 'A' || c > 'Z') return fail(std::move(r), "invalid http method");
    }

    std::optional<Credential> cred;
    err = resolve_credential(creds_.get(), step, ctx, host, &cred);
    if (!err.empty()) return fail(std::move(r), err);

    std::string cfg;
    cfg += "url = " + curl_cfg_quote(url) + "\n";
    if (cred) {
        if (metadata(step, "auth") == "bearer") {
            cfg += "header = " + curl_cfg_quote("Authorization: Bearer " + cred->secret) + "\n";
        } else {
            cfg += "user = " + curl_cfg_quote(cred->username + ":" + cred->secret) + "\n";
        }
    }
    if (method == "POST" || method == "PUT" || method == "PATCH") {
        json_mini::Doc d = json_mini::parse(ctx.inputs_json);
        std::string body;
        if (auto b = json_mini::field_string(d.root, "body")) body = *b;
        else if (json_object* bo = json_mini::field(d.root, "body")) body = json_mini::to_string(bo);
        else body = ctx.inputs_json;
        cfg += "header = \"Content-Type: application/json\"\n";
        cfg += "data-binary = " + curl_cfg_quote(body) + "\n";
    }

    ProcLimits lim = limits_for(lim_, ctx);
    char max_time[32];
    std::snprintf(max_time, sizeof(max_time), "%.3f", (lim.timeout_ms > 0 ? lim.timeout_ms : 30000) / 1000.0);

    ProcSpec spec;
    spec.argv = {curl_bin_, "-sS", "--proto", "=http,https", "-X", method, "--max-time", max_time,
                 "-w", "\n%{http_code}", "-K", "-"};
    spec.stdin_data = cfg;
    ProcResult pr;
    bool started = proc_run(spec, lim, &pr);
    r = finish(std::move(r), started, pr);

    // Last line is the status code written by -w.
    size_t nl = r.output.rfind('\n');
    if (nl != std::string::npos) {
        const std::string code = trim_ws(r.output.substr(nl + 1));
        r.output.erase(nl);
        if (r.status == StepStatus::SUCCEEDED) {
            int status = 0;
            try {
                status = std::stoi(code);
            } catch (const std::exception&) {
                status = 0;
            }
            if (status < 200 || status > 299) {
                r.status = StepStatus::FAILED;
                r.error = "http status " + (code.empty() ? std::string("unknown") : code);
            }
        }
    }
    return r;
}

} // namespace caproute
