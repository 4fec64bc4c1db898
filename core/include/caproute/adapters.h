#pragma once

#include "caproute/credentials.h"
#include "caproute/enricher.h"
#include "caproute/proc.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace caproute {

// Plan-level cancellation flag shared with every in-flight adapter call.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }
    const std::atomic<bool>* flag() const { return &flag_; }

private:
    std::atomic<bool> flag_{false};
};

// What the dispatcher hands an adapter instead of a secret.
struct CredentialHandle {
    std::string ref;
    std::string host;
};

struct StepContext {
    const CancelToken* cancel{nullptr};
    int64_t timeout_ms{0};                     // effective per-step timeout
    std::optional<CredentialHandle> credential;
    std::string inputs_json{"{}"};             // step inputs after ${id.output} substitution
};

enum class StepStatus { SUCCEEDED, FAILED, TIMED_OUT, SKIPPED, CANCELLED };

const char* step_status_str(StepStatus s);

struct StepResult {
    std::string step_id;
    std::string tool;
    std::string pattern;
    StepStatus status{StepStatus::FAILED};
    std::string output;
    std::string error;
    int exit_code{-1};
    int64_t duration_ms{0};
    std::string backend;          // adapter that ran the step
    bool fallback_routed{false};  // execution_location unknown, default backend used
};

// Uniform backend contract. Implementations must honour ctx.cancel and ctx.timeout_ms.
class IBackendAdapter {
public:
    virtual ~IBackendAdapter() = default;
    virtual const char* name() const = 0;
    virtual StepResult execute(const EnrichedExecutionStep& step, const StepContext& ctx) = 0;
};

// execution_location -> adapter, filled at startup.
class AdapterRegistry {
public:
    struct Resolved {
        std::shared_ptr<IBackendAdapter> adapter;
        std::string location;
        bool fell_back{false};
    };

    void register_adapter(const std::string& location, std::shared_ptr<IBackendAdapter> adapter);
    // Location used for unknown execution_location values; "" disables fallback.
    void set_default(const std::string& location);

    std::optional<Resolved> resolve(const std::string& location) const;
    std::vector<std::string> locations() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<IBackendAdapter>> adapters_;
    std::string default_location_;
};

// Renders "{name}" placeholders in each token from the step's string/number inputs.
// Unknown placeholders are an error. Returns "" on success.
std::string render_command(const std::vector<std::string>& tmpl, const std::string& inputs_json,
                           std::vector<std::string>* out);

// Local process: argv from protocol_metadata "command" (template), else the
// "command" array input. Inputs JSON on stdin when metadata "stdin" = "inputs".
class LocalProcessAdapter final : public IBackendAdapter {
public:
    explicit LocalProcessAdapter(ProcLimits lim = {});
    const char* name() const override { return "local"; }
    StepResult execute(const EnrichedExecutionStep& step, const StepContext& ctx) override;

private:
    ProcLimits lim_;
};

// OpenSSH client in batch mode with key-based credentials from the resolver.
class SshAdapter final : public IBackendAdapter {
public:
    SshAdapter(std::shared_ptr<ICredentialResolver> creds, ProcLimits lim = {}, std::string ssh_bin = "ssh");
    const char* name() const override { return "ssh"; }
    StepResult execute(const EnrichedExecutionStep& step, const StepContext& ctx) override;

private:
    std::shared_ptr<ICredentialResolver> creds_;
    ProcLimits lim_;
    std::string ssh_bin_;
};

// Operator-configured client (WinRM, database) fed one JSON request on stdin:
// {host, tool, pattern, command, inputs, protocolMetadata, credential?}.
class StdinClientAdapter final : public IBackendAdapter {
public:
    StdinClientAdapter(std::string name, std::string client_cmd,
                       std::shared_ptr<ICredentialResolver> creds, ProcLimits lim = {});
    const char* name() const override { return name_.c_str(); }
    StepResult execute(const EnrichedExecutionStep& step, const StepContext& ctx) override;

private:
    std::string name_;
    std::vector<std::string> client_argv_;
    std::shared_ptr<ICredentialResolver> creds_;
    ProcLimits lim_;
};

// HTTP through curl. Target from metadata "url" (template), method from
// "method" (default GET), body from the "body" input or the whole inputs for
// POST/PUT/PATCH. Secrets and body go through curl's stdin config (-K -).
class HttpAdapter final : public IBackendAdapter {
public:
    // allowed_hosts empty and deny_by_default false: any host.
    HttpAdapter(std::shared_ptr<ICredentialResolver> creds, std::vector<std::string> allowed_hosts,
                bool deny_by_default, ProcLimits lim = {}, std::string curl_bin = "curl");
    const char* name() const override { return "http"; }
    StepResult execute(const EnrichedExecutionStep& step, const StepContext& ctx) override;

private:
    std::shared_ptr<ICredentialResolver> creds_;
    std::vector<std::string> allowed_hosts_;
    bool deny_by_default_{false};
    ProcLimits lim_;
    std::string curl_bin_;
};

// Host part of an http(s) URL, lowercased; "" when unparseable.
std::string url_host(const std::string& url);

} // namespace caproute
