#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace caproute {

struct ProcLimits {
    int64_t timeout_ms{30000};
    size_t output_max_bytes{256 * 1024};

    int rlimit_cpu_sec{0};          // 0: unlimited (adapters mostly wait on remote I/O)
    size_t rlimit_as_mb{1024};      // virtual memory MB
    size_t rlimit_fsize_mb{16};     // max file size MB
    int rlimit_nofile{256};         // max open fds

    bool no_new_privs{true};

    // Polled while the child runs; when set, the whole process group is killed.
    const std::atomic<bool>* cancel{nullptr};
};

struct ProcSpec {
    std::vector<std::string> argv;              // argv[0] resolved through PATH
    std::string cwd;
    std::string stdin_data;                     // written then closed; empty: stdin closed at once
    std::map<std::string, std::string> env;     // added to the (scrubbed) parent environment
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    int64_t duration_ms{0};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// fork/exec without a shell, own process group, rlimits, merged output capture
// with a byte cap, interleaved stdin feeding, timeout and cancellation kill of
// the group. CAPROUTE_PROC_WRAPPER (enabled by CAPROUTE_PROC_WRAPPER_ENABLE)
// is prepended to argv. Returns true if the process started.
bool proc_run(const ProcSpec& spec, const ProcLimits& lim, ProcResult* res);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace caproute
