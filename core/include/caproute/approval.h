#pragma once

// Approval leases: TTL-bound, single-use tokens an operator issues so that a
// step whose pattern requires approval may run.
//
// Scope: "tool", "tool/pattern", or "*". An optional host pins the lease to a
// single target_host. Issuance is audited by the caller.

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace caproute {

struct ApprovalLease {
    std::string token;        // "appr_" + random hex
    std::string scope;        // tool, tool/pattern or "*"
    std::string host;         // "" matches any target host
    std::string issuer;
    int64_t issued_ms{0};     // epoch ms
    int64_t expires_ms{0};
    bool consumed{false};
};

class ApprovalLeaseManager {
public:
    // TTL is clamped to [1s, 300s].
    ApprovalLease issue(const std::string& scope,
                        int64_t ttl_ms = 60000,
                        const std::string& issuer = "operator",
                        const std::string& host = "");

    // Verifies token against the step's tool/pattern/host and consumes it.
    // On failure, *reason says why.
    bool verify_and_consume(const std::string& token,
                            const std::string& tool,
                            const std::string& pattern,
                            const std::string& host,
                            std::string* reason = nullptr);

    void gc();

    size_t active_count() const;
    size_t total_issued() const;
    size_t total_consumed() const;
    size_t total_rejected() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, ApprovalLease> leases_;
    size_t total_issued_{0};
    size_t total_consumed_{0};
    size_t total_rejected_{0};
};

} // namespace caproute
