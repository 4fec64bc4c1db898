#include "caproute/approval.h"
#include "caproute/crypto.h"
#include "caproute/util.h"

namespace caproute {

ApprovalLease ApprovalLeaseManager::issue(const std::string& scope,
                                          int64_t ttl_ms,
                                          const std::string& issuer,
                                          const std::string& host) {
    if (ttl_ms < 1000) ttl_ms = 1000;
    if (ttl_ms > 300000) ttl_ms = 300000;

    ApprovalLease l;
    l.token = "appr_" + random_hex(16);
    l.scope = scope.empty() ? std::string("*") : scope;
    l.host = host;
    l.issuer = issuer;
    l.issued_ms = now_ms_wall();
    l.expires_ms = l.issued_ms + ttl_ms;

    std::lock_guard<std::mutex> lk(mu_);
    leases_[l.token] = l;
    total_issued_++;
    return l;
}

bool ApprovalLeaseManager::verify_and_consume(const std::string& token,
                                              const std::string& tool,
                                              const std::string& pattern,
                                              const std::string& host,
                                              std::string* reason) {
    std::lock_guard<std::mutex> lk(mu_);
    auto reject = [&](std::string why) {
        if (reason) *reason = std::move(why);
        total_rejected_++;
        return false;
    };

    if (token.empty()) return reject("approval token missing");
    auto it = leases_.find(token);
    if (it == leases_.end()) return reject("approval lease not found");

    ApprovalLease& l = it->second;
    if (now_ms_wall() > l.expires_ms) {
        leases_.erase(it);
        return reject("approval lease expired");
    }
    if (l.consumed) return reject("approval lease already consumed");

    const std::string label = tool + "/" + pattern;
    if (l.scope != "*" && l.scope != tool && l.scope != label)
        return reject("approval scope mismatch: lease=" + l.scope + " step=" + label);
    if (!l.host.empty() && l.host != host)
        return reject("approval host mismatch: lease=" + l.host + " step=" + host);

    l.consumed = true;
    total_consumed_++;
    return true;
}

void ApprovalLeaseManager::gc() {
    std::lock_guard<std::mutex> lk(mu_);
    const int64_t now = now_ms_wall();
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (it->second.expires_ms < now || it->second.consumed) it = leases_.erase(it);
        else ++it;
    }
}

size_t ApprovalLeaseManager::active_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    const int64_t now = now_ms_wall();
    size_t n = 0;
    for (const auto& kv : leases_) {
        if (!kv.second.consumed && kv.second.expires_ms > now) n++;
    }
    return n;
}

size_t ApprovalLeaseManager::total_issued() const {
    std::lock_guard<std::mutex> lk(mu_);
    return total_issued_;
}

size_t ApprovalLeaseManager::total_consumed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return total_consumed_;
}

size_t ApprovalLeaseManager::total_rejected() const {
    std::lock_guard<std::mutex> lk(mu_);
    return total_rejected_;
}

} // namespace caproute
