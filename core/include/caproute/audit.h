#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace caproute {

// Tamper-evident audit trail. One canonical JSON object per line:
//   {chain_hash, chain_prev, event, payload, instance_id, seq, ts, version}
// chain_hash = SHA256(chain_prev || canonical record without chain fields).
// Reopening an existing file continues its chain.
class AuditLog {
public:
    AuditLog(const std::string& path, std::string instance_id);

    // payload_json must be a JSON object; anything else is recorded as a string.
    void event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    const std::string& instance_id() const { return instance_id_; }
    uint64_t seq() const;
    std::string last_hash() const;

private:
    std::string path_;
    std::string instance_id_;
    mutable std::mutex mu_;
    std::ofstream out_;
    std::string chain_prev_;
    uint64_t seq_{0};
};

// Recomputes every chain link. Returns "" when intact, else the first broken
// line (1-based) and why.
std::string verify_audit_chain(const std::string& path);

} // namespace caproute
