#include "caproute/audit.h"
#include "caproute/crypto.h"
#include "caproute/json_mini.h"
#include "caproute/util.h"

#include <json-c/json.h>

#include <filesystem>
#include <iostream>

namespace caproute {

namespace {

constexpr const char* kAuditVersion = "caproute.audit/1";
const std::string kGenesis(64, '0');

json_object* payload_object(const std::string& payload_json) {
    json_mini::Doc d = json_mini::parse(payload_json);
    if (d && json_object_is_type(d.root, json_type_object)) return d.release();
    return json_object_new_string(payload_json.c_str());
}

// Record part that is hashed: everything except the two chain fields.
std::string canonical_record(json_object* line) {
    json_object* rec = json_object_new_object();
    json_object_object_foreach(line, k, v) {
        const std::string key(k);
        if (key == "chain_hash" || key == "chain_prev") continue;
        json_object_object_add(rec, k, json_object_get(v));
    }
    std::string out = json_mini::canonical(rec);
    json_object_put(rec);
    return out;
}

std::string chain_hash_of(const std::string& prev, json_object* line) {
    return Sha256().update(prev).update(canonical_record(line)).hex_digest();
}

} // namespace

AuditLog::AuditLog(const std::string& path, std::string instance_id)
    : path_(path), instance_id_(std::move(instance_id)), chain_prev_(kGenesis) {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    // Resume the chain from the last intact line.
    {
        std::ifstream in(path_);
        std::string line, last;
        while (std::getline(in, line)) {
            if (!line.empty()) last = line;
        }
        if (!last.empty()) {
            json_mini::Doc d = json_mini::parse(last);
            auto h = json_mini::field_string(d.root, "chain_hash");
            auto s = json_mini::field_int(d.root, "seq");
            if (h && h->size() == 64) {
                chain_prev_ = *h;
                seq_ = s ? static_cast<uint64_t>(*s) : 0;
            } else {
                std::cerr << "[audit] last line of " << path_ << " unreadable; starting a new chain\n";
            }
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) std::cerr << "[audit] cannot open " << path_ << " for append\n";
}

void AuditLog::event(const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    const uint64_t seq = seq_ + 1;

    json_object* line = json_object_new_object();
    json_object_object_add(line, "event", json_object_new_string(name.c_str()));
    json_object_object_add(line, "payload", payload_object(payload_json));
    json_object_object_add(line, "instance_id", json_object_new_string(instance_id_.c_str()));
    json_object_object_add(line, "seq", json_object_new_int64(static_cast<int64_t>(seq)));
    json_object_object_add(line, "ts", json_object_new_string(iso_from_ms(now_ms_wall()).c_str()));
    json_object_object_add(line, "version", json_object_new_string(kAuditVersion));

    const std::string chain_hash = chain_hash_of(chain_prev_, line);
    json_object_object_add(line, "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(line, "chain_prev", json_object_new_string(chain_prev_.c_str()));

    out_ << json_mini::canonical(line) << "\n";
    out_.flush();
    json_object_put(line);

    if (!out_) {
        std::cerr << "[audit] write failed for " << path_ << "\n";
        out_.clear();
    }
    chain_prev_ = chain_hash;
    seq_ = seq;
}

uint64_t AuditLog::seq() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

std::string AuditLog::last_hash() const {
    std::lock_guard<std::mutex> lk(mu_);
    return chain_prev_;
}

std::string verify_audit_chain(const std::string& path) {
    std::ifstream in(path);
    if (!in) return "cannot open " + path;

    std::string prev = kGenesis;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        json_mini::Doc d = json_mini::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object))
            return "line " + std::to_string(lineno) + ": not a JSON object";
        auto h = json_mini::field_string(d.root, "chain_hash");
        auto p = json_mini::field_string(d.root, "chain_prev");
        if (!h || !p) return "line " + std::to_string(lineno) + ": missing chain fields";
        if (*p != prev) return "line " + std::to_string(lineno) + ": chain_prev does not match previous hash";
        if (chain_hash_of(*p, d.root) != *h)
            return "line " + std::to_string(lineno) + ": chain_hash mismatch";
        prev = *h;
    }
    return "";
}

} // namespace caproute
