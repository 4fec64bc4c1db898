#include "caproute/selection_cache.h"
#include "caproute/crypto.h"
#include "caproute/errors.h"
#include "caproute/serialization.h"
#include "caproute/util.h"

#include <iostream>
#include <iterator>

namespace caproute {

std::string fingerprint_request(const SelectionRequest& req) {
    return sha256_hex(canonical_request(req));
}

// ---------- cache ----------

SelectionCache::SelectionCache(size_t max_entries) : max_entries_(max_entries == 0 ? 1 : max_entries) {}

std::shared_ptr<const CacheEntry> SelectionCache::get(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = map_.find(fingerprint);
    if (it == map_.end()) return nullptr;
    return it->second.entry;
}

void SelectionCache::put(std::shared_ptr<const CacheEntry> entry) {
    if (!entry) return;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = map_.find(entry->fingerprint);
    if (it != map_.end()) {
        // A replacement counts as a new insertion.
        order_.splice(order_.end(), order_, it->second.pos);
        it->second.entry = std::move(entry);
        return;
    }
    const std::string key = entry->fingerprint;
    order_.push_back(key);
    auto pos = std::prev(order_.end());
    map_.emplace(key, Slot{std::move(entry), pos});
    while (map_.size() > max_entries_) {
        map_.erase(order_.front());
        order_.pop_front();
        evictions_++;
    }
}

void SelectionCache::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    map_.clear();
    order_.clear();
}

size_t SelectionCache::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

uint64_t SelectionCache::evictions() const {
    std::lock_guard<std::mutex> lk(mu_);
    return evictions_;
}

// ---------- gateway ----------

SelectionGateway::SelectionGateway(Resolver& resolver, GatewayOptions opt)
    : resolver_(resolver), opt_(std::move(opt)), cache_(opt_.max_entries) {
    if (opt_.retry_after_base_sec < 1) opt_.retry_after_base_sec = 1;
    if (opt_.retry_after_max_sec < opt_.retry_after_base_sec) opt_.retry_after_max_sec = opt_.retry_after_base_sec;
}

int64_t SelectionGateway::now() const {
    return opt_.clock ? opt_.clock() : now_ms();
}

int SelectionGateway::retry_after_locked() const {
    int64_t secs = opt_.retry_after_base_sec;
    for (uint64_t i = 1; i < consecutive_unavailable_ && secs < opt_.retry_after_max_sec; i++) secs *= 2;
    if (secs > opt_.retry_after_max_sec) secs = opt_.retry_after_max_sec;
    return static_cast<int>(secs);
}

SelectionOutcome SelectionGateway::select(const SelectionRequest& req) {
    requests_++;

    const std::string invalid = validate_request(req);
    if (!invalid.empty()) {
        invalid_++;
        SelectionOutcome out;
        out.status = SelectionStatus::INVALID_REQUEST;
        out.reason = invalid;
        return out;
    }

    const std::string fp = fingerprint_request(req);
    std::shared_ptr<const CacheEntry> entry = cache_.get(fp);
    const int64_t t = now();

    if (entry && entry->fresh(t)) {
        hits_++;
        SelectionOutcome out;
        out.status = SelectionStatus::OK;
        out.result = entry->result;
        out.result_json = entry->result_json;
        out.from_cache = true;
        out.stale = entry->result->stale;
        out.fingerprint = fp;
        return out;
    }

    misses_++;
    SelectionOutcome out;
    try {
        out = resolver_.resolve(req);
    } catch (const CatalogUnavailable& e) {
        int retry = 0;
        {
            std::lock_guard<std::mutex> lk(backoff_mu_);
            consecutive_unavailable_++;
            retry = retry_after_locked();
        }

        std::shared_ptr<const CacheEntry> warm = entry ? entry->warm_fallback(entry) : nullptr;
        if (warm && t - warm->created_ms <= opt_.grace_ms) {
            degraded_served_++;
            auto copy = std::make_shared<SelectionResult>(*warm->result);
            copy->stale = true;
            SelectionOutcome d;
            d.status = SelectionStatus::OK;
            d.result = copy;
            d.result_json = selection_result_to_string(*copy);
            d.from_cache = true;
            d.stale = true;
            d.fingerprint = fp;
            d.reason = e.what();
            std::cerr << "[select] catalog unavailable, serving warm entry " << fp.substr(0, 12) << ": " << e.what()
                      << "\n";
            return d;
        }

        unavailable_++;
        SelectionOutcome u;
        u.status = SelectionStatus::SERVICE_UNAVAILABLE;
        u.reason = e.what();
        u.retry_after_seconds = retry;
        u.fingerprint = fp;
        std::cerr << "[select] catalog unavailable, no warm entry for " << fp.substr(0, 12) << "; retry after "
                  << retry << "s\n";
        return u;
    }

    {
        std::lock_guard<std::mutex> lk(backoff_mu_);
        consecutive_unavailable_ = 0;
    }
    out.fingerprint = fp;

    if (out.status == SelectionStatus::NO_ELIGIBLE_CANDIDATE) {
        no_eligible_++;
        return out;
    }
    if (out.status != SelectionStatus::OK || !out.result) {
        invalid_++;
        return out;
    }

    out.result_json = selection_result_to_string(*out.result);
    if (out.result->stale) stale_results_++;

    auto fresh = std::make_shared<CacheEntry>();
    fresh->fingerprint = fp;
    fresh->result = out.result;
    fresh->result_json = out.result_json;
    fresh->created_ms = t;
    fresh->ttl_ms = opt_.ttl_ms;
    fresh->warm = !out.result->stale;
    if (!fresh->warm && entry) fresh->last_warm = entry->warm_fallback(entry);
    cache_.put(std::move(fresh));
    return out;
}

GatewayStats SelectionGateway::stats() const {
    GatewayStats s;
    s.requests = requests_.load();
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.degraded_served = degraded_served_.load();
    s.unavailable = unavailable_.load();
    s.no_eligible = no_eligible_.load();
    s.invalid = invalid_.load();
    s.stale_results = stale_results_.load();
    {
        std::lock_guard<std::mutex> lk(backoff_mu_);
        s.consecutive_unavailable = consecutive_unavailable_;
    }
    s.cache_entries = cache_.size();
    s.cache_evictions = cache_.evictions();
    return s;
}

} // namespace caproute
