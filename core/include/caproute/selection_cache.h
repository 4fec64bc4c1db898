#pragma once

#include "caproute/selection.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace caproute {

// SHA-256 hex of the canonical normalized request.
std::string fingerprint_request(const SelectionRequest& req);

struct CacheEntry {
    std::string fingerprint;
    std::shared_ptr<const SelectionResult> result;
    std::string result_json;     // bytes returned on every hit
    int64_t created_ms{0};       // monotonic
    int64_t ttl_ms{0};
    bool warm{false};            // built from fresh catalog data
    // On a stale entry: the warm entry it replaced, kept for degraded serving.
    std::shared_ptr<const CacheEntry> last_warm;

    bool fresh(int64_t now_ms) const { return now_ms - created_ms < ttl_ms; }
    std::shared_ptr<const CacheEntry> warm_fallback(const std::shared_ptr<const CacheEntry>& self) const {
        return warm ? self : last_warm;
    }
};

// Fingerprint -> immutable entry. Entries are swapped whole; a reader holds
// the shared_ptr it got. Bounded, oldest insertion evicted first.
class SelectionCache {
public:
    explicit SelectionCache(size_t max_entries = 10000);

    std::shared_ptr<const CacheEntry> get(const std::string& fingerprint) const;
    void put(std::shared_ptr<const CacheEntry> entry);
    void clear();

    size_t size() const;
    size_t capacity() const { return max_entries_; }
    uint64_t evictions() const;

private:
    using Order = std::list<std::string>;
    struct Slot {
        std::shared_ptr<const CacheEntry> entry;
        Order::iterator pos;
    };

    size_t max_entries_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Slot> map_;
    Order order_;   // front: oldest
    uint64_t evictions_{0};
};

struct GatewayOptions {
    int64_t ttl_ms{60000};
    int64_t grace_ms{600000};
    int retry_after_base_sec{30};
    int retry_after_max_sec{300};
    size_t max_entries{10000};
    // Monotonic milliseconds. Defaults to steady_clock.
    std::function<int64_t()> clock;
};

struct GatewayStats {
    uint64_t requests{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t degraded_served{0};
    uint64_t unavailable{0};
    uint64_t no_eligible{0};
    uint64_t invalid{0};
    uint64_t stale_results{0};
    uint64_t consecutive_unavailable{0};
    size_t cache_entries{0};
    uint64_t cache_evictions{0};
};

// SelectionGateway
// - fingerprint -> cache lookup -> resolve on miss
// - CatalogUnavailable on a miss: a warm entry inside the grace window is
//   served marked stale (a result built from stale catalog data keeps the
//   warm entry it replaced); otherwise SERVICE_UNAVAILABLE with a retry hint that
//   doubles per consecutive outage (capped), reset by the next resolution
// - NO_ELIGIBLE_CANDIDATE and INVALID_REQUEST are never cached
class SelectionGateway {
public:
    explicit SelectionGateway(Resolver& resolver, GatewayOptions opt = {});

    SelectionOutcome select(const SelectionRequest& req);

    GatewayStats stats() const;
    SelectionCache& cache() { return cache_; }
    const GatewayOptions& options() const { return opt_; }

private:
    int64_t now() const;
    int retry_after_locked() const;

    Resolver& resolver_;
    GatewayOptions opt_;
    SelectionCache cache_;

    mutable std::mutex backoff_mu_;
    uint64_t consecutive_unavailable_{0};

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> degraded_served_{0};
    std::atomic<uint64_t> unavailable_{0};
    std::atomic<uint64_t> no_eligible_{0};
    std::atomic<uint64_t> invalid_{0};
    std::atomic<uint64_t> stale_results_{0};
};

} // namespace caproute
