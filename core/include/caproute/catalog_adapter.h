#pragma once

#include "caproute/catalog.h"
#include "caproute/catalog_store.h"
#include "caproute/lru_cache.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace caproute {

// Bounded pool of store slots (stands in for a connection pool).
class SlotGate {
public:
    explicit SlotGate(size_t slots) : free_(slots == 0 ? 1 : slots) {}

    bool acquire(int64_t timeout_ms);
    void release();
    size_t available() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    size_t free_;
};

struct CatalogAdapterOptions {
    size_t max_entries{1000};
    int64_t ttl_ms{300000};
    size_t pool_size{10};
    int64_t slot_timeout_ms{2000};
    // Monotonic milliseconds. Defaults to steady_clock.
    std::function<int64_t()> clock;
};

struct CandidateSet {
    std::vector<Candidate> candidates;
    bool stale{false};          // answered from last-known-good data after a store failure
    uint64_t generation{0};
};

struct ToolLookup {
    ToolDefPtr tool;
    bool stale{false};
    uint64_t generation{0};
};

struct CatalogAdapterStats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t stale_served{0};
    uint64_t store_errors{0};
    uint64_t reloads{0};
    uint64_t reload_failures{0};
    uint64_t generation{0};
    size_t cached_entries{0};
};

// CatalogAdapter
// - Read-through LRU/TTL cache over an ICatalogStore, keyed per capability and per tool name
// - Store failure: last-known-good entry marked stale, else CatalogUnavailable
// - reload() builds a complete new generation off-lock and publishes it with one pointer swap
class CatalogAdapter {
public:
    explicit CatalogAdapter(std::shared_ptr<ICatalogStore> store, CatalogAdapterOptions opt = {});
    ~CatalogAdapter();

    CatalogAdapter(const CatalogAdapter&) = delete;
    CatalogAdapter& operator=(const CatalogAdapter&) = delete;

    // Selectable (latest active version) candidates. Throws CatalogUnavailable.
    CandidateSet getCandidates(const std::string& capability, const std::string& platform);

    // nullopt when no selectable version exists. Throws CatalogUnavailable.
    std::optional<ToolLookup> getByName(const std::string& name);

    // Re-reads the whole store into a new generation. Returns "" on success;
    // on failure the current generation stays published.
    std::string reload();

    void start_background_refresh(int64_t interval_ms);
    void stop();

    uint64_t generation() const;
    CatalogAdapterStats stats() const;
    ICatalogStore& store() { return *store_; }

private:
    struct Generation {
        uint64_t id{0};
        mutable std::mutex mu;
        LruTtlCache<std::string, std::vector<ToolDefPtr>> cache;
        Generation(uint64_t gid, size_t max_entries, int64_t ttl_ms) : id(gid), cache(max_entries, ttl_ms) {}
    };

    std::shared_ptr<Generation> current() const;
    int64_t now() const;

    // Cached lookup; `load` runs against the store on a miss.
    std::vector<ToolDefPtr> lookup(const std::string& key,
                                   const std::function<std::vector<ToolDefPtr>()>& load,
                                   bool* stale, uint64_t* gen_id);

    std::shared_ptr<ICatalogStore> store_;
    CatalogAdapterOptions opt_;
    SlotGate slots_;

    mutable std::mutex gen_mu_;
    std::shared_ptr<Generation> gen_;
    std::atomic<uint64_t> next_gen_{1};

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stale_served_{0};
    std::atomic<uint64_t> store_errors_{0};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> reload_failures_{0};

    std::mutex refresh_mu_;
    std::condition_variable refresh_cv_;
    bool refresh_stop_{false};
    std::thread refresher_;
};

} // namespace caproute
