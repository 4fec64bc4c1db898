#include "caproute/catalog_adapter.h"
#include "caproute/errors.h"

#include <chrono>
#include <iostream>
#include <map>
#include <set>

namespace caproute {

bool SlotGate::acquire(int64_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                      [&] { return free_ > 0; })) {
        return false;
    }
    free_--;
    return true;
}

void SlotGate::release() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        free_++;
    }
    cv_.notify_one();
}

size_t SlotGate::available() const {
    std::lock_guard<std::mutex> lk(mu_);
    return free_;
}

namespace {

struct SlotGuard {
    SlotGate& gate;
    explicit SlotGuard(SlotGate& g) : gate(g) {}
    ~SlotGuard() { gate.release(); }
};

std::string cap_key(const std::string& capability) { return "cap:" + capability; }
std::string name_key(const std::string& name) { return "name:" + name; }

} // namespace

CatalogAdapter::CatalogAdapter(std::shared_ptr<ICatalogStore> store, CatalogAdapterOptions opt)
    : store_(std::move(store)), opt_(std::move(opt)), slots_(opt_.pool_size) {
    if (!opt_.clock) {
        opt_.clock = [] {
            return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()).count());
        };
    }
    gen_ = std::make_shared<Generation>(next_gen_++, opt_.max_entries, opt_.ttl_ms);
}

CatalogAdapter::~CatalogAdapter() {
    stop();
}

int64_t CatalogAdapter::now() const {
    return opt_.clock();
}

std::shared_ptr<CatalogAdapter::Generation> CatalogAdapter::current() const {
    std::lock_guard<std::mutex> lk(gen_mu_);
    return gen_;
}

uint64_t CatalogAdapter::generation() const {
    return current()->id;
}

std::vector<ToolDefPtr> CatalogAdapter::lookup(const std::string& key,
                                               const std::function<std::vector<ToolDefPtr>()>& load,
                                               bool* stale, uint64_t* gen_id) {
    std::shared_ptr<Generation> g = current();
    *gen_id = g->id;
    *stale = false;
    {
        std::lock_guard<std::mutex> lk(g->mu);
        if (auto v = g->cache.get_fresh(key, now())) {
            hits_++;
            return *v;
        }
    }
    misses_++;

    std::string failure;
    if (!slots_.acquire(opt_.slot_timeout_ms)) {
        failure = "no catalog store slot available within " + std::to_string(opt_.slot_timeout_ms) + "ms";
    } else {
        SlotGuard guard(slots_);
        try {
            std::vector<ToolDefPtr> loaded = latest_selectable(load());
            std::lock_guard<std::mutex> lk(g->mu);
            g->cache.put(key, loaded, now());
            return loaded;
        } catch (const CatalogUnavailable& e) {
            failure = e.what();
        }
    }

    store_errors_++;
    std::lock_guard<std::mutex> lk(g->mu);
    if (auto e = g->cache.get_any(key)) {
        stale_served_++;
        *stale = true;
        return e->value;
    }
    throw CatalogUnavailable(failure);
}

CandidateSet CatalogAdapter::getCandidates(const std::string& capability, const std::string& platform) {
    CandidateSet out;
    std::vector<ToolDefPtr> tools = lookup(cap_key(capability),
        [&] { return store_->loadByCapability(capability, ""); },
        &out.stale, &out.generation);
    out.candidates = candidates_for(tools, capability, platform);
    return out;
}

std::optional<ToolLookup> CatalogAdapter::getByName(const std::string& name) {
    ToolLookup out;
    std::vector<ToolDefPtr> tools = lookup(name_key(name),
        [&] { return store_->loadByName(name); },
        &out.stale, &out.generation);
    for (const auto& t : tools) {
        if (t->name == name) {
            out.tool = t;
            return out;
        }
    }
    return std::nullopt;
}

std::string CatalogAdapter::reload() {
    std::vector<ToolDefPtr> all;
    if (!slots_.acquire(opt_.slot_timeout_ms)) {
        reload_failures_++;
        return "no catalog store slot available";
    }
    {
        SlotGuard guard(slots_);
        try {
            all = store_->loadAll();
        } catch (const CatalogUnavailable& e) {
            reload_failures_++;
            return e.what();
        }
    }

    // Group all versions per tool, then index capabilities of the latest selectable ones.
    std::map<std::string, std::vector<ToolDefPtr>> by_name;
    for (const auto& d : all) by_name[d->name].push_back(d);

    auto g = std::make_shared<Generation>(next_gen_++, opt_.max_entries, opt_.ttl_ms);
    const int64_t t = now();
    std::map<std::string, std::vector<ToolDefPtr>> by_cap;
    for (const auto& [name, records] : by_name) {
        std::vector<ToolDefPtr> latest = latest_selectable(records);
        g->cache.put(name_key(name), latest, t);
        std::set<std::string> caps;
        for (const auto& r : records) {
            for (const auto& c : r->capabilities) caps.insert(c.first);
        }
        for (const auto& c : caps) {
            for (const auto& l : latest) by_cap[c].push_back(l);
        }
    }
    for (auto& [cap, tools] : by_cap) g->cache.put(cap_key(cap), tools, t);

    {
        std::lock_guard<std::mutex> lk(gen_mu_);
        gen_ = g;
    }
    reloads_++;
    return "";
}

void CatalogAdapter::start_background_refresh(int64_t interval_ms) {
    if (interval_ms <= 0 || refresher_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(refresh_mu_);
        refresh_stop_ = false;
    }
    refresher_ = std::thread([this, interval_ms] {
        std::unique_lock<std::mutex> lk(refresh_mu_);
        while (!refresh_stop_) {
            if (refresh_cv_.wait_for(lk, std::chrono::milliseconds(interval_ms), [&] { return refresh_stop_; })) break;
            lk.unlock();
            std::string err = reload();
            if (!err.empty()) std::cerr << "[catalog] background refresh failed: " << err << "\n";
            lk.lock();
        }
    });
}

void CatalogAdapter::stop() {
    {
        std::lock_guard<std::mutex> lk(refresh_mu_);
        refresh_stop_ = true;
    }
    refresh_cv_.notify_all();
    if (refresher_.joinable()) refresher_.join();
}

CatalogAdapterStats CatalogAdapter::stats() const {
    CatalogAdapterStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.stale_served = stale_served_.load();
    s.store_errors = store_errors_.load();
    s.reloads = reloads_.load();
    s.reload_failures = reload_failures_.load();
    auto g = current();
    s.generation = g->id;
    std::lock_guard<std::mutex> lk(g->mu);
    s.cached_entries = g->cache.size();
    return s;
}

} // namespace caproute
