#include "test_common.h"
#include "test_fixtures.h"

#include "caproute/catalog_adapter.h"
#include "caproute/errors.h"
#include "caproute/lru_cache.h"

#include <chrono>
#include <thread>

using namespace caproute;

int main() {
    // Test 1: LRU eviction order and TTL expiry
    {
        LruTtlCache<std::string, int> c(2, 100);
        c.put("a", 1, 0);
        c.put("b", 2, 0);
        expect_true(c.get_fresh("a", 10).value_or(0) == 1, "a fresh");
        c.put("c", 3, 10);  // evicts b, the least recently used
        expect_true(!c.get_any("b").has_value(), "b evicted");
        expect_eq_ll((long long)c.evictions(), 1, "one eviction");
        expect_true(!c.get_fresh("a", 100).has_value(), "a expired at ttl");
        expect_true(c.get_any("a").has_value() && c.get_any("a")->value == 1, "expired value still readable");
        c.erase("a");
        expect_eq_ll((long long)c.size(), 1, "erase");
    }

    // Test 2: read-through then cache hit
    {
        auto store = std::make_shared<FakeStore>();
        store->add(make_tool(tool_json("ansible", "1.0.0", "service_restart", {PatternSpec{"rolling"}}, "multi-platform")));
        store->add(make_tool(tool_json("systemctl", "1.0.0", "service_restart", {PatternSpec{"restart"}})));
        ManualClock clk;
        CatalogAdapterOptions opt;
        opt.clock = clk.fn();
        CatalogAdapter ad(store, opt);

        CandidateSet cs = ad.getCandidates("service_restart", "");
        expect_eq_ll((long long)cs.candidates.size(), 2, "two candidates");
        expect_true(!cs.stale, "fresh read");
        expect_eq_ll(store->loads(), 1, "one store read");
        cs = ad.getCandidates("service_restart", "windows");
        expect_eq_ll((long long)cs.candidates.size(), 1, "platform filter applied after cache");
        expect_true(cs.candidates[0].tool->name == "ansible", "multi-platform kept");
        expect_eq_ll(store->loads(), 1, "served from cache");
        auto st = ad.stats();
        expect_eq_ll((long long)st.hits, 1, "hit counted");
        expect_eq_ll((long long)st.misses, 1, "miss counted");

        // TTL expiry forces a new store read.
        clk.advance(300000);
        ad.getCandidates("service_restart", "");
        expect_eq_ll(store->loads(), 2, "expired entry re-read");
    }

    // Test 3: store failure serves last-known-good marked stale
    {
        auto store = std::make_shared<FakeStore>();
        store->add(make_tool(tool_json("systemctl", "1.0.0", "service_restart", {PatternSpec{"restart"}})));
        ManualClock clk;
        CatalogAdapterOptions opt;
        opt.clock = clk.fn();
        opt.ttl_ms = 1000;
        CatalogAdapter ad(store, opt);

        ad.getCandidates("service_restart", "");
        clk.advance(5000);
        store->set_failing(true);
        CandidateSet cs = ad.getCandidates("service_restart", "");
        expect_true(cs.stale, "stale flag set");
        expect_eq_ll((long long)cs.candidates.size(), 1, "last-known-good candidates");
        expect_eq_ll((long long)ad.stats().stale_served, 1, "stale counted");

        bool threw = false;
        try {
            ad.getCandidates("disk_cleanup", "");
        } catch (const CatalogUnavailable&) {
            threw = true;
        }
        expect_true(threw, "uncached key with failing store is unavailable");
        expect_true(ad.stats().store_errors >= 2, "store errors counted");
    }

    // Test 4: getByName returns the latest selectable version
    {
        auto store = std::make_shared<FakeStore>();
        store->add(make_tool(tool_json("t", "1.0.0", "cap", {PatternSpec{"a"}})));
        store->add(make_tool(tool_json("t", "1.4.0", "cap", {PatternSpec{"a"}})));
        store->add(make_tool(tool_json("t", "2.0.0", "cap", {PatternSpec{"a"}}, "linux", "deprecated")));
        CatalogAdapter ad(store);
        auto t = ad.getByName("t");
        expect_true(t.has_value() && t->tool->version == "1.4.0", "latest active version");
        expect_true(!ad.getByName("missing").has_value(), "unknown name");
    }

    // Test 5: reload publishes a new generation; failure keeps the old one
    {
        auto store = std::make_shared<FakeStore>();
        store->add(make_tool(tool_json("a", "1.0.0", "cap", {PatternSpec{"p"}})));
        ManualClock clk;
        CatalogAdapterOptions opt;
        opt.clock = clk.fn();
        CatalogAdapter ad(store, opt);
        const uint64_t g0 = ad.generation();

        expect_true(ad.reload().empty(), "reload ok");
        const uint64_t g1 = ad.generation();
        expect_true(g1 > g0, "generation advanced");
        const int before = store->loads();
        CandidateSet cs = ad.getCandidates("cap", "");
        expect_eq_ll(store->loads(), before, "reload pre-populated capability key");
        expect_true(cs.generation == g1, "answer tagged with generation");
        expect_true(ad.getByName("a").has_value(), "reload pre-populated name key");

        store->add(make_tool(tool_json("b", "1.0.0", "cap", {PatternSpec{"p"}})));
        expect_eq_ll((long long)ad.getCandidates("cap", "").candidates.size(), 1, "old generation until reload");
        expect_true(ad.reload().empty(), "second reload");
        expect_eq_ll((long long)ad.getCandidates("cap", "").candidates.size(), 2, "new tool visible");

        store->set_failing(true);
        const uint64_t g2 = ad.generation();
        expect_true(!ad.reload().empty(), "reload failure reported");
        expect_true(ad.generation() == g2, "generation kept on failure");
        expect_eq_ll((long long)ad.stats().reload_failures, 1, "reload failure counted");
        expect_eq_ll((long long)ad.getCandidates("cap", "").candidates.size(), 2, "cache still serves");
    }

    // Test 6: slot gate bounds concurrent store access
    {
        SlotGate g(1);
        expect_true(g.acquire(0), "first slot");
        expect_true(!g.acquire(20), "second acquire times out");
        std::thread t([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            g.release();
        });
        expect_true(g.acquire(2000), "acquire after release");
        t.join();
        g.release();
        expect_eq_ll((long long)g.available(), 1, "slot returned");
    }

    // Test 7: background refresh reloads periodically and stops cleanly
    {
        auto store = std::make_shared<FakeStore>();
        store->add(make_tool(tool_json("a", "1.0.0", "cap", {PatternSpec{"p"}})));
        CatalogAdapter ad(store);
        ad.start_background_refresh(10);
        for (int i = 0; i < 200 && ad.stats().reloads < 2; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ad.stop();
        expect_true(ad.stats().reloads >= 2, "background reloads ran");
    }

    std::cerr << "test_catalog_adapter: ALL PASSED" << std::endl;
    return 0;
}
