#pragma once

// Shared fixtures: tool definitions built from JSON and an in-memory store
// whose reads can be made to fail.

#include "caproute/catalog.h"
#include "caproute/catalog_store.h"
#include "caproute/errors.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct PatternSpec {
    std::string name;
    std::string time{"1000"};
    std::string cost{"1"};
    std::string prefs{"\"speed\":0.5,\"accuracy\":0.5,\"cost\":0.5,\"complexity\":0.5,\"completeness\":0.5"};
    std::string policy{"{}"};
    std::string extra;   // raw JSON members appended to the pattern object
};

// cost/time strings are JSON values: "1000" is a number, "\"2 * N\"" an expression.
inline std::string tool_json(const std::string& name,
                             const std::string& version,
                             const std::string& capability,
                             const std::vector<PatternSpec>& patterns,
                             const std::string& platform = "linux",
                             const std::string& status = "active",
                             const std::string& routing = "{\"execution_location\":\"local\",\"protocol\":\"local\"}") {
    std::string s = "{\"name\":\"" + name + "\",\"version\":\"" + version + "\",\"platform\":\"" + platform +
                    "\",\"status\":\"" + status + "\",\"routing\":" + routing +
                    ",\"capabilities\":{\"" + capability + "\":{\"description\":\"d\",\"patterns\":{";
    for (size_t i = 0; i < patterns.size(); i++) {
        const auto& p = patterns[i];
        if (i) s += ",";
        s += "\"" + p.name + "\":{\"time_estimate_ms\":" + p.time + ",\"cost_estimate\":" + p.cost +
             ",\"preference_match\":{" + p.prefs + "},\"policy\":" + p.policy;
        if (!p.extra.empty()) s += "," + p.extra;
        s += "}";
    }
    s += "}}}}";
    return s;
}

inline caproute::ToolDefPtr make_tool(const std::string& json) {
    return std::make_shared<const caproute::ToolDefinition>(caproute::tool_from_json(json));
}

class FakeStore : public caproute::ICatalogStore {
public:
    void add(caproute::ToolDefPtr t) {
        std::lock_guard<std::mutex> lk(mu_);
        tools_.push_back(std::move(t));
    }
    void set_failing(bool f) { failing_.store(f); }
    int loads() const { return loads_.load(); }

    std::vector<caproute::ToolDefPtr> loadAll() override {
        check();
        std::lock_guard<std::mutex> lk(mu_);
        return tools_;
    }
    std::vector<caproute::ToolDefPtr> loadByName(const std::string& name) override {
        check();
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<caproute::ToolDefPtr> out;
        for (const auto& t : tools_) if (t->name == name) out.push_back(t);
        return out;
    }
    std::vector<caproute::ToolDefPtr> loadByCapability(const std::string& capability,
                                                       const std::string& platform) override {
        check();
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<caproute::ToolDefPtr> out;
        for (const auto& t : tools_) {
            if (!t->capabilities.count(capability)) continue;
            if (!platform.empty() && t->platform != platform && t->platform != "multi-platform") continue;
            out.push_back(t);
        }
        return out;
    }
    bool upsert(const caproute::ToolDefinition& def) override {
        check();
        add(std::make_shared<const caproute::ToolDefinition>(def));
        return true;
    }
    bool retire(const std::string&, const std::string&) override {
        check();
        return false;
    }

private:
    void check() {
        loads_++;
        if (failing_.load()) throw caproute::CatalogUnavailable("fake store down");
    }

    std::mutex mu_;
    std::vector<caproute::ToolDefPtr> tools_;
    std::atomic<bool> failing_{false};
    std::atomic<int> loads_{0};
};

// Manually advanced millisecond clock.
struct ManualClock {
    std::shared_ptr<std::atomic<int64_t>> t = std::make_shared<std::atomic<int64_t>>(1000000);
    std::function<int64_t()> fn() const {
        auto p = t;
        return [p] { return p->load(); };
    }
    void advance(int64_t ms) { t->fetch_add(ms); }
};
