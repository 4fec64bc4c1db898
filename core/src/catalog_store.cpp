#include "caproute/catalog_store.h"
#include "caproute/errors.h"
#include "caproute/fsutil.h"

#include <algorithm>
#include <iostream>
#include <set>

namespace caproute {

namespace fs = std::filesystem;

static bool safe_component(const std::string& s) {
    if (s.empty() || s.size() > 128) return false;
    for (char c : s) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.' || c == '+';
        if (!ok) return false;
    }
    return s != "." && s != "..";
}

FileCatalogStore::FileCatalogStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path FileCatalogStore::record_path(const std::string& name, const std::string& version) const {
    return dir_ / (name + "@" + version + ".json");
}

ToolDefPtr FileCatalogStore::load_file(const fs::path& p) const {
    std::string body;
    try {
        body = slurp(p.string());
    } catch (const std::runtime_error& e) {
        throw CatalogUnavailable(std::string("catalog read failed: ") + e.what());
    }
    try {
        return std::make_shared<const ToolDefinition>(tool_from_json(body));
    } catch (const CatalogAuthoringError& e) {
        // A corrupt record must not take the whole catalog down.
        std::cerr << "[catalog] skipping " << p.filename().string() << ": " << e.what() << "\n";
        return nullptr;
    }
}

std::vector<ToolDefPtr> FileCatalogStore::loadAll() {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        throw CatalogUnavailable("catalog directory not readable: " + dir_.string());
    }
    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        if (it->path().extension() != ".json") continue;
        files.push_back(it->path());
    }
    if (ec) throw CatalogUnavailable("catalog listing failed: " + ec.message());
    std::sort(files.begin(), files.end());

    std::vector<ToolDefPtr> out;
    out.reserve(files.size());
    for (const auto& f : files) {
        if (auto d = load_file(f)) out.push_back(std::move(d));
    }
    return out;
}

std::vector<ToolDefPtr> FileCatalogStore::loadByName(const std::string& name) {
    std::vector<ToolDefPtr> out;
    for (auto& d : loadAll()) {
        if (d->name == name) out.push_back(std::move(d));
    }
    return out;
}

std::vector<ToolDefPtr> FileCatalogStore::loadByCapability(const std::string& capability,
                                                           const std::string& platform) {
    std::vector<ToolDefPtr> all = loadAll();
    std::set<std::string> names;
    for (const auto& d : all) {
        if (!d->capabilities.count(capability)) continue;
        if (!platform.empty() && d->platform != platform && d->platform != "multi-platform") continue;
        names.insert(d->name);
    }
    std::vector<ToolDefPtr> out;
    for (auto& d : all) {
        if (names.count(d->name)) out.push_back(std::move(d));
    }
    return out;
}

bool FileCatalogStore::upsert(const ToolDefinition& def) {
    if (!safe_component(def.name) || !safe_component(def.version)) {
        throw CatalogAuthoringError("tool name/version not usable as a record key: " + def.name + "@" + def.version);
    }
    std::lock_guard<std::mutex> lk(write_mu_);
    const fs::path p = record_path(def.name, def.version);
    const std::string body = tool_to_json(def);

    std::error_code ec;
    if (fs::exists(p, ec)) {
        ToolDefPtr existing = load_file(p);
        if (existing && tool_to_json(*existing) == body) return false;
        throw CatalogConflict("tool " + def.name + "@" + def.version +
                              " is already published with different content; bump the version");
    }
    std::string err = write_atomic_file(p, body + "\n");
    if (!err.empty()) throw CatalogUnavailable("catalog write failed: " + err);
    return true;
}

bool FileCatalogStore::retire(const std::string& name, const std::string& version) {
    if (!safe_component(name) || !safe_component(version)) return false;
    std::lock_guard<std::mutex> lk(write_mu_);
    const fs::path p = record_path(name, version);
    std::error_code ec;
    if (!fs::exists(p, ec)) return false;
    ToolDefPtr existing = load_file(p);
    if (!existing) return false;
    ToolDefinition copy = *existing;
    copy.status = ToolStatus::DISABLED;
    std::string err = write_atomic_file(p, tool_to_json(copy) + "\n");
    if (!err.empty()) throw CatalogUnavailable("catalog write failed: " + err);
    return true;
}

} // namespace caproute
