#pragma once

#include "caproute/catalog.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace caproute {

// Durable tool catalog. Every read may throw CatalogUnavailable; the adapter
// in front of it (catalog_adapter.h) turns that into stale reads or errors.
class ICatalogStore {
public:
    virtual ~ICatalogStore() = default;

    // Every record, all versions and statuses.
    virtual std::vector<ToolDefPtr> loadAll() = 0;
    virtual std::vector<ToolDefPtr> loadByName(const std::string& name) = 0;
    // Every record of every tool that declares `capability` in any version,
    // so latest_selectable() over the result is still correct when the newest
    // version dropped the capability. Platform filter as in candidates_for().
    virtual std::vector<ToolDefPtr> loadByCapability(const std::string& capability,
                                                     const std::string& platform) = 0;

    // Publishes name@version. Returns false when an identical record already
    // exists. Throws CatalogConflict when it exists with different content.
    virtual bool upsert(const ToolDefinition& def) = 0;

    // Marks name@version disabled. Returns false when no such record exists.
    virtual bool retire(const std::string& name, const std::string& version) = 0;
};

// Directory of "<name>@<version>.json" records.
class FileCatalogStore : public ICatalogStore {
public:
    explicit FileCatalogStore(std::filesystem::path dir);

    std::vector<ToolDefPtr> loadAll() override;
    std::vector<ToolDefPtr> loadByName(const std::string& name) override;
    std::vector<ToolDefPtr> loadByCapability(const std::string& capability,
                                             const std::string& platform) override;
    bool upsert(const ToolDefinition& def) override;
    bool retire(const std::string& name, const std::string& version) override;

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path record_path(const std::string& name, const std::string& version) const;

private:
    std::filesystem::path dir_;
    std::mutex write_mu_;

    ToolDefPtr load_file(const std::filesystem::path& p) const;
};

} // namespace caproute
