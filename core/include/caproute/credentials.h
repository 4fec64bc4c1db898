#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace caproute {

struct Credential {
    std::string username;
    std::string secret;     // password or token; never logged
    std::string key_path;   // private key file for key-based protocols
};

// Resolves a credential handle for one target host. Only adapters call this.
class ICredentialResolver {
public:
    virtual ~ICredentialResolver() = default;
    virtual std::optional<Credential> resolve(const std::string& ref, const std::string& host) = 0;
};

// JSON file:
//   { "<ref>": { "username": "...", "secret": "...", "key_path": "...",
//                "hosts": { "<host>": { ...per-host overrides... } } } }
// Re-read when the file's mtime changes.
class FileCredentialResolver final : public ICredentialResolver {
public:
    explicit FileCredentialResolver(std::filesystem::path path);
    std::optional<Credential> resolve(const std::string& ref, const std::string& host) override;

private:
    struct Entry {
        Credential base;
        std::map<std::string, Credential> hosts;
    };
    std::string load_locked();

    std::filesystem::path path_;
    std::mutex mu_;
    std::filesystem::file_time_type loaded_mtime_{};
    bool loaded_{false};
    std::map<std::string, Entry> entries_;
};

} // namespace caproute
