#include "caproute/credentials.h"
#include "caproute/fsutil.h"
#include "caproute/json_mini.h"

#include <iostream>
#include <stdexcept>

namespace caproute {

FileCredentialResolver::FileCredentialResolver(std::filesystem::path path) : path_(std::move(path)) {}

static Credential read_cred(json_object* o, const Credential& base) {
    Credential c = base;
    if (auto v = json_mini::field_string(o, "username")) c.username = *v;
    if (auto v = json_mini::field_string(o, "secret")) c.secret = *v;
    if (auto v = json_mini::field_string(o, "key_path")) c.key_path = *v;
    return c;
}

std::string FileCredentialResolver::load_locked() {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) return "credential file not readable: " + path_.string();
    if (loaded_ && mtime == loaded_mtime_) return "";

    std::string body;
    try {
        body = slurp(path_.string());
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    json_mini::Doc d = json_mini::parse(body);
    if (!d || !json_object_is_type(d.root, json_type_object)) return "credential file is not a JSON object";

    std::map<std::string, Entry> entries;
    json_object_object_foreach(d.root, ref, obj) {
        if (!obj || !json_object_is_type(obj, json_type_object)) continue;
        Entry e;
        e.base = read_cred(obj, Credential{});
        if (json_object* hosts = json_mini::field(obj, "hosts")) {
            if (json_object_is_type(hosts, json_type_object)) {
                json_object_object_foreach(hosts, host, hobj) {
                    if (hobj && json_object_is_type(hobj, json_type_object)) e.hosts[host] = read_cred(hobj, e.base);
                }
            }
        }
        entries[ref] = std::move(e);
    }
    entries_ = std::move(entries);
    loaded_mtime_ = mtime;
    loaded_ = true;
    return "";
}

std::optional<Credential> FileCredentialResolver::resolve(const std::string& ref, const std::string& host) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = load_locked();
    if (!err.empty()) {
        std::cerr << "[credentials] " << err << "\n";
        if (!loaded_) return std::nullopt;
    }
    auto it = entries_.find(ref);
    if (it == entries_.end()) return std::nullopt;
    auto h = it->second.hosts.find(host);
    if (h != it->second.hosts.end()) return h->second;
    return it->second.base;
}

} // namespace caproute
