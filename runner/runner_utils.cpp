#include "runner_utils.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace caproute {

namespace fs = std::filesystem;

static void warn_sensitive_root(const fs::path& root) {
    static const std::vector<std::string> sensitive = {"/", "/etc", "/usr", "/var", "/home", "/root", "/tmp"};
    std::error_code ec;
    auto canon = fs::weakly_canonical(root, ec);
    if (ec) return;
    for (const auto& s : sensitive) {
        if (canon == fs::path(s)) {
            std::cerr << "[WARN] caproute root is a sensitive directory: " << canon << "\n";
            break;
        }
    }
}

fs::path resolve_root(const char* argv0) {
    std::error_code ec;
    if (const char* e = std::getenv("CAPROUTE_ROOT")) {
        fs::path p = e;
        if (fs::exists(p, ec)) {
            auto result = fs::canonical(p, ec);
            if (!ec) {
                warn_sensitive_root(result);
                return result;
            }
        }
    }

    std::vector<fs::path> starts;
    starts.push_back(fs::current_path(ec));
    if (argv0 && *argv0) {
        fs::path exe = fs::absolute(argv0, ec);
        if (!ec) {
            auto canon = fs::canonical(exe, ec);
            starts.push_back((ec ? exe : canon).parent_path());
        }
    }
    for (fs::path dir : starts) {
        // walk up looking for a catalog directory
        for (int i = 0; i < 8 && !dir.empty(); i++) {
            if (fs::is_directory(dir / "catalog", ec)) {
                warn_sensitive_root(dir);
                return dir;
            }
            if (!dir.has_parent_path() || dir.parent_path() == dir) break;
            dir = dir.parent_path();
        }
    }
    return fs::current_path(ec);
}

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
    setenv(key, value.c_str(), 0);
}

CliArgs parse_cli_args(int argc, char** argv, int first, const std::set<std::string>& value_flags) {
    CliArgs a;
    for (int i = first; i < argc; i++) {
        std::string s = argv[i];
        if (s.rfind("--", 0) == 0 && s.size() > 2) {
            if (value_flags.count(s) && i + 1 < argc) {
                a.values[s] = argv[++i];
            } else {
                a.switches.insert(s);
            }
            continue;
        }
        a.positional.push_back(s);
    }
    return a;
}

ServiceConfig configure_from_args(const fs::path& root, const CliArgs& args) {
    apply_profile_defaults(detect_profile());
    ServiceConfig cfg = load_service_config();

    auto v = [&](const char* k) -> const std::string* {
        auto it = args.values.find(k);
        return it == args.values.end() ? nullptr : &it->second;
    };
    if (auto* s = v("--catalog")) cfg.catalog_dir = *s;
    if (auto* s = v("--data")) cfg.data_dir = *s;
    if (auto* s = v("--host")) cfg.host = *s;
    if (auto* s = v("--port")) {
        int p = std::atoi(s->c_str());
        if (p > 0 && p < 65536) cfg.port = p;
        else std::cerr << "[config] ignoring bad --port " << *s << "\n";
    }

    if (!fs::path(cfg.catalog_dir).is_absolute()) cfg.catalog_dir = (root / cfg.catalog_dir).string();
    if (!fs::path(cfg.data_dir).is_absolute()) cfg.data_dir = (root / cfg.data_dir).string();
    return cfg;
}

std::string read_input(const std::string& path, std::string* out, size_t max_bytes) {
    out->clear();
    char buf[8192];
    if (path == "-") {
        while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount()) {
            out->append(buf, (size_t)std::cin.gcount());
            if (out->size() > max_bytes) return "stdin exceeds " + std::to_string(max_bytes) + " bytes";
        }
        return "";
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) return "cannot open: " + path;
    while (f.read(buf, sizeof(buf)) || f.gcount()) {
        out->append(buf, (size_t)f.gcount());
        if (out->size() > max_bytes) return path + " exceeds " + std::to_string(max_bytes) + " bytes";
    }
    return "";
}

} // namespace caproute
