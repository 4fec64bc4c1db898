#include "caproute/util.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

namespace caproute {

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            out.push_back(trim_ws(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(trim_ws(cur));
    out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& x) { return x.empty(); }), out.end());
    return out;
}

int getenv_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) {
        try {
            return std::stoi(v);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

int64_t getenv_i64(const char* name, int64_t defv) {
    if (const char* v = std::getenv(name)) {
        try {
            return (int64_t)std::stoll(v);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

bool getenv_bool(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    std::string s = lower_ascii(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* name, const std::string& defv) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : defv;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

int64_t now_ms_wall() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso_from_ms(int64_t epoch_ms) {
    std::time_t t = (std::time_t)(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, (int)(epoch_ms % 1000));
    return out;
}

} // namespace caproute
