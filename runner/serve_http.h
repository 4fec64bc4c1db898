#pragma once

// Minimal HTTP/1.1 plumbing for cmd_serve.cpp: one request per connection,
// Connection: close on every reply.

#ifndef _WIN32

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "caproute/crypto.h"
#include "caproute/util.h"

namespace caproute {

struct HttpRequest {
    std::string method;
    std::string target;
    std::string path;
    std::unordered_map<std::string, std::string> query;
    std::map<std::string, std::string> headers;   // lowercased names
    std::string body;

    std::string header(const std::string& name_lower) const {
        auto it = headers.find(name_lower);
        return it == headers.end() ? std::string() : it->second;
    }
    bool query_flag(const std::string& key) const {
        auto it = query.find(key);
        return it != query.end() && (it->second.empty() || it->second == "1" || it->second == "true");
    }
};

// Recv/send timeouts so a stalled client cannot pin a worker (Slowloris).
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

inline void split_target(const std::string& target, HttpRequest* req) {
    const auto q = target.find('?');
    req->path = target.substr(0, q);
    if (q == std::string::npos) return;
    std::istringstream qs(target.substr(q + 1));
    std::string kv;
    while (std::getline(qs, kv, '&')) {
        if (kv.empty()) continue;
        const auto eq = kv.find('=');
        if (eq == std::string::npos) req->query[kv] = "";
        else req->query[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
}

// Parses the request line and headers out of `head` (without the blank line).
// Returns "" on success. Duplicate Content-Length is rejected (request smuggling).
inline std::string parse_http_head(const std::string& head, HttpRequest* req, size_t* content_length) {
    std::istringstream iss(head);
    std::string line;
    if (!std::getline(iss, line)) return "empty request";
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::istringstream rl(line);
    std::string version;
    rl >> req->method >> req->target >> version;
    if (req->method.empty() || req->target.empty() || version.rfind("HTTP/1.", 0) != 0) return "bad request line";
    split_target(req->target, req);

    *content_length = 0;
    bool have_length = false;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        const auto c = line.find(':');
        if (c == std::string::npos) return "malformed header";
        const std::string name = lower_ascii(trim_ws(line.substr(0, c)));
        const std::string value = trim_ws(line.substr(c + 1));
        if (name == "content-length") {
            if (have_length) return "duplicate content-length";
            have_length = true;
            if (value.empty() || value.size() > 18 || value.find_first_not_of("0123456789") != std::string::npos)
                return "bad content-length";
            *content_length = (size_t)std::stoull(value);
        }
        req->headers[name] = value;
    }
    return "";
}

// 0 on success, else the status to answer with (400 malformed, 413 too large,
// -1 when the peer went away and no reply is possible).
inline int read_http_request(int fd, size_t max_body, HttpRequest* req) {
    constexpr size_t kMaxHead = 64 * 1024;
    std::string buf(8192, '\0');
    std::string data;
    size_t head_end = std::string::npos;
    while ((head_end = data.find("\r\n\r\n")) == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return -1;
        data.append(buf.data(), (size_t)n);
        if (data.size() > kMaxHead) return 400;
    }

    size_t cl = 0;
    if (!parse_http_head(data.substr(0, head_end), req, &cl).empty()) return 400;
    if (cl > max_body) return 413;

    req->body = data.substr(head_end + 4);
    while (req->body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return -1;
        req->body.append(buf.data(), (size_t)n);
    }
    req->body.resize(cl);
    return 0;
}

inline const char* http_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Error";
    }
}

inline void send_reply(int fd, int code, const std::string& content_type, const std::string& body,
                       const std::string& extra_headers = "") {
    std::string out = "HTTP/1.1 " + std::to_string(code) + " " + http_reason(code) + "\r\n";
    out += "Content-Type: " + content_type + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += extra_headers;
    out += "Connection: close\r\n\r\n";
    out += body;

    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline void send_json(int fd, int code, const std::string& json, const std::string& extra_headers = "") {
    send_reply(fd, code, "application/json", json, extra_headers);
}

// Prometheus text exposition
inline void send_text(int fd, int code, const std::string& text) {
    send_reply(fd, code, "text/plain; version=0.0.4; charset=utf-8", text);
}

// X-Api-Token or Authorization: Bearer. An empty expected token accepts all.
inline bool api_token_ok(const HttpRequest& req, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    const std::string x = req.header("x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    const std::string auth = req.header("authorization");
    const std::string pfx = "Bearer ";
    return auth.rfind(pfx, 0) == 0 && constant_time_eq(auth.substr(pfx.size()), expected_token);
}

struct TokenBucket {
    double tokens{0.0};
    double rate_per_sec{0.0};
    double capacity{0.0};
    int64_t last_ms{0};

    // rpm <= 0 disables limiting.
    void init(int rpm, int64_t now_ms) {
        rate_per_sec = rpm > 0 ? rpm / 60.0 : 0.0;
        capacity = rpm > 0 ? (double)rpm : 0.0;
        tokens = capacity;
        last_ms = now_ms;
    }

    bool allow(int64_t now_ms) {
        if (rate_per_sec <= 0.0) return true;
        if (now_ms > last_ms) {
            tokens = std::min(capacity, tokens + (double)(now_ms - last_ms) / 1000.0 * rate_per_sec);
            last_ms = now_ms;
        }
        if (tokens < 1.0) return false;
        tokens -= 1.0;
        return true;
    }
};

// Signed-request nonces seen inside the replay window.
class NonceCache {
public:
    explicit NonceCache(size_t max_entries = 10000) : max_entries_(max_entries) {}

    // false when `nonce` was already used within window_ms.
    bool admit(const std::string& nonce, int64_t now_ms, int64_t window_ms) {
        auto it = seen_.find(nonce);
        if (it != seen_.end() && now_ms - it->second < window_ms) return false;
        seen_[nonce] = now_ms;
        if (seen_.size() > max_entries_ / 2) prune(now_ms, window_ms);
        return true;
    }

private:
    void prune(int64_t now_ms, int64_t window_ms) {
        for (auto it = seen_.begin(); it != seen_.end();) {
            if (now_ms - it->second >= window_ms) it = seen_.erase(it);
            else ++it;
        }
        while (seen_.size() > max_entries_) {
            auto oldest = std::min_element(seen_.begin(), seen_.end(),
                                           [](const auto& a, const auto& b) { return a.second < b.second; });
            seen_.erase(oldest);
        }
    }

    size_t max_entries_;
    std::unordered_map<std::string, int64_t> seen_;
};

// Signature: hex HMAC-SHA256 over "ts\nnonce\nMETHOD\npath\nsha256(body)\n",
// optionally prefixed "v1=". ts is epoch seconds or milliseconds.
inline bool api_hmac_ok(const HttpRequest& req, const std::string& secret, int ttl_sec, NonceCache& nonces) {
    if (secret.empty()) return true;
    if (ttl_sec <= 0) ttl_sec = 60;

    const std::string ts_s = req.header("x-caproute-ts");
    const std::string nonce = req.header("x-caproute-nonce");
    std::string sig = req.header("x-caproute-signature");
    if (ts_s.empty() || nonce.empty() || sig.empty()) return false;
    if (ts_s.find_first_not_of("0123456789") != std::string::npos || ts_s.size() > 18) return false;

    const int64_t now_wall = now_ms_wall();
    int64_t ts_ms = std::stoll(ts_s);
    if (ts_ms < 20000000000LL) ts_ms *= 1000;
    const int64_t window_ms = (int64_t)ttl_sec * 1000;
    if (std::llabs(now_wall - ts_ms) > window_ms) return false;

    const std::string canon = ts_s + "\n" + nonce + "\n" + req.method + "\n" + req.path + "\n" +
                              sha256_hex(req.body) + "\n";
    if (sig.rfind("v1=", 0) == 0) sig = sig.substr(3);
    if (!constant_time_eq(hmac_sha256_hex(secret, canon), sig)) return false;
    return nonces.admit(nonce, now_wall, window_ms);
}

} // namespace caproute

#endif // !_WIN32
