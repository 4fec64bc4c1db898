#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace caproute {

// Streaming SHA-256. Feed with update(), read once with digest()/hex_digest().
class Sha256 {
public:
    Sha256();

    Sha256& update(const uint8_t* data, size_t n);
    Sha256& update(const std::string& s) {
        return update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    std::array<uint8_t, 32> digest();
    std::string hex_digest();

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> buf_{};
    size_t buf_len_{0};
    uint64_t total_bytes_{0};
};

inline std::string sha256_hex(const std::string& s) {
    return Sha256().update(s).hex_digest();
}

// HMAC-SHA256 (hex). Used for signed API requests.
std::string hmac_sha256_hex(const std::string& key, const std::string& msg);

// Constant-time string equality (tokens, signatures)
bool constant_time_eq(const std::string& a, const std::string& b);

// Lowercase hex of `bytes` kernel random bytes. Throws std::runtime_error if
// no entropy source is available.
std::string random_hex(size_t bytes);

} // namespace caproute
