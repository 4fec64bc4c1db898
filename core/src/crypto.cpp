#include "caproute/crypto.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <vector>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace caproute {

namespace {

constexpr std::array<uint32_t, 64> K = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u
};

constexpr std::array<uint32_t, 8> H0 = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u
};

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }

void fill_random(uint8_t* out, size_t n) {
    size_t got = 0;
#if defined(__linux__)
    while (got < n) {
        ssize_t r = ::getrandom(out + got, n - got, 0);
        if (r <= 0) break;
        got += (size_t)r;
    }
    if (got == n) return;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        got = std::fread(out, 1, n, f);
        std::fclose(f);
        if (got == n) return;
    }
    throw std::runtime_error("random_hex: no entropy source available");
}

std::string to_hex(const uint8_t* b, size_t n) {
    static const char* HEX = "0123456789abcdef";
    std::string out(n * 2, '0');
    for (size_t i = 0; i < n; i++) {
        out[i * 2] = HEX[b[i] >> 4];
        out[i * 2 + 1] = HEX[b[i] & 0xF];
    }
    return out;
}

} // namespace

Sha256::Sha256() : state_(H0) {}

void Sha256::compress(const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
               (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; i++) {
        const uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        const uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = state_;
    for (int i = 0; i < 64; i++) {
        const uint32_t e = v[4];
        const uint32_t a = v[0];
        const uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) + ((e & v[5]) ^ (~e & v[6])) + K[i] + w[i];
        const uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) + ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        for (int j = 7; j > 0; j--) v[j] = v[j - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }
    for (int i = 0; i < 8; i++) state_[i] += v[i];
}

Sha256& Sha256::update(const uint8_t* data, size_t n) {
    total_bytes_ += n;
    while (n > 0) {
        const size_t take = std::min(n, buf_.size() - buf_len_);
        std::memcpy(buf_.data() + buf_len_, data, take);
        buf_len_ += take;
        data += take;
        n -= take;
        if (buf_len_ == buf_.size()) {
            compress(buf_.data());
            buf_len_ = 0;
        }
    }
    return *this;
}

std::array<uint8_t, 32> Sha256::digest() {
    const uint64_t bit_len = total_bytes_ * 8ull;
    buf_[buf_len_++] = 0x80;
    if (buf_len_ > 56) {
        std::memset(buf_.data() + buf_len_, 0, buf_.size() - buf_len_);
        compress(buf_.data());
        buf_len_ = 0;
    }
    std::memset(buf_.data() + buf_len_, 0, 56 - buf_len_);
    for (int i = 0; i < 8; i++) buf_[63 - i] = uint8_t(bit_len >> (i * 8));
    compress(buf_.data());
    buf_len_ = 0;

    std::array<uint8_t, 32> out{};
    for (int i = 0; i < 8; i++) {
        out[i * 4] = uint8_t(state_[i] >> 24);
        out[i * 4 + 1] = uint8_t(state_[i] >> 16);
        out[i * 4 + 2] = uint8_t(state_[i] >> 8);
        out[i * 4 + 3] = uint8_t(state_[i]);
    }
    return out;
}

std::string Sha256::hex_digest() {
    const auto d = digest();
    return to_hex(d.data(), d.size());
}

std::string hmac_sha256_hex(const std::string& key, const std::string& msg) {
    // HMAC(K, m) = H((K0 ^ opad) || H((K0 ^ ipad) || m))
    std::array<uint8_t, 64> k0{};
    if (key.size() > k0.size()) {
        const auto kh = Sha256().update(key).digest();
        std::memcpy(k0.data(), kh.data(), kh.size());
    } else {
        std::memcpy(k0.data(), key.data(), key.size());
    }

    std::array<uint8_t, 64> ipad{}, opad{};
    for (size_t i = 0; i < k0.size(); i++) {
        ipad[i] = uint8_t(k0[i] ^ 0x36);
        opad[i] = uint8_t(k0[i] ^ 0x5c);
    }
    const auto inner = Sha256().update(ipad.data(), ipad.size()).update(msg).digest();
    return Sha256().update(opad.data(), opad.size()).update(inner.data(), inner.size()).hex_digest();
}

bool constant_time_eq(const std::string& a, const std::string& b) {
    // Length mismatch is folded in rather than returned early.
    const size_t len = std::max(a.size(), b.size());
    volatile uint8_t v = (a.size() != b.size()) ? 1 : 0;
    for (size_t i = 0; i < len; i++) {
        const uint8_t ca = i < a.size() ? (uint8_t)a[i] : 0;
        const uint8_t cb = i < b.size() ? (uint8_t)b[i] : 0;
        v |= ca ^ cb;
    }
    return v == 0;
}

std::string random_hex(size_t bytes) {
    std::vector<uint8_t> buf(bytes);
    if (bytes) fill_random(buf.data(), bytes);
    return to_hex(buf.data(), buf.size());
}

} // namespace caproute
