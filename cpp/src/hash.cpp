// src/hash.cpp
#include "hashchain/hash.hpp"
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace hashchain {
namespace {

// ---- SHA-256 (FIPS 180-4) ----
inline constexpr std::uint32_t rotr(std::uint32_t x, int n) {
  return (x >> n) | (x << (32 - n));
}
inline std::uint32_t load_be32(const unsigned char *p) {
  return (std::uint32_t)p[0] << 24 | (std::uint32_t)p[1] << 16 |
         (std::uint32_t)p[2] << 8 | (std::uint32_t)p[3];
}
inline void store_be32(unsigned char *p, std::uint32_t v) {
  p[0] = (unsigned char)(v >> 24);
  p[1] = (unsigned char)(v >> 16);
  p[2] = (unsigned char)(v >> 8);
  p[3] = (unsigned char)(v);
}

constexpr std::uint32_t K[64] = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu,
    0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u,
    0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u,
    0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
    0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u,
    0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
    0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u,
    0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u, 0x1e376c08u,
    0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu,
    0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
    0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

constexpr std::uint32_t kInitH[8] = {0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u,
                                     0xa54ff53au, 0x510e527fu, 0x9b05688cu,
                                     0x1f83d9abu, 0x5be0cd19u};

// Expects w[0..15] loaded with the message block; expands the schedule in place.
void compress(std::uint32_t H[8], std::uint32_t w[64]) noexcept {
  for (int i = 16; i < 64; ++i) {
    std::uint32_t s0 =
        rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
    std::uint32_t s1 =
        rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }
  std::uint32_t a = H[0], b = H[1], c = H[2], d = H[3], e = H[4], f = H[5],
                g = H[6], h = H[7];
  for (int i = 0; i < 64; ++i) {
    std::uint32_t S1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
    std::uint32_t ch = (e & f) ^ (~e & g);
    std::uint32_t t1 = h + S1 + ch + K[i] + w[i];
    std::uint32_t S0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
    std::uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
    std::uint32_t t2 = S0 + maj;
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }
  H[0] += a;
  H[1] += b;
  H[2] += c;
  H[3] += d;
  H[4] += e;
  H[5] += f;
  H[6] += g;
  H[7] += h;
}

void compress_block(std::uint32_t H[8], const unsigned char *block) noexcept {
  std::uint32_t w[64];
  for (int i = 0; i < 16; ++i)
    w[i] = load_be32(block + 4 * i);
  compress(H, w);
}

} // namespace

Digest sha256(const void *data, std::size_t nbytes) noexcept {
  std::uint32_t H[8];
  std::memcpy(H, kInitH, sizeof(H));

  const unsigned char *in = static_cast<const unsigned char *>(data);
  std::size_t full = nbytes / 64 * 64;
  unsigned char block[64];

  for (std::size_t i = 0; i < full; i += 64)
    compress_block(H, in + i);

  // Padding
  std::size_t rem = nbytes - full;
  std::memset(block, 0, 64);
  if (rem)
    std::memcpy(block, in + full, rem);
  block[rem] = 0x80;

  if (rem >= 56) { // need two blocks
    compress_block(H, block);
    std::memset(block, 0, 64);
  }
  // length in bits (big-endian)
  std::uint64_t bits = static_cast<std::uint64_t>(nbytes) * 8;
  for (int i = 0; i < 8; ++i)
    block[56 + 7 - i] = (unsigned char)(bits >> (8 * i));
  compress_block(H, block);

  Digest d{};
  for (int i = 0; i < 8; ++i)
    store_be32(d.bytes.data() + 4 * i, H[i]);
  return d;
}

Digest sha256(const std::string &s) noexcept {
  return sha256(s.data(), s.size());
}

Digest sha256(const std::vector<std::uint8_t> &v) noexcept {
  return sha256(v.data(), v.size());
}

// A 32-byte message is always one block with fixed padding: 0x80 marker at
// byte 32, zeros, then the bit length 256. Only w[0..7] depend on the state.
void hash_in_place(Digest &d) noexcept {
  std::uint32_t H[8];
  std::memcpy(H, kInitH, sizeof(H));

  std::uint32_t w[64];
  for (int i = 0; i < 8; ++i)
    w[i] = load_be32(d.bytes.data() + 4 * i);
  w[8] = 0x80000000u;
  for (int i = 9; i < 15; ++i)
    w[i] = 0;
  w[15] = 256;
  compress(H, w);

  for (int i = 0; i < 8; ++i)
    store_be32(d.bytes.data() + 4 * i, H[i]);
}

Digest hash_once(const Digest &d) noexcept {
  Digest out = d;
  hash_in_place(out);
  return out;
}

std::string to_hex(const Digest &d) {
  constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(2 * d.bytes.size());
  for (std::uint8_t b : d.bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

} // namespace hashchain
