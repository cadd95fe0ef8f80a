// src/words.cpp
#include "hashchain/hashchain.hpp"
#include <cstdint>

namespace hashchain {
OutputWords encode_words(const Digest &d) noexcept {
  OutputWords w{};
  for (int i = 0; i < 8; ++i) {
    const std::uint8_t *p = d.bytes.data() + 4 * i;
    w[i] = (std::uint32_t)p[0] << 24 | (std::uint32_t)p[1] << 16 |
           (std::uint32_t)p[2] << 8 | (std::uint32_t)p[3]; // big-endian
  }
  return w;
}

Digest words_to_digest(const OutputWords &w) noexcept {
  Digest d{};
  for (int i = 0; i < 8; ++i) {
    d.bytes[4 * i] = (std::uint8_t)(w[i] >> 24);
    d.bytes[4 * i + 1] = (std::uint8_t)(w[i] >> 16);
    d.bytes[4 * i + 2] = (std::uint8_t)(w[i] >> 8);
    d.bytes[4 * i + 3] = (std::uint8_t)(w[i]);
  }
  return d;
}
} // namespace hashchain
