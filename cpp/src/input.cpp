// src/input.cpp
#include "hashchain/input.hpp"
#include <algorithm> // std::min
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace hashchain {

MalformedInput::MalformedInput(std::size_t got)
    : std::invalid_argument("malformed input: need " +
                            std::to_string(kInputSize) + " bytes, got " +
                            std::to_string(got)),
      got_(got) {}

ChainInput decode_input(const void *data, std::size_t nbytes) {
  // Length is checked before any field is touched.
  if (data == nullptr || nbytes < kInputSize)
    throw MalformedInput(data == nullptr ? 0 : nbytes);

  const unsigned char *p = static_cast<const unsigned char *>(data);
  ChainInput in;
  // n is little-endian; output words are big-endian. Both are fixed by the format.
  for (std::size_t i = 0; i < kCountSize; ++i)
    in.n |= static_cast<std::uint64_t>(p[i]) << (8 * i);
  std::memcpy(in.seed.bytes.data(), p + kCountSize, kSeedSize);
  return in;
}

ChainInput decode_input(const std::vector<std::uint8_t> &buf) {
  return decode_input(buf.data(), buf.size());
}

std::vector<std::uint8_t> encode_input(const ChainInput &in) {
  std::vector<std::uint8_t> out(kInputSize);
  for (std::size_t i = 0; i < kCountSize; ++i)
    out[i] = static_cast<std::uint8_t>(in.n >> (8 * i));
  std::memcpy(out.data() + kCountSize, in.seed.bytes.data(), kSeedSize);
  return out;
}

Digest seed_from_secret(const std::string &secret) noexcept {
  Digest seed{}; // zero padding
  std::memcpy(seed.bytes.data(), secret.data(),
              std::min(secret.size(), kSeedSize));
  return seed;
}

} // namespace hashchain
