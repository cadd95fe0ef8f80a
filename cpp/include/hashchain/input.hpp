// include/hashchain/input.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "hashchain.hpp"

namespace hashchain {

// Fixed input layout:
//   [0, 8)   n, u64 little-endian
//   [8, 40)  seed, raw bytes
inline constexpr std::size_t kCountSize = 8;
inline constexpr std::size_t kSeedSize = 32;
inline constexpr std::size_t kInputSize = kCountSize + kSeedSize;

// Raised when the buffer is too short to hold both fields.
class MalformedInput : public std::invalid_argument {
public:
  explicit MalformedInput(std::size_t got);
  std::size_t size() const noexcept { return got_; }

private:
  std::size_t got_;
};

// Throws MalformedInput if nbytes < kInputSize. Trailing bytes are ignored.
ChainInput decode_input(const void* data, std::size_t nbytes);
ChainInput decode_input(const std::vector<std::uint8_t>& buf);

// Writes the exact 40-byte layout decode_input reads.
std::vector<std::uint8_t> encode_input(const ChainInput& in);

// Secret string bytes as a seed: truncated to 32 bytes, zero-padded if shorter.
Digest seed_from_secret(const std::string& secret) noexcept;

} // namespace hashchain
