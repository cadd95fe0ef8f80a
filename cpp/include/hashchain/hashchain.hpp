// include/hashchain/hashchain.hpp
#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <string>

namespace hashchain {

// Bump when the input layout or output word format changes.
inline constexpr const char* HASHCHAIN_VERSION = "0.1.0";

// 256-bit chain state. Also used for the private seed (opaque bytes, not a number).
struct Digest {
  std::array<std::uint8_t, 32> bytes{};
};

inline bool operator==(const Digest& a, const Digest& b) noexcept {
  return a.bytes == b.bytes;
}
inline bool operator!=(const Digest& a, const Digest& b) noexcept {
  return !(a == b);
}

// Public result: word i is bytes [4i, 4i+4) of the final digest, big-endian.
using OutputWords = std::array<std::uint32_t, 8>;

// Decoded input buffer: public iteration count and private seed.
struct ChainInput {
  std::uint64_t n = 0;
  Digest seed{};
};

struct ChainConfig {
  std::uint64_t n = 0;                // iteration count (public)
  Digest seed{};                      // initial state (private)
  bool enable_progress = true;        // allow callbacks
  std::uint64_t progress_stride = 0;  // 0 = auto (~1% of n)
};

struct ChainResult {
  std::uint64_t n = 0;
  Digest digest{};                    // state after n iterations
  OutputWords words{};
  std::uint64_t ns_elapsed = 0;       // wall-clock nanoseconds (best effort)
  std::string engine_info;            // e.g., "sha256:portable; gcc:13.2.0"
};

// Progress callback: 1-based iteration count and the in-place chain state.
// The reference is only valid for the duration of the call.
using ProgressCb = std::function<void(std::uint64_t, const Digest&)>;

// Applies SHA-256 to the seed n times; n == 0 returns the seed unchanged.
Digest hash_chain(std::uint64_t n, const Digest& seed) noexcept;

// Big-endian split of the digest into eight words, independent of host order.
OutputWords encode_words(const Digest& d) noexcept;

// Inverse of encode_words.
Digest words_to_digest(const OutputWords& w) noexcept;

// Full engine run with timing and optional progress reporting.
// Exceptions thrown by the callback propagate; no partial result is returned.
ChainResult run_chain(const ChainConfig& cfg, ProgressCb cb = {});

} // namespace hashchain
