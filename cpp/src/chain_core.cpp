// src/chain_core.cpp
#include "hashchain/hash.hpp"
#include "hashchain/hashchain.hpp"

#include <algorithm> // std::max
#include <chrono>
#include <cstdint>
#include <string>

namespace {
// "gcc:13.2", "clang:17.0", ... for engine_info.
std::string toolchain_tag() {
#if defined(__clang__)
  return "clang:" + std::to_string(__clang_major__) + "." +
         std::to_string(__clang_minor__);
#elif defined(__GNUC__)
  return "gcc:" + std::to_string(__GNUC__) + "." +
         std::to_string(__GNUC_MINOR__);
#elif defined(_MSC_VER)
  return "msvc:" + std::to_string(_MSC_VER);
#else
  return "cxx:unknown";
#endif
}
} // namespace

namespace hashchain {
// Forward decl for the single-block step (no public header exposure)
void hash_in_place(Digest &d) noexcept;
} // namespace hashchain

namespace hashchain {

Digest hash_chain(std::uint64_t n, const Digest &seed) noexcept {
  Digest state = seed;
  for (std::uint64_t i = 0; i < n; ++i)
    hash_in_place(state);
  return state;
}

ChainResult run_chain(const ChainConfig &cfg, ProgressCb cb) {
  const std::uint64_t n = cfg.n;

  ChainResult out;
  out.n = n;

  // Compute effective progress stride (0 => auto ~1%).
  const std::uint64_t stride =
      (cfg.progress_stride != 0)
          ? cfg.progress_stride
          : std::max<std::uint64_t>(1, n / 100);
  const bool report = cb && cfg.enable_progress;

  auto t0 = std::chrono::steady_clock::now();

  // One 32-byte state, rewritten in place for every step.
  Digest state = cfg.seed;

  for (std::uint64_t i = 0; i < n; ++i) {
    hash_in_place(state);

    if (report && ((i + 1) % stride == 0 || i + 1 == n))
      cb(i + 1, state);
  }

  auto t1 = std::chrono::steady_clock::now();
  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());

  out.digest = state;
  out.words = encode_words(state);
  out.engine_info = std::string("sha256:portable; ") + toolchain_tag() +
                    "; hashchain:" + HASHCHAIN_VERSION;
  return out;
}

} // namespace hashchain
