// include/hashchain/hash.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "hashchain.hpp"  // for hashchain::Digest

namespace hashchain {

// One-shot SHA-256 over arbitrary bytes.
Digest sha256(const void* data, std::size_t nbytes) noexcept;

// Convenience overloads for tests/logging.
Digest sha256(const std::string& s) noexcept;
Digest sha256(const std::vector<std::uint8_t>& v) noexcept;

// Single chain step: SHA-256 of exactly the 32 state bytes.
Digest hash_once(const Digest& d) noexcept;

// Hex encoding for logs and debugging.
std::string to_hex(const Digest& d);

} // namespace hashchain
