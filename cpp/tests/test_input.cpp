#include "hashchain/input.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
std::vector<std::uint8_t> sample_buffer(std::size_t len) {
  std::vector<std::uint8_t> buf(len);
  for (std::size_t i = 0; i < len; ++i) buf[i] = static_cast<std::uint8_t>(i * 7 + 1);
  return buf;
}
} // namespace

TEST_CASE("Buffers shorter than 40 bytes are malformed") {
  using hashchain::decode_input; using hashchain::MalformedInput;

  for (std::size_t len : {0u, 1u, 8u, 39u}) {
    REQUIRE_THROWS_AS(decode_input(sample_buffer(len)), MalformedInput);
  }
  REQUIRE_THROWS_AS(decode_input(nullptr, 40), MalformedInput);

  try {
    decode_input(sample_buffer(39));
    FAIL("expected MalformedInput");
  } catch (const MalformedInput& e) {
    REQUIRE(e.size() == 39);
  }
}

TEST_CASE("MalformedInput is an invalid_argument") {
  REQUIRE_THROWS_AS(hashchain::decode_input(sample_buffer(10)), std::invalid_argument);
}

TEST_CASE("39 bytes fail, same leading 40 bytes succeed") {
  auto buf = sample_buffer(40);
  std::vector<std::uint8_t> short_buf(buf.begin(), buf.begin() + 39);
  REQUIRE_THROWS_AS(hashchain::decode_input(short_buf), hashchain::MalformedInput);
  REQUIRE_NOTHROW(hashchain::decode_input(buf));
}

TEST_CASE("Count is little-endian, seed is raw") {
  auto buf = sample_buffer(40);
  auto in = hashchain::decode_input(buf);

  std::uint64_t expected = 0;
  for (int i = 7; i >= 0; --i) expected = (expected << 8) | buf[i];
  REQUIRE(in.n == expected);
  for (std::size_t i = 0; i < 32; ++i) REQUIRE(in.seed.bytes[i] == buf[8 + i]);
}

TEST_CASE("Concrete layout: n = 5, seed 0xFF") {
  std::vector<std::uint8_t> buf = {5, 0, 0, 0, 0, 0, 0, 0};
  buf.insert(buf.end(), 32, 0xFF);
  auto in = hashchain::decode_input(buf);
  REQUIRE(in.n == 5);
  for (auto b : in.seed.bytes) REQUIRE(b == 0xFF);
}

TEST_CASE("Any content of 40+ bytes decodes; trailing bytes ignored") {
  std::vector<std::uint8_t> ones(40, 0xFF), zeros(40, 0x00);
  REQUIRE(hashchain::decode_input(ones).n == UINT64_MAX);
  REQUIRE(hashchain::decode_input(zeros).n == 0);

  auto buf = sample_buffer(40);
  auto longer = sample_buffer(100);
  auto a = hashchain::decode_input(buf);
  auto b = hashchain::decode_input(longer);
  REQUIRE(a.n == b.n);
  REQUIRE(a.seed == b.seed);
}

TEST_CASE("Decoding is deterministic") {
  auto buf = sample_buffer(40);
  auto a = hashchain::decode_input(buf);
  auto b = hashchain::decode_input(buf);
  REQUIRE(a.n == b.n);
  REQUIRE(a.seed == b.seed);
}

TEST_CASE("encode_input writes the layout decode_input reads") {
  hashchain::ChainInput in;
  in.n = 0x0102030405060708ull;
  in.seed.bytes.fill(0xEE);
  auto buf = hashchain::encode_input(in);
  REQUIRE(buf.size() == hashchain::kInputSize);
  REQUIRE(buf[0] == 0x08);
  REQUIRE(buf[7] == 0x01);
  REQUIRE(buf[8] == 0xEE);
  REQUIRE(buf[39] == 0xEE);
}

TEST_CASE("Secrets are truncated or zero-padded to 32 bytes") {
  auto shortseed = hashchain::seed_from_secret("abc");
  REQUIRE(shortseed.bytes[0] == 'a');
  REQUIRE(shortseed.bytes[2] == 'c');
  for (std::size_t i = 3; i < 32; ++i) REQUIRE(shortseed.bytes[i] == 0);

  auto longseed = hashchain::seed_from_secret(std::string(40, 'x') + "tail");
  for (auto b : longseed.bytes) REQUIRE(b == 'x');

  REQUIRE(hashchain::seed_from_secret("") == hashchain::Digest{});
}
