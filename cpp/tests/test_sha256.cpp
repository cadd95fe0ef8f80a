#include "hashchain/hash.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <vector>

TEST_CASE("SHA-256 known-answer vectors") {
  using hashchain::sha256; using hashchain::to_hex;

  REQUIRE(to_hex(sha256(std::string())) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(to_hex(sha256(std::string("abc"))) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  // 56 bytes: padding spills into a second block
  REQUIRE(to_hex(sha256(std::string(
              "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"))) ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
  // exactly one full block
  REQUIRE(to_hex(sha256(std::string(64, 'a'))) ==
          "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
}

TEST_CASE("Single step matches general SHA-256 over 32 bytes") {
  using hashchain::Digest; using hashchain::hash_once; using hashchain::sha256;
  using hashchain::to_hex;

  Digest zero{};
  REQUIRE(to_hex(hash_once(zero)) ==
          "66687aadf862bd776c8fc18b8e9f8e20089714856ee233b3902a591d0d5f2925");

  Digest counting{};
  for (int i = 0; i < 32; ++i) counting.bytes[i] = static_cast<std::uint8_t>(i);
  REQUIRE(to_hex(hash_once(counting)) ==
          "630dcd2966c4336691125448bbb25b4ff412a49c732db2c8abc1b8581bd710dd");

  for (std::uint8_t fill : {0x00, 0x01, 0x7f, 0x80, 0xff}) {
    Digest d{};
    d.bytes.fill(fill);
    std::vector<std::uint8_t> v(d.bytes.begin(), d.bytes.end());
    REQUIRE(hash_once(d) == sha256(v));
  }
}

TEST_CASE("Hex encoding is lowercase and 64 chars") {
  hashchain::Digest d{};
  d.bytes[0] = 0xAB;
  d.bytes[31] = 0x0F;
  auto h = hashchain::to_hex(d);
  REQUIRE(h.size() == 64);
  REQUIRE(h.substr(0, 2) == "ab");
  REQUIRE(h.substr(62) == "0f");
}
