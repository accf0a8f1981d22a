#include "evichain/digest.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace evichain;

TEST(Sha256, ReturnsExpectedDigest) {
  EXPECT_EQ(sha256Hex("test"),
            "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
}

TEST(Sha256, EmptyInput) {
  EXPECT_EQ(sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, IncrementalMatchesOneShot) {
  Sha256 h;
  h.ingest("te");
  h.ingest("st");
  EXPECT_EQ(h.finalizeHex(), sha256Hex("test"));
}

TEST(Sha256, ByteSpanMatchesString) {
  std::vector<std::byte> bytes{std::byte{'t'}, std::byte{'e'}, std::byte{'s'},
                               std::byte{'t'}};
  EXPECT_EQ(sha256Hex(std::span<const std::byte>(bytes)), sha256Hex("test"));
}

TEST(Sha256, FinalizeTwiceThrows) {
  Sha256 h;
  h.ingest("x");
  h.finalize();
  EXPECT_THROW(h.finalize(), std::logic_error);
  EXPECT_THROW(h.ingest("y"), std::logic_error);
}

TEST(Digest, GenesisSentinelIsSixtyFourZeros) {
  EXPECT_EQ(GENESIS_SENTINEL, std::string(64, '0'));
  EXPECT_TRUE(isHexDigest(GENESIS_SENTINEL));
}

TEST(Digest, IsHexDigest) {
  EXPECT_TRUE(isHexDigest(sha256Hex("abc")));
  EXPECT_FALSE(isHexDigest(""));
  EXPECT_FALSE(isHexDigest(std::string(63, 'a')));
  EXPECT_FALSE(isHexDigest(std::string(64, 'A')));
  EXPECT_FALSE(isHexDigest(std::string(64, 'g')));
}
