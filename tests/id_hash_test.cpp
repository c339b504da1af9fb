#include "color/id_hash.hpp"

#include <gtest/gtest.h>

using gc::color::IdDigest;
using gc::color::hash_identifier;
using gc::color::read_u32_le;
using gc::id::Identifier;

namespace {

auto sample_bytes() -> Identifier::Bytes {
  return Identifier::Bytes{0xff, 0x19, 0x96, 0x6f, 0x86, 0x8b, 0x11, 0xd0,
                           0xb4, 0x2d, 0x00, 0xc0, 0x4f, 0xc9, 0x64, 0xff};
}

}  // namespace

TEST(IdHash, DigestIsBigEndianXxh3) {
  // XXH3-64(sample, seed 0) == 0xe75029ebfe28311c
  const auto digest = hash_identifier(sample_bytes(), 0);
  const std::array<std::uint8_t, 8> expected{0xe7, 0x50, 0x29, 0xeb, 0xfe, 0x28, 0x31, 0x1c};
  EXPECT_EQ(digest.bytes, expected);
}

TEST(IdHash, SeedChangesDigest) {
  const auto base = hash_identifier(sample_bytes(), 0);
  EXPECT_NE(hash_identifier(sample_bytes(), 1).bytes, base.bytes);
  EXPECT_NE(hash_identifier(sample_bytes(), -1).bytes, base.bytes);
  EXPECT_EQ(hash_identifier(sample_bytes(), 0).bytes, base.bytes);
}

TEST(IdHash, EveryByteContributes) {
  const auto base = hash_identifier(sample_bytes(), 0);
  for (std::size_t i = 0; i < 16; ++i) {
    auto bytes = sample_bytes();
    bytes[i] ^= 0x01;
    EXPECT_NE(hash_identifier(bytes, 0).bytes, base.bytes) << "byte " << i;
  }
}

TEST(IdHash, ReadsWordsLittleEndian) {
  IdDigest digest{{0x01, 0x02, 0x03, 0x04, 0xaa, 0xbb, 0xcc, 0xdd}};
  EXPECT_EQ(read_u32_le(digest, 0), 0x04030201u);
  EXPECT_EQ(read_u32_le(digest, 4), 0xddccbbaau);

  const auto sample = hash_identifier(sample_bytes(), 0);
  EXPECT_EQ(read_u32_le(sample, 0), 0xeb2950e7u);
  EXPECT_EQ(read_u32_le(sample, 4), 0x1c3128feu);
}
