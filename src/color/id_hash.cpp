#include "color/id_hash.hpp"

#include <cstring>

#include <xxhash.h>

namespace gc::color {

static_assert(sizeof(XXH64_canonical_t) == std::tuple_size_v<decltype(IdDigest::bytes)>,
              "digest must hold exactly one canonical XXH64 value");

auto hash_identifier(const id::Identifier::Bytes& bytes, std::int64_t seed) -> IdDigest {
  const XXH64_hash_t hash =
      XXH3_64bits_withSeed(bytes.data(), bytes.size(), static_cast<XXH64_hash_t>(seed));

  XXH64_canonical_t canonical;
  XXH64_canonicalFromHash(&canonical, hash);

  IdDigest digest{};
  std::memcpy(digest.bytes.data(), canonical.digest, digest.bytes.size());
  return digest;
}

auto read_u32_le(const IdDigest& digest, std::size_t offset) -> std::uint32_t {
  return static_cast<std::uint32_t>(digest.bytes[offset]) |
         (static_cast<std::uint32_t>(digest.bytes[offset + 1]) << 8) |
         (static_cast<std::uint32_t>(digest.bytes[offset + 2]) << 16) |
         (static_cast<std::uint32_t>(digest.bytes[offset + 3]) << 24);
}

}  // namespace gc::color
