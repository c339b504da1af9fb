#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "id/identifier.hpp"

namespace gc::color {

/// 64-bit digest of an identifier, stored big-endian (XXH64 canonical form).
struct IdDigest {
  std::array<std::uint8_t, 8> bytes{};
};

/// XXH3-64 of the canonical identifier bytes, seeded with `seed`.
auto hash_identifier(const id::Identifier::Bytes& bytes, std::int64_t seed) -> IdDigest;

/// Little-endian u32 read of digest bytes [offset, offset + 4).
auto read_u32_le(const IdDigest& digest, std::size_t offset) -> std::uint32_t;

}  // namespace gc::color
