#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

#include "common/error.hpp"

namespace gc::id {

/// 128-bit identifier with the GUID field structure.
///
/// Two byte layouts are supported:
///  - canonical (GUID) layout: data1, data2 and data3 little-endian, followed by
///    data4 verbatim. This is what .NET `Guid.ToByteArray` and an in-memory Windows
///    `GUID` produce, and the layout the colorizer hashes.
///  - RFC 4122 layout: every field big-endian, as in libuuid's `uuid_t`.
struct Identifier {
  using Bytes = std::array<std::uint8_t, 16>;

  std::uint32_t data1 = 0;
  std::uint16_t data2 = 0;
  std::uint16_t data3 = 0;
  std::array<std::uint8_t, 8> data4{};

  static constexpr auto nil() -> Identifier { return Identifier{}; }

  constexpr auto is_nil() const -> bool { return *this == nil(); }

  static auto from_bytes(const Bytes& bytes) -> Identifier;
  auto to_bytes() const -> Bytes;

  static auto from_rfc4122_bytes(const Bytes& bytes) -> Identifier;
  auto to_rfc4122_bytes() const -> Bytes;

  /// Parse "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", optionally wrapped in {} or (),
  /// or 32 undelimited hex digits. Surrounding whitespace is ignored.
  static auto parse(std::string_view text) -> Expected<Identifier>;

  /// Lowercase hyphenated form.
  auto to_string() const -> std::string;

  constexpr auto operator<=>(const Identifier&) const = default;
};

}  // namespace gc::id

template <>
struct std::hash<gc::id::Identifier> {
  auto operator()(const gc::id::Identifier& id) const -> std::size_t {
    std::size_t h = std::hash<std::uint32_t>{}(id.data1);
    h ^= std::hash<std::uint32_t>{}((std::uint32_t{id.data2} << 16) | id.data3) << 1;
    for (auto byte : id.data4) {
      h = h * 31 + byte;
    }
    return h;
  }
};

template <>
struct std::formatter<gc::id::Identifier> : std::formatter<std::string> {
  auto format(const gc::id::Identifier& id, std::format_context& ctx) const {
    return formatter<std::string>::format(id.to_string(), ctx);
  }
};
