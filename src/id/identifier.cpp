#include "id/identifier.hpp"

#include <cctype>
#include <optional>

namespace gc::id {
namespace {

constexpr auto kHyphenatedLength = std::size_t{36};
constexpr auto kDigitsLength = std::size_t{32};
constexpr std::array<std::size_t, 4> kHyphenPositions{8, 13, 18, 23};
constexpr char kHexDigits[] = "0123456789abcdef";

auto hex_value(char c) -> std::optional<std::uint8_t> {
  if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
  return std::nullopt;
}

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

/// Strip hyphens from the 36-char form, checking they sit at group boundaries.
auto strip_hyphens(std::string_view text, std::string& digits) -> bool {
  std::size_t next_hyphen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (next_hyphen < kHyphenPositions.size() && i == kHyphenPositions[next_hyphen]) {
      if (text[i] != '-') {
        return false;
      }
      ++next_hyphen;
      continue;
    }
    digits.push_back(text[i]);
  }
  return true;
}

auto load_be(const Identifier::Bytes& bytes, std::size_t offset, std::size_t count)
    -> std::uint32_t {
  std::uint32_t value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    value = (value << 8) | bytes[offset + i];
  }
  return value;
}

auto load_le(const Identifier::Bytes& bytes, std::size_t offset, std::size_t count)
    -> std::uint32_t {
  std::uint32_t value = 0;
  for (std::size_t i = count; i > 0; --i) {
    value = (value << 8) | bytes[offset + i - 1];
  }
  return value;
}

auto store_be(Identifier::Bytes& bytes, std::size_t offset, std::size_t count,
              std::uint32_t value) -> void {
  for (std::size_t i = count; i > 0; --i) {
    bytes[offset + i - 1] = static_cast<std::uint8_t>(value & 0xFFu);
    value >>= 8;
  }
}

auto store_le(Identifier::Bytes& bytes, std::size_t offset, std::size_t count,
              std::uint32_t value) -> void {
  for (std::size_t i = 0; i < count; ++i) {
    bytes[offset + i] = static_cast<std::uint8_t>(value & 0xFFu);
    value >>= 8;
  }
}

auto copy_tail(const Identifier::Bytes& bytes, Identifier& id) -> void {
  for (std::size_t i = 0; i < id.data4.size(); ++i) {
    id.data4[i] = bytes[8 + i];
  }
}

auto write_tail(const Identifier& id, Identifier::Bytes& bytes) -> void {
  for (std::size_t i = 0; i < id.data4.size(); ++i) {
    bytes[8 + i] = id.data4[i];
  }
}

}  // namespace

auto Identifier::from_bytes(const Bytes& bytes) -> Identifier {
  Identifier id;
  id.data1 = load_le(bytes, 0, 4);
  id.data2 = static_cast<std::uint16_t>(load_le(bytes, 4, 2));
  id.data3 = static_cast<std::uint16_t>(load_le(bytes, 6, 2));
  copy_tail(bytes, id);
  return id;
}

auto Identifier::to_bytes() const -> Bytes {
  Bytes bytes{};
  store_le(bytes, 0, 4, data1);
  store_le(bytes, 4, 2, data2);
  store_le(bytes, 6, 2, data3);
  write_tail(*this, bytes);
  return bytes;
}

auto Identifier::from_rfc4122_bytes(const Bytes& bytes) -> Identifier {
  Identifier id;
  id.data1 = load_be(bytes, 0, 4);
  id.data2 = static_cast<std::uint16_t>(load_be(bytes, 4, 2));
  id.data3 = static_cast<std::uint16_t>(load_be(bytes, 6, 2));
  copy_tail(bytes, id);
  return id;
}

auto Identifier::to_rfc4122_bytes() const -> Bytes {
  Bytes bytes{};
  store_be(bytes, 0, 4, data1);
  store_be(bytes, 4, 2, data2);
  store_be(bytes, 6, 2, data3);
  write_tail(*this, bytes);
  return bytes;
}

auto Identifier::parse(std::string_view text) -> Expected<Identifier> {
  const auto input = text;
  text = trim(text);

  if (text.size() == kHyphenatedLength + 2) {
    const char open = text.front();
    const char close = text.back();
    if (!((open == '{' && close == '}') || (open == '(' && close == ')'))) {
      return tl::unexpected(make_error(
          std::format("identifier '{}' has mismatched delimiters", input)));
    }
    text = text.substr(1, kHyphenatedLength);
  }

  std::string digits;
  digits.reserve(kDigitsLength);
  if (text.size() == kHyphenatedLength) {
    if (!strip_hyphens(text, digits)) {
      return tl::unexpected(make_error(
          std::format("identifier '{}' has misplaced group separators", input)));
    }
  } else if (text.size() == kDigitsLength) {
    digits.assign(text);
  } else {
    return tl::unexpected(make_error(
        std::format("identifier '{}' has invalid length {}", input, text.size())));
  }

  // Hex text lists the fields most significant digit first, which is RFC 4122 order.
  Bytes bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    auto high = hex_value(digits[2 * i]);
    auto low = hex_value(digits[2 * i + 1]);
    if (!high || !low) {
      return tl::unexpected(make_error(
          std::format("identifier '{}' contains a non-hex digit", input)));
    }
    bytes[i] = static_cast<std::uint8_t>((*high << 4) | *low);
  }
  return from_rfc4122_bytes(bytes);
}

auto Identifier::to_string() const -> std::string {
  const auto bytes = to_rfc4122_bytes();
  std::string out;
  out.reserve(kHyphenatedLength);
  std::size_t next_hyphen = 0;
  for (auto byte : bytes) {
    if (next_hyphen < kHyphenPositions.size() && out.size() == kHyphenPositions[next_hyphen]) {
      out.push_back('-');
      ++next_hyphen;
    }
    out.push_back(kHexDigits[byte >> 4]);
    out.push_back(kHexDigits[byte & 0x0F]);
  }
  return out;
}

}  // namespace gc::id
