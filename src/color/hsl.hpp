#pragma once

#include <cstdint>
#include <string>

namespace gc::color {

/// Fractional RGB, each channel in [0, 1].
struct Rgb {
  double red = 0.0;
  double green = 0.0;
  double blue = 0.0;
};

/// RGB with 8 bits per channel.
struct Rgb8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  static constexpr auto black() -> Rgb8 { return Rgb8{}; }

  /// 0xRRGGBB.
  constexpr auto packed() const -> std::uint32_t {
    return (std::uint32_t{r} << 16) | (std::uint32_t{g} << 8) | b;
  }

  /// "#RRGGBB", uppercase.
  auto to_hex() const -> std::string;

  auto operator==(const Rgb8&) const -> bool = default;
};

struct Hsl {
  double hue = 0.0;
  double saturation = 0.0;
  double lightness = 0.0;
};

/// HSL to RGB using the "alternative" formulation
/// (https://en.wikipedia.org/wiki/HSL_and_HSV#HSL_to_RGB_alternative).
/// Hue is in degrees and is wrapped into [0, 360); saturation and lightness
/// are expected in [0, 1].
auto hsl_to_rgb(double hue, double saturation, double lightness) -> Rgb;

/// Scales each channel by 256 and truncates, saturating at 255.
auto hsl_to_rgb8(double hue, double saturation, double lightness) -> Rgb8;

inline auto hsl_to_rgb8(const Hsl& hsl) -> Rgb8 {
  return hsl_to_rgb8(hsl.hue, hsl.saturation, hsl.lightness);
}

}  // namespace gc::color
