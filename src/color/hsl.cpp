#include "color/hsl.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace gc::color {
namespace {

auto to_channel8(double value) -> std::uint8_t {
  return static_cast<std::uint8_t>(std::min(255, static_cast<int>(value * 256)));
}

}  // namespace

auto Rgb8::to_hex() const -> std::string {
  return std::format("#{:02X}{:02X}{:02X}", unsigned{r}, unsigned{g}, unsigned{b});
}

auto hsl_to_rgb(double hue, double saturation, double lightness) -> Rgb {
  hue = std::fmod(hue, 360.0);
  if (hue < 0) {
    hue += 360.0;
  }

  const double a = saturation * std::min(lightness, 1 - lightness);

  auto channel = [&](int n) {
    const double k = std::fmod(n + hue / 30, 12.0);
    return lightness - a * std::clamp(std::min(k - 3, 9 - k), -1.0, 1.0);
  };

  return Rgb{channel(0), channel(8), channel(4)};
}

auto hsl_to_rgb8(double hue, double saturation, double lightness) -> Rgb8 {
  const auto rgb = hsl_to_rgb(hue, saturation, lightness);
  return Rgb8{to_channel8(rgb.red), to_channel8(rgb.green), to_channel8(rgb.blue)};
}

}  // namespace gc::color
