#include "color/colorizer.hpp"

#include <limits>

#include <spdlog/spdlog.h>

namespace gc::color {
namespace {

constexpr double kWordMax = std::numeric_limits<std::uint32_t>::max();
constexpr double kSaturation = 1.0;
constexpr double kBrightnessScale = 0.6;
constexpr double kBrightnessFloor = 0.2;

constexpr double kWarmHueLimit = 30.0;
constexpr double kCoolHueLimit = 210.0;
constexpr double kDarkThresholdOutside = 0.7;
constexpr double kDarkThresholdInside = 0.45;

}  // namespace

auto hsl_from_digest(const IdDigest& digest) -> Hsl {
  const double hue = (read_u32_le(digest, 0) / kWordMax) * 360;
  const double brightness_mod = read_u32_le(digest, 4) / kWordMax;
  return Hsl{hue, kSaturation, kBrightnessScale * brightness_mod + kBrightnessFloor};
}

auto is_dark(double hue, double brightness) -> bool {
  if (hue < kWarmHueLimit || hue > kCoolHueLimit) {
    return brightness <= kDarkThresholdOutside;
  }
  return brightness <= kDarkThresholdInside;
}

auto to_color(const id::Identifier& id, std::int64_t seed) -> ColorResult {
  if (id.is_nil()) {
    return ColorResult{Rgb8::black(), true};
  }

  const auto digest = hash_identifier(id.to_bytes(), seed);
  const auto hsl = hsl_from_digest(digest);

  ColorResult result{hsl_to_rgb8(hsl), is_dark(hsl.hue, hsl.lightness)};
  auto* logger = spdlog::default_logger_raw();
  if (logger != nullptr && logger->should_log(spdlog::level::trace)) {
    logger->trace("to_color id={} seed={} hue={:.3f} lightness={:.3f} rgb={} dark={}",
                  id.to_string(), seed, hsl.hue, hsl.lightness,
                  result.color.to_hex(), result.is_dark);
  }
  return result;
}

auto to_html_color(const id::Identifier& id, std::int64_t seed) -> HtmlColorResult {
  const auto result = to_color(id, seed);
  return HtmlColorResult{result.color.to_hex(), result.is_dark};
}

}  // namespace gc::color
