#pragma once

#include <cstdint>
#include <string>

#include "color/hsl.hpp"
#include "color/id_hash.hpp"
#include "id/identifier.hpp"

namespace gc::color {

/// A color plus whether it is dark enough to need light foreground text.
struct ColorResult {
  Rgb8 color;
  bool is_dark = true;

  auto operator==(const ColorResult&) const -> bool = default;
};

/// ColorResult with the color rendered as "#RRGGBB".
struct HtmlColorResult {
  std::string color;
  bool is_dark = true;
};

/// Hue and lightness derived from a digest; saturation is always 1.
/// Hue spans [0, 360] and lightness [0.2, 0.8].
auto hsl_from_digest(const IdDigest& digest) -> Hsl;

/// Hues outside [30, 210] are perceptually darker at the same lightness,
/// so they use a higher threshold.
auto is_dark(double hue, double brightness) -> bool;

/// Stable color for `id`. Different seeds give unrelated color sets for the
/// same identifiers. The nil identifier always maps to black, dark.
auto to_color(const id::Identifier& id, std::int64_t seed = 0) -> ColorResult;

auto to_html_color(const id::Identifier& id, std::int64_t seed = 0) -> HtmlColorResult;

}  // namespace gc::color
