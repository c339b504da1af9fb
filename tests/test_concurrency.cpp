#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "color/colorizer.hpp"
#include "test_support.hpp"

namespace {

struct Expectation {
  gc::id::Identifier id;
  std::int64_t seed = 0;
  gc::color::ColorResult color;
  std::string html;
};

auto make_expectations(int count) -> std::vector<Expectation> {
  std::vector<Expectation> out;
  out.reserve(static_cast<std::size_t>(count));
  uint64_t rng = 2024;
  for (int i = 0; i < count; ++i) {
    Expectation e;
    e.id = next_identifier(rng);
    e.seed = static_cast<std::int64_t>(next_seed(rng));
    e.color = gc::color::to_color(e.id, e.seed);
    e.html = gc::color::to_html_color(e.id, e.seed).color;
    out.push_back(std::move(e));
  }
  return out;
}

auto test_concurrent_to_color_matches_serial() -> bool {
  const auto expectations = make_expectations(256);
  return run_concurrent(8, 2000, [&](int thread, int iter) {
    const auto& e = expectations[static_cast<std::size_t>(thread * 31 + iter) % expectations.size()];
    const auto got = gc::color::to_color(e.id, e.seed);
    if (got != e.color) {
      std::cerr << "color mismatch for " << e.id.to_string() << "\n";
      return false;
    }
    return true;
  });
}

auto test_concurrent_html_matches_serial() -> bool {
  const auto expectations = make_expectations(128);
  return run_concurrent(4, 1000, [&](int thread, int iter) {
    const auto& e = expectations[static_cast<std::size_t>(thread + iter * 7) % expectations.size()];
    const auto got = gc::color::to_html_color(e.id, e.seed);
    return got.color == e.html && got.is_dark == e.color.is_dark;
  });
}

auto test_concurrent_nil_is_black() -> bool {
  return run_concurrent(4, 500, [](int thread, int iter) {
    const auto got = gc::color::to_color(gc::id::Identifier::nil(), thread * 1000 + iter);
    return got.color == gc::color::Rgb8::black() && got.is_dark;
  });
}

}  // namespace

int main() {
  TestStats stats;
  run_test("concurrent_to_color_matches_serial", test_concurrent_to_color_matches_serial, stats);
  run_test("concurrent_html_matches_serial", test_concurrent_html_matches_serial, stats);
  run_test("concurrent_nil_is_black", test_concurrent_nil_is_black, stats);

  std::cout << "Passed: " << stats.passed << ", Failed: " << stats.failed << "\n";
  return stats.failed == 0 ? 0 : 1;
}
