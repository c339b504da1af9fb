#include <benchmark/benchmark.h>

#include <cstdint>
#include <vector>

#include "color/colorizer.hpp"
#include "color/hsl.hpp"
#include "id/identifier.hpp"

namespace {

auto make_identifiers(std::size_t count) -> std::vector<gc::id::Identifier> {
  std::vector<gc::id::Identifier> ids;
  ids.reserve(count);
  std::uint64_t state = 0x9e3779b97f4a7c15ULL;
  for (std::size_t i = 0; i < count; ++i) {
    gc::id::Identifier::Bytes bytes{};
    for (auto& byte : bytes) {
      state = state * 6364136223846793005ULL + 1442695040888963407ULL;
      byte = static_cast<std::uint8_t>(state >> 56);
    }
    ids.push_back(gc::id::Identifier::from_bytes(bytes));
  }
  return ids;
}

void BM_ToColor(benchmark::State& state) {
  const auto ids = make_identifiers(1024);
  std::size_t i = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(gc::color::to_color(ids[i++ % ids.size()], state.range(0)));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ToColor)->Arg(0)->Arg(42);

void BM_ToHtmlColor(benchmark::State& state) {
  const auto ids = make_identifiers(1024);
  std::size_t i = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(gc::color::to_html_color(ids[i++ % ids.size()]));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ToHtmlColor);

void BM_HslToRgb8(benchmark::State& state) {
  double hue = 0.0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(gc::color::hsl_to_rgb8(hue, 1.0, 0.5));
    hue += 0.7;
  }
}
BENCHMARK(BM_HslToRgb8);

void BM_ParseIdentifier(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(gc::id::Identifier::parse("6f9619ff-8b86-d011-b42d-00c04fc964ff"));
  }
}
BENCHMARK(BM_ParseIdentifier);

}  // namespace

BENCHMARK_MAIN();
