#include <cstdint>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <gflags/gflags.h>

#include "color/colorizer.hpp"
#include "common/error.hpp"
#include "common/logging/log.hpp"
#include "id/identifier.hpp"

DEFINE_int64(seed, 0, "Hash seed; changes the color set for all identifiers");
DEFINE_string(format, "html", "Output format: html, rgb or both");
DEFINE_string(ids, "", "Comma-separated identifiers (positional arguments are also accepted)");

namespace {

enum class OutputFormat { Html, Rgb, Both };

auto parse_format(std::string_view name) -> gc::Expected<OutputFormat> {
  if (name == "html") return OutputFormat::Html;
  if (name == "rgb") return OutputFormat::Rgb;
  if (name == "both") return OutputFormat::Both;
  return tl::unexpected(gc::make_error(std::format("unknown format '{}'", name)));
}

auto split_ids(std::string_view list, std::vector<std::string>& out) -> void {
  while (!list.empty()) {
    const auto comma = list.find(',');
    auto item = list.substr(0, comma);
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    list.remove_prefix(comma + 1);
  }
}

auto render(const gc::id::Identifier& id, std::int64_t seed, OutputFormat format) -> std::string {
  const auto result = gc::color::to_color(id, seed);
  const auto& c = result.color;
  std::string colors;
  switch (format) {
    case OutputFormat::Html:
      colors = c.to_hex();
      break;
    case OutputFormat::Rgb:
      colors = std::format("{},{},{}", unsigned{c.r}, unsigned{c.g}, unsigned{c.b});
      break;
    case OutputFormat::Both:
      colors = std::format("{} {},{},{}", c.to_hex(), unsigned{c.r}, unsigned{c.g}, unsigned{c.b});
      break;
  }
  return std::format("{} {} {}", id, colors, result.is_dark ? "dark" : "light");
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("guid_color [--seed=N] [--format=html|rgb|both] <identifier>...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  gc::log::init();

  auto format = parse_format(FLAGS_format);
  if (!format) {
    gc::log::error("{}", format.error().message);
    gc::log::shutdown();
    return 2;
  }

  std::vector<std::string> inputs;
  split_ids(FLAGS_ids, inputs);
  for (int i = 1; i < argc; ++i) {
    inputs.emplace_back(argv[i]);
  }
  if (inputs.empty()) {
    gc::log::warn("no identifiers given");
  }

  int failures = 0;
  for (const auto& text : inputs) {
    auto id = gc::id::Identifier::parse(text);
    if (!id) {
      gc::log::error("{}", id.error().message);
      ++failures;
      continue;
    }
    std::cout << render(*id, FLAGS_seed, *format) << "\n";
  }

  gc::log::info("colorized", {{"count", std::to_string(inputs.size() - static_cast<std::size_t>(failures))},
                              {"failed", std::to_string(failures)},
                              {"seed", std::to_string(FLAGS_seed)}});
  gc::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return failures == 0 ? 0 : 1;
}
