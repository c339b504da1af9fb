#include <cstdint>
#include <format>
#include <iostream>

#include "color/colorizer.hpp"
#include "id/identifier.hpp"

int main() {
  const char* texts[] = {
      "00000000-0000-0000-0000-000000000000",
      "6f9619ff-8b86-d011-b42d-00c04fc964ff",
      "3f2504e0-4f89-11d3-9a0c-0305e82c3301",
      "550e8400-e29b-41d4-a716-446655440000",
  };

  for (const char* text : texts) {
    auto id = gc::id::Identifier::parse(text);
    if (!id) {
      std::cerr << "Parse error: " << id.error().message << "\n";
      return 1;
    }
    for (std::int64_t seed : {0, 1}) {
      auto result = gc::color::to_html_color(*id, seed);
      std::cout << std::format("{} seed={} color={} text={}\n", *id, seed, result.color,
                               result.is_dark ? "light" : "dark");
    }
  }
  return 0;
}
