#pragma once

#include <atomic>
#include <barrier>
#include <cstdlib>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string_view>
#include <thread>
#include <vector>

#include "id/identifier.hpp"

/// Simple stats holder for the ad-hoc test runner.
struct TestStats {
  int passed = 0;
  int failed = 0;
};

inline auto run_test(const char* name, const std::function<bool()>& test, TestStats& stats) -> void {
  if (test()) {
    std::cout << "[PASS] " << name << "\n";
    stats.passed += 1;
  } else {
    std::cout << "[FAIL] " << name << "\n";
    stats.failed += 1;
  }
}

/// Simple deterministic RNG step for generating test identifiers.
inline auto next_seed(uint64_t &seed) -> uint64_t {
  seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
  return seed;
}

/// Build a pseudo-random identifier from the RNG state.
inline auto next_identifier(uint64_t &seed) -> gc::id::Identifier {
  gc::id::Identifier::Bytes bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    auto word = next_seed(seed);
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<std::uint8_t>(word >> (8 * j));
    }
  }
  return gc::id::Identifier::from_bytes(bytes);
}

/// Parse an identifier that is known to be well formed.
inline auto must_parse(std::string_view text) -> gc::id::Identifier {
  auto parsed = gc::id::Identifier::parse(text);
  if (!parsed) {
    std::cerr << "bad test identifier: " << parsed.error().message << "\n";
    std::abort();
  }
  return *parsed;
}

/// Run a synchronized parallel loop and return false on the first failure.
template <typename Fn>
auto run_concurrent(int threads, int iterations, Fn &&fn) -> bool {
  if (threads <= 0 || iterations <= 0) {
    return true;
  }

  std::barrier start_gate(threads);
  std::atomic<bool> abort{false};
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(threads));

  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&, i]() {
      start_gate.arrive_and_wait();
      for (int iter = 0; iter < iterations; ++iter) {
        if (abort.load(std::memory_order_acquire)) {
          break;
        }
        if (!fn(i, iter)) {
          failures.fetch_add(1, std::memory_order_relaxed);
          abort.store(true, std::memory_order_release);
          break;
        }
      }
    });
  }

  for (auto &worker : workers) {
    worker.join();
  }

  return failures.load(std::memory_order_relaxed) == 0;
}
