#pragma once

#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace gc {

struct Error {
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, Error>;

inline auto make_error(std::string message) -> Error {
  return Error{std::move(message)};
}

}  // namespace gc
