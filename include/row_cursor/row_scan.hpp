#pragma once
#include <algorithm>
#include <cstdint>
#include <string_view>

namespace rc {

// Number of `sep` bytes in `bytes`.
inline std::uint64_t count_separators(std::string_view bytes, char sep) noexcept {
  return static_cast<std::uint64_t>(std::count(bytes.begin(), bytes.end(), sep));
}

}
