#pragma once
#include <cstdint>
#include <limits>

namespace rc {

// Seek target: absolute, relative to the current position, or relative to the end.
struct SeekFrom {
  enum class Whence { Start, Current, End };

  Whence whence = Whence::Start;
  std::int64_t offset = 0;

  // Offsets past INT64_MAX saturate; no stream is that long, so they still clamp.
  static SeekFrom start(std::uint64_t n) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    return SeekFrom{Whence::Start, n > static_cast<std::uint64_t>(kMax) ? kMax
                                                                         : static_cast<std::int64_t>(n)};
  }
  static SeekFrom current(std::int64_t n) { return SeekFrom{Whence::Current, n}; }
  static SeekFrom end(std::int64_t n) { return SeekFrom{Whence::End, n}; }
};

// base + offset without signed overflow: large forward targets saturate at
// INT64_MAX, negative results are returned as-is for the caller to reject.
inline std::int64_t offset_from(std::uint64_t base, std::int64_t offset) noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  const std::int64_t b = base > static_cast<std::uint64_t>(kMax) ? kMax
                                                                  : static_cast<std::int64_t>(base);
  if (offset > 0 && b > kMax - offset) return kMax;
  return b + offset; // b >= 0, so a negative offset cannot underflow
}

}
