#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rc {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
};

struct RunStats {
  std::uint64_t rows_emitted = 0;
  std::uint64_t bytes_emitted = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  std::vector<StageTiming> stages; // in first-started order
};

// Wall-clock stage timings plus emitted row/byte counters for one run.
class MetricsRegistry {
public:
  void reset();
  void add_row(std::uint64_t bytes) noexcept { ++rows_; bytes_ += bytes; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::vector<std::string> order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
