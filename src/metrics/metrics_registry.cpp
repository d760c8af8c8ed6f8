#include "row_cursor/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace rc {

void MetricsRegistry::reset() {
  rows_ = bytes_ = 0;
  order_.clear();
  stage_accum_us_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(order_.begin(), order_.end(), key) == order_.end()) order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows_emitted = rows_;
  r.bytes_emitted = bytes_;
  r.wall_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(order_.size());
  for (const auto& name : order_) {
    auto it = stage_accum_us_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_us_.end() ? 0 : it->second});
  }
  return r;
}

}
