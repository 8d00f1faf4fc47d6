#ifndef SKIRMISH_PIPELINE_PROFILER_H
#define SKIRMISH_PIPELINE_PROFILER_H

#include "pipeline_interfaces.h"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_map>

namespace skirmish {

struct TimingStats {
  uint64_t count = 0;
  double total_ms = 0.0;
  double max_ms = 0.0;
  double last_ms = 0.0;

  double mean_ms() const { return count ? total_ms / (double)count : 0.0; }
};

// Wall-clock spans keyed per request, aggregated per action kind.
class PipelineProfiler final : public PerformanceMonitor {
public:
  void start_timing(const std::string &key) override;
  void stop_timing(const std::string &key,
                   const std::string &action_kind) noexcept override;

  size_t open_spans() const;
  std::optional<TimingStats> stats_for(const std::string &action_kind) const;
  void reset();
  nlohmann::json snapshot() const;

private:
  using SteadyClock = std::chrono::steady_clock;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, SteadyClock::time_point> open_;
  std::unordered_map<std::string, TimingStats> by_kind_;
};

} // namespace skirmish

#endif // SKIRMISH_PIPELINE_PROFILER_H
