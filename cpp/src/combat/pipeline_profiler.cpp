#include "pipeline_profiler.h"
#include "combat_log.h"

namespace skirmish {

void PipelineProfiler::start_timing(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = open_.emplace(key, SteadyClock::now());
  if (!inserted) {
    log_warn("Timing span '", key, "' restarted before it was stopped");
    it->second = SteadyClock::now();
  }
}

void PipelineProfiler::stop_timing(const std::string &key,
                                   const std::string &action_kind) noexcept {
  auto end = SteadyClock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_.find(key);
  if (it == open_.end())
    return; // Never started or already closed
  double ms =
      std::chrono::duration<double, std::milli>(end - it->second).count();
  open_.erase(it);

  TimingStats &s = by_kind_[action_kind];
  s.count++;
  s.total_ms += ms;
  s.last_ms = ms;
  if (ms > s.max_ms)
    s.max_ms = ms;
}

size_t PipelineProfiler::open_spans() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_.size();
}

std::optional<TimingStats>
PipelineProfiler::stats_for(const std::string &action_kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_kind_.find(action_kind);
  if (it == by_kind_.end())
    return std::nullopt;
  return it->second;
}

void PipelineProfiler::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  open_.clear();
  by_kind_.clear();
}

nlohmann::json PipelineProfiler::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json kinds = nlohmann::json::object();
  for (const auto &[kind, s] : by_kind_) {
    kinds[kind] = {{"count", s.count},
                   {"total_ms", s.total_ms},
                   {"mean_ms", s.mean_ms()},
                   {"max_ms", s.max_ms},
                   {"last_ms", s.last_ms}};
  }
  return {{"component", "PipelineProfiler"},
          {"open_spans", open_.size()},
          {"kinds", std::move(kinds)}};
}

} // namespace skirmish
