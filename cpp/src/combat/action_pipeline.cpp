#include "action_pipeline.h"
#include <stdexcept>

namespace skirmish {

namespace {

// Closes the span on every exit path, unwinding included.
class ScopedTiming {
public:
  ScopedTiming(PerformanceMonitor &monitor, std::string key,
               const std::string &kind)
      : monitor_(monitor), key_(std::move(key)), kind_(kind) {
    monitor_.start_timing(key_);
  }
  ~ScopedTiming() { monitor_.stop_timing(key_, kind_); }

  ScopedTiming(const ScopedTiming &) = delete;
  ScopedTiming &operator=(const ScopedTiming &) = delete;

private:
  PerformanceMonitor &monitor_;
  std::string key_;
  const std::string &kind_;
};

} // namespace

std::string timing_key(const ActionRequest &request) {
  return request.kind() + "#" + std::to_string(request.id());
}

ActionPipeline::ActionPipeline(ActionStages stages,
                               PerformanceMonitor &monitor,
                               ErrorReporter &reporter)
    : stages_(std::move(stages)), monitor_(monitor), reporter_(reporter) {
  if (!stages_.pre_check || !stages_.execute || !stages_.post_react)
    throw std::invalid_argument("ActionPipeline needs all three stages");
}

bool ActionPipeline::run(const ActionRequest &request, flecs::world &state) {
  ScopedTiming span(monitor_, timing_key(request), request.kind());

  if (!stages_.pre_check(request, state)) {
    reporter_.report(ERROR_STATE_CONFLICT, request.source(),
                     "pre-check rejected " + request.kind(), &request);
    return false;
  }

  try {
    stages_.execute(request, state);
    stages_.post_react(request, state);
  } catch (const std::exception &e) {
    reporter_.report(ERROR_EXECUTION_FAULT, request.source(), e.what(),
                     &request);
    throw;
  }
  return true;
}

} // namespace skirmish
