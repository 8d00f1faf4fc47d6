#ifndef SKIRMISH_ACTION_PIPELINE_H
#define SKIRMISH_ACTION_PIPELINE_H

#include "action_stages.h"

namespace skirmish {

/**
 * Runs one request through pre_check → execute → post_react.
 *
 *  - pre_check false: state_conflict reported, timing closed, returns
 *    false. execute/post_react are not called.
 *  - execute/post_react throw: execution_fault reported, timing closed,
 *    exception rethrown to the caller.
 *  - otherwise returns true.
 *
 * The pipeline does not look at is_cancelled() itself; see
 * ActionRequest.
 *
 * Stateless apart from its collaborators, so one pipeline can serve
 * several threads as long as they don't share a world.
 */
class ActionPipeline {
public:
  ActionPipeline(ActionStages stages, PerformanceMonitor &monitor,
                 ErrorReporter &reporter);

  bool run(const ActionRequest &request, flecs::world &state);

private:
  ActionStages stages_;
  PerformanceMonitor &monitor_;
  ErrorReporter &reporter_;
};

// "<kind>#<id>", the key handed to PerformanceMonitor.
std::string timing_key(const ActionRequest &request);

} // namespace skirmish

#endif // SKIRMISH_ACTION_PIPELINE_H
