#ifndef SKIRMISH_PIPELINE_INTERFACES_H
#define SKIRMISH_PIPELINE_INTERFACES_H

#include "action_request.h"
#include <flecs.h>
#include <string>
#include <vector>

namespace skirmish {

// ═════════════════════════════════════════════════════════════
// Collaborators the pipeline consumes. Default implementations:
//   PerformanceMonitor → PipelineProfiler      (pipeline_profiler.h)
//   ErrorReporter      → LoggingErrorReporter  (error_reporter.h)
//   ValidationGate     → EcsValidationGate     (validation_gate.h)
//   SystemsTrigger     → NullSystemsTrigger    (below)
//   ChainExecutor      → supplied by the combo/chain system
// ═════════════════════════════════════════════════════════════

// Diagnostic kinds passed to ErrorReporter::report.
inline constexpr const char *ERROR_STATE_CONFLICT = "state_conflict";
inline constexpr const char *ERROR_EXECUTION_FAULT = "execution_fault";

class PerformanceMonitor {
public:
  virtual ~PerformanceMonitor() = default;

  virtual void start_timing(const std::string &key) = 0;
  // Must not throw: called from the pipeline's unwinding path.
  virtual void stop_timing(const std::string &key,
                           const std::string &action_kind) noexcept = 0;
};

class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;

  // `request` may be null for diagnostics raised outside a run.
  virtual void report(const std::string &kind, const std::string &actor,
                      const std::string &message,
                      const ActionRequest *request) = 0;
};

class ValidationGate {
public:
  virtual ~ValidationGate() = default;

  virtual bool is_valid(const ActionRequest &request,
                        flecs::world &state) const = 0;
};

// Fan-out to animation, audio, VFX... Opaque to the core.
class SystemsTrigger {
public:
  virtual ~SystemsTrigger() = default;

  virtual void trigger(const ActionRequest &request, flecs::world &state) = 0;
};

class NullSystemsTrigger final : public SystemsTrigger {
public:
  void trigger(const ActionRequest &, flecs::world &) override {}
};

// Nested context carried by chain_action requests.
struct ChainDefinition {
  std::string chain_id;
  std::vector<std::string> steps;
  std::string target;
};

class ChainExecutor {
public:
  virtual ~ChainExecutor() = default;

  virtual void start_chain(const ChainDefinition &definition,
                           const std::string &owner) = 0;
};

} // namespace skirmish

#endif // SKIRMISH_PIPELINE_INTERFACES_H
