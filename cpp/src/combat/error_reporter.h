#ifndef SKIRMISH_ERROR_REPORTER_H
#define SKIRMISH_ERROR_REPORTER_H

#include "pipeline_interfaces.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace skirmish {

class CombatEventBus;

/**
 * Logs every diagnostic through the combat log and keeps per-kind
 * counts. When given a bus it also announces the failure as a queued
 * action_error event so the HUD and analytics can pick it up on the
 * next dispatch tick.
 */
class LoggingErrorReporter final : public ErrorReporter {
public:
  explicit LoggingErrorReporter(CombatEventBus *bus = nullptr) : bus_(bus) {}

  void report(const std::string &kind, const std::string &actor,
              const std::string &message,
              const ActionRequest *request) override;

  uint64_t count(const std::string &kind) const;
  uint64_t total() const;

private:
  CombatEventBus *bus_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint64_t> counts_;
  uint64_t total_ = 0;
};

} // namespace skirmish

#endif // SKIRMISH_ERROR_REPORTER_H
