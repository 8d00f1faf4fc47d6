#include "error_reporter.h"
#include "combat_event_bus.h"
#include "combat_log.h"

namespace skirmish {

void LoggingErrorReporter::report(const std::string &kind,
                                  const std::string &actor,
                                  const std::string &message,
                                  const ActionRequest *request) {
  if (request) {
    log_error("[", kind, "] ", actor, ": ", message, " (", request->kind(),
              " #", request->id(), ")");
  } else {
    log_error("[", kind, "] ", actor, ": ", message);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[kind]++;
    total_++;
  }

  if (bus_)
    bus_->raise(EVENT_ACTION_ERROR, actor, "", ErrorPayload{kind, message});
}

uint64_t LoggingErrorReporter::count(const std::string &kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counts_.find(kind);
  return it != counts_.end() ? it->second : 0;
}

uint64_t LoggingErrorReporter::total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_;
}

} // namespace skirmish
