#ifndef SKIRMISH_COMBAT_LOG_H
#define SKIRMISH_COMBAT_LOG_H

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace skirmish {

// ═════════════════════════════════════════════════════════════
// COMBAT LOG
//
// The core is Godot-free, so it cannot call UtilityFunctions::print
// directly. Every message goes through one process-wide sink:
//   - default: stdout / stderr with the [SkirmishEngine] prefix
//   - GDExtension: UtilityFunctions::print / printerr
//   - tests: a capturing sink (see test_harness.h)
// ═════════════════════════════════════════════════════════════
enum LogLevel : uint8_t { LOG_INFO = 0, LOG_WARN = 1, LOG_ERROR = 2 };

using LogSink = std::function<void(LogLevel, const std::string &)>;

// Replace the active sink. Passing an empty function restores the default.
void set_log_sink(LogSink sink);

void log_message(LogLevel level, const std::string &message);

// Variadic helpers mirror UtilityFunctions::print("a", 1, "b") call sites.
template <typename... Args> std::string concat(const Args &...args) {
  std::ostringstream out;
  (out << ... << args);
  return out.str();
}

template <typename... Args> void log_info(const Args &...args) {
  log_message(LOG_INFO, concat(args...));
}

template <typename... Args> void log_warn(const Args &...args) {
  log_message(LOG_WARN, concat(args...));
}

template <typename... Args> void log_error(const Args &...args) {
  log_message(LOG_ERROR, concat(args...));
}

} // namespace skirmish

#endif // SKIRMISH_COMBAT_LOG_H
