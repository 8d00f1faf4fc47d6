#include "combat_log.h"
#include <cstdio>
#include <mutex>

namespace skirmish {

namespace {

std::mutex g_sink_mutex;
LogSink g_sink;

void default_sink(LogLevel level, const std::string &message) {
  if (level == LOG_INFO) {
    std::fprintf(stdout, "[SkirmishEngine] %s\n", message.c_str());
    return;
  }
  std::fprintf(stderr, "[SkirmishEngine] %s: %s\n",
               level == LOG_WARN ? "WARN" : "ERROR", message.c_str());
}

} // namespace

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_sink = std::move(sink);
}

void log_message(LogLevel level, const std::string &message) {
  // Copy under the lock so a concurrent set_log_sink can't free the target
  // mid-call.
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    sink = g_sink;
  }
  if (sink)
    sink(level, message);
  else
    default_sink(level, message);
}

} // namespace skirmish
