#ifndef SKIRMISH_COMBAT_CONFIG_H
#define SKIRMISH_COMBAT_CONFIG_H

#include "priority_resolver.h"
#include <cstddef>
#include <string>
#include <unordered_map>

namespace skirmish {

// Tuning only: these trade dispatch latency against per-tick cost,
// they never change what gets delivered or in which order.
struct EventBusConfig {
  double throttle_ms = 10.0; // Min wall time between queued flushes
  size_t log_capacity = 256; // Ring buffer entries
  size_t batch_size = 16;    // Max events per flush
};

using CooldownTable = std::unordered_map<std::string, float>;

struct CombatConfig {
  EventBusConfig event_bus;
  PriorityTable priorities;
  CooldownTable cooldowns; // Seconds per action kind, absent = no cooldown
};

CombatConfig default_combat_config();

// Overlays `text` on the defaults. Parse errors and out-of-range values
// are logged and the affected defaults kept; never throws.
CombatConfig parse_combat_config(const std::string &text);

// Same, reading from disk. A missing file logs and returns defaults.
CombatConfig load_combat_config(const std::string &path);

} // namespace skirmish

#endif // SKIRMISH_COMBAT_CONFIG_H
