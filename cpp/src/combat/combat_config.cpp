#include "combat_config.h"
#include "combat_log.h"
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace skirmish {

CombatConfig default_combat_config() {
  CombatConfig cfg;
  cfg.priorities = default_priority_table();
  cfg.cooldowns = {
      {ACTION_SPECIAL_ABILITY, 6.0f},
      {ACTION_CHAIN, 3.0f},
      {ACTION_BASIC_ATTACK, 1.0f},
  };
  return cfg;
}

static void apply_event_bus(const json &bus, EventBusConfig &out) {
  if (bus.contains("throttle_ms")) {
    double v = bus["throttle_ms"].get<double>();
    if (v >= 0.0)
      out.throttle_ms = v;
    else
      log_error("event_bus.throttle_ms must be >= 0, got ", v);
  }
  if (bus.contains("log_capacity")) {
    int64_t v = bus["log_capacity"].get<int64_t>();
    if (v > 0)
      out.log_capacity = (size_t)v;
    else
      log_error("event_bus.log_capacity must be > 0, got ", v);
  }
  if (bus.contains("batch_size")) {
    int64_t v = bus["batch_size"].get<int64_t>();
    if (v > 0)
      out.batch_size = (size_t)v;
    else
      log_error("event_bus.batch_size must be > 0, got ", v);
  }
}

// True when `key` is present and holds an object. Anything else is logged
// and the section's defaults stay.
static bool section(const json &root, const char *key) {
  if (!root.is_object() || !root.contains(key))
    return false;
  if (!root[key].is_object()) {
    log_error(key, " must be an object, got ", root[key].type_name());
    return false;
  }
  return true;
}

CombatConfig parse_combat_config(const std::string &text) {
  CombatConfig cfg = default_combat_config();
  try {
    json j = json::parse(text);

    if (section(j, "event_bus"))
      apply_event_bus(j["event_bus"], cfg.event_bus);

    if (section(j, "priorities")) {
      for (auto &[kind, value] : j["priorities"].items())
        cfg.priorities[kind] = value.get<int>();
    }

    if (section(j, "cooldowns")) {
      for (auto &[kind, value] : j["cooldowns"].items()) {
        float seconds = value.get<float>();
        if (seconds < 0.0f) {
          log_error("cooldowns.", kind, " must be >= 0, got ", seconds);
          continue;
        }
        cfg.cooldowns[kind] = seconds;
      }
    }
  } catch (json::parse_error &e) {
    log_error("Parse error in combat config: ", e.what());
    return default_combat_config();
  } catch (json::type_error &e) {
    log_error("Type error in combat config: ", e.what());
    return default_combat_config();
  }
  return cfg;
}

CombatConfig load_combat_config(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    log_error("Failed to find ", path, ", using default combat config");
    return default_combat_config();
  }
  std::stringstream content;
  content << file.rdbuf();
  log_info("Loaded combat config: ", path);
  return parse_combat_config(content.str());
}

} // namespace skirmish
