#include "combat_event.h"

namespace skirmish {

namespace {

constexpr const char *KIND_NAMES[COMBAT_EVENT_KIND_COUNT] = {
    "action_started", "action_completed", "damage_dealt",  "effect_applied",
    "effect_removed", "status_changed",   "custom",        "action_error",
};

} // namespace

const char *kind_name(CombatEventKind kind) {
  if (kind >= COMBAT_EVENT_KIND_COUNT)
    return "unknown";
  return KIND_NAMES[kind];
}

std::optional<CombatEventKind> parse_kind(const std::string &name) {
  for (int i = 0; i < COMBAT_EVENT_KIND_COUNT; i++) {
    if (name == KIND_NAMES[i])
      return (CombatEventKind)i;
  }
  return std::nullopt;
}

bool operator==(const ActionPayload &a, const ActionPayload &b) {
  return a.request_id == b.request_id && a.action_kind == b.action_kind;
}

bool operator==(const DamagePayload &a, const DamagePayload &b) {
  return a.amount == b.amount && a.damage_type == b.damage_type &&
         a.critical == b.critical;
}

bool operator==(const EffectPayload &a, const EffectPayload &b) {
  return a.effect_id == b.effect_id && a.duration == b.duration &&
         a.stacks == b.stacks;
}

bool operator==(const StatusPayload &a, const StatusPayload &b) {
  return a.status == b.status && a.active == b.active;
}

bool operator==(const ErrorPayload &a, const ErrorPayload &b) {
  return a.error_kind == b.error_kind && a.message == b.message;
}

bool operator==(const CustomPayload &a, const CustomPayload &b) {
  return a.name == b.name && a.data == b.data;
}

bool operator==(const CombatEvent &a, const CombatEvent &b) {
  return a.kind == b.kind && a.actor == b.actor && a.target == b.target &&
         a.payload == b.payload && a.timestamp == b.timestamp;
}

bool operator!=(const CombatEvent &a, const CombatEvent &b) {
  return !(a == b);
}

Clock::time_point event_clock_now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      Clock::now());
}

} // namespace skirmish
