#ifndef SKIRMISH_COMBAT_EVENT_H
#define SKIRMISH_COMBAT_EVENT_H

#include "action_request.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace skirmish {

enum CombatEventKind : uint8_t {
  EVENT_ACTION_STARTED = 0,
  EVENT_ACTION_COMPLETED = 1,
  EVENT_DAMAGE_DEALT = 2,
  EVENT_EFFECT_APPLIED = 3,
  EVENT_EFFECT_REMOVED = 4,
  EVENT_STATUS_CHANGED = 5,
  EVENT_CUSTOM = 6,
  EVENT_ACTION_ERROR = 7,
};
constexpr int COMBAT_EVENT_KIND_COUNT = 8;

// Stable names used on the wire, in config files and from GDScript.
const char *kind_name(CombatEventKind kind);
std::optional<CombatEventKind> parse_kind(const std::string &name);

// ─── Payloads (wire schema v1) ────────────────────────────
// Closed tagged union. Adding a tag means bumping the schema
// version in event_codec.cpp.
struct ActionPayload {
  RequestId request_id = 0;
  std::string action_kind;
};

struct DamagePayload {
  double amount = 0.0;
  std::string damage_type;
  bool critical = false;
};

struct EffectPayload {
  std::string effect_id;
  double duration = 0.0; // Seconds, 0 = until removed
  uint32_t stacks = 1;
};

struct StatusPayload {
  std::string status;
  bool active = false;
};

struct ErrorPayload {
  std::string error_kind;
  std::string message;
};

struct CustomPayload {
  std::string name;
  nlohmann::json data;
};

using EventPayload =
    std::variant<std::monostate, ActionPayload, DamagePayload, EffectPayload,
                 StatusPayload, ErrorPayload, CustomPayload>;

bool operator==(const ActionPayload &a, const ActionPayload &b);
bool operator==(const DamagePayload &a, const DamagePayload &b);
bool operator==(const EffectPayload &a, const EffectPayload &b);
bool operator==(const StatusPayload &a, const StatusPayload &b);
bool operator==(const ErrorPayload &a, const ErrorPayload &b);
bool operator==(const CustomPayload &a, const CustomPayload &b);

/**
 * Immutable record of one consequence. Built once per raise(), never
 * mutated afterwards. Timestamps are UTC, truncated to microseconds so
 * they survive the wire unchanged.
 */
struct CombatEvent {
  CombatEventKind kind = EVENT_CUSTOM;
  std::string actor;
  std::string target;
  EventPayload payload;
  Clock::time_point timestamp;
};

bool operator==(const CombatEvent &a, const CombatEvent &b);
bool operator!=(const CombatEvent &a, const CombatEvent &b);

Clock::time_point event_clock_now();

} // namespace skirmish

#endif // SKIRMISH_COMBAT_EVENT_H
