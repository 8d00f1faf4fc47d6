#ifndef SKIRMISH_EVENT_CODEC_H
#define SKIRMISH_EVENT_CODEC_H

#include "combat_event.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

namespace skirmish {

constexpr int EVENT_SCHEMA_VERSION = 1;

class EventCodecError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ═════════════════════════════════════════════════════════════
// WIRE SCHEMA v1
//
//   { "v": 1, "kind": "damage_dealt", "actor": "...", "target": "...",
//     "ts_us": <int64 µs since Unix epoch, UTC>,
//     "payload": { "type": "damage", "amount": 12.5, ... } }
//
// Packed as CBOR for replication. JSON form is exposed for the
// debug overlay and the GDScript bridge.
// ═════════════════════════════════════════════════════════════
nlohmann::json event_to_json(const CombatEvent &event);
CombatEvent event_from_json(const nlohmann::json &j);

std::vector<uint8_t> encode_event(const CombatEvent &event);
CombatEvent decode_event(const std::vector<uint8_t> &bytes);

} // namespace skirmish

#endif // SKIRMISH_EVENT_CODEC_H
