#include "event_codec.h"
#include <limits>

using json = nlohmann::json;

namespace skirmish {

namespace {

struct PayloadWriter {
  json &out;

  void operator()(const std::monostate &) const { out["type"] = "none"; }
  void operator()(const ActionPayload &p) const {
    out["type"] = "action";
    out["request_id"] = p.request_id;
    out["action_kind"] = p.action_kind;
  }
  void operator()(const DamagePayload &p) const {
    out["type"] = "damage";
    out["amount"] = p.amount;
    out["damage_type"] = p.damage_type;
    out["critical"] = p.critical;
  }
  void operator()(const EffectPayload &p) const {
    out["type"] = "effect";
    out["effect_id"] = p.effect_id;
    out["duration"] = p.duration;
    out["stacks"] = p.stacks;
  }
  void operator()(const StatusPayload &p) const {
    out["type"] = "status";
    out["status"] = p.status;
    out["active"] = p.active;
  }
  void operator()(const ErrorPayload &p) const {
    out["type"] = "error";
    out["error_kind"] = p.error_kind;
    out["message"] = p.message;
  }
  void operator()(const CustomPayload &p) const {
    out["type"] = "custom";
    out["name"] = p.name;
    out["data"] = p.data;
  }
};

// Non-negative integer no larger than `max`. Rejects floats, negatives
// and anything that would wrap on narrowing.
uint64_t unsigned_field(const json &p, const char *key, uint64_t max) {
  const json &v = p.at(key);
  if (!v.is_number_unsigned())
    throw EventCodecError(std::string("'") + key +
                          "' must be a non-negative integer");
  uint64_t value = v.get<uint64_t>();
  if (value > max)
    throw EventCodecError(std::string("'") + key + "' out of range: " +
                          std::to_string(value));
  return value;
}

// ts_us must land inside Clock::time_point's range before conversion.
Clock::time_point timestamp_from_json(const json &v) {
  using std::chrono::microseconds;
  if (!v.is_number_integer())
    throw EventCodecError("'ts_us' must be an integer");

  const int64_t max_us =
      std::chrono::duration_cast<microseconds>(Clock::duration::max()).count();
  const int64_t min_us =
      std::chrono::duration_cast<microseconds>(Clock::duration::min()).count();

  bool in_range;
  int64_t us = 0;
  if (v.is_number_unsigned()) {
    uint64_t raw = v.get<uint64_t>();
    in_range = raw <= (uint64_t)max_us;
    us = in_range ? (int64_t)raw : 0;
  } else {
    us = v.get<int64_t>();
    in_range = us >= min_us && us <= max_us;
  }
  if (!in_range)
    throw EventCodecError("'ts_us' out of range: " + v.dump());

  return Clock::time_point(
      std::chrono::duration_cast<Clock::duration>(microseconds(us)));
}

EventPayload payload_from_json(const json &p) {
  const std::string type = p.at("type").get<std::string>();
  if (type == "none")
    return std::monostate{};
  if (type == "action")
    return ActionPayload{
        unsigned_field(p, "request_id", std::numeric_limits<RequestId>::max()),
                         p.at("action_kind").get<std::string>()};
  if (type == "damage")
    return DamagePayload{p.at("amount").get<double>(),
                         p.at("damage_type").get<std::string>(),
                         p.at("critical").get<bool>()};
  if (type == "effect")
    return EffectPayload{p.at("effect_id").get<std::string>(),
                         p.at("duration").get<double>(),
                         (uint32_t)unsigned_field(
                             p, "stacks", std::numeric_limits<uint32_t>::max())};
  if (type == "status")
    return StatusPayload{p.at("status").get<std::string>(),
                         p.at("active").get<bool>()};
  if (type == "error")
    return ErrorPayload{p.at("error_kind").get<std::string>(),
                        p.at("message").get<std::string>()};
  if (type == "custom")
    return CustomPayload{p.at("name").get<std::string>(), p.at("data")};
  throw EventCodecError("unknown payload type '" + type + "'");
}

} // namespace

json event_to_json(const CombatEvent &event) {
  json payload = json::object();
  std::visit(PayloadWriter{payload}, event.payload);

  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                event.timestamp.time_since_epoch())
                .count();

  return json{{"v", EVENT_SCHEMA_VERSION},
              {"kind", kind_name(event.kind)},
              {"actor", event.actor},
              {"target", event.target},
              {"ts_us", (int64_t)us},
              {"payload", std::move(payload)}};
}

CombatEvent event_from_json(const json &j) {
  try {
    int version = j.at("v").get<int>();
    if (version != EVENT_SCHEMA_VERSION)
      throw EventCodecError("unsupported event schema version " +
                            std::to_string(version));

    const std::string name = j.at("kind").get<std::string>();
    auto kind = parse_kind(name);
    if (!kind)
      throw EventCodecError("unknown event kind '" + name + "'");

    CombatEvent event;
    event.kind = *kind;
    event.actor = j.at("actor").get<std::string>();
    event.target = j.at("target").get<std::string>();
    event.timestamp = timestamp_from_json(j.at("ts_us"));
    event.payload = payload_from_json(j.at("payload"));
    return event;
  } catch (json::exception &e) {
    throw EventCodecError(std::string("malformed combat event: ") + e.what());
  }
}

std::vector<uint8_t> encode_event(const CombatEvent &event) {
  return json::to_cbor(event_to_json(event));
}

CombatEvent decode_event(const std::vector<uint8_t> &bytes) {
  json j;
  try {
    j = json::from_cbor(bytes);
  } catch (json::parse_error &e) {
    throw EventCodecError(std::string("combat event is not valid CBOR: ") +
                          e.what());
  }
  return event_from_json(j);
}

} // namespace skirmish
